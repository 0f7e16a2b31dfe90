#include "consumer/memory_stream_client.h"

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

namespace tracescore::consumer {

using std::chrono::steady_clock;

namespace {

std::string FormatId(uint64_t sequence) {
    return absl::StrCat(sequence, "-0");
}

bool ParseId(const std::string& id, uint64_t* sequence) {
    auto dash = id.find('-');
    return absl::SimpleAtoi(id.substr(0, dash), sequence);
}

}  // namespace

absl::StatusOr<MemoryStreamClient::Group*> MemoryStreamClient::FindGroupLocked(
    const std::string& stream, const std::string& group) {
    auto stream_it = streams_.find(stream);
    if (stream_it == streams_.end()) {
        return absl::FailedPreconditionError(absl::StrCat("NOGROUP no such key '", stream, "'"));
    }
    auto group_it = stream_it->second.groups.find(group);
    if (group_it == stream_it->second.groups.end()) {
        return absl::FailedPreconditionError(
            absl::StrCat("NOGROUP no consumer group '", group, "' for key '", stream, "'"));
    }
    return &group_it->second;
}

absl::Status MemoryStreamClient::CreateGroup(const std::string& stream, const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_.ok()) {
        return failure_;
    }
    auto& target = streams_[stream];
    if (target.groups.count(group) == 0) {
        Group created;
        created.last_delivered = target.entries.empty() ? 0 : target.entries.rbegin()->first;
        target.groups.emplace(group, std::move(created));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::vector<model::StreamEntry>> MemoryStreamClient::ReadGroup(
    const std::string& stream, const std::string& group, const std::string& consumer,
    size_t count, std::chrono::milliseconds block) {
    const auto deadline = steady_clock::now() + block;
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (!failure_.ok()) {
            return failure_;
        }
        auto found = FindGroupLocked(stream, group);
        if (!found.ok()) {
            return found.status();
        }
        Group* target = *found;
        target->consumers.insert(consumer);

        auto& entries = streams_[stream].entries;
        std::vector<model::StreamEntry> delivered;
        for (auto it = entries.upper_bound(target->last_delivered);
             it != entries.end() && delivered.size() < count; ++it) {
            target->last_delivered = it->first;
            target->pending[it->first] = PendingEntry{consumer, 1, steady_clock::now()};
            delivered.push_back(model::StreamEntry{FormatId(it->first), it->second});
        }
        if (!delivered.empty() || block.count() <= 0 || steady_clock::now() >= deadline) {
            return delivered;
        }
        appended_.wait_until(lock, deadline);
    }
}

absl::StatusOr<std::vector<model::StreamEntry>> MemoryStreamClient::AutoClaim(
    const std::string& stream, const std::string& group, const std::string& consumer,
    std::chrono::milliseconds min_idle, size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_.ok()) {
        return failure_;
    }
    auto found = FindGroupLocked(stream, group);
    if (!found.ok()) {
        return found.status();
    }
    Group* target = *found;
    target->consumers.insert(consumer);

    const auto now = steady_clock::now();
    auto& entries = streams_[stream].entries;
    std::vector<model::StreamEntry> claimed;
    for (auto it = target->pending.begin(); it != target->pending.end() && claimed.size() < count;) {
        if (now - it->second.delivered_at < min_idle) {
            ++it;
            continue;
        }
        auto entry = entries.find(it->first);
        if (entry == entries.end()) {
            // Deleted while pending, dropped from the pending list as Redis does
            it = target->pending.erase(it);
            continue;
        }
        it->second.consumer = consumer;
        it->second.delivery_count += 1;
        it->second.delivered_at = now;
        claimed.push_back(model::StreamEntry{FormatId(it->first), entry->second});
        ++it;
    }
    return claimed;
}

absl::StatusOr<int64_t> MemoryStreamClient::Ack(const std::string& stream,
                                                const std::string& group,
                                                const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_.ok()) {
        return failure_;
    }
    auto found = FindGroupLocked(stream, group);
    if (!found.ok()) {
        return found.status();
    }
    int64_t acked = 0;
    for (const auto& id : ids) {
        uint64_t sequence = 0;
        if (ParseId(id, &sequence)) {
            acked += static_cast<int64_t>((*found)->pending.erase(sequence));
        }
    }
    return acked;
}

absl::StatusOr<int64_t> MemoryStreamClient::Delete(const std::string& stream,
                                                   const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_.ok()) {
        return failure_;
    }
    auto it = streams_.find(stream);
    if (it == streams_.end()) {
        return 0;
    }
    int64_t deleted = 0;
    for (const auto& id : ids) {
        uint64_t sequence = 0;
        if (ParseId(id, &sequence)) {
            deleted += static_cast<int64_t>(it->second.entries.erase(sequence));
        }
    }
    return deleted;
}

absl::StatusOr<int64_t> MemoryStreamClient::DeliveryCount(const std::string& stream,
                                                          const std::string& group,
                                                          const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_.ok()) {
        return failure_;
    }
    auto found = FindGroupLocked(stream, group);
    if (!found.ok()) {
        return found.status();
    }
    uint64_t sequence = 0;
    if (!ParseId(id, &sequence)) {
        return 0;
    }
    auto it = (*found)->pending.find(sequence);
    return it == (*found)->pending.end() ? 0 : it->second.delivery_count;
}

absl::StatusOr<std::string> MemoryStreamClient::PendingOwner(const std::string& stream,
                                                            const std::string& group,
                                                            const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_.ok()) {
        return failure_;
    }
    auto found = FindGroupLocked(stream, group);
    if (!found.ok()) {
        return found.status();
    }
    uint64_t sequence = 0;
    if (!ParseId(id, &sequence)) {
        return std::string();
    }
    auto it = (*found)->pending.find(sequence);
    return it == (*found)->pending.end() ? std::string() : it->second.consumer;
}

absl::Status MemoryStreamClient::RemoveConsumer(const std::string& stream,
                                                const std::string& group,
                                                const std::string& consumer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_.ok()) {
        return failure_;
    }
    auto found = FindGroupLocked(stream, group);
    if (!found.ok()) {
        return found.status();
    }
    Group* target = *found;
    target->consumers.erase(consumer);
    for (auto it = target->pending.begin(); it != target->pending.end();) {
        if (it->second.consumer == consumer) {
            it = target->pending.erase(it);
        } else {
            ++it;
        }
    }
    return absl::OkStatus();
}

absl::StatusOr<std::string> MemoryStreamClient::Append(
    const std::string& stream, const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failure_.ok()) {
            return failure_;
        }
        uint64_t sequence = next_sequence_++;
        auto& target = streams_[stream].entries[sequence];
        for (const auto& [key, value] : fields) {
            target[key] = value;
        }
        id = FormatId(sequence);
    }
    appended_.notify_all();
    return id;
}

void MemoryStreamClient::SetFailure(absl::Status status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = std::move(status);
    }
    appended_.notify_all();
}

size_t MemoryStreamClient::PendingCount(const std::string& stream, const std::string& group) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stream_it = streams_.find(stream);
    if (stream_it == streams_.end()) {
        return 0;
    }
    auto group_it = stream_it->second.groups.find(group);
    return group_it == stream_it->second.groups.end() ? 0 : group_it->second.pending.size();
}

size_t MemoryStreamClient::Length(const std::string& stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream);
    return it == streams_.end() ? 0 : it->second.entries.size();
}

std::set<std::string> MemoryStreamClient::Consumers(const std::string& stream,
                                                    const std::string& group) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stream_it = streams_.find(stream);
    if (stream_it == streams_.end()) {
        return {};
    }
    auto group_it = stream_it->second.groups.find(group);
    return group_it == stream_it->second.groups.end() ? std::set<std::string>{}
                                                      : group_it->second.consumers;
}

}  // namespace tracescore::consumer
