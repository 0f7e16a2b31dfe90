#include "consumer/stream_consumer.h"

#include <cctype>
#include <iomanip>
#include <map>
#include <random>
#include <set>
#include <sstream>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace tracescore::consumer {

namespace {

/// Entries of one (workspace, project, user, rule) group
struct PendingBatch {
    model::StreamMessage message;
    std::set<std::string> entry_ids;
};

std::string GroupKey(const std::string& workspace_id,
                     const std::string& project_id,
                     const std::string& user_name,
                     const std::optional<std::string>& rule_id) {
    return absl::StrCat(workspace_id, "\x1f", project_id, "\x1f", user_name, "\x1f",
                        rule_id.value_or(""));
}

PendingBatch& BatchFor(std::map<std::string, PendingBatch>& batches,
                       const model::StreamMessage& message,
                       const std::string& project_id) {
    auto key = GroupKey(message.workspace_id, project_id, message.user_name, message.rule_id);
    auto it = batches.find(key);
    if (it == batches.end()) {
        PendingBatch batch;
        batch.message.workspace_id = message.workspace_id;
        batch.message.user_name = message.user_name;
        batch.message.project_id = project_id;
        batch.message.entity_type = message.entity_type;
        batch.message.rule_id = message.rule_id;
        it = batches.emplace(key, std::move(batch)).first;
    }
    return it->second;
}

}  // namespace

std::string MakeConsumerName(const std::string& group) {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::mutex gen_mutex;
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = 0;
    uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        high = dis(gen);
        low = dis(gen);
    }
    // RFC 4122 version 4, variant 1
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream id;
    id << std::hex << std::setfill('0') << std::setw(8) << (high >> 32) << "-" << std::setw(4)
       << ((high >> 16) & 0xFFFF) << "-" << std::setw(4) << (high & 0xFFFF) << "-" << std::setw(4)
       << (low >> 48) << "-" << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return absl::StrCat("consumer-", group, "-", id.str());
}

StreamConsumer::StreamConsumer(StreamConfig config,
                               std::shared_ptr<StreamClient> client,
                               std::unique_ptr<EnvelopeCodec> codec,
                               std::shared_ptr<BatchHandler> handler)
    : config_(std::move(config)),
      client_(std::move(client)),
      codec_(std::move(codec)),
      handler_(std::move(handler)),
      consumer_name_(MakeConsumerName(config_.consumer_group)) {}

StreamConsumer::~StreamConsumer() {
    if (thread_.joinable()) {
        auto status = Stop();
        if (!status.ok()) {
            TRACESCORE_LOG_ERROR("Failed to stop consumer '{}' in destructor: {}", consumer_name_,
                                 status.ToString());
        }
    }
}

absl::Status StreamConsumer::Start() {
    if (thread_.joinable()) {
        return absl::AlreadyExistsError("Consumer already running");
    }
    auto status = client_->CreateGroup(config_.stream_name, config_.consumer_group);
    if (!status.ok()) {
        return Annotate(status, absl::StrCat("Cannot create consumer group '",
                                             config_.consumer_group, "' on '",
                                             config_.stream_name, "'"));
    }

    running_.store(true);
    thread_ = std::thread(&StreamConsumer::ConsumerLoop, this);
    TRACESCORE_LOG_INFO("Consumer '{}' started on stream '{}' for {} (batch={}, interval={}ms)",
                        consumer_name_, config_.stream_name, model::ToString(config_.kind),
                        config_.batch_size, config_.polling_interval.count());
    return absl::OkStatus();
}

void StreamConsumer::RequestStop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_.store(false);
    }
    wake_.notify_all();
}

absl::Status StreamConsumer::Stop() {
    if (!thread_.joinable()) {
        return absl::FailedPreconditionError("Consumer not running");
    }
    RequestStop();
    thread_.join();

    // Entries this consumer still holds would be discarded with it, so leave
    // them for another consumer to claim
    size_t held = 0;
    {
        std::lock_guard<std::mutex> poll_lock(poll_mutex_);
        PruneHeld();
        held = held_ids_.size();
    }
    if (held > 0) {
        TRACESCORE_LOG_WARN("Consumer '{}' keeps {} pending entries in group '{}' for reclaim",
                            consumer_name_, held, config_.consumer_group);
    } else {
        auto status =
            client_->RemoveConsumer(config_.stream_name, config_.consumer_group, consumer_name_);
        if (!status.ok()) {
            TRACESCORE_LOG_WARN("Failed to remove consumer '{}' from group '{}': {}",
                                consumer_name_, config_.consumer_group, status.ToString());
        }
    }
    TRACESCORE_LOG_INFO("Consumer '{}' stopped", consumer_name_);
    return absl::OkStatus();
}

StreamConsumerStats StreamConsumer::GetStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void StreamConsumer::ConsumerLoop() {
    while (running_.load()) {
        auto status = PollOnce();
        if (!status.ok()) {
            TRACESCORE_LOG_DEBUG("Tick on '{}' failed: {}", config_.stream_name, status.ToString());
        }
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, config_.polling_interval, [this] { return !running_.load(); });
    }
    TRACESCORE_LOG_DEBUG("Consumer thread for '{}' stopped", config_.stream_name);
}

std::string StreamConsumer::MetricName(const char* suffix) const {
    std::string stream;
    for (char c : config_.stream_name) {
        stream += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
    }
    return absl::StrCat("tracescore_stream_", stream, "_", suffix);
}

absl::Status StreamConsumer::PollOnce() {
    std::lock_guard<std::mutex> poll_lock(poll_mutex_);
    ++tick_;
    const bool claim =
        config_.claim_interval_ratio > 0 && tick_ % static_cast<uint64_t>(config_.claim_interval_ratio) == 0;

    auto entries = claim ? client_->AutoClaim(config_.stream_name, config_.consumer_group,
                                              consumer_name_, config_.pending_message_duration,
                                              config_.batch_size)
                         : client_->ReadGroup(config_.stream_name, config_.consumer_group,
                                              consumer_name_, config_.batch_size,
                                              std::chrono::milliseconds(0));
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.ticks++;
    }
    if (!entries.ok()) {
        healthy_.store(false);
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.read_errors++;
        }
        TRACESCORE_COUNTER(MetricName(claim ? "claim_errors" : "read_errors")).Increment();
        TRACESCORE_LOG_ERROR("Failed to {} entries from '{}': {}", claim ? "claim" : "read",
                             config_.stream_name, entries.status().ToString());
        return entries.status();
    }
    healthy_.store(true);
    if (claim) {
        PruneHeld();
    }

    if (entries->empty()) {
        return absl::OkStatus();
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        (claim ? stats_.entries_claimed : stats_.entries_read) += entries->size();
    }
    TRACESCORE_HISTOGRAM(MetricName(claim ? "claim_size" : "read_size"))
        .Observe(static_cast<double>(entries->size()));
    if (claim) {
        TRACESCORE_LOG_INFO("Reclaimed {} idle entries from '{}'", entries->size(),
                            config_.stream_name);
    }

    ScopedTimer timer(TRACESCORE_HISTOGRAM(MetricName("processing_ms")));
    ProcessBatch(*entries);
    return absl::OkStatus();
}

void StreamConsumer::ProcessBatch(const std::vector<model::StreamEntry>& entries) {
    std::vector<std::string> poison;
    std::map<std::string, PendingBatch> batches;

    for (const auto& entry : entries) {
        auto message = codec_->Decode(entry, model::EntityTypeOf(config_.kind));
        if (!message.ok()) {
            TRACESCORE_LOG_WARN("Dropping undecodable entry {} from '{}': {}", entry.id,
                                config_.stream_name, message.status().ToString());
            poison.push_back(entry.id);
            continue;
        }
        if (message->entity_type == model::EntityType::kThread) {
            auto& batch = BatchFor(batches, *message, message->project_id);
            batch.message.thread_ids.insert(batch.message.thread_ids.end(),
                                            message->thread_ids.begin(), message->thread_ids.end());
            batch.entry_ids.insert(entry.id);
            continue;
        }
        for (auto& entity : message->entities) {
            auto& batch = BatchFor(batches, *message, entity.project_id);
            batch.message.entities.push_back(std::move(entity));
            batch.entry_ids.insert(entry.id);
        }
        if (message->entities.empty()) {
            // Nothing to score, settle with the rest
            BatchFor(batches, *message, message->project_id).entry_ids.insert(entry.id);
        }
    }

    if (!poison.empty()) {
        TRACESCORE_COUNTER(MetricName("poison_entries")).Add(static_cast<int64_t>(poison.size()));
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.poison_entries += poison.size();
        }
        Settle(poison);
    }

    std::set<std::string> failed_ids;
    std::set<std::string> handled_ids;
    for (const auto& [key, batch] : batches) {
        absl::Status status = absl::OkStatus();
        if (!batch.message.entities.empty() || !batch.message.thread_ids.empty()) {
            status = handler_->Handle(config_.kind, batch.message);
        }
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (status.ok()) {
            stats_.batches_handled++;
            handled_ids.insert(batch.entry_ids.begin(), batch.entry_ids.end());
        } else {
            stats_.batches_failed++;
            TRACESCORE_LOG_WARN("Batch of project '{}' from '{}' failed, leaving {} entries pending: {}",
                                batch.message.project_id, config_.stream_name,
                                batch.entry_ids.size(), status.ToString());
            failed_ids.insert(batch.entry_ids.begin(), batch.entry_ids.end());
        }
    }

    // An entry split across projects is settled only when every part succeeded
    std::vector<std::string> done;
    for (const auto& id : handled_ids) {
        if (failed_ids.count(id) == 0) {
            done.push_back(id);
        }
    }
    if (!done.empty()) {
        Settle(done);
    }
    if (!failed_ids.empty()) {
        HandleFailed(std::vector<std::string>(failed_ids.begin(), failed_ids.end()));
    }
}

void StreamConsumer::Settle(const std::vector<std::string>& ids) {
    auto acked = client_->Ack(config_.stream_name, config_.consumer_group, ids);
    if (!acked.ok()) {
        TRACESCORE_COUNTER(MetricName("ack_errors")).Increment();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.ack_errors++;
        }
        TRACESCORE_LOG_ERROR("Failed to ack {} entries on '{}': {}", ids.size(),
                             config_.stream_name, acked.status().ToString());
        return;
    }
    for (const auto& id : ids) {
        held_ids_.erase(id);
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.entries_acked += static_cast<uint64_t>(*acked);
    }
    TRACESCORE_COUNTER(MetricName("acked")).Add(*acked);

    auto deleted = client_->Delete(config_.stream_name, ids);
    if (!deleted.ok()) {
        TRACESCORE_LOG_WARN("Failed to delete {} acked entries from '{}': {}", ids.size(),
                            config_.stream_name, deleted.status().ToString());
    }
}

void StreamConsumer::PruneHeld() {
    for (auto it = held_ids_.begin(); it != held_ids_.end();) {
        auto owner = client_->PendingOwner(config_.stream_name, config_.consumer_group, *it);
        if (!owner.ok()) {
            TRACESCORE_LOG_WARN("Cannot read owner of pending entry {} on '{}': {}", *it,
                                config_.stream_name, owner.status().ToString());
            break;
        }
        if (*owner != consumer_name_) {
            TRACESCORE_LOG_DEBUG("Entry {} on '{}' moved from '{}' to '{}'", *it, config_.stream_name,
                                 consumer_name_, owner->empty() ? "acknowledged" : *owner);
            it = held_ids_.erase(it);
        } else {
            ++it;
        }
    }
    TRACESCORE_GAUGE(MetricName("pending")).Set(static_cast<double>(held_ids_.size()));
}

void StreamConsumer::HandleFailed(const std::vector<std::string>& ids) {
    std::vector<std::string> exhausted;
    size_t left_pending = 0;
    for (const auto& id : ids) {
        auto deliveries = client_->DeliveryCount(config_.stream_name, config_.consumer_group, id);
        if (!deliveries.ok()) {
            TRACESCORE_LOG_WARN("Cannot read delivery count of {} on '{}': {}", id,
                                config_.stream_name, deliveries.status().ToString());
            held_ids_.insert(id);
            ++left_pending;
            continue;
        }
        if (*deliveries >= config_.max_retries) {
            TRACESCORE_LOG_ERROR("Dropping entry {} from '{}' after {} deliveries", id,
                                 config_.stream_name, *deliveries);
            exhausted.push_back(id);
        } else {
            held_ids_.insert(id);
            ++left_pending;
        }
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.entries_dead_lettered += exhausted.size();
        stats_.entries_left_pending += left_pending;
    }
    TRACESCORE_GAUGE(MetricName("pending")).Set(static_cast<double>(held_ids_.size()));
    if (!exhausted.empty()) {
        TRACESCORE_COUNTER(MetricName("dead_lettered")).Add(static_cast<int64_t>(exhausted.size()));
        Settle(exhausted);
    }
}

}  // namespace tracescore::consumer
