#include "sinks/memory_sinks.h"

#include <algorithm>

namespace tracescore::sinks {

// =============================================================================
// MemoryFeedbackScoreSink
// =============================================================================

absl::Status MemoryFeedbackScoreSink::Write(const std::vector<model::FeedbackScore>& scores) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_.ok()) {
        return failure_;
    }
    batches_.push_back(scores);
    return absl::OkStatus();
}

void MemoryFeedbackScoreSink::SetFailure(absl::Status status) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_ = std::move(status);
}

std::vector<std::vector<model::FeedbackScore>> MemoryFeedbackScoreSink::Batches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_;
}

std::vector<model::FeedbackScore> MemoryFeedbackScoreSink::Scores() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::FeedbackScore> all;
    for (const auto& batch : batches_) {
        all.insert(all.end(), batch.begin(), batch.end());
    }
    return all;
}

size_t MemoryFeedbackScoreSink::WriteCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_.size();
}

// =============================================================================
// MemoryUserLogSink
// =============================================================================

absl::Status MemoryUserLogSink::Append(const std::vector<model::UserLogEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert(entries_.end(), entries.begin(), entries.end());
    return absl::OkStatus();
}

absl::StatusOr<model::UserLogPage> MemoryUserLogSink::Query(const model::UserLogQuery& query) {
    std::vector<model::UserLogEntry> matching;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.workspace_id != query.workspace_id) {
                continue;
            }
            if (query.rule_id && entry.rule_id != *query.rule_id) {
                continue;
            }
            if (query.level && entry.level != *query.level) {
                continue;
            }
            matching.push_back(entry);
        }
    }

    // Newest first; entries with equal timestamps keep reverse append order
    std::reverse(matching.begin(), matching.end());
    std::stable_sort(matching.begin(), matching.end(),
                     [](const model::UserLogEntry& a, const model::UserLogEntry& b) {
                         return a.timestamp > b.timestamp;
                     });

    model::UserLogPage page;
    page.page = std::max<int64_t>(query.page, 1);
    const int64_t size = std::max<int64_t>(query.size, 1);
    page.total = static_cast<int64_t>(matching.size());

    const int64_t offset = (page.page - 1) * size;
    for (int64_t i = offset; i < page.total && i < offset + size; ++i) {
        page.content.push_back(std::move(matching[static_cast<size_t>(i)]));
    }
    page.size = static_cast<int64_t>(page.content.size());
    return page;
}

std::vector<model::UserLogEntry> MemoryUserLogSink::Entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

}  // namespace tracescore::sinks
