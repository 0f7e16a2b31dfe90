#pragma once

/// @file memory_sinks.h
/// @brief In-process sinks for dry runs and tests

#include <mutex>
#include <vector>

#include "sinks/feedback_score_sink.h"
#include "sinks/user_log_sink.h"

namespace tracescore::sinks {

class MemoryFeedbackScoreSink : public FeedbackScoreSink {
public:
    absl::Status Write(const std::vector<model::FeedbackScore>& scores) override;

    /// @brief Make subsequent writes fail with status (OkStatus to recover)
    void SetFailure(absl::Status status);

    std::vector<std::vector<model::FeedbackScore>> Batches() const;

    std::vector<model::FeedbackScore> Scores() const;

    size_t WriteCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::vector<model::FeedbackScore>> batches_;
    absl::Status failure_;
};

class MemoryUserLogSink : public UserLogSink {
public:
    absl::Status Append(const std::vector<model::UserLogEntry>& entries) override;

    absl::StatusOr<model::UserLogPage> Query(const model::UserLogQuery& query) override;

    /// @brief Everything appended so far, in append order
    std::vector<model::UserLogEntry> Entries() const;

private:
    mutable std::mutex mutex_;
    std::vector<model::UserLogEntry> entries_;
};

}  // namespace tracescore::sinks
