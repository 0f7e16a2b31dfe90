#pragma once

/// @file buffered_user_log_sink.h
/// @brief Batches user log entries in front of a slower sink

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "sinks/user_log_sink.h"

namespace tracescore::sinks {

struct BufferedUserLogConfig {
    /// Flush as soon as this many entries are buffered
    size_t max_batch_size = 500;

    /// Flush at least this often while entries are buffered
    std::chrono::milliseconds flush_interval{1000};

    /// Entries beyond this are dropped with a WARN
    size_t max_buffer_size = 100000;
};

/// @brief Write-behind wrapper for a UserLogSink
///
/// Append only buffers. A flush thread writes the buffer downstream when it
/// reaches max_batch_size or when flush_interval elapses. Query flushes first
/// so readers see their own writes. When not running, appends go straight
/// through.
class BufferedUserLogSink : public UserLogSink {
public:
    BufferedUserLogSink(std::shared_ptr<UserLogSink> downstream, BufferedUserLogConfig config);

    ~BufferedUserLogSink() override;

    BufferedUserLogSink(const BufferedUserLogSink&) = delete;
    BufferedUserLogSink& operator=(const BufferedUserLogSink&) = delete;

    absl::Status Start();

    /// @brief Stop the flush thread and write what is left
    absl::Status Shutdown();

    absl::Status Append(const std::vector<model::UserLogEntry>& entries) override;

    absl::StatusOr<model::UserLogPage> Query(const model::UserLogQuery& query) override;

    /// @brief Write the buffer downstream now
    absl::Status Flush();

    size_t PendingCount() const;

    bool IsRunning() const { return running_.load(); }

private:
    void FlushLoop();

    std::shared_ptr<UserLogSink> downstream_;
    BufferedUserLogConfig config_;

    std::vector<model::UserLogEntry> buffer_;
    mutable std::mutex buffer_mutex_;
    std::condition_variable buffer_cv_;

    // Serializes downstream writes so batches keep their order
    std::mutex flush_mutex_;

    std::thread flush_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace tracescore::sinks
