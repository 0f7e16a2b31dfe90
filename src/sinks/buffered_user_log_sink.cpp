#include "sinks/buffered_user_log_sink.h"

#include <algorithm>

#include "common/logging.h"
#include "common/metrics.h"

namespace tracescore::sinks {

BufferedUserLogSink::BufferedUserLogSink(std::shared_ptr<UserLogSink> downstream,
                                         BufferedUserLogConfig config)
    : downstream_(std::move(downstream)), config_(config) {}

BufferedUserLogSink::~BufferedUserLogSink() {
    if (running_.load()) {
        auto status = Shutdown();
        if (!status.ok()) {
            TRACESCORE_LOG_ERROR("Dropping user logs on shutdown: {}", status.ToString());
        }
    }
}

absl::Status BufferedUserLogSink::Start() {
    if (running_.exchange(true)) {
        return absl::AlreadyExistsError("User log buffer already running");
    }
    shutdown_requested_ = false;
    flush_thread_ = std::thread(&BufferedUserLogSink::FlushLoop, this);
    TRACESCORE_LOG_INFO("User log buffer started, batch_size={}, interval={}ms",
                        config_.max_batch_size, config_.flush_interval.count());
    return absl::OkStatus();
}

absl::Status BufferedUserLogSink::Shutdown() {
    if (!running_.exchange(false)) {
        return absl::FailedPreconditionError("User log buffer not running");
    }
    shutdown_requested_ = true;
    buffer_cv_.notify_all();
    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }
    return Flush();
}

absl::Status BufferedUserLogSink::Append(const std::vector<model::UserLogEntry>& entries) {
    if (entries.empty()) {
        return absl::OkStatus();
    }
    if (!running_.load()) {
        return downstream_->Append(entries);
    }

    bool full = false;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        size_t room = config_.max_buffer_size > buffer_.size()
                          ? config_.max_buffer_size - buffer_.size()
                          : 0;
        size_t accepted = std::min(room, entries.size());
        buffer_.insert(buffer_.end(), entries.begin(), entries.begin() + accepted);
        if (accepted < entries.size()) {
            TRACESCORE_COUNTER("tracescore_user_logs_dropped").Add(entries.size() - accepted);
            TRACESCORE_LOG_WARN("User log buffer full, dropped {} entries",
                                entries.size() - accepted);
        }
        full = buffer_.size() >= config_.max_batch_size;
    }
    if (full) {
        buffer_cv_.notify_one();
    }
    return absl::OkStatus();
}

absl::StatusOr<model::UserLogPage> BufferedUserLogSink::Query(const model::UserLogQuery& query) {
    auto status = Flush();
    if (!status.ok()) {
        TRACESCORE_LOG_WARN("Querying user logs with unflushed entries: {}", status.ToString());
    }
    return downstream_->Query(query);
}

absl::Status BufferedUserLogSink::Flush() {
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);
    std::vector<model::UserLogEntry> batch;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        batch.swap(buffer_);
    }
    if (batch.empty()) {
        return absl::OkStatus();
    }
    auto status = downstream_->Append(batch);
    if (!status.ok()) {
        TRACESCORE_COUNTER("tracescore_user_logs_dropped").Add(batch.size());
        return status;
    }
    TRACESCORE_COUNTER("tracescore_user_logs_written").Add(batch.size());
    return absl::OkStatus();
}

size_t BufferedUserLogSink::PendingCount() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return buffer_.size();
}

void BufferedUserLogSink::FlushLoop() {
    while (!shutdown_requested_.load()) {
        {
            std::unique_lock<std::mutex> lock(buffer_mutex_);
            buffer_cv_.wait_for(lock, config_.flush_interval, [this] {
                return buffer_.size() >= config_.max_batch_size || shutdown_requested_.load();
            });
        }
        if (shutdown_requested_.load()) {
            break;
        }
        auto status = Flush();
        if (!status.ok()) {
            TRACESCORE_LOG_ERROR("Failed to write user logs: {}", status.ToString());
        }
    }
}

}  // namespace tracescore::sinks
