#pragma once

/// @file stream_consumer.h
/// @brief Consumer-group poller feeding one evaluator kind

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <absl/status/status.h>

#include "consumer/batch_handler.h"
#include "consumer/envelope_codec.h"
#include "consumer/stream_client.h"
#include "model/evaluator_kind.h"

namespace tracescore::consumer {

/// @brief Configuration of one consumed stream
struct StreamConfig {
    std::string stream_name;
    model::EvaluatorKind kind = model::EvaluatorKind::kTraceLlmJudge;
    std::string consumer_group;

    /// Entries read per tick
    size_t batch_size = 10;

    /// Pause between ticks
    std::chrono::milliseconds polling_interval{500};

    std::string codec = "json";

    /// Pending entries idle this long are reclaimed
    std::chrono::milliseconds pending_message_duration{std::chrono::minutes(10)};

    /// Every Nth tick reclaims idle entries instead of reading new ones
    int claim_interval_ratio = 10;

    /// Deliveries after which a failing entry is dropped
    int max_retries = 3;

    bool enabled = true;
};

/// @brief Statistics for a stream consumer
struct StreamConsumerStats {
    uint64_t ticks = 0;
    uint64_t entries_read = 0;
    uint64_t entries_claimed = 0;
    uint64_t entries_acked = 0;
    uint64_t entries_left_pending = 0;
    uint64_t entries_dead_lettered = 0;
    uint64_t poison_entries = 0;
    uint64_t batches_handled = 0;
    uint64_t batches_failed = 0;
    uint64_t read_errors = 0;
    uint64_t ack_errors = 0;
};

/// @brief Polls one stream through a consumer group and hands batches over
///
/// Each tick reads new entries, or on every claim_interval_ratio-th tick
/// reclaims entries pending longer than pending_message_duration. Entries
/// that cannot be decoded are acknowledged and deleted at once. Decoded
/// entries are acknowledged and deleted when their batch is handled; when the
/// handler fails they stay pending until max_retries deliveries, after which
/// they are dropped with an ERROR.
class StreamConsumer {
public:
    StreamConsumer(StreamConfig config,
                   std::shared_ptr<StreamClient> client,
                   std::unique_ptr<EnvelopeCodec> codec,
                   std::shared_ptr<BatchHandler> handler);
    ~StreamConsumer();

    StreamConsumer(const StreamConsumer&) = delete;
    StreamConsumer& operator=(const StreamConsumer&) = delete;

    /// @brief Create the group and start the polling thread
    absl::Status Start();

    /// @brief Stop intake, let the in-flight tick finish and leave the group
    absl::Status Stop();

    /// @brief Signal the polling thread to stop without waiting for it
    ///
    /// Stop() must still be called to join the thread and leave the group.
    void RequestStop();

    bool IsRunning() const { return running_.load(); }

    /// @brief False after the last tick failed to reach the stream
    bool IsHealthy() const { return healthy_.load(); }

    /// @brief Run a single tick on the calling thread
    absl::Status PollOnce();

    StreamConsumerStats GetStats() const;

    const std::string& ConsumerName() const { return consumer_name_; }

    const StreamConfig& GetConfig() const { return config_; }

private:
    void ConsumerLoop();

    /// @brief Decode, dispatch and settle one set of entries
    void ProcessBatch(const std::vector<model::StreamEntry>& entries);

    /// @brief Ack then delete; failures are logged and counted
    void Settle(const std::vector<std::string>& ids);

    /// @brief Drop entries that reached max_retries, leave the others pending
    void HandleFailed(const std::vector<std::string>& ids);

    /// @brief Forget held entries another consumer claimed or acknowledged
    void PruneHeld();  // requires poll_mutex_

    std::string MetricName(const char* suffix) const;

    StreamConfig config_;
    std::shared_ptr<StreamClient> client_;
    std::unique_ptr<EnvelopeCodec> codec_;
    std::shared_ptr<BatchHandler> handler_;
    std::string consumer_name_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> healthy_{true};
    std::mutex wake_mutex_;
    std::condition_variable wake_;

    // PollOnce runs on one thread at a time
    std::mutex poll_mutex_;
    uint64_t tick_ = 0;
    // Entries left pending for redelivery that this consumer still owns
    std::set<std::string> held_ids_;

    mutable std::mutex stats_mutex_;
    StreamConsumerStats stats_;
};

/// @brief "consumer-<group>-<random uuid>"
std::string MakeConsumerName(const std::string& group);

}  // namespace tracescore::consumer
