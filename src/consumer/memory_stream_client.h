#pragma once

/// @file memory_stream_client.h
/// @brief In-process stream with consumer-group semantics, for tests and dry runs

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>

#include "consumer/stream_client.h"

namespace tracescore::consumer {

/// @brief Follows Redis stream semantics closely enough for the consumer
///
/// Ids are "<sequence>-0". Removing a consumer discards its pending entries,
/// as XGROUP DELCONSUMER does.
class MemoryStreamClient : public StreamClient {
public:
    absl::Status CreateGroup(const std::string& stream, const std::string& group) override;

    absl::StatusOr<std::vector<model::StreamEntry>> ReadGroup(
        const std::string& stream, const std::string& group, const std::string& consumer,
        size_t count, std::chrono::milliseconds block) override;

    absl::StatusOr<std::vector<model::StreamEntry>> AutoClaim(
        const std::string& stream, const std::string& group, const std::string& consumer,
        std::chrono::milliseconds min_idle, size_t count) override;

    absl::StatusOr<int64_t> Ack(const std::string& stream, const std::string& group,
                                const std::vector<std::string>& ids) override;

    absl::StatusOr<int64_t> Delete(const std::string& stream,
                                   const std::vector<std::string>& ids) override;

    absl::StatusOr<int64_t> DeliveryCount(const std::string& stream, const std::string& group,
                                          const std::string& id) override;

    absl::StatusOr<std::string> PendingOwner(const std::string& stream, const std::string& group,
                                             const std::string& id) override;

    absl::Status RemoveConsumer(const std::string& stream, const std::string& group,
                                const std::string& consumer) override;

    absl::StatusOr<std::string> Append(
        const std::string& stream,
        const std::vector<std::pair<std::string, std::string>>& fields) override;

    /// @brief Fail every call with status until reset with OkStatus
    void SetFailure(absl::Status status);

    /// @brief Entries delivered to the group and not yet acknowledged
    size_t PendingCount(const std::string& stream, const std::string& group) const;

    /// @brief Entries still in the stream
    size_t Length(const std::string& stream) const;

    /// @brief Consumers currently registered in the group
    std::set<std::string> Consumers(const std::string& stream, const std::string& group) const;

private:
    struct PendingEntry {
        std::string consumer;
        int64_t delivery_count = 0;
        std::chrono::steady_clock::time_point delivered_at;
    };

    struct Group {
        uint64_t last_delivered = 0;
        std::map<uint64_t, PendingEntry> pending;
        std::set<std::string> consumers;
    };

    struct Stream {
        std::map<uint64_t, std::unordered_map<std::string, std::string>> entries;
        std::map<std::string, Group> groups;
    };

    absl::StatusOr<Group*> FindGroupLocked(const std::string& stream, const std::string& group);

    mutable std::mutex mutex_;
    std::condition_variable appended_;
    std::map<std::string, Stream> streams_;
    uint64_t next_sequence_ = 1;
    absl::Status failure_;
};

}  // namespace tracescore::consumer
