#pragma once

/// @file redis_stream_client.h
/// @brief StreamClient over Redis streams

#include <memory>

#include "consumer/stream_client.h"
#include "storage/redis/client.h"

namespace tracescore::consumer {

class RedisStreamClient : public StreamClient {
public:
    explicit RedisStreamClient(std::shared_ptr<storage::RedisClient> redis);

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

private:
    std::shared_ptr<storage::RedisClient> redis_;
};

}  // namespace tracescore::consumer
