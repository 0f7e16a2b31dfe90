#include "consumer/redis_stream_client.h"

namespace tracescore::consumer {

RedisStreamClient::RedisStreamClient(std::shared_ptr<storage::RedisClient> redis)
    : redis_(std::move(redis)) {}

absl::Status RedisStreamClient::CreateGroup(const std::string& stream, const std::string& group) {
    return redis_->CreateGroup(stream, group);
}

absl::StatusOr<std::vector<model::StreamEntry>> RedisStreamClient::ReadGroup(
    const std::string& stream, const std::string& group, const std::string& consumer,
    size_t count, std::chrono::milliseconds block) {
    return redis_->ReadGroup(stream, group, consumer, count, block);
}

absl::StatusOr<std::vector<model::StreamEntry>> RedisStreamClient::AutoClaim(
    const std::string& stream, const std::string& group, const std::string& consumer,
    std::chrono::milliseconds min_idle, size_t count) {
    return redis_->AutoClaim(stream, group, consumer, min_idle, count);
}

absl::StatusOr<int64_t> RedisStreamClient::Ack(const std::string& stream, const std::string& group,
                                               const std::vector<std::string>& ids) {
    return redis_->Ack(stream, group, ids);
}

absl::StatusOr<int64_t> RedisStreamClient::Delete(const std::string& stream,
                                                  const std::vector<std::string>& ids) {
    return redis_->DeleteEntries(stream, ids);
}

absl::StatusOr<int64_t> RedisStreamClient::DeliveryCount(const std::string& stream,
                                                         const std::string& group,
                                                         const std::string& id) {
    return redis_->DeliveryCount(stream, group, id);
}

absl::StatusOr<std::string> RedisStreamClient::PendingOwner(const std::string& stream,
                                                           const std::string& group,
                                                           const std::string& id) {
    return redis_->PendingOwner(stream, group, id);
}

absl::Status RedisStreamClient::RemoveConsumer(const std::string& stream,
                                               const std::string& group,
                                               const std::string& consumer) {
    return redis_->RemoveConsumer(stream, group, consumer);
}

absl::StatusOr<std::string> RedisStreamClient::Append(
    const std::string& stream, const std::vector<std::pair<std::string, std::string>>& fields) {
    return redis_->Append(stream, fields);
}

}  // namespace tracescore::consumer
