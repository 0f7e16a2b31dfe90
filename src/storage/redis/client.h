#pragma once

/// @file client.h
/// @brief Redis client wrapper for the rule cache and the entity streams

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "model/stream_message.h"

namespace tracescore::storage {

/// @brief Redis client configuration
struct RedisConfig {
    std::string host = "localhost";
    uint16_t port = 6379;
    std::string password;
    int database = 0;

    std::chrono::seconds connection_timeout{5};
    /// Must exceed the XREADGROUP block time
    std::chrono::seconds socket_timeout{10};
};

/// @brief One synchronous hiredis connection
///
/// Calls are serialized on an internal mutex, so an instance may be shared
/// between threads, but a blocking XREADGROUP holds the connection for the
/// whole block time. Stream consumers therefore get their own client.
/// A connection error marks the client disconnected; the next call reconnects.
class RedisClient {
public:
    explicit RedisClient(RedisConfig config);

    ~RedisClient();

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    RedisClient(RedisClient&&) noexcept;
    RedisClient& operator=(RedisClient&&) noexcept;

    absl::Status Connect();

    absl::Status Disconnect();

    bool IsConnected() const;

    absl::Status Ping();

    // ==========================================================================
    // Keys
    // ==========================================================================

    /// @param ttl Expiry, none when nullopt or zero
    absl::Status Set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::seconds> ttl = std::nullopt);

    /// @return Value if exists, nullopt if not found
    absl::StatusOr<std::optional<std::string>> Get(const std::string& key);

    /// @return true if the key existed
    absl::StatusOr<bool> Delete(const std::string& key);

    /// @brief All keys matching a glob, collected with SCAN
    absl::StatusOr<std::vector<std::string>> Scan(const std::string& pattern, size_t batch = 100);

    // ==========================================================================
    // Streams
    // ==========================================================================

    /// @brief XGROUP CREATE <stream> <group> $ MKSTREAM; an existing group is not an error
    absl::Status CreateGroup(const std::string& stream, const std::string& group);

    /// @brief XREADGROUP of never-delivered entries
    /// @param block Zero means do not block
    absl::StatusOr<std::vector<model::StreamEntry>> ReadGroup(
        const std::string& stream, const std::string& group, const std::string& consumer,
        size_t count, std::chrono::milliseconds block);

    /// @brief XAUTOCLAIM entries idle longer than min_idle, starting from 0-0
    absl::StatusOr<std::vector<model::StreamEntry>> AutoClaim(
        const std::string& stream, const std::string& group, const std::string& consumer,
        std::chrono::milliseconds min_idle, size_t count);

    /// @return Number of entries acknowledged
    absl::StatusOr<int64_t> Ack(const std::string& stream, const std::string& group,
                                const std::vector<std::string>& ids);

    /// @return Number of entries removed from the stream
    absl::StatusOr<int64_t> DeleteEntries(const std::string& stream,
                                          const std::vector<std::string>& ids);

    /// @brief Delivery count of a pending entry, 0 if it is not pending
    absl::StatusOr<int64_t> DeliveryCount(const std::string& stream, const std::string& group,
                                          const std::string& id);

    /// @brief Consumer holding a pending entry, empty if it is not pending
    absl::StatusOr<std::string> PendingOwner(const std::string& stream, const std::string& group,
                                             const std::string& id);

    /// @brief XGROUP DELCONSUMER
    absl::Status RemoveConsumer(const std::string& stream, const std::string& group,
                                const std::string& consumer);

    /// @brief XADD <stream> * field value ...
    absl::StatusOr<std::string> Append(const std::string& stream,
                                       const std::vector<std::pair<std::string, std::string>>& fields);

    const RedisConfig& GetConfig() const { return config_; }

private:
    RedisConfig config_;
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tracescore::storage
