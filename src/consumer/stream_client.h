#pragma once

/// @file stream_client.h
/// @brief Consumer-group operations the stream consumer relies on

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "model/stream_message.h"

namespace tracescore::consumer {

/// @brief Consumer-group view of an append-only stream
///
/// Entries read through a group stay pending for the reading consumer until
/// acknowledged. Pending entries idle for long enough can be claimed by any
/// consumer of the group.
class StreamClient {
public:
    virtual ~StreamClient() = default;

    /// @brief Create the group at the end of the stream; an existing group is fine
    virtual absl::Status CreateGroup(const std::string& stream, const std::string& group) = 0;

    /// @brief Up to count entries never delivered to the group
    virtual absl::StatusOr<std::vector<model::StreamEntry>> ReadGroup(
        const std::string& stream, const std::string& group, const std::string& consumer,
        size_t count, std::chrono::milliseconds block) = 0;

    /// @brief Take over up to count entries pending longer than min_idle
    virtual absl::StatusOr<std::vector<model::StreamEntry>> AutoClaim(
        const std::string& stream, const std::string& group, const std::string& consumer,
        std::chrono::milliseconds min_idle, size_t count) = 0;

    virtual absl::StatusOr<int64_t> Ack(const std::string& stream, const std::string& group,
                                        const std::vector<std::string>& ids) = 0;

    virtual absl::StatusOr<int64_t> Delete(const std::string& stream,
                                           const std::vector<std::string>& ids) = 0;

    /// @brief Times the entry was delivered, 0 if it is not pending
    virtual absl::StatusOr<int64_t> DeliveryCount(const std::string& stream,
                                                  const std::string& group,
                                                  const std::string& id) = 0;

    /// @brief Consumer holding a pending entry, empty if it is not pending
    virtual absl::StatusOr<std::string> PendingOwner(const std::string& stream,
                                                     const std::string& group,
                                                     const std::string& id) = 0;

    /// @brief Drop a consumer from the group along with its pending entries
    virtual absl::Status RemoveConsumer(const std::string& stream, const std::string& group,
                                        const std::string& consumer) = 0;

    /// @return Id of the new entry
    virtual absl::StatusOr<std::string> Append(
        const std::string& stream,
        const std::vector<std::pair<std::string, std::string>>& fields) = 0;
};

}  // namespace tracescore::consumer
