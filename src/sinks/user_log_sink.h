#pragma once

/// @file user_log_sink.h
/// @brief Per-rule logs that rule owners read back

#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "model/user_log.h"

namespace tracescore::sinks {

class UserLogSink {
public:
    virtual ~UserLogSink() = default;

    virtual absl::Status Append(const std::vector<model::UserLogEntry>& entries) = 0;

    /// @brief Entries filtered by workspace, rule and level, newest first
    virtual absl::StatusOr<model::UserLogPage> Query(const model::UserLogQuery& query) = 0;
};

}  // namespace tracescore::sinks
