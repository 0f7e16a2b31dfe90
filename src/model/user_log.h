#pragma once

/// @file user_log.h
/// @brief Per-rule log entries readable by rule owners

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tracescore::model {

enum class UserLogLevel {
    kTrace,
    kDebug,
    kInfo,
    kWarn,
    kError
};

std::string_view ToString(UserLogLevel level);

std::optional<UserLogLevel> ParseUserLogLevel(std::string_view text);

/// @brief Markers link a log line to the scored entity
inline constexpr const char* kTraceMarker = "trace_id";
inline constexpr const char* kSpanMarker = "span_id";
inline constexpr const char* kThreadMarker = "thread_model_id";

struct UserLogEntry {
    std::chrono::system_clock::time_point timestamp;
    UserLogLevel level = UserLogLevel::kInfo;
    std::string workspace_id;
    std::string rule_id;
    std::string message;
    std::map<std::string, std::string> markers;
};

struct UserLogQuery {
    std::string workspace_id;
    std::optional<std::string> rule_id;
    std::optional<UserLogLevel> level;
    int64_t page = 1;  ///< 1-based
    int64_t size = 50;
};

/// @brief One page of entries, newest first
struct UserLogPage {
    std::vector<UserLogEntry> content;
    int64_t page = 1;
    int64_t size = 0;
    int64_t total = 0;
};

}  // namespace tracescore::model
