#pragma once

/// @file client.h
/// @brief ClickHouse client wrapper for tracescore

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "model/entity.h"
#include "model/feedback_score.h"
#include "model/user_log.h"

namespace tracescore::storage {

inline constexpr const char* kFeedbackScoresTable = "feedback_scores";
inline constexpr const char* kRuleLogsTable = "automation_rule_evaluator_logs";
inline constexpr const char* kTracesTable = "traces";

/// @brief Query parameter for parameterized queries
struct QueryParam {
    std::string name;
    std::string value;
    std::string type;  // "String" or "Int64"
};

/// @brief Result of a query execution
struct QueryResult {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;
    size_t total_rows = 0;
    std::chrono::milliseconds execution_time{0};
};

/// @brief ClickHouse client configuration
struct ClickHouseConfig {
    std::string host = "localhost";
    uint16_t port = 9000;
    std::string database = "tracescore";
    std::string user = "default";
    std::string password;

    std::chrono::seconds connection_timeout{30};
    bool use_compression = true;
};

/// @brief Quote a value for inlining into SQL
///
/// Strings are single-quoted with quotes, backslashes and control characters
/// escaped. Int64 values are validated and fall back to 0.
std::string EscapeValue(const std::string& value, const std::string& type);

/// @brief Substitute {name} placeholders with escaped parameter values
std::string BindParams(const std::string& sql, const std::vector<QueryParam>& params);

/// @brief Thread-safe ClickHouse client for scores, rule logs and thread traces
class ClickHouseClient {
public:
    explicit ClickHouseClient(ClickHouseConfig config);

    ~ClickHouseClient();

    // Non-copyable
    ClickHouseClient(const ClickHouseClient&) = delete;
    ClickHouseClient& operator=(const ClickHouseClient&) = delete;

    absl::Status Connect();

    absl::Status Disconnect();

    bool IsConnected() const;

    /// @brief Execute a query and return results as text
    absl::StatusOr<QueryResult> Execute(const std::string& sql);

    absl::StatusOr<QueryResult> ExecuteWithParams(const std::string& sql,
                                                  const std::vector<QueryParam>& params);

    /// @brief Insert a batch of scores as one block
    absl::Status InsertFeedbackScores(const std::vector<model::FeedbackScore>& scores);

    /// @brief Insert a batch of rule log entries as one block
    absl::Status InsertRuleLogs(const std::vector<model::UserLogEntry>& entries);

    /// @brief Page of rule logs, newest first
    absl::StatusOr<model::UserLogPage> QueryRuleLogs(const model::UserLogQuery& query);

    /// @brief Latest version of every trace in a thread, oldest first
    absl::StatusOr<std::vector<model::ScoredEntity>> QueryThreadTraces(
        const std::string& workspace_id,
        const std::string& project_id,
        const std::string& thread_id);

    /// @brief Create the tables this service writes
    absl::Status RunMigrations();

    const ClickHouseConfig& GetConfig() const { return config_; }

private:
    ClickHouseConfig config_;
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tracescore::storage
