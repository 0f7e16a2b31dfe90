/// @file client.cpp
/// @brief ClickHouse client implementation for tracescore

#include "storage/clickhouse/client.h"

#include <algorithm>
#include <cctype>
#include <mutex>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <clickhouse/client.h>
#include <clickhouse/columns/date.h>
#include <clickhouse/columns/map.h>
#include <clickhouse/columns/numeric.h>
#include <clickhouse/columns/string.h>
#include <nlohmann/json.hpp>

#include "common/error.h"
#include "common/logging.h"

namespace tracescore::storage {

using json = nlohmann::json;

namespace {

using MarkerColumn = clickhouse::ColumnMapT<clickhouse::ColumnString, clickhouse::ColumnString>;

const std::vector<std::string> kMigrations = {
    R"(CREATE TABLE IF NOT EXISTS feedback_scores (
        workspace_id String,
        project_id String,
        entity_id String,
        entity_type String,
        name String,
        value Float64,
        reason String,
        source String,
        created_by String,
        created_at DateTime64(3, 'UTC'),
        last_updated_at DateTime64(3, 'UTC')
    ) ENGINE = ReplacingMergeTree(last_updated_at)
    ORDER BY (workspace_id, project_id, entity_type, entity_id, name))",

    R"(CREATE TABLE IF NOT EXISTS automation_rule_evaluator_logs (
        timestamp DateTime64(3, 'UTC'),
        workspace_id String,
        rule_id String,
        level String,
        message String,
        markers Map(String, String)
    ) ENGINE = MergeTree
    ORDER BY (workspace_id, rule_id, timestamp)
    TTL toDateTime(timestamp) + INTERVAL 12 MONTH)",
};

int64_t ToEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t ParseInt64(const std::string& text) {
    int64_t value = 0;
    if (!absl::SimpleAtoi(text, &value)) {
        return 0;
    }
    return value;
}

json ParseJsonColumn(const std::string& text) {
    if (text.empty()) {
        return json::object();
    }
    auto value = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (value.is_discarded()) {
        return json(text);
    }
    return value;
}

}  // namespace

std::string EscapeValue(const std::string& value, const std::string& type) {
    if (type == "Int64") {
        if (value.empty()) {
            return "0";
        }
        size_t pos = value[0] == '-' ? 1 : 0;
        if (pos == value.size()) {
            return "0";
        }
        for (; pos < value.size(); ++pos) {
            if (!std::isdigit(static_cast<unsigned char>(value[pos]))) {
                TRACESCORE_LOG_WARN("Invalid integer value rejected: {}", value);
                return "0";
            }
        }
        return value;
    }

    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped += "'";
    for (unsigned char c : value) {
        switch (c) {
            case '\'':
                escaped += "\\'";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\0':
                escaped += "\\0";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                // Drop remaining control characters, keep UTF-8 bytes
                if (c >= 32) {
                    escaped += static_cast<char>(c);
                }
                break;
        }
    }
    escaped += "'";
    return escaped;
}

std::string BindParams(const std::string& sql, const std::vector<QueryParam>& params) {
    std::string final_sql = sql;
    for (const auto& param : params) {
        const std::string placeholder = "{" + param.name + "}";
        const std::string escaped = EscapeValue(param.value, param.type);
        size_t pos = 0;
        while ((pos = final_sql.find(placeholder, pos)) != std::string::npos) {
            final_sql.replace(pos, placeholder.length(), escaped);
            pos += escaped.length();
        }
    }
    return final_sql;
}

// =============================================================================
// ClickHouseClient Implementation
// =============================================================================

class ClickHouseClient::Impl {
public:
    explicit Impl(const ClickHouseConfig& config) : config_(config) {}

    ~Impl() {
        std::lock_guard<std::mutex> lock(mutex_);
        client_.reset();
    }

    absl::Status Connect() {
        std::lock_guard<std::mutex> lock(mutex_);
        return ConnectLocked();
    }

    absl::Status Disconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_) {
            client_.reset();
            TRACESCORE_LOG_INFO("Disconnected from ClickHouse");
        }
        return absl::OkStatus();
    }

    bool IsConnected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return client_ != nullptr;
    }

    absl::StatusOr<QueryResult> Execute(const std::string& sql) {
        std::lock_guard<std::mutex> lock(mutex_);
        TRACESCORE_RETURN_IF_ERROR(ConnectLocked());

        QueryResult result;
        auto start_time = std::chrono::steady_clock::now();

        try {
            bool first_block = true;
            client_->Select(sql, [&result, &first_block](const clickhouse::Block& block) {
                if (first_block && block.GetColumnCount() > 0) {
                    for (size_t i = 0; i < block.GetColumnCount(); ++i) {
                        result.columns.push_back(block.GetColumnName(i));
                    }
                    first_block = false;
                }
                for (size_t row = 0; row < block.GetRowCount(); ++row) {
                    std::vector<std::string> row_data;
                    for (size_t col = 0; col < block.GetColumnCount(); ++col) {
                        row_data.push_back(ColumnValueToString(block[col], row));
                    }
                    result.rows.push_back(std::move(row_data));
                }
                result.total_rows += block.GetRowCount();
            });
        } catch (const std::exception& e) {
            return MakeError(ErrorCode::kUnavailable,
                             std::string("Query execution failed: ") + e.what());
        }

        result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        TRACESCORE_LOG_DEBUG("Query executed in {}ms, {} rows returned",
                             result.execution_time.count(), result.total_rows);
        return result;
    }

    absl::Status ExecuteDDL(const std::string& ddl) {
        std::lock_guard<std::mutex> lock(mutex_);
        TRACESCORE_RETURN_IF_ERROR(ConnectLocked());
        try {
            client_->Execute(ddl);
            return absl::OkStatus();
        } catch (const std::exception& e) {
            return MakeError(ErrorCode::kUnavailable,
                             std::string("DDL execution failed: ") + e.what());
        }
    }

    absl::Status InsertFeedbackScores(const std::vector<model::FeedbackScore>& scores) {
        if (scores.empty()) {
            return absl::OkStatus();
        }

        auto workspace_id = std::make_shared<clickhouse::ColumnString>();
        auto project_id = std::make_shared<clickhouse::ColumnString>();
        auto entity_id = std::make_shared<clickhouse::ColumnString>();
        auto entity_type = std::make_shared<clickhouse::ColumnString>();
        auto name = std::make_shared<clickhouse::ColumnString>();
        auto value = std::make_shared<clickhouse::ColumnFloat64>();
        auto reason = std::make_shared<clickhouse::ColumnString>();
        auto source = std::make_shared<clickhouse::ColumnString>();
        auto created_by = std::make_shared<clickhouse::ColumnString>();
        auto created_at = std::make_shared<clickhouse::ColumnDateTime64>(3);
        auto last_updated_at = std::make_shared<clickhouse::ColumnDateTime64>(3);

        const int64_t now = ToEpochMillis(std::chrono::system_clock::now());
        for (const auto& score : scores) {
            workspace_id->Append(score.workspace_id);
            project_id->Append(score.project_id);
            entity_id->Append(score.entity_id);
            entity_type->Append(std::string(model::ToString(score.entity_type)));
            name->Append(score.name);
            value->Append(score.value);
            reason->Append(score.reason);
            source->Append(score.source);
            created_by->Append(score.author);
            created_at->Append(now);
            last_updated_at->Append(now);
        }

        clickhouse::Block block;
        block.AppendColumn("workspace_id", workspace_id);
        block.AppendColumn("project_id", project_id);
        block.AppendColumn("entity_id", entity_id);
        block.AppendColumn("entity_type", entity_type);
        block.AppendColumn("name", name);
        block.AppendColumn("value", value);
        block.AppendColumn("reason", reason);
        block.AppendColumn("source", source);
        block.AppendColumn("created_by", created_by);
        block.AppendColumn("created_at", created_at);
        block.AppendColumn("last_updated_at", last_updated_at);

        TRACESCORE_RETURN_IF_ERROR(InsertBlock(kFeedbackScoresTable, block));
        TRACESCORE_LOG_DEBUG("Inserted {} feedback scores into ClickHouse", scores.size());
        return absl::OkStatus();
    }

    absl::Status InsertRuleLogs(const std::vector<model::UserLogEntry>& entries) {
        if (entries.empty()) {
            return absl::OkStatus();
        }

        auto timestamp = std::make_shared<clickhouse::ColumnDateTime64>(3);
        auto workspace_id = std::make_shared<clickhouse::ColumnString>();
        auto rule_id = std::make_shared<clickhouse::ColumnString>();
        auto level = std::make_shared<clickhouse::ColumnString>();
        auto message = std::make_shared<clickhouse::ColumnString>();
        auto markers = std::make_shared<MarkerColumn>(std::make_shared<clickhouse::ColumnString>(),
                                                      std::make_shared<clickhouse::ColumnString>());

        for (const auto& entry : entries) {
            timestamp->Append(ToEpochMillis(entry.timestamp));
            workspace_id->Append(entry.workspace_id);
            rule_id->Append(entry.rule_id);
            level->Append(std::string(model::ToString(entry.level)));
            message->Append(entry.message);
            markers->Append(entry.markers);
        }

        clickhouse::Block block;
        block.AppendColumn("timestamp", timestamp);
        block.AppendColumn("workspace_id", workspace_id);
        block.AppendColumn("rule_id", rule_id);
        block.AppendColumn("level", level);
        block.AppendColumn("message", message);
        block.AppendColumn("markers", markers);

        return InsertBlock(kRuleLogsTable, block);
    }

private:
    absl::Status ConnectLocked() {
        if (client_) {
            return absl::OkStatus();
        }
        try {
            clickhouse::ClientOptions options;
            options.SetHost(config_.host)
                   .SetPort(config_.port)
                   .SetUser(config_.user)
                   .SetPassword(config_.password)
                   .SetDefaultDatabase(config_.database)
                   .SetSendRetries(3)
                   .SetRetryTimeout(std::chrono::seconds(5))
                   .SetConnectionConnectTimeout(config_.connection_timeout)
                   .SetCompressionMethod(
                       config_.use_compression
                           ? clickhouse::CompressionMethod::LZ4
                           : clickhouse::CompressionMethod::None);

            client_ = std::make_unique<clickhouse::Client>(options);
            TRACESCORE_LOG_INFO("Connected to ClickHouse at {}:{}/{}",
                                config_.host, config_.port, config_.database);
            return absl::OkStatus();
        } catch (const std::exception& e) {
            client_.reset();
            return MakeError(ErrorCode::kConnectionFailed,
                             std::string("Failed to connect to ClickHouse: ") + e.what());
        }
    }

    absl::Status InsertBlock(const std::string& table, const clickhouse::Block& block) {
        std::lock_guard<std::mutex> lock(mutex_);
        TRACESCORE_RETURN_IF_ERROR(ConnectLocked());
        try {
            client_->Insert(table, block);
            return absl::OkStatus();
        } catch (const std::exception& e) {
            // Drop the connection so the next call starts from a clean socket
            client_.reset();
            return MakeError(ErrorCode::kUnavailable,
                             absl::StrCat("Insert into ", table, " failed: ", e.what()));
        }
    }

    static std::string ColumnValueToString(const clickhouse::ColumnRef& column, size_t row) {
        if (auto str_col = column->As<clickhouse::ColumnString>()) {
            return std::string(str_col->At(row));
        }
        if (auto int64_col = column->As<clickhouse::ColumnInt64>()) {
            return std::to_string(int64_col->At(row));
        }
        if (auto uint64_col = column->As<clickhouse::ColumnUInt64>()) {
            return std::to_string(uint64_col->At(row));
        }
        if (auto float64_col = column->As<clickhouse::ColumnFloat64>()) {
            return std::to_string(float64_col->At(row));
        }
        return "";
    }

    const ClickHouseConfig& config_;
    mutable std::mutex mutex_;
    std::unique_ptr<clickhouse::Client> client_;
};

// =============================================================================
// ClickHouseClient Public Interface
// =============================================================================

ClickHouseClient::ClickHouseClient(ClickHouseConfig config)
    : config_(std::move(config)), impl_(std::make_unique<Impl>(config_)) {}

ClickHouseClient::~ClickHouseClient() = default;

absl::Status ClickHouseClient::Connect() {
    return impl_->Connect();
}

absl::Status ClickHouseClient::Disconnect() {
    return impl_->Disconnect();
}

bool ClickHouseClient::IsConnected() const {
    return impl_->IsConnected();
}

absl::StatusOr<QueryResult> ClickHouseClient::Execute(const std::string& sql) {
    return impl_->Execute(sql);
}

absl::StatusOr<QueryResult> ClickHouseClient::ExecuteWithParams(
    const std::string& sql,
    const std::vector<QueryParam>& params) {
    return impl_->Execute(BindParams(sql, params));
}

absl::Status ClickHouseClient::InsertFeedbackScores(
    const std::vector<model::FeedbackScore>& scores) {
    return impl_->InsertFeedbackScores(scores);
}

absl::Status ClickHouseClient::InsertRuleLogs(const std::vector<model::UserLogEntry>& entries) {
    return impl_->InsertRuleLogs(entries);
}

absl::StatusOr<model::UserLogPage> ClickHouseClient::QueryRuleLogs(
    const model::UserLogQuery& query) {
    const int64_t page = std::max<int64_t>(query.page, 1);
    const int64_t size = std::max<int64_t>(query.size, 1);

    std::vector<QueryParam> params = {
        {"workspace_id", query.workspace_id, "String"},
        {"limit", std::to_string(size), "Int64"},
        {"offset", std::to_string((page - 1) * size), "Int64"},
    };
    std::string where = "workspace_id = {workspace_id}";
    if (query.rule_id) {
        where += " AND rule_id = {rule_id}";
        params.push_back({"rule_id", *query.rule_id, "String"});
    }
    if (query.level) {
        where += " AND level = {level}";
        params.push_back({"level", std::string(model::ToString(*query.level)), "String"});
    }

    TRACESCORE_ASSIGN_OR_RETURN(
        auto rows,
        ExecuteWithParams(absl::StrCat("SELECT toUnixTimestamp64Milli(timestamp), workspace_id, "
                                       "rule_id, level, message, toJSONString(markers) FROM ",
                                       kRuleLogsTable, " WHERE ", where,
                                       " ORDER BY timestamp DESC LIMIT {limit} OFFSET {offset}"),
                          params));
    TRACESCORE_ASSIGN_OR_RETURN(
        auto count,
        ExecuteWithParams(absl::StrCat("SELECT count() FROM ", kRuleLogsTable, " WHERE ", where),
                          params));

    model::UserLogPage result;
    result.page = page;
    result.total = count.rows.empty() ? 0 : ParseInt64(count.rows[0][0]);
    for (const auto& row : rows.rows) {
        if (row.size() < 6) {
            continue;
        }
        model::UserLogEntry entry;
        entry.timestamp = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(ParseInt64(row[0])));
        entry.workspace_id = row[1];
        entry.rule_id = row[2];
        entry.level = model::ParseUserLogLevel(row[3]).value_or(model::UserLogLevel::kInfo);
        entry.message = row[4];
        auto markers = ParseJsonColumn(row[5]);
        if (markers.is_object()) {
            for (const auto& [key, value] : markers.items()) {
                if (value.is_string()) {
                    entry.markers[key] = value.get<std::string>();
                }
            }
        }
        result.content.push_back(std::move(entry));
    }
    result.size = static_cast<int64_t>(result.content.size());
    return result;
}

absl::StatusOr<std::vector<model::ScoredEntity>> ClickHouseClient::QueryThreadTraces(
    const std::string& workspace_id,
    const std::string& project_id,
    const std::string& thread_id) {
    static const std::string kSql = absl::StrCat(
        "SELECT id, name, input, output, metadata, toJSONString(tags), "
        "toUnixTimestamp64Milli(start_time), toUnixTimestamp64Milli(end_time) "
        "FROM (SELECT * FROM ", kTracesTable,
        " WHERE workspace_id = {workspace_id} AND project_id = {project_id} "
        "AND thread_id = {thread_id} "
        "ORDER BY id DESC, last_updated_at DESC LIMIT 1 BY id) "
        "ORDER BY start_time ASC, id ASC");

    TRACESCORE_ASSIGN_OR_RETURN(auto result,
                                ExecuteWithParams(kSql, {{"workspace_id", workspace_id, "String"},
                                                         {"project_id", project_id, "String"},
                                                         {"thread_id", thread_id, "String"}}));

    std::vector<model::ScoredEntity> traces;
    traces.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        if (row.size() < 8) {
            continue;
        }
        model::ScoredEntity trace;
        trace.type = model::EntityType::kTrace;
        trace.id = row[0];
        trace.project_id = project_id;
        trace.thread_id = thread_id;
        trace.name = row[1];
        trace.input = ParseJsonColumn(row[2]);
        trace.output = ParseJsonColumn(row[3]);
        trace.metadata = ParseJsonColumn(row[4]);
        auto tags = ParseJsonColumn(row[5]);
        if (tags.is_array()) {
            for (const auto& tag : tags) {
                if (tag.is_string()) {
                    trace.tags.push_back(tag.get<std::string>());
                }
            }
        }
        int64_t start = ParseInt64(row[6]);
        int64_t end = ParseInt64(row[7]);
        if (start > 0) {
            trace.start_time_ms = start;
        }
        if (end > 0) {
            trace.end_time_ms = end;
        }
        traces.push_back(std::move(trace));
    }
    return traces;
}

absl::Status ClickHouseClient::RunMigrations() {
    TRACESCORE_LOG_INFO("Running ClickHouse migrations");
    for (const auto& ddl : kMigrations) {
        TRACESCORE_RETURN_IF_ERROR(impl_->ExecuteDDL(ddl));
    }
    return absl::OkStatus();
}

}  // namespace tracescore::storage
