#pragma once

/// @file clickhouse_sinks.h
/// @brief Sinks writing to ClickHouse

#include <memory>

#include "sinks/feedback_score_sink.h"
#include "sinks/user_log_sink.h"
#include "storage/clickhouse/client.h"

namespace tracescore::sinks {

/// @brief One insert into feedback_scores per batch
class ClickHouseFeedbackScoreSink : public FeedbackScoreSink {
public:
    explicit ClickHouseFeedbackScoreSink(std::shared_ptr<storage::ClickHouseClient> client);

    absl::Status Write(const std::vector<model::FeedbackScore>& scores) override;

private:
    std::shared_ptr<storage::ClickHouseClient> client_;
};

/// @brief automation_rule_evaluator_logs reader and writer
class ClickHouseUserLogSink : public UserLogSink {
public:
    explicit ClickHouseUserLogSink(std::shared_ptr<storage::ClickHouseClient> client);

    absl::Status Append(const std::vector<model::UserLogEntry>& entries) override;

    absl::StatusOr<model::UserLogPage> Query(const model::UserLogQuery& query) override;

private:
    std::shared_ptr<storage::ClickHouseClient> client_;
};

}  // namespace tracescore::sinks
