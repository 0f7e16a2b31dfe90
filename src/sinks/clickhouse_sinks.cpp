#include "sinks/clickhouse_sinks.h"

#include "common/metrics.h"

namespace tracescore::sinks {

ClickHouseFeedbackScoreSink::ClickHouseFeedbackScoreSink(
    std::shared_ptr<storage::ClickHouseClient> client)
    : client_(std::move(client)) {}

absl::Status ClickHouseFeedbackScoreSink::Write(const std::vector<model::FeedbackScore>& scores) {
    ScopedTimer timer(TRACESCORE_HISTOGRAM("tracescore_feedback_score_write_ms"));
    auto status = client_->InsertFeedbackScores(scores);
    if (!status.ok()) {
        TRACESCORE_COUNTER("tracescore_feedback_score_write_errors").Increment();
    }
    return status;
}

ClickHouseUserLogSink::ClickHouseUserLogSink(std::shared_ptr<storage::ClickHouseClient> client)
    : client_(std::move(client)) {}

absl::Status ClickHouseUserLogSink::Append(const std::vector<model::UserLogEntry>& entries) {
    return client_->InsertRuleLogs(entries);
}

absl::StatusOr<model::UserLogPage> ClickHouseUserLogSink::Query(const model::UserLogQuery& query) {
    return client_->QueryRuleLogs(query);
}

}  // namespace tracescore::sinks
