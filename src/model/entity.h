#pragma once

/// @file entity.h
/// @brief Snapshots of traces, spans and threads as seen by the scoring engine

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "model/evaluator_kind.h"

namespace tracescore::model {

/// @brief One turn of a conversation thread
struct ThreadMessage {
    std::string role;  ///< "user" or "assistant"
    std::string content;
    int64_t timestamp_ms = 0;
};

/// @brief Read-only view of the entity a rule is scored against
///
/// Traces and spans carry input/output/metadata trees; threads carry the
/// ordered message list instead. Times are Unix epoch milliseconds.
struct ScoredEntity {
    EntityType type = EntityType::kTrace;
    std::string id;
    std::string project_id;
    std::string trace_id;   ///< Spans only
    std::string thread_id;  ///< Empty when the trace is not part of a thread
    std::string name;

    nlohmann::json input = nlohmann::json::object();
    nlohmann::json output = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
    std::vector<std::string> tags;

    std::optional<int64_t> start_time_ms;
    std::optional<int64_t> end_time_ms;

    std::map<std::string, int64_t> usage;
    std::optional<double> total_estimated_cost;

    // Spans
    std::string model;
    std::string provider;
    std::string span_type;
    std::string error_info;

    /// "passed" or "failed" once guardrails ran, empty otherwise
    std::string guardrails;

    std::map<std::string, double> feedback_scores;

    // Threads, in chronological order
    std::vector<ThreadMessage> messages;

    /// @brief end - start in milliseconds, if both are known
    std::optional<int64_t> DurationMs() const;
};

/// @brief Parse an RFC 3339 timestamp into epoch milliseconds
std::optional<int64_t> ParseTimestampMs(const std::string& text);

/// @brief Decode a trace or span payload as published on the stream
absl::StatusOr<ScoredEntity> DecodeEntity(EntityType type, const nlohmann::json& json);

/// @brief Encode a trace or span in the form DecodeEntity reads, times as epoch ms
nlohmann::json EntityToJson(const ScoredEntity& entity);

/// @brief Assemble a thread from its traces
///
/// Traces are ordered by start time; each contributes a user message from its
/// input and an assistant message from its output.
ScoredEntity BuildThreadEntity(const std::string& thread_id,
                               const std::string& project_id,
                               std::vector<ScoredEntity> traces);

/// @brief Text of a message-like JSON value: strings as-is, other values dumped
std::string JsonToText(const nlohmann::json& value);

}  // namespace tracescore::model
