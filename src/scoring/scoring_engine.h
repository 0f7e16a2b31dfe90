#pragma once

/// @file scoring_engine.h
/// @brief Scores a batch of entities against the enabled rules of a project

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>

#include "common/thread_pool.h"
#include "llm/provider_registry.h"
#include "model/entity.h"
#include "model/evaluator_kind.h"
#include "model/feedback_score.h"
#include "model/rule.h"
#include "model/user_log.h"
#include "python/metric_executor.h"
#include "registry/rule_registry.h"
#include "scoring/sampler.h"
#include "sinks/feedback_score_sink.h"
#include "sinks/user_log_sink.h"

namespace tracescore::scoring {

struct EngineOptions {
    /// Bound on one LLM or python call, retries included
    std::chrono::milliseconds call_timeout{60000};

    /// Bound on one Evaluate() call; unfinished items become errors
    std::chrono::milliseconds batch_timeout{300000};
};

/// @brief Collaborators the engine calls into
struct EngineDependencies {
    std::shared_ptr<registry::RuleRegistry> rules;
    std::shared_ptr<llm::ProviderRegistry> providers;
    std::shared_ptr<python::PythonMetricExecutor> python;
    std::shared_ptr<sinks::FeedbackScoreSink> feedback_scores;
    std::shared_ptr<sinks::UserLogSink> user_logs;
    std::shared_ptr<ThreadPool> pool;
    std::shared_ptr<Sampler> sampler;
};

/// @brief What one (entity, rule) evaluation produced
struct ItemOutcome {
    std::vector<model::FeedbackScore> scores;
    std::vector<model::UserLogEntry> logs;
    bool failed = false;
};

/// @brief Identity of the batch being scored
struct BatchContext {
    std::string project_id;
    std::string workspace_id;
    std::string user_name;
    model::EvaluatorKind kind = model::EvaluatorKind::kTraceLlmJudge;
};

/// @brief The online scoring pipeline
///
/// For every entity the enabled rules of (project, kind) are filtered and
/// sampled, then each surviving pair is scored on the worker pool. Failures of
/// a single pair are written to the user log and never affect the others. The
/// scores of the whole batch are written with one sink call.
class ScoringEngine {
public:
    ScoringEngine(EngineDependencies deps, EngineOptions options);

    ScoringEngine(const ScoringEngine&) = delete;
    ScoringEngine& operator=(const ScoringEngine&) = delete;

    /// @param rule_id When set, only that rule is considered and sampling is
    ///        skipped since the producer already sampled
    /// @return Non-OK only when the rules cannot be resolved; the caller should
    ///         leave the batch for redelivery
    absl::Status Evaluate(const std::string& project_id,
                          const std::string& workspace_id,
                          const std::string& user_name,
                          model::EvaluatorKind kind,
                          const std::vector<model::ScoredEntity>& entities,
                          const std::optional<std::string>& rule_id = std::nullopt);

    /// @brief Score one entity with one rule on the calling thread
    ///
    /// Never fails: provider and parse errors are reported in the outcome.
    static ItemOutcome ScoreItem(const EngineDependencies& deps,
                                 const EngineOptions& options,
                                 const BatchContext& context,
                                 const model::Rule& rule,
                                 const model::ScoredEntity& entity);

    const EngineOptions& Options() const { return options_; }

private:
    std::shared_ptr<const EngineDependencies> deps_;
    EngineOptions options_;
};

/// @brief "traceId", "spanId" or "threadId"
std::string EntityIdLabel(model::EntityType type);

/// @brief Markers linking a user log line to the entity
std::map<std::string, std::string> EntityMarkers(const model::ScoredEntity& entity);

}  // namespace tracescore::scoring
