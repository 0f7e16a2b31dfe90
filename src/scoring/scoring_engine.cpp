#include "scoring/scoring_engine.h"

#include <future>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/logging.h"
#include "common/metrics.h"
#include "scoring/filter_evaluator.h"
#include "scoring/request_builder.h"
#include "scoring/response_parser.h"
#include "scoring/template_renderer.h"
#include "scoring/variable_resolver.h"

namespace tracescore::scoring {

using model::EvaluatorKind;
using model::UserLogLevel;
using std::chrono::steady_clock;

namespace {

model::UserLogEntry MakeLog(UserLogLevel level,
                            const BatchContext& context,
                            const model::Rule& rule,
                            const model::ScoredEntity& entity,
                            std::string message) {
    model::UserLogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.workspace_id = context.workspace_id;
    entry.rule_id = rule.id;
    entry.message = std::move(message);
    entry.markers = EntityMarkers(entity);
    return entry;
}

std::string FailureMessage(const model::Rule& rule,
                           const model::ScoredEntity& entity,
                           const std::string& cause) {
    return absl::StrCat("Unexpected error while scoring ", EntityIdLabel(entity.type), " '",
                        entity.id, "' with rule '", rule.name, "': \n\n", cause);
}

model::FeedbackScore MakeScore(const BatchContext& context,
                               const model::ScoredEntity& entity,
                               std::string name,
                               double value,
                               std::string reason) {
    model::FeedbackScore score;
    score.entity_id = entity.id;
    score.entity_type = entity.type;
    score.project_id = context.project_id;
    score.workspace_id = context.workspace_id;
    score.name = std::move(name);
    score.value = value;
    score.reason = std::move(reason);
    score.author = context.user_name;
    return score;
}

std::string ScoreSummary(const std::vector<model::FeedbackScore>& scores) {
    return absl::StrJoin(scores, "\n", [](std::string* out, const model::FeedbackScore& score) {
        absl::StrAppend(out, score.name, ": ", score.value);
        if (!score.reason.empty()) {
            absl::StrAppend(out, " (", score.reason, ")");
        }
    });
}

/// Scores via an LLM judge; failures mark the outcome
void ScoreWithJudge(const EngineDependencies& deps,
                    const EngineOptions& options,
                    const BatchContext& context,
                    const model::Rule& rule,
                    const model::LlmJudgeCode& code,
                    const model::ScoredEntity& entity,
                    ItemOutcome& outcome) {
    auto fail = [&](const std::string& cause) {
        outcome.failed = true;
        outcome.logs.push_back(
            MakeLog(UserLogLevel::kError, context, rule, entity, FailureMessage(rule, entity, cause)));
    };

    if (!deps.providers) {
        fail("No LLM provider is configured");
        return;
    }
    auto provider = deps.providers->Resolve(code.model.name);
    if (!provider.ok()) {
        fail(provider.status().ToString());
        return;
    }

    auto values = VariableResolver::Resolve(code.variables, entity);
    auto rendered = TemplateRenderer::RenderMessages(code.messages, values);
    auto strategy = (*provider)->SupportsStructuredOutput(code.model.name)
                        ? StructuredOutputStrategy::kNativeSchema
                        : StructuredOutputStrategy::kInstructionInjection;
    auto request = RequestBuilder::Build(code, rendered, strategy);

    auto response = (*provider)->Chat(request, options.call_timeout);
    if (!response.ok()) {
        fail(response.status().ToString());
        return;
    }
    outcome.logs.push_back(MakeLog(UserLogLevel::kInfo, context, rule, entity,
                                   absl::StrCat("Received response for ", EntityIdLabel(entity.type),
                                                " '", entity.id, "':\n\n", response->content)));

    auto parsed = ResponseParser::Parse(response->content);
    if (!parsed.ok()) {
        TRACESCORE_LOG_WARN("Unparsable judge response for {} '{}' with rule '{}': {}",
                            EntityIdLabel(entity.type), entity.id, rule.id,
                            parsed.status().ToString());
        outcome.logs.push_back(MakeLog(
            UserLogLevel::kWarn, context, rule, entity,
            absl::StrCat("Failed to parse the response for ", EntityIdLabel(entity.type), " '",
                         entity.id, "' with rule '", rule.name, "': \n\n",
                         parsed.status().message())));
        return;
    }
    for (auto& score : *parsed) {
        outcome.scores.push_back(
            MakeScore(context, entity, std::move(score.name), score.value, std::move(score.reason)));
    }
}

/// Scores via the python metric backend; failures mark the outcome
void ScoreWithPython(const EngineDependencies& deps,
                     const EngineOptions& options,
                     const BatchContext& context,
                     const model::Rule& rule,
                     const model::PythonMetricCode& code,
                     const model::ScoredEntity& entity,
                     ItemOutcome& outcome) {
    if (!deps.python) {
        outcome.failed = true;
        outcome.logs.push_back(MakeLog(UserLogLevel::kError, context, rule, entity,
                                       FailureMessage(rule, entity,
                                                      "No python metric backend is configured")));
        return;
    }

    nlohmann::json data;
    if (entity.type == model::EntityType::kThread) {
        data = {{kThreadContextVariable, VariableResolver::ThreadMessagesJson(entity)}};
    } else {
        data = VariableResolver::ResolveJson(code.arguments, entity);
    }

    auto result = deps.python->Evaluate(code.metric, data, options.call_timeout);
    if (!result.ok()) {
        outcome.failed = true;
        outcome.logs.push_back(MakeLog(UserLogLevel::kError, context, rule, entity,
                                       FailureMessage(rule, entity, result.status().ToString())));
        return;
    }
    for (auto& score : *result) {
        outcome.scores.push_back(
            MakeScore(context, entity, std::move(score.name), score.value, std::move(score.reason)));
    }
}

/// An (entity, rule) pair handed to the pool
struct PendingItem {
    std::shared_ptr<const model::ScoredEntity> entity;
    std::shared_ptr<const model::Rule> rule;
    std::future<ItemOutcome> result;
};

}  // namespace

std::string EntityIdLabel(model::EntityType type) {
    return absl::StrCat(std::string(model::ToString(type)), "Id");
}

std::map<std::string, std::string> EntityMarkers(const model::ScoredEntity& entity) {
    switch (entity.type) {
        case model::EntityType::kTrace:
            return {{model::kTraceMarker, entity.id}};
        case model::EntityType::kSpan:
            return {{model::kTraceMarker, entity.trace_id}, {model::kSpanMarker, entity.id}};
        case model::EntityType::kThread:
            return {{model::kThreadMarker, entity.id}};
    }
    return {};
}

ScoringEngine::ScoringEngine(EngineDependencies deps, EngineOptions options)
    : deps_(std::make_shared<const EngineDependencies>(std::move(deps))), options_(options) {}

ItemOutcome ScoringEngine::ScoreItem(const EngineDependencies& deps,
                                     const EngineOptions& options,
                                     const BatchContext& context,
                                     const model::Rule& rule,
                                     const model::ScoredEntity& entity) {
    ItemOutcome outcome;
    outcome.logs.push_back(MakeLog(UserLogLevel::kInfo, context, rule, entity,
                                   absl::StrCat("Evaluating ", EntityIdLabel(entity.type), " '",
                                                entity.id, "' sampled by rule '", rule.name, "'")));

    auto fail = [&](const std::string& cause) {
        outcome.failed = true;
        outcome.scores.clear();
        outcome.logs.push_back(
            MakeLog(UserLogLevel::kError, context, rule, entity, FailureMessage(rule, entity, cause)));
    };

    const auto* judge = std::get_if<model::LlmJudgeCode>(&rule.code);
    const auto* metric = std::get_if<model::PythonMetricCode>(&rule.code);
    // Third-party code on the scoring path (json, httplib) reports by throwing
    try {
        switch (rule.kind) {
            case EvaluatorKind::kTraceLlmJudge:
            case EvaluatorKind::kSpanLlmJudge:
            case EvaluatorKind::kThreadLlmJudge:
                if (judge == nullptr) {
                    fail("rule code is not an LLM judge payload");
                    break;
                }
                ScoreWithJudge(deps, options, context, rule, *judge, entity, outcome);
                break;
            case EvaluatorKind::kTracePythonMetric:
            case EvaluatorKind::kSpanPythonMetric:
            case EvaluatorKind::kThreadPythonMetric:
                if (metric == nullptr) {
                    fail("rule code is not a python metric payload");
                    break;
                }
                ScoreWithPython(deps, options, context, rule, *metric, entity, outcome);
                break;
        }
    } catch (const std::exception& e) {
        fail(e.what());
    }
    return outcome;
}

absl::Status ScoringEngine::Evaluate(const std::string& project_id,
                                     const std::string& workspace_id,
                                     const std::string& user_name,
                                     EvaluatorKind kind,
                                     const std::vector<model::ScoredEntity>& entities,
                                     const std::optional<std::string>& rule_id) {
    const auto started = steady_clock::now();
    const auto deadline = started + options_.batch_timeout;

    auto rules = deps_->rules->FindEnabled(project_id, kind);
    if (!rules.ok()) {
        TRACESCORE_LOG_ERROR("Cannot resolve {} rules for project '{}': {}", model::ToString(kind),
                             project_id, rules.status().ToString());
        return rules.status();
    }
    if (rule_id) {
        std::vector<model::Rule> selected;
        for (auto& rule : *rules) {
            if (rule.id == *rule_id) {
                selected.push_back(std::move(rule));
            }
        }
        if (selected.empty()) {
            TRACESCORE_LOG_WARN("Rule '{}' is not an enabled {} rule of project '{}', skipping {} entities",
                                *rule_id, model::ToString(kind), project_id, entities.size());
        }
        *rules = std::move(selected);
    }
    if (rules->empty() || entities.empty()) {
        TRACESCORE_LOG_DEBUG("Nothing to score for project '{}' ({} rules, {} entities)", project_id,
                             rules->size(), entities.size());
        return absl::OkStatus();
    }

    const BatchContext context{project_id, workspace_id, user_name, kind};
    const auto expected_type = model::EntityTypeOf(kind);

    auto& produced = TRACESCORE_COUNTER("tracescore_scores_produced");
    auto& failed = TRACESCORE_COUNTER("tracescore_items_failed");
    auto& skipped_filter = TRACESCORE_COUNTER("tracescore_items_skipped_filter");
    auto& skipped_sampling = TRACESCORE_COUNTER("tracescore_items_skipped_sampling");

    std::vector<std::shared_ptr<const model::Rule>> shared_rules;
    shared_rules.reserve(rules->size());
    for (auto& rule : *rules) {
        shared_rules.push_back(std::make_shared<const model::Rule>(std::move(rule)));
    }

    std::vector<model::UserLogEntry> logs;
    std::vector<PendingItem> pending;

    for (const auto& source : entities) {
        if (source.type != expected_type) {
            TRACESCORE_LOG_WARN("Skipping {} '{}' in a {} batch", model::ToString(source.type),
                                source.id, model::ToString(kind));
            continue;
        }
        auto entity = std::make_shared<const model::ScoredEntity>(source);

        for (const auto& rule : shared_rules) {
            bool matches = false;
            bool sampled = true;
            try {
                matches = FilterEvaluator::Matches(rule->filters, *entity);
                if (matches && !rule_id) {
                    sampled = deps_->sampler->ShouldSample(rule->sampling_rate);
                }
            } catch (const std::exception& e) {
                // Only this pair fails, the rest of the batch is still scored
                failed.Increment();
                TRACESCORE_LOG_ERROR("Filtering {} '{}' for rule '{}' failed: {}",
                                     model::ToString(entity->type), entity->id, rule->id, e.what());
                logs.push_back(MakeLog(UserLogLevel::kError, context, *rule, *entity,
                                       FailureMessage(*rule, *entity, e.what())));
                continue;
            }
            if (!matches) {
                skipped_filter.Increment();
                logs.push_back(MakeLog(UserLogLevel::kInfo, context, *rule, *entity,
                                       absl::StrCat("The ", EntityIdLabel(entity->type), " '",
                                                    entity->id, "' was skipped for rule: '",
                                                    rule->name,
                                                    "' as it does not match the filters")));
                continue;
            }
            if (!sampled) {
                skipped_sampling.Increment();
                logs.push_back(MakeLog(UserLogLevel::kInfo, context, *rule, *entity,
                                       absl::StrCat("The ", EntityIdLabel(entity->type), " '",
                                                    entity->id, "' was skipped for rule: '",
                                                    rule->name, "' and per the sampling rate '",
                                                    rule->sampling_rate, "'")));
                continue;
            }

            auto deps = deps_;
            auto options = options_;
            auto submitted = deps_->pool->Submit([deps, options, context, entity, rule]() {
                return ScoreItem(*deps, options, context, *rule, *entity);
            });
            if (!submitted.ok()) {
                failed.Increment();
                logs.push_back(MakeLog(UserLogLevel::kError, context, *rule, *entity,
                                       FailureMessage(*rule, *entity,
                                                      submitted.status().ToString())));
                continue;
            }
            pending.push_back(PendingItem{entity, rule, std::move(submitted).value()});
        }
    }

    std::vector<model::FeedbackScore> scores;
    // Items whose scores go into this batch's write, for the "stored" log lines
    std::vector<std::pair<const PendingItem*, std::vector<model::FeedbackScore>>> scored_items;

    for (auto& item : pending) {
        if (item.result.wait_until(deadline) != std::future_status::ready) {
            failed.Increment();
            logs.push_back(MakeLog(
                UserLogLevel::kError, context, *item.rule, *item.entity,
                FailureMessage(*item.rule, *item.entity,
                               absl::StrCat("Scoring did not finish within the batch timeout of ",
                                            options_.batch_timeout.count(), "ms"))));
            continue;
        }
        ItemOutcome outcome = item.result.get();
        if (outcome.failed) {
            failed.Increment();
        }
        logs.insert(logs.end(), std::make_move_iterator(outcome.logs.begin()),
                    std::make_move_iterator(outcome.logs.end()));
        if (!outcome.scores.empty()) {
            scores.insert(scores.end(), outcome.scores.begin(), outcome.scores.end());
            scored_items.emplace_back(&item, std::move(outcome.scores));
        }
    }

    if (!scores.empty()) {
        auto status = deps_->feedback_scores->Write(scores);
        if (status.ok()) {
            produced.Add(static_cast<int64_t>(scores.size()));
            for (const auto& [item, item_scores] : scored_items) {
                logs.push_back(MakeLog(UserLogLevel::kInfo, context, *item->rule, *item->entity,
                                       absl::StrCat("Scores for ", EntityIdLabel(item->entity->type),
                                                    " '", item->entity->id,
                                                    "' stored successfully:\n\n",
                                                    ScoreSummary(item_scores))));
            }
        } else {
            TRACESCORE_LOG_ERROR("Failed to store {} feedback scores for project '{}': {}",
                                 scores.size(), project_id, status.ToString());
            for (const auto& [item, item_scores] : scored_items) {
                logs.push_back(MakeLog(
                    UserLogLevel::kError, context, *item->rule, *item->entity,
                    FailureMessage(*item->rule, *item->entity, status.ToString())));
            }
        }
    }

    if (!logs.empty()) {
        auto status = deps_->user_logs->Append(logs);
        if (!status.ok()) {
            TRACESCORE_LOG_ERROR("Failed to write {} user log entries: {}", logs.size(),
                                 status.ToString());
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - started);
    TRACESCORE_HISTOGRAM("tracescore_batch_ms").Observe(static_cast<double>(elapsed.count()));
    TRACESCORE_LOG_INFO("Scored {} {} entities for project '{}': {} evaluations, {} scores in {}ms",
                        entities.size(), model::ToString(kind), project_id, pending.size(),
                        scores.size(), elapsed.count());
    return absl::OkStatus();
}

}  // namespace tracescore::scoring
