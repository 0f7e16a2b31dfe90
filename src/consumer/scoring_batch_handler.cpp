#include "consumer/scoring_batch_handler.h"

#include <set>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace tracescore::consumer {

ScoringBatchHandler::ScoringBatchHandler(std::shared_ptr<scoring::ScoringEngine> engine,
                                         std::shared_ptr<ThreadLoader> threads)
    : engine_(std::move(engine)), threads_(std::move(threads)) {}

absl::Status ScoringBatchHandler::Handle(model::EvaluatorKind kind,
                                         const model::StreamMessage& batch) {
    switch (model::EntityTypeOf(kind)) {
        case model::EntityType::kTrace:
        case model::EntityType::kSpan:
            return engine_->Evaluate(batch.project_id, batch.workspace_id, batch.user_name, kind,
                                     batch.entities, batch.rule_id);
        case model::EntityType::kThread: {
            TRACESCORE_ASSIGN_OR_RETURN(auto threads, LoadThreads(batch));
            if (threads.empty()) {
                return absl::OkStatus();
            }
            return engine_->Evaluate(batch.project_id, batch.workspace_id, batch.user_name, kind,
                                     threads, batch.rule_id);
        }
    }
    return absl::InternalError("unreachable");
}

absl::StatusOr<std::vector<model::ScoredEntity>> ScoringBatchHandler::LoadThreads(
    const model::StreamMessage& batch) {
    if (!threads_) {
        return MakeError(ErrorCode::kConfigurationError,
                         "Thread batches need a thread loader");
    }
    std::vector<model::ScoredEntity> threads;
    std::set<std::string> seen;
    for (const auto& thread_id : batch.thread_ids) {
        if (!seen.insert(thread_id).second) {
            continue;
        }
        auto traces = threads_->LoadTraces(batch.workspace_id, batch.project_id, thread_id);
        if (!traces.ok()) {
            return Annotate(traces.status(), absl::StrCat("Cannot load thread '", thread_id, "'"));
        }
        if (traces->empty()) {
            TRACESCORE_LOG_WARN("Thread '{}' of project '{}' has no traces, skipping",
                                thread_id, batch.project_id);
            continue;
        }
        threads.push_back(
            model::BuildThreadEntity(thread_id, batch.project_id, std::move(*traces)));
    }
    return threads;
}

}  // namespace tracescore::consumer
