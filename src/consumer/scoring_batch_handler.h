#pragma once

/// @file scoring_batch_handler.h
/// @brief Hands decoded stream batches to the scoring engine

#include <memory>

#include "consumer/batch_handler.h"
#include "consumer/thread_loader.h"
#include "scoring/scoring_engine.h"

namespace tracescore::consumer {

/// @brief Batch handler for all six evaluator kinds
///
/// Trace and span batches are scored as delivered. Thread batches are first
/// resolved through the thread loader; threads without traces are skipped.
/// A failed thread load fails the batch so it is redelivered.
class ScoringBatchHandler : public BatchHandler {
public:
    ScoringBatchHandler(std::shared_ptr<scoring::ScoringEngine> engine,
                        std::shared_ptr<ThreadLoader> threads);

    absl::Status Handle(model::EvaluatorKind kind, const model::StreamMessage& batch) override;

private:
    absl::StatusOr<std::vector<model::ScoredEntity>> LoadThreads(const model::StreamMessage& batch);

    std::shared_ptr<scoring::ScoringEngine> engine_;
    std::shared_ptr<ThreadLoader> threads_;
};

}  // namespace tracescore::consumer
