#pragma once

/// @file batch_handler.h
/// @brief Receiver of decoded stream batches

#include <absl/status/status.h>

#include "model/evaluator_kind.h"
#include "model/stream_message.h"

namespace tracescore::consumer {

/// @brief Processes one group of decoded envelopes
///
/// The consumer merges envelopes sharing workspace, project, user and rule
/// id into one message before calling Handle.
class BatchHandler {
public:
    virtual ~BatchHandler() = default;

    /// @return OK when the entries may be acknowledged, non-OK to leave them
    ///         pending for redelivery
    virtual absl::Status Handle(model::EvaluatorKind kind, const model::StreamMessage& batch) = 0;
};

}  // namespace tracescore::consumer
