#pragma once

/// @file feedback_score_sink.h
/// @brief Destination of the scores produced by one batch

#include <vector>

#include <absl/status/status.h>

#include "model/feedback_score.h"

namespace tracescore::sinks {

class FeedbackScoreSink {
public:
    virtual ~FeedbackScoreSink() = default;

    /// @brief Persist one batch; called at most once per engine batch
    virtual absl::Status Write(const std::vector<model::FeedbackScore>& scores) = 0;
};

}  // namespace tracescore::sinks
