#pragma once

/// @file feedback_score.h
/// @brief Scores produced by the engine

#include <string>

#include "model/evaluator_kind.h"

namespace tracescore::model {

inline constexpr const char* kOnlineScoringSource = "online_scoring";

/// @brief A named numeric result attached to a trace, span or thread
struct FeedbackScore {
    std::string entity_id;
    EntityType entity_type = EntityType::kTrace;
    std::string project_id;
    std::string workspace_id;
    std::string name;
    double value = 0.0;
    std::string reason;
    std::string source = kOnlineScoringSource;
    std::string author;  ///< User who owns the rule's workspace session
};

}  // namespace tracescore::model
