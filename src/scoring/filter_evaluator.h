#pragma once

/// @file filter_evaluator.h
/// @brief In-memory evaluation of rule filters against an entity

#include <vector>

#include "model/entity.h"
#include "model/rule.h"

namespace tracescore::scoring {

/// @brief Decides whether a rule applies to an entity
///
/// String operators compare case-insensitively, except = and != which are
/// exact. Numeric operators parse the filter value as a number (or an RFC 3339
/// time for time fields). An unknown field, an unsupported field for the
/// entity type or a non-numeric comparison value makes the filter not match;
/// evaluation never throws.
class FilterEvaluator {
public:
    /// @brief AND over all filters; an empty list matches everything
    static bool Matches(const std::vector<model::Filter>& filters, const model::ScoredEntity& entity);

    static bool Matches(const model::Filter& filter, const model::ScoredEntity& entity);
};

}  // namespace tracescore::scoring
