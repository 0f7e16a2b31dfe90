#pragma once

/// @file evaluator_kind.h
/// @brief Entity types and the six evaluator kinds
///
/// Every switch over EvaluatorKind or EntityType is written without a default
/// branch, so adding a kind is a compile error (-Werror=switch) until all
/// dispatch sites handle it.

#include <array>
#include <optional>
#include <string_view>

namespace tracescore::model {

/// @brief What a rule scores
enum class EntityType {
    kTrace,
    kSpan,
    kThread
};

/// @brief Rule kind: entity type crossed with scoring method
enum class EvaluatorKind {
    kTraceLlmJudge,
    kSpanLlmJudge,
    kThreadLlmJudge,
    kTracePythonMetric,
    kSpanPythonMetric,
    kThreadPythonMetric
};

inline constexpr std::array<EvaluatorKind, 6> kAllEvaluatorKinds = {
    EvaluatorKind::kTraceLlmJudge,
    EvaluatorKind::kSpanLlmJudge,
    EvaluatorKind::kThreadLlmJudge,
    EvaluatorKind::kTracePythonMetric,
    EvaluatorKind::kSpanPythonMetric,
    EvaluatorKind::kThreadPythonMetric,
};

/// @brief Wire name, e.g. "span_llm_as_judge"
std::string_view ToString(EvaluatorKind kind);

std::optional<EvaluatorKind> ParseEvaluatorKind(std::string_view name);

/// @brief "trace", "span" or "thread"
std::string_view ToString(EntityType type);

std::optional<EntityType> ParseEntityType(std::string_view name);

EntityType EntityTypeOf(EvaluatorKind kind);

bool IsLlmJudge(EvaluatorKind kind);

}  // namespace tracescore::model
