#include "model/evaluator_kind.h"

namespace tracescore::model {

std::string_view ToString(EvaluatorKind kind) {
    switch (kind) {
        case EvaluatorKind::kTraceLlmJudge:
            return "llm_as_judge";
        case EvaluatorKind::kSpanLlmJudge:
            return "span_llm_as_judge";
        case EvaluatorKind::kThreadLlmJudge:
            return "trace_thread_llm_as_judge";
        case EvaluatorKind::kTracePythonMetric:
            return "user_defined_metric_python";
        case EvaluatorKind::kSpanPythonMetric:
            return "span_user_defined_metric_python";
        case EvaluatorKind::kThreadPythonMetric:
            return "trace_thread_user_defined_metric_python";
    }
    return "unknown";
}

std::optional<EvaluatorKind> ParseEvaluatorKind(std::string_view name) {
    for (EvaluatorKind kind : kAllEvaluatorKinds) {
        if (ToString(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string_view ToString(EntityType type) {
    switch (type) {
        case EntityType::kTrace:
            return "trace";
        case EntityType::kSpan:
            return "span";
        case EntityType::kThread:
            return "thread";
    }
    return "unknown";
}

std::optional<EntityType> ParseEntityType(std::string_view name) {
    if (name == "trace") return EntityType::kTrace;
    if (name == "span") return EntityType::kSpan;
    if (name == "thread") return EntityType::kThread;
    return std::nullopt;
}

EntityType EntityTypeOf(EvaluatorKind kind) {
    switch (kind) {
        case EvaluatorKind::kTraceLlmJudge:
        case EvaluatorKind::kTracePythonMetric:
            return EntityType::kTrace;
        case EvaluatorKind::kSpanLlmJudge:
        case EvaluatorKind::kSpanPythonMetric:
            return EntityType::kSpan;
        case EvaluatorKind::kThreadLlmJudge:
        case EvaluatorKind::kThreadPythonMetric:
            return EntityType::kThread;
    }
    return EntityType::kTrace;
}

bool IsLlmJudge(EvaluatorKind kind) {
    switch (kind) {
        case EvaluatorKind::kTraceLlmJudge:
        case EvaluatorKind::kSpanLlmJudge:
        case EvaluatorKind::kThreadLlmJudge:
            return true;
        case EvaluatorKind::kTracePythonMetric:
        case EvaluatorKind::kSpanPythonMetric:
        case EvaluatorKind::kThreadPythonMetric:
            return false;
    }
    return false;
}

}  // namespace tracescore::model
