#pragma once

/// @file rule.h
/// @brief Automation rule evaluators: filters, variable mappings, kind payloads

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "model/evaluator_kind.h"

namespace tracescore::model {

// =============================================================================
// Filters
// =============================================================================

enum class FilterOperator {
    kEqual,
    kNotEqual,
    kContains,
    kNotContains,
    kStartsWith,
    kEndsWith,
    kGreaterThan,
    kGreaterThanEqual,
    kLessThan,
    kLessThanEqual,
    kIsEmpty,
    kIsNotEmpty
};

/// @brief "=", "!=", "contains", ..., "is_not_empty"
std::string_view ToString(FilterOperator op);

std::optional<FilterOperator> ParseFilterOperator(std::string_view text);

/// @brief Operators that compare against no value
bool IsUnary(FilterOperator op);

/// @brief One condition of a rule. All filters of a rule must match.
struct Filter {
    std::string field;
    FilterOperator op = FilterOperator::kEqual;
    std::optional<std::string> key;    ///< For dictionary-valued fields
    std::optional<std::string> value;  ///< Absent for is_empty / is_not_empty
};

// =============================================================================
// Variables and output schema
// =============================================================================

/// @brief Entity section a variable path points into
enum class Section {
    kInput,
    kOutput,
    kMetadata
};

/// @brief Binds a template variable to an entity field or a literal
///
/// "input.messages[0].content" resolves $.messages[0].content in the input
/// tree. Anything without an input./output./metadata. prefix is a literal.
struct VariableMapping {
    std::string name;
    std::string configured;          ///< As written in the rule
    std::optional<Section> section;  ///< Absent for literals
    std::string json_path;           ///< "$.a.b[0]" form, empty for literals
};

VariableMapping ParseVariableMapping(std::string name, std::string configured);

enum class ScoreType {
    kInteger,
    kDouble,
    kBoolean
};

std::string_view ToString(ScoreType type);

std::optional<ScoreType> ParseScoreType(std::string_view text);

struct OutputSchemaField {
    std::string name;
    ScoreType type = ScoreType::kDouble;
    std::string description;
};

// =============================================================================
// Kind payloads
// =============================================================================

struct JudgeModel {
    std::string name;
    std::optional<double> temperature;
    std::optional<int64_t> seed;
    nlohmann::json custom_parameters = nlohmann::json::object();
};

struct PromptMessage {
    std::string role;  ///< "system", "user" or "assistant", lower case
    std::string content;
};

/// @brief Payload of the *_llm_as_judge kinds
struct LlmJudgeCode {
    JudgeModel model;
    std::vector<PromptMessage> messages;
    std::vector<VariableMapping> variables;
    std::vector<OutputSchemaField> schema;
};

/// @brief Payload of the *_user_defined_metric_python kinds
struct PythonMetricCode {
    std::string metric;                      ///< Python source
    std::vector<VariableMapping> arguments;  ///< Ignored by thread kinds
};

using RuleCode = std::variant<LlmJudgeCode, PythonMetricCode>;

// =============================================================================
// Rule
// =============================================================================

/// @brief A configured scoring rule, read-only to the engine
struct Rule {
    std::string id;
    std::vector<std::string> project_ids;
    std::string name;
    EvaluatorKind kind = EvaluatorKind::kTraceLlmJudge;
    double sampling_rate = 1.0;
    bool enabled = true;
    std::vector<Filter> filters;
    RuleCode code;
};

/// @brief Check that the code payload matches the kind and that filters are
/// complete; clamps sampling_rate into [0, 1]
absl::Status ValidateRule(Rule& rule);

/// @brief Decode one rule. The result has been through ValidateRule.
absl::StatusOr<Rule> ParseRule(const nlohmann::json& json);

/// @brief Decode a JSON array of rules
absl::StatusOr<std::vector<Rule>> ParseRules(const nlohmann::json& json);

nlohmann::json RuleToJson(const Rule& rule);

nlohmann::json RulesToJson(const std::vector<Rule>& rules);

}  // namespace tracescore::model
