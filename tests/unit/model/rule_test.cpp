/// @file rule_test.cpp
/// @brief Tests for rule decoding and validation

#include <cmath>

#include <gtest/gtest.h>

#include "model/rule.h"

namespace tracescore::model {
namespace {

using json = nlohmann::json;

json JudgeRuleJson() {
    return json::parse(R"({
        "id": "rule-1",
        "project_id": "project-1",
        "name": "Relevance",
        "type": "llm_as_judge",
        "sampling_rate": 0.5,
        "filters": [
            {"field": "metadata", "operator": "=", "key": "env", "value": "prod"},
            {"field": "output", "operator": "is_not_empty"}
        ],
        "code": {
            "model": {"name": "gpt-4o", "temperature": 0.2, "seed": 7},
            "messages": [{"role": "USER", "content": "Rate {{answer}}"}],
            "variables": {"answer": "output.choices[0].text", "tone": "formal"},
            "schema": [{"name": "relevance", "type": "double", "description": "0 to 1"}]
        }
    })");
}

TEST(RuleTest, ParseJudgeRule) {
    auto rule = ParseRule(JudgeRuleJson());
    ASSERT_TRUE(rule.ok()) << rule.status();

    EXPECT_EQ(rule->id, "rule-1");
    EXPECT_EQ(rule->project_ids, std::vector<std::string>{"project-1"});
    EXPECT_EQ(rule->kind, EvaluatorKind::kTraceLlmJudge);
    EXPECT_DOUBLE_EQ(rule->sampling_rate, 0.5);
    ASSERT_EQ(rule->filters.size(), 2u);
    EXPECT_EQ(rule->filters[0].key, "env");
    EXPECT_EQ(rule->filters[1].op, FilterOperator::kIsNotEmpty);
    EXPECT_FALSE(rule->filters[1].value.has_value());

    const auto* code = std::get_if<LlmJudgeCode>(&rule->code);
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(code->model.name, "gpt-4o");
    EXPECT_EQ(code->model.seed, 7);
    EXPECT_EQ(code->messages[0].role, "user");
    ASSERT_EQ(code->schema.size(), 1u);
    EXPECT_EQ(code->schema[0].type, ScoreType::kDouble);
}

TEST(RuleTest, VariableMappings) {
    auto path = ParseVariableMapping("answer", "output.choices[0].text");
    EXPECT_EQ(path.section, Section::kOutput);
    EXPECT_EQ(path.json_path, "$.choices[0].text");

    auto whole = ParseVariableMapping("all", "input");
    EXPECT_EQ(whole.section, Section::kInput);
    EXPECT_EQ(whole.json_path, "$");

    auto literal = ParseVariableMapping("tone", "formal");
    EXPECT_FALSE(literal.section.has_value());

    // A prefix without a separator is not a path
    auto lookalike = ParseVariableMapping("x", "inputs");
    EXPECT_FALSE(lookalike.section.has_value());
}

TEST(RuleTest, SamplingRateIsClamped) {
    auto above = JudgeRuleJson();
    above["sampling_rate"] = 3.0;
    auto rule = ParseRule(above);
    ASSERT_TRUE(rule.ok());
    EXPECT_DOUBLE_EQ(rule->sampling_rate, 1.0);

    Rule nan_rule = *rule;
    nan_rule.sampling_rate = std::nan("");
    ASSERT_TRUE(ValidateRule(nan_rule).ok());
    EXPECT_DOUBLE_EQ(nan_rule.sampling_rate, 0.0);

    Rule negative = *rule;
    negative.sampling_rate = -0.5;
    ASSERT_TRUE(ValidateRule(negative).ok());
    EXPECT_DOUBLE_EQ(negative.sampling_rate, 0.0);
}

TEST(RuleTest, PayloadMustMatchKind) {
    auto rule = ParseRule(JudgeRuleJson());
    ASSERT_TRUE(rule.ok());

    Rule mismatched = *rule;
    mismatched.kind = EvaluatorKind::kSpanPythonMetric;
    EXPECT_EQ(ValidateRule(mismatched).code(), absl::StatusCode::kInvalidArgument);
}

TEST(RuleTest, RejectsBrokenRules) {
    auto unknown_type = JudgeRuleJson();
    unknown_type["type"] = "sentiment";
    EXPECT_FALSE(ParseRule(unknown_type).ok());

    auto no_schema = JudgeRuleJson();
    no_schema["code"]["schema"] = json::array();
    EXPECT_FALSE(ParseRule(no_schema).ok());

    auto missing_value = JudgeRuleJson();
    missing_value["filters"][0].erase("value");
    EXPECT_FALSE(ParseRule(missing_value).ok());

    auto bad_operator = JudgeRuleJson();
    bad_operator["filters"][0]["operator"] = "~=";
    EXPECT_FALSE(ParseRule(bad_operator).ok());

    EXPECT_FALSE(ParseRules(json::object()).ok());
}

TEST(RuleTest, ParsePythonRule) {
    auto rule = ParseRule(json::parse(R"({
        "id": "rule-py",
        "project_ids": ["p1", "p2"],
        "type": "span_user_defined_metric_python",
        "code": {"metric": "def score(output): ...", "arguments": {"output": "output.text"}}
    })"));
    ASSERT_TRUE(rule.ok()) << rule.status();

    EXPECT_EQ(rule->name, "rule-py");
    EXPECT_EQ(rule->project_ids.size(), 2u);
    const auto* code = std::get_if<PythonMetricCode>(&rule->code);
    ASSERT_NE(code, nullptr);
    ASSERT_EQ(code->arguments.size(), 1u);
    EXPECT_EQ(code->arguments[0].json_path, "$.text");
}

TEST(RuleTest, SerializedRulesDecodeUnchanged) {
    auto rule = ParseRule(JudgeRuleJson());
    ASSERT_TRUE(rule.ok());

    auto decoded = ParseRules(RulesToJson({*rule}));
    ASSERT_TRUE(decoded.ok()) << decoded.status();
    ASSERT_EQ(decoded->size(), 1u);
    const Rule& copy = decoded->front();
    EXPECT_EQ(copy.id, rule->id);
    EXPECT_EQ(copy.kind, rule->kind);
    EXPECT_EQ(copy.filters.size(), rule->filters.size());
    const auto& judge = std::get<LlmJudgeCode>(copy.code);
    EXPECT_EQ(judge.variables.size(), 2u);
    EXPECT_EQ(judge.model.temperature, 0.2);
}

}  // namespace
}  // namespace tracescore::model
