/// @file entity_test.cpp
/// @brief Tests for entity decoding and thread assembly

#include <gtest/gtest.h>

#include "model/entity.h"
#include "model/evaluator_kind.h"

namespace tracescore::model {
namespace {

using json = nlohmann::json;

TEST(EvaluatorKindTest, WireNamesRoundTrip) {
    for (auto kind : kAllEvaluatorKinds) {
        auto parsed = ParseEvaluatorKind(ToString(kind));
        ASSERT_TRUE(parsed.has_value()) << ToString(kind);
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(ParseEvaluatorKind("llm_judge").has_value());
}

TEST(EvaluatorKindTest, EntityTypeAndMethod) {
    EXPECT_EQ(EntityTypeOf(EvaluatorKind::kTraceLlmJudge), EntityType::kTrace);
    EXPECT_EQ(EntityTypeOf(EvaluatorKind::kSpanPythonMetric), EntityType::kSpan);
    EXPECT_EQ(EntityTypeOf(EvaluatorKind::kThreadLlmJudge), EntityType::kThread);
    EXPECT_TRUE(IsLlmJudge(EvaluatorKind::kSpanLlmJudge));
    EXPECT_FALSE(IsLlmJudge(EvaluatorKind::kThreadPythonMetric));
}

TEST(EntityTest, ParseTimestamp) {
    EXPECT_EQ(ParseTimestampMs("2024-05-01T10:00:00Z"), 1714557600000);
    EXPECT_EQ(ParseTimestampMs("2024-05-01T10:00:00.250Z"), 1714557600250);
    EXPECT_FALSE(ParseTimestampMs("yesterday").has_value());
}

TEST(EntityTest, DecodeTrace) {
    json payload = json::parse(R"({
        "id": "trace-1",
        "project_id": "project-1",
        "name": "chat",
        "input": {"question": "What is 2+2?"},
        "output": {"answer": "4"},
        "metadata": {"model": "gpt-4o"},
        "tags": ["production", "eu"],
        "start_time": "2024-05-01T10:00:00Z",
        "end_time": "2024-05-01T10:00:01.500Z",
        "usage": {"total_tokens": 42},
        "total_estimated_cost": 0.0021,
        "feedback_scores": [{"name": "hallucination", "value": 0.2}]
    })");

    auto entity = DecodeEntity(EntityType::kTrace, payload);
    ASSERT_TRUE(entity.ok()) << entity.status();

    EXPECT_EQ(entity->id, "trace-1");
    EXPECT_EQ(entity->project_id, "project-1");
    EXPECT_EQ(entity->input["question"], "What is 2+2?");
    EXPECT_EQ(entity->tags, (std::vector<std::string>{"production", "eu"}));
    EXPECT_EQ(entity->DurationMs(), 1500);
    EXPECT_EQ(entity->usage.at("total_tokens"), 42);
    EXPECT_DOUBLE_EQ(*entity->total_estimated_cost, 0.0021);
    EXPECT_DOUBLE_EQ(entity->feedback_scores.at("hallucination"), 0.2);
}

TEST(EntityTest, DecodeSpanFields) {
    json payload = json::parse(R"({
        "id": "span-1",
        "trace_id": "trace-1",
        "model": "gpt-4o-mini",
        "provider": "openai",
        "type": "llm",
        "guardrails_validations": [{"checks": [{"result": "passed"}, {"result": "failed"}]}]
    })");

    auto entity = DecodeEntity(EntityType::kSpan, payload);
    ASSERT_TRUE(entity.ok()) << entity.status();

    EXPECT_EQ(entity->trace_id, "trace-1");
    EXPECT_EQ(entity->model, "gpt-4o-mini");
    EXPECT_EQ(entity->span_type, "llm");
    EXPECT_EQ(entity->guardrails, "failed");
    EXPECT_TRUE(entity->input.is_object());
    EXPECT_FALSE(entity->DurationMs().has_value());
}

TEST(EntityTest, DecodeRejectsMissingId) {
    auto entity = DecodeEntity(EntityType::kTrace, json{{"name", "anonymous"}});
    EXPECT_EQ(entity.status().code(), absl::StatusCode::kDataLoss);

    auto scalar = DecodeEntity(EntityType::kTrace, json("trace-1"));
    EXPECT_EQ(scalar.status().code(), absl::StatusCode::kDataLoss);
}

TEST(EntityTest, EncodedEntityDecodesToTheSameFields) {
    ScoredEntity span;
    span.type = EntityType::kSpan;
    span.id = "span-9";
    span.trace_id = "trace-9";
    span.input = {{"prompt", "hi"}};
    span.start_time_ms = 1000;
    span.end_time_ms = 1250;
    span.model = "o3";

    auto decoded = DecodeEntity(EntityType::kSpan, EntityToJson(span));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->trace_id, "trace-9");
    EXPECT_EQ(decoded->input, span.input);
    EXPECT_EQ(decoded->DurationMs(), 250);
    EXPECT_EQ(decoded->model, "o3");
}

TEST(EntityTest, BuildThreadOrdersTracesByStartTime) {
    ScoredEntity late;
    late.id = "t2";
    late.input = json("how about tomorrow?");
    late.output = json("rain");
    late.start_time_ms = 2000;
    late.end_time_ms = 2500;

    ScoredEntity early;
    early.id = "t1";
    early.input = json("weather today?");
    early.output = json("sunny");
    early.start_time_ms = 1000;
    early.end_time_ms = 1200;
    early.tags = {"support"};

    auto thread = BuildThreadEntity("thread-1", "project-1", {late, early});

    EXPECT_EQ(thread.type, EntityType::kThread);
    EXPECT_EQ(thread.id, "thread-1");
    ASSERT_EQ(thread.messages.size(), 4u);
    EXPECT_EQ(thread.messages[0].role, "user");
    EXPECT_EQ(thread.messages[0].content, "weather today?");
    EXPECT_EQ(thread.messages[1].role, "assistant");
    EXPECT_EQ(thread.messages[1].content, "sunny");
    EXPECT_EQ(thread.messages[2].content, "how about tomorrow?");
    EXPECT_EQ(thread.messages[3].content, "rain");
    EXPECT_EQ(thread.DurationMs(), 1500);
    EXPECT_EQ(thread.tags, std::vector<std::string>{"support"});
}

TEST(EntityTest, JsonToText) {
    EXPECT_EQ(JsonToText(json("plain")), "plain");
    EXPECT_EQ(JsonToText(json(nullptr)), "");
    EXPECT_EQ(JsonToText(json{{"a", 1}}), R"({"a":1})");
}

}  // namespace
}  // namespace tracescore::model
