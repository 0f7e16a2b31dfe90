/// @file filter_evaluator_test.cpp
/// @brief Tests for rule filter matching

#include <gtest/gtest.h>

#include "scoring/filter_evaluator.h"

namespace tracescore::scoring {
namespace {

using model::Filter;
using model::FilterOperator;
using json = nlohmann::json;

Filter MakeFilter(std::string field, FilterOperator op, std::optional<std::string> value = std::nullopt,
                  std::optional<std::string> key = std::nullopt) {
    Filter filter;
    filter.field = std::move(field);
    filter.op = op;
    filter.value = std::move(value);
    filter.key = std::move(key);
    return filter;
}

class FilterEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        trace_.type = model::EntityType::kTrace;
        trace_.id = "trace-1";
        trace_.name = "Checkout Assistant";
        trace_.input = json::parse(R"({"question": "Where is my order?", "locale": "en"})");
        trace_.output = json::parse(R"({"answer": "It ships tomorrow", "confidence": 0.82})");
        trace_.metadata = json::parse(R"({"env": "prod", "retries": 2})");
        trace_.tags = {"Production", "checkout"};
        trace_.start_time_ms = 1714557600000;
        trace_.end_time_ms = 1714557601500;
        trace_.usage = {{"total_tokens", 420}};
        trace_.total_estimated_cost = 0.013;
        trace_.feedback_scores = {{"hallucination", 0.1}};
    }

    model::ScoredEntity trace_;
};

TEST_F(FilterEvaluatorTest, EmptyFilterListMatches) {
    EXPECT_TRUE(FilterEvaluator::Matches(std::vector<Filter>{}, trace_));
}

TEST_F(FilterEvaluatorTest, EqualityIsExactContainsIgnoresCase) {
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("name", FilterOperator::kEqual, "Checkout Assistant"), trace_));
    EXPECT_FALSE(FilterEvaluator::Matches(
        MakeFilter("name", FilterOperator::kEqual, "checkout assistant"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("name", FilterOperator::kContains, "ASSIST"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("name", FilterOperator::kStartsWith, "check"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("name", FilterOperator::kEndsWith, "ANT"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("name", FilterOperator::kNotContains, "refund"), trace_));
}

TEST_F(FilterEvaluatorTest, KeyedTreeFields) {
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("metadata", FilterOperator::kEqual, "prod", "env"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("metadata", FilterOperator::kGreaterThan, "1", "retries"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("output", FilterOperator::kGreaterThanEqual, "0.8", "confidence"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("custom", FilterOperator::kContains, "order", "input.question"), trace_));
}

TEST_F(FilterEvaluatorTest, ListFieldsMatchAnyItem) {
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("tags", FilterOperator::kContains, "prod"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("tags", FilterOperator::kEqual, "production"), trace_));
    EXPECT_FALSE(FilterEvaluator::Matches(MakeFilter("tags", FilterOperator::kNotEqual, "checkout"), trace_));
    EXPECT_FALSE(FilterEvaluator::Matches(MakeFilter("tags", FilterOperator::kGreaterThan, "1"), trace_));
}

TEST_F(FilterEvaluatorTest, NumericAndTimeFields) {
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("duration", FilterOperator::kGreaterThan, "1000"), trace_));
    EXPECT_FALSE(FilterEvaluator::Matches(MakeFilter("duration", FilterOperator::kLessThan, "1000"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("start_time", FilterOperator::kGreaterThanEqual, "2024-05-01T00:00:00Z"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("usage.total_tokens", FilterOperator::kLessThanEqual, "420"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("feedback_scores", FilterOperator::kLessThan, "0.5", "hallucination"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("total_estimated_cost", FilterOperator::kGreaterThan, "0.01"), trace_));
}

TEST_F(FilterEvaluatorTest, NonNumericComparisonNeverMatches) {
    EXPECT_FALSE(FilterEvaluator::Matches(MakeFilter("duration", FilterOperator::kGreaterThan, "long"), trace_));
    EXPECT_FALSE(FilterEvaluator::Matches(MakeFilter("name", FilterOperator::kLessThan, "5"), trace_));
}

TEST_F(FilterEvaluatorTest, EmptinessOperators) {
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("output", FilterOperator::kIsNotEmpty), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("thread_id", FilterOperator::kIsEmpty), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("metadata", FilterOperator::kIsEmpty, std::nullopt, "missing"), trace_));
}

TEST_F(FilterEvaluatorTest, MissingFieldOnlySatisfiesNegativeOperators) {
    EXPECT_FALSE(FilterEvaluator::Matches(
        MakeFilter("metadata", FilterOperator::kEqual, "x", "region"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("metadata", FilterOperator::kNotEqual, "x", "region"), trace_));
}

TEST_F(FilterEvaluatorTest, SpanOnlyFieldsRejectedOnTraces) {
    EXPECT_FALSE(FilterEvaluator::Matches(MakeFilter("model", FilterOperator::kEqual, "gpt-4o"), trace_));

    model::ScoredEntity span = trace_;
    span.type = model::EntityType::kSpan;
    span.model = "gpt-4o";
    span.span_type = "llm";
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("model", FilterOperator::kEqual, "gpt-4o"), span));
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("type", FilterOperator::kEqual, "llm"), span));
}

TEST_F(FilterEvaluatorTest, OverflowingArrayIndexDoesNotMatch) {
    trace_.input = json::parse(R"({"items": ["a", "b"]})");
    EXPECT_FALSE(FilterEvaluator::Matches(
        MakeFilter("input", FilterOperator::kEqual, "a", "items.99999999999999999999"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("input", FilterOperator::kNotEqual, "a", "items.99999999999999999999"), trace_));
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("input", FilterOperator::kEqual, "b", "items.1"), trace_));
}

TEST_F(FilterEvaluatorTest, UnknownFieldDoesNotMatch) {
    EXPECT_FALSE(FilterEvaluator::Matches(MakeFilter("colour", FilterOperator::kEqual, "red"), trace_));
}

TEST_F(FilterEvaluatorTest, AllFiltersMustMatch) {
    std::vector<Filter> filters = {
        MakeFilter("tags", FilterOperator::kContains, "checkout"),
        MakeFilter("metadata", FilterOperator::kEqual, "staging", "env"),
    };
    EXPECT_FALSE(FilterEvaluator::Matches(filters, trace_));

    filters[1].value = "prod";
    EXPECT_TRUE(FilterEvaluator::Matches(filters, trace_));
}

TEST(ThreadFilterTest, ConversationFields) {
    model::ScoredEntity thread;
    thread.type = model::EntityType::kThread;
    thread.id = "thread-1";
    thread.messages = {{"user", "hello there", 1000},
                       {"assistant", "hi, how can I help?", 1100},
                       {"user", "cancel my plan", 2000},
                       {"assistant", "done", 2100}};
    thread.start_time_ms = 1000;
    thread.end_time_ms = 2100;

    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("first_message", FilterOperator::kStartsWith, "hello"), thread));
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("last_message", FilterOperator::kEqual, "done"), thread));
    EXPECT_TRUE(FilterEvaluator::Matches(
        MakeFilter("number_of_messages", FilterOperator::kEqual, "4"), thread));
    EXPECT_TRUE(FilterEvaluator::Matches(MakeFilter("duration", FilterOperator::kEqual, "1100"), thread));
    EXPECT_FALSE(FilterEvaluator::Matches(MakeFilter("name", FilterOperator::kEqual, "x"), thread));
}

}  // namespace
}  // namespace tracescore::scoring
