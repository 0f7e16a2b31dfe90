/// @file variable_resolver_test.cpp
/// @brief Tests for variable path resolution

#include <gtest/gtest.h>

#include "scoring/variable_resolver.h"

namespace tracescore::scoring {
namespace {

using json = nlohmann::json;

TEST(JsonPathTest, LookupForms) {
    json root = json::parse(R"({"messages": [{"content": "hi"}, {"content": "bye"}], "a b": {"c": 1}})");

    EXPECT_EQ(LookupJsonPath(root, "$.messages[1].content").value(), json("bye"));
    EXPECT_EQ(LookupJsonPath(root, "messages.0.content").value(), json("hi"));
    EXPECT_EQ(LookupJsonPath(root, R"($["a b"].c)").value(), json(1));
    EXPECT_EQ(LookupJsonPath(root, "$").value(), root);
    EXPECT_FALSE(LookupJsonPath(root, "$.messages[5].content").has_value());
    EXPECT_FALSE(LookupJsonPath(root, "$.missing").has_value());
    EXPECT_FALSE(LookupJsonPath(root, "$.messages[0").has_value());
}

TEST(JsonPathTest, OverflowingIndexIsAMiss) {
    json root = json::parse(R"({"items": [{"id": 1}]})");

    EXPECT_FALSE(LookupJsonPath(root, "items.99999999999999999999").has_value());
    EXPECT_FALSE(LookupJsonPath(root, "$.items[184467440737095516160].id").has_value());
    EXPECT_EQ(LookupJsonPath(root, "items.0.id").value(), json(1));
}

class VariableResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        trace_.id = "trace-1";
        trace_.input = json::parse(R"({"question": "What is the capital of France?", "history": [1, 2]})");
        trace_.output = json::parse(R"({"answer": "Paris"})");
        trace_.metadata = json::parse(R"({"user": {"tier": "gold"}})");
    }

    model::ScoredEntity trace_;
};

TEST_F(VariableResolverTest, ResolvesSectionsAndLiterals) {
    std::vector<model::VariableMapping> variables = {
        model::ParseVariableMapping("q", "input.question"),
        model::ParseVariableMapping("a", "output.answer"),
        model::ParseVariableMapping("tier", "metadata.user.tier"),
        model::ParseVariableMapping("history", "input.history"),
        model::ParseVariableMapping("style", "be strict"),
    };

    auto values = VariableResolver::Resolve(variables, trace_);

    EXPECT_EQ(values["q"], "What is the capital of France?");
    EXPECT_EQ(values["a"], "Paris");
    EXPECT_EQ(values["tier"], "gold");
    EXPECT_EQ(values["history"], "[1,2]");
    EXPECT_EQ(values["style"], "be strict");
}

TEST_F(VariableResolverTest, UnresolvedPathRendersConfiguredText) {
    std::vector<model::VariableMapping> variables = {
        model::ParseVariableMapping("context", "input.documents[0].text"),
    };

    auto values = VariableResolver::Resolve(variables, trace_);

    EXPECT_EQ(values["context"], "input.documents[0].text");
}

TEST_F(VariableResolverTest, ResolveJsonKeepsTypes) {
    std::vector<model::VariableMapping> variables = {
        model::ParseVariableMapping("history", "input.history"),
        model::ParseVariableMapping("output", "output"),
        model::ParseVariableMapping("missing", "output.score"),
    };

    auto values = VariableResolver::ResolveJson(variables, trace_);

    EXPECT_EQ(values["history"], json::array({1, 2}));
    EXPECT_EQ(values["output"], trace_.output);
    EXPECT_EQ(values["missing"], json("output.score"));
}

TEST(ThreadVariablesTest, ContextIsTheConversation) {
    model::ScoredEntity thread;
    thread.type = model::EntityType::kThread;
    thread.messages = {{"user", "refund please", 1}, {"assistant", "sure", 2}};

    std::vector<model::VariableMapping> variables = {
        model::ParseVariableMapping("first", "input[0].content"),
    };
    auto values = VariableResolver::Resolve(variables, thread);

    EXPECT_EQ(values[kThreadContextVariable], "user: refund please\nassistant: sure");
    EXPECT_EQ(values["first"], "refund please");

    auto messages = VariableResolver::ThreadMessagesJson(thread);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[1]["role"], "assistant");
    EXPECT_EQ(messages[1]["content"], "sure");
}

}  // namespace
}  // namespace tracescore::scoring
