/// @file template_renderer_test.cpp
/// @brief Tests for prompt template rendering

#include <gtest/gtest.h>

#include "scoring/template_renderer.h"

namespace tracescore::scoring {
namespace {

TEST(TemplateRendererTest, ReplacesKnownVariables) {
    std::unordered_map<std::string, std::string> values = {{"question", "2+2?"}, {"answer", "4"}};

    EXPECT_EQ(TemplateRenderer::Render("Q: {{question}} A: {{ answer }}", values), "Q: 2+2? A: 4");
}

TEST(TemplateRendererTest, UnknownVariablesStayAsWritten) {
    EXPECT_EQ(TemplateRenderer::Render("Hello {{ name }}!", {}), "Hello {{ name }}!");
}

TEST(TemplateRendererTest, ValuesAreNotRenderedAgain) {
    std::unordered_map<std::string, std::string> values = {{"a", "{{b}}"}, {"b", "x"}};

    EXPECT_EQ(TemplateRenderer::Render("{{a}}", values), "{{b}}");
}

TEST(TemplateRendererTest, RepeatedAndAdjacentTokens) {
    std::unordered_map<std::string, std::string> values = {{"x", "1"}, {"y", "2"}};

    EXPECT_EQ(TemplateRenderer::Render("{{x}}{{y}}{{x}}", values), "121");
}

TEST(TemplateRendererTest, RenderMessagesKeepsRoles) {
    std::vector<model::PromptMessage> messages = {{"system", "You grade {{topic}}."},
                                                  {"user", "{{answer}}"}};

    auto rendered = TemplateRenderer::RenderMessages(messages, {{"topic", "math"}, {"answer", "4"}});

    ASSERT_EQ(rendered.size(), 2u);
    EXPECT_EQ(rendered[0].role, "system");
    EXPECT_EQ(rendered[0].content, "You grade math.");
    EXPECT_EQ(rendered[1].content, "4");
}

TEST(TemplateRendererTest, ThreadContextOneLinePerMessage) {
    std::vector<model::ThreadMessage> messages = {{"user", "hi", 1}, {"assistant", "hello", 2}};

    EXPECT_EQ(TemplateRenderer::RenderThreadContext(messages), "user: hi\nassistant: hello");
    EXPECT_EQ(TemplateRenderer::RenderThreadContext({}), "");
}

}  // namespace
}  // namespace tracescore::scoring
