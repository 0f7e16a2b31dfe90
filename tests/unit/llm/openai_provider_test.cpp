/// @file openai_provider_test.cpp
/// @brief Tests for the OpenAI compatible chat provider

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include <httplib.h>

#include "llm/openai_provider.h"

namespace tracescore::llm {
namespace {

using json = nlohmann::json;

TEST(SplitEndpointTest, SchemeHostAndPath) {
    std::string host;
    std::string path;
    ASSERT_TRUE(SplitEndpoint("HTTPS://llm.internal:8443/openai/v1/", &host, &path));
    EXPECT_EQ(host, "https://llm.internal:8443");
    EXPECT_EQ(path, "/openai/v1");

    ASSERT_TRUE(SplitEndpoint("http://localhost:8080", &host, &path));
    EXPECT_EQ(host, "http://localhost:8080");
    EXPECT_EQ(path, "");

    EXPECT_FALSE(SplitEndpoint("localhost:8080", &host, &path));
}

TEST(ClassifyHttpStatusTest, TransientAndPermanent) {
    EXPECT_TRUE(ClassifyHttpStatus(200, "").ok());
    EXPECT_EQ(ClassifyHttpStatus(429, "").code(), absl::StatusCode::kResourceExhausted);
    EXPECT_EQ(ClassifyHttpStatus(503, "").code(), absl::StatusCode::kUnavailable);
    EXPECT_EQ(ClassifyHttpStatus(408, "").code(), absl::StatusCode::kUnavailable);
    EXPECT_EQ(ClassifyHttpStatus(400, "bad").code(), absl::StatusCode::kInvalidArgument);
    EXPECT_TRUE(IsTransient(ClassifyHttpStatus(500, "")));
    EXPECT_FALSE(IsTransient(ClassifyHttpStatus(401, "")));
}

TEST(ClassifyHttpStatusTest, LongBodiesAreTruncated) {
    auto status = ClassifyHttpStatus(400, std::string(4096, 'x'));
    EXPECT_LT(status.message().size(), 600u);
}

TEST(ParseChatCompletionTest, ContentAndUsage) {
    auto response = ParseChatCompletion(R"({
        "choices": [{"message": {"role": "assistant", "content": "{\"Relevance\": 1}"}}],
        "usage": {"prompt_tokens": 120, "completion_tokens": 9}
    })");
    ASSERT_TRUE(response.ok()) << response.status();
    EXPECT_EQ(response->content, "{\"Relevance\": 1}");
    EXPECT_EQ(response->usage.prompt_tokens, 120);
    EXPECT_EQ(response->usage.completion_tokens, 9);
}

TEST(ParseChatCompletionTest, RefusalIsPermanent) {
    auto response = ParseChatCompletion(
        R"({"choices": [{"message": {"content": null, "refusal": "I cannot help"}}]})");
    EXPECT_EQ(response.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ParseChatCompletionTest, MalformedBodies) {
    EXPECT_EQ(ParseChatCompletion("not json").status().code(), absl::StatusCode::kInternal);
    EXPECT_EQ(ParseChatCompletion(R"({"choices": []})").status().code(), absl::StatusCode::kInternal);
}

TEST(EncodeChatRequestTest, CustomParametersAreMergedFirst) {
    ChatRequest request;
    request.model = "gpt-4o";
    request.temperature = 0.2;
    request.custom_parameters = json::parse(R"({"top_p": 0.5, "model": "ignored"})");
    request.messages = {{"system", "grade"}, {"user", "answer"}};
    request.response_format = json::parse(R"({"type": "json_object"})");

    auto body = EncodeChatRequest(request);
    EXPECT_EQ(body["model"], "gpt-4o");
    EXPECT_EQ(body["top_p"], 0.5);
    EXPECT_EQ(body["temperature"], 0.2);
    EXPECT_FALSE(body.contains("seed"));
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][1]["content"], "answer");
    EXPECT_EQ(body["response_format"]["type"], "json_object");
}

TEST(OpenAiCompatibleProviderTest, StructuredOutputByModelPrefix) {
    OpenAiConfig config;
    config.structured_output_models = {"gpt-4o"};
    OpenAiCompatibleProvider provider(config);
    EXPECT_TRUE(provider.SupportsStructuredOutput("gpt-4o-mini"));
    EXPECT_FALSE(provider.SupportsStructuredOutput("llama3"));
}

TEST(OpenAiCompatibleProviderTest, InvalidEndpointIsAConfigurationError) {
    OpenAiConfig config;
    config.endpoint = "not a url";
    OpenAiCompatibleProvider provider(config);
    auto response = provider.Chat(ChatRequest{}, std::chrono::seconds(1));
    EXPECT_EQ(response.status().code(), absl::StatusCode::kFailedPrecondition);
}

/// Serves chat completions on a loopback port
class FakeChatServer {
public:
    FakeChatServer() {
        server_.Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
            last_body_ = req.body;
            last_auth_ = req.get_header_value("Authorization");
            if (++calls_ <= failures_) {
                res.status = 503;
                res.set_content("overloaded", "text/plain");
                return;
            }
            res.set_content(
                R"({"choices": [{"message": {"content": "{\"Relevance\": {\"score\": 5}}"}}]})",
                "application/json");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeChatServer() {
        server_.stop();
        thread_.join();
    }

    std::string Endpoint() const { return "http://127.0.0.1:" + std::to_string(port_) + "/v1"; }

    void FailFirst(int count) { failures_ = count; }

    int Calls() const { return calls_.load(); }
    std::string LastBody() const { return last_body_; }
    std::string LastAuth() const { return last_auth_; }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    int failures_ = 0;
    std::atomic<int> calls_{0};
    std::string last_body_;
    std::string last_auth_;
};

TEST(OpenAiCompatibleProviderTest, PostsToChatCompletionsAndRetries) {
    FakeChatServer server;
    server.FailFirst(1);

    OpenAiConfig config;
    config.endpoint = server.Endpoint();
    config.api_key = "sk-test";
    config.retry.initial_backoff = std::chrono::milliseconds(1);
    OpenAiCompatibleProvider provider(config);

    ChatRequest request;
    request.model = "gpt-4o";
    request.messages = {{"user", "Rate: Paris"}};
    auto response = provider.Chat(request, std::chrono::seconds(5));

    ASSERT_TRUE(response.ok()) << response.status();
    EXPECT_EQ(response->content, "{\"Relevance\": {\"score\": 5}}");
    EXPECT_EQ(server.Calls(), 2);
    EXPECT_EQ(server.LastAuth(), "Bearer sk-test");
    EXPECT_EQ(json::parse(server.LastBody())["model"], "gpt-4o");
}

TEST(OpenAiCompatibleProviderTest, FailingCallEndsWithinItsTimeout) {
    FakeChatServer server;
    server.FailFirst(100);

    OpenAiConfig config;
    config.endpoint = server.Endpoint();
    OpenAiCompatibleProvider provider(config);

    ChatRequest request;
    request.model = "gpt-4o";
    request.messages = {{"user", "Rate: Paris"}};
    const auto started = std::chrono::steady_clock::now();
    auto response = provider.Chat(request, std::chrono::milliseconds(200));

    EXPECT_FALSE(response.ok());
    EXPECT_EQ(server.Calls(), 1);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(500));
}

}  // namespace
}  // namespace tracescore::llm
