#pragma once

/// @file openai_provider.h
/// @brief Chat completions over an OpenAI compatible HTTP API

#include <chrono>
#include <string>
#include <vector>

#include "llm/llm_provider.h"
#include "llm/retry.h"

namespace tracescore::llm {

/// @brief Configuration for an OpenAI compatible endpoint
struct OpenAiConfig {
    std::string endpoint = "https://api.openai.com";
    std::string chat_path = "/v1/chat/completions";
    std::string api_key;
    std::chrono::milliseconds connect_timeout{5000};
    /// Model name prefixes that honour response_format json_schema
    std::vector<std::string> structured_output_models = {"gpt-4o", "gpt-4.1", "o1", "o3"};
    RetryPolicy retry;
};

/// @brief Split "https://host:port/base" into "https://host:port" and "/base"
///
/// @return false when the URL has no http(s) scheme
bool SplitEndpoint(const std::string& url, std::string* scheme_host, std::string* base_path);

/// @brief Map an HTTP status to the error taxonomy
///
/// 429 and 5xx are transient, other non-2xx codes are permanent.
absl::Status ClassifyHttpStatus(int status, const std::string& body);

/// @brief Parse a chat completion body into content and usage
absl::StatusOr<ChatResponse> ParseChatCompletion(const std::string& body);

/// @brief Encode a request as a chat completion body
nlohmann::json EncodeChatRequest(const ChatRequest& request);

class OpenAiCompatibleProvider : public LlmProvider {
public:
    explicit OpenAiCompatibleProvider(OpenAiConfig config);

    absl::StatusOr<ChatResponse> Chat(const ChatRequest& request,
                                      std::chrono::milliseconds timeout) override;

    bool SupportsStructuredOutput(const std::string& model) const override;

    std::string Name() const override { return "openai"; }

private:
    absl::StatusOr<ChatResponse> PostOnce(const std::string& body,
                                          std::chrono::milliseconds timeout);

    OpenAiConfig config_;
    std::string scheme_host_;
    std::string path_;
};

}  // namespace tracescore::llm
