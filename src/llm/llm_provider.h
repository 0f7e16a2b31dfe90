#pragma once

/// @file llm_provider.h
/// @brief Boundary to chat-completion style LLM providers

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace tracescore::llm {

struct ChatMessage {
    std::string role;
    std::string content;
};

struct ChatRequest {
    std::string model;
    std::optional<double> temperature;
    std::optional<int64_t> seed;
    nlohmann::json custom_parameters = nlohmann::json::object();
    std::vector<ChatMessage> messages;
    /// OpenAI style response_format, absent when the schema is in the prompt
    std::optional<nlohmann::json> response_format;
};

struct TokenUsage {
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
};

struct ChatResponse {
    std::string content;
    TokenUsage usage;
};

/// @brief A chat-completion backend
///
/// Implementations return kUnavailable, kDeadlineExceeded or
/// kResourceExhausted for failures worth retrying and kInvalidArgument,
/// kPermissionDenied or kFailedPrecondition for requests that will never
/// succeed. Retries are the implementation's concern.
class LlmProvider {
public:
    virtual ~LlmProvider() = default;

    virtual absl::StatusOr<ChatResponse> Chat(const ChatRequest& request,
                                              std::chrono::milliseconds timeout) = 0;

    /// @brief Whether the model enforces a JSON schema natively
    virtual bool SupportsStructuredOutput(const std::string& model) const = 0;

    virtual std::string Name() const = 0;
};

}  // namespace tracescore::llm
