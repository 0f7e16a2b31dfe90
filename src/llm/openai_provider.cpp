#include "llm/openai_provider.h"

#include <algorithm>
#include <regex>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <httplib.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace tracescore::llm {

using json = nlohmann::json;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {

constexpr size_t kMaxErrorBody = 512;

std::string Truncate(const std::string& body) {
    if (body.size() <= kMaxErrorBody) {
        return body;
    }
    return body.substr(0, kMaxErrorBody) + "...";
}

}  // namespace

bool SplitEndpoint(const std::string& url, std::string* scheme_host, std::string* base_path) {
    static const std::regex url_regex(R"((https?)://([^/]+)(/.*)?)", std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, url_regex)) {
        return false;
    }
    *scheme_host = absl::AsciiStrToLower(match[1].str()) + "://" + match[2].str();
    std::string path = match[3].matched ? match[3].str() : "";
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    *base_path = path;
    return true;
}

absl::Status ClassifyHttpStatus(int status, const std::string& body) {
    if (status >= 200 && status < 300) {
        return absl::OkStatus();
    }
    std::string message = absl::StrCat("HTTP ", status, ": ", Truncate(body));
    if (status == 429) {
        return MakeError(ErrorCode::kRateLimited, message);
    }
    if (status == 408 || status >= 500) {
        return MakeError(ErrorCode::kTransientProviderError, message);
    }
    return MakeError(ErrorCode::kPermanentRequestError, message);
}

json EncodeChatRequest(const ChatRequest& request) {
    json body = request.custom_parameters.is_object() ? request.custom_parameters : json::object();
    body["model"] = request.model;
    if (request.temperature) {
        body["temperature"] = *request.temperature;
    }
    if (request.seed) {
        body["seed"] = *request.seed;
    }
    json messages = json::array();
    for (const auto& message : request.messages) {
        messages.push_back({{"role", message.role}, {"content", message.content}});
    }
    body["messages"] = std::move(messages);
    if (request.response_format) {
        body["response_format"] = *request.response_format;
    }
    return body;
}

absl::StatusOr<ChatResponse> ParseChatCompletion(const std::string& body) {
    try {
        json response = json::parse(body);
        if (!response.contains("choices") || !response["choices"].is_array() ||
            response["choices"].empty() || !response["choices"][0].contains("message")) {
            return MakeError(ErrorCode::kParseError, "Chat completion has no choices");
        }
        const auto& message = response["choices"][0]["message"];
        ChatResponse result;
        if (message.contains("content") && message["content"].is_string()) {
            result.content = message["content"].get<std::string>();
        } else if (message.contains("refusal") && message["refusal"].is_string()) {
            return MakeError(ErrorCode::kPermanentRequestError,
                             absl::StrCat("Model refused: ", message["refusal"].get<std::string>()));
        }
        if (response.contains("usage") && response["usage"].is_object()) {
            const auto& usage = response["usage"];
            result.usage.prompt_tokens = usage.value("prompt_tokens", int64_t{0});
            result.usage.completion_tokens = usage.value("completion_tokens", int64_t{0});
        }
        return result;
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kParseError,
                         std::string("Failed to parse chat completion: ") + e.what());
    }
}

OpenAiCompatibleProvider::OpenAiCompatibleProvider(OpenAiConfig config)
    : config_(std::move(config)) {
    std::string base_path;
    if (!SplitEndpoint(config_.endpoint, &scheme_host_, &base_path)) {
        TRACESCORE_LOG_ERROR("Invalid LLM endpoint '{}'", config_.endpoint);
    }
    // Endpoints configured as ".../v1" already carry the version segment
    if (absl::EndsWith(base_path, "/v1") && absl::StartsWith(config_.chat_path, "/v1/")) {
        path_ = base_path + config_.chat_path.substr(3);
    } else {
        path_ = base_path + config_.chat_path;
    }
}

bool OpenAiCompatibleProvider::SupportsStructuredOutput(const std::string& model) const {
    for (const auto& prefix : config_.structured_output_models) {
        if (!prefix.empty() && absl::StartsWith(model, prefix)) {
            return true;
        }
    }
    return false;
}

absl::StatusOr<ChatResponse> OpenAiCompatibleProvider::Chat(const ChatRequest& request,
                                                            milliseconds timeout) {
    if (scheme_host_.empty()) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Invalid LLM endpoint '", config_.endpoint, "'"));
    }

    const std::string body = EncodeChatRequest(request).dump();
    const auto deadline = steady_clock::now() + timeout;
    auto& latency = TRACESCORE_HISTOGRAM("tracescore_llm_request_ms");

    std::function<absl::StatusOr<ChatResponse>()> attempt = [&]() -> absl::StatusOr<ChatResponse> {
        auto remaining = std::chrono::duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) {
            return MakeError(ErrorCode::kTimeout,
                             absl::StrCat("LLM call exceeded ", timeout.count(), "ms"));
        }
        ScopedTimer timer(latency);
        return PostOnce(body, remaining);
    };

    auto response = CallWithRetry<ChatResponse>(config_.retry, deadline, attempt);
    if (!response.ok()) {
        TRACESCORE_COUNTER("tracescore_llm_request_errors").Increment();
        TRACESCORE_LOG_DEBUG("LLM call for model '{}' failed: {}", request.model,
                             response.status().ToString());
    }
    return response;
}

absl::StatusOr<ChatResponse> OpenAiCompatibleProvider::PostOnce(const std::string& body,
                                                                milliseconds timeout) {
    httplib::Client client(scheme_host_);
    client.set_connection_timeout(std::min(config_.connect_timeout, timeout));
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    auto result = client.Post(path_, headers, body, "application/json");
    if (!result) {
        return MakeError(ErrorCode::kTransientProviderError,
                         absl::StrCat("LLM request failed: ", httplib::to_string(result.error())));
    }
    auto status = ClassifyHttpStatus(result->status, result->body);
    if (!status.ok()) {
        return status;
    }
    return ParseChatCompletion(result->body);
}

}  // namespace tracescore::llm
