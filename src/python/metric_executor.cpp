#include "python/metric_executor.h"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <httplib.h>

#include "common/error.h"
#include "common/logging.h"
#include "llm/openai_provider.h"

namespace tracescore::python {

using json = nlohmann::json;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

absl::StatusOr<std::vector<PythonScore>> ParsePythonScores(const std::string& body) {
    try {
        json response = json::parse(body);
        if (!response.is_object() || !response.contains("scores") || !response["scores"].is_array()) {
            return MakeError(ErrorCode::kParseError, "Python evaluator response has no scores");
        }
        std::vector<PythonScore> scores;
        for (const auto& item : response["scores"]) {
            if (!item.is_object() || !item.contains("name") || !item.contains("value")) {
                continue;
            }
            PythonScore score;
            score.name = item["name"].get<std::string>();
            if (item["value"].is_boolean()) {
                score.value = item["value"].get<bool>() ? 1.0 : 0.0;
            } else if (item["value"].is_number()) {
                score.value = item["value"].get<double>();
            } else {
                continue;
            }
            if (item.contains("reason") && item["reason"].is_string()) {
                score.reason = item["reason"].get<std::string>();
            }
            scores.push_back(std::move(score));
        }
        return scores;
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kParseError,
                         std::string("Failed to parse python evaluator response: ") + e.what());
    }
}

HttpPythonMetricExecutor::HttpPythonMetricExecutor(HttpPythonExecutorConfig config)
    : config_(std::move(config)) {
    std::string base_path;
    if (!llm::SplitEndpoint(config_.url, &scheme_host_, &base_path)) {
        TRACESCORE_LOG_ERROR("Invalid python backend url '{}'", config_.url);
    }
    path_ = base_path + config_.path;
}

absl::StatusOr<std::vector<PythonScore>> HttpPythonMetricExecutor::Evaluate(
    const std::string& code, const json& data, milliseconds timeout) {
    if (data.empty()) {
        return absl::InvalidArgumentError("Argument 'data' must not be empty");
    }
    if (scheme_host_.empty()) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Invalid python backend url '", config_.url, "'"));
    }

    const std::string body = json{{"code", code}, {"data", data}}.dump();
    const auto deadline = steady_clock::now() + timeout;

    std::function<absl::StatusOr<std::vector<PythonScore>>()> attempt =
        [&]() -> absl::StatusOr<std::vector<PythonScore>> {
        auto remaining = std::chrono::duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) {
            return MakeError(ErrorCode::kTimeout,
                             absl::StrCat("Python metric exceeded ", timeout.count(), "ms"));
        }
        httplib::Client client(scheme_host_);
        client.set_connection_timeout(std::min(config_.connect_timeout, remaining));
        client.set_read_timeout(remaining);
        client.set_write_timeout(remaining);

        auto result = client.Post(path_, body, "application/json");
        if (!result) {
            return MakeError(ErrorCode::kTransientProviderError,
                             absl::StrCat("Python evaluator request failed: ",
                                          httplib::to_string(result.error())));
        }
        auto status = llm::ClassifyHttpStatus(result->status, result->body);
        if (!status.ok()) {
            return status;
        }
        return ParsePythonScores(result->body);
    };

    return llm::CallWithRetry<std::vector<PythonScore>>(config_.retry, deadline, attempt);
}

}  // namespace tracescore::python
