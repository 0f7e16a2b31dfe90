#pragma once

/// @file metric_executor.h
/// @brief Dispatch of user defined python metrics to the execution backend

#include <chrono>
#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "llm/retry.h"

namespace tracescore::python {

struct PythonScore {
    std::string name;
    double value = 0.0;
    std::string reason;
};

/// @brief Runs a metric's source against one data object
class PythonMetricExecutor {
public:
    virtual ~PythonMetricExecutor() = default;

    virtual absl::StatusOr<std::vector<PythonScore>> Evaluate(const std::string& code,
                                                              const nlohmann::json& data,
                                                              std::chrono::milliseconds timeout) = 0;
};

struct HttpPythonExecutorConfig {
    std::string url = "http://localhost:8000";
    std::string path = "/v1/private/evaluators/python";
    std::chrono::milliseconds connect_timeout{5000};
    llm::RetryPolicy retry;
};

/// @brief Decode {"scores": [{name, value, reason}]}
absl::StatusOr<std::vector<PythonScore>> ParsePythonScores(const std::string& body);

/// @brief Executor backed by the python evaluator HTTP service
class HttpPythonMetricExecutor : public PythonMetricExecutor {
public:
    explicit HttpPythonMetricExecutor(HttpPythonExecutorConfig config);

    absl::StatusOr<std::vector<PythonScore>> Evaluate(const std::string& code,
                                                      const nlohmann::json& data,
                                                      std::chrono::milliseconds timeout) override;

private:
    HttpPythonExecutorConfig config_;
    std::string scheme_host_;
    std::string path_;
};

}  // namespace tracescore::python
