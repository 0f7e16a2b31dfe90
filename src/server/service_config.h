#pragma once

/// @file service_config.h
/// @brief Typed configuration of the tracescore service

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/logging.h"
#include "consumer/stream_consumer.h"
#include "llm/openai_provider.h"
#include "python/metric_executor.h"
#include "scoring/scoring_engine.h"
#include "sinks/buffered_user_log_sink.h"
#include "storage/clickhouse/client.h"
#include "storage/redis/client.h"

namespace tracescore::server {

/// @brief Rule cache backends
enum class CacheBackend {
    kMemory,
    kRedis
};

struct EngineSettings {
    size_t worker_threads = 8;
    scoring::EngineOptions options;
};

struct RegistrySettings {
    CacheBackend cache = CacheBackend::kRedis;
    std::chrono::seconds cache_ttl{300};
    std::string rules_file = "config/rules.json";
};

/// @brief Everything the service reads from YAML and the environment
struct ServiceConfig {
    LogConfig logging;
    storage::RedisConfig redis;
    storage::ClickHouseConfig clickhouse;
    bool run_migrations = false;
    llm::OpenAiConfig llm;
    python::HttpPythonExecutorConfig python;
    EngineSettings engine;
    RegistrySettings registry;
    sinks::BufferedUserLogConfig user_log;
    std::vector<consumer::StreamConfig> streams;

    /// @brief Defaults plus one stream per evaluator kind
    static ServiceConfig Default();

    /// @brief Build from a layered config, then validate
    /// @return kFailedPrecondition (kConfigurationError) on invalid values
    static absl::StatusOr<ServiceConfig> FromConfig(const Config& config);

    /// @brief YAML file overlaid by TRACESCORE_* environment variables
    static absl::StatusOr<ServiceConfig> LoadWithEnv(const std::filesystem::path& path,
                                                     const std::string& env_prefix = "TRACESCORE_");

    absl::Status Validate() const;
};

/// @brief Default stream name of a kind, e.g. "online_scoring:span_llm_as_judge"
std::string DefaultStreamName(model::EvaluatorKind kind);

}  // namespace tracescore::server
