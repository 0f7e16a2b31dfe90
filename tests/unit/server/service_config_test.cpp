/// @file service_config_test.cpp
/// @brief Tests for the typed service configuration

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "server/service_config.h"

namespace tracescore::server {
namespace {

using model::EvaluatorKind;
using std::chrono::milliseconds;

absl::StatusOr<ServiceConfig> FromYaml(const std::string& yaml) {
    auto config = Config::LoadFromString(yaml);
    if (!config.ok()) {
        return config.status();
    }
    return ServiceConfig::FromConfig(*config);
}

TEST(ServiceConfigTest, DefaultsCoverEveryKind) {
    auto config = ServiceConfig::Default();
    ASSERT_EQ(config.streams.size(), model::kAllEvaluatorKinds.size());
    EXPECT_EQ(config.streams[0].stream_name, "online_scoring:llm_as_judge");
    EXPECT_EQ(config.streams[0].consumer_group, "online_scoring");
    EXPECT_EQ(DefaultStreamName(EvaluatorKind::kThreadPythonMetric),
              "online_scoring:trace_thread_user_defined_metric_python");
    EXPECT_TRUE(config.Validate().ok());
}

TEST(ServiceConfigTest, EmptyYamlKeepsDefaults) {
    auto config = FromYaml("{}");
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->streams.size(), 6u);
    EXPECT_EQ(config->registry.cache, CacheBackend::kRedis);
    EXPECT_EQ(config->engine.worker_threads, 8u);
}

TEST(ServiceConfigTest, SectionsAreRead) {
    auto config = FromYaml(R"(
logging:
  level: debug
redis:
  host: redis.internal
  port: 6380
clickhouse:
  host: ch.internal
  database: traces
  run_migrations: true
llm:
  endpoint: http://llm.internal:8080/v1
  structured_output_models: [gpt-4o, qwen]
  retry:
    max_attempts: 5
    initial_backoff_ms: 250
engine:
  worker_threads: 16
  call_timeout_ms: 20000
  batch_timeout_ms: 90000
registry:
  cache: memory
  cache_ttl_s: 60
  rules_file: /etc/tracescore/rules.json
user_log:
  max_batch_size: 100
  flush_interval_ms: 250
)");
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->logging.level, LogLevel::kDebug);
    EXPECT_EQ(config->redis.host, "redis.internal");
    EXPECT_EQ(config->redis.port, 6380);
    EXPECT_EQ(config->clickhouse.database, "traces");
    EXPECT_TRUE(config->run_migrations);
    EXPECT_EQ(config->llm.endpoint, "http://llm.internal:8080/v1");
    EXPECT_EQ(config->llm.structured_output_models, (std::vector<std::string>{"gpt-4o", "qwen"}));
    EXPECT_EQ(config->llm.retry.max_attempts, 5);
    EXPECT_EQ(config->llm.retry.initial_backoff, milliseconds(250));
    EXPECT_EQ(config->engine.worker_threads, 16u);
    EXPECT_EQ(config->engine.options.call_timeout, milliseconds(20000));
    EXPECT_EQ(config->engine.options.batch_timeout, milliseconds(90000));
    EXPECT_EQ(config->registry.cache, CacheBackend::kMemory);
    EXPECT_EQ(config->registry.cache_ttl, std::chrono::seconds(60));
    EXPECT_EQ(config->registry.rules_file, "/etc/tracescore/rules.json");
    EXPECT_EQ(config->user_log.max_batch_size, 100u);
    EXPECT_EQ(config->user_log.flush_interval, milliseconds(250));
}

TEST(ServiceConfigTest, StreamsInheritSectionDefaults) {
    auto config = FromYaml(R"(
online_scoring:
  consumer_group: scorers
  batch_size: 1
  polling_interval_ms: 100
  max_retries: 5
  streams:
    - evaluator_kind: llm_as_judge
    - evaluator_kind: span_llm_as_judge
      stream_name: spans
      batch_size: 50
      enabled: false
)");
    ASSERT_TRUE(config.ok()) << config.status();
    ASSERT_EQ(config->streams.size(), 2u);

    const auto& traces = config->streams[0];
    EXPECT_EQ(traces.kind, EvaluatorKind::kTraceLlmJudge);
    EXPECT_EQ(traces.stream_name, "online_scoring:llm_as_judge");
    EXPECT_EQ(traces.consumer_group, "scorers");
    EXPECT_EQ(traces.batch_size, 1u);
    EXPECT_EQ(traces.polling_interval, milliseconds(100));
    EXPECT_EQ(traces.max_retries, 5);
    EXPECT_TRUE(traces.enabled);

    const auto& spans = config->streams[1];
    EXPECT_EQ(spans.stream_name, "spans");
    EXPECT_EQ(spans.batch_size, 50u);
    EXPECT_FALSE(spans.enabled);
}

TEST(ServiceConfigTest, SectionDefaultsApplyWithoutStreamList) {
    auto config = FromYaml("online_scoring:\n  batch_size: 3\n");
    ASSERT_TRUE(config.ok()) << config.status();
    for (const auto& stream : config->streams) {
        EXPECT_EQ(stream.batch_size, 3u);
        EXPECT_EQ(stream.stream_name, DefaultStreamName(stream.kind));
    }
}

TEST(ServiceConfigTest, InvalidValuesAreConfigurationErrors) {
    const std::vector<std::string> invalid = {
        "registry:\n  cache: memcached\n",
        "engine:\n  worker_threads: 0\n",
        "engine:\n  batch_timeout_ms: 0\n",
        "llm:\n  retry:\n    max_attempts: 0\n",
        "online_scoring:\n  batch_size: 0\n",
        "online_scoring:\n  claim_interval_ratio: 0\n",
        "online_scoring:\n  max_retries: 0\n",
        "online_scoring:\n  codec: protobuf\n",
        "online_scoring:\n  streams:\n    - evaluator_kind: sentiment\n",
        "online_scoring:\n  streams:\n    - evaluator_kind: llm_as_judge\n      stream_name: s\n"
        "    - evaluator_kind: span_llm_as_judge\n      stream_name: s\n",
    };
    for (const auto& yaml : invalid) {
        auto config = FromYaml(yaml);
        EXPECT_EQ(config.status().code(), absl::StatusCode::kFailedPrecondition) << yaml;
    }
}

TEST(ServiceConfigTest, EnvironmentOverridesFile) {
    auto path = std::filesystem::temp_directory_path() / "tracescore_service_config_test.yaml";
    std::ofstream(path) << "redis:\n  host: from-file\n  port: 6379\n";
    ::setenv("TSCFGTEST_REDIS_HOST", "from-env", 1);

    auto config = ServiceConfig::LoadWithEnv(path, "TSCFGTEST_");

    ::unsetenv("TSCFGTEST_REDIS_HOST");
    std::filesystem::remove(path);
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->redis.host, "from-env");
    EXPECT_EQ(config->redis.port, 6379);
}

TEST(ServiceConfigTest, MissingFileFails) {
    auto config = ServiceConfig::LoadWithEnv("/nonexistent/tracescore.yaml");
    EXPECT_FALSE(config.ok());
}

}  // namespace
}  // namespace tracescore::server
