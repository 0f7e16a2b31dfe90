#pragma once

/// @file service.h
/// @brief Wires stores, providers, the engine and one consumer per stream

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

#include <absl/status/status.h>

#include "consumer/stream_consumer.h"
#include "llm/provider_registry.h"
#include "python/metric_executor.h"
#include "registry/rule_registry.h"
#include "scoring/scoring_engine.h"
#include "server/service_config.h"
#include "sinks/buffered_user_log_sink.h"
#include "sinks/memory_sinks.h"
#include "storage/clickhouse/client.h"
#include "storage/redis/client.h"

namespace tracescore::server {

struct ServiceOptions {
    /// Scores and rule logs stay in memory instead of ClickHouse
    bool dry_run = false;
};

/// @brief The online scoring service
///
/// Start connects the stores and starts every enabled stream consumer.
/// Shutdown stops intake on all consumers, lets their in-flight batches finish
/// and be acknowledged, then flushes the rule log buffer.
class Service {
public:
    Service(ServiceConfig config, ServiceOptions options = {});
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    /// @brief Build components and start consuming (non-blocking)
    absl::Status Start();

    /// @brief Drain consumers and release connections
    absl::Status Shutdown();

    /// @brief Block until RequestShutdown is called
    void WaitForShutdown();

    void RequestShutdown();

    /// @brief False when any consumer cannot reach its stream
    bool IsHealthy() const;

    const ServiceConfig& GetConfig() const { return config_; }

    size_t ConsumerCount() const { return consumers_.size(); }

private:
    absl::Status BuildStores();
    absl::Status BuildEngine();
    absl::Status BuildConsumers();
    void LogFinalStats() const;

    ServiceConfig config_;
    ServiceOptions options_;

    std::shared_ptr<storage::RedisClient> redis_;
    std::shared_ptr<storage::ClickHouseClient> clickhouse_;
    std::shared_ptr<registry::RuleRegistry> rules_;
    std::shared_ptr<llm::ProviderRegistry> providers_;
    std::shared_ptr<python::PythonMetricExecutor> python_;
    std::shared_ptr<sinks::FeedbackScoreSink> feedback_scores_;
    std::shared_ptr<sinks::MemoryFeedbackScoreSink> dry_run_scores_;
    std::shared_ptr<sinks::BufferedUserLogSink> user_logs_;
    std::shared_ptr<ThreadPool> pool_;
    std::shared_ptr<scoring::ScoringEngine> engine_;
    std::vector<std::unique_ptr<consumer::StreamConsumer>> consumers_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::mutex shutdown_mutex_;
    std::condition_variable shutdown_cv_;
};

}  // namespace tracescore::server
