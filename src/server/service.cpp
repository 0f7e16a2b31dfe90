#include "server/service.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "consumer/envelope_codec.h"
#include "consumer/redis_stream_client.h"
#include "consumer/scoring_batch_handler.h"
#include "consumer/thread_loader.h"
#include "llm/openai_provider.h"
#include "registry/memory_cache.h"
#include "registry/redis_cache.h"
#include "registry/rule_store.h"
#include "sinks/clickhouse_sinks.h"

namespace tracescore::server {

Service::Service(ServiceConfig config, ServiceOptions options)
    : config_(std::move(config)), options_(options) {}

Service::~Service() {
    if (running_.load()) {
        auto status = Shutdown();
        if (!status.ok()) {
            TRACESCORE_LOG_ERROR("Error during shutdown: {}", status.ToString());
        }
    }
}

absl::Status Service::Start() {
    if (running_.exchange(true)) {
        return absl::AlreadyExistsError("Service already running");
    }
    TRACESCORE_LOG_INFO("Starting tracescore{}", options_.dry_run ? " (dry run)" : "");

    auto status = BuildStores();
    if (status.ok()) {
        status = BuildEngine();
    }
    if (status.ok()) {
        status = BuildConsumers();
    }
    if (!status.ok()) {
        running_ = false;
        for (auto& consumer : consumers_) {
            if (consumer->IsRunning()) {
                consumer->Stop().IgnoreError();
            }
        }
        consumers_.clear();
        return status;
    }

    TRACESCORE_LOG_INFO("tracescore started with {} stream consumers and {} workers",
                        consumers_.size(), config_.engine.worker_threads);
    return absl::OkStatus();
}

absl::Status Service::BuildStores() {
    redis_ = std::make_shared<storage::RedisClient>(config_.redis);
    auto status = redis_->Connect();
    if (!status.ok()) {
        return Annotate(status, absl::StrCat("Cannot connect to Redis at ", config_.redis.host,
                                             ":", config_.redis.port));
    }
    TRACESCORE_LOG_INFO("Connected to Redis at {}:{}", config_.redis.host, config_.redis.port);

    if (options_.dry_run) {
        dry_run_scores_ = std::make_shared<sinks::MemoryFeedbackScoreSink>();
        feedback_scores_ = dry_run_scores_;
        user_logs_ = std::make_shared<sinks::BufferedUserLogSink>(
            std::make_shared<sinks::MemoryUserLogSink>(), config_.user_log);
    } else {
        clickhouse_ = std::make_shared<storage::ClickHouseClient>(config_.clickhouse);
        status = clickhouse_->Connect();
        if (!status.ok()) {
            return Annotate(status, absl::StrCat("Cannot connect to ClickHouse at ",
                                                 config_.clickhouse.host, ":",
                                                 config_.clickhouse.port));
        }
        if (config_.run_migrations) {
            TRACESCORE_RETURN_IF_ERROR(clickhouse_->RunMigrations());
        }
        feedback_scores_ = std::make_shared<sinks::ClickHouseFeedbackScoreSink>(clickhouse_);
        user_logs_ = std::make_shared<sinks::BufferedUserLogSink>(
            std::make_shared<sinks::ClickHouseUserLogSink>(clickhouse_), config_.user_log);
    }
    return user_logs_->Start();
}

absl::Status Service::BuildEngine() {
    auto store = std::make_shared<registry::FileRuleStore>(config_.registry.rules_file);
    TRACESCORE_RETURN_IF_ERROR(store->Load());
    TRACESCORE_LOG_INFO("Loaded {} rules from {}", store->RuleCount(), config_.registry.rules_file);

    std::shared_ptr<registry::CachePort> cache;
    switch (config_.registry.cache) {
        case CacheBackend::kMemory:
            cache = std::make_shared<registry::MemoryCache>(
                std::chrono::duration_cast<std::chrono::milliseconds>(config_.registry.cache_ttl));
            break;
        case CacheBackend::kRedis:
            cache = std::make_shared<registry::RedisCache>(redis_, config_.registry.cache_ttl);
            break;
    }
    rules_ = std::make_shared<registry::RuleRegistry>(store, cache);

    providers_ = std::make_shared<llm::ProviderRegistry>();
    providers_->SetDefault(std::make_shared<llm::OpenAiCompatibleProvider>(config_.llm));

    python_ = std::make_shared<python::HttpPythonMetricExecutor>(config_.python);
    pool_ = std::make_shared<ThreadPool>(config_.engine.worker_threads, "scoring");

    scoring::EngineDependencies deps;
    deps.rules = rules_;
    deps.providers = providers_;
    deps.python = python_;
    deps.feedback_scores = feedback_scores_;
    deps.user_logs = user_logs_;
    deps.pool = pool_;
    deps.sampler = std::make_shared<scoring::Sampler>();
    engine_ = std::make_shared<scoring::ScoringEngine>(std::move(deps), config_.engine.options);
    return absl::OkStatus();
}

absl::Status Service::BuildConsumers() {
    std::shared_ptr<consumer::ThreadLoader> threads;
    if (clickhouse_) {
        threads = std::make_shared<consumer::ClickHouseThreadLoader>(clickhouse_);
    }
    auto handler = std::make_shared<consumer::ScoringBatchHandler>(engine_, threads);

    for (const auto& stream : config_.streams) {
        if (!stream.enabled) {
            TRACESCORE_LOG_INFO("Stream '{}' is disabled", stream.stream_name);
            continue;
        }
        if (!threads && model::EntityTypeOf(stream.kind) == model::EntityType::kThread) {
            TRACESCORE_LOG_WARN("Skipping thread stream '{}': threads need ClickHouse",
                                stream.stream_name);
            continue;
        }
        TRACESCORE_ASSIGN_OR_RETURN(auto codec, consumer::MakeEnvelopeCodec(stream.codec));

        // A blocking stream read holds its connection, so each consumer gets one
        auto connection = std::make_shared<storage::RedisClient>(config_.redis);
        TRACESCORE_RETURN_IF_ERROR(connection->Connect());

        auto consumer = std::make_unique<consumer::StreamConsumer>(
            stream, std::make_shared<consumer::RedisStreamClient>(connection), std::move(codec),
            handler);
        TRACESCORE_RETURN_IF_ERROR(consumer->Start());
        consumers_.push_back(std::move(consumer));
    }
    if (consumers_.empty()) {
        return MakeError(ErrorCode::kConfigurationError, "No stream consumer is enabled");
    }
    return absl::OkStatus();
}

absl::Status Service::Shutdown() {
    if (!running_.exchange(false)) {
        return absl::FailedPreconditionError("Service not running");
    }
    TRACESCORE_LOG_INFO("Shutting down tracescore...");

    // Stop intake first. Every consumer is signalled before any is joined, so
    // in-flight batches drain in parallel
    for (auto& consumer : consumers_) {
        consumer->RequestStop();
    }
    for (auto& consumer : consumers_) {
        auto status = consumer->Stop();
        if (!status.ok()) {
            TRACESCORE_LOG_WARN("Error stopping consumer '{}': {}", consumer->ConsumerName(),
                                status.ToString());
        }
    }

    if (user_logs_) {
        auto status = user_logs_->Shutdown();
        if (!status.ok()) {
            TRACESCORE_LOG_WARN("Error flushing rule logs: {}", status.ToString());
        }
    }
    if (pool_) {
        pool_->Shutdown();
    }

    LogFinalStats();

    if (clickhouse_) {
        clickhouse_->Disconnect().IgnoreError();
    }
    if (redis_) {
        redis_->Disconnect().IgnoreError();
    }

    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        shutdown_requested_ = true;
    }
    shutdown_cv_.notify_all();
    TRACESCORE_LOG_INFO("tracescore shutdown complete");
    return absl::OkStatus();
}

void Service::WaitForShutdown() {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    shutdown_cv_.wait(lock, [this] { return shutdown_requested_.load(); });
}

void Service::RequestShutdown() {
    shutdown_requested_ = true;
    shutdown_cv_.notify_all();
}

bool Service::IsHealthy() const {
    if (!running_.load()) {
        return false;
    }
    for (const auto& consumer : consumers_) {
        if (!consumer->IsRunning() || !consumer->IsHealthy()) {
            return false;
        }
    }
    return true;
}

void Service::LogFinalStats() const {
    for (const auto& consumer : consumers_) {
        auto stats = consumer->GetStats();
        TRACESCORE_LOG_INFO(
            "Stream '{}': read={}, claimed={}, acked={}, poison={}, dead-lettered={}, "
            "batches={}, failed batches={}",
            consumer->GetConfig().stream_name, stats.entries_read, stats.entries_claimed,
            stats.entries_acked, stats.poison_entries, stats.entries_dead_lettered,
            stats.batches_handled, stats.batches_failed);
    }
    TRACESCORE_LOG_DEBUG("Metrics at shutdown:\n{}", MetricsRegistry::Instance().ExportText());
    if (dry_run_scores_) {
        TRACESCORE_LOG_INFO("Dry run produced {} feedback scores in {} writes",
                            dry_run_scores_->Scores().size(), dry_run_scores_->WriteCount());
    }
}

}  // namespace tracescore::server
