/// @file main.cpp
/// @brief tracescore entry point

#include <csignal>
#include <iostream>

#include <CLI/CLI.hpp>

#include "common/logging.h"
#include "server/service.h"

namespace {

tracescore::server::Service* g_service = nullptr;

void SignalHandler(int signal) {
    TRACESCORE_LOG_INFO("Received signal {}, draining consumers", signal);
    if (g_service) {
        g_service->RequestShutdown();
    }
}

void LogSummary(const tracescore::server::ServiceConfig& config) {
    TRACESCORE_LOG_INFO("Configuration:");
    TRACESCORE_LOG_INFO("  Redis: {}:{}", config.redis.host, config.redis.port);
    TRACESCORE_LOG_INFO("  ClickHouse: {}:{}/{}", config.clickhouse.host, config.clickhouse.port,
                        config.clickhouse.database);
    TRACESCORE_LOG_INFO("  LLM endpoint: {}", config.llm.endpoint);
    TRACESCORE_LOG_INFO("  Python backend: {}", config.python.url);
    TRACESCORE_LOG_INFO("  Rules file: {}", config.registry.rules_file);
    TRACESCORE_LOG_INFO("  Workers: {}, call timeout: {}ms, batch timeout: {}ms",
                        config.engine.worker_threads, config.engine.options.call_timeout.count(),
                        config.engine.options.batch_timeout.count());
    for (const auto& stream : config.streams) {
        TRACESCORE_LOG_INFO(
            "  Stream '{}' ({}): group={}, batch={}, interval={}ms, codec={}, claim every {} ticks, "
            "max retries={}{}",
            stream.stream_name, tracescore::model::ToString(stream.kind), stream.consumer_group,
            stream.batch_size, stream.polling_interval.count(), stream.codec,
            stream.claim_interval_ratio, stream.max_retries, stream.enabled ? "" : " (disabled)");
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"tracescore - online evaluation of LLM traces, spans and threads"};

    std::string config_path;
    std::string log_level;
    bool dry_run = false;
    bool validate_only = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--log-level", log_level,
                   "Log level (trace, debug, info, warn, error), overrides the config");
    app.add_flag("--dry-run", dry_run, "Keep scores and rule logs in memory instead of ClickHouse");
    app.add_flag("--validate-config", validate_only, "Validate the configuration and exit");

    CLI11_PARSE(app, argc, argv);

    tracescore::server::ServiceConfig config = tracescore::server::ServiceConfig::Default();
    if (!config_path.empty()) {
        auto config_or = tracescore::server::ServiceConfig::LoadWithEnv(config_path);
        if (!config_or.ok()) {
            std::cerr << "Invalid configuration: " << config_or.status().ToString() << std::endl;
            return 1;
        }
        config = *config_or;
    } else {
        auto config_or = tracescore::server::ServiceConfig::FromConfig(
            tracescore::Config::LoadFromEnvironment("TRACESCORE_"));
        if (!config_or.ok()) {
            std::cerr << "Invalid configuration: " << config_or.status().ToString() << std::endl;
            return 1;
        }
        config = *config_or;
    }
    if (!log_level.empty()) {
        config.logging.level = tracescore::ParseLogLevel(log_level);
    }

    tracescore::InitLogging(config.logging);
    LogSummary(config);

    if (validate_only) {
        TRACESCORE_LOG_INFO("Configuration is valid");
        tracescore::ShutdownLogging();
        return 0;
    }

    tracescore::server::ServiceOptions options;
    options.dry_run = dry_run;
    tracescore::server::Service service(std::move(config), options);
    g_service = &service;

    struct sigaction sa;
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    auto status = service.Start();
    if (!status.ok()) {
        TRACESCORE_LOG_ERROR("Failed to start: {}", status.ToString());
        g_service = nullptr;
        tracescore::ShutdownLogging();
        return 1;
    }

    TRACESCORE_LOG_INFO("tracescore is running. Press Ctrl+C to stop.");
    service.WaitForShutdown();

    status = service.Shutdown();
    g_service = nullptr;
    if (!status.ok()) {
        TRACESCORE_LOG_ERROR("Error during shutdown: {}", status.ToString());
    }
    tracescore::ShutdownLogging();
    return 0;
}
