#include "logging.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

#include "config.h"

namespace tracescore {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::once_flag g_init_flag;

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}  // namespace

void InitLogging(const LogConfig& config) {
    std::call_once(g_init_flag, [&config]() {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(ToSpdlog(config.level));
        sinks.push_back(console_sink);

        if (config.enable_file) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files);
            file_sink->set_level(ToSpdlog(config.level));
            sinks.push_back(file_sink);
        }

        g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        g_logger->set_level(ToSpdlog(config.level));
        g_logger->set_pattern(config.pattern);
        g_logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(g_logger);
    });
}

LogConfig LogConfigFromConfig(const Config& config) {
    LogConfig log;
    log.level = ParseLogLevel(config.GetString("logging.level", "info"));
    log.pattern = config.GetString("logging.pattern", log.pattern);
    log.enable_file = config.GetBool("logging.file.enabled", false);
    log.file_path = config.GetString("logging.file.path", log.file_path);
    log.max_file_size =
        static_cast<size_t>(config.GetInt("logging.file.max_size_mb", 10)) * 1024 * 1024;
    log.max_files = static_cast<size_t>(config.GetInt("logging.file.max_files", 5));
    return log;
}

std::shared_ptr<spdlog::logger> GetLogger() {
    if (!g_logger) {
        InitLogging();
    }
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    if (!g_logger) {
        return;
    }
    g_logger->set_level(ToSpdlog(level));
    for (auto& sink : g_logger->sinks()) {
        sink->set_level(ToSpdlog(level));
    }
}

LogLevel ParseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::kTrace;
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    if (lowered == "critical") return LogLevel::kCritical;
    if (lowered == "off") return LogLevel::kOff;
    return LogLevel::kInfo;
}

void FlushLogs() {
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace tracescore
