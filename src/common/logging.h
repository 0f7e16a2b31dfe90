#pragma once

/// @file logging.h
/// @brief Process logging for tracescore, wrapping spdlog
///
/// This is the operator-facing log. Messages meant for rule owners go to the
/// user log sink (see sinks/user_log_sink.h).

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tracescore {

class Config;

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "tracescore";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // Rotating file output, off by default
    bool enable_file = false;
    std::string file_path = "tracescore.log";
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
};

/// @brief Read the logging section: logging.level, logging.pattern and
/// logging.file.{enabled, path, max_size_mb, max_files}
LogConfig LogConfigFromConfig(const Config& config);

/// @brief Initialize the process logger. Only the first call has an effect.
void InitLogging(const LogConfig& config = {});

/// @brief Get the process logger, initializing it with defaults if needed
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Change the level of an initialized logger
void SetLogLevel(LogLevel level);

/// @brief Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
/// @return kInfo for anything unrecognised
LogLevel ParseLogLevel(std::string_view name);

void FlushLogs();

void ShutdownLogging();

#define TRACESCORE_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::tracescore::GetLogger(), __VA_ARGS__)
#define TRACESCORE_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::tracescore::GetLogger(), __VA_ARGS__)
#define TRACESCORE_LOG_INFO(...) SPDLOG_LOGGER_INFO(::tracescore::GetLogger(), __VA_ARGS__)
#define TRACESCORE_LOG_WARN(...) SPDLOG_LOGGER_WARN(::tracescore::GetLogger(), __VA_ARGS__)
#define TRACESCORE_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::tracescore::GetLogger(), __VA_ARGS__)
#define TRACESCORE_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::tracescore::GetLogger(), __VA_ARGS__)

}  // namespace tracescore
