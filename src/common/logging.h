#pragma once

/// @file logging.h
/// @brief TraceLens logging utilities wrapping spdlog

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace tracelens {

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
///
/// Console output goes to stderr; stdout is reserved for compiled queries.
struct LogConfig {
    std::string name = "tracelens";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "tracelens.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 3;
};

/// @brief Initialize the global logger with the given configuration
/// @param config Logging configuration
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
/// @return Shared pointer to the logger
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
void SetLogLevel(LogLevel level);

/// @brief Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
/// @return std::nullopt for unrecognised names
std::optional<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define TRACELENS_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::tracelens::GetLogger(), __VA_ARGS__)
#define TRACELENS_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::tracelens::GetLogger(), __VA_ARGS__)
#define TRACELENS_LOG_INFO(...) SPDLOG_LOGGER_INFO(::tracelens::GetLogger(), __VA_ARGS__)
#define TRACELENS_LOG_WARN(...) SPDLOG_LOGGER_WARN(::tracelens::GetLogger(), __VA_ARGS__)
#define TRACELENS_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::tracelens::GetLogger(), __VA_ARGS__)
#define TRACELENS_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::tracelens::GetLogger(), __VA_ARGS__)

}  // namespace tracelens
