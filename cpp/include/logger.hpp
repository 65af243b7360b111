/**
 * @file logger.hpp
 * @brief spdlog setup and per-setup loggers
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

// Prevent Windows macro conflicts
#ifdef ERROR
#undef ERROR
#endif

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace drLogger {

/**
 * @brief Process-wide logging built on spdlog
 *
 * One root logger ("drLogger") writes to a colored console sink and, when a
 * log file is configured, a rotating file sink. Every DR setup gets its own
 * logger sharing those sinks so lines can be told apart by setup.
 */
class Logger {
public:
    static constexpr const char* kRootName = "drLogger";

    /**
     * @brief Build the sinks and register the root logger
     *
     * Calling it again after initialization is a no-op. An empty
     * config.log_file keeps logging on the console only.
     */
    static void initialize(const LoggingConfig& config);

    /**
     * @brief Root logger, or a named logger sharing its sinks
     *
     * Lazily initializes with default settings when nothing was configured.
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& name = kRootName);

    /**
     * @brief Logger of one DR setup, registered as "session.<setup>"
     */
    static std::shared_ptr<spdlog::logger> forSetup(const std::string& setup_name);

    static void setLevel(LogLevel level);
    static void flush();
    static void shutdown();

    static bool isInitialized();

private:
    static std::shared_ptr<spdlog::logger> root_;
    static bool initialized_;
    static std::recursive_mutex mutex_;

    static std::vector<spdlog::sink_ptr> makeSinks(const LoggingConfig& config);
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level);
};

#define LOG_TRACE(...) drLogger::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) drLogger::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...) drLogger::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...) drLogger::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) drLogger::Logger::get()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) drLogger::Logger::get()->critical(__VA_ARGS__)

} // namespace drLogger
