/**
 * @file logger.cpp
 * @brief spdlog setup and per-setup loggers
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "logger.hpp"
#include <iostream>

namespace drLogger {

std::shared_ptr<spdlog::logger> Logger::root_;
bool Logger::initialized_ = false;
std::recursive_mutex Logger::mutex_;

std::vector<spdlog::sink_ptr> Logger::makeSinks(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(toSpdlogLevel(config.console_level));
    sinks.push_back(console);

    if (!config.log_file.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file,
            static_cast<size_t>(config.max_file_size_mb) * 1024 * 1024,
            config.max_files);
        file->set_level(toSpdlogLevel(config.file_level));
        sinks.push_back(file);
    }

    return sinks;
}

void Logger::initialize(const LoggingConfig& config) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (initialized_) {
        return;
    }

    try {
        auto sinks = makeSinks(config);

        root_ = std::make_shared<spdlog::logger>(kRootName, sinks.begin(), sinks.end());
        root_->set_level(spdlog::level::trace); // sinks filter
        root_->set_pattern(config.format);
        root_->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(root_);

        initialized_ = true;

        LOG_INFO("Logging to console ({}){}", to_string(config.console_level),
                 config.log_file.empty() ? std::string()
                                         : " and " + config.log_file + " (" + to_string(config.file_level) + ")");
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        throw;
    }
}

std::shared_ptr<spdlog::logger> Logger::get(const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!initialized_) {
        initialize(LoggingConfig());
    }

    if (name.empty() || name == kRootName) {
        return root_;
    }

    auto named = spdlog::get(name);
    if (!named) {
        named = root_->clone(name);
        spdlog::register_logger(named);
    }
    return named;
}

std::shared_ptr<spdlog::logger> Logger::forSetup(const std::string& setup_name) {
    return get("session." + setup_name);
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!root_) {
        return;
    }
    // Named loggers are clones and keep their own level
    spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& logger) {
        logger->set_level(toSpdlogLevel(level));
    });
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (root_) {
        spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
    }
}

void Logger::shutdown() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!initialized_) {
        return;
    }
    LOG_INFO("Shutting down logging");
    flush();
    spdlog::shutdown();
    root_.reset();
    initialized_ = false;
}

bool Logger::isInitialized() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return initialized_;
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default: return spdlog::level::info;
    }
}

} // namespace drLogger
