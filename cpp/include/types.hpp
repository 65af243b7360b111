/**
 * @file types.hpp
 * @brief Common type definitions for the DR Logger
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <map>
#include <nlohmann/json.hpp>

namespace drLogger {

// Type aliases for clarity
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using RpcContext = uint32_t;
using Row = std::vector<double>;

// Log levels
#ifdef ERROR
#undef ERROR  // Undefine Windows ERROR macro if present
#endif
enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief A magnitude together with the unit it is expressed in
 */
struct Quantity {
    double value = 0.0;
    std::string unit;

    Quantity() = default;

    Quantity(double v, const std::string& u)
        : value(v), unit(u) {}
};

using Reading = std::vector<Quantity>;

/**
 * @brief One dependent or independent variable of a dataset
 */
struct VariableDescriptor {
    std::string label;
    std::string category;
    std::string unit;

    VariableDescriptor() = default;

    VariableDescriptor(const std::string& l, const std::string& c, const std::string& u)
        : label(l), category(c), unit(u) {}

    /**
     * @brief Render as "label (category) [unit]"; the category part is omitted when empty
     */
    std::string toString() const {
        std::string result = label;
        if (!category.empty()) {
            result += " (" + category + ")";
        }
        result += " [" + unit + "]";
        return result;
    }

    bool operator==(const VariableDescriptor& other) const {
        return label == other.label && category == other.category && unit == other.unit;
    }
};

/**
 * @brief Failure recorded by a session cycle
 */
struct ErrorRecord {
    std::string source;
    std::string message;

    ErrorRecord() = default;

    ErrorRecord(const std::string& s, const std::string& m)
        : source(s), message(m) {}

    bool operator==(const ErrorRecord& other) const {
        return source == other.source && message == other.message;
    }
};

/**
 * @brief Configuration of one watched instrument server
 */
struct WatcherConfig {
    std::string source_kind;   // instrument server name, e.g. "lakeshore_diodes"
    std::string node;
    nlohmann::json options = nlohmann::json::object();

    WatcherConfig() = default;

    WatcherConfig(const std::string& kind, const std::string& n,
                  const nlohmann::json& opts = nlohmann::json::object())
        : source_kind(kind), node(n), options(opts) {}
};

/**
 * @brief One DR setup as declared in the registry
 */
struct SetupConfig {
    std::string name;
    std::vector<std::string> dataset_path;
    std::string dataset_name;
    Duration time_interval = Duration(1000);
    std::vector<std::pair<std::string, WatcherConfig>> sources;
};

/**
 * @brief Handle to a dataset created in the store
 */
struct DatasetHandle {
    int64_t id = 0;
    std::vector<std::string> path;
    std::string name;
    std::vector<VariableDescriptor> independents;
    std::vector<VariableDescriptor> dependents;
    std::string day_marker;
    TimePoint created_at;

    size_t columnCount() const { return independents.size() + dependents.size(); }
};

// Statistics structures
struct SessionStatistics {
    uint64_t total_cycles = 0;
    uint64_t successful_cycles = 0;
    uint64_t failed_cycles = 0;
    uint64_t rows_written = 0;
    uint64_t datasets_created = 0;
    TimePoint last_cycle_time;

    double success_rate() const {
        return total_cycles > 0 ? static_cast<double>(successful_cycles) / total_cycles : 0.0;
    }
};

// Configuration structures
struct RpcConfig {
    std::string base_url = "http://localhost:7682";
    std::string api_key;
    std::string rpc_endpoint = "/rpc";
    std::string servers_endpoint = "/servers";
    Duration timeout = Duration(5000);
};

struct StorageConfig {
    std::string database_path = "dr_logger.db";
};

struct CommandServerConfig {
    bool enabled = true;
    std::string listen_url = "http://0.0.0.0:8881";
};

struct LoggingConfig {
    LogLevel console_level = LogLevel::INFO;
    LogLevel file_level = LogLevel::DEBUG;
    std::string log_file = "dr_logger.log";
    uint32_t max_file_size_mb = 10;
    uint32_t max_files = 5;
    std::string format = "[%Y-%m-%d %H:%M:%S] [%n] [%l] %v";
};

// Smart pointer aliases
template<typename T>
using UniquePtr = std::unique_ptr<T>;

template<typename T>
using SharedPtr = std::shared_ptr<T>;

// Helper functions

/**
 * @brief Drop the units of a reading, keeping each entry's own magnitude
 */
inline Row stripUnits(const Reading& reading) {
    Row row;
    row.reserve(reading.size());
    for (const auto& quantity : reading) {
        row.push_back(quantity.value);
    }
    return row;
}

/**
 * @brief Parse "label (category) [unit]" back into a descriptor
 */
inline VariableDescriptor parseVariable(const std::string& text) {
    VariableDescriptor var;
    std::string rest = text;

    size_t unit_open = rest.rfind('[');
    if (unit_open != std::string::npos && rest.back() == ']') {
        var.unit = rest.substr(unit_open + 1, rest.size() - unit_open - 2);
        rest = rest.substr(0, unit_open);
    }
    rest.erase(rest.find_last_not_of(' ') + 1);

    size_t cat_open = rest.rfind('(');
    if (cat_open != std::string::npos && !rest.empty() && rest.back() == ')') {
        var.category = rest.substr(cat_open + 1, rest.size() - cat_open - 2);
        rest = rest.substr(0, cat_open);
        rest.erase(rest.find_last_not_of(' ') + 1);
    }

    var.label = rest;
    return var;
}

inline std::string joinPath(const std::vector<std::string>& path) {
    std::string result;
    for (const auto& part : path) {
        if (part.empty()) {
            continue;
        }
        result += "/" + part;
    }
    return result.empty() ? "/" : result;
}

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

inline LogLevel log_level_from_string(const std::string& str) {
    if (str == "TRACE") return LogLevel::TRACE;
    if (str == "DEBUG") return LogLevel::DEBUG;
    if (str == "INFO") return LogLevel::INFO;
    if (str == "WARN") return LogLevel::WARN;
    if (str == "ERROR") return LogLevel::ERROR;
    if (str == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

} // namespace drLogger
