/**
 * @file exceptions.hpp
 * @brief Custom exception classes for the DR Logger
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include <stdexcept>
#include <string>

namespace drLogger {

/**
 * @brief Base exception class for the DR Logger
 */
class DrLoggerException : public std::runtime_error {
public:
    explicit DrLoggerException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The named instrument server is not connected
 */
class SourceNotFoundException : public DrLoggerException {
public:
    explicit SourceNotFoundException(const std::string& server_name)
        : DrLoggerException("'" + server_name + "' server not found") {}
};

/**
 * @brief Device selection matched none of the server's devices
 */
class NoSuchDeviceException : public DrLoggerException {
public:
    explicit NoSuchDeviceException(const std::string& message)
        : DrLoggerException("No such device: " + message) {}
};

/**
 * @brief The instrument server has no device selected for our context
 */
class DeviceNotSelectedException : public DrLoggerException {
public:
    explicit DeviceNotSelectedException(const std::string& message)
        : DrLoggerException("Device not selected: " + message) {}
};

/**
 * @brief An instrument server returned an empty reading
 */
class NoDataException : public DrLoggerException {
public:
    explicit NoDataException(const std::string& message)
        : DrLoggerException(message) {}
};

/**
 * @brief Exception for RPC gateway errors reported by an instrument server
 */
class RpcException : public DrLoggerException {
public:
    explicit RpcException(const std::string& message)
        : DrLoggerException("RPC Error: " + message) {}

    RpcException(const std::string& error_type, const std::string& message)
        : DrLoggerException("RPC Error (" + error_type + "): " + message) {}
};

/**
 * @brief Exception for HTTP communication errors
 */
class HttpException : public DrLoggerException {
public:
    explicit HttpException(const std::string& message)
        : DrLoggerException("HTTP Error: " + message) {}

    HttpException(long response_code, const std::string& message)
        : DrLoggerException("HTTP Error (" + std::to_string(response_code) + "): " + message) {}
};

/**
 * @brief Exception for configuration errors
 */
class ConfigException : public DrLoggerException {
public:
    explicit ConfigException(const std::string& message)
        : DrLoggerException("Configuration Error: " + message) {}
};

/**
 * @brief Exception for data storage errors
 */
class StorageException : public DrLoggerException {
public:
    explicit StorageException(const std::string& message)
        : DrLoggerException("Storage Error: " + message) {}
};

/**
 * @brief The store no longer knows the dataset being written to
 */
class DatasetNotFoundException : public StorageException {
public:
    explicit DatasetNotFoundException(const std::string& message)
        : StorageException("No dataset: " + message) {}
};

/**
 * @brief A row does not match the dataset's declared columns
 */
class SchemaMismatchException : public StorageException {
public:
    SchemaMismatchException(size_t expected, size_t actual)
        : StorageException("Schema mismatch: dataset has " + std::to_string(expected) +
                           " columns, row has " + std::to_string(actual)) {}
};

/**
 * @brief Exception for scheduler misuse
 */
class SchedulerException : public DrLoggerException {
public:
    explicit SchedulerException(const std::string& message)
        : DrLoggerException("Scheduler Error: " + message) {}
};

class AlreadyRunningException : public SchedulerException {
public:
    AlreadyRunningException()
        : SchedulerException("already running") {}
};

/**
 * @brief Exception for session lifecycle errors
 */
class SessionException : public DrLoggerException {
public:
    explicit SessionException(const std::string& message)
        : DrLoggerException("Session Error: " + message) {}
};

/**
 * @brief Exception for unknown commands or setups
 */
class CommandException : public DrLoggerException {
public:
    explicit CommandException(const std::string& message)
        : DrLoggerException("Command Error: " + message) {}
};

/**
 * @brief Exception for validation errors
 */
class ValidationException : public DrLoggerException {
public:
    explicit ValidationException(const std::string& message)
        : DrLoggerException("Validation Error: " + message) {}
};

} // namespace drLogger
