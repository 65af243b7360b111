/**
 * @file config_manager.hpp
 * @brief Configuration management for the DR Logger
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace drLogger {

/**
 * @brief Manages application configuration from environment files and JSON files
 *
 * The "setups" section doubles as the device registry: one entry per DR,
 * each mapping a measurement label to the instrument server that provides it.
 */
class ConfigManager {
public:
    /**
     * @brief Constructor - loads configuration from files
     * @param config_file Path to JSON configuration file
     * @param env_file Path to environment file (.env)
     * @throws ConfigException if the file is missing, malformed or invalid
     */
    ConfigManager(const std::string& config_file = "config.json",
                  const std::string& env_file = ".env");

    /**
     * @brief Get RPC gateway configuration
     */
    const RpcConfig& getRpcConfig() const { return rpc_config_; }

    /**
     * @brief Get storage configuration
     */
    const StorageConfig& getStorageConfig() const { return storage_config_; }

    /**
     * @brief Get command server configuration
     */
    const CommandServerConfig& getCommandServerConfig() const { return command_server_config_; }

    /**
     * @brief Get logging configuration
     */
    const LoggingConfig& getLoggingConfig() const { return logging_config_; }

    /**
     * @brief Get all DR setups, in registry order
     */
    const std::vector<SetupConfig>& getSetupConfigs() const { return setup_configs_; }

    /**
     * @brief Get a setup by name
     * @throws ConfigException if the setup is not configured
     */
    const SetupConfig& getSetupConfig(const std::string& name) const;

    bool hasSetup(const std::string& name) const;

    /**
     * @brief Get application information
     */
    const std::string& getAppName() const { return app_name_; }
    const std::string& getAppVersion() const { return app_version_; }

    /**
     * @brief Save current configuration to file
     * @param config_file Path to save configuration
     */
    void saveConfiguration(const std::string& config_file) const;

    /**
     * @brief Add or replace a setup
     */
    void setSetupConfig(const SetupConfig& setup);

    /**
     * @brief Validate configuration consistency
     * @throws ConfigException if configuration is invalid
     */
    void validateConfiguration() const;

    /**
     * @brief Look up a value by environment key or dotted JSON path (e.g. "rpc.base_url")
     */
    std::string getString(const std::string& key, const std::string& default_value = "") const;
    bool getBool(const std::string& key, bool default_value = false) const;
    double getDouble(const std::string& key, double default_value = 0.0) const;

private:
    void loadEnvironmentVariables(const std::string& env_file);
    void loadJsonConfiguration(const std::string& config_file);
    void parseSetupConfigs(const nlohmann::json& json);
    SetupConfig parseSetup(const std::string& name, const nlohmann::json& setup_json) const;
    const nlohmann::json* findJsonValue(const std::string& key) const;

    // Configuration sections
    RpcConfig rpc_config_;
    StorageConfig storage_config_;
    CommandServerConfig command_server_config_;
    LoggingConfig logging_config_;

    // Registry of DR setups
    std::vector<SetupConfig> setup_configs_;

    // Application information
    std::string app_name_ = "DR Logger";
    std::string app_version_ = "1.0.0";

    // Environment variables
    std::map<std::string, std::string> env_vars_;

    // Full JSON configuration for dotted-path queries
    nlohmann::json config_;
};

} // namespace drLogger
