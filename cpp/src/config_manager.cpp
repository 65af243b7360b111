/**
 * @file config_manager.cpp
 * @brief Implementation of configuration management
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "config_manager.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cmath>

namespace drLogger {

ConfigManager::ConfigManager(const std::string& config_file, const std::string& env_file) {
    // Load environment variables first (they override config file values)
    loadEnvironmentVariables(env_file);

    // Load JSON configuration
    loadJsonConfiguration(config_file);

    // Validate configuration
    validateConfiguration();

    LOG_INFO("Configuration loaded successfully ({} setups)", setup_configs_.size());
}

void ConfigManager::loadEnvironmentVariables(const std::string& env_file) {
    std::ifstream file(env_file);
    if (!file.is_open()) {
        LOG_DEBUG("Environment file '{}' not found, using defaults", env_file);
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Parse KEY=VALUE format
        size_t equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, equals_pos);
        std::string value = line.substr(equals_pos + 1);

        // Trim whitespace
        key.erase(key.find_last_not_of(" \t\r\n") + 1);
        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        env_vars_[key] = value;
    }

    LOG_DEBUG("Loaded {} environment variables from '{}'", env_vars_.size(), env_file);
}

void ConfigManager::loadJsonConfiguration(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        throw ConfigException("Cannot open configuration file: " + config_file);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException("Invalid JSON in configuration file: " + std::string(e.what()));
    }

    try {
        // Application info
        if (json.contains("application")) {
            const auto& app = json["application"];
            app_name_ = app.value("name", "DR Logger");
            app_version_ = app.value("version", "1.0.0");
        }

        // RPC gateway configuration
        if (json.contains("rpc")) {
            const auto& rpc = json["rpc"];
            rpc_config_.base_url = rpc.value("base_url", rpc_config_.base_url);
            rpc_config_.api_key = rpc.value("api_key", "");
            rpc_config_.rpc_endpoint = rpc.value("rpc_endpoint", "/rpc");
            rpc_config_.servers_endpoint = rpc.value("servers_endpoint", "/servers");
            rpc_config_.timeout = Duration(rpc.value("timeout_ms", 5000));
        }

        // Storage configuration
        if (json.contains("storage")) {
            storage_config_.database_path = json["storage"].value("database_path", "dr_logger.db");
        }

        // Command server configuration
        if (json.contains("command_server")) {
            const auto& cmd = json["command_server"];
            command_server_config_.enabled = cmd.value("enabled", true);
            command_server_config_.listen_url = cmd.value("listen_url", command_server_config_.listen_url);
        }

        // Logging configuration
        if (json.contains("logging")) {
            const auto& logging = json["logging"];
            logging_config_.console_level = log_level_from_string(logging.value("console_level", "INFO"));
            logging_config_.file_level = log_level_from_string(logging.value("file_level", "DEBUG"));
            logging_config_.log_file = logging.value("log_file", logging_config_.log_file);
            logging_config_.max_file_size_mb = logging.value("max_file_size_mb", 10);
            logging_config_.max_files = logging.value("max_files", 5);
            logging_config_.format = logging.value("format", logging_config_.format);
        }

        // DR setups
        parseSetupConfigs(json);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException("Invalid value in configuration file: " + std::string(e.what()));
    }

    // Override with environment variables
    if (env_vars_.count("RPC_BASE_URL")) {
        rpc_config_.base_url = env_vars_["RPC_BASE_URL"];
    }
    if (env_vars_.count("RPC_API_KEY")) {
        rpc_config_.api_key = env_vars_["RPC_API_KEY"];
    }
    if (env_vars_.count("DATABASE_PATH")) {
        storage_config_.database_path = env_vars_["DATABASE_PATH"];
    }
    if (env_vars_.count("COMMAND_LISTEN_URL")) {
        command_server_config_.listen_url = env_vars_["COMMAND_LISTEN_URL"];
    }
    if (env_vars_.count("LOG_LEVEL")) {
        logging_config_.console_level = log_level_from_string(env_vars_["LOG_LEVEL"]);
    }
    if (env_vars_.count("LOG_FILE")) {
        logging_config_.log_file = env_vars_["LOG_FILE"];
    }

    config_ = json;
}

void ConfigManager::parseSetupConfigs(const nlohmann::json& json) {
    if (!json.contains("setups") || !json["setups"].is_object()) {
        throw ConfigException("No DR setups found in config file");
    }

    for (const auto& [name, setup_json] : json["setups"].items()) {
        setup_configs_.push_back(parseSetup(name, setup_json));
    }

    LOG_DEBUG("Loaded {} setup configurations", setup_configs_.size());
}

SetupConfig ConfigManager::parseSetup(const std::string& name, const nlohmann::json& setup_json) const {
    SetupConfig setup;
    setup.name = name;
    setup.dataset_path = setup_json.value("dataset_path", std::vector<std::string>{"", "DR", name});
    setup.dataset_name = setup_json.value("dataset_name", name + " log - [t]");

    double interval_s = setup_json.value("time_interval_s", 1.0);
    if (!(interval_s > 0.0)) {
        throw ConfigException("Setup '" + name + "': time_interval_s must be positive");
    }
    setup.time_interval = Duration(static_cast<Duration::rep>(std::llround(interval_s * 1000.0)));

    if (!setup_json.contains("sources") || !setup_json["sources"].is_object()) {
        throw ConfigException("Setup '" + name + "' has no sources");
    }

    for (const auto& [label, source_json] : setup_json["sources"].items()) {
        WatcherConfig watcher;

        // Either {"server": ..., "node": ..., "options": ...} or [server, node, options]
        if (source_json.is_array()) {
            if (source_json.size() < 2) {
                throw ConfigException("Setup '" + name + "' source '" + label +
                                      "' needs at least (server, node)");
            }
            watcher.source_kind = source_json[0].get<std::string>();
            watcher.node = source_json[1].get<std::string>();
            if (source_json.size() > 2) {
                watcher.options = source_json[2];
            }
        } else {
            watcher.source_kind = source_json.value("server", "");
            watcher.node = source_json.value("node", "");
            watcher.options = source_json.value("options", nlohmann::json::object());
        }

        // Options may also be given as a list of (key, value) pairs
        if (watcher.options.is_array()) {
            nlohmann::json options = nlohmann::json::object();
            for (const auto& pair : watcher.options) {
                if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string()) {
                    throw ConfigException("Setup '" + name + "' source '" + label +
                                          "' has malformed options");
                }
                options[pair[0].get<std::string>()] = pair[1];
            }
            watcher.options = options;
        }

        setup.sources.emplace_back(label, watcher);
    }

    return setup;
}

const SetupConfig& ConfigManager::getSetupConfig(const std::string& name) const {
    auto it = std::find_if(setup_configs_.begin(), setup_configs_.end(),
                           [&name](const SetupConfig& s) { return s.name == name; });
    if (it == setup_configs_.end()) {
        throw ConfigException("Setup '" + name + "' not configured");
    }
    return *it;
}

bool ConfigManager::hasSetup(const std::string& name) const {
    return std::any_of(setup_configs_.begin(), setup_configs_.end(),
                       [&name](const SetupConfig& s) { return s.name == name; });
}

void ConfigManager::setSetupConfig(const SetupConfig& setup) {
    auto it = std::find_if(setup_configs_.begin(), setup_configs_.end(),
                           [&setup](const SetupConfig& s) { return s.name == setup.name; });
    if (it != setup_configs_.end()) {
        *it = setup;
    } else {
        setup_configs_.push_back(setup);
    }
    LOG_DEBUG("Setup '{}' configuration updated", setup.name);
}

void ConfigManager::saveConfiguration(const std::string& config_file) const {
    nlohmann::json json;

    // Application info
    json["application"]["name"] = app_name_;
    json["application"]["version"] = app_version_;

    // RPC config
    json["rpc"]["base_url"] = rpc_config_.base_url;
    json["rpc"]["rpc_endpoint"] = rpc_config_.rpc_endpoint;
    json["rpc"]["servers_endpoint"] = rpc_config_.servers_endpoint;
    json["rpc"]["timeout_ms"] = rpc_config_.timeout.count();

    // Storage config
    json["storage"]["database_path"] = storage_config_.database_path;

    // Command server config
    json["command_server"]["enabled"] = command_server_config_.enabled;
    json["command_server"]["listen_url"] = command_server_config_.listen_url;

    // Logging config
    json["logging"]["console_level"] = to_string(logging_config_.console_level);
    json["logging"]["file_level"] = to_string(logging_config_.file_level);
    json["logging"]["log_file"] = logging_config_.log_file;
    json["logging"]["max_file_size_mb"] = logging_config_.max_file_size_mb;
    json["logging"]["max_files"] = logging_config_.max_files;
    json["logging"]["format"] = logging_config_.format;

    // Setups
    json["setups"] = nlohmann::json::object();
    for (const auto& setup : setup_configs_) {
        auto& setup_json = json["setups"][setup.name];
        setup_json["dataset_path"] = setup.dataset_path;
        setup_json["dataset_name"] = setup.dataset_name;
        setup_json["time_interval_s"] = setup.time_interval.count() / 1000.0;
        setup_json["sources"] = nlohmann::json::object();
        for (const auto& [label, watcher] : setup.sources) {
            auto& source_json = setup_json["sources"][label];
            source_json["server"] = watcher.source_kind;
            source_json["node"] = watcher.node;
            source_json["options"] = watcher.options;
        }
    }

    std::ofstream file(config_file);
    if (!file.is_open()) {
        throw ConfigException("Cannot write configuration file: " + config_file);
    }

    file << json.dump(2);
    LOG_INFO("Configuration saved to '{}'", config_file);
}

void ConfigManager::validateConfiguration() const {
    if (rpc_config_.base_url.empty()) {
        throw ConfigException("RPC base URL is required (set RPC_BASE_URL)");
    }

    if (rpc_config_.timeout.count() < 100) {
        throw ConfigException("RPC timeout must be at least 100ms");
    }

    for (const auto& setup : setup_configs_) {
        if (setup.time_interval.count() <= 0) {
            throw ConfigException("Setup '" + setup.name + "': time interval must be positive");
        }
        if (setup.sources.empty()) {
            throw ConfigException("Setup '" + setup.name + "' has no sources");
        }
        for (const auto& [label, watcher] : setup.sources) {
            if (watcher.source_kind.empty() || watcher.node.empty()) {
                throw ConfigException("Setup '" + setup.name + "' source '" + label +
                                      "' needs both server and node");
            }
            if (!watcher.options.is_object()) {
                throw ConfigException("Setup '" + setup.name + "' source '" + label +
                                      "' options must be an object");
            }
        }
    }

    LOG_DEBUG("Configuration validation passed");
}

const nlohmann::json* ConfigManager::findJsonValue(const std::string& key) const {
    const nlohmann::json* node = &config_;
    std::stringstream path(key);
    std::string section;

    while (std::getline(path, section, '.')) {
        if (!node->is_object() || !node->contains(section)) {
            return nullptr;
        }
        node = &(*node)[section];
    }

    return node;
}

std::string ConfigManager::getString(const std::string& key, const std::string& default_value) const {
    // First check environment variables
    auto env_it = env_vars_.find(key);
    if (env_it != env_vars_.end()) {
        return env_it->second;
    }

    // Then check JSON config using dot notation
    const nlohmann::json* value = findJsonValue(key);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }

    return default_value;
}

bool ConfigManager::getBool(const std::string& key, bool default_value) const {
    auto env_it = env_vars_.find(key);
    if (env_it != env_vars_.end()) {
        std::string value = env_it->second;
        std::transform(value.begin(), value.end(), value.begin(), ::tolower);
        if (value == "true" || value == "1" || value == "yes" || value == "on") {
            return true;
        }
        if (value == "false" || value == "0" || value == "no" || value == "off") {
            return false;
        }
    }

    const nlohmann::json* value = findJsonValue(key);
    if (value && value->is_boolean()) {
        return value->get<bool>();
    }

    return default_value;
}

double ConfigManager::getDouble(const std::string& key, double default_value) const {
    auto env_it = env_vars_.find(key);
    if (env_it != env_vars_.end()) {
        try {
            return std::stod(env_it->second);
        } catch (const std::exception&) {
            LOG_WARN("Environment value '{}' for {} is not a number", env_it->second, key);
        }
    }

    const nlohmann::json* value = findJsonValue(key);
    if (value && value->is_number()) {
        return value->get<double>();
    }

    return default_value;
}

} // namespace drLogger
