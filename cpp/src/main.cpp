/**
 * @file main.cpp
 * @brief Main application entry point for the DR Logger
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "config_manager.hpp"
#include "logger.hpp"
#include "rpc_connection.hpp"
#include "dataset_store.hpp"
#include "watcher_registry.hpp"
#include "setup_manager.hpp"
#include "command_handler.hpp"
#include "command_server.hpp"
#include "exceptions.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>

// Set by the signal handler, polled by the main loop
static std::atomic<bool> g_shutdown_requested{false};

/**
 * @brief Signal handler for graceful shutdown
 */
void signalHandler(int) {
    g_shutdown_requested = true;
}

namespace drLogger {

/**
 * @brief Print application banner
 */
void printBanner(const ConfigManager& config) {
    std::cout << "\n";
    std::cout << "+==============================================================+\n";
    std::cout << "|                          DR Logger                           |\n";
    std::cout << "|        Dilution refrigerator temperature/pressure log        |\n";
    std::cout << "|                                                              |\n";
    std::cout << "|  Version: " << std::left << std::setw(50) << config.getAppVersion() << " |\n";
    std::cout << "+==============================================================+\n";
    std::cout << "\n";
}

/**
 * @brief Print the status of every running session
 */
void printSystemStatus(const SetupManager& setups) {
    for (const auto& name : setups.listSetups()) {
        auto session = setups.getSession(name);
        if (!session) {
            continue;
        }

        auto stats = session->getStatistics();
        auto errors = session->getErrors();

        std::cout << "\n+- " << std::left << std::setw(59) << (name + " ") << "+\n";
        std::cout << "| State: " << std::left << std::setw(53) << to_string(session->getState()) << "|\n";
        std::cout << "| Cycles: " << std::left << std::setw(52) << stats.total_cycles << "|\n";
        std::cout << "| Success Rate: " << std::left << std::setw(46) << (stats.success_rate() * 100) << "%|\n";
        std::cout << "| Rows Written: " << std::left << std::setw(46) << stats.rows_written << "|\n";
        std::cout << "| Datasets Created: " << std::left << std::setw(42) << stats.datasets_created << "|\n";
        for (const auto& error : errors) {
            std::string line = "| ! " + error.source + ": " + error.message;
            std::cout << std::left << std::setw(62) << line.substr(0, 62) << "|\n";
        }
        std::cout << "+--------------------------------------------------------------+\n";
    }
}

} // namespace drLogger

/**
 * @brief Main application entry point
 */
int main(int argc, char* argv[]) {
    using namespace drLogger;

    try {
        // Parse command line arguments
        std::string config_file = "config.json";
        std::string env_file = ".env";
        int status_interval_seconds = 30;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_file = argv[++i];
            } else if (arg == "--env" && i + 1 < argc) {
                env_file = argv[++i];
            } else if (arg == "--status-interval" && i + 1 < argc) {
                status_interval_seconds = std::stoi(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [options]\n";
                std::cout << "Options:\n";
                std::cout << "  --config <file>            Configuration file (default: config.json)\n";
                std::cout << "  --env <file>               Environment file (default: .env)\n";
                std::cout << "  --status-interval <secs>   Status print interval, 0 disables (default: 30)\n";
                std::cout << "  --help, -h                 Show this help message\n";
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return 1;
            }
        }

        // Load configuration
        ConfigManager config(config_file, env_file);

        // Initialize logging
        Logger::initialize(config.getLoggingConfig());

        printBanner(config);

        LOG_INFO("Starting {} v{}", config.getAppName(), config.getAppVersion());
        LOG_INFO("Configuration loaded from: {}", config_file);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        auto directory = std::make_shared<HttpServerDirectory>(config.getRpcConfig());
        auto store = std::make_shared<SQLiteDatasetStore>(config.getStorageConfig().database_path);

        SetupManager setups(directory, store, WatcherRegistry::withDefaultWatchers());
        size_t started = setups.discover(config.getSetupConfigs());
        if (started == 0) {
            LOG_WARN("No DR setup could be started; waiting for commands only");
        }

        CommandHandler handler(setups);
        CommandServer server(config.getCommandServerConfig(), handler);
        if (config.getCommandServerConfig().enabled) {
            server.start();
        }

        std::cout << "[*] DR Logger is running with " << started << " setups\n";
        std::cout << "   Press Ctrl+C to stop\n\n";

        auto last_status_time = std::chrono::steady_clock::now();
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            auto now = std::chrono::steady_clock::now();
            if (status_interval_seconds > 0 &&
                now - last_status_time >= std::chrono::seconds(status_interval_seconds)) {
                printSystemStatus(setups);
                last_status_time = now;
            }
        }

        LOG_INFO("Shutdown requested, stopping...");
        server.stop();
        setups.shutdownAll();

        LOG_INFO("DR Logger stopped");
        Logger::shutdown();
        return 0;

    } catch (const ConfigException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const DrLoggerException& e) {
        LOG_CRITICAL("Fatal error: {}", e.what());
        Logger::shutdown();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
