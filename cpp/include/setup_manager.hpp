/**
 * @file setup_manager.hpp
 * @brief Discovery and ownership of the DR setup sessions
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include "dr_session.hpp"
#include "watcher_registry.hpp"
#include "rpc_connection.hpp"
#include "dataset_store.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace drLogger {

/**
 * @brief Creates one session per usable setup and keeps them by name
 */
class SetupManager {
public:
    /**
     * @brief Constructor
     * @param directory Server directory shared by all sessions
     * @param store Dataset store shared by all sessions
     * @param registry Watcher factories
     * @param clock Clock handed to every session; system clock if empty
     */
    SetupManager(SharedPtr<ServerDirectory> directory,
                 SharedPtr<DatasetStore> store,
                 WatcherRegistry registry,
                 DrSession::Clock clock = DrSession::Clock());

    ~SetupManager();

    SetupManager(const SetupManager&) = delete;
    SetupManager& operator=(const SetupManager&) = delete;

    /**
     * @brief Add every usable setup; unusable ones are skipped with a warning
     * @param start_logging Start logging in each created session
     * @return Number of sessions created
     */
    size_t discover(const std::vector<SetupConfig>& setups, bool start_logging = true);

    /**
     * @brief Add one setup
     * @return False if the setup was skipped
     * @throws ConfigException if a session with the same name already exists
     */
    bool addSetup(const SetupConfig& setup, bool start_logging = true);

    /**
     * @brief Why a setup cannot be instantiated right now; empty if it can
     */
    std::optional<std::string> checkSetup(const SetupConfig& setup);

    /**
     * @brief Session by setup name; null if unknown
     */
    SharedPtr<DrSession> getSession(const std::string& name) const;

    std::vector<std::string> listSetups() const;

    size_t size() const;

    /**
     * @brief Shut down and forget all sessions
     */
    void shutdownAll();

private:
    SharedPtr<ServerDirectory> directory_;
    SharedPtr<DatasetStore> store_;
    WatcherRegistry registry_;
    DrSession::Clock clock_;

    std::map<std::string, SharedPtr<DrSession>> sessions_;
    mutable std::mutex mutex_;
};

} // namespace drLogger
