/**
 * @file setup_manager.cpp
 * @brief Implementation of setup discovery
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "setup_manager.hpp"
#include "logger.hpp"
#include <set>

namespace drLogger {

SetupManager::SetupManager(SharedPtr<ServerDirectory> directory,
                           SharedPtr<DatasetStore> store,
                           WatcherRegistry registry,
                           DrSession::Clock clock)
    : directory_(std::move(directory)),
      store_(std::move(store)),
      registry_(std::move(registry)),
      clock_(std::move(clock)) {

    if (!directory_ || !store_) {
        throw ValidationException("setup manager needs a server directory and a dataset store");
    }
}

SetupManager::~SetupManager() {
    shutdownAll();
}

size_t SetupManager::discover(const std::vector<SetupConfig>& setups, bool start_logging) {
    size_t created = 0;

    for (const auto& setup : setups) {
        try {
            if (addSetup(setup, start_logging)) {
                created++;
            }
        } catch (const DrLoggerException& e) {
            LOG_ERROR("Failed to create session for setup '{}': {}", setup.name, e.what());
        }
    }

    LOG_INFO("Discovered {} of {} configured setups", created, setups.size());
    return created;
}

bool SetupManager::addSetup(const SetupConfig& setup, bool start_logging) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.count(setup.name) > 0) {
            throw ConfigException("Setup '" + setup.name + "' is already running");
        }
    }

    auto problem = checkSetup(setup);
    if (problem) {
        LOG_WARN("Skipping setup '{}': {}", setup.name, *problem);
        return false;
    }

    LOG_INFO("Creating DR logger for {}", setup.name);

    // One context per session so device selection is not shared between setups
    RpcContext context = directory_->newContext();

    std::vector<UniquePtr<Watcher>> watchers;
    for (const auto& entry : setup.sources) {
        watchers.push_back(registry_.create(entry.second, directory_, context));
        LOG_DEBUG("{}: '{}' watched through {}", setup.name, entry.first, entry.second.source_kind);
    }

    auto session = std::make_shared<DrSession>(setup, std::move(watchers), store_, clock_);
    if (start_logging) {
        session->logging(true);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[setup.name] = session;
    return true;
}

std::optional<std::string> SetupManager::checkSetup(const SetupConfig& setup) {
    for (const auto& entry : setup.sources) {
        if (!registry_.canCreate(entry.second.source_kind)) {
            return "no watcher for server '" + entry.second.source_kind + "' (" + entry.first + ")";
        }
    }

    std::set<std::string> missing_nodes;
    try {
        for (const auto& entry : setup.sources) {
            if (!directory_->isNodeRunning(entry.second.node)) {
                missing_nodes.insert(entry.second.node);
            }
        }
    } catch (const DrLoggerException& e) {
        return std::string("cannot list servers: ") + e.what();
    }

    if (!missing_nodes.empty()) {
        std::string nodes;
        for (const auto& node : missing_nodes) {
            nodes += (nodes.empty() ? "" : ", ") + node;
        }
        return "missing nodes " + nodes;
    }

    return std::nullopt;
}

SharedPtr<DrSession> SetupManager::getSession(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(name);
    return it != sessions_.end() ? it->second : nullptr;
}

std::vector<std::string> SetupManager::listSetups() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : sessions_) {
        names.push_back(entry.first);
    }
    return names;
}

size_t SetupManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SetupManager::shutdownAll() {
    std::map<std::string, SharedPtr<DrSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }

    for (auto& entry : sessions) {
        try {
            entry.second->shutdown();
        } catch (const std::exception& e) {
            LOG_ERROR("Error shutting down session '{}': {}", entry.first, e.what());
        }
    }

    if (!sessions.empty()) {
        LOG_INFO("Shut down {} sessions", sessions.size());
    }
}

} // namespace drLogger
