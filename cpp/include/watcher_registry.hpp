/**
 * @file watcher_registry.hpp
 * @brief Maps instrument server kinds to watcher constructors
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include "watcher.hpp"
#include "rpc_connection.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace drLogger {

/**
 * @brief Kinds of instrument server the logger knows how to watch
 */
enum class SourceKind {
    GAUGE_SET,
    GAUGE_SET_TEST_HACK,
    DIODE_ARRAY,
    RUOX_ARRAY
};

std::string to_string(SourceKind kind);

/**
 * @brief Map an instrument server name to its kind; empty if unknown
 */
std::optional<SourceKind> sourceKindFromString(const std::string& server_name);

/**
 * @brief Registry of watcher factories, built once at startup
 */
class WatcherRegistry {
public:
    using Factory = std::function<UniquePtr<Watcher>(const WatcherConfig&,
                                                     SharedPtr<ServerDirectory>,
                                                     RpcContext)>;

    /**
     * @brief Registry with a factory for every SourceKind
     */
    static WatcherRegistry withDefaultWatchers();

    void registerFactory(SourceKind kind, Factory factory);

    /**
     * @brief Whether a watcher can be built for the given server name
     */
    bool canCreate(const std::string& server_name) const;

    /**
     * @brief Build the watcher for a configured source
     * @throws ConfigException if the source kind is unknown or unregistered
     */
    UniquePtr<Watcher> create(const WatcherConfig& config,
                              SharedPtr<ServerDirectory> directory,
                              RpcContext context) const;

    size_t size() const { return factories_.size(); }

private:
    std::map<SourceKind, Factory> factories_;
};

} // namespace drLogger
