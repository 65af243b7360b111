/**
 * @file watcher_registry.cpp
 * @brief Implementation of the watcher registry
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "watcher_registry.hpp"
#include "logger.hpp"

namespace drLogger {

std::string to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::GAUGE_SET: return "mks_gauge_server";
        case SourceKind::GAUGE_SET_TEST_HACK: return "mks_gauge_server_testhack";
        case SourceKind::DIODE_ARRAY: return "lakeshore_diodes";
        case SourceKind::RUOX_ARRAY: return "lakeshore_ruox";
        default: return "unknown";
    }
}

std::optional<SourceKind> sourceKindFromString(const std::string& server_name) {
    if (server_name == "mks_gauge_server") return SourceKind::GAUGE_SET;
    if (server_name == "mks_gauge_server_testhack") return SourceKind::GAUGE_SET_TEST_HACK;
    if (server_name == "lakeshore_diodes") return SourceKind::DIODE_ARRAY;
    if (server_name == "lakeshore_ruox") return SourceKind::RUOX_ARRAY;
    return std::nullopt;
}

namespace {

template<typename T>
WatcherRegistry::Factory makeFactory() {
    return [](const WatcherConfig& config, SharedPtr<ServerDirectory> directory, RpcContext context) {
        return UniquePtr<Watcher>(std::make_unique<T>(config, directory, context));
    };
}

} // namespace

WatcherRegistry WatcherRegistry::withDefaultWatchers() {
    WatcherRegistry registry;
    registry.registerFactory(SourceKind::GAUGE_SET, makeFactory<GaugeSetWatcher>());
    registry.registerFactory(SourceKind::GAUGE_SET_TEST_HACK, makeFactory<GaugeSetWatcher>());
    registry.registerFactory(SourceKind::DIODE_ARRAY, makeFactory<DiodeArrayWatcher>());
    registry.registerFactory(SourceKind::RUOX_ARRAY, makeFactory<RuoxWatcher>());
    return registry;
}

void WatcherRegistry::registerFactory(SourceKind kind, Factory factory) {
    factories_[kind] = std::move(factory);
    LOG_DEBUG("Registered watcher for {}", to_string(kind));
}

bool WatcherRegistry::canCreate(const std::string& server_name) const {
    auto kind = sourceKindFromString(server_name);
    return kind && factories_.count(*kind) > 0;
}

UniquePtr<Watcher> WatcherRegistry::create(const WatcherConfig& config,
                                           SharedPtr<ServerDirectory> directory,
                                           RpcContext context) const {
    auto kind = sourceKindFromString(config.source_kind);
    if (!kind) {
        throw ConfigException("No watcher class found for: " + config.source_kind);
    }

    auto it = factories_.find(*kind);
    if (it == factories_.end()) {
        throw ConfigException("No watcher registered for: " + config.source_kind);
    }

    LOG_DEBUG("Found watcher for {}", config.source_kind);
    return it->second(config, directory, context);
}

} // namespace drLogger
