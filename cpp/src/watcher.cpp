/**
 * @file watcher.cpp
 * @brief Implementation of the instrument server watchers
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "watcher.hpp"
#include "logger.hpp"
#include <algorithm>

namespace drLogger {

namespace {

// Protocol violations surface as RPC errors, not as JSON library errors
template<typename Fn>
auto decodeResponse(const std::string& server_name, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const nlohmann::json::exception& e) {
        throw RpcException("Unexpected response from '" + server_name + "': " + e.what());
    }
}

// Keeps DrLoggerExceptions as they are and wraps anything else with the source name
[[noreturn]] void rethrowTyped(const std::string& server_name) {
    try {
        throw;
    } catch (const DrLoggerException&) {
        throw;
    } catch (const std::exception& e) {
        throw RpcException("'" + server_name + "': " + e.what());
    }
}

} // namespace

// ServerWatcher
ServerWatcher::ServerWatcher(const WatcherConfig& config,
                             SharedPtr<ServerDirectory> directory,
                             RpcContext context)
    : config_(config), directory_(directory), context_(context) {}

Reading ServerWatcher::takePoint() {
    try {
        server_ = directory_->getServer(config_.source_kind, context_);
    } catch (const std::exception&) {
        active_ = false;
        rethrowTyped(config_.source_kind);
    }

    try {
        Reading reading = decodeResponse(config_.source_kind, [this] { return readPoint(*server_); });
        active_ = true;
        return reading;
    } catch (const DeviceNotSelectedException& e) {
        LOG_INFO("{}: {}; selecting device", config_.source_kind, e.what());
    } catch (const std::exception&) {
        active_ = false;
        rethrowTyped(config_.source_kind);
    }

    // Exactly one reselect and retry; a second failure propagates
    try {
        Reading reading = decodeResponse(config_.source_kind, [this] {
            selectDevice(*server_);
            return readPoint(*server_);
        });
        active_ = true;
        return reading;
    } catch (const std::exception&) {
        active_ = false;
        rethrowTyped(config_.source_kind);
    }
}

void ServerWatcher::selectDevice(InstrumentServer& server) {
    if (!config_.options.contains("device") || config_.options["device"].is_null()) {
        LOG_DEBUG("{}: selecting default device", config_.source_kind);
        server.call("select_device");
        return;
    }

    const auto& device = config_.options["device"];
    if (device.is_number_integer()) {
        server.call("select_device", nlohmann::json::array({device}));
        return;
    }
    std::string device_name = device.get<std::string>();

    // list_devices returns (index, name) pairs
    std::vector<std::string> names = decodeResponse(config_.source_kind, [&server] {
        std::vector<std::string> result;
        for (const auto& entry : server.call("list_devices")) {
            result.push_back(entry.at(1).get<std::string>());
        }
        return result;
    });

    if (std::find(names.begin(), names.end(), device_name) != names.end()) {
        server.call("select_device", nlohmann::json::array({device_name}));
        return;
    }

    auto partial = std::find_if(names.begin(), names.end(), [&device_name](const std::string& n) {
        return n.find(device_name) != std::string::npos;
    });
    if (partial != names.end()) {
        LOG_INFO("{}: selecting device '{}'", config_.source_kind, *partial);
        server.call("select_device", nlohmann::json::array({*partial}));
        return;
    }

    throw NoSuchDeviceException("'" + device_name + "' on server '" + config_.source_kind + "'");
}

InstrumentServer& ServerWatcher::currentServer() {
    if (!server_) {
        throw SourceNotFoundException(config_.source_kind);
    }
    return *server_;
}

// GaugeSetWatcher
Reading GaugeSetWatcher::readPoint(InstrumentServer& server) {
    Reading reading = readingFromJson(server.call("get_readings"));
    if (reading.empty()) {
        throw NoDataException("Gauge server '" + config_.source_kind + "' did not return data.");
    }

    if (!flow_resolved_) {
        setupFlowChannel(server);
    }

    if (flow_channel_) {
        if (flow_channel_->index >= reading.size()) {
            throw NoDataException("Gauge server '" + config_.source_kind +
                                  "' returned no reading for the He flow gauge");
        }
        reading.emplace_back(flow_channel_->multiplier * reading[flow_channel_->index].value, "L/h");
    }

    return reading;
}

void GaugeSetWatcher::setupFlowChannel(InstrumentServer& server) {
    if (!config_.options.contains("channel") || !config_.options.contains("he_flow_rate")) {
        flow_resolved_ = true;
        return;
    }

    std::string channel;
    double multiplier = 0.0;
    try {
        channel = config_.options["channel"].get<std::string>();
        multiplier = quantityFromJson(config_.options["he_flow_rate"]).value;
    } catch (const std::exception& e) {
        LOG_ERROR("{}: bad He flow options {}: {}; He flow disabled",
                  config_.source_kind, config_.options.dump(), e.what());
        flow_resolved_ = true;
        return;
    }

    auto names = server.call("get_gauge_list").get<std::vector<std::string>>();
    auto it = std::find(names.begin(), names.end(), channel);
    if (it != names.end()) {
        flow_channel_ = FlowChannel{static_cast<size_t>(it - names.begin()), multiplier};
        LOG_INFO("{}: using gauge reading {} ({}) for He flow with multiplier {}",
                 config_.source_kind, flow_channel_->index, channel, multiplier);
    } else {
        LOG_ERROR("{}: could not find gauge reading named '{}', He flow disabled",
                  config_.source_kind, channel);
    }

    flow_resolved_ = true;
}

std::optional<size_t> GaugeSetWatcher::flowChannel() const {
    if (!flow_channel_) {
        return std::nullopt;
    }
    return flow_channel_->index;
}

std::vector<VariableDescriptor> GaugeSetWatcher::getVariables() {
    Reading point = takePoint();

    auto names = decodeResponse(config_.source_kind, [this] {
        return currentServer().call("get_gauge_list").get<std::vector<std::string>>();
    });

    size_t gauge_count = point.size() - (flow_channel_ ? 1 : 0);
    std::vector<VariableDescriptor> vars;
    for (size_t i = 0; i < std::min(gauge_count, names.size()); ++i) {
        vars.emplace_back(names[i], "Pressure", point[i].unit);
    }
    if (flow_channel_) {
        vars.emplace_back("He Flow", "LHe", "L/h");
    }
    return vars;
}

// DiodeArrayWatcher
const std::vector<std::string>& DiodeArrayWatcher::channelLabels() {
    static const std::vector<std::string> labels = {
        "4Kin", "4Kout", "77K", "Ret", "Mix", "Xchg", "Still", "Pot"
    };
    return labels;
}

Reading DiodeArrayWatcher::readPoint(InstrumentServer& server) {
    return readingFromJson(server.call("temperatures"));
}

std::vector<VariableDescriptor> DiodeArrayWatcher::getVariables() {
    std::vector<VariableDescriptor> vars;
    for (const auto& label : channelLabels()) {
        vars.emplace_back(label, "Diode", "K");
    }
    return vars;
}

// RuoxWatcher
Reading RuoxWatcher::readPoint(InstrumentServer& server) {
    auto results = server.callPacket({RpcRequest("temperatures"), RpcRequest("resistances")});

    Reading reading = readingFromJson(results.at(0));
    Reading resistances = readingFromJson(results.at(1));
    reading.insert(reading.end(), resistances.begin(), resistances.end());
    return reading;
}

std::vector<VariableDescriptor> RuoxWatcher::getVariables() {
    takePoint();  // make sure we're connected and a device is selected

    return decodeResponse(config_.source_kind, [this] {
        auto vars = namedChannels(currentServer().call("named_temperatures"), "Ruox");
        auto res_vars = namedChannels(currentServer().call("named_resistances"), "Ruox Res");
        vars.insert(vars.end(), res_vars.begin(), res_vars.end());
        return vars;
    });
}

std::vector<VariableDescriptor> RuoxWatcher::namedChannels(const nlohmann::json& channels,
                                                           const std::string& category) {
    // Each channel is (name, value) where value may itself be a (quantity, time) tuple
    std::vector<VariableDescriptor> vars;
    for (const auto& channel : channels) {
        vars.emplace_back(channel.at(0).get<std::string>(), category,
                          quantityFromJson(channel.at(1)).unit);
    }
    return vars;
}

} // namespace drLogger
