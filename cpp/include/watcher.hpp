/**
 * @file watcher.hpp
 * @brief Proxies for the instrument servers a DR setup is logged from
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include "rpc_connection.hpp"
#include <optional>
#include <string>
#include <vector>

namespace drLogger {

/**
 * @brief One source of data for a session
 *
 * takePoint() must return exactly one value per descriptor returned by
 * getVariables(), in the same order.
 */
class Watcher {
public:
    virtual ~Watcher() = default;

    /**
     * @brief Source identity used in error records
     */
    virtual const std::string& sourceName() const = 0;

    /**
     * @brief Describe the variables this source logs
     *
     * Called on dataset creation; may contact the server.
     */
    virtual std::vector<VariableDescriptor> getVariables() = 0;

    /**
     * @brief Take one reading
     * @throws DrLoggerException on failure
     */
    virtual Reading takePoint() = 0;

    /**
     * @brief Whether the last attempt succeeded
     */
    virtual bool isActive() const = 0;
};

/**
 * @brief Watcher backed by an instrument server in the directory
 *
 * Handles server lookup and device selection: a read that fails because no
 * device is selected triggers one selection attempt and one retry.
 */
class ServerWatcher : public Watcher {
public:
    ServerWatcher(const WatcherConfig& config,
                  SharedPtr<ServerDirectory> directory,
                  RpcContext context);

    const std::string& sourceName() const override { return config_.source_kind; }

    Reading takePoint() override;

    bool isActive() const override { return active_; }

    const WatcherConfig& getConfig() const { return config_; }

protected:
    /**
     * @brief Kind-specific read against a resolved server
     */
    virtual Reading readPoint(InstrumentServer& server) = 0;

    /**
     * @brief Select the configured device (or the default one)
     * @throws NoSuchDeviceException if no listed device matches
     */
    void selectDevice(InstrumentServer& server);

    /**
     * @brief Server resolved by the last takePoint()
     * @throws SourceNotFoundException if takePoint() has not resolved one yet
     */
    InstrumentServer& currentServer();

    WatcherConfig config_;

private:
    SharedPtr<ServerDirectory> directory_;
    RpcContext context_;
    SharedPtr<InstrumentServer> server_;
    bool active_ = false;
};

/**
 * @brief Pressure gauge controller, with an optional He flow channel
 *
 * Options "channel" (gauge name) and "he_flow_rate" (multiplier) enable a
 * derived flow value computed from that gauge's reading.
 */
class GaugeSetWatcher : public ServerWatcher {
public:
    using ServerWatcher::ServerWatcher;

    std::vector<VariableDescriptor> getVariables() override;

    /**
     * @brief Index of the gauge used for the flow channel; empty when disabled
     *
     * Only meaningful once a reading has been taken.
     */
    std::optional<size_t> flowChannel() const;

protected:
    Reading readPoint(InstrumentServer& server) override;

private:
    void setupFlowChannel(InstrumentServer& server);

    struct FlowChannel {
        size_t index;
        double multiplier;
    };

    bool flow_resolved_ = false;
    std::optional<FlowChannel> flow_channel_;
};

/**
 * @brief Diode thermometer monitor with a fixed channel list
 */
class DiodeArrayWatcher : public ServerWatcher {
public:
    using ServerWatcher::ServerWatcher;

    static const std::vector<std::string>& channelLabels();

    std::vector<VariableDescriptor> getVariables() override;

protected:
    Reading readPoint(InstrumentServer& server) override;
};

/**
 * @brief Resistance bridge reporting RuOx temperatures and resistances
 */
class RuoxWatcher : public ServerWatcher {
public:
    using ServerWatcher::ServerWatcher;

    std::vector<VariableDescriptor> getVariables() override;

protected:
    Reading readPoint(InstrumentServer& server) override;

private:
    static std::vector<VariableDescriptor> namedChannels(const nlohmann::json& channels,
                                                         const std::string& category);
};

} // namespace drLogger
