/**
 * @file rpc_connection.hpp
 * @brief Access to remote instrument servers over the RPC gateway
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include "http_client.hpp"
#include <nlohmann/json.hpp>
#include <vector>
#include <memory>
#include <atomic>

namespace drLogger {

/**
 * @brief One setting call inside a request packet
 */
struct RpcRequest {
    std::string setting;
    nlohmann::json args = nlohmann::json::array();

    RpcRequest() = default;

    RpcRequest(const std::string& s, const nlohmann::json& a = nlohmann::json::array())
        : setting(s), args(a) {}
};

/**
 * @brief Proxy for one instrument server, bound to an RPC context
 *
 * Device selection is remembered by the server per context, so a proxy
 * obtained twice with the same context sees the same selected device.
 */
class InstrumentServer {
public:
    virtual ~InstrumentServer() = default;

    virtual const std::string& name() const = 0;

    /**
     * @brief Call a single setting
     * @throws DeviceNotSelectedException, NoSuchDeviceException, RpcException
     */
    virtual nlohmann::json call(const std::string& setting,
                                const nlohmann::json& args = nlohmann::json::array()) = 0;

    /**
     * @brief Send several settings as one packet
     * @return One result per request, in order
     */
    virtual std::vector<nlohmann::json> callPacket(const std::vector<RpcRequest>& requests) = 0;
};

/**
 * @brief The set of servers currently reachable through the connection
 */
class ServerDirectory {
public:
    virtual ~ServerDirectory() = default;

    /**
     * @brief Names of all connected servers (instrument servers and node servers)
     */
    virtual std::vector<std::string> listServers() = 0;

    /**
     * @brief Get a proxy for a connected server
     * @throws SourceNotFoundException if the server is not connected
     */
    virtual SharedPtr<InstrumentServer> getServer(const std::string& name, RpcContext context) = 0;

    /**
     * @brief Allocate a fresh context id
     */
    virtual RpcContext newContext() = 0;

    /**
     * @brief Whether the node server hosting instruments is running
     */
    bool isNodeRunning(const std::string& node);
};

// Helpers for the quantity encoding used by instrument servers

/**
 * @brief Decode {"value": v, "unit": u}, a bare number, or a tuple whose first element is a quantity
 * @throws RpcException if the value is none of these
 */
Quantity quantityFromJson(const nlohmann::json& json);

/**
 * @brief Decode a list of quantities
 */
Reading readingFromJson(const nlohmann::json& json);

nlohmann::json quantityToJson(const Quantity& quantity);

/**
 * @brief Instrument server reached through the HTTP RPC gateway
 */
class HttpInstrumentServer : public InstrumentServer {
public:
    HttpInstrumentServer(SharedPtr<HttpClient> http_client,
                         const RpcConfig& config,
                         const std::string& name,
                         RpcContext context);

    const std::string& name() const override { return name_; }

    nlohmann::json call(const std::string& setting,
                        const nlohmann::json& args = nlohmann::json::array()) override;

    std::vector<nlohmann::json> callPacket(const std::vector<RpcRequest>& requests) override;

private:
    /**
     * @brief Map a gateway error object to the matching exception and throw it
     */
    void throwRemoteError(const nlohmann::json& error) const;

    SharedPtr<HttpClient> http_client_;
    RpcConfig config_;
    std::string name_;
    RpcContext context_;
};

/**
 * @brief Server directory backed by the HTTP RPC gateway
 */
class HttpServerDirectory : public ServerDirectory {
public:
    explicit HttpServerDirectory(const RpcConfig& config);

    std::vector<std::string> listServers() override;

    SharedPtr<InstrumentServer> getServer(const std::string& name, RpcContext context) override;

    RpcContext newContext() override { return next_context_++; }

private:
    RpcConfig config_;
    SharedPtr<HttpClient> http_client_;
    std::atomic<RpcContext> next_context_{1};
};

} // namespace drLogger
