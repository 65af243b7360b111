/**
 * @file rpc_connection.cpp
 * @brief Implementation of the RPC gateway connection
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "rpc_connection.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>

namespace drLogger {

bool ServerDirectory::isNodeRunning(const std::string& node) {
    std::string node_server = "node_" + node;
    std::transform(node_server.begin(), node_server.end(), node_server.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto servers = listServers();
    return std::find(servers.begin(), servers.end(), node_server) != servers.end();
}

Quantity quantityFromJson(const nlohmann::json& json) {
    if (json.is_number()) {
        return Quantity(json.get<double>(), "");
    }
    if (json.is_object() && json.contains("value") && json["value"].is_number()) {
        return Quantity(json["value"].get<double>(), json.value("unit", ""));
    }
    // Timestamped tuples such as (value, time) carry the quantity first
    if (json.is_array() && !json.empty()) {
        return quantityFromJson(json[0]);
    }
    throw RpcException("Not a quantity: " + json.dump());
}

Reading readingFromJson(const nlohmann::json& json) {
    if (!json.is_array()) {
        throw RpcException("Expected a list of values, got: " + json.dump());
    }

    Reading reading;
    reading.reserve(json.size());
    for (const auto& entry : json) {
        reading.push_back(quantityFromJson(entry));
    }
    return reading;
}

nlohmann::json quantityToJson(const Quantity& quantity) {
    return nlohmann::json{{"value", quantity.value}, {"unit", quantity.unit}};
}

// HttpInstrumentServer
HttpInstrumentServer::HttpInstrumentServer(SharedPtr<HttpClient> http_client,
                                           const RpcConfig& config,
                                           const std::string& name,
                                           RpcContext context)
    : http_client_(http_client), config_(config), name_(name), context_(context) {}

nlohmann::json HttpInstrumentServer::call(const std::string& setting, const nlohmann::json& args) {
    auto results = callPacket({RpcRequest(setting, args)});
    return results.front();
}

std::vector<nlohmann::json> HttpInstrumentServer::callPacket(const std::vector<RpcRequest>& requests) {
    if (requests.empty()) {
        throw ValidationException("Empty request packet for server '" + name_ + "'");
    }

    nlohmann::json payload;
    payload["server"] = name_;
    payload["context"] = context_;
    payload["requests"] = nlohmann::json::array();
    for (const auto& request : requests) {
        payload["requests"].push_back({{"setting", request.setting}, {"args", request.args}});
    }

    LOG_TRACE("RPC {} (ctx {}): {}", name_, context_, payload["requests"].dump());

    HttpResponse response = http_client_->postJson(config_.rpc_endpoint, payload);

    nlohmann::json response_json;
    try {
        response_json = response.json();
    } catch (const RpcException&) {
        if (!response.isSuccess()) {
            throw HttpException(response.status_code, response.body);
        }
        throw;
    }

    if (response_json.contains("error")) {
        throwRemoteError(response_json["error"]);
    }
    if (!response.isSuccess()) {
        throw HttpException(response.status_code, response.body);
    }

    if (!response_json.contains("results") || !response_json["results"].is_array() ||
        response_json["results"].size() != requests.size()) {
        throw RpcException("Malformed response from '" + name_ + "': " + response.body);
    }

    LOG_TRACE("RPC {} response: {}", name_, response_json["results"].dump());
    return response_json["results"].get<std::vector<nlohmann::json>>();
}

void HttpInstrumentServer::throwRemoteError(const nlohmann::json& error) const {
    std::string type = error.is_object() ? error.value("type", "Error") : "Error";
    std::string message = error.is_object() ? error.value("message", error.dump()) : error.dump();

    if (type.find("DeviceNotSelectedError") != std::string::npos) {
        throw DeviceNotSelectedException(message);
    }
    if (type.find("NoSuchDeviceError") != std::string::npos) {
        throw NoSuchDeviceException(message);
    }
    throw RpcException(type, message);
}

// HttpServerDirectory
HttpServerDirectory::HttpServerDirectory(const RpcConfig& config)
    : config_(config),
      http_client_(std::make_shared<HttpClient>(config)) {
    LOG_INFO("RPC gateway at {}", config_.base_url);
}

std::vector<std::string> HttpServerDirectory::listServers() {
    HttpResponse response = http_client_->get(config_.servers_endpoint);
    if (!response.isSuccess()) {
        throw HttpException(response.status_code, "Listing servers failed: " + response.body);
    }

    nlohmann::json servers = response.json();
    try {
        return servers.get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& e) {
        throw RpcException("Invalid server list: " + std::string(e.what()));
    }
}

SharedPtr<InstrumentServer> HttpServerDirectory::getServer(const std::string& name, RpcContext context) {
    auto servers = listServers();
    if (std::find(servers.begin(), servers.end(), name) == servers.end()) {
        throw SourceNotFoundException(name);
    }
    return std::make_shared<HttpInstrumentServer>(http_client_, config_, name, context);
}

} // namespace drLogger
