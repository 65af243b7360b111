/**
 * @file http_client.cpp
 * @brief JSON-over-HTTP client for the RPC gateway
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "http_client.hpp"
#include "logger.hpp"
#include <chrono>

using namespace web;
using namespace web::http;
using namespace web::http::client;

namespace drLogger {

nlohmann::json HttpResponse::json() const {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw RpcException("Invalid JSON from gateway (HTTP " + std::to_string(status_code) + "): " + e.what());
    }
}

HttpClient::HttpClient(const RpcConfig& config)
    : base_url_(config.base_url) {

    headers_["Accept"] = "application/json";
    if (!config.api_key.empty()) {
        headers_["Authorization"] = config.api_key;
    }

    try {
        http_client_config client_config;
        client_config.set_timeout(config.timeout);
        client_ = std::make_unique<http_client>(utility::conversions::to_string_t(base_url_), client_config);
    } catch (const std::exception& e) {
        throw HttpException("Bad gateway URL '" + base_url_ + "': " + e.what());
    }

    LOG_DEBUG("Gateway client for {} (timeout {} ms)", base_url_, config.timeout.count());
}

HttpResponse HttpClient::postJson(const std::string& endpoint, const nlohmann::json& payload) {
    http_request request(methods::POST);
    request.set_body(utility::conversions::to_string_t(payload.dump()), U("application/json"));
    return send(request, endpoint);
}

HttpResponse HttpClient::get(const std::string& endpoint) {
    return send(http_request(methods::GET), endpoint);
}

HttpResponse HttpClient::send(http_request request, const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    request.set_request_uri(utility::conversions::to_string_t(endpoint));
    for (const auto& header : headers_) {
        request.headers().add(utility::conversions::to_string_t(header.first),
                              utility::conversions::to_string_t(header.second));
    }

    auto started = std::chrono::steady_clock::now();

    try {
        http_response reply = client_->request(request).get();

        HttpResponse result;
        result.status_code = reply.status_code();
        result.body = utility::conversions::to_utf8string(reply.extract_string().get());

        LOG_TRACE("{} {} -> {} in {} ms", utility::conversions::to_utf8string(request.method()), endpoint,
                  result.status_code,
                  std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started).count());
        return result;
    } catch (const std::exception& e) {
        LOG_DEBUG("Gateway request {} failed: {}", endpoint, e.what());
        throw HttpException("request to " + base_url_ + endpoint + " failed: " + e.what());
    }
}

} // namespace drLogger
