/**
 * @file http_client.hpp
 * @brief JSON-over-HTTP client for the RPC gateway
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include <map>
#include <mutex>
#include <string>
#include <cpprest/http_client.h>
#include <nlohmann/json.hpp>

namespace drLogger {

/**
 * @brief Status and body of one gateway reply
 */
struct HttpResponse {
    long status_code = 0;
    std::string body;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }

    /**
     * @brief Parse the body
     * @throws RpcException if the body is not JSON
     */
    nlohmann::json json() const;
};

/**
 * @brief cpprestsdk client bound to one gateway base URL
 *
 * Every request accepts JSON and, when configured, carries the API key. Requests are serialized; the gateway multiplexes instrument servers.
 */
class HttpClient {
public:
    explicit HttpClient(const RpcConfig& config);

    /**
     * @throws HttpException on transport failure or timeout
     */
    HttpResponse postJson(const std::string& endpoint, const nlohmann::json& payload);

    /**
     * @throws HttpException on transport failure or timeout
     */
    HttpResponse get(const std::string& endpoint);

    const std::string& getBaseUrl() const { return base_url_; }

private:
    HttpResponse send(web::http::http_request request, const std::string& endpoint);

    std::unique_ptr<web::http::client::http_client> client_;
    std::string base_url_;
    std::map<std::string, std::string> headers_;
    std::mutex mutex_;
};

} // namespace drLogger
