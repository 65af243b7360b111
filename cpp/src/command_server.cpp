/**
 * @file command_server.cpp
 * @brief Implementation of the HTTP command server
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "command_server.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>

using namespace web;
using namespace web::http;
using namespace web::http::experimental::listener;

namespace drLogger {

using json = nlohmann::json;

namespace {

CommandResponse errorResponse(int status_code, const std::string& type, const std::string& message) {
    json body = {{"error", {{"type", type}, {"message", message}}}};
    return {status_code, body.dump()};
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

} // namespace

CommandServer::CommandServer(const CommandServerConfig& config, CommandHandler& handler)
    : config_(config), handler_(handler) {}

CommandServer::~CommandServer() {
    stop();
}

void CommandServer::start() {
    if (running_) {
        return;
    }

    try {
        listener_ = std::make_unique<http_listener>(utility::conversions::to_string_t(config_.listen_url));
        listener_->support(methods::GET, [this](http_request request) { onRequest(request); });
        listener_->support(methods::POST, [this](http_request request) { onRequest(request); });
        listener_->open().wait();
    } catch (const std::exception& e) {
        listener_.reset();
        throw HttpException("Failed to listen on " + config_.listen_url + ": " + e.what());
    }

    running_ = true;
    LOG_INFO("Command server listening on {}", config_.listen_url);
}

void CommandServer::stop() {
    if (!running_) {
        return;
    }

    try {
        listener_->close().wait();
    } catch (const std::exception& e) {
        LOG_WARN("Error closing command server: {}", e.what());
    }
    listener_.reset();
    running_ = false;
    LOG_INFO("Command server stopped");
}

void CommandServer::onRequest(http_request request) {
    try {
        std::string method = utility::conversions::to_utf8string(request.method());
        std::string path = utility::conversions::to_utf8string(uri::decode(request.relative_uri().path()));
        std::string body;
        if (method == "POST") {
            body = request.extract_utf8string().get();
        }

        CommandResponse response = handle(method, path, body);
        request.reply(static_cast<status_code>(response.status_code), response.body, "application/json");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to answer command request: {}", e.what());
    }
}

CommandResponse CommandServer::handle(const std::string& method,
                                      const std::string& path,
                                      const std::string& body) {
    auto parts = splitPath(path);
    if (parts.empty() || parts[0] != "setups" || parts.size() > 3) {
        return errorResponse(404, "NotFound", "No route for " + path);
    }

    std::string setup;
    std::string command = "list_setups";
    if (parts.size() == 2) {
        return errorResponse(404, "NotFound", "Missing command for setup " + parts[1]);
    }
    if (parts.size() == 3) {
        setup = parts[1];
        command = parts[2];
    }

    try {
        json args;
        if (method == "POST" && !body.empty()) {
            args = json::parse(body);
        }

        json result = handler_.execute(setup, command, args);
        return {200, result.dump()};

    } catch (const json::exception& e) {
        return errorResponse(400, "ValidationError", std::string("Malformed JSON: ") + e.what());
    } catch (const ValidationException& e) {
        return errorResponse(400, "ValidationError", e.what());
    } catch (const CommandException& e) {
        return errorResponse(404, "NotFound", e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Command '{}' for setup '{}' failed: {}", command, setup, e.what());
        return errorResponse(500, "InternalError", e.what());
    }
}

} // namespace drLogger
