/**
 * @file command_server.hpp
 * @brief HTTP front end for the session commands
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include "command_handler.hpp"
#include <cpprest/http_listener.h>
#include <memory>
#include <string>

namespace drLogger {

/**
 * @brief Status code and JSON body of a command reply
 */
struct CommandResponse {
    int status_code = 200;
    std::string body;
};

/**
 * @brief Serves CommandHandler over HTTP using cpprestsdk
 *
 * Routes:
 *   GET  /setups                      list of setup names
 *   GET  /setups/<setup>/<command>    command without arguments
 *   POST /setups/<setup>/<command>    command with a JSON object body as arguments
 */
class CommandServer {
public:
    CommandServer(const CommandServerConfig& config, CommandHandler& handler);

    ~CommandServer();

    CommandServer(const CommandServer&) = delete;
    CommandServer& operator=(const CommandServer&) = delete;

    /**
     * @brief Start listening
     * @throws HttpException if the listener cannot be opened
     */
    void start();

    void stop();

    bool isRunning() const { return running_; }

    /**
     * @brief Route one request to the command handler
     *
     * Never throws: 400 for malformed input, 404 for unknown setups or
     * commands, 500 for anything else.
     */
    CommandResponse handle(const std::string& method,
                           const std::string& path,
                           const std::string& body);

private:
    void onRequest(web::http::http_request request);

    CommandServerConfig config_;
    CommandHandler& handler_;
    std::unique_ptr<web::http::experimental::listener::http_listener> listener_;
    bool running_ = false;
};

} // namespace drLogger
