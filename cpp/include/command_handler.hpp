/**
 * @file command_handler.hpp
 * @brief Remote control commands for running sessions
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include "setup_manager.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace drLogger {

/**
 * @brief Executes named commands against the session of a setup
 *
 * Commands: take_point, new_dataset, logging, time_interval, errors,
 * current_time and list_setups (which ignores the setup name).
 */
class CommandHandler {
public:
    explicit CommandHandler(SetupManager& setups);

    /**
     * @brief Execute a command
     * @param setup Setup name
     * @param command Command name
     * @param args JSON object with the command's optional arguments, or null
     * @return JSON result
     * @throws CommandException for an unknown setup or command
     * @throws ValidationException for malformed arguments
     */
    nlohmann::json execute(const std::string& setup,
                           const std::string& command,
                           const nlohmann::json& args = nlohmann::json());

    static const std::vector<std::string>& commandNames();

private:
    SharedPtr<DrSession> requireSession(const std::string& setup) const;

    SetupManager& setups_;
};

} // namespace drLogger
