/**
 * @file command_handler.cpp
 * @brief Implementation of the session commands
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "command_handler.hpp"
#include "logger.hpp"
#include <cmath>

namespace drLogger {

using json = nlohmann::json;

namespace {

// Optional argument lookup; absent or null means "not given"
const json* findArg(const json& args, const char* key) {
    if (args.is_null()) {
        return nullptr;
    }
    if (!args.is_object()) {
        throw ValidationException("command arguments must be a JSON object");
    }
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

double toSeconds(Duration duration) {
    return std::chrono::duration<double>(duration).count();
}

} // namespace

CommandHandler::CommandHandler(SetupManager& setups)
    : setups_(setups) {}

const std::vector<std::string>& CommandHandler::commandNames() {
    static const std::vector<std::string> names = {
        "take_point", "new_dataset", "logging", "time_interval",
        "errors", "current_time", "list_setups"
    };
    return names;
}

json CommandHandler::execute(const std::string& setup,
                             const std::string& command,
                             const json& args) {
    LOG_DEBUG("Command '{}' for setup '{}'", command, setup);

    if (command == "list_setups") {
        return setups_.listSetups();
    }

    if (command == "current_time") {
        TimePoint now = requireSession(setup)->currentTime();
        return {{"time", std::chrono::duration<double>(now.time_since_epoch()).count()}};
    }

    if (command == "take_point") {
        requireSession(setup)->cycle();
        return json::object();
    }

    if (command == "new_dataset") {
        requireSession(setup)->newDataset();
        return json::object();
    }

    if (command == "logging") {
        auto session = requireSession(setup);
        if (const json* start = findArg(args, "start")) {
            if (!start->is_boolean()) {
                throw ValidationException("'start' must be a boolean");
            }
            try {
                session->logging(start->get<bool>());
            } catch (const SessionException& e) {
                throw ValidationException(e.what());
            }
        }
        return {{"logging", session->isLogging()}};
    }

    if (command == "time_interval") {
        auto session = requireSession(setup);
        if (const json* seconds = findArg(args, "seconds")) {
            if (!seconds->is_number()) {
                throw ValidationException("'seconds' must be a number");
            }
            double value = seconds->get<double>();
            if (!std::isfinite(value) || value <= 0.0) {
                throw ValidationException("'seconds' must be positive");
            }
            auto interval = std::chrono::duration_cast<Duration>(std::chrono::duration<double>(value));
            if (interval.count() <= 0) {
                throw ValidationException("'seconds' must be at least one millisecond");
            }
            session->setInterval(interval);
            LOG_INFO("Setup '{}' interval set to {}s", setup, value);
        }
        return {{"seconds", toSeconds(session->getInterval())}};
    }

    if (command == "errors") {
        json result = json::array();
        for (const auto& error : requireSession(setup)->getErrors()) {
            result.push_back({error.source, error.message});
        }
        return result;
    }

    throw CommandException("Unknown command: " + command);
}

SharedPtr<DrSession> CommandHandler::requireSession(const std::string& setup) const {
    auto session = setups_.getSession(setup);
    if (!session) {
        throw CommandException("Unknown setup: " + setup);
    }
    return session;
}

} // namespace drLogger
