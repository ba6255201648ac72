// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/detection.hpp>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace detstab {
class BaseStabilizer;
}

namespace detstab::control {

/// Handler receives the command arguments and returns a response payload
using CommandHandler = std::function<nlohmann::json(const nlohmann::json& args)>;

/**
 * Explicit registry of control commands.
 * Only commands that are available get registered, so an unknown command
 * fails early with the list of what is available.
 */
class CommandRegistry {
public:
    /**
     * Register a command; an existing one with the same name is replaced
     */
    void register_command(const std::string& command, CommandHandler handler,
                          const std::string& description = "");

    /**
     * Run a registered command
     * @throws CommandNotAvailableError if the command is not registered
     */
    nlohmann::json execute(const std::string& command,
                           const nlohmann::json& args = nlohmann::json::object()) const;

    /**
     * Decode a `{"command": ..., ...}` JSON payload and run it.
     * The whole payload is passed to the handler as its arguments.
     * @throws CommandNotAvailableError for unknown commands
     * @throws std::invalid_argument for malformed JSON or a payload without a command
     */
    nlohmann::json dispatch(const std::string& payload) const;

    bool is_available(const std::string& command) const;
    std::set<std::string> available_commands() const;
    std::map<std::string, std::string> help() const { return descriptions_; }
    size_t size() const { return commands_.size(); }

private:
    std::map<std::string, CommandHandler> commands_;
    std::map<std::string, std::string> descriptions_;
};

/// Command names understood by the stabilization control path
inline constexpr const char* kToggleStabilization = "toggle_stabilization";
inline constexpr const char* kStabilizationReset = "stabilization_reset";
inline constexpr const char* kStabilizationStats = "stabilization_stats";

/**
 * Bind toggle / reset / stats commands to a stabilizer.
 * Commands read an optional integer `source_id` argument (default 0).
 * The stabilizer must outlive the registry.
 */
void register_stabilization_commands(CommandRegistry& registry, BaseStabilizer& stabilizer);

} // namespace detstab::control
