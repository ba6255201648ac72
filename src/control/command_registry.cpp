// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/control/command_registry.hpp>
#include <detstab/errors.hpp>
#include <detstab/report.hpp>
#include <detstab/stabilizer.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace detstab::control {

namespace {

using json = nlohmann::json;

SourceId source_arg(const json& args) {
    if (!args.is_object() || !args.contains("source_id") || args["source_id"].is_null()) {
        return 0;
    }
    const json& value = args["source_id"];
    if (!value.is_number_integer()) {
        throw std::invalid_argument("source_id must be an integer, got " + value.dump());
    }
    return value.get<SourceId>();
}

} // namespace

void CommandRegistry::register_command(const std::string& command, CommandHandler handler,
                                       const std::string& description) {
    if (commands_.count(command) > 0) {
        std::cerr << "Warning: command '" << command << "' already registered, overwriting" << std::endl;
    }
    commands_[command] = std::move(handler);
    descriptions_[command] = description;
}

json CommandRegistry::execute(const std::string& command, const json& args) const {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::ostringstream oss;
        oss << "Command '" << command << "' not available. Available commands: ";
        bool first = true;
        for (const auto& [name, handler] : commands_) {
            oss << (first ? "" : ", ") << name;
            first = false;
        }
        throw CommandNotAvailableError(oss.str());
    }
    return it->second(args);
}

json CommandRegistry::dispatch(const std::string& payload) const {
    json message;
    try {
        message = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Malformed command payload: ") + e.what());
    }

    if (!message.is_object() || !message.contains("command") || !message["command"].is_string()) {
        throw std::invalid_argument("Command payload has no 'command' field");
    }

    return execute(message["command"].get<std::string>(), message);
}

bool CommandRegistry::is_available(const std::string& command) const {
    return commands_.count(command) > 0;
}

std::set<std::string> CommandRegistry::available_commands() const {
    std::set<std::string> names;
    for (const auto& [name, handler] : commands_) {
        names.insert(name);
    }
    return names;
}

void register_stabilization_commands(CommandRegistry& registry, BaseStabilizer& stabilizer) {
    registry.register_command(kToggleStabilization,
        [&stabilizer](const json&) {
            return json{{"enabled", stabilizer.toggle()}};
        },
        "Enable/disable detection stabilization without dropping tracks");

    registry.register_command(kStabilizationReset,
        [&stabilizer](const json& args) {
            const SourceId source_id = source_arg(args);
            stabilizer.reset(source_id);
            return json{{"reset", source_id}};
        },
        "Clear every track of a source");

    registry.register_command(kStabilizationStats,
        [&stabilizer](const json& args) {
            const SourceId source_id = source_arg(args);
            return stats_to_json(stabilizer.get_stats(source_id), source_id);
        },
        "Report stabilization statistics of a source");
}

} // namespace detstab::control
