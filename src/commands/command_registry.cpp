#include "commands/command_registry.hpp"
#include <spdlog/spdlog.h>

namespace jotter::commands {

bool CommandRegistry::add(Command command) {
    if (command.name.empty() || !command.handler) {
        spdlog::error("Refusing to register a command without a name or handler");
        return false;
    }
    if (commands_.count(command.name)) {
        spdlog::warn("Command {} already registered", command.name);
        return false;
    }

    for (const auto& key : command.keys) {
        bindings_[key].push_back(command.name);
    }
    order_.push_back(command.name);
    spdlog::debug("Registered command {} ({} key(s))", command.name, command.keys.size());
    std::string name = command.name;
    commands_.emplace(std::move(name), std::move(command));
    return true;
}

bool CommandRegistry::available(const Command& command) {
    return !command.filter || command.filter();
}

bool CommandRegistry::run(const std::string& name) {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        spdlog::warn("Unknown command: {}", name);
        return false;
    }
    if (!available(it->second)) {
        spdlog::debug("Command {} not available here", name);
        return false;
    }
    auto handler = it->second.handler;
    handler();
    return true;
}

bool CommandRegistry::dispatch(const std::string& key) {
    auto it = bindings_.find(key);
    if (it == bindings_.end()) {
        return false;
    }
    for (const auto& name : it->second) {
        const Command& command = commands_.at(name);
        if (available(command)) {
            auto handler = command.handler;
            handler();
            return true;
        }
    }
    return false;
}

const Command* CommandRegistry::find(const std::string& name) const {
    auto it = commands_.find(name);
    return it == commands_.end() ? nullptr : &it->second;
}

std::vector<std::string> CommandRegistry::names(const std::string& group) const {
    std::vector<std::string> result;
    for (const auto& name : order_) {
        if (group.empty() || commands_.at(name).group == group) {
            result.push_back(name);
        }
    }
    return result;
}

} // namespace jotter::commands
