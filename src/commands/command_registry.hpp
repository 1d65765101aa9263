#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace jotter::commands {

// Command is available when this returns true
using Filter = std::function<bool()>;
using Handler = std::function<void()>;

struct Command {
    std::string name;
    std::vector<std::string> keys;   // key chords, e.g. "c-a" or "I I"
    Filter filter;                   // empty = always available
    Handler handler;
    std::string group;
    std::string description;
};

// Named commands and their key bindings
class CommandRegistry {
public:
    // False if a command with the same name exists
    bool add(Command command);

    // Run by name. Returns true when the handler ran.
    bool run(const std::string& name);

    // Run the first command bound to key whose filter passes
    bool dispatch(const std::string& key);

    const Command* find(const std::string& name) const;
    std::vector<std::string> names(const std::string& group = "") const;
    size_t size() const { return commands_.size(); }

private:
    std::unordered_map<std::string, Command> commands_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, std::vector<std::string>> bindings_;

    static bool available(const Command& command);
};

} // namespace jotter::commands
