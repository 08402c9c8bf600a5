// keymap.h
#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mdtodo {

// Declaration order is the lookup priority when two actions share a key.
enum class Action {
    Quit,
    Save,
    Reload,
    Add,
    CategoryPrev,
    CategoryNext,
    MoveUp,
    MoveDown,
    Toggle,
    Delete,
    Edit,
    Help,
};

// Malformed keymap document. Caught by Keymap::loadOrCreate.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

const char* actionName(Action action);
std::optional<Action> actionFromName(const std::string& name);

struct KeymapLoadResult;

// --------------------------------------------------------------------
// Keymap: action -> key token ("q", "space", "enter", "?", ...).
// --------------------------------------------------------------------
class Keymap {
public:
    // Built-in defaults.
    Keymap();

    // Parse a YAML mapping of action name -> key. Missing actions keep
    // their default. Throws ConfigError on malformed input.
    static Keymap fromYaml(const std::string& document);

    // Read the config file, writing the defaults out first if it does not
    // exist. Never throws: errors yield the defaults plus a warning.
    static KeymapLoadResult loadOrCreate(const std::string& path);

    std::string toYaml() const;

    std::optional<Action> actionFor(const std::string& key) const;
    const std::string& keyFor(Action action) const;
    void bind(Action action, const std::string& key);

    // (action name, key) pairs in the order the help dialog lists them.
    std::vector<std::pair<std::string, std::string>> entries() const;

private:
    std::map<Action, std::string> keys_;
};

struct KeymapLoadResult {
    Keymap keymap;
    std::string warning;
};

// $XDG_CONFIG_HOME/mdtodo or ~/.config/mdtodo.
std::string defaultConfigDir();

} // namespace mdtodo
