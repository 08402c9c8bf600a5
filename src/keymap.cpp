// keymap.cpp
#include "keymap.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace mdtodo {

namespace {

struct ActionInfo {
    Action action;
    const char* name;
    const char* defaultKey;
};

// Order of the config file and of the help dialog.
const ActionInfo kActions[] = {
    {Action::Quit, "quit", "q"},
    {Action::Add, "add", "a"},
    {Action::Edit, "edit", "e"},
    {Action::Delete, "delete", "d"},
    {Action::Toggle, "toggle", "space"},
    {Action::Save, "save", "w"},
    {Action::MoveUp, "move_up", "k"},
    {Action::MoveDown, "move_down", "j"},
    {Action::CategoryPrev, "category_prev", "h"},
    {Action::CategoryNext, "category_next", "l"},
    {Action::Help, "help", "?"},
    {Action::Reload, "reload", "r"},
};

const ActionInfo& infoFor(Action action) {
    for (const ActionInfo& info : kActions) {
        if (info.action == action) return info;
    }
    throw std::logic_error("unknown action");
}

} // namespace

const char* actionName(Action action) {
    return infoFor(action).name;
}

std::optional<Action> actionFromName(const std::string& name) {
    for (const ActionInfo& info : kActions) {
        if (name == info.name) return info.action;
    }
    return std::nullopt;
}

std::string defaultConfigDir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return (fs::path(xdg) / "mdtodo").string();
    }
    const char* home = std::getenv("HOME");
    return (fs::path(home ? home : ".") / ".config" / "mdtodo").string();
}

Keymap::Keymap() {
    for (const ActionInfo& info : kActions) {
        keys_[info.action] = info.defaultKey;
    }
}

Keymap Keymap::fromYaml(const std::string& document) {
    YAML::Node root;
    try {
        root = YAML::Load(document);
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("invalid YAML: ") + ex.what());
    }

    Keymap keymap;
    if (root.IsNull()) {
        return keymap;
    }
    if (!root.IsMap()) {
        throw ConfigError("keymap must be a mapping of action to key");
    }
    for (const auto& entry : root) {
        if (!entry.first.IsScalar() || !entry.second.IsScalar()) {
            throw ConfigError("keymap entries must be plain 'action: key' pairs");
        }
        const std::string name = entry.first.as<std::string>();
        const std::string key = entry.second.as<std::string>();
        std::optional<Action> action = actionFromName(name);
        if (!action) {
            spdlog::warn("Ignoring unknown keymap action '{}'", name);
            continue;
        }
        if (key.empty()) {
            throw ConfigError("empty key for action '" + name + "'");
        }
        keymap.bind(*action, key);
    }
    return keymap;
}

KeymapLoadResult Keymap::loadOrCreate(const std::string& path) {
    KeymapLoadResult result;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream in(path);
        std::ostringstream content;
        if (in) {
            content << in.rdbuf();
        }
        if (!in.is_open() || in.bad()) {
            result.warning = "Error loading keymap: can't read " + path;
            spdlog::warn("{}", result.warning);
            return result;
        }
        try {
            result.keymap = fromYaml(content.str());
        } catch (const ConfigError& ex) {
            result.warning = std::string("Error loading keymap: ") + ex.what();
            spdlog::warn("{} ({}), using defaults", result.warning, path);
        }
        return result;
    }

    fs::create_directories(fs::path(path).parent_path(), ec);
    std::ofstream out(path);
    if (out) {
        out << result.keymap.toYaml();
        out.close();
    }
    if (!out) {
        spdlog::warn("Can't write default keymap to {}", path);
    } else {
        spdlog::info("Wrote default keymap to {}", path);
    }
    return result;
}

std::string Keymap::toYaml() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const ActionInfo& info : kActions) {
        out << YAML::Key << info.name << YAML::Value << YAML::DoubleQuoted << keyFor(info.action);
    }
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

std::optional<Action> Keymap::actionFor(const std::string& key) const {
    // std::map iterates in enum order, which is the priority order.
    for (const auto& entry : keys_) {
        if (entry.second == key) return entry.first;
    }
    return std::nullopt;
}

const std::string& Keymap::keyFor(Action action) const {
    return keys_.at(action);
}

void Keymap::bind(Action action, const std::string& key) {
    keys_[action] = key;
}

std::vector<std::pair<std::string, std::string>> Keymap::entries() const {
    std::vector<std::pair<std::string, std::string>> result;
    for (const ActionInfo& info : kActions) {
        result.emplace_back(info.name, keyFor(info.action));
    }
    return result;
}

} // namespace mdtodo
