#include <yframe/config.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace yframe {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

YAML::Node lookup(const YAML::Node& node, const std::vector<std::string>& parts, size_t i) {
    if (i == parts.size()) return node;
    if (!node.IsMap()) return YAML::Node();
    const YAML::Node child = node[parts[i]];
    if (!child) return YAML::Node();
    return lookup(child, parts, i + 1);
}

void assign(YAML::Node node, const std::vector<std::string>& parts, size_t i, const YAML::Node& value) {
    if (i + 1 == parts.size()) {
        node[parts[i]] = value;
        return;
    }
    YAML::Node child = node[parts[i]];
    if (!child.IsMap()) {
        child = YAML::Node(YAML::NodeType::Map);
    }
    assign(child, parts, i + 1, value);
}

// Keys without a default that the environment may still set
constexpr const char* OVERRIDE_ONLY_KEYS[] = {
    "caps.truecolor", "caps.color256", "caps.color16",
    "caps.hyperlink-osc8", "caps.clipboard-osc52", "caps.notify-osc9",
    "caps.finalterm-osc133", "caps.iterm2-osc1337", "caps.kitty-graphics",
    "caps.sixel", "caps.bracketed-paste", "caps.focus-events",
    "caps.sgr-mouse", "caps.synchronized-output", "caps.tmux-passthrough",
    "caps.width-method",
};

void collectLeafPaths(const YAML::Node& node, const std::string& prefix,
                      std::vector<std::string>& out) {
    if (!node.IsMap()) {
        out.push_back(prefix);
        return;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        collectLeafPaths(it->second, prefix.empty() ? key : prefix + "." + key, out);
    }
}

} // namespace

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return config;
}

Result<void> Config::init() noexcept {
    try {
        loadDefaults();

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                // An explicit path must load, the XDG default is optional
                if (!_configPath.empty()) {
                    return Err("Failed to load config " + effectivePath, res);
                }
                ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                yinfo("Loaded config from: {}", effectivePath);
            }
        }

        applyEnvOverrides();

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err(std::string("Config error: ") + e.what());
    }
    return Ok();
}

void Config::loadDefaults() {
    _config["rendering"]["batched"] = true;
    _config["rendering"]["coalesce"] = true;
    _config["rendering"]["sync-output"] = true;

    _config["terminal"]["alt-screen"] = true;
    _config["terminal"]["hide-cursor"] = true;
    _config["terminal"]["mouse"] = false;
    _config["terminal"]["bracketed-paste"] = false;
    _config["terminal"]["focus-events"] = false;
    _config["terminal"]["raw-input"] = false;

    _config["log"]["file"] = "";
    _config["log"]["level"] = "info";
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && !fileConfig.IsNull()) {
            if (!fileConfig.IsMap()) {
                return Err("Config file is not a mapping: " + path);
            }
            mergeNodes(_config, fileConfig);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides() {
    std::vector<std::string> paths;
    collectLeafPaths(_config, "", paths);
    for (const char* key : OVERRIDE_ONLY_KEYS) {
        paths.emplace_back(key);
    }

    for (const auto& path : paths) {
        std::string envVar = pathToEnvVar(path);
        const char* val = std::getenv(envVar.c_str());
        if (!val) continue;

        std::string s(val);
        if (s == "1") s = "true";
        else if (s == "0") s = "false";

        setNode(path, YAML::Node(s));
        ydebug("Config override from env: {}={}", envVar, val);
    }
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) return _config;
    return lookup(_config, parts, 0);
}

void Config::setNode(const std::string& path, const YAML::Node& value) {
    auto parts = splitPath(path);
    if (parts.empty()) return;
    assign(_config, parts, 0, value);
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }

    return configDir / "yframe" / "config.yaml";
}

} // namespace yframe
