#pragma once

#include <yframe/result.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace yframe {

//=============================================================================
// Config - layered settings
//
// Precedence (lowest first): built-in defaults, YAML file, YFRAME_*
// environment variables, command line overrides.
//=============================================================================

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Empty configPath means $XDG_CONFIG_HOME/yframe/config.yaml when it exists
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g. "rendering.batched")
    // Returns nullopt if the key doesn't exist or has the wrong type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "YFRAME_";

    static constexpr const char* KEY_RENDERING_BATCHED = "rendering.batched";
    static constexpr const char* KEY_RENDERING_COALESCE = "rendering.coalesce";
    static constexpr const char* KEY_RENDERING_SYNC_OUTPUT = "rendering.sync-output";
    static constexpr const char* KEY_TERMINAL_ALT_SCREEN = "terminal.alt-screen";
    static constexpr const char* KEY_TERMINAL_HIDE_CURSOR = "terminal.hide-cursor";
    static constexpr const char* KEY_TERMINAL_MOUSE = "terminal.mouse";
    static constexpr const char* KEY_TERMINAL_BRACKETED_PASTE = "terminal.bracketed-paste";
    static constexpr const char* KEY_TERMINAL_FOCUS_EVENTS = "terminal.focus-events";
    static constexpr const char* KEY_TERMINAL_RAW_INPUT = "terminal.raw-input";
    static constexpr const char* KEY_LOG_FILE = "log.file";
    static constexpr const char* KEY_LOG_LEVEL = "log.level";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides();

    YAML::Node getNode(const std::string& path) const;
    void setNode(const std::string& path, const YAML::Node& value);

    // "rendering.sync-output" -> "YFRAME_RENDERING_SYNC_OUTPUT"
    static std::string pathToEnvVar(const std::string& path);

    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull() || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace yframe
