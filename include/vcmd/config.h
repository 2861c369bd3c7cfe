#pragma once

#include <vcmd/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vcmd {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Defaults, then the file (configPath, or the XDG path if it exists),
    // then VCMD_* environment variables, then cmdOverrides.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Slash path, e.g. "scrollback/lines"; nullopt if missing or not convertible
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    // Sequence of scalars; a single scalar is split on whitespace
    std::vector<std::string> getList(const std::string& path) const;

    // Map of scalars in file order
    std::vector<std::pair<std::string, std::string>> getMap(const std::string& path) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _root; }
    const std::string& loadedFrom() const { return _loadedFrom; }

    static std::filesystem::path getXDGConfigPath();
    static std::filesystem::path getXDGStatePath();

    static constexpr const char* ENV_PREFIX = "VCMD_";

    static constexpr const char* KEY_SHELL_COMMAND = "shell/command";
    static constexpr const char* KEY_SHELL_ARGS = "shell/args";
    static constexpr const char* KEY_SHELL_ENV = "shell/env";
    static constexpr const char* KEY_SCROLLBACK_LINES = "scrollback/lines";
    static constexpr const char* KEY_SCROLLBACK_DEDUP = "scrollback/dedup-window";
    static constexpr const char* KEY_RENDER_INTERVAL = "render/interval-ms";
    static constexpr const char* KEY_RENDER_MIN_INTERVAL = "render/min-interval-ms";
    static constexpr const char* KEY_SCROLL_STEP = "input/scroll-step";
    static constexpr const char* KEY_AI_PROVIDER = "ai/provider";
    static constexpr const char* KEY_AI_MODEL = "ai/model";
    static constexpr const char* KEY_AI_SYSTEM_PROMPT = "ai/system-prompt";
    static constexpr const char* KEY_AI_ARGS = "ai/args";
    static constexpr const char* KEY_LOG_LEVEL = "log/level";
    static constexpr const char* KEY_LOG_FILE = "log/file";

    // Convert slash path to env var name ("scrollback/dedup-window" -> "VCMD_SCROLLBACK_DEDUP_WINDOW")
    static std::string pathToEnvVar(const std::string& path);

private:
    Config(std::string configPath, YAML::Node cmdOverrides) noexcept;
    Result<void> init() noexcept;

    Result<void> loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _root;
    std::string _configPath;
    YAML::Node _cmdOverrides;
    std::string _loadedFrom;
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

} // namespace vcmd
