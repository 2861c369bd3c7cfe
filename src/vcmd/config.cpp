#include <vcmd/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace vcmd {

namespace {

const char* DEFAULT_CONFIG = R"(
shell:
  command: ""
  args: []
  env:
    TERM: xterm-256color
    COLORTERM: truecolor
scrollback:
  lines: 10000
  dedup-window: 20
render:
  interval-ms: 50
  min-interval-ms: 0
input:
  scroll-step: 3
ai:
  provider: claude-code
  model: ""
  system-prompt: ""
  args: []
palette:
  cursor: "7"
  selection: "7"
  indicator: "1;38;5;51"
  error: "31"
log:
  level: info
  file: ""
)";

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

} // namespace

Config::Config(std::string configPath, YAML::Node cmdOverrides) noexcept
    : _configPath(std::move(configPath)), _cmdOverrides(std::move(cmdOverrides)) {}

Result<void> Config::init() noexcept {
    if (auto res = loadDefaults(); !res) {
        return res;
    }

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
            // An explicitly requested file must load; the XDG one is optional
            if (!_configPath.empty()) {
                return Err("Failed to load config " + effectivePath, res);
            }
            ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
        } else {
            _loadedFrom = effectivePath;
            yinfo("Loaded config from: {}", effectivePath);
        }
    }

    applyEnvOverrides(_root, "");

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_root, _cmdOverrides);
    }
    return Ok();
}

Result<void> Config::loadDefaults() {
    try {
        _root = YAML::Load(DEFAULT_CONFIG);
    } catch (const YAML::Exception& e) {
        return Err(std::string("Default config parse error: ") + e.what());
    }
    return Ok();
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && fileConfig.IsMap()) {
            mergeNodes(_root, fileConfig);
        } else if (fileConfig && !fileConfig.IsNull()) {
            return Err("Config root must be a map: " + path);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err("YAML parse error: " + std::string(e.what()));
    }
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

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    if (!node.IsMap()) return;

    std::vector<std::pair<std::string, std::string>> overrides;
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "/" + key;

        // shell/env holds variables to export, not to read
        if (fullPath == KEY_SHELL_ENV) {
            continue;
        }

        YAML::Node value = it->second;
        if (value.IsMap()) {
            applyEnvOverrides(value, fullPath);
            continue;
        }
        if (!value.IsScalar() && !value.IsNull()) {
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        if (const char* val = std::getenv(envVar.c_str())) {
            overrides.emplace_back(key, val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }
    for (const auto& [key, val] : overrides) {
        node[key] = val;
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    const YAML::Node& root = _root;
    YAML::Node current;
    current.reset(root);
    for (const auto& part : splitPath(path)) {
        if (!current.IsMap()) return YAML::Node();
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child) return YAML::Node();
        current.reset(child);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::vector<std::string> Config::getList(const std::string& path) const {
    std::vector<std::string> result;
    YAML::Node node = getNode(path);
    if (!node) return result;

    try {
        if (node.IsSequence()) {
            for (const auto& item : node) {
                if (item.IsScalar()) {
                    result.push_back(item.as<std::string>());
                }
            }
        } else if (node.IsScalar()) {
            std::istringstream ss(node.as<std::string>());
            std::string word;
            while (ss >> word) {
                result.push_back(word);
            }
        }
    } catch (const YAML::Exception& e) {
        ywarn("Config::getList({}): {}", path, e.what());
        result.clear();
    }
    return result;
}

std::vector<std::pair<std::string, std::string>> Config::getMap(const std::string& path) const {
    std::vector<std::pair<std::string, std::string>> result;
    YAML::Node node = getNode(path);
    if (!node || !node.IsMap()) return result;

    try {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (it->second.IsScalar()) {
                result.emplace_back(it->first.as<std::string>(), it->second.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        ywarn("Config::getMap({}): {}", path, e.what());
        result.clear();
    }
    return result;
}

Result<Config::Ptr> Config::create(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else if (const char* home = std::getenv("HOME")) {
        configDir = std::filesystem::path(home) / ".config";
    } else {
        configDir = "/tmp";
    }
    return configDir / "vcmd" / "config.yaml";
}

std::filesystem::path Config::getXDGStatePath() {
    std::filesystem::path stateDir;
    const char* xdgState = std::getenv("XDG_STATE_HOME");
    if (xdgState && xdgState[0] != '\0') {
        stateDir = xdgState;
    } else if (const char* home = std::getenv("HOME")) {
        stateDir = std::filesystem::path(home) / ".local" / "state";
    } else {
        stateDir = "/tmp";
    }
    return stateDir / "vcmd";
}

} // namespace vcmd
