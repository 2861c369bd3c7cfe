#include <vcmd/ai-provider.h>
#include <ytrace/ytrace.hpp>

namespace vcmd {

bool AiProvider::isAvailable() const {
    return !findExecutable(executable()).empty();
}

namespace {

class ClaudeCodeProvider : public AiProvider {
public:
    std::string name() const override { return "claude-code"; }
    std::string executable() const override { return "claude"; }
    std::vector<std::string> defaultArgs() const override { return {}; }

    SpawnConfig spawnConfig(const AiOptions& options) const override {
        SpawnConfig config;
        config.command = executable();
        config.args = defaultArgs();
        if (!options.workingDir.empty()) {
            config.args.push_back("--add-dir");
            config.args.push_back(options.workingDir);
        }
        if (!options.systemPrompt.empty()) {
            config.args.push_back("--append-system-prompt");
            config.args.push_back(options.systemPrompt);
        }
        if (!options.model.empty()) {
            config.args.push_back("--model");
            config.args.push_back(options.model);
        }
        config.args.insert(config.args.end(), options.additionalArgs.begin(), options.additionalArgs.end());
        config.workingDir = options.workingDir;
        config.env = {{"TERM", "xterm-256color"}, {"COLORTERM", "truecolor"}};
        return config;
    }
};

class AiderProvider : public AiProvider {
public:
    std::string name() const override { return "aider"; }
    std::string executable() const override { return "aider"; }
    std::vector<std::string> defaultArgs() const override { return {"--no-auto-commits"}; }

    SpawnConfig spawnConfig(const AiOptions& options) const override {
        SpawnConfig config;
        config.command = executable();
        config.args = defaultArgs();
        if (!options.model.empty()) {
            config.args.push_back("--model");
            config.args.push_back(options.model);
        }
        config.args.insert(config.args.end(), options.additionalArgs.begin(), options.additionalArgs.end());
        config.workingDir = options.workingDir;
        config.env = {{"TERM", "xterm-256color"}};
        return config;
    }
};

} // namespace

AiProvider::Ptr AiProvider::claudeCode() {
    return std::make_shared<ClaudeCodeProvider>();
}

AiProvider::Ptr AiProvider::aider() {
    return std::make_shared<AiderProvider>();
}

//=============================================================================
// AiProviderRegistry
//=============================================================================

AiProviderRegistry AiProviderRegistry::withBuiltins() {
    AiProviderRegistry registry;
    registry.add(AiProvider::claudeCode());
    registry.add(AiProvider::aider());
    registry._defaultName = "claude-code";
    return registry;
}

void AiProviderRegistry::add(AiProvider::Ptr provider) {
    if (!provider) return;
    _providers[provider->name()] = std::move(provider);
}

Result<void> AiProviderRegistry::setDefault(const std::string& name) {
    if (_providers.find(name) == _providers.end()) {
        return Err("unknown AI provider: " + name);
    }
    _defaultName = name;
    return Ok();
}

Result<AiProvider::Ptr> AiProviderRegistry::get(const std::string& name) const {
    const std::string& key = name.empty() ? _defaultName : name;
    auto it = _providers.find(key);
    if (it == _providers.end()) {
        return Err<AiProvider::Ptr>("unknown AI provider: " + key);
    }
    return Ok(it->second);
}

std::vector<AiProvider::Ptr> AiProviderRegistry::all() const {
    std::vector<AiProvider::Ptr> out;
    out.reserve(_providers.size());
    for (const auto& [name, provider] : _providers) {
        out.push_back(provider);
    }
    return out;
}

std::vector<AiProvider::Ptr> AiProviderRegistry::available() const {
    std::vector<AiProvider::Ptr> out;
    for (const auto& [name, provider] : _providers) {
        if (provider->isAvailable()) {
            out.push_back(provider);
        } else {
            ydebug("AiProviderRegistry: {} not found on PATH", provider->executable());
        }
    }
    return out;
}

std::vector<std::string> AiProviderRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(_providers.size());
    for (const auto& [name, provider] : _providers) {
        out.push_back(name);
    }
    return out;
}

} // namespace vcmd
