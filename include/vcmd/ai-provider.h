#pragma once

#include <vcmd/process-session.h>
#include <vcmd/result.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vcmd {

struct AiOptions {
    std::string workingDir;
    std::string systemPrompt;
    std::string model;
    std::vector<std::string> additionalArgs;
};

//=============================================================================
// AiProvider - how to launch an AI assistant CLI in a command-role pane
//=============================================================================

class AiProvider {
public:
    using Ptr = std::shared_ptr<AiProvider>;

    virtual ~AiProvider() = default;

    virtual std::string name() const = 0;
    virtual std::string executable() const = 0;
    virtual std::vector<std::string> defaultArgs() const = 0;
    virtual SpawnConfig spawnConfig(const AiOptions& options) const = 0;

    // Executable found on PATH
    virtual bool isAvailable() const;

    // Built-in providers
    static Ptr claudeCode();
    static Ptr aider();
};

class AiProviderRegistry {
public:
    // Registry holding every built-in provider, claude-code as default
    static AiProviderRegistry withBuiltins();

    void add(AiProvider::Ptr provider);
    Result<void> setDefault(const std::string& name);
    const std::string& defaultName() const { return _defaultName; }

    // Empty name: the default provider
    Result<AiProvider::Ptr> get(const std::string& name = "") const;

    std::vector<AiProvider::Ptr> all() const;
    std::vector<AiProvider::Ptr> available() const;
    std::vector<std::string> names() const;

private:
    std::map<std::string, AiProvider::Ptr> _providers;
    std::string _defaultName;
};

} // namespace vcmd
