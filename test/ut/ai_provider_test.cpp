//=============================================================================
// AI Provider Tests
//
// Covers: built-in providers, spawn configuration, registry defaults
//=============================================================================

#include <boost/ut.hpp>
#include <vcmd/ai-provider.h>
#include <algorithm>

using namespace boost::ut;
using namespace vcmd;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

suite ai_provider_tests = [] {
    "claude-code spawn configuration"_test = [] {
        auto provider = AiProvider::claudeCode();
        expect(provider->name() == "claude-code");
        expect(provider->executable() == "claude");

        AiOptions options;
        options.workingDir = "/tmp/project";
        options.model = "opus";
        options.additionalArgs = {"--verbose"};
        SpawnConfig spawn = provider->spawnConfig(options);
        expect(spawn.command == "claude");
        expect(spawn.workingDir == "/tmp/project");
        expect(contains(spawn.args, "--model"));
        expect(contains(spawn.args, "opus"));
        expect(spawn.args.back() == "--verbose");
    };

    "aider spawn configuration"_test = [] {
        auto provider = AiProvider::aider();
        SpawnConfig spawn = provider->spawnConfig(AiOptions{});
        expect(spawn.command == "aider");
        expect(contains(spawn.args, "--no-auto-commits"));
        expect(!contains(spawn.args, "--model"));
    };

    "registry defaults to claude-code"_test = [] {
        auto registry = AiProviderRegistry::withBuiltins();
        expect(registry.defaultName() == "claude-code");
        auto res = registry.get();
        expect(fatal(res.has_value()));
        expect((*res)->name() == "claude-code");
        auto names = registry.names();
        expect(names == std::vector<std::string>{"aider", "claude-code"});
    };

    "unknown provider is an error"_test = [] {
        auto registry = AiProviderRegistry::withBuiltins();
        expect(!registry.get("copilot"));
        expect(!registry.setDefault("copilot"));
        expect(registry.defaultName() == "claude-code");
        expect(registry.setDefault("aider").has_value());
        expect((*registry.get())->name() == "aider");
    };

    "available providers are on PATH"_test = [] {
        auto registry = AiProviderRegistry::withBuiltins();
        for (const auto& provider : registry.available()) {
            expect(!findExecutable(provider->executable()).empty());
        }
        expect(registry.all().size() == 2_u);
    };
};
