//=============================================================================
// vcmd - terminal commander
//
// Full-screen host for an AI assistant pane and a shell mini-buffer, each an
// interactive process pane driven by a libvterm screen behind a pty.
//=============================================================================

#include <vcmd/commander.h>
#include <vcmd/config.h>
#include <vcmd/base/event-loop.h>
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <ytrace/ytrace.hpp>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iostream>

namespace {

// The terminal belongs to the panes; logs go to a file
void setupLogging(const vcmd::Config& config) {
    std::filesystem::path logFile = config.get<std::string>(vcmd::Config::KEY_LOG_FILE, "");
    if (logFile.empty()) {
        logFile = vcmd::Config::getXDGStatePath() / "vcmd.log";
    }
    std::error_code ec;
    std::filesystem::create_directories(logFile.parent_path(), ec);

    try {
        auto logger = spdlog::basic_logger_mt("vcmd", logFile.string());
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "vcmd: cannot open log file " << logFile << ": " << e.what() << "\n";
    }

    auto level = spdlog::level::from_str(config.get<std::string>(vcmd::Config::KEY_LOG_LEVEL, "info"));
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::cfg::load_env_levels();
}

} // namespace

int main(int argc, const char** argv) {
    std::setlocale(LC_ALL, "");
    // A clipboard tool exiting early must not take the commander down;
    // spawned sessions restore the default before exec
    std::signal(SIGPIPE, SIG_IGN);

    args::ArgumentParser parser("vcmd", "Terminal commander with an AI assistant pane and a shell mini-buffer.");
    parser.Prog("vcmd");
    args::HelpFlag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "path",
        "Config file (default: ~/.config/vcmd/config.yaml)", {'c', "config"});
    args::ValueFlag<std::string> shellFlag(parser, "cmd", "Shell for the mini-buffer", {"shell"});
    args::ValueFlag<std::string> aiFlag(parser, "provider", "AI provider (claude-code, aider)", {"ai"});
    args::ValueFlag<std::string> logLevelFlag(parser, "level",
        "Log level (trace, debug, info, warn, error, off)", {"log-level"});
    args::ValueFlag<int> scrollbackFlag(parser, "lines", "Scrollback capacity per pane", {"scrollback"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }

    YAML::Node overrides;
    if (shellFlag) overrides["shell"]["command"] = args::get(shellFlag);
    if (aiFlag) overrides["ai"]["provider"] = args::get(aiFlag);
    if (logLevelFlag) overrides["log"]["level"] = args::get(logLevelFlag);
    if (scrollbackFlag) overrides["scrollback"]["lines"] = args::get(scrollbackFlag);

    auto configRes = vcmd::Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!configRes) {
        std::cerr << "vcmd: " << vcmd::error_msg(configRes) << "\n";
        return 1;
    }
    auto config = *configRes;
    setupLogging(*config);
    yinfo("vcmd starting, config: {}", config->loadedFrom().empty() ? "defaults" : config->loadedFrom());

    auto loopRes = vcmd::base::EventLoop::instance();
    if (!loopRes) {
        std::cerr << "vcmd: " << vcmd::error_msg(loopRes) << "\n";
        return 1;
    }

    auto commanderRes = vcmd::Commander::create(config, *loopRes);
    if (!commanderRes) {
        yerror("Failed to initialize vcmd: {}", vcmd::error_msg(commanderRes));
        std::cerr << "vcmd: " << vcmd::error_msg(commanderRes) << "\n";
        return 1;
    }
    auto commander = *commanderRes;
    commander->setNotifyCallback([](vcmd::Notification, const std::string& role, const std::string& detail) {
        yinfo("session exited: {}{}{}", role, detail.empty() ? "" : ": ", detail);
    });

    auto runRes = commander->run();
    auto shutdownRes = commander->shutdown();
    if (!runRes) {
        yerror("vcmd run failed: {}", vcmd::error_msg(runRes));
        std::cerr << "vcmd: " << vcmd::error_msg(runRes) << "\n";
        return 1;
    }
    if (!shutdownRes) {
        yerror("vcmd shutdown failed: {}", vcmd::error_msg(shutdownRes));
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
