#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <scenelink/config/ShimConfig.h>
#include <scenelink/engine/BasicEngine.h>
#include <scenelink/host/SimulatedHost.h>
#include <scenelink/logging/logging.h>
#include <scenelink/runtime/EngineLifecycleCoordinator.h>
#include <scenelink/version.hpp>
#include <scenelink/workspace/DirectoryWorkspaceProvider.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace scenelink;

namespace {

// Script console: everything the shim logs ends up on stderr, script output on stdout.
class StderrConsole : public host::IHostConsole {
public:
    void displayInfo(const std::string& line) override { std::cerr << line << '\n'; }
    void displayWarning(const std::string& line) override {
        std::cerr << "WARNING: " << line << '\n';
    }
    void displayError(const std::string& line) override { std::cerr << "ERROR: " << line << '\n'; }
};

std::vector<std::string> splitWords(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> words;
    std::string w;
    while (in >> w)
        words.push_back(w);
    return words;
}

void printState(const runtime::EngineLifecycleCoordinator& coordinator) {
    auto snap = coordinator.snapshot();
    std::cout << "state=" << runtime::engineStateName(snap.state);
    std::cout << " context=" << (snap.context ? snap.context->toString() : std::string("-"));
    std::cout << " engine=" << (coordinator.currentEngine() ? "yes" : "no");
    std::cout << " indicator=" << (coordinator.isDisabledIndicatorShown() ? "on" : "off");
    std::cout << " watching=";
    if (!coordinator.isWatching())
        std::cout << "no";
    else
        std::cout << (coordinator.watcher().isRunOnce() ? "once" : "persistent");
    std::cout << '\n';
}

// Reports @p steps evenly spaced progress values, then optionally fails.
jobs::JobAction makeScriptJob(int steps, bool fail) {
    return [steps, fail](jobs::JobArgs& args) {
        for (int i = 1; i <= steps; ++i)
            jobs::reportProgress(args, i * 100 / steps);
        if (fail)
            throw std::runtime_error("job failed on request");
    };
}

int replay(std::istream& script, host::SimulatedHost& host,
           runtime::EngineLifecycleCoordinator& coordinator) {
    std::string line;
    int lineNo = 0;
    while (std::getline(script, line)) {
        ++lineNo;
        auto words = splitWords(line);
        if (words.empty() || words.front().rfind("#", 0) == 0)
            continue;

        const auto& cmd = words.front();
        if (cmd == "open" && words.size() == 2) {
            host.openDocument(words[1]);
        } else if (cmd == "save" && words.size() == 1) {
            host.saveDocument();
        } else if (cmd == "save" && words.size() == 2) {
            host.saveDocumentAs(words[1]);
        } else if (cmd == "new" && words.size() == 1) {
            host.newDocument();
        } else if (cmd == "exit" && words.size() == 1) {
            host.exitHost();
        } else if (cmd == "job" && (words.size() == 3 || words.size() == 4)) {
            auto* engine = coordinator.currentEngine();
            int steps = 0;
            try {
                steps = std::stoi(words[2]);
            } catch (const std::exception&) {
                steps = -1;
            }
            if (steps <= 0) {
                spdlog::error("line {}: job steps must be a positive number", lineNo);
                return 2;
            }
            if (!engine) {
                std::cout << "job '" << words[1] << "' rejected: no engine\n";
            } else {
                bool fail = words.size() == 4 && words[3] == "fail";
                engine->jobQueue().enqueue(words[1], makeScriptJob(steps, fail));
            }
        } else if (cmd == "drain" && words.size() == 1) {
            if (auto* engine = coordinator.currentEngine()) {
                auto stats = engine->jobQueue().drain(host);
                std::cout << "drained executed=" << stats.executed << " failed=" << stats.failed
                          << '\n';
            } else {
                std::cout << "drain skipped: no engine\n";
            }
        } else {
            spdlog::error("line {}: cannot parse '{}'", lineNo, line);
            return 2;
        }
        printState(coordinator);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"SceneLink replay - drive the engine lifecycle from a script", "scenelink-replay"};
    app.set_version_flag("--version", SCENELINK_VERSION_LONG_STRING);

    std::string configPath;
    std::string scriptPath;
    std::string logLevel;
    std::string platform = "linux64";
    std::string hostVersion = "2024.1";

    app.add_option("-c,--config", configPath, "Configuration file (TOML)");
    app.add_option("-s,--script", scriptPath, "Script to replay (stdin when omitted)")
        ->check(CLI::ExistingFile);
    app.add_option("-l,--log-level", logLevel, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_option("--platform", platform, "Platform reported by the simulated host")
        ->default_val("linux64");
    app.add_option("--host-version", hostVersion, "Version reported by the simulated host")
        ->default_val("2024.1");
    CLI11_PARSE(app, argc, argv);

    try {
        auto cfg = config::loadShimConfig(configPath);
        if (!cfg) {
            std::cerr << "Failed to load configuration: " << cfg.error().message << '\n';
            return 1;
        }
        if (!logLevel.empty())
            cfg.value().logging.level = logLevel;

        StderrConsole console;
        if (auto logged = logging::configureLogging(cfg.value(), &console); !logged) {
            std::cerr << logged.error().message << '\n';
            return 1;
        }

        host::SimulatedHost host;
        workspace::DirectoryWorkspaceProvider workspaces(cfg.value().workspaces);
        engine::BasicEngineFactory factory(cfg.value().engine,
                                           engine::HostInfo{platform, hostVersion, false});

        runtime::EngineLifecycleCoordinator coordinator({host, host, workspaces, factory},
                                                        cfg.value().engine.name);
        coordinator.start();
        printState(coordinator);

        int rc = 0;
        if (scriptPath.empty()) {
            rc = replay(std::cin, host, coordinator);
        } else {
            std::ifstream in(scriptPath);
            if (!in) {
                spdlog::error("Cannot open script {}", scriptPath);
                return 1;
            }
            rc = replay(in, host, coordinator);
        }

        coordinator.shutdown();
        printState(coordinator);
        return rc;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
