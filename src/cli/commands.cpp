#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "runner/execution_engine.hpp"
#include "runner/languages.hpp"
#include "runner/request_validator.hpp"
#include "server/http_server.hpp"
#include "server/run_code_handler.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "workspace/workspace.hpp"

namespace {

using runbox::utils::LogLevel;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage: runbox_cli serve [--config PATH]\n"
              << "       runbox_cli exec FILENAME [--language NAME] [--config PATH] < code"
              << std::endl;
}

struct Options {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> config_path;
    std::optional<std::string> language;
};

std::optional<Options> ParseOptions(int argc, char** argv) {
    if (argc < 2) {
        return std::nullopt;
    }
    Options options{};
    options.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" || arg == "--language") {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << std::endl;
                return std::nullopt;
            }
            (arg == "--config" ? options.config_path : options.language) = argv[++i];
        } else {
            options.positional.push_back(arg);
        }
    }
    return options;
}

runbox::config::Config LoadConfig(const Options& options) {
    auto config = options.config_path
        ? runbox::config::LoadConfig(std::filesystem::path(*options.config_path))
        : runbox::config::LoadConfig();
    runbox::utils::LogConfig log_config{};
    log_config.min_level = runbox::utils::ParseLogLevel(config.logging.level);
    runbox::utils::ConfigureLogging(log_config);
    return config;
}

runbox::runner::EngineOptions MakeEngineOptions(const runbox::config::RunnerConfig& runner) {
    runbox::runner::EngineOptions options{};
    options.timeout = std::chrono::seconds(runner.timeout_s > 0 ? runner.timeout_s : 0);
    options.cleanup_after_run = runner.cleanup_after_run;
    return options;
}

int RunServe(const Options& options) {
    const auto config = LoadConfig(options);

    runbox::workspace::Workspace workspace(config.workspace.root);
    if (!workspace.EnsureExists()) {
        std::cerr << "Failed to create workspace " << workspace.Root() << std::endl;
        return 1;
    }
    const auto languages = runbox::runner::BuildLanguageTable(config.runner);
    runbox::runner::RequestValidator validator(workspace, languages);
    runbox::runner::ExecutionEngine engine(workspace, languages, MakeEngineOptions(config.runner));
    runbox::server::RunCodeHandler handler(validator, engine);
    runbox::server::HttpServer http_server(config.server, handler);

    runbox::utils::Log(LogLevel::kInfo, "serve", "starting",
                       {{"workspace", workspace.Root().string()},
                        {"languages", runbox::utils::Join(languages.Names(), ",")},
                        {"timeout_s", std::to_string(engine.Options().timeout.count())}});

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_ok{true};
    std::thread http_thread([&http_server, &listen_ok]() {
        listen_ok.store(http_server.Listen());
    });

    while (g_signal == 0 && listen_ok.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    runbox::utils::Log(LogLevel::kInfo, "serve", "stopped");
    return listen_ok.load() ? 0 : 1;
}

int RunExec(const Options& options) {
    if (options.positional.size() != 1) {
        PrintUsage();
        return 1;
    }
    const auto config = LoadConfig(options);

    runbox::workspace::Workspace workspace(config.workspace.root);
    const auto languages = runbox::runner::BuildLanguageTable(config.runner);
    runbox::runner::RequestValidator validator(workspace, languages);
    runbox::runner::ExecutionEngine engine(workspace, languages, MakeEngineOptions(config.runner));
    runbox::server::RunCodeHandler handler(validator, engine);

    const std::string code((std::istreambuf_iterator<char>(std::cin)),
                           std::istreambuf_iterator<char>());
    nlohmann::json payload = {{"code", code}, {"filename", options.positional.front()}};
    if (options.language) {
        payload["language"] = *options.language;
    }

    runbox::server::HttpReply reply{};
    try {
        reply = handler.Handle(payload);
    } catch (const std::exception& ex) {
        runbox::utils::Log(LogLevel::kError, "exec", "unhandled exception", {{"what", ex.what()}});
        reply = {500, runbox::server::BuildErrorJson("Internal server error")};
    }
    std::cout << runbox::server::DumpJson(reply.body, 2) << std::endl;
    return reply.status == 200 ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = ParseOptions(argc, argv);
    if (!options) {
        PrintUsage();
        return 1;
    }
    if (options->command == "serve") {
        return RunServe(*options);
    }
    if (options->command == "exec") {
        return RunExec(*options);
    }
    PrintUsage();
    return 1;
}
