#pragma once

#include <cstddef>
#include <string>

namespace runbox::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 5000;
    std::size_t max_body_bytes = 1024 * 1024;
};

struct WorkspaceConfig {
    std::string root = "./workspace";
};

struct RunnerConfig {
    std::string python_interpreter = "python3";
    // 0 disables the deadline.
    int timeout_s = 30;
    bool cleanup_after_run = true;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ServerConfig server;
    WorkspaceConfig workspace;
    RunnerConfig runner;
    LoggingConfig logging;
};

}  // namespace runbox::config
