#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::config {
namespace {

using runbox::utils::LogLevel;

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    const auto lowered = runbox::utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    // Trailing garbage ("12abc") counts as unparsable.
    std::size_t consumed = 0;
    int parsed = fallback;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        runbox::utils::Log(LogLevel::kWarn, "config", "ignoring non-integer value",
                           {{"value", value}});
        return fallback;
    }
    return parsed;
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto from_env = GetEnv("RUNBOX_CONFIG");
    if (!from_env.empty()) {
        return std::filesystem::path(from_env);
    }
    return GetHomePath() / ".runbox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        if (server.contains("host") && server["host"].is_string()) {
            config.server.host = server["host"].get<std::string>();
        }
        if (server.contains("port") && server["port"].is_number_integer()) {
            config.server.port = server["port"].get<int>();
        }
        if (server.contains("maxBodyBytes") && server["maxBodyBytes"].is_number_unsigned()) {
            config.server.max_body_bytes = server["maxBodyBytes"].get<std::size_t>();
        }
    }

    if (data.contains("workspace") && data["workspace"].is_object()) {
        const auto& workspace = data["workspace"];
        if (workspace.contains("root") && workspace["root"].is_string()) {
            config.workspace.root = workspace["root"].get<std::string>();
        }
    }

    if (data.contains("runner") && data["runner"].is_object()) {
        const auto& runner = data["runner"];
        if (runner.contains("pythonInterpreter") && runner["pythonInterpreter"].is_string()) {
            config.runner.python_interpreter = runner["pythonInterpreter"].get<std::string>();
        }
        if (runner.contains("timeoutS") && runner["timeoutS"].is_number_integer()) {
            config.runner.timeout_s = runner["timeoutS"].get<int>();
        }
        if (runner.contains("cleanupAfterRun") && runner["cleanupAfterRun"].is_boolean()) {
            config.runner.cleanup_after_run = runner["cleanupAfterRun"].get<bool>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto host = GetEnvFallback("RUNBOX_SERVER__HOST", "RUNBOX_SERVER_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("RUNBOX_SERVER__PORT", "RUNBOX_SERVER_PORT");
    if (!port.empty()) {
        config.server.port = ParseInt(port, config.server.port);
    }

    const auto max_body = GetEnvFallback(
        "RUNBOX_SERVER__MAX_BODY_BYTES",
        "RUNBOX_SERVER_MAX_BODY_BYTES");
    if (!max_body.empty()) {
        const auto value = ParseInt(max_body, static_cast<int>(config.server.max_body_bytes));
        if (value > 0) {
            config.server.max_body_bytes = static_cast<std::size_t>(value);
        }
    }

    const auto workspace = GetEnvFallback("RUNBOX_WORKSPACE__ROOT", "RUNBOX_WORKSPACE_ROOT");
    if (!workspace.empty()) {
        config.workspace.root = workspace;
    }

    const auto interpreter = GetEnvFallback(
        "RUNBOX_RUNNER__PYTHON_INTERPRETER",
        "RUNBOX_RUNNER_PYTHON_INTERPRETER");
    if (!interpreter.empty()) {
        config.runner.python_interpreter = interpreter;
    }

    const auto timeout = GetEnvFallback("RUNBOX_RUNNER__TIMEOUT_S", "RUNBOX_RUNNER_TIMEOUT_S");
    if (!timeout.empty()) {
        config.runner.timeout_s = ParseInt(timeout, config.runner.timeout_s);
    }

    const auto cleanup = GetEnvFallback(
        "RUNBOX_RUNNER__CLEANUP_AFTER_RUN",
        "RUNBOX_RUNNER_CLEANUP_AFTER_RUN");
    if (!cleanup.empty()) {
        config.runner.cleanup_after_run = ParseBool(cleanup);
    }

    const auto level = GetEnvFallback("RUNBOX_LOGGING__LEVEL", "RUNBOX_LOGGING_LEVEL");
    if (!level.empty()) {
        config.logging.level = level;
    }
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            runbox::utils::Log(LogLevel::kWarn, "config", "failed to parse config; using defaults",
                               {{"path", path.string()}});
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

}  // namespace runbox::config
