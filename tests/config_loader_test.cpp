#include "config/config_loader.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include "test_support.hpp"

using nlohmann::json;
using runbox::config::ApplyConfigFromJson;
using runbox::config::ApplyEnvOverrides;
using runbox::config::Config;
using runbox::config::LoadConfig;
using runbox::test_support::TempDir;

namespace {

const std::vector<std::string> kEnvVars = {
    "RUNBOX_CONFIG",
    "RUNBOX_SERVER__HOST", "RUNBOX_SERVER_HOST",
    "RUNBOX_SERVER__PORT", "RUNBOX_SERVER_PORT",
    "RUNBOX_SERVER__MAX_BODY_BYTES", "RUNBOX_SERVER_MAX_BODY_BYTES",
    "RUNBOX_WORKSPACE__ROOT", "RUNBOX_WORKSPACE_ROOT",
    "RUNBOX_RUNNER__PYTHON_INTERPRETER", "RUNBOX_RUNNER_PYTHON_INTERPRETER",
    "RUNBOX_RUNNER__TIMEOUT_S", "RUNBOX_RUNNER_TIMEOUT_S",
    "RUNBOX_RUNNER__CLEANUP_AFTER_RUN", "RUNBOX_RUNNER_CLEANUP_AFTER_RUN",
    "RUNBOX_LOGGING__LEVEL", "RUNBOX_LOGGING_LEVEL",
};

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override { ClearEnv(); }
    void TearDown() override { ClearEnv(); }

    static void ClearEnv() {
        for (const auto& name : kEnvVars) {
            ::unsetenv(name.c_str());
        }
    }

    TempDir tmp_;
};

}  // namespace

TEST_F(ConfigLoaderTest, defaults) {
    const Config config{};
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 5000);
    EXPECT_EQ(config.server.max_body_bytes, 1024u * 1024u);
    EXPECT_EQ(config.workspace.root, "./workspace");
    EXPECT_EQ(config.runner.python_interpreter, "python3");
    EXPECT_EQ(config.runner.timeout_s, 30);
    EXPECT_TRUE(config.runner.cleanup_after_run);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigLoaderTest, apply_json) {
    Config config{};
    ApplyConfigFromJson(config, json::parse(R"({
        "server": {"host": "127.0.0.1", "port": 8080, "maxBodyBytes": 4096},
        "workspace": {"root": "/srv/runbox"},
        "runner": {"pythonInterpreter": "python3.11", "timeoutS": 0, "cleanupAfterRun": false},
        "logging": {"level": "debug"}
    })"));
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.max_body_bytes, 4096u);
    EXPECT_EQ(config.workspace.root, "/srv/runbox");
    EXPECT_EQ(config.runner.python_interpreter, "python3.11");
    EXPECT_EQ(config.runner.timeout_s, 0);
    EXPECT_FALSE(config.runner.cleanup_after_run);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigLoaderTest, wrong_types_are_ignored) {
    Config config{};
    ApplyConfigFromJson(config, json::parse(R"({
        "server": {"port": "8080", "maxBodyBytes": -1},
        "runner": {"timeoutS": 1.5, "cleanupAfterRun": "no"},
        "workspace": "nope"
    })"));
    EXPECT_EQ(config.server.port, 5000);
    EXPECT_EQ(config.server.max_body_bytes, 1024u * 1024u);
    EXPECT_EQ(config.runner.timeout_s, 30);
    EXPECT_TRUE(config.runner.cleanup_after_run);
    EXPECT_EQ(config.workspace.root, "./workspace");
}

TEST_F(ConfigLoaderTest, load_from_file) {
    const auto path = tmp_.path() / "config.json";
    std::ofstream(path) << R"({"server": {"port": 6000}, "runner": {"timeoutS": 5}})";

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.server.port, 6000);
    EXPECT_EQ(config.runner.timeout_s, 5);
    EXPECT_EQ(config.server.host, "0.0.0.0");
}

TEST_F(ConfigLoaderTest, missing_or_malformed_file_keeps_defaults) {
    EXPECT_EQ(LoadConfig(tmp_.path() / "absent.json").server.port, 5000);

    const auto path = tmp_.path() / "broken.json";
    std::ofstream(path) << "{ server: ";
    EXPECT_EQ(LoadConfig(path).server.port, 5000);
}

TEST_F(ConfigLoaderTest, env_overrides_file) {
    const auto path = tmp_.path() / "config.json";
    std::ofstream(path) << R"({"server": {"port": 6000}, "workspace": {"root": "/from/file"}})";
    ::setenv("RUNBOX_SERVER__PORT", "7000", 1);
    ::setenv("RUNBOX_WORKSPACE_ROOT", "/from/env", 1);
    ::setenv("RUNBOX_RUNNER__CLEANUP_AFTER_RUN", "off", 1);
    ::setenv("RUNBOX_RUNNER__PYTHON_INTERPRETER", "/usr/bin/python3", 1);
    ::setenv("RUNBOX_LOGGING__LEVEL", "warn", 1);

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.server.port, 7000);
    EXPECT_EQ(config.workspace.root, "/from/env");
    EXPECT_FALSE(config.runner.cleanup_after_run);
    EXPECT_EQ(config.runner.python_interpreter, "/usr/bin/python3");
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigLoaderTest, double_underscore_spelling_wins) {
    ::setenv("RUNBOX_RUNNER__TIMEOUT_S", "12", 1);
    ::setenv("RUNBOX_RUNNER_TIMEOUT_S", "99", 1);
    Config config{};
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.runner.timeout_s, 12);
}

TEST_F(ConfigLoaderTest, unparsable_numbers_keep_previous_value) {
    ::setenv("RUNBOX_SERVER_PORT", "eighty", 1);
    ::setenv("RUNBOX_RUNNER__TIMEOUT_S", "99999999999999999999", 1);
    Config config{};
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.server.port, 5000);
    EXPECT_EQ(config.runner.timeout_s, 30);
}

TEST_F(ConfigLoaderTest, trailing_garbage_is_unparsable) {
    ::setenv("RUNBOX_SERVER__PORT", "8080abc", 1);
    ::setenv("RUNBOX_RUNNER__TIMEOUT_S", "12 ", 1);
    Config config{};
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.server.port, 5000);
    EXPECT_EQ(config.runner.timeout_s, 30);
}

TEST_F(ConfigLoaderTest, boolean_spellings) {
    for (const std::string value : {"1", "true", "YES", "On"}) {
        ::setenv("RUNBOX_RUNNER__CLEANUP_AFTER_RUN", value.c_str(), 1);
        Config config{};
        config.runner.cleanup_after_run = false;
        ApplyEnvOverrides(config);
        EXPECT_TRUE(config.runner.cleanup_after_run) << value;
    }
}

TEST_F(ConfigLoaderTest, default_path_honours_runbox_config) {
    ::setenv("RUNBOX_CONFIG", "/etc/runbox/config.json", 1);
    EXPECT_EQ(runbox::config::DefaultConfigPath(), std::filesystem::path("/etc/runbox/config.json"));
    ::unsetenv("RUNBOX_CONFIG");
    EXPECT_EQ(runbox::config::DefaultConfigPath().filename(), "config.json");
}
