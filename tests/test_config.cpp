#include <gtest/gtest.h>
#include "utils/config.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace codemend;
using namespace codemend::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().reset();
        testFile = std::filesystem::temp_directory_path() /
                   ("codemend_config_test_" + std::to_string(::getpid()) + ".conf");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
        Config::instance().reset();
    }

    std::filesystem::path testFile;
};

TEST_F(ConfigTest, Defaults) {
    Config& cfg = Config::instance();
    auto sandbox = cfg.getSandboxConfig();
    EXPECT_EQ(sandbox.backend, sandbox::BackendKind::PROCESS);
    EXPECT_EQ(sandbox.timeoutMs, 30000u);
    EXPECT_EQ(sandbox.memoryLimit, 512ULL * 1024 * 1024);
    EXPECT_DOUBLE_EQ(sandbox.cpuLimit, 1.0);
    EXPECT_FALSE(sandbox.networkDisabled);
    EXPECT_EQ(sandbox.image, "python:3.11-slim");
    EXPECT_EQ(sandbox.shell, "/bin/sh");

    auto engine = cfg.getEngineOptions();
    EXPECT_EQ(engine.maxFixAttempts, 3);
    EXPECT_TRUE(engine.executionEnabled);
    EXPECT_TRUE(engine.selfHealingEnabled);
    EXPECT_EQ(engine.workerThreads, 1u);

    auto runtime = cfg.getRuntimeProfile();
    EXPECT_EQ(runtime.interpreter, "python3");
    EXPECT_EQ(runtime.manifestName, "requirements.txt");
    std::vector<std::string> names = {"main.py", "app.py", "run.py", "__main__.py"};
    EXPECT_EQ(runtime.mainNames, names);
}

TEST_F(ConfigTest, LoadFile) {
    {
        std::ofstream out(testFile);
        out << "# comment\n";
        out << "sandbox.backend = docker\n";
        out << "sandbox.timeout_ms=1500\n";
        out << "sandbox.network_disabled = yes\n";
        out << "engine.max_fix_attempts=5\n";
        out << "runtime.main_names = main.sh, run.sh\n";
        out << "sandbox.image = \"python:3.12-slim\"\n";
        out << "not a pair\n";
    }
    Config& cfg = Config::instance();
    ASSERT_TRUE(cfg.load(testFile.string()));

    auto sandbox = cfg.getSandboxConfig();
    EXPECT_EQ(sandbox.backend, sandbox::BackendKind::DOCKER);
    EXPECT_EQ(sandbox.timeoutMs, 1500u);
    EXPECT_TRUE(sandbox.networkDisabled);
    EXPECT_EQ(sandbox.image, "python:3.12-slim");
    EXPECT_EQ(cfg.getEngineOptions().maxFixAttempts, 5);
    std::vector<std::string> names = {"main.sh", "run.sh"};
    EXPECT_EQ(sandbox.runtime.mainNames, names);
}

TEST_F(ConfigTest, MissingFile) {
    EXPECT_FALSE(Config::instance().load("/nonexistent/codemend.conf"));
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    EXPECT_EQ(Config::environmentName("sandbox.timeout_ms"), "CODEMEND_SANDBOX_TIMEOUT_MS");
    ::setenv("CODEMEND_SANDBOX_TIMEOUT_MS", "2500", 1);
    ::setenv("CODEMEND_ENGINE_SELF_HEALING_ENABLED", "false", 1);
    Config& cfg = Config::instance();
    EXPECT_EQ(cfg.loadEnvironment(), 2u);
    ::unsetenv("CODEMEND_SANDBOX_TIMEOUT_MS");
    ::unsetenv("CODEMEND_ENGINE_SELF_HEALING_ENABLED");

    EXPECT_EQ(cfg.getSandboxConfig().timeoutMs, 2500u);
    EXPECT_FALSE(cfg.getEngineOptions().selfHealingEnabled);
}

TEST_F(ConfigTest, TypedGettersFallBack) {
    Config& cfg = Config::instance();
    cfg.set("x.int", "not a number");
    cfg.set("x.bool", "maybe");
    EXPECT_EQ(cfg.getInt("x.int", 7), 7);
    EXPECT_TRUE(cfg.getBool("x.bool", true));
    EXPECT_DOUBLE_EQ(cfg.getDouble("x.missing", 2.5), 2.5);
    EXPECT_EQ(cfg.getString("x.missing", "d"), "d");
}

TEST_F(ConfigTest, OverridesFlowIntoTypedViews) {
    Config& cfg = Config::instance();
    cfg.set("sandbox.backend", "Docker");
    cfg.set("sandbox.memory_limit_mb", 64);
    cfg.set("sandbox.cpu_limit", "0.5");
    cfg.set("sandbox.network_disabled", true);
    cfg.set("runtime.interpreter", "sh");
    cfg.set("runtime.main_names", " main.sh ,, run.sh ");
    cfg.set("engine.worker_threads", 0);
    cfg.set("engine.self_healing_enabled", false);

    auto sandbox = cfg.getSandboxConfig();
    EXPECT_EQ(sandbox.backend, sandbox::BackendKind::DOCKER);
    EXPECT_EQ(sandbox.memoryLimit, 64ULL * 1024 * 1024);
    EXPECT_DOUBLE_EQ(sandbox.cpuLimit, 0.5);
    EXPECT_TRUE(sandbox.networkDisabled);
    EXPECT_EQ(sandbox.runtime.interpreter, "sh");
    std::vector<std::string> names = {"main.sh", "run.sh"};
    EXPECT_EQ(sandbox.runtime.mainNames, names);

    auto engine = cfg.getEngineOptions();
    EXPECT_EQ(engine.workerThreads, 1u);
    EXPECT_FALSE(engine.selfHealingEnabled);
}

TEST_F(ConfigTest, EffectiveConfigAsJson) {
    Config& cfg = Config::instance();
    cfg.set("repair.command", "fix \"$1\"");
    cfg.set("log.file", std::string("\xff.log"));

    std::string dumped;
    ASSERT_NO_THROW(dumped = cfg.toJson());
    nlohmann::json j = nlohmann::json::parse(dumped);
    EXPECT_EQ(j["repair.command"].get<std::string>(), "fix \"$1\"");
    EXPECT_EQ(j["sandbox.timeout_ms"].get<std::string>(), "30000");
    EXPECT_EQ(j.size(), cfg.keys().size());
}

TEST_F(ConfigTest, KeysByPrefix) {
    auto keys = Config::instance().keys("repair.");
    std::vector<std::string> expected = {"repair.command", "repair.timeout_ms"};
    EXPECT_EQ(keys, expected);
}
