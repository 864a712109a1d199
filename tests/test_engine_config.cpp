#include <gtest/gtest.h>

#include "capsule/core/engine_config.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace capsule::core;
using json = nlohmann::json;

namespace {

class TempFile {
public:
    explicit TempFile(const std::string& contents) {
        path_ = std::filesystem::temp_directory_path() /
                ("capsule_config_" + std::to_string(getpid()) + "_" + std::to_string(counter_++) + ".json");
        std::ofstream(path_) << contents;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    const std::filesystem::path& Path() const { return path_; }

private:
    static inline int counter_ = 0;
    std::filesystem::path path_;
};

} // namespace

TEST(EngineConfigTest, DefaultsMatchServiceLimits) {
    EngineConfig config;
    EXPECT_EQ(config.mode, SandboxMode::IN_PROCESS);
    EXPECT_EQ(config.sandbox.timeout.count(), 30000);
    EXPECT_EQ(config.sandbox.memory_limit_mb, 128u);
    EXPECT_EQ(config.pool.min_instances, 2u);
    EXPECT_EQ(config.pool.max_instances, 10u);
    EXPECT_EQ(config.security.max_code_length, 50u * 1024u);
    EXPECT_EQ(config.python_executable, "python3");

    auto runtime = config.Runtime();
    EXPECT_EQ(runtime.python_executable, "python3");
    EXPECT_FALSE(runtime.policy.IsBuiltinAllowed("open"));
}

TEST(EngineConfigTest, ApplyJsonOverridesOnlyPresentKeys) {
    EngineConfig config;
    ApplyJson(json{
        {"mode", "worker"},
        {"sandbox", {{"timeoutMs", 1500}}},
        {"pool", {{"maxInstances", 3}}},
        {"security", {{"maxExecutionsPerMinute", 5}}},
        {"policy", {{"blockedModules", {"os"}}}}
    }, config);

    EXPECT_EQ(config.mode, SandboxMode::ISOLATED);
    EXPECT_EQ(config.sandbox.timeout.count(), 1500);
    EXPECT_EQ(config.sandbox.memory_limit_mb, 128u);
    EXPECT_EQ(config.pool.max_instances, 3u);
    EXPECT_EQ(config.pool.min_instances, 2u);
    EXPECT_EQ(config.security.max_executions_per_minute, 5u);
    EXPECT_EQ(config.security.max_code_length, 50u * 1024u);
    EXPECT_EQ(config.policy.blocked_modules, std::vector<std::string>{"os"});
    EXPECT_FALSE(config.policy.allowed_builtins.empty());
    EXPECT_EQ(config.log_level, "info");
}

TEST(EngineConfigTest, ApplyJsonRejectsUnknownMode) {
    EngineConfig config;
    EXPECT_THROW(ApplyJson(json{{"mode", "docker"}}, config), std::invalid_argument);
}

TEST(EngineConfigTest, LoadsConfigFile) {
    TempFile file(R"({"mode": "isolated", "logLevel": "debug", "pythonExecutable": "/usr/bin/python3",
                      "pool": {"minInstances": 0, "idleTimeoutMs": 0}})");

    auto config = LoadConfigFile(file.Path());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->mode, SandboxMode::ISOLATED);
    EXPECT_EQ(config->log_level, "debug");
    EXPECT_EQ(config->python_executable, "/usr/bin/python3");
    EXPECT_EQ(config->pool.min_instances, 0u);
    EXPECT_EQ(config->pool.idle_timeout.count(), 0);
}

TEST(EngineConfigTest, BadConfigFilesAreReported) {
    TempFile malformed("{ not json");
    EXPECT_FALSE(LoadConfigFile(malformed.Path()).has_value());

    TempFile wrong_type(R"({"sandbox": {"timeoutMs": "fast"}})");
    EXPECT_FALSE(LoadConfigFile(wrong_type.Path()).has_value());

    TempFile bad_mode(R"({"mode": "container"})");
    EXPECT_FALSE(LoadConfigFile(bad_mode.Path()).has_value());

    EXPECT_FALSE(LoadConfigFile("/nonexistent/capsule.json").has_value());
}

TEST(EngineConfigTest, EnvironmentOverridesModeAndInterpreter) {
    EngineConfig config;

    setenv("CAPSULE_ISOLATION", "isolated", 1);
    setenv("CAPSULE_PYTHON", "/opt/python/bin/python3", 1);
    ApplyEnvironment(config);
    EXPECT_EQ(config.mode, SandboxMode::ISOLATED);
    EXPECT_EQ(config.python_executable, "/opt/python/bin/python3");

    setenv("CAPSULE_ISOLATION", "bogus", 1);
    setenv("CAPSULE_PYTHON", "", 1);
    ApplyEnvironment(config);
    EXPECT_EQ(config.mode, SandboxMode::ISOLATED);
    EXPECT_EQ(config.python_executable, "/opt/python/bin/python3");

    unsetenv("CAPSULE_ISOLATION");
    unsetenv("CAPSULE_PYTHON");
}

TEST(EngineConfigTest, SerializesAllSections) {
    EngineConfig config;
    config.mode = SandboxMode::ISOLATED;
    json j = config;

    EXPECT_EQ(j["mode"], "isolated");
    EXPECT_EQ(j["sandbox"]["timeoutMs"], 30000);
    EXPECT_EQ(j["pool"]["maxInstances"], 10);
    EXPECT_TRUE(j["security"].contains("blockedPatterns"));
    EXPECT_TRUE(j["policy"].contains("allowedBuiltins"));

    EngineConfig reloaded;
    ApplyJson(j, reloaded);
    EXPECT_EQ(json(reloaded), j);
}
