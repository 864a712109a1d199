#include <gtest/gtest.h>

#include "capsule/core/isolated_sandbox.hpp"
#include "test_helpers.hpp"

#include <sys/wait.h>
#include <unistd.h>

using namespace capsule::core;
using capsule::testing::SampleCapabilities;
using capsule::testing::SampleTables;
using capsule::testing::TestRuntime;

namespace {

SandboxOptions Limits(long long timeout_ms, std::size_t memory_mb = 128) {
    SandboxOptions options;
    options.timeout = std::chrono::milliseconds(timeout_ms);
    options.memory_limit_mb = memory_mb;
    return options;
}

/// Scripts that try to reach host namespaces through objects placed in scope
const char* const kEscapeScripts[] = {
    "return console.log.__globals__['_builtins'].__import__('os').environ.get('HOME')",
    "return print.__self__",
    "return pg.core.listTables.__call__",
    "return type(pg).__mro__[-1].__subclasses__()",
    "return [c for c in object.__subclasses__()]",
    "return (1).__class__",
    "def walk():\n"
    "    yield steps.gi_frame.f_back\n"
    "steps = walk()\n"
    "frame = next(steps)\n"
    "return frame.f_globals['_builtins'].open('/etc/hostname').read()",
};

} // namespace

class IsolatedSandboxTest : public ::testing::Test {
protected:
    IsolatedSandbox sandbox_{Limits(5000), TestRuntime()};
};

TEST_F(IsolatedSandboxTest, ReturnsScriptValue) {
    auto result = sandbox_.Execute("return 2 + 2", {});
    ASSERT_TRUE(result.success) << result.error.value_or("") << "\n" << result.stack.value_or("");
    EXPECT_EQ(result.result, 4);
    EXPECT_GT(result.metrics.wall_time_ms, 0.0);
    EXPECT_GT(result.metrics.memory_used_mb, 0.0);
}

TEST_F(IsolatedSandboxTest, CapabilityCallsCrossTheBridge) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto result = sandbox_.Execute(
        "a = await pg.core.listTables()\n"
        "b = await pg.core.listTables()\n"
        "return a + b",
        SampleCapabilities(calls));
    ASSERT_TRUE(result.success) << result.error.value_or("");
    ASSERT_TRUE(result.result.is_array());
    EXPECT_EQ(result.result.size(), 4u);
    EXPECT_EQ(result.result[0], SampleTables()[0]);
    EXPECT_EQ(calls->load(), 2);
}

TEST_F(IsolatedSandboxTest, PassesParameterObjects) {
    auto result = sandbox_.Execute(
        "r = await pg.core.readQuery({'sql': 'select 1', 'params': [1, 2]})\n"
        "return r['params']",
        SampleCapabilities());
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.result["sql"], "select 1");
    EXPECT_EQ(result.result["params"], nlohmann::json::array({1, 2}));
}

TEST_F(IsolatedSandboxTest, CapabilityFailureSurfacesAsCapabilityError) {
    auto result = sandbox_.Execute("return await pg.core.fail()", SampleCapabilities());
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->rfind("CapabilityError:", 0), 0u);
    EXPECT_NE(result.error->find("does not exist"), std::string::npos);
}

TEST_F(IsolatedSandboxTest, ScriptErrorsCarryTypeAndStack) {
    auto result = sandbox_.Execute("return 1 / 0", {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or("").rfind("ZeroDivisionError:", 0), 0u);
    ASSERT_TRUE(result.stack.has_value());
    EXPECT_NE(result.stack->find("Traceback"), std::string::npos);
}

TEST_F(IsolatedSandboxTest, HostNamesAreUnreachable) {
    auto imported = sandbox_.Execute("import os\nreturn os.getcwd()", {});
    EXPECT_FALSE(imported.success);
    EXPECT_EQ(imported.error.value_or("").rfind("ImportError:", 0), 0u);

    auto environ = sandbox_.Execute("return os.environ", {});
    EXPECT_FALSE(environ.success);
    EXPECT_EQ(environ.error.value_or("").rfind("NameError:", 0), 0u);
}

TEST_F(IsolatedSandboxTest, ExposedObjectsDoNotLeadBackToTheHost) {
    for (const char* code : kEscapeScripts) {
        auto result = sandbox_.Execute(code, SampleCapabilities());
        EXPECT_FALSE(result.success) << code << "\n-> " << result.result.dump();
        EXPECT_EQ(result.error.value_or("").rfind("SyntaxError:", 0), 0u) << code;
        EXPECT_NE(result.error.value_or("").find("not allowed"), std::string::npos) << code;
    }
}

TEST_F(IsolatedSandboxTest, ConsoleOutputIsCollectedFromTheWorker) {
    auto result = sandbox_.Execute("print('from worker')\nconsole.warn('careful')\nreturn None", {});
    ASSERT_TRUE(result.success) << result.error.value_or("");

    auto console = sandbox_.GetConsoleOutput();
    ASSERT_EQ(console.size(), 2u);
    EXPECT_EQ(console[0], "from worker");
    EXPECT_EQ(console[1], "[WARN] careful");

    sandbox_.ClearConsoleOutput();
    EXPECT_TRUE(sandbox_.GetConsoleOutput().empty());
}

TEST_F(IsolatedSandboxTest, EachExecutionGetsAFreshWorker) {
    ASSERT_TRUE(sandbox_.Execute("counter = 41\nreturn counter", {}).success);
    auto result = sandbox_.Execute("return counter", {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or("").rfind("NameError:", 0), 0u);
}

TEST(IsolatedSandboxLimitsTest, RunawayLoopTimesOut) {
    IsolatedSandbox sandbox(Limits(500), TestRuntime());
    auto result = sandbox.Execute("while True:\n    pass\n", {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Execution timeout: exceeded 500ms limit");
}

TEST(IsolatedSandboxLimitsTest, WorkerThatSwallowsTheTimeoutIsKilled) {
    IsolatedSandbox sandbox(Limits(300), TestRuntime());
    auto started = std::chrono::steady_clock::now();
    auto result = sandbox.Execute(
        "while True:\n"
        "    try:\n"
        "        while True:\n"
        "            pass\n"
        "    except:\n"
        "        pass\n",
        {});
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Execution timeout: exceeded 300ms limit");
    EXPECT_GE(elapsed, std::chrono::milliseconds(300) + kHardKillBuffer);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(IsolatedSandboxLimitsTest, SlowCapabilityDoesNotDelayTheKill) {
    IsolatedSandbox sandbox(Limits(300), TestRuntime());
    auto started = std::chrono::steady_clock::now();
    auto result = sandbox.Execute("return await pg.core.slow()",
                                  capsule::testing::SlowCapabilities(std::chrono::seconds(5)));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.value_or("").find("timeout"), std::string::npos) << result.error.value_or("");
    EXPECT_LT(elapsed, std::chrono::milliseconds(300 + 1500));
}

TEST(IsolatedSandboxLimitsTest, MemoryLimitStopsLargeAllocations) {
    IsolatedSandbox sandbox(Limits(5000, 64), TestRuntime());
    auto result = sandbox.Execute("blob = 'x' * (512 * 1024 * 1024)\nreturn len(blob)", {});
    EXPECT_FALSE(result.success);
}

TEST(IsolatedSandboxFailureTest, AbnormalExitIsReported) {
    capsule::core::RuntimeSettings settings;
    settings.python_executable = "false";
    IsolatedSandbox sandbox(Limits(2000), settings);

    auto result = sandbox.Execute("return 1", {});
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.value_or("").find("exited with code 1"), std::string::npos);
}

TEST(IsolatedSandboxFailureTest, MissingInterpreterIsReported) {
    capsule::core::RuntimeSettings settings;
    settings.python_executable = "/nonexistent/python3";
    IsolatedSandbox sandbox(Limits(2000), settings);

    auto result = sandbox.Execute("return 1", {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Python interpreter not found: /nonexistent/python3");
}

TEST(IsolatedSandboxFailureTest, DisposedUnitRejectsExecution) {
    IsolatedSandbox sandbox(Limits(2000), TestRuntime());
    sandbox.Dispose();
    sandbox.Dispose();
    EXPECT_FALSE(sandbox.IsHealthy());

    auto result = sandbox.Execute("return 1", {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), kDisposedMessage);
    EXPECT_EQ(result.metrics.wall_time_ms, 0.0);
}

TEST(IsolatedSandboxFailureTest, WorksWithStandardStreamsClosed) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        // New descriptors now land on 0-2, the numbers the worker remaps
        close(STDIN_FILENO);
        close(STDOUT_FILENO);
        close(STDERR_FILENO);
        IsolatedSandbox sandbox(Limits(5000), TestRuntime());
        auto result = sandbox.Execute("return await pg.core.listTables()", SampleCapabilities());
        _exit(result.success && result.result == SampleTables() ? 0 : 1);
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
