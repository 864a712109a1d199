#include <gtest/gtest.h>

#include "capsule/core/sandbox_pool.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace capsule::core;

namespace {

/// Scriptless unit that records what the pool does to it
class FakeSandbox : public ISandbox {
public:
    SandboxResult Execute(const std::string& code, const capsule::bindings::CapabilityMap&) override {
        if (disposed_) {
            return MakeFailure(kDisposedMessage);
        }
        ++executions;
        console_.push_back("ran: " + code);
        SandboxResult result;
        result.success = code != "fail";
        if (!result.success) {
            result.error = "Error: fail";
        }
        return result;
    }

    bool IsHealthy() const override { return !disposed_ && !broken; }
    void Dispose() override { disposed_ = true; }
    bool IsDisposed() const { return disposed_; }

    std::vector<std::string> GetConsoleOutput() const override { return console_; }
    void ClearConsoleOutput() override { console_.clear(); }

    SandboxMode Mode() const override { return SandboxMode::IN_PROCESS; }
    const SandboxOptions& Options() const override { return options_; }

    std::atomic<bool> broken{false};
    int executions{0};

private:
    std::atomic<bool> disposed_{false};
    std::vector<std::string> console_;
    SandboxOptions options_;
};

PoolOptions Sizing(std::size_t min, std::size_t max) {
    PoolOptions options;
    options.min_instances = min;
    options.max_instances = max;
    options.idle_timeout = std::chrono::milliseconds(0);
    return options;
}

} // namespace

class SandboxPoolTest : public ::testing::Test {
protected:
    std::unique_ptr<SandboxPool> MakePool(std::size_t min, std::size_t max) {
        return std::make_unique<SandboxPool>(Sizing(min, max), [this]() {
            auto sandbox = std::make_shared<FakeSandbox>();
            created_.push_back(sandbox);
            return sandbox;
        });
    }

    std::vector<std::shared_ptr<FakeSandbox>> created_;
};

TEST_F(SandboxPoolTest, InitializeWarmsUpToMinimum) {
    auto pool = MakePool(2, 4);
    EXPECT_EQ(pool->GetStats().available, 0u);

    pool->Initialize();
    pool->Initialize();
    auto stats = pool->GetStats();
    EXPECT_EQ(stats.available, 2u);
    EXPECT_EQ(stats.in_use, 0u);
    EXPECT_EQ(stats.max, 4u);
    EXPECT_EQ(created_.size(), 2u);
}

TEST_F(SandboxPoolTest, MinimumIsClampedToMaximum) {
    auto pool = MakePool(5, 2);
    pool->Initialize();
    EXPECT_EQ(pool->GetStats().available, 2u);
}

TEST_F(SandboxPoolTest, ZeroMaximumIsRejected) {
    EXPECT_THROW(MakePool(0, 0), std::invalid_argument);
}

TEST_F(SandboxPoolTest, AcquireReusesReleasedUnits) {
    auto pool = MakePool(0, 2);
    pool->Initialize();

    auto first = pool->Acquire();
    pool->Release(first);
    auto second = pool->Acquire();

    EXPECT_EQ(first, second);
    EXPECT_EQ(created_.size(), 1u);
}

TEST_F(SandboxPoolTest, AcquireBeyondMaximumThrows) {
    auto pool = MakePool(0, 2);
    auto a = pool->Acquire();
    auto b = pool->Acquire();

    try {
        pool->Acquire();
        FAIL() << "expected exhaustion";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Sandbox pool exhausted (max: 2)");
    }

    EXPECT_EQ(pool->GetStats().in_use, 2u);
    pool->Release(a);
    EXPECT_NO_THROW(pool->Acquire());
}

TEST_F(SandboxPoolTest, ReleaseClearsConsoleAndIgnoresForeignUnits) {
    auto pool = MakePool(0, 2);
    auto sandbox = pool->Acquire();
    sandbox->Execute("print", {});
    ASSERT_FALSE(sandbox->GetConsoleOutput().empty());

    pool->Release(sandbox);
    EXPECT_TRUE(sandbox->GetConsoleOutput().empty());

    pool->Release(sandbox);
    pool->Release(std::make_shared<FakeSandbox>());
    pool->Release(nullptr);

    auto stats = pool->GetStats();
    EXPECT_EQ(stats.available, 1u);
    EXPECT_EQ(stats.in_use, 0u);
}

TEST_F(SandboxPoolTest, UnhealthyUnitsAreNotHandedOut) {
    auto pool = MakePool(1, 2);
    pool->Initialize();
    created_[0]->broken = true;

    auto sandbox = pool->Acquire();
    EXPECT_NE(sandbox, created_[0]);
    EXPECT_TRUE(created_[0]->IsDisposed());
    EXPECT_EQ(created_.size(), 2u);
}

TEST_F(SandboxPoolTest, UnhealthyUnitsAreDisposedOnRelease) {
    auto pool = MakePool(0, 2);
    auto sandbox = pool->Acquire();
    created_[0]->broken = true;

    pool->Release(sandbox);
    EXPECT_TRUE(created_[0]->IsDisposed());
    EXPECT_EQ(pool->GetStats().available, 0u);
}

TEST_F(SandboxPoolTest, CleanupTrimsIdleUnitsToMinimum) {
    auto pool = MakePool(1, 4);
    pool->Initialize();

    std::vector<std::shared_ptr<ISandbox>> leased;
    for (int i = 0; i < 4; ++i) {
        leased.push_back(pool->Acquire());
    }
    for (auto& sandbox : leased) {
        pool->Release(sandbox);
    }
    ASSERT_EQ(pool->GetStats().available, 4u);

    pool->RunCleanup();
    EXPECT_EQ(pool->GetStats().available, 1u);

    // Oldest idle units go first; the most recently released one survives
    EXPECT_TRUE(created_[0]->IsDisposed());
    EXPECT_FALSE(std::static_pointer_cast<FakeSandbox>(leased.back())->IsDisposed());
}

TEST_F(SandboxPoolTest, CleanupRemovesUnhealthyIdleUnits) {
    auto pool = MakePool(2, 4);
    pool->Initialize();
    created_[1]->broken = true;

    pool->RunCleanup();
    EXPECT_EQ(pool->GetStats().available, 1u);
    EXPECT_TRUE(created_[1]->IsDisposed());
    EXPECT_FALSE(created_[0]->IsDisposed());
}

TEST_F(SandboxPoolTest, ExecuteAlwaysReleases) {
    auto pool = MakePool(0, 1);

    auto ok = pool->Execute("return 1", {});
    EXPECT_TRUE(ok.success);
    auto failed = pool->Execute("fail", {});
    EXPECT_FALSE(failed.success);

    auto stats = pool->GetStats();
    EXPECT_EQ(stats.in_use, 0u);
    EXPECT_EQ(stats.available, 1u);
    EXPECT_EQ(created_[0]->executions, 2);
}

TEST_F(SandboxPoolTest, ExecuteAsyncRunsOnThePool) {
    auto pool = MakePool(0, 1);
    auto result = pool->ExecuteAsync("return 1", capsule::testing::SampleCapabilities()).get();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(pool->GetStats().in_use, 0u);
}

TEST_F(SandboxPoolTest, DisposeRetiresEveryUnit) {
    auto pool = MakePool(1, 3);
    pool->Initialize();
    auto leased = pool->Acquire();
    auto extra = pool->Acquire();

    pool->Dispose();
    pool->Dispose();
    EXPECT_TRUE(pool->IsDisposed());
    for (const auto& sandbox : created_) {
        EXPECT_TRUE(sandbox->IsDisposed());
    }

    // A late release must not bring a unit back
    pool->Release(leased);
    EXPECT_FALSE(leased->IsHealthy());
    auto stats = pool->GetStats();
    EXPECT_EQ(stats.available, 0u);
    EXPECT_EQ(stats.in_use, 0u);

    EXPECT_THROW(pool->Acquire(), std::runtime_error);
    EXPECT_THROW(pool->Initialize(), std::runtime_error);
    EXPECT_THROW(pool->Execute("return 1", {}), std::runtime_error);
}

TEST_F(SandboxPoolTest, BackgroundCleanupStopsOnDispose) {
    PoolOptions options = Sizing(0, 2);
    options.idle_timeout = std::chrono::milliseconds(20);
    SandboxPool pool(options, []() { return std::make_shared<FakeSandbox>(); });
    pool.Initialize();

    pool.Release(pool.Acquire());
    ASSERT_EQ(pool.GetStats().available, 1u);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (pool.GetStats().available > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(pool.GetStats().available, 0u);
    pool.Dispose();
}

TEST(InProcessSandboxPoolTest, RunsRealScripts) {
    SandboxPool pool(Sizing(1, 2));
    pool.Initialize();

    auto result = pool.Execute("return await pg.core.listTables()", capsule::testing::SampleCapabilities());
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.result, capsule::testing::SampleTables());
    EXPECT_EQ(pool.Mode(), SandboxMode::IN_PROCESS);
}

TEST(IsolatedSandboxPoolTest, BoundsConcurrentWorkers) {
    IsolatedSandboxPool pool(Sizing(0, 2), SandboxOptions{}, capsule::testing::TestRuntime());
    pool.Initialize();

    auto stats = pool.GetStats();
    EXPECT_EQ(stats.available, 2u);
    EXPECT_EQ(stats.in_use, 0u);

    auto a = pool.Acquire();
    auto b = pool.Acquire();
    EXPECT_NE(a, b);
    EXPECT_EQ(a->Mode(), SandboxMode::ISOLATED);
    EXPECT_EQ(pool.GetStats().available, 0u);
    EXPECT_THROW(pool.Acquire(), std::runtime_error);

    pool.Release(a);
    EXPECT_FALSE(a->IsHealthy());
    stats = pool.GetStats();
    EXPECT_EQ(stats.available, 1u);
    EXPECT_EQ(stats.in_use, 1u);

    pool.Dispose();
    EXPECT_FALSE(b->IsHealthy());
    EXPECT_THROW(pool.Acquire(), std::runtime_error);
}

TEST(IsolatedSandboxPoolTest, ExecutesThroughWorkers) {
    IsolatedSandboxPool pool(Sizing(0, 1), SandboxOptions{}, capsule::testing::TestRuntime());
    auto result = pool.Execute("return 6 * 7", {});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.result, 42);
    EXPECT_EQ(pool.GetStats().in_use, 0u);
}
