/**
 * @file sandbox_pool.hpp
 * @brief Bounded pools of execution units
 *
 * Two pools share one contract:
 * - SandboxPool keeps reusable in-process units, warms up to
 *   `min_instances`, creates lazily up to `max_instances` and periodically
 *   evicts unhealthy or surplus idle units.
 * - IsolatedSandboxPool has no idle collection; it only bounds the number of
 *   concurrently running worker executions.
 *
 * Exhaustion and use after Dispose() are API misuse and throw
 * std::runtime_error ("Sandbox pool exhausted (max: N)", "Pool has been
 * disposed"). Script failures never throw; they come back in SandboxResult.
 *
 * @date 2025
 */

#pragma once

#include "capsule/core/sandbox.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace capsule {
namespace core {

/**
 * @class ISandboxPool
 * @brief Pool contract shared by both isolation modes
 *
 * **Usage**:
 * @code
 * SandboxPool pool(PoolOptions{1, 4, std::chrono::minutes(1)});
 * pool.Initialize();
 * auto result = pool.Execute("return await pg.core.listTables()", capabilities);
 * pool.Dispose();
 * @endcode
 *
 * **Thread Safety**: All methods are safe to call concurrently.
 */
class ISandboxPool {
public:
    virtual ~ISandboxPool() = default;

    /**
     * @brief Warm the pool up and start background maintenance
     *
     * Safe to call more than once.
     * @throws std::runtime_error if the pool was disposed
     */
    virtual void Initialize() = 0;

    /**
     * @brief Check out a unit for exclusive use
     * @throws std::runtime_error "exhausted" when at capacity, "disposed" after Dispose()
     */
    virtual std::shared_ptr<ISandbox> Acquire() = 0;

    /**
     * @brief Return a unit obtained from Acquire()
     *
     * Idempotent. Units this pool does not own are ignored. After Dispose()
     * the unit stays disposed.
     */
    virtual void Release(const std::shared_ptr<ISandbox>& sandbox) = 0;

    /**
     * @brief Acquire, execute and always release
     * @throws std::runtime_error on exhaustion or after Dispose()
     */
    SandboxResult Execute(const std::string& code, const bindings::CapabilityMap& bindings);

    /**
     * @brief Execute() on a separate thread; the capability map is copied
     *
     * Exhaustion and disposal surface from future::get().
     */
    std::future<SandboxResult> ExecuteAsync(std::string code, bindings::CapabilityMap bindings);

    virtual PoolStats GetStats() const = 0;

    /**
     * @brief Dispose every owned unit, including checked-out ones (idempotent)
     */
    virtual void Dispose() = 0;

    virtual bool IsDisposed() const = 0;

    virtual SandboxMode Mode() const = 0;
};

/**
 * @class SandboxPool
 * @brief Pool of reusable in-process units
 *
 * Idle units are kept in acquisition order; Acquire() takes the most
 * recently released one and cleanup trims from the oldest end.
 */
class SandboxPool : public ISandboxPool {
public:
    /// Creates one unit; overridable for tests
    using SandboxFactory = std::function<std::shared_ptr<ISandbox>()>;

    explicit SandboxPool(PoolOptions options = {},
                         SandboxOptions sandbox_options = {},
                         RuntimeSettings settings = {});

    SandboxPool(PoolOptions options, SandboxFactory factory);

    ~SandboxPool() override;

    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    void Initialize() override;
    std::shared_ptr<ISandbox> Acquire() override;
    void Release(const std::shared_ptr<ISandbox>& sandbox) override;
    PoolStats GetStats() const override;
    void Dispose() override;
    bool IsDisposed() const override;
    SandboxMode Mode() const override { return SandboxMode::IN_PROCESS; }

    /**
     * @brief One maintenance pass
     *
     * Disposes unhealthy idle units, then disposes the oldest idle units
     * until at most `min_instances` remain. Runs every `idle_timeout` once
     * Initialize() was called; exposed for deterministic tests.
     */
    void RunCleanup();

private:
    void CleanupLoop();

    PoolOptions options_;
    SandboxFactory factory_;

    mutable std::mutex mutex_;
    std::deque<std::shared_ptr<ISandbox>> available_;
    std::map<ISandbox*, std::shared_ptr<ISandbox>> in_use_;
    bool initialized_{false};
    bool disposed_{false};

    std::condition_variable cleanup_cv_;
    std::thread cleanup_thread_;
};

/**
 * @class IsolatedSandboxPool
 * @brief Concurrency bound for worker-process execution
 *
 * Every Acquire() hands out a fresh IsolatedSandbox; Release() disposes it.
 * `available` in stats is `max - in_use`.
 */
class IsolatedSandboxPool : public ISandboxPool {
public:
    explicit IsolatedSandboxPool(PoolOptions options = {},
                                 SandboxOptions sandbox_options = {},
                                 RuntimeSettings settings = {});
    ~IsolatedSandboxPool() override;

    IsolatedSandboxPool(const IsolatedSandboxPool&) = delete;
    IsolatedSandboxPool& operator=(const IsolatedSandboxPool&) = delete;

    void Initialize() override;
    std::shared_ptr<ISandbox> Acquire() override;
    void Release(const std::shared_ptr<ISandbox>& sandbox) override;
    PoolStats GetStats() const override;
    void Dispose() override;
    bool IsDisposed() const override;
    SandboxMode Mode() const override { return SandboxMode::ISOLATED; }

private:
    PoolOptions options_;
    SandboxOptions sandbox_options_;
    RuntimeSettings settings_;

    mutable std::mutex mutex_;
    std::map<ISandbox*, std::shared_ptr<ISandbox>> in_use_;
    bool disposed_{false};
};

} // namespace core
} // namespace capsule
