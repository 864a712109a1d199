/**
 * @file isolated_sandbox.hpp
 * @brief Hard-isolated execution unit backed by a worker process per call
 *
 * Every Execute() forks a fresh `python3 -I -S` worker with rlimits applied,
 * ships it the script and the capability *shape*, and serves its capability
 * calls over the bridge (see bridge_protocol.hpp). The host enforces the
 * timeout by killing the worker outright once `timeout + kHardKillBuffer`
 * has elapsed, so a runaway script can never block the watchdog.
 *
 * A call settles exactly once, on whichever comes first:
 * - a result message (success or script error)
 * - worker exit or crash without a result (abnormal exit)
 * - the hard deadline (timeout, worker killed)
 *
 * @date 2025
 */

#pragma once

#include "capsule/core/sandbox.hpp"

#include <atomic>
#include <chrono>
#include <mutex>

namespace capsule {
namespace core {

/// Grace added to the timeout before the worker is killed
constexpr std::chrono::milliseconds kHardKillBuffer{1000};

/**
 * @class IsolatedSandbox
 * @brief Worker-process ISandbox implementation
 *
 * Holds no long-lived execution state; Dispose() only gates future calls.
 *
 * **Thread Safety**: Concurrent Execute() calls each get their own worker.
 */
class IsolatedSandbox : public ISandbox {
public:
    explicit IsolatedSandbox(SandboxOptions options = {}, RuntimeSettings settings = {});
    ~IsolatedSandbox() override = default;

    IsolatedSandbox(const IsolatedSandbox&) = delete;
    IsolatedSandbox& operator=(const IsolatedSandbox&) = delete;

    SandboxResult Execute(const std::string& code,
                          const bindings::CapabilityMap& bindings) override;

    bool IsHealthy() const override { return !disposed_.load(); }
    void Dispose() override;

    std::vector<std::string> GetConsoleOutput() const override;
    void ClearConsoleOutput() override;

    SandboxMode Mode() const override { return SandboxMode::ISOLATED; }
    const SandboxOptions& Options() const override { return options_; }

private:
    SandboxResult RunWorker(const std::string& code, const bindings::CapabilityMap& bindings);

    SandboxOptions options_;
    RuntimeSettings settings_;
    std::atomic<bool> disposed_{false};

    mutable std::mutex console_mutex_;
    std::vector<std::string> console_;
};

} // namespace core
} // namespace capsule
