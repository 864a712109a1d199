/**
 * @file inprocess_sandbox.hpp
 * @brief Lightweight execution unit running on the embedded interpreter
 *
 * Each unit owns a private scope that is reused across executions. The
 * security policy is re-applied and the `pg` / `console` objects are rebuilt
 * at the start of every call. Console output is buffered per unit and read
 * through GetConsoleOutput(); pools clear it when a unit is returned.
 *
 * **Timeout**: a watchdog thread raises an uncatchable-by-`Exception`
 * ExecutionTimeout in the executing thread once the limit passes. The
 * exception is delivered at the next bytecode boundary, so a long-running C
 * call (huge integer arithmetic, a blocking capability that ignores its
 * deadline) delays the timeout until it returns. Memory limits are not
 * enforced in this mode.
 *
 * @date 2025
 */

#pragma once

#include "capsule/core/sandbox.hpp"

#include <memory>

namespace capsule {
namespace core {

/**
 * @class InProcessSandbox
 * @brief In-process ISandbox implementation
 *
 * **Usage**:
 * @code
 * InProcessSandbox sandbox(SandboxOptions{std::chrono::milliseconds(5000)});
 * auto result = sandbox.Execute("return 2 + 2", {});
 * // result.success == true, result.result == 4
 * @endcode
 *
 * **Thread Safety**: Execute() calls on one unit are serialized.
 */
class InProcessSandbox : public ISandbox {
public:
    /**
     * @brief Create a unit, starting the embedded interpreter if needed
     * @throws std::runtime_error if the interpreter cannot be initialized
     */
    explicit InProcessSandbox(SandboxOptions options = {}, RuntimeSettings settings = {});
    ~InProcessSandbox() override;

    InProcessSandbox(const InProcessSandbox&) = delete;
    InProcessSandbox& operator=(const InProcessSandbox&) = delete;

    SandboxResult Execute(const std::string& code,
                          const bindings::CapabilityMap& bindings) override;

    bool IsHealthy() const override;
    void Dispose() override;

    std::vector<std::string> GetConsoleOutput() const override;
    void ClearConsoleOutput() override;

    SandboxMode Mode() const override { return SandboxMode::IN_PROCESS; }
    const SandboxOptions& Options() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace core
} // namespace capsule
