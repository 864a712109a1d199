/**
 * @file sandbox.hpp
 * @brief Execution unit contract shared by both isolation modes
 *
 * An execution unit ("sandbox") runs one script at a time against a
 * capability map and always answers with a SandboxResult. Code-level
 * problems (exceptions, blocked names, timeouts, crashed workers) never
 * escape as C++ exceptions.
 *
 * Implementations:
 * - InProcessSandbox: embedded interpreter, reusable scope, cooperative
 *   timeout
 * - IsolatedSandbox: fresh worker process per call, hard kill on timeout
 *
 * @date 2025
 */

#pragma once

#include "capsule/bindings/capability_map.hpp"
#include "capsule/core/types.hpp"
#include "capsule/security/security_policy.hpp"

#include <future>
#include <string>
#include <vector>

namespace capsule {
namespace core {

/**
 * @enum SandboxMode
 * @brief Isolation mode of an execution unit
 */
enum class SandboxMode {
    IN_PROCESS,  ///< Same process, shared interpreter, cooperative timeout
    ISOLATED     ///< Worker process per execution, preemptive kill
};

/**
 * @struct RuntimeSettings
 * @brief Construction-time settings beyond the per-unit limits
 */
struct RuntimeSettings {
    security::SecurityPolicy policy = security::SecurityPolicy::Default();  ///< Re-applied on every call
    std::string python_executable{"python3"};  ///< Worker interpreter (isolated mode)
};

/// Message carried by every result produced after Dispose()
constexpr const char* kDisposedMessage = "Sandbox has been disposed";

/**
 * @class ISandbox
 * @brief Abstract execution unit
 *
 * **Thread Safety**: All methods may be called from any thread. Concurrent
 * Execute() calls on one in-process unit are serialized.
 */
class ISandbox {
public:
    virtual ~ISandbox() = default;

    /**
     * @brief Run a script
     *
     * @param code Script body (implicit async function; `return` yields result)
     * @param bindings Capabilities exposed under `pg`; read-only, must stay
     *                 alive for the duration of the call
     * @return Result with metrics; never throws for script failures
     */
    virtual SandboxResult Execute(const std::string& code,
                                  const bindings::CapabilityMap& bindings) = 0;

    /**
     * @brief Run a script on a separate thread
     *
     * The capability map is copied, so the caller's map need not outlive the
     * returned future. The unit itself must.
     */
    std::future<SandboxResult> ExecuteAsync(std::string code, bindings::CapabilityMap bindings);

    /**
     * @brief Whether the unit can still execute scripts
     *
     * Monotonic: once false after Dispose(), never true again.
     */
    virtual bool IsHealthy() const = 0;

    /**
     * @brief Retire the unit (idempotent)
     */
    virtual void Dispose() = 0;

    /// Console lines buffered since the last clear
    virtual std::vector<std::string> GetConsoleOutput() const = 0;

    virtual void ClearConsoleOutput() = 0;

    virtual SandboxMode Mode() const = 0;

    virtual const SandboxOptions& Options() const = 0;
};

} // namespace core
} // namespace capsule
