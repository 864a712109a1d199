/**
 * @file code_executor.hpp
 * @brief Service layer that turns a code request into a SandboxResult
 *
 * Pipeline for every request:
 * 1. ValidateCode (rejection -> failed result, zero metrics)
 * 2. CheckRateLimit (rejection -> failed result, zero metrics)
 * 3. Pool execute (pool exhaustion/disposal -> failed result)
 * 4. SanitizeResult on success
 * 5. AuditLog
 *
 * Unlike the pool, the executor never throws for a request; every outcome
 * is a SandboxResult.
 *
 * @date 2025
 */

#pragma once

#include "capsule/core/engine_config.hpp"
#include "capsule/core/sandbox_pool.hpp"
#include "capsule/security/security_manager.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace capsule {
namespace core {

/**
 * @struct ExecuteCodeOptions
 * @brief One code execution request
 */
struct ExecuteCodeOptions {
    std::string code;                                ///< Script body
    std::optional<std::chrono::milliseconds> timeout; ///< Clamped to the configured timeout
    bool readonly{false};                            ///< Recorded in the audit trail
};

/**
 * @class CodeExecutor
 * @brief Validated, rate-limited, audited execution on a pool
 *
 * **Usage**:
 * @code
 * EngineConfig config;
 * config.mode = SandboxMode::ISOLATED;
 *
 * CodeExecutor executor(config);
 * auto result = executor.Execute({"return await pg.core.listTables()"}, capabilities, "agent-7");
 * executor.Shutdown();
 * @endcode
 *
 * **Thread Safety**: Execute() may be called concurrently.
 */
class CodeExecutor {
public:
    /// Client id used when the caller does not supply one
    static constexpr const char* kDefaultClientId = "default";

    explicit CodeExecutor(EngineConfig config = {});
    ~CodeExecutor();

    CodeExecutor(const CodeExecutor&) = delete;
    CodeExecutor& operator=(const CodeExecutor&) = delete;

    /**
     * @brief Run one request through the full pipeline
     * @param options Code, optional timeout override and readonly flag
     * @param bindings Capabilities exposed under `pg`
     * @param client_id Rate limit and audit identity
     * @param console Receives the script's console lines, if not null
     */
    SandboxResult Execute(const ExecuteCodeOptions& options,
                          const bindings::CapabilityMap& bindings,
                          const std::string& client_id = kDefaultClientId,
                          std::vector<std::string>* console = nullptr);

    std::future<SandboxResult> ExecuteAsync(ExecuteCodeOptions options,
                                            bindings::CapabilityMap bindings,
                                            std::string client_id = kDefaultClientId);

    /// Stats of the underlying pool (nothing available before first use)
    PoolStats GetPoolStats() const;

    /// Dispose the pool (idempotent); later requests fail with "disposed"
    void Shutdown();

    const EngineConfig& Config() const { return config_; }
    security::SecurityManager& Security() { return security_; }

private:
    std::shared_ptr<ISandboxPool> EnsurePool();
    SandboxResult RunOnPool(const ExecuteCodeOptions& options,
                            const bindings::CapabilityMap& bindings,
                            std::vector<std::string>* console);

    EngineConfig config_;
    security::SecurityManager security_;

    mutable std::mutex pool_mutex_;
    std::shared_ptr<ISandboxPool> pool_;
    bool shut_down_{false};
};

/**
 * @brief Single-shot execution on a one-off unit
 *
 * Acquire, execute and release without a long-lived pool. Never throws;
 * construction failures are reported as a failed result.
 *
 * @param mode Isolation mode; the process-wide default when omitted
 */
SandboxResult Execute(const std::string& code,
                      const bindings::CapabilityMap& bindings,
                      SandboxOptions options = {},
                      std::optional<SandboxMode> mode = std::nullopt);

} // namespace core
} // namespace capsule
