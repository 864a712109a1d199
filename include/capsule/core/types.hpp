/**
 * @file types.hpp
 * @brief Value types shared by sandboxes, pools and the executor service
 *
 * Defines execution options, pool sizing, per-execution metrics and the
 * uniform SandboxResult returned by every isolation mode.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace capsule {
namespace core {

/**
 * @struct SandboxOptions
 * @brief Per-unit execution limits
 *
 * Immutable once a sandbox is constructed. Defaults mirror the limits the
 * executor service applies when nothing else is configured.
 */
struct SandboxOptions {
    std::chrono::milliseconds timeout{30000};   ///< Wall-clock execution limit (30s default)
    std::size_t memory_limit_mb{128};           ///< Memory budget (128MB default)
};

/**
 * @struct PoolOptions
 * @brief Pool sizing and eviction configuration
 */
struct PoolOptions {
    std::size_t min_instances{2};                   ///< Units kept warm
    std::size_t max_instances{10};                  ///< Hard cap on units / concurrent executions
    std::chrono::milliseconds idle_timeout{60000};  ///< Cleanup interval for idle units
};

/**
 * @struct ExecutionMetrics
 * @brief Telemetry captured around a single execution
 *
 * Always populated. All fields are zero when execution never started
 * (disposed unit, rejected request).
 */
struct ExecutionMetrics {
    double wall_time_ms{0.0};    ///< Wall clock time (whole milliseconds)
    double cpu_time_ms{0.0};     ///< Approximate CPU time (whole milliseconds)
    double memory_used_mb{0.0};  ///< Memory delta in MB, two decimals, may be negative
};

/**
 * @struct SandboxResult
 * @brief Outcome of executing one script
 *
 * The only thing Execute() ever produces for code-level problems. Runtime
 * errors, blocked capabilities, timeouts and abnormal worker exits all end
 * up here with success == false.
 */
struct SandboxResult {
    bool success{false};                ///< Script completed and returned
    nlohmann::json result;              ///< Returned value (null when nothing was returned)
    std::optional<std::string> error;   ///< Error message when success == false
    std::optional<std::string> stack;   ///< Traceback or worker diagnostics, when available
    ExecutionMetrics metrics;           ///< Execution telemetry
};

/**
 * @struct PoolStats
 * @brief Utilization snapshot of a pool
 */
struct PoolStats {
    std::size_t available{0};  ///< Idle units (or free execution slots for isolated pools)
    std::size_t in_use{0};     ///< Units currently checked out
    std::size_t max{0};        ///< Configured maximum
};

/**
 * @brief Build a failed result with zeroed metrics
 * @param message Error message
 * @return SandboxResult with success == false
 */
SandboxResult MakeFailure(const std::string& message);

/**
 * @brief Error text reported when a script exceeds its wall-clock limit
 */
std::string TimeoutMessage(std::chrono::milliseconds timeout);

// JSON views used by the CLI, audit logging and the worker protocol
void to_json(nlohmann::json& j, const ExecutionMetrics& metrics);
void to_json(nlohmann::json& j, const SandboxResult& result);
void to_json(nlohmann::json& j, const PoolStats& stats);

} // namespace core
} // namespace capsule
