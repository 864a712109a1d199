/**
 * @file security_policy.hpp
 * @brief Static description of what sandboxed scripts may and may not reach
 *
 * The policy is plain data. It is serialized to JSON and re-applied by the
 * script runtime on every execution: the scope's builtins are rebuilt from
 * the allow-list and any blocked name is removed from the scope, so module
 * loading, process/environment access and filesystem access fail with
 * ImportError / NameError instead of silently doing nothing.
 *
 * Isolated workers are additionally confined by kernel resource limits
 * (see ResourceLimits).
 *
 * @date 2025
 */

#pragma once

#include "capsule/core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace capsule {
namespace security {

/**
 * @struct SecurityPolicy
 * @brief Allowed and blocked host surface for scripts
 *
 * **Usage**:
 * @code
 * auto policy = SecurityPolicy::Default();
 * policy.blocked_modules.push_back("urllib");
 * nlohmann::json wire = policy;   // shipped with every execution
 * @endcode
 */
struct SecurityPolicy {
    std::vector<std::string> allowed_builtins;  ///< Builtins placed in the script scope
    std::vector<std::string> blocked_builtins;  ///< Never exposed, even if also allowed
    std::vector<std::string> blocked_modules;   ///< Module names stripped from the scope

    /**
     * @brief Policy used when nothing else is configured
     */
    static SecurityPolicy Default();

    bool IsBuiltinAllowed(const std::string& name) const;
    bool IsModuleBlocked(const std::string& name) const;
};

void to_json(nlohmann::json& j, const SecurityPolicy& policy);
void from_json(const nlohmann::json& j, SecurityPolicy& policy);

/**
 * @struct ResourceLimits
 * @brief rlimit values applied to an isolated worker process
 */
struct ResourceLimits {
    std::uint64_t address_space_bytes{0};  ///< RLIMIT_AS
    std::uint64_t cpu_seconds{0};          ///< RLIMIT_CPU
    std::uint64_t file_size_bytes{0};      ///< RLIMIT_FSIZE (no file writes)
    std::uint64_t core_size_bytes{0};      ///< RLIMIT_CORE (no core dumps)
    std::uint64_t open_files{32};          ///< RLIMIT_NOFILE
};

/// Interpreter footprint added on top of the script's memory budget
constexpr std::size_t kInterpreterBaselineMb = 64;

/**
 * @brief Derive worker rlimits from per-unit options
 *
 * Address space = memory limit + interpreter baseline; CPU seconds = timeout
 * rounded up plus one, so the wall-clock watchdog normally fires first.
 */
ResourceLimits LimitsFor(const core::SandboxOptions& options);

} // namespace security
} // namespace capsule
