/**
 * @file engine_config.hpp
 * @brief Engine-wide configuration: isolation mode, limits, pool sizing
 *
 * Resolution order (later wins):
 * 1. Built-in defaults
 * 2. JSON config file (LoadConfigFile)
 * 3. Environment: `CAPSULE_ISOLATION`, `CAPSULE_PYTHON`
 * 4. Command-line flags
 *
 * **Config file format** (every key optional):
 * @code{.json}
 * {
 *   "mode": "isolated",
 *   "logLevel": "info",
 *   "pythonExecutable": "/usr/bin/python3",
 *   "sandbox": { "timeoutMs": 30000, "memoryLimitMb": 128 },
 *   "pool": { "minInstances": 2, "maxInstances": 10, "idleTimeoutMs": 60000 },
 *   "security": { "maxCodeLength": 51200, "maxExecutionsPerMinute": 60 },
 *   "policy": { "blockedModules": ["os", "sys"] }
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "capsule/core/sandbox.hpp"
#include "capsule/core/types.hpp"
#include "capsule/security/security_manager.hpp"
#include "capsule/security/security_policy.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace capsule {
namespace core {

/**
 * @struct EngineConfig
 * @brief Everything needed to stand up a CodeExecutor
 */
struct EngineConfig {
    SandboxMode mode{SandboxMode::IN_PROCESS};
    SandboxOptions sandbox;
    PoolOptions pool;
    security::SecurityConfig security = security::SecurityConfig::Default();
    security::SecurityPolicy policy = security::SecurityPolicy::Default();
    std::string python_executable{"python3"};
    std::string log_level{"info"};

    /// Policy and interpreter handed to every unit
    RuntimeSettings Runtime() const { return RuntimeSettings{policy, python_executable}; }
};

/**
 * @brief Overlay a JSON document onto @p config
 * @throws std::invalid_argument on an unknown mode name
 * @throws nlohmann::json::exception on mistyped values
 */
void ApplyJson(const nlohmann::json& j, EngineConfig& config);

/**
 * @brief Load a config file on top of the defaults
 * @return std::nullopt if the file cannot be read or is not valid
 */
std::optional<EngineConfig> LoadConfigFile(const std::filesystem::path& path);

/**
 * @brief Apply `CAPSULE_ISOLATION` and `CAPSULE_PYTHON`
 *
 * Unknown isolation names are logged and ignored.
 */
void ApplyEnvironment(EngineConfig& config);

void to_json(nlohmann::json& j, const EngineConfig& config);

} // namespace core
} // namespace capsule
