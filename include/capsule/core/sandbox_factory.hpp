/**
 * @file sandbox_factory.hpp
 * @brief Mode selection and construction of units and pools
 *
 * @date 2025
 */

#pragma once

#include "capsule/core/sandbox.hpp"
#include "capsule/core/sandbox_pool.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capsule {
namespace core {

/**
 * @struct SandboxModeInfo
 * @brief Human-readable trade-offs of an isolation mode
 */
struct SandboxModeInfo {
    std::string name;
    std::string isolation;
    std::string performance;
    std::string security;
    std::vector<std::string> requirements;
};

/**
 * @brief Parse a mode name
 *
 * Accepts "inprocess" / "vm" and "isolated" / "worker" (case-insensitive).
 */
std::optional<SandboxMode> ParseSandboxMode(const std::string& name);

/// Canonical name: "inprocess" or "isolated"
std::string ToString(SandboxMode mode);

/// Process-wide default used when no mode is given (initially IN_PROCESS)
void SetDefaultSandboxMode(SandboxMode mode);
SandboxMode GetDefaultSandboxMode();

std::vector<SandboxMode> GetAvailableSandboxModes();

/**
 * @brief Create a standalone unit
 * @param mode Isolation mode; the process-wide default when omitted
 */
std::shared_ptr<ISandbox> CreateSandbox(std::optional<SandboxMode> mode = std::nullopt,
                                        SandboxOptions options = {},
                                        RuntimeSettings settings = {});

/**
 * @brief Create a pool (not yet initialized)
 * @param mode Isolation mode; the process-wide default when omitted
 */
std::unique_ptr<ISandboxPool> CreateSandboxPool(std::optional<SandboxMode> mode = std::nullopt,
                                                PoolOptions pool_options = {},
                                                SandboxOptions sandbox_options = {},
                                                RuntimeSettings settings = {});

SandboxModeInfo GetSandboxModeInfo(SandboxMode mode);

void to_json(nlohmann::json& j, const SandboxModeInfo& info);

} // namespace core
} // namespace capsule
