/**
 * @file sandbox_factory.cpp
 * @brief Mode parsing, process-wide default and unit/pool construction
 *
 * @date 2025
 */

#include "capsule/core/sandbox_factory.hpp"
#include "capsule/core/inprocess_sandbox.hpp"
#include "capsule/core/isolated_sandbox.hpp"
#include "capsule/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace capsule {
namespace core {

namespace {

std::atomic<SandboxMode> g_default_mode{SandboxMode::IN_PROCESS};

} // anonymous namespace

std::optional<SandboxMode> ParseSandboxMode(const std::string& name) {
    const auto lowered = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lowered == "inprocess" || lowered == "vm") {
        return SandboxMode::IN_PROCESS;
    }
    if (lowered == "isolated" || lowered == "worker") {
        return SandboxMode::ISOLATED;
    }
    return std::nullopt;
}

std::string ToString(SandboxMode mode) {
    switch (mode) {
        case SandboxMode::IN_PROCESS: return "inprocess";
        case SandboxMode::ISOLATED:   return "isolated";
    }
    return "unknown";
}

void SetDefaultSandboxMode(SandboxMode mode) {
    g_default_mode.store(mode);
    spdlog::info("Default sandbox mode set to: {}", ToString(mode));
}

SandboxMode GetDefaultSandboxMode() {
    return g_default_mode.load();
}

std::vector<SandboxMode> GetAvailableSandboxModes() {
    return {SandboxMode::IN_PROCESS, SandboxMode::ISOLATED};
}

std::shared_ptr<ISandbox> CreateSandbox(std::optional<SandboxMode> mode,
                                        SandboxOptions options,
                                        RuntimeSettings settings) {
    switch (mode.value_or(GetDefaultSandboxMode())) {
        case SandboxMode::ISOLATED:
            return std::make_shared<IsolatedSandbox>(options, std::move(settings));
        case SandboxMode::IN_PROCESS:
            break;
    }
    return std::make_shared<InProcessSandbox>(options, std::move(settings));
}

std::unique_ptr<ISandboxPool> CreateSandboxPool(std::optional<SandboxMode> mode,
                                                PoolOptions pool_options,
                                                SandboxOptions sandbox_options,
                                                RuntimeSettings settings) {
    switch (mode.value_or(GetDefaultSandboxMode())) {
        case SandboxMode::ISOLATED:
            return std::make_unique<IsolatedSandboxPool>(pool_options, sandbox_options, std::move(settings));
        case SandboxMode::IN_PROCESS:
            break;
    }
    return std::make_unique<SandboxPool>(pool_options, sandbox_options, std::move(settings));
}

SandboxModeInfo GetSandboxModeInfo(SandboxMode mode) {
    if (mode == SandboxMode::ISOLATED) {
        return SandboxModeInfo{
            "Isolated worker",
            "Separate worker process per execution",
            "Slower (process spawn per execution)",
            "High: hard kill on timeout, rlimits on memory and CPU",
            {"A python3 interpreter on PATH (or configured explicitly)"}
        };
    }
    return SandboxModeInfo{
        "In-process",
        "Restricted scope on the embedded interpreter",
        "Fast (reused scope, no process spawn)",
        "Medium: cooperative timeout, no memory limit",
        {"libpython3 linked into the host"}
    };
}

void to_json(nlohmann::json& j, const SandboxModeInfo& info) {
    j = nlohmann::json{
        {"name", info.name},
        {"isolation", info.isolation},
        {"performance", info.performance},
        {"security", info.security},
        {"requirements", info.requirements}
    };
}

} // namespace core
} // namespace capsule
