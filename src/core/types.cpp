/**
 * @file types.cpp
 * @brief JSON conversions for the shared execution value types
 *
 * @date 2025
 */

#include "capsule/core/types.hpp"

namespace capsule {
namespace core {

SandboxResult MakeFailure(const std::string& message) {
    SandboxResult result;
    result.success = false;
    result.error = message;
    return result;
}

std::string TimeoutMessage(std::chrono::milliseconds timeout) {
    return "Execution timeout: exceeded " + std::to_string(timeout.count()) + "ms limit";
}

void to_json(nlohmann::json& j, const ExecutionMetrics& metrics) {
    j = nlohmann::json{
        {"wallTimeMs", metrics.wall_time_ms},
        {"cpuTimeMs", metrics.cpu_time_ms},
        {"memoryUsedMb", metrics.memory_used_mb}
    };
}

void to_json(nlohmann::json& j, const SandboxResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"metrics", result.metrics}
    };
    if (result.success) {
        j["result"] = result.result;
    }
    if (result.error) {
        j["error"] = *result.error;
    }
    if (result.stack) {
        j["stack"] = *result.stack;
    }
}

void to_json(nlohmann::json& j, const PoolStats& stats) {
    j = nlohmann::json{
        {"available", stats.available},
        {"inUse", stats.in_use},
        {"max", stats.max}
    };
}

} // namespace core
} // namespace capsule
