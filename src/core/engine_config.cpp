/**
 * @file engine_config.cpp
 * @brief Config file and environment loading
 *
 * @date 2025
 */

#include "capsule/core/engine_config.hpp"
#include "capsule/core/sandbox_factory.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace capsule {
namespace core {

void ApplyJson(const nlohmann::json& j, EngineConfig& config) {
    if (j.contains("mode")) {
        const auto name = j.at("mode").get<std::string>();
        auto mode = ParseSandboxMode(name);
        if (!mode) {
            throw std::invalid_argument("Unknown sandbox mode: " + name);
        }
        config.mode = *mode;
    }

    config.log_level = j.value("logLevel", config.log_level);
    config.python_executable = j.value("pythonExecutable", config.python_executable);

    if (j.contains("sandbox")) {
        const auto& sandbox = j.at("sandbox");
        config.sandbox.timeout = std::chrono::milliseconds(
            sandbox.value("timeoutMs", static_cast<std::int64_t>(config.sandbox.timeout.count())));
        config.sandbox.memory_limit_mb = sandbox.value("memoryLimitMb", config.sandbox.memory_limit_mb);
    }

    if (j.contains("pool")) {
        const auto& pool = j.at("pool");
        config.pool.min_instances = pool.value("minInstances", config.pool.min_instances);
        config.pool.max_instances = pool.value("maxInstances", config.pool.max_instances);
        config.pool.idle_timeout = std::chrono::milliseconds(
            pool.value("idleTimeoutMs", static_cast<std::int64_t>(config.pool.idle_timeout.count())));
    }

    if (j.contains("security")) {
        j.at("security").get_to(config.security);
    }

    if (j.contains("policy")) {
        j.at("policy").get_to(config.policy);
    }
}

std::optional<EngineConfig> LoadConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open config file: {}", path.string());
        return std::nullopt;
    }

    EngineConfig config;
    try {
        ApplyJson(nlohmann::json::parse(file), config);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid config file {}: {}", path.string(), e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid config file {}: {}", path.string(), e.what());
        return std::nullopt;
    }

    spdlog::debug("Loaded config from {}", path.string());
    return config;
}

void ApplyEnvironment(EngineConfig& config) {
    if (const char* isolation = std::getenv("CAPSULE_ISOLATION")) {
        if (auto mode = ParseSandboxMode(isolation)) {
            config.mode = *mode;
        } else {
            spdlog::warn("Ignoring unknown CAPSULE_ISOLATION value '{}'", isolation);
        }
    }

    if (const char* python = std::getenv("CAPSULE_PYTHON")) {
        if (*python != '\0') {
            config.python_executable = python;
        }
    }
}

void to_json(nlohmann::json& j, const EngineConfig& config) {
    j = nlohmann::json{
        {"mode", ToString(config.mode)},
        {"logLevel", config.log_level},
        {"pythonExecutable", config.python_executable},
        {"sandbox", {
            {"timeoutMs", config.sandbox.timeout.count()},
            {"memoryLimitMb", config.sandbox.memory_limit_mb}
        }},
        {"pool", {
            {"minInstances", config.pool.min_instances},
            {"maxInstances", config.pool.max_instances},
            {"idleTimeoutMs", config.pool.idle_timeout.count()}
        }},
        {"security", config.security},
        {"policy", config.policy}
    };
}

} // namespace core
} // namespace capsule
