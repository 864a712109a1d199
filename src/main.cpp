/**
 * @file main.cpp
 * @brief Capsule - Command-line interface
 *
 * Runs one script through the CodeExecutor pipeline. Capabilities come from
 * a JSON fixture mapping `group -> method -> canned response`, which makes
 * the CLI usable for trying scripts against recorded host responses:
 *
 * @code{.json}
 * {
 *   "core": {
 *     "listTables": [{"name": "users"}, {"name": "orders"}],
 *     "dropTable": {"$error": "permission denied"}
 *   }
 * }
 * @endcode
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "capsule/core/code_executor.hpp"
#include "capsule/core/engine_config.hpp"
#include "capsule/core/sandbox_factory.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

/*******************************************************************************
 * Helpers
 ******************************************************************************/

std::string ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read file: " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief Build a capability map that answers with canned responses
 *
 * An object response carrying a "$error" key makes that capability fail.
 */
capsule::bindings::CapabilityMap LoadFixture(const std::string& path) {
    const json fixture = json::parse(ReadFile(path));
    if (!fixture.is_object()) {
        throw std::runtime_error("Bindings fixture must be a JSON object: " + path);
    }

    capsule::bindings::CapabilityMap capabilities;
    for (const auto& [group, methods] : fixture.items()) {
        if (!methods.is_object()) {
            spdlog::warn("Skipping fixture group '{}' (not an object)", group);
            continue;
        }
        for (const auto& [method, response] : methods.items()) {
            capabilities[group][method] = capsule::bindings::MakeCapability(
                [response](const json&) -> json {
                    if (response.is_object() && response.contains("$error")) {
                        const auto& error = response.at("$error");
                        throw std::runtime_error(error.is_string() ? error.get<std::string>() : error.dump());
                    }
                    return response;
                });
        }
    }
    return capabilities;
}

void PrintResult(const capsule::core::SandboxResult& result, const std::vector<std::string>& console) {
    if (!console.empty()) {
        std::cout << "── console ─────────────────────────────────────────\n";
        for (const auto& line : console) {
            std::cout << line << "\n";
        }
    }
    std::cout << "── result ──────────────────────────────────────────\n";
    std::cout << json(result).dump(2) << std::endl;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Capsule - sandboxed script execution"};

    std::string script_path;
    std::string mode_name;
    std::string fixture_path;
    std::string config_path;
    std::string client_id = capsule::core::CodeExecutor::kDefaultClientId;
    std::int64_t timeout_ms = 0;
    std::size_t memory_mb = 0;
    bool readonly = false;
    bool verbose = false;
    bool show_modes = false;

    app.add_option("script", script_path, "Python script to execute")
        ->check(CLI::ExistingFile);
    app.add_option("-m,--mode", mode_name, "Isolation mode: inprocess|vm|isolated|worker");
    app.add_option("-t,--timeout", timeout_ms, "Execution timeout in milliseconds");
    app.add_option("--memory", memory_mb, "Memory limit in MB (isolated mode)");
    app.add_option("-b,--bindings", fixture_path, "JSON fixture of canned capability responses")
        ->check(CLI::ExistingFile);
    app.add_option("-c,--config", config_path, "JSON engine configuration")
        ->check(CLI::ExistingFile);
    app.add_option("--client", client_id, "Client id for rate limiting and audit");
    app.add_flag("--readonly", readonly, "Mark the execution read-only in the audit trail");
    app.add_flag("--modes", show_modes, "Describe the available isolation modes and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        capsule::core::EngineConfig config;
        if (!config_path.empty()) {
            auto loaded = capsule::core::LoadConfigFile(config_path);
            if (!loaded) {
                return 1;
            }
            config = std::move(*loaded);
        }
        capsule::core::ApplyEnvironment(config);

        if (verbose) {
            spdlog::set_level(spdlog::level::debug);
        } else {
            spdlog::set_level(spdlog::level::from_str(config.log_level));
        }

        if (show_modes) {
            json modes = json::array();
            for (auto mode : capsule::core::GetAvailableSandboxModes()) {
                json entry = capsule::core::GetSandboxModeInfo(mode);
                entry["mode"] = capsule::core::ToString(mode);
                modes.push_back(entry);
            }
            std::cout << modes.dump(2) << std::endl;
            return 0;
        }

        if (script_path.empty()) {
            spdlog::error("[ERROR] No script given (see --help)");
            return 1;
        }

        if (!mode_name.empty()) {
            auto mode = capsule::core::ParseSandboxMode(mode_name);
            if (!mode) {
                spdlog::error("[ERROR] Unknown mode '{}'", mode_name);
                return 1;
            }
            config.mode = *mode;
        }
        if (timeout_ms > 0) {
            config.sandbox.timeout = std::chrono::milliseconds(timeout_ms);
        }
        if (memory_mb > 0) {
            config.sandbox.memory_limit_mb = memory_mb;
        }
        // One script per invocation: no warm spares
        config.pool.min_instances = 0;
        config.pool.max_instances = 1;
        config.pool.idle_timeout = std::chrono::milliseconds(0);

        capsule::bindings::CapabilityMap capabilities;
        if (!fixture_path.empty()) {
            capabilities = LoadFixture(fixture_path);
        }

        const std::string code = ReadFile(script_path);
        spdlog::info("[START] {} ({} mode, {}ms limit)", script_path,
                     capsule::core::ToString(config.mode), config.sandbox.timeout.count());

        capsule::core::ExecuteCodeOptions options;
        options.code = code;
        options.readonly = readonly;

        capsule::core::CodeExecutor executor(config);
        std::vector<std::string> console;
        auto result = executor.Execute(options, capabilities, client_id, &console);
        executor.Shutdown();

        PrintResult(result, console);

        if (!result.success) {
            spdlog::error("[FAIL] {}", result.error.value_or("unknown error"));
            return 1;
        }
        spdlog::info("[DONE] {}ms wall, {}ms cpu, {}MB", result.metrics.wall_time_ms,
                     result.metrics.cpu_time_ms, result.metrics.memory_used_mb);
        return 0;

    } catch (const json::exception& e) {
        spdlog::error("[ERROR] Invalid JSON: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
