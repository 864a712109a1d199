/**
 * @file code_executor.cpp
 * @brief CodeExecutor pipeline and single-shot Execute()
 *
 * @date 2025
 */

#include "capsule/core/code_executor.hpp"
#include "capsule/core/sandbox_factory.hpp"
#include "capsule/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace capsule {
namespace core {

namespace {

constexpr const char* kRateLimitMessage = "Rate limit exceeded. Please wait before executing more code.";

} // anonymous namespace

CodeExecutor::CodeExecutor(EngineConfig config)
    : config_(std::move(config))
    , security_(config_.security) {
    spdlog::debug("Code executor configured (mode: {}, timeout: {}ms)",
                  ToString(config_.mode), config_.sandbox.timeout.count());
}

CodeExecutor::~CodeExecutor() {
    Shutdown();
}

std::shared_ptr<ISandboxPool> CodeExecutor::EnsurePool() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (shut_down_) {
        throw std::runtime_error("Pool has been disposed");
    }
    if (!pool_) {
        std::shared_ptr<ISandboxPool> pool =
            CreateSandboxPool(config_.mode, config_.pool, config_.sandbox, config_.Runtime());
        pool->Initialize();
        pool_ = std::move(pool);
    }
    return pool_;
}

SandboxResult CodeExecutor::RunOnPool(const ExecuteCodeOptions& options,
                                      const bindings::CapabilityMap& bindings,
                                      std::vector<std::string>* console) {
    try {
        auto pool = EnsurePool();

        struct LeaseGuard {
            ISandboxPool& pool;
            std::shared_ptr<ISandbox> sandbox;
            ~LeaseGuard() { pool.Release(sandbox); }
        } lease{*pool, pool->Acquire()};

        std::shared_ptr<ISandbox> sandbox = lease.sandbox;
        if (options.timeout && *options.timeout != config_.sandbox.timeout) {
            // Per-request limit: a one-off unit of the same mode, still holding a pool slot
            SandboxOptions sandbox_options = config_.sandbox;
            sandbox_options.timeout = std::clamp(*options.timeout, std::chrono::milliseconds(1),
                                                 config_.sandbox.timeout);
            sandbox = CreateSandbox(config_.mode, sandbox_options, config_.Runtime());
        }

        auto result = sandbox->Execute(options.code, bindings);
        if (console) {
            *console = sandbox->GetConsoleOutput();
        }
        if (sandbox != lease.sandbox) {
            sandbox->Dispose();
        }
        return result;
    } catch (const std::runtime_error& e) {
        spdlog::warn("Execution rejected by pool: {}", e.what());
        return MakeFailure(e.what());
    }
}

SandboxResult CodeExecutor::Execute(const ExecuteCodeOptions& options,
                                    const bindings::CapabilityMap& bindings,
                                    const std::string& client_id,
                                    std::vector<std::string>* console) {
    auto validation = security_.ValidateCode(options.code);
    if (!validation.valid) {
        return MakeFailure("Code validation failed: " + utils::StringUtils::Join(validation.errors, "; "));
    }

    if (!security_.CheckRateLimit(client_id)) {
        return MakeFailure(kRateLimitMessage);
    }

    auto result = RunOnPool(options, bindings, console);

    if (result.success && !result.result.is_null()) {
        result.result = security_.SanitizeResult(result.result);
    }

    security_.AuditLog(security_.CreateExecutionRecord(options.code, result, options.readonly, client_id));
    return result;
}

std::future<SandboxResult> CodeExecutor::ExecuteAsync(ExecuteCodeOptions options,
                                                      bindings::CapabilityMap bindings,
                                                      std::string client_id) {
    return std::async(std::launch::async,
        [this, options = std::move(options), bindings = std::move(bindings),
         client_id = std::move(client_id)]() {
            return Execute(options, bindings, client_id);
        });
}

PoolStats CodeExecutor::GetPoolStats() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return pool_ ? pool_->GetStats() : PoolStats{0, 0, config_.pool.max_instances};
}

void CodeExecutor::Shutdown() {
    std::shared_ptr<ISandboxPool> pool;
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        pool = std::move(pool_);
    }

    if (pool) {
        pool->Dispose();
        spdlog::info("✓ Code executor shut down");
    }
}

SandboxResult Execute(const std::string& code,
                      const bindings::CapabilityMap& bindings,
                      SandboxOptions options,
                      std::optional<SandboxMode> mode) {
    std::shared_ptr<ISandbox> sandbox;
    try {
        sandbox = CreateSandbox(mode, options);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create sandbox: {}", e.what());
        return MakeFailure(std::string("Failed to create sandbox: ") + e.what());
    }

    auto result = sandbox->Execute(code, bindings);
    sandbox->Dispose();
    return result;
}

} // namespace core
} // namespace capsule
