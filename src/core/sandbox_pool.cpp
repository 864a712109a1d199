/**
 * @file sandbox_pool.cpp
 * @brief SandboxPool and IsolatedSandboxPool
 *
 * @date 2025
 */

#include "capsule/core/sandbox_pool.hpp"
#include "capsule/core/inprocess_sandbox.hpp"
#include "capsule/core/isolated_sandbox.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace capsule {
namespace core {

namespace {

constexpr const char* kPoolDisposedMessage = "Pool has been disposed";

std::string ExhaustedMessage(std::size_t max) {
    return "Sandbox pool exhausted (max: " + std::to_string(max) + ")";
}

/// Returns a checked-out unit to its pool when the scope ends
class LeaseGuard {
public:
    LeaseGuard(ISandboxPool& pool, std::shared_ptr<ISandbox> sandbox)
        : pool_(pool), sandbox_(std::move(sandbox)) {}
    ~LeaseGuard() { pool_.Release(sandbox_); }

    LeaseGuard(const LeaseGuard&) = delete;
    LeaseGuard& operator=(const LeaseGuard&) = delete;

    ISandbox& operator*() const { return *sandbox_; }

private:
    ISandboxPool& pool_;
    std::shared_ptr<ISandbox> sandbox_;
};

} // anonymous namespace

// ============================================================================
// ISandboxPool
// ============================================================================

SandboxResult ISandboxPool::Execute(const std::string& code, const bindings::CapabilityMap& bindings) {
    LeaseGuard lease(*this, Acquire());
    return (*lease).Execute(code, bindings);
}

std::future<SandboxResult> ISandboxPool::ExecuteAsync(std::string code, bindings::CapabilityMap bindings) {
    return std::async(std::launch::async,
        [this, code = std::move(code), bindings = std::move(bindings)]() {
            return Execute(code, bindings);
        });
}

// ============================================================================
// SandboxPool
// ============================================================================

SandboxPool::SandboxPool(PoolOptions options, SandboxOptions sandbox_options, RuntimeSettings settings)
    : SandboxPool(options, [sandbox_options, settings]() -> std::shared_ptr<ISandbox> {
          return std::make_shared<InProcessSandbox>(sandbox_options, settings);
      }) {}

SandboxPool::SandboxPool(PoolOptions options, SandboxFactory factory)
    : options_(options)
    , factory_(std::move(factory)) {
    if (options_.max_instances == 0) {
        throw std::invalid_argument("Pool max_instances must be at least 1");
    }
    if (options_.min_instances > options_.max_instances) {
        options_.min_instances = options_.max_instances;
    }
}

SandboxPool::~SandboxPool() {
    Dispose();
}

void SandboxPool::Initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        throw std::runtime_error(kPoolDisposedMessage);
    }
    if (initialized_) {
        return;
    }

    while (available_.size() + in_use_.size() < options_.min_instances) {
        available_.push_back(factory_());
    }

    if (options_.idle_timeout.count() > 0) {
        cleanup_thread_ = std::thread(&SandboxPool::CleanupLoop, this);
    }
    initialized_ = true;

    spdlog::info("✓ Sandbox pool initialized ({} warm, max {})",
                 available_.size(), options_.max_instances);
}

std::shared_ptr<ISandbox> SandboxPool::Acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        throw std::runtime_error(kPoolDisposedMessage);
    }

    while (!available_.empty()) {
        auto sandbox = std::move(available_.back());
        available_.pop_back();

        if (sandbox->IsHealthy()) {
            in_use_.emplace(sandbox.get(), sandbox);
            return sandbox;
        }
        spdlog::debug("Discarding unhealthy idle sandbox");
        sandbox->Dispose();
    }

    if (in_use_.size() >= options_.max_instances) {
        throw std::runtime_error(ExhaustedMessage(options_.max_instances));
    }

    auto sandbox = factory_();
    in_use_.emplace(sandbox.get(), sandbox);
    spdlog::debug("Created sandbox ({} in use)", in_use_.size());
    return sandbox;
}

void SandboxPool::Release(const std::shared_ptr<ISandbox>& sandbox) {
    if (!sandbox) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_use_.find(sandbox.get());
    if (it == in_use_.end()) {
        return;
    }
    in_use_.erase(it);

    if (!disposed_ && sandbox->IsHealthy() && available_.size() < options_.max_instances) {
        sandbox->ClearConsoleOutput();
        available_.push_back(sandbox);
    } else {
        sandbox->Dispose();
    }
}

PoolStats SandboxPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return PoolStats{available_.size(), in_use_.size(), options_.max_instances};
}

void SandboxPool::RunCleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        return;
    }

    std::size_t evicted = 0;
    for (auto it = available_.begin(); it != available_.end();) {
        if (!(*it)->IsHealthy()) {
            (*it)->Dispose();
            it = available_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }

    while (available_.size() > options_.min_instances) {
        available_.front()->Dispose();
        available_.pop_front();
        ++evicted;
    }

    if (evicted > 0) {
        spdlog::debug("Pool cleanup evicted {} sandbox(es), {} idle", evicted, available_.size());
    }
}

void SandboxPool::CleanupLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!disposed_) {
        if (cleanup_cv_.wait_for(lock, options_.idle_timeout, [this] { return disposed_; })) {
            break;
        }
        lock.unlock();
        RunCleanup();
        lock.lock();
    }
}

void SandboxPool::Dispose() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;

        for (auto& sandbox : available_) {
            sandbox->Dispose();
        }
        for (auto& entry : in_use_) {
            entry.second->Dispose();
        }
        available_.clear();
        in_use_.clear();
    }

    cleanup_cv_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
    spdlog::debug("Sandbox pool disposed");
}

bool SandboxPool::IsDisposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

// ============================================================================
// IsolatedSandboxPool
// ============================================================================

IsolatedSandboxPool::IsolatedSandboxPool(PoolOptions options,
                                         SandboxOptions sandbox_options,
                                         RuntimeSettings settings)
    : options_(options)
    , sandbox_options_(sandbox_options)
    , settings_(std::move(settings)) {
    if (options_.max_instances == 0) {
        throw std::invalid_argument("Pool max_instances must be at least 1");
    }
}

IsolatedSandboxPool::~IsolatedSandboxPool() {
    Dispose();
}

void IsolatedSandboxPool::Initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        throw std::runtime_error(kPoolDisposedMessage);
    }
    spdlog::info("✓ Isolated sandbox pool ready (max {} concurrent workers)", options_.max_instances);
}

std::shared_ptr<ISandbox> IsolatedSandboxPool::Acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        throw std::runtime_error(kPoolDisposedMessage);
    }
    if (in_use_.size() >= options_.max_instances) {
        throw std::runtime_error(ExhaustedMessage(options_.max_instances));
    }

    auto sandbox = std::make_shared<IsolatedSandbox>(sandbox_options_, settings_);
    in_use_.emplace(sandbox.get(), sandbox);
    return sandbox;
}

void IsolatedSandboxPool::Release(const std::shared_ptr<ISandbox>& sandbox) {
    if (!sandbox) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_.erase(sandbox.get()) > 0) {
        sandbox->Dispose();
    }
}

PoolStats IsolatedSandboxPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return PoolStats{options_.max_instances - in_use_.size(), in_use_.size(), options_.max_instances};
}

void IsolatedSandboxPool::Dispose() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        return;
    }
    disposed_ = true;

    for (auto& entry : in_use_) {
        entry.second->Dispose();
    }
    in_use_.clear();
    spdlog::debug("Isolated sandbox pool disposed");
}

bool IsolatedSandboxPool::IsDisposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

} // namespace core
} // namespace capsule
