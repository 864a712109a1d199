/**
 * @file capability_map.cpp
 * @brief Capability projection and allow-listed dispatch
 *
 * @date 2025
 */

#include "capsule/bindings/capability_map.hpp"

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace capsule {
namespace bindings {

namespace {

/**
 * @class StragglerReaper
 * @brief Owns capability futures abandoned at a deadline
 *
 * A future obtained from std::async joins its task when destroyed, so an
 * abandoned one cannot be dropped on the caller's path. Stragglers are
 * parked here and released by a background thread once they are ready.
 */
class StragglerReaper {
public:
    static StragglerReaper& Instance() {
        static StragglerReaper reaper;
        return reaper;
    }

    void Adopt(std::future<nlohmann::json> future) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push_back(std::move(future));
        }
        cv_.notify_one();
    }

    std::size_t Pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    ~StragglerReaper() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

private:
    StragglerReaper() : thread_(&StragglerReaper::Run, this) {}

    void Run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            cv_.wait_for(lock, kScanInterval);

            std::vector<std::future<nlohmann::json>> settled;
            for (auto it = pending_.begin(); it != pending_.end();) {
                if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                    settled.push_back(std::move(*it));
                    it = pending_.erase(it);
                } else {
                    ++it;
                }
            }

            if (!settled.empty()) {
                spdlog::debug("Released {} late capability result(s)", settled.size());
            }
            lock.unlock();
            settled.clear();
            lock.lock();
        }
    }

    static constexpr std::chrono::milliseconds kScanInterval{50};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::future<nlohmann::json>> pending_;
    bool stopping_{false};
    std::thread thread_;
};

} // anonymous namespace

std::size_t PendingCapabilityStragglers() {
    return StragglerReaper::Instance().Pending();
}

Capability MakeCapability(std::function<nlohmann::json(const nlohmann::json&)> fn) {
    return [fn = std::move(fn)](const nlohmann::json& params) {
        std::promise<nlohmann::json> promise;
        try {
            promise.set_value(fn(params));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
        return promise.get_future();
    };
}

BindingShape ProjectShape(const CapabilityMap& capabilities) {
    BindingShape shape;
    for (const auto& [group, methods] : capabilities) {
        auto& names = shape[group];
        for (const auto& [name, callable] : methods) {
            if (!callable) {
                spdlog::debug("Skipping empty capability {}.{}.{}", kBindingsRoot, group, name);
                continue;
            }
            names.push_back(name);
        }
    }
    return shape;
}

nlohmann::json ShapeToJson(const BindingShape& shape) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [group, methods] : shape) {
        j[group] = methods;
    }
    return j;
}

// ============================================================================
// DISPATCHER
// ============================================================================

CapabilityDispatcher::CapabilityDispatcher(const CapabilityMap& capabilities)
    : shape_(ProjectShape(capabilities)) {
    for (const auto& [group, methods] : capabilities) {
        for (const auto& [name, callable] : methods) {
            if (callable) {
                table_.emplace(Key{group, name}, &callable);
            }
        }
    }
}

bool CapabilityDispatcher::Contains(const std::string& group, const std::string& method) const {
    return table_.count(Key{group, method}) > 0;
}

std::string CapabilityDispatcher::Qualify(const std::string& group, const std::string& method) {
    return group + "." + method;
}

std::future<nlohmann::json> CapabilityDispatcher::Start(const std::string& group,
                                                        const std::string& method,
                                                        const nlohmann::json& params) const {
    const std::string qualified = Qualify(group, method);

    if (!params.is_null() && !params.is_object()) {
        throw std::invalid_argument(std::string(kBindingsRoot) + "." + qualified +
                                    "() expects a single parameter object");
    }

    auto it = table_.find(Key{group, method});
    if (it == table_.end()) {
        spdlog::warn("Rejected call to unknown capability {}.{}", kBindingsRoot, qualified);
        throw std::runtime_error("Unknown capability: " + std::string(kBindingsRoot) + "." + qualified);
    }

    auto future = (*it->second)(params);
    if (!future.valid()) {
        throw std::runtime_error(std::string(kBindingsRoot) + "." + qualified + "() produced no result");
    }
    return future;
}

nlohmann::json CapabilityDispatcher::Invoke(const std::string& group,
                                            const std::string& method,
                                            const nlohmann::json& params) const {
    return Start(group, method, params).get();
}

nlohmann::json CapabilityDispatcher::InvokeUntil(const std::string& group,
                                                 const std::string& method,
                                                 const nlohmann::json& params,
                                                 std::chrono::steady_clock::time_point deadline) const {
    auto future = Start(group, method, params);
    if (future.wait_until(deadline) != std::future_status::ready) {
        StragglerReaper::Instance().Adopt(std::move(future));
        throw std::runtime_error("Execution timeout: " + std::string(kBindingsRoot) + "." +
                                 Qualify(group, method) + "() did not complete before the deadline");
    }
    return future.get();
}

} // namespace bindings
} // namespace capsule
