/**
 * @file capability_map.hpp
 * @brief Host capability tree and its projections across isolation boundaries
 *
 * A capability map is the tree of named host operations (group -> method ->
 * async callable) a script may reach through the `pg` root object. The
 * sandbox treats it as read-only, non-owned data.
 *
 * Two projections exist:
 * - **In-process**: live references. CapabilityDispatcher points straight at
 *   the callables in the caller's map for the duration of one execution.
 * - **Isolated**: names only. ProjectShape() extracts `{group: [methods]}`,
 *   which is all that crosses into a worker process; calls come back over
 *   the bridge and are resolved by a dispatcher on the host side.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace capsule {
namespace bindings {

/// Top-level name the capability tree is bound to inside scripts
constexpr const char* kBindingsRoot = "pg";

/**
 * @brief Async host operation taking a single parameter object
 *
 * Params are a JSON object, or null when the script passed nothing.
 */
using Capability = std::function<std::future<nlohmann::json>(const nlohmann::json& params)>;

using CapabilityGroup = std::map<std::string, Capability>;  ///< method name -> callable
using CapabilityMap = std::map<std::string, CapabilityGroup>;  ///< group name -> methods
using BindingShape = std::map<std::string, std::vector<std::string>>;  ///< group -> method names

/**
 * @brief Wrap a synchronous function as a Capability
 *
 * The function runs on the calling thread; its return value (or exception)
 * is delivered through an already-satisfied future.
 */
Capability MakeCapability(std::function<nlohmann::json(const nlohmann::json&)> fn);

/**
 * @brief Extract the name-only shape of a capability map
 *
 * Empty callables are skipped rather than rejected, so a partially
 * populated map degrades to the methods that are actually callable. Groups
 * are kept even when they end up empty.
 *
 * @param capabilities Capability tree supplied by the host
 * @return Group -> method names
 */
BindingShape ProjectShape(const CapabilityMap& capabilities);

/**
 * @brief Serialize a shape as `{group: [methods...]}`
 */
nlohmann::json ShapeToJson(const BindingShape& shape);

/**
 * @class CapabilityDispatcher
 * @brief String-keyed dispatch table over a capability map
 *
 * Built once per execution from the caller's map. Lookups are validated
 * against the names present in that map; a script can never invoke a name
 * that was not supplied. Holds pointers into the map, which must outlive
 * the dispatcher.
 *
 * **Thread Safety**: Read-only after construction; Invoke() may be called
 * from any thread.
 */
class CapabilityDispatcher {
public:
    explicit CapabilityDispatcher(const CapabilityMap& capabilities);

    CapabilityDispatcher(const CapabilityDispatcher&) = delete;
    CapabilityDispatcher& operator=(const CapabilityDispatcher&) = delete;

    /**
     * @brief Check whether group.method is on the allow-list
     */
    bool Contains(const std::string& group, const std::string& method) const;

    /**
     * @brief Name-only view of the allow-list
     */
    const BindingShape& Shape() const { return shape_; }

    /**
     * @brief Number of callable methods across all groups
     */
    std::size_t Size() const { return table_.size(); }

    /**
     * @brief Invoke a capability and wait for its result
     *
     * @param group Group name
     * @param method Method name
     * @param params Parameter object (JSON object or null)
     * @return Value the capability resolved to
     *
     * @throws std::invalid_argument if params is neither an object nor null
     * @throws std::runtime_error if the name is not on the allow-list
     * @throws any exception the capability itself raised
     */
    nlohmann::json Invoke(const std::string& group,
                          const std::string& method,
                          const nlohmann::json& params) const;

    /**
     * @brief Invoke a capability, giving up at a deadline
     *
     * Returns at the deadline even when the capability is still running. The
     * unfinished future is handed to a background owner and dropped once it
     * settles; its result is discarded.
     *
     * @throws std::runtime_error containing "timeout" when the capability
     *         has not resolved by @p deadline
     */
    nlohmann::json InvokeUntil(const std::string& group,
                               const std::string& method,
                               const nlohmann::json& params,
                               std::chrono::steady_clock::time_point deadline) const;

private:
    std::future<nlohmann::json> Start(const std::string& group,
                                      const std::string& method,
                                      const nlohmann::json& params) const;

    static std::string Qualify(const std::string& group, const std::string& method);

    using Key = std::pair<std::string, std::string>;  ///< (group, method)

    std::map<Key, const Capability*> table_;
    BindingShape shape_;
};

/**
 * @brief Capability calls that missed their deadline and are still running
 */
std::size_t PendingCapabilityStragglers();

} // namespace bindings
} // namespace capsule
