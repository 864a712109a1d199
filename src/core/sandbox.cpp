/**
 * @file sandbox.cpp
 * @brief Shared ISandbox behaviour
 *
 * @date 2025
 */

#include "capsule/core/sandbox.hpp"

#include <utility>

namespace capsule {
namespace core {

std::future<SandboxResult> ISandbox::ExecuteAsync(std::string code, bindings::CapabilityMap bindings) {
    return std::async(std::launch::async,
        [this, code = std::move(code), bindings = std::move(bindings)]() {
            return Execute(code, bindings);
        });
}

} // namespace core
} // namespace capsule
