/**
 * @file security_policy.cpp
 * @brief Default policy lists and worker resource limits
 *
 * @date 2025
 */

#include "capsule/security/security_policy.hpp"

#include <algorithm>

namespace capsule {
namespace security {

namespace {

bool ListContains(const std::vector<std::string>& list, const std::string& name) {
    return std::find(list.begin(), list.end(), name) != list.end();
}

} // anonymous namespace

SecurityPolicy SecurityPolicy::Default() {
    SecurityPolicy policy;

    policy.allowed_builtins = {
        // Values and containers
        "bool", "int", "float", "complex", "str", "bytes", "bytearray",
        "list", "tuple", "dict", "set", "frozenset", "object", "slice",
        "range", "type", "NotImplemented", "Ellipsis",

        // Arithmetic and conversion
        "abs", "divmod", "pow", "round", "sum", "min", "max", "hash",
        "bin", "oct", "hex", "chr", "ord", "ascii", "repr", "format",

        // Iteration
        "all", "any", "enumerate", "filter", "iter", "len", "map", "next",
        "reversed", "sorted", "zip",

        // Introspection that cannot reach the host
        "callable", "isinstance", "issubclass", "hasattr",

        // Classes
        "__build_class__", "super", "property", "staticmethod", "classmethod",

        // Exceptions
        "Exception", "ArithmeticError", "AssertionError",
        "AttributeError", "IndexError", "KeyError", "LookupError", "NameError",
        "NotImplementedError", "OverflowError", "RecursionError", "RuntimeError",
        "StopIteration", "TimeoutError", "TypeError", "ValueError",
        "ZeroDivisionError", "ImportError", "UnicodeError"
    };

    policy.blocked_builtins = {
        "__import__", "open", "exec", "eval", "compile", "input", "breakpoint",
        "globals", "locals", "vars", "getattr", "setattr", "delattr",
        "memoryview", "help", "exit", "quit"
    };

    policy.blocked_modules = {
        "os", "sys", "subprocess", "socket", "shutil", "pathlib", "importlib",
        "ctypes", "signal", "threading", "multiprocessing", "io", "builtins"
    };

    return policy;
}

bool SecurityPolicy::IsBuiltinAllowed(const std::string& name) const {
    return ListContains(allowed_builtins, name) && !ListContains(blocked_builtins, name);
}

bool SecurityPolicy::IsModuleBlocked(const std::string& name) const {
    return ListContains(blocked_modules, name);
}

void to_json(nlohmann::json& j, const SecurityPolicy& policy) {
    j = nlohmann::json{
        {"allowedBuiltins", policy.allowed_builtins},
        {"blockedBuiltins", policy.blocked_builtins},
        {"blockedModules", policy.blocked_modules}
    };
}

void from_json(const nlohmann::json& j, SecurityPolicy& policy) {
    auto defaults = SecurityPolicy::Default();
    policy.allowed_builtins = j.value("allowedBuiltins", defaults.allowed_builtins);
    policy.blocked_builtins = j.value("blockedBuiltins", defaults.blocked_builtins);
    policy.blocked_modules = j.value("blockedModules", defaults.blocked_modules);
}

ResourceLimits LimitsFor(const core::SandboxOptions& options) {
    constexpr std::uint64_t kMb = 1024 * 1024;

    ResourceLimits limits;
    limits.address_space_bytes = (options.memory_limit_mb + kInterpreterBaselineMb) * kMb;

    auto ms = static_cast<std::uint64_t>(std::max<std::int64_t>(options.timeout.count(), 0));
    limits.cpu_seconds = (ms + 999) / 1000 + 1;
    return limits;
}

} // namespace security
} // namespace capsule
