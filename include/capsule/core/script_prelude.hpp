/**
 * @file script_prelude.hpp
 * @brief Python support code shared by both isolation modes
 *
 * The prelude defines the script-side runtime: the `ExecutionTimeout`
 * exception, the `pg` binding builder, the buffered `console`, and
 * `run_script()`, which applies the security policy, compiles the script as
 * the body of an `async def` and drives it to completion. Isolated workers
 * run the same code followed by `child_main()`, which speaks the bridge
 * protocol on fd 3.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace capsule {
namespace core {

/**
 * @brief Prelude source, executed once per interpreter
 */
const std::string& ScriptPrelude();

/**
 * @brief Prelude plus the worker entry point, suitable for `python3 -c`
 */
const std::string& WorkerBootstrap();

} // namespace core
} // namespace capsule
