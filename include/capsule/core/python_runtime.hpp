/**
 * @file python_runtime.hpp
 * @brief Process-wide embedded CPython interpreter used by in-process units
 *
 * The interpreter is initialized lazily on first use with an isolated
 * configuration (no environment variables, no user site, no signal handlers
 * installed, no `site` import) and is never finalized. After start-up the
 * GIL is released; every caller takes it through GilGuard.
 *
 * If the host application already embeds Python, the existing interpreter
 * is reused.
 *
 * @date 2025
 */

#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <memory>
#include <optional>
#include <string>

namespace capsule {
namespace core {

/**
 * @brief Drops a strong reference. The GIL must be held.
 */
struct PyObjectDeleter {
    void operator()(PyObject* object) const noexcept { Py_XDECREF(object); }
};

using PyObjectPtr = std::unique_ptr<PyObject, PyObjectDeleter>;

/**
 * @class GilGuard
 * @brief Holds the GIL for the lifetime of the guard (any thread)
 */
class GilGuard {
public:
    GilGuard() : state_(PyGILState_Ensure()) {}
    ~GilGuard() { PyGILState_Release(state_); }

    GilGuard(const GilGuard&) = delete;
    GilGuard& operator=(const GilGuard&) = delete;

private:
    PyGILState_STATE state_;
};

/**
 * @class GilRelease
 * @brief Temporarily releases a GIL held by the current thread
 */
class GilRelease {
public:
    GilRelease() : saved_(PyEval_SaveThread()) {}
    ~GilRelease() { PyEval_RestoreThread(saved_); }

    GilRelease(const GilRelease&) = delete;
    GilRelease& operator=(const GilRelease&) = delete;

private:
    PyThreadState* saved_;
};

/**
 * @class PythonRuntime
 * @brief Singleton owning the interpreter and the loaded script prelude
 *
 * All returned PyObject pointers are borrowed and stay valid for the
 * lifetime of the process.
 */
class PythonRuntime {
public:
    /**
     * @brief Get the runtime, initializing the interpreter on first call
     * @throws std::runtime_error if the interpreter or prelude fails to load
     */
    static PythonRuntime& Instance();

    PythonRuntime(const PythonRuntime&) = delete;
    PythonRuntime& operator=(const PythonRuntime&) = delete;

    PyObject* RunScript() const { return run_script_; }         ///< prelude run_script()
    PyObject* HostCallAdapter() const { return adapter_; }      ///< wraps a JSON host call
    PyObject* TimeoutType() const { return timeout_type_; }     ///< ExecutionTimeout class
    PyObject* CapabilityErrorType() const { return capability_error_type_; }  ///< CapabilityError class

    /// Interpreter version string, e.g. "3.11.2"
    const std::string& Version() const { return version_; }

    /**
     * @brief Take the pending Python error as "Type: message" and clear it
     *
     * Requires the GIL. Returns "unknown error" when nothing is pending.
     */
    static std::string FetchError();

    /**
     * @brief UTF-8 contents of a str object, or nullopt for anything else
     */
    static std::optional<std::string> AsString(PyObject* object);

private:
    PythonRuntime();

    PyObject* LoadPrelude();

    PyObject* namespace_{nullptr};
    PyObject* run_script_{nullptr};
    PyObject* adapter_{nullptr};
    PyObject* timeout_type_{nullptr};
    PyObject* capability_error_type_{nullptr};
    std::string version_;
};

} // namespace core
} // namespace capsule
