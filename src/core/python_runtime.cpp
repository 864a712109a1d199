/**
 * @file python_runtime.cpp
 * @brief Embedded interpreter start-up and prelude loading
 *
 * @date 2025
 */

#include "capsule/core/python_runtime.hpp"
#include "capsule/core/script_prelude.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace capsule {
namespace core {

PythonRuntime& PythonRuntime::Instance() {
    // Interpreter objects are never released; the interpreter is never finalized
    static PythonRuntime runtime;
    return runtime;
}

PythonRuntime::PythonRuntime() {
    bool owns_interpreter = false;

    if (!Py_IsInitialized()) {
        PyConfig config;
        PyConfig_InitIsolatedConfig(&config);
        config.install_signal_handlers = 0;
        config.site_import = 0;
        config.write_bytecode = 0;

        PyStatus status = Py_InitializeFromConfig(&config);
        PyConfig_Clear(&config);

        if (PyStatus_Exception(status)) {
            std::string reason = status.err_msg ? status.err_msg : "unknown error";
            spdlog::error("Failed to initialize embedded Python: {}", reason);
            throw std::runtime_error("Failed to initialize Python interpreter: " + reason);
        }
        owns_interpreter = true;
    }

    try {
        GilGuard gil;
        namespace_ = LoadPrelude();

        std::string full_version = Py_GetVersion();
        version_ = full_version.substr(0, full_version.find(' '));
    } catch (const std::exception&) {
        if (owns_interpreter) {
            PyEval_SaveThread();
        }
        throw;
    }

    if (owns_interpreter) {
        // Py_InitializeFromConfig leaves the GIL held by this thread
        PyEval_SaveThread();
        spdlog::info("✓ Embedded Python {} initialized", version_);
    } else {
        spdlog::info("Reusing host Python {} interpreter", version_);
    }
}

PyObject* PythonRuntime::LoadPrelude() {
    PyObjectPtr ns(PyDict_New());
    PyObjectPtr builtins(PyImport_ImportModule("builtins"));
    PyObjectPtr name(PyUnicode_FromString("capsule_prelude"));

    if (!ns || !builtins || !name ||
        PyDict_SetItemString(ns.get(), "__builtins__", builtins.get()) != 0 ||
        PyDict_SetItemString(ns.get(), "__name__", name.get()) != 0) {
        throw std::runtime_error("Failed to prepare prelude namespace: " + FetchError());
    }

    PyObjectPtr loaded(PyRun_String(ScriptPrelude().c_str(), Py_file_input, ns.get(), ns.get()));
    if (!loaded) {
        std::string error = FetchError();
        spdlog::error("Script prelude failed to load: {}", error);
        throw std::runtime_error("Failed to load script prelude: " + error);
    }

    // Borrowed references, kept alive by the namespace
    run_script_ = PyDict_GetItemString(ns.get(), "run_script");
    adapter_ = PyDict_GetItemString(ns.get(), "host_call_adapter");
    timeout_type_ = PyDict_GetItemString(ns.get(), "ExecutionTimeout");
    capability_error_type_ = PyDict_GetItemString(ns.get(), "CapabilityError");

    if (!run_script_ || !adapter_ || !timeout_type_ || !capability_error_type_) {
        throw std::runtime_error("Script prelude is missing required definitions");
    }

    spdlog::debug("Script prelude loaded ({} bytes)", ScriptPrelude().size());
    return ns.release();
}

std::optional<std::string> PythonRuntime::AsString(PyObject* object) {
    if (!object || !PyUnicode_Check(object)) {
        return std::nullopt;
    }

    Py_ssize_t size = 0;
    const char* data = PyUnicode_AsUTF8AndSize(object, &size);
    if (!data) {
        PyErr_Clear();
        return std::nullopt;
    }
    return std::string(data, static_cast<std::size_t>(size));
}

std::string PythonRuntime::FetchError() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) {
        return "unknown error";
    }
    PyErr_NormalizeException(&type, &value, &traceback);

    PyObjectPtr type_ptr(type);
    PyObjectPtr value_ptr(value);
    PyObjectPtr traceback_ptr(traceback);

    std::string name = PyType_Check(type) ? reinterpret_cast<PyTypeObject*>(type)->tp_name : "Error";
    auto dot = name.rfind('.');
    if (dot != std::string::npos) {
        name = name.substr(dot + 1);
    }

    std::string message;
    if (value_ptr) {
        PyObjectPtr text(PyObject_Str(value_ptr.get()));
        if (auto str = AsString(text.get())) {
            message = *str;
        } else {
            PyErr_Clear();
        }
    }

    return message.empty() ? name : name + ": " + message;
}

} // namespace core
} // namespace capsule
