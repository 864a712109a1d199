/**
 * @file inprocess_sandbox.cpp
 * @brief In-process execution on the embedded interpreter
 *
 * Host functions reach the script through two C functions bound to a
 * PyCapsule that points at the unit's Bridge:
 * - host_call(group, method, params_json) -> result_json, dispatched with
 *   the GIL released and bounded by the execution deadline
 * - console_sink(line), appending to the unit's console buffer
 *
 * The watchdog raises ExecutionTimeout asynchronously in the executing
 * thread and keeps re-raising it until the call unwinds.
 *
 * @date 2025
 */

#include "capsule/core/python_runtime.hpp"  // Python.h goes first
#include "capsule/core/inprocess_sandbox.hpp"
#include "capsule/monitors/metrics_collector.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace capsule {
namespace core {

namespace {

constexpr const char* kBridgeCapsuleName = "capsule.bridge";
constexpr auto kWatchdogRetry = std::chrono::milliseconds(20);

/**
 * @brief State shared between a unit and its host functions
 */
struct Bridge {
    std::mutex mutex;
    const bindings::CapabilityDispatcher* dispatcher{nullptr};  ///< Set only while executing
    std::chrono::steady_clock::time_point deadline;
    std::vector<std::string> console;
};

using BridgeHandle = std::shared_ptr<Bridge>;

Bridge* BridgeFrom(PyObject* capsule) {
    auto* handle = static_cast<BridgeHandle*>(PyCapsule_GetPointer(capsule, kBridgeCapsuleName));
    return handle ? handle->get() : nullptr;
}

void ReleaseBridge(PyObject* capsule) {
    delete static_cast<BridgeHandle*>(PyCapsule_GetPointer(capsule, kBridgeCapsuleName));
}

PyObject* HostCall(PyObject* self, PyObject* args) {
    Bridge* bridge = BridgeFrom(self);
    if (!bridge) {
        return nullptr;
    }

    const char* group = nullptr;
    const char* method = nullptr;
    const char* params = nullptr;
    if (!PyArg_ParseTuple(args, "sss", &group, &method, &params)) {
        return nullptr;
    }

    const std::string group_name(group);
    const std::string method_name(method);
    const std::string params_text(params);

    std::string reply;
    std::string error;
    bool failed = false;
    bool timed_out = false;

    Py_BEGIN_ALLOW_THREADS
    const bindings::CapabilityDispatcher* dispatcher = nullptr;
    std::chrono::steady_clock::time_point deadline;
    {
        std::lock_guard<std::mutex> lock(bridge->mutex);
        dispatcher = bridge->dispatcher;
        deadline = bridge->deadline;
    }

    if (!dispatcher) {
        failed = true;
        error = "Capabilities are only available while a script is executing";
    } else {
        try {
            reply = dispatcher->InvokeUntil(group_name, method_name,
                                            nlohmann::json::parse(params_text), deadline).dump();
        } catch (const std::exception& e) {
            failed = true;
            error = e.what();
            timed_out = std::chrono::steady_clock::now() >= deadline;
        } catch (...) {
            failed = true;
            error = "pg." + group_name + "." + method_name + "() raised a non-standard exception";
        }
    }
    Py_END_ALLOW_THREADS

    if (failed) {
        auto& runtime = PythonRuntime::Instance();
        PyObject* type = timed_out ? runtime.TimeoutType() : runtime.CapabilityErrorType();
        PyErr_SetString(type, error.c_str());
        return nullptr;
    }
    return PyUnicode_FromStringAndSize(reply.data(), static_cast<Py_ssize_t>(reply.size()));
}

PyObject* ConsoleSink(PyObject* self, PyObject* args) {
    Bridge* bridge = BridgeFrom(self);
    if (!bridge) {
        return nullptr;
    }

    const char* line = nullptr;
    Py_ssize_t length = 0;
    if (!PyArg_ParseTuple(args, "s#", &line, &length)) {
        return nullptr;
    }

    {
        std::lock_guard<std::mutex> lock(bridge->mutex);
        bridge->console.emplace_back(line, static_cast<std::size_t>(length));
    }
    Py_RETURN_NONE;
}

PyMethodDef kHostCallDef = {"host_call", HostCall, METH_VARARGS, nullptr};
PyMethodDef kConsoleSinkDef = {"console_sink", ConsoleSink, METH_VARARGS, nullptr};

/**
 * @class Watchdog
 * @brief Raises ExecutionTimeout in a Python thread once a deadline passes
 *
 * Must be created and finished by a thread holding the GIL.
 */
class Watchdog {
public:
    Watchdog(unsigned long thread_id, PyObject* timeout_type,
             std::chrono::steady_clock::time_point deadline)
        : thread_([this, thread_id, timeout_type, deadline]() {
              Run(thread_id, timeout_type, deadline);
          }) {}

    ~Watchdog() {
        if (thread_.joinable()) {
            Finish();
        }
    }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    /// Stop and join. Releases the GIL while joining.
    void Finish() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
        }
        cv_.notify_all();

        GilRelease release;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool Fired() const { return fired_.load(); }

private:
    void Run(unsigned long thread_id, PyObject* timeout_type,
             std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_until(lock, deadline, [this] { return finished_; })) {
            return;
        }

        fired_ = true;
        while (!finished_) {
            lock.unlock();
            {
                GilGuard gil;
                PyThreadState_SetAsyncExc(thread_id, timeout_type);
            }
            lock.lock();
            cv_.wait_for(lock, kWatchdogRetry, [this] { return finished_; });
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    bool finished_{false};
    std::atomic<bool> fired_{false};
    std::thread thread_;
};

/**
 * @brief What run_script() reported
 */
struct Outcome {
    enum class Status { OK, ERROR, TIMEOUT };

    Status status{Status::ERROR};
    std::string payload;               ///< JSON text of the returned value
    std::string error;
    std::optional<std::string> stack;
};

} // anonymous namespace

// ============================================================================
// IMPLEMENTATION
// ============================================================================

struct InProcessSandbox::Impl {
    SandboxOptions options;
    std::string policy_json;
    BridgeHandle bridge = std::make_shared<Bridge>();

    std::atomic<bool> disposed{false};
    std::mutex execution_mutex;

    // Released under the GIL in the destructor
    PyObjectPtr scope;
    PyObjectPtr call;
    PyObjectPtr sink;

    Impl(SandboxOptions sandbox_options, const RuntimeSettings& settings);
    ~Impl();

    Outcome Run(const std::string& code, const std::string& shape_json,
                std::chrono::steady_clock::time_point deadline);
};

InProcessSandbox::Impl::Impl(SandboxOptions sandbox_options, const RuntimeSettings& settings)
    : options(sandbox_options)
    , policy_json(nlohmann::json(settings.policy).dump()) {

    PythonRuntime& runtime = PythonRuntime::Instance();
    GilGuard gil;

    PyObjectPtr new_scope(PyDict_New());

    auto handle = std::make_unique<BridgeHandle>(bridge);
    PyObjectPtr capsule(PyCapsule_New(handle.get(), kBridgeCapsuleName, ReleaseBridge));
    if (capsule) {
        handle.release();
    }

    PyObjectPtr host_call(capsule ? PyCFunction_New(&kHostCallDef, capsule.get()) : nullptr);
    PyObjectPtr console_sink(capsule ? PyCFunction_New(&kConsoleSinkDef, capsule.get()) : nullptr);
    PyObjectPtr adapted(host_call
        ? PyObject_CallFunctionObjArgs(runtime.HostCallAdapter(), host_call.get(), nullptr)
        : nullptr);

    if (!new_scope || !console_sink || !adapted) {
        throw std::runtime_error("Failed to create sandbox scope: " + PythonRuntime::FetchError());
    }

    scope = std::move(new_scope);
    call = std::move(adapted);
    sink = std::move(console_sink);
}

InProcessSandbox::Impl::~Impl() {
    GilGuard gil;
    if (scope) {
        PyDict_Clear(scope.get());
    }
    scope.reset();
    call.reset();
    sink.reset();
}

Outcome InProcessSandbox::Impl::Run(const std::string& code, const std::string& shape_json,
                                    std::chrono::steady_clock::time_point deadline) {
    PythonRuntime& runtime = PythonRuntime::Instance();
    Outcome outcome;

    GilGuard gil;
    const unsigned long thread_id = PyThread_get_thread_ident();

    PyObjectPtr source(PyUnicode_DecodeUTF8(code.data(), static_cast<Py_ssize_t>(code.size()), "replace"));
    PyObjectPtr shape(PyUnicode_FromStringAndSize(shape_json.data(), static_cast<Py_ssize_t>(shape_json.size())));
    PyObjectPtr policy(PyUnicode_FromStringAndSize(policy_json.data(), static_cast<Py_ssize_t>(policy_json.size())));
    PyObjectPtr timeout_ms(PyLong_FromLongLong(static_cast<long long>(options.timeout.count())));
    if (!source || !shape || !policy || !timeout_ms) {
        outcome.error = PythonRuntime::FetchError();
        return outcome;
    }

    PyObjectPtr returned;
    bool fired = false;
    {
        Watchdog watchdog(thread_id, runtime.TimeoutType(), deadline);
        returned.reset(PyObject_CallFunctionObjArgs(runtime.RunScript(), scope.get(), source.get(),
                                                    shape.get(), policy.get(), call.get(), sink.get(),
                                                    timeout_ms.get(), nullptr));
        watchdog.Finish();
        fired = watchdog.Fired();
    }
    // Drop a timeout the watchdog raised after the script had already unwound
    PyThreadState_SetAsyncExc(thread_id, nullptr);

    if (fired || (!returned && PyErr_ExceptionMatches(runtime.TimeoutType()))) {
        PyErr_Clear();
        outcome.status = Outcome::Status::TIMEOUT;
        return outcome;
    }

    if (!returned) {
        outcome.error = PythonRuntime::FetchError();
        return outcome;
    }

    if (!PyTuple_Check(returned.get()) || PyTuple_Size(returned.get()) != 4) {
        outcome.error = "Script runtime returned an unexpected value";
        return outcome;
    }

    auto status = PythonRuntime::AsString(PyTuple_GET_ITEM(returned.get(), 0));
    if (status == "ok") {
        outcome.status = Outcome::Status::OK;
        outcome.payload = PythonRuntime::AsString(PyTuple_GET_ITEM(returned.get(), 1)).value_or("null");
    } else if (status == "timeout") {
        outcome.status = Outcome::Status::TIMEOUT;
    } else {
        outcome.error = PythonRuntime::AsString(PyTuple_GET_ITEM(returned.get(), 2)).value_or("Script failed");
        outcome.stack = PythonRuntime::AsString(PyTuple_GET_ITEM(returned.get(), 3));
    }
    return outcome;
}

// ============================================================================
// PUBLIC INTERFACE
// ============================================================================

InProcessSandbox::InProcessSandbox(SandboxOptions options, RuntimeSettings settings)
    : impl_(std::make_unique<Impl>(options, settings)) {
    spdlog::debug("In-process sandbox created (timeout: {}ms)", options.timeout.count());
}

InProcessSandbox::~InProcessSandbox() = default;

SandboxResult InProcessSandbox::Execute(const std::string& code,
                                        const bindings::CapabilityMap& bindings) {
    if (impl_->disposed.load()) {
        return MakeFailure(kDisposedMessage);
    }

    std::lock_guard<std::mutex> execution_lock(impl_->execution_mutex);
    if (impl_->disposed.load()) {
        return MakeFailure(kDisposedMessage);
    }

    bindings::CapabilityDispatcher dispatcher(bindings);
    const std::string shape = bindings::ShapeToJson(dispatcher.Shape()).dump();

    monitors::MetricsCollector metrics;
    metrics.Start();
    const auto deadline = std::chrono::steady_clock::now() + impl_->options.timeout;

    // Dispatcher is only reachable from host_call for the duration of Run()
    struct ActiveCall {
        Bridge& bridge;
        ActiveCall(Bridge& b, const bindings::CapabilityDispatcher* d,
                   std::chrono::steady_clock::time_point until) : bridge(b) {
            std::lock_guard<std::mutex> lock(bridge.mutex);
            bridge.dispatcher = d;
            bridge.deadline = until;
        }
        ~ActiveCall() {
            std::lock_guard<std::mutex> lock(bridge.mutex);
            bridge.dispatcher = nullptr;
        }
    };

    Outcome outcome;
    {
        ActiveCall active(*impl_->bridge, &dispatcher, deadline);
        outcome = impl_->Run(code, shape, deadline);
    }

    SandboxResult result;
    result.metrics = metrics.Stop();

    switch (outcome.status) {
        case Outcome::Status::OK:
            try {
                result.result = nlohmann::json::parse(outcome.payload);
                result.success = true;
            } catch (const nlohmann::json::parse_error& e) {
                result.error = std::string("Script result could not be decoded: ") + e.what();
            }
            break;

        case Outcome::Status::TIMEOUT:
            result.error = TimeoutMessage(impl_->options.timeout);
            spdlog::warn("⏱ In-process execution exceeded {}ms", impl_->options.timeout.count());
            break;

        case Outcome::Status::ERROR:
            result.error = outcome.error;
            result.stack = outcome.stack;
            spdlog::debug("Script failed: {}", outcome.error);
            break;
    }

    return result;
}

bool InProcessSandbox::IsHealthy() const {
    return !impl_->disposed.load();
}

void InProcessSandbox::Dispose() {
    if (impl_->disposed.exchange(true)) {
        return;
    }
    ClearConsoleOutput();
    spdlog::debug("In-process sandbox disposed");
}

std::vector<std::string> InProcessSandbox::GetConsoleOutput() const {
    std::lock_guard<std::mutex> lock(impl_->bridge->mutex);
    return impl_->bridge->console;
}

void InProcessSandbox::ClearConsoleOutput() {
    std::lock_guard<std::mutex> lock(impl_->bridge->mutex);
    impl_->bridge->console.clear();
}

const SandboxOptions& InProcessSandbox::Options() const {
    return impl_->options;
}

} // namespace core
} // namespace capsule
