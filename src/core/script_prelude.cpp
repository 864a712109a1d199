/**
 * @file script_prelude.cpp
 * @brief Embedded Python prelude
 *
 * run_script(scope, source, shape, policy, call, sink, timeout_ms) returns
 * a 4-tuple `(status, payload_json, error, stack)` with status one of
 * "ok", "error" or "timeout".
 *
 * @date 2025
 */

#include "capsule/core/script_prelude.hpp"

namespace capsule {
namespace core {

namespace {

constexpr const char* kPrelude = R"PY(
import ast as _ast
import json as _json
import math as _math
import traceback as _traceback
import types as _types
import builtins as _builtins

_SCRIPT_NAME = "<sandbox>"


class ExecutionTimeout(BaseException):
    pass


class CapabilityError(Exception):
    pass


def _timeout_message(timeout_ms):
    return "Execution timeout: exceeded %dms limit" % timeout_ms


def _format_arg(value):
    if isinstance(value, (dict, list)):
        try:
            return _json.dumps(value, default=str)
        except (TypeError, ValueError):
            return str(value)
    return str(value)


class _Console:
    __slots__ = ("_sink",)

    def __init__(self, sink):
        self._sink = sink

    def _emit(self, prefix, args):
        self._sink(prefix + " ".join(_format_arg(a) for a in args))

    def log(self, *args):
        self._emit("", args)

    def info(self, *args):
        self._emit("[INFO] ", args)

    def warn(self, *args):
        self._emit("[WARN] ", args)

    def error(self, *args):
        self._emit("[ERROR] ", args)


class _Settled:
    __slots__ = ("_value", "_error")

    def __init__(self, value=None, error=None):
        self._value = value
        self._error = error

    def __await__(self):
        if self._error is not None:
            raise self._error
        return self._value
        yield


def _params(qualified, args, kwargs):
    if args and kwargs:
        raise TypeError(qualified + "() takes a parameter dict or keyword arguments, not both")
    if len(args) > 1:
        raise TypeError(qualified + "() takes a single parameter object")
    if args:
        if args[0] is None:
            return None
        if not isinstance(args[0], dict):
            raise TypeError(qualified + "() expects a dict of parameters")
        return args[0]
    return dict(kwargs) if kwargs else None


class _Method:
    __slots__ = ("_call", "_group", "_name")

    def __init__(self, call, group, name):
        self._call = call
        self._group = group
        self._name = name

    def __call__(self, *args, **kwargs):
        qualified = "pg." + self._group + "." + self._name
        try:
            return _Settled(self._call(self._group, self._name, _params(qualified, args, kwargs)))
        except Exception as exc:
            return _Settled(error=exc)


def _make_bindings(shape, call):
    groups = {}
    for group, methods in shape.items():
        groups[group] = _types.SimpleNamespace(**{m: _Method(call, group, m) for m in methods})
    return _types.SimpleNamespace(**groups)


def _apply_policy(scope, policy):
    blocked = set(policy.get("blockedBuiltins", ()))
    allowed = {}
    for name in policy.get("allowedBuiltins", ()):
        if name not in blocked and hasattr(_builtins, name):
            allowed[name] = getattr(_builtins, name)
    for name in list(scope):
        if name in blocked or name in policy.get("blockedModules", ()):
            del scope[name]
    scope["__builtins__"] = allowed
    scope["__name__"] = "__sandbox__"


# Frame, code and traceback links lead back into host namespaces
_FORBIDDEN_ATTRIBUTES = frozenset((
    "gi_frame", "gi_code", "gi_yieldfrom", "cr_frame", "cr_code", "cr_await",
    "cr_origin", "ag_frame", "ag_code", "ag_await", "tb_frame", "tb_next",
    "f_back", "f_builtins", "f_code", "f_globals", "f_locals",
))

_MATCH_CLASS = getattr(_ast, "MatchClass", ())


def _forbidden_attribute(name):
    return name.startswith("_") or name in _FORBIDDEN_ATTRIBUTES


def _reject(node, kind, name):
    raise SyntaxError("access to %s '%s' is not allowed" % (kind, name),
                      (_SCRIPT_NAME, getattr(node, "lineno", 1),
                       getattr(node, "col_offset", 0) + 1, None))


def _check_access(tree):
    for node in _ast.walk(tree):
        if isinstance(node, _ast.Attribute) and _forbidden_attribute(node.attr):
            _reject(node, "attribute", node.attr)
        elif isinstance(node, _ast.Name) and node.id.startswith("__"):
            _reject(node, "name", node.id)
        elif isinstance(node, _MATCH_CLASS):
            for attr in node.kwd_attrs:
                if _forbidden_attribute(attr):
                    _reject(node, "attribute", attr)


def _compile(source):
    tree = _ast.parse(source, _SCRIPT_NAME, "exec")
    _check_access(tree)
    wrapper = _ast.parse("async def __capsule_main__():\n    pass\n", _SCRIPT_NAME, "exec")
    if tree.body:
        wrapper.body[0].body = tree.body
    _ast.fix_missing_locations(wrapper)
    return compile(wrapper, _SCRIPT_NAME, "exec", dont_inherit=True)


def _drive(coro):
    if not isinstance(coro, _types.CoroutineType):
        raise SyntaxError("'yield' is not allowed at the top level of a script")
    try:
        coro.send(None)
    except StopIteration as stop:
        return stop.value
    coro.close()
    raise RuntimeError("scripts may only await capability calls")


def _encode(value):
    try:
        return _json.dumps(value, default=str, allow_nan=False)
    except (TypeError, ValueError):
        return _json.dumps(str(value))


def _format_stack(exc):
    frames = [f for f in _traceback.extract_tb(exc.__traceback__) if f.filename == _SCRIPT_NAME]
    lines = ["Traceback (most recent call last):\n"]
    lines.extend(_traceback.format_list(frames))
    lines.extend(_traceback.format_exception_only(type(exc), exc))
    return "".join(lines)


def run_script(scope, source, shape, policy, call, sink, timeout_ms):
    if isinstance(shape, str):
        shape = _json.loads(shape)
    if isinstance(policy, str):
        policy = _json.loads(policy)
    try:
        _apply_policy(scope, policy)
        console = _Console(sink)
        scope["pg"] = _make_bindings(shape, call)
        scope["console"] = console
        scope["print"] = console.log
        scope["math"] = _math
        scope["json"] = _types.SimpleNamespace(dumps=_json.dumps, loads=_json.loads)
        scope.pop("__capsule_main__", None)
        exec(_compile(source), scope)
        main = scope.pop("__capsule_main__")
        return ("ok", _encode(_drive(main())), None, None)
    except ExecutionTimeout:
        return ("timeout", None, _timeout_message(timeout_ms), None)
    except Exception as exc:
        return ("error", None, "%s: %s" % (type(exc).__name__, exc), _format_stack(exc))


def host_call_adapter(host_call):
    def call(group, method, params):
        return _json.loads(host_call(group, method, _json.dumps(params)))
    return call


def child_main():
    import os
    import signal
    import socket

    sock = socket.socket(fileno=3)
    reader = sock.makefile("rb")

    def send(message):
        sock.sendall((_json.dumps(message, default=str) + "\n").encode("utf-8"))

    def receive():
        line = reader.readline()
        if not line:
            raise ConnectionError("host closed the bridge")
        return _json.loads(line)

    start = receive()
    if start.get("type") != "start":
        raise RuntimeError("expected a start message")
    timeout_ms = int(start.get("timeoutMs", 30000))
    pending = {"next": 0}

    def call(group, method, params):
        pending["next"] += 1
        request_id = pending["next"]
        send({"type": "call", "requestId": request_id, "group": group,
              "method": method, "args": params})
        while True:
            reply = receive()
            if reply.get("type") == "reply" and reply.get("requestId") == request_id:
                break
        if "error" in reply:
            raise CapabilityError(reply["error"])
        return reply.get("result")

    def on_alarm(signum, frame):
        raise ExecutionTimeout()

    lines = []
    signal.signal(signal.SIGALRM, on_alarm)
    try:
        signal.setitimer(signal.ITIMER_REAL, timeout_ms / 1000.0)
        status, payload, error, stack = run_script(
            {}, start.get("code", ""), start.get("bindings", {}), start.get("policy", {}),
            call, lines.append, timeout_ms)
        signal.setitimer(signal.ITIMER_REAL, 0)
    except ExecutionTimeout:
        status, payload, error, stack = ("timeout", None, _timeout_message(timeout_ms), None)

    message = {"type": "result", "success": status == "ok", "console": lines}
    if status == "ok":
        message["result"] = _json.loads(payload)
    else:
        message["error"] = error
        if stack:
            message["stack"] = stack
    send(message)
    sock.close()
    os._exit(0)
)PY";

} // anonymous namespace

const std::string& ScriptPrelude() {
    static const std::string prelude(kPrelude);
    return prelude;
}

const std::string& WorkerBootstrap() {
    static const std::string bootstrap = ScriptPrelude() + "\nchild_main()\n";
    return bootstrap;
}

} // namespace core
} // namespace capsule
