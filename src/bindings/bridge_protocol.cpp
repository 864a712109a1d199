/**
 * @file bridge_protocol.cpp
 * @brief Bridge message encoding, decoding and call serving
 *
 * @date 2025
 */

#include "capsule/bindings/bridge_protocol.hpp"

#include <spdlog/spdlog.h>

namespace capsule {
namespace bindings {

MessageType GetMessageType(const nlohmann::json& message) {
    if (!message.is_object()) {
        return MessageType::UNKNOWN;
    }
    auto it = message.find("type");
    if (it == message.end() || !it->is_string()) {
        return MessageType::UNKNOWN;
    }

    const auto& type = it->get_ref<const std::string&>();
    if (type == "start") return MessageType::START;
    if (type == "call") return MessageType::CALL;
    if (type == "reply") return MessageType::REPLY;
    if (type == "result") return MessageType::RESULT;
    return MessageType::UNKNOWN;
}

nlohmann::json MakeStartMessage(const std::string& code,
                                const BindingShape& shape,
                                std::chrono::milliseconds timeout,
                                const nlohmann::json& policy) {
    return nlohmann::json{
        {"type", "start"},
        {"code", code},
        {"bindings", ShapeToJson(shape)},
        {"timeoutMs", timeout.count()},
        {"policy", policy}
    };
}

nlohmann::json MakeReply(std::int64_t request_id, const nlohmann::json& result) {
    return nlohmann::json{{"type", "reply"}, {"requestId", request_id}, {"result", result}};
}

nlohmann::json MakeErrorReply(std::int64_t request_id, const std::string& error) {
    return nlohmann::json{{"type", "reply"}, {"requestId", request_id}, {"error", error}};
}

std::optional<CallRequest> ParseCallRequest(const nlohmann::json& message) {
    if (GetMessageType(message) != MessageType::CALL) {
        return std::nullopt;
    }

    auto id = message.find("requestId");
    auto group = message.find("group");
    auto method = message.find("method");
    if (id == message.end() || !id->is_number_integer() ||
        group == message.end() || !group->is_string() ||
        method == message.end() || !method->is_string()) {
        return std::nullopt;
    }

    CallRequest request;
    request.request_id = id->get<std::int64_t>();
    request.group = group->get<std::string>();
    request.method = method->get<std::string>();
    request.args = message.value("args", nlohmann::json());
    return request;
}

std::optional<WorkerResult> ParseWorkerResult(const nlohmann::json& message) {
    if (GetMessageType(message) != MessageType::RESULT) {
        return std::nullopt;
    }

    auto success = message.find("success");
    if (success == message.end() || !success->is_boolean()) {
        return std::nullopt;
    }

    WorkerResult result;
    result.success = success->get<bool>();
    result.result = message.value("result", nlohmann::json());

    auto error = message.find("error");
    if (error != message.end() && error->is_string()) {
        result.error = error->get<std::string>();
    }
    auto stack = message.find("stack");
    if (stack != message.end() && stack->is_string()) {
        result.stack = stack->get<std::string>();
    }

    auto console = message.find("console");
    if (console != message.end() && console->is_array()) {
        for (const auto& line : *console) {
            result.console.push_back(line.is_string() ? line.get<std::string>() : line.dump());
        }
    }

    if (!result.success && !result.error) {
        result.error = "Script failed";
    }
    return result;
}

std::string EncodeLine(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

nlohmann::json ServeCall(const CapabilityDispatcher& dispatcher,
                         const CallRequest& request,
                         std::chrono::steady_clock::time_point deadline) {
    try {
        return MakeReply(request.request_id,
                         dispatcher.InvokeUntil(request.group, request.method, request.args, deadline));
    } catch (const std::exception& e) {
        spdlog::debug("Capability {}.{}.{} failed: {}", kBindingsRoot, request.group, request.method, e.what());
        return MakeErrorReply(request.request_id, e.what());
    } catch (...) {
        return MakeErrorReply(request.request_id,
                              std::string(kBindingsRoot) + "." + request.group + "." + request.method +
                              "() raised a non-standard exception");
    }
}

} // namespace bindings
} // namespace capsule
