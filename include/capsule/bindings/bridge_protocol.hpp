/**
 * @file bridge_protocol.hpp
 * @brief Request/response messages between the host and an isolated worker
 *
 * Newline-delimited JSON over one AF_UNIX stream socket (fd 3 in the worker).
 *
 * | Direction      | Message                                                        |
 * |----------------|----------------------------------------------------------------|
 * | host -> worker | `{"type":"start","code","bindings","timeoutMs","policy"}`      |
 * | worker -> host | `{"type":"call","requestId","group","method","args"}`          |
 * | host -> worker | `{"type":"reply","requestId","result"}` or `..."error"}`       |
 * | worker -> host | `{"type":"result","success","result"?,"error"?,"stack"?,"console"}` |
 *
 * Only capability names cross the boundary. Every call is checked against
 * the host-side dispatcher, so a worker can never invoke a name that was
 * not in the map supplied to Execute().
 *
 * @date 2025
 */

#pragma once

#include "capsule/bindings/capability_map.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace capsule {
namespace bindings {

/**
 * @enum MessageType
 * @brief Bridge message kinds
 */
enum class MessageType {
    START,
    CALL,
    REPLY,
    RESULT,
    UNKNOWN
};

/**
 * @struct CallRequest
 * @brief Capability invocation forwarded by a worker
 */
struct CallRequest {
    std::int64_t request_id{0};
    std::string group;
    std::string method;
    nlohmann::json args;  ///< Parameter object or null
};

/**
 * @struct WorkerResult
 * @brief Final report of a worker
 */
struct WorkerResult {
    bool success{false};
    nlohmann::json result;
    std::optional<std::string> error;
    std::optional<std::string> stack;
    std::vector<std::string> console;
};

MessageType GetMessageType(const nlohmann::json& message);

nlohmann::json MakeStartMessage(const std::string& code,
                                const BindingShape& shape,
                                std::chrono::milliseconds timeout,
                                const nlohmann::json& policy);

nlohmann::json MakeReply(std::int64_t request_id, const nlohmann::json& result);
nlohmann::json MakeErrorReply(std::int64_t request_id, const std::string& error);

/**
 * @brief Decode a call message
 * @return std::nullopt if required fields are missing or mistyped
 */
std::optional<CallRequest> ParseCallRequest(const nlohmann::json& message);

/**
 * @brief Decode a result message
 * @return std::nullopt if `success` is missing
 */
std::optional<WorkerResult> ParseWorkerResult(const nlohmann::json& message);

/**
 * @brief Serialize one message as a protocol line (invalid UTF-8 replaced)
 */
std::string EncodeLine(const nlohmann::json& message);

/**
 * @brief Resolve a worker's call against the host allow-list
 *
 * Never throws: unknown names, bad parameters, capability failures and
 * deadline overruns all become error replies.
 *
 * @param dispatcher Allow-list built from the caller's capability map
 * @param request Decoded call
 * @param deadline Execution deadline; the capability is not awaited past it
 * @return Reply message for the worker
 */
nlohmann::json ServeCall(const CapabilityDispatcher& dispatcher,
                         const CallRequest& request,
                         std::chrono::steady_clock::time_point deadline);

} // namespace bindings
} // namespace capsule
