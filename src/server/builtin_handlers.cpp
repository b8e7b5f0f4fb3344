#include "umcp/server/builtin_handlers.hpp"

#include "umcp/log/logger.hpp"
#include "umcp/server/server_utils.hpp"

namespace umcp {

// ─────────────────────────────────────────────────────────────────────────────
// initialize
// ─────────────────────────────────────────────────────────────────────────────

InitializeHandler::InitializeHandler(ServerIdentity identity)
    : identity_(std::move(identity))
    , schema_(ParamSchema::from_json({
          {"required", Json::array({"clientCapabilities"})},
          {"properties", {
              {"clientCapabilities", {{"type", "object"}}},
              {"clientName", {{"type", "string"}}},
              {"clientVersion", {{"type", "string"}}}
          }}
      }))
{}

asio::awaitable<Json> InitializeHandler::handle(
    const Json& params,
    ConnectionContext& context,
    const JsonRpcRequest& /*request*/
) {
    context.client_capabilities = params.at("clientCapabilities");
    context.client_name = params.value("clientName", std::string("unknown"));
    context.client_version = params.value("clientVersion", std::string("unknown"));
    context.initialized = true;
    context.initialized_at = std::chrono::system_clock::now();

    UMCP_LOG_INFO("Connection {} initialized by {} {}",
                  context.connection_id, context.client_name, context.client_version);

    co_return Json{{"capabilities", identity_.capabilities()}};
}

// ─────────────────────────────────────────────────────────────────────────────
// ping
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Json> PingHandler::handle(
    const Json& /*params*/,
    ConnectionContext& context,
    const JsonRpcRequest& /*request*/
) {
    co_return Json{
        {"message", "pong"},
        {"timestamp", format_iso8601(std::chrono::system_clock::now())},
        {"clientInfo", {
            {"id", context.connection_id},
            {"name", context.client_name},
            {"requestCount", context.request_count}
        }}
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// operation.status
// ─────────────────────────────────────────────────────────────────────────────

OperationStatusHandler::OperationStatusHandler(const AsyncOperationTracker& tracker)
    : tracker_(tracker)
    , schema_(ParamSchema::from_json({
          {"required", Json::array({"operationId"})},
          {"properties", {{"operationId", {{"type", "string"}}}}}
      }))
{}

asio::awaitable<Json> OperationStatusHandler::handle(
    const Json& params,
    ConnectionContext& context,
    const JsonRpcRequest& /*request*/
) {
    const auto operation_id = params.at("operationId").get<std::string>();
    const auto operation = tracker_.find(operation_id);

    // Other connections' operations are reported as unknown.
    const bool visible = operation.has_value() && (operation->connection_id == context.connection_id);
    if (visible == false) {
        throw RpcException(ErrorCode::AsyncOperationError,
                           "Unknown operation: " + operation_id,
                           Json{{"operationId", operation_id}});
    }
    co_return operation->to_json();
}

}  // namespace umcp
