#include "umcp/server/handler.hpp"

#include "umcp/log/logger.hpp"

#include <new>
#include <system_error>

namespace umcp {

std::string_view exception_kind(const std::exception& e) noexcept {
    if (dynamic_cast<const RpcException*>(&e) != nullptr) return "RpcException";
    if (dynamic_cast<const Json::exception*>(&e) != nullptr) return "JsonError";
    if (dynamic_cast<const std::system_error*>(&e) != nullptr) return "SystemError";
    if (dynamic_cast<const std::invalid_argument*>(&e) != nullptr) return "InvalidArgument";
    if (dynamic_cast<const std::out_of_range*>(&e) != nullptr) return "OutOfRange";
    if (dynamic_cast<const std::logic_error*>(&e) != nullptr) return "LogicError";
    if (dynamic_cast<const std::runtime_error*>(&e) != nullptr) return "RuntimeError";
    if (dynamic_cast<const std::bad_alloc*>(&e) != nullptr) return "BadAlloc";
    return "Exception";
}

JsonRpcError map_exception(const std::exception& e) {
    Json data = Json::object();
    data["errorType"] = std::string(exception_kind(e));

    const auto* rpc = dynamic_cast<const RpcException*>(&e);
    if (rpc == nullptr) {
        return JsonRpcError::internal("Internal server error", std::move(data));
    }

    if (rpc->data().has_value()) {
        const Json& extra = *rpc->data();
        if (extra.is_object()) {
            for (const auto& [key, value] : extra.items()) {
                data[key] = value;
            }
        } else {
            data["details"] = extra;
        }
    }
    return JsonRpcError{rpc->code(), rpc->what(), std::move(data)};
}

asio::awaitable<HandlerResult> IHandler::execute(
    const JsonRpcRequest& request,
    ConnectionContext& context
) {
    const Json params = request.params_or_empty();

    const ParamSchema* schema = param_schema();
    if (schema != nullptr) {
        auto valid = validate_params(request.method(), params, *schema);
        if (valid.has_value() == false) {
            UMCP_LOG_WARN("Invalid params for {} on {}: {}",
                          request.method(), context.connection_id, valid.error().message);
            co_return tl::unexpected(valid.error());
        }
    }

    std::optional<JsonRpcError> failure;
    try {
        Json result = co_await handle(params, context, request);
        co_return result;
    } catch (const RpcException& e) {
        UMCP_LOG_DEBUG("{} raised protocol error {}: {}", request.method(), e.code(), e.what());
        failure = map_exception(e);
    } catch (const std::exception& e) {
        UMCP_LOG_ERROR("Handler for {} failed: {}", request.method(), e.what());
        failure = map_exception(e);
    } catch (...) {
        UMCP_LOG_ERROR("Handler for {} threw a non-standard exception", request.method());
        failure = JsonRpcError::internal("Internal server error", Json{{"errorType", "UnknownException"}});
    }
    co_return tl::unexpected(std::move(*failure));
}

}  // namespace umcp
