#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Handler Contract
// ═══════════════════════════════════════════════════════════════════════════
// A handler implements handle(); the non-virtual execute() wraps it with the
// param-schema check and turns anything the domain code throws into a
// JsonRpcError. execute() is the only place exceptions become wire errors.

#include "umcp/protocol/json_rpc.hpp"
#include "umcp/protocol/validator.hpp"
#include "umcp/server/connection_context.hpp"

#include <asio/awaitable.hpp>
#include <tl/expected.hpp>

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace umcp {

using HandlerResult = tl::expected<Json, JsonRpcError>;

// ─────────────────────────────────────────────────────────────────────────────
// RpcException - domain error with an explicit protocol code
// ─────────────────────────────────────────────────────────────────────────────

class RpcException : public std::runtime_error {
public:
    RpcException(int code, const std::string& message, std::optional<Json> data = std::nullopt)
        : std::runtime_error(message)
        , code_(code)
        , data_(std::move(data))
    {}

    [[nodiscard]] int code() const noexcept { return code_; }
    [[nodiscard]] const std::optional<Json>& data() const noexcept { return data_; }

    [[nodiscard]] static RpcException provider_error(const std::string& message, std::optional<Json> data = std::nullopt) {
        return RpcException(ErrorCode::ProviderError, message, std::move(data));
    }

    [[nodiscard]] static RpcException validation_error(const std::string& message, std::optional<Json> data = std::nullopt) {
        return RpcException(ErrorCode::ValidationError, message, std::move(data));
    }

private:
    int code_;
    std::optional<Json> data_;
};

/// Short name for the kind of exception, reported as data.errorType.
[[nodiscard]] std::string_view exception_kind(const std::exception& e) noexcept;

/// Translate an exception into the error sent to the client.
[[nodiscard]] JsonRpcError map_exception(const std::exception& e);

// ─────────────────────────────────────────────────────────────────────────────
// IHandler
// ─────────────────────────────────────────────────────────────────────────────

class IHandler {
public:
    virtual ~IHandler() = default;

    /// Constraints checked before handle() runs. nullptr means none.
    [[nodiscard]] virtual const ParamSchema* param_schema() const noexcept {
        return nullptr;
    }

    /// Domain logic. Return the result value or throw.
    virtual asio::awaitable<Json> handle(
        const Json& params,
        ConnectionContext& context,
        const JsonRpcRequest& request
    ) = 0;

    /// Validate, run handle(), map failures. Never throws.
    [[nodiscard]] asio::awaitable<HandlerResult> execute(
        const JsonRpcRequest& request,
        ConnectionContext& context
    );
};

}  // namespace umcp
