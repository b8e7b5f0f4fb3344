#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Built-in Handlers
// ═══════════════════════════════════════════════════════════════════════════
// Methods every server answers regardless of which domain handlers are
// registered on top.

#include "umcp/config/server_config.hpp"
#include "umcp/server/async_operation_tracker.hpp"
#include "umcp/server/handler.hpp"

#include <string_view>

namespace umcp {

inline constexpr std::string_view kInitializeMethod{"initialize"};
inline constexpr std::string_view kPingMethod{"ping"};
inline constexpr std::string_view kOperationStatusMethod{"operation.status"};

/// Records the client's capabilities, name and version on the connection and
/// answers with the server capabilities. Unlocks every other method.
class InitializeHandler final : public IHandler {
public:
    explicit InitializeHandler(ServerIdentity identity);

    [[nodiscard]] const ParamSchema* param_schema() const noexcept override { return &schema_; }

    asio::awaitable<Json> handle(const Json& params, ConnectionContext& context, const JsonRpcRequest& request) override;

private:
    ServerIdentity identity_;
    ParamSchema schema_;
};

/// Liveness probe: pong, server time, and what the server knows of the client.
class PingHandler final : public IHandler {
public:
    asio::awaitable<Json> handle(const Json& params, ConnectionContext& context, const JsonRpcRequest& request) override;
};

/// Late query for an async operation the caller's connection started.
class OperationStatusHandler final : public IHandler {
public:
    explicit OperationStatusHandler(const AsyncOperationTracker& tracker);

    [[nodiscard]] const ParamSchema* param_schema() const noexcept override { return &schema_; }

    asio::awaitable<Json> handle(const Json& params, ConnectionContext& context, const JsonRpcRequest& request) override;

private:
    const AsyncOperationTracker& tracker_;
    ParamSchema schema_;
};

}  // namespace umcp
