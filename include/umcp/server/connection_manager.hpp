#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection Manager
// ═══════════════════════════════════════════════════════════════════════════
// Owns the live connections and runs, per connection:
//
//   bytes ─▶ codec.feed ─▶ validate_envelope ─▶ init gate ─▶ handler.execute
//                                                                 │
//                      writer.write(response)  ◀── only if id ◀───┘
//
// Each decoded envelope is dispatched as its own coroutine, so a slow handler
// does not hold up later requests; responses go out in completion order.
//
// Transport-agnostic: bytes come in through receive() and frames go out
// through an IConnectionWriter. All members must be used from the executor
// passed to the constructor.

#include "umcp/protocol/json_rpc.hpp"
#include "umcp/protocol/message_codec.hpp"
#include "umcp/server/async_operation_tracker.hpp"
#include "umcp/server/connection_context.hpp"
#include "umcp/server/handler.hpp"
#include "umcp/server/handler_registry.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace umcp {

// ─────────────────────────────────────────────────────────────────────────────
// Outbound side of a connection
// ─────────────────────────────────────────────────────────────────────────────

class IConnectionWriter {
public:
    virtual ~IConnectionWriter() = default;

    /// Queue one encoded frame. Never blocks; a no-op once closed.
    virtual void write(std::string frame) = 0;

    /// Close the underlying stream. Idempotent.
    virtual void close() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Configuration / Errors / Events
// ─────────────────────────────────────────────────────────────────────────────

struct ConnectionManagerConfig {
    std::size_t max_connections{10};
    std::size_t max_message_size{1024 * 1024};
    /// 0 disables the per-request deadline.
    std::chrono::milliseconds request_timeout{30000};
    std::string initialize_method{"initialize"};
    CodecConfig codec{};
};

struct ConnectionError {
    enum class Code {
        CapacityReached,
        InvalidWriter
    };

    Code code;
    std::string message;
};

struct MessageProcessedEvent {
    std::string connection_id;
    std::string method;
    std::optional<JsonRpcId> id;
    bool success{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionManager
// ─────────────────────────────────────────────────────────────────────────────

class ConnectionManager {
public:
    using ConnectedCallback = std::function<void(const std::string& connection_id)>;
    using DisconnectedCallback = std::function<void(const std::string& connection_id, const std::string& reason)>;
    using MessageProcessedCallback = std::function<void(const MessageProcessedEvent& event)>;
    using ConnectionErrorCallback = std::function<void(const std::string& connection_id, const std::string& message)>;

    ConnectionManager(
        asio::any_io_executor executor,
        HandlerRegistry& registry,
        AsyncOperationTracker& operations,
        ConnectionManagerConfig config = {}
    );

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;
    ConnectionManager(ConnectionManager&&) = delete;
    ConnectionManager& operator=(ConnectionManager&&) = delete;

    ~ConnectionManager();

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Register a new connection (Connecting → Active). Fails when the
    /// connection limit is reached.
    [[nodiscard]] tl::expected<std::string, ConnectionError> open(std::shared_ptr<IConnectionWriter> writer);

    /// Feed bytes read from the connection. Complete envelopes are dispatched;
    /// an oversized unterminated tail closes the connection.
    void receive(const std::string& connection_id, std::string_view bytes);

    /// Active → Closing → Closed. Cancels the connection's async operations
    /// and closes its writer. No-op for unknown or already closing connections.
    void close(const std::string& connection_id, const std::string& reason);

    void close_all(const std::string& reason);

    /// Report a transport failure (fires the error event; does not close).
    void report_error(const std::string& connection_id, const std::string& message);

    /// Push a server-initiated notification. False if the connection is not Active.
    bool send_notification(const std::string& connection_id, const JsonRpcNotification& notification);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<ConnectionState> state(const std::string& connection_id) const;
    [[nodiscard]] std::optional<ConnectionContext> context(const std::string& connection_id) const;
    [[nodiscard]] std::size_t connection_count() const noexcept { return connections_.size(); }
    [[nodiscard]] std::vector<std::string> connection_ids() const;
    [[nodiscard]] const ConnectionManagerConfig& config() const noexcept { return config_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Events
    // ─────────────────────────────────────────────────────────────────────────

    void on_connected(ConnectedCallback callback) { on_connected_ = std::move(callback); }
    void on_disconnected(DisconnectedCallback callback) { on_disconnected_ = std::move(callback); }
    void on_message_processed(MessageProcessedCallback callback) { on_message_processed_ = std::move(callback); }
    void on_connection_error(ConnectionErrorCallback callback) { on_connection_error_ = std::move(callback); }

private:
    struct Connection {
        ConnectionState state{ConnectionState::Connecting};
        ConnectionContext context;
        MessageCodec codec;
        std::shared_ptr<IConnectionWriter> writer;
    };

    asio::awaitable<void> process(std::shared_ptr<Connection> connection, Json message);
    asio::awaitable<HandlerResult> dispatch(std::shared_ptr<Connection> connection, const JsonRpcRequest& request);
    asio::awaitable<HandlerResult> run_with_deadline(
        std::shared_ptr<IHandler> handler,
        std::shared_ptr<Connection> connection,
        const JsonRpcRequest& request
    );

    void write_frame(Connection& connection, const Json& envelope);

    asio::any_io_executor executor_;
    HandlerRegistry& registry_;
    AsyncOperationTracker& operations_;
    ConnectionManagerConfig config_;

    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;

    ConnectedCallback on_connected_;
    DisconnectedCallback on_disconnected_;
    MessageProcessedCallback on_message_processed_;
    ConnectionErrorCallback on_connection_error_;
};

}  // namespace umcp
