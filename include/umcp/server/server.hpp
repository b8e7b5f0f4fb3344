#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server
// ═══════════════════════════════════════════════════════════════════════════
// TCP front end: accepts sockets, gives each one a read loop feeding the
// ConnectionManager, and owns the registry and async-operation tracker the
// manager works against. Everything runs on one strand, so the io_context may
// be driven by several threads.
//
// Usage:
//   asio::io_context io;
//   umcp::Server server(io, config);
//   server.handlers().emplace<MyHandler>("site.list");
//   auto bound = server.start();
//   io.run();

#include "umcp/config/server_config.hpp"
#include "umcp/server/async_operation_tracker.hpp"
#include "umcp/server/connection_manager.hpp"
#include "umcp/server/handler_registry.hpp"
#include "umcp/server/tcp_connection.hpp"

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/strand.hpp>
#include <tl/expected.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace umcp {

struct ServerError {
    enum class Category {
        Resolve,
        Bind
    };

    Category category;
    std::string message;
};

template <typename T>
using ServerResult = tl::expected<T, ServerError>;

class Server {
public:
    using StartedCallback = std::function<void(const std::string& host, std::uint16_t port)>;

    /// Registers the built-in initialize, ping and operation.status handlers.
    Server(asio::io_context& io, ServerConfig config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] HandlerRegistry& handlers() noexcept { return registry_; }
    [[nodiscard]] AsyncOperationTracker& operations() noexcept { return operations_; }
    [[nodiscard]] ConnectionManager& connections() noexcept { return connections_; }
    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }

    /// The strand all session state lives on.
    [[nodiscard]] asio::any_io_executor executor() const { return strand_; }

    /// Bind, listen and start the accept loop. Returns the bound endpoint,
    /// which carries the real port when the config asked for port 0.
    [[nodiscard]] ServerResult<asio::ip::tcp::endpoint> start();

    /// Stop accepting and close every connection. Safe from any thread.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_; }

    void on_started(StartedCallback callback) { on_started_ = std::move(callback); }

private:
    asio::awaitable<void> accept_loop();
    asio::awaitable<void> read_loop(std::shared_ptr<TcpConnection> connection, std::string connection_id);
    void do_stop();

    asio::io_context& io_;
    ServerConfig config_;
    asio::strand<asio::io_context::executor_type> strand_;

    HandlerRegistry registry_;
    AsyncOperationTracker operations_;
    ConnectionManager connections_;

    asio::ip::tcp::acceptor acceptor_;
    bool running_{false};
    StartedCallback on_started_;
};

}  // namespace umcp
