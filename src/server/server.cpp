#include "umcp/server/server.hpp"

#include "umcp/log/logger.hpp"
#include "umcp/server/builtin_handlers.hpp"
#include "umcp/server/server_utils.hpp"

#include <asio/buffer.hpp>
#include <asio/co_spawn.hpp>
#include <asio/dispatch.hpp>
#include <asio/use_awaitable.hpp>

#include <array>

namespace umcp {

namespace {

constexpr std::size_t kReadChunkSize = 8192;

ConnectionManagerConfig manager_config(const ServerConfig& config) {
    ConnectionManagerConfig result;
    result.max_connections = config.max_connections;
    result.max_message_size = config.max_message_size;
    result.request_timeout = config.request_timeout;
    result.initialize_method = std::string(kInitializeMethod);
    return result;
}

AsyncTrackerConfig tracker_config(const ServerConfig& config) {
    AsyncTrackerConfig result;
    result.operation_timeout = config.async_operation_timeout;
    result.retention = config.operation_retention;
    return result;
}

}  // namespace

Server::Server(asio::io_context& io, ServerConfig config)
    : io_(io)
    , config_(std::move(config))
    , strand_(asio::make_strand(io_))
    , operations_(strand_, tracker_config(config_))
    , connections_(strand_, registry_, operations_, manager_config(config_))
    , acceptor_(strand_)
{
    operations_.set_notification_sink(
        [this](const std::string& connection_id, const JsonRpcNotification& notification) {
            return connections_.send_notification(connection_id, notification);
        });

    registry_.emplace<InitializeHandler>(std::string(kInitializeMethod), config_.identity);
    registry_.emplace<PingHandler>(std::string(kPingMethod));
    registry_.emplace<OperationStatusHandler>(std::string(kOperationStatusMethod), operations_);
}

Server::~Server() {
    do_stop();
}

// ═══════════════════════════════════════════════════════════════════════════
// Start / Stop
// ═══════════════════════════════════════════════════════════════════════════

ServerResult<asio::ip::tcp::endpoint> Server::start() {
    asio::error_code ec;
    asio::ip::tcp::endpoint endpoint;

    const auto address = asio::ip::make_address(config_.host, ec);
    if (!ec) {
        endpoint = asio::ip::tcp::endpoint(address, static_cast<std::uint16_t>(config_.port));
    } else {
        asio::ip::tcp::resolver resolver(io_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port), ec);
        if (ec || results.empty()) {
            return tl::unexpected(ServerError{
                ServerError::Category::Resolve,
                "Cannot resolve host " + config_.host + ": " + ec.message()});
        }
        endpoint = results.begin()->endpoint();
    }

    const auto bind_failure = [&](std::string_view step) {
        return tl::unexpected(ServerError{
            ServerError::Category::Bind,
            std::string(step) + " failed for " + config_.host + ":" +
                std::to_string(config_.port) + ": " + ec.message()});
    };

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) return bind_failure("open");
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    if (ec) return bind_failure("set_option");
    acceptor_.bind(endpoint, ec);
    if (ec) return bind_failure("bind");
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) return bind_failure("listen");

    const auto bound = acceptor_.local_endpoint(ec);
    if (ec) return bind_failure("local_endpoint");

    running_ = true;
    asio::co_spawn(strand_, accept_loop(), log_coroutine_failure("Accept loop"));

    UMCP_LOG_INFO("MCP server listening on {}:{}", bound.address().to_string(), bound.port());
    if (on_started_ != nullptr) {
        on_started_(bound.address().to_string(), bound.port());
    }
    return bound;
}

void Server::stop() {
    asio::dispatch(strand_, [this]() { do_stop(); });
}

void Server::do_stop() {
    if (running_ == false) {
        return;
    }
    running_ = false;

    asio::error_code ec;
    acceptor_.close(ec);
    connections_.close_all("Server shutting down");
    operations_.shutdown();

    UMCP_LOG_INFO("MCP server stopped");
}

// ═══════════════════════════════════════════════════════════════════════════
// Loops
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Server::accept_loop() {
    while (running_) {
        asio::ip::tcp::socket socket(strand_);
        try {
            socket = co_await acceptor_.async_accept(asio::use_awaitable);
        } catch (const std::system_error& e) {
            if ((running_ == false) || (e.code() == asio::error::operation_aborted)) {
                break;
            }
            UMCP_LOG_WARN("Accept failed: {}", e.what());
            continue;
        }

        auto connection = std::make_shared<TcpConnection>(std::move(socket));
        auto opened = connections_.open(connection);
        if (opened.has_value() == false) {
            UMCP_LOG_WARN("Rejecting connection from {}: {}",
                          connection->remote_address(), opened.error().message);
            connection->close();
            continue;
        }

        UMCP_LOG_DEBUG("Accepted {} as {}", connection->remote_address(), *opened);
        asio::co_spawn(strand_,
                       read_loop(connection, *opened),
                       log_coroutine_failure("Read loop for " + *opened));
    }
}

asio::awaitable<void> Server::read_loop(std::shared_ptr<TcpConnection> connection, std::string connection_id) {
    std::array<char, kReadChunkSize> chunk{};
    std::string reason = "Connection closed by peer";

    while (true) {
        std::size_t received = 0;
        try {
            received = co_await connection->socket().async_read_some(asio::buffer(chunk), asio::use_awaitable);
        } catch (const std::system_error& e) {
            if (e.code() == asio::error::eof) {
                break;
            }
            if ((e.code() == asio::error::operation_aborted) || connection->is_closed()) {
                reason = "Connection closed";
                break;
            }
            connections_.report_error(connection_id, e.what());
            reason = e.what();
            break;
        }

        connections_.receive(connection_id, std::string_view(chunk.data(), received));

        // receive() may have closed it (oversized message)
        if (connections_.state(connection_id) != ConnectionState::Active) {
            break;
        }
    }

    connections_.close(connection_id, reason);
}

}  // namespace umcp
