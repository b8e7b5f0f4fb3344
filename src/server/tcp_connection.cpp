#include "umcp/server/tcp_connection.hpp"

#include "umcp/log/logger.hpp"
#include "umcp/server/server_utils.hpp"

#include <asio/buffer.hpp>
#include <asio/co_spawn.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

namespace umcp {

TcpConnection::TcpConnection(asio::ip::tcp::socket socket)
    : socket_(std::move(socket))
{}

void TcpConnection::write(std::string frame) {
    if (closed_) {
        return;
    }
    outbox_.push_back(std::move(frame));
    if (writing_) {
        return;
    }
    writing_ = true;
    asio::co_spawn(socket_.get_executor(), flush(), log_coroutine_failure("Socket writer"));
}

void TcpConnection::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    // Frames queued before close() still go out; flush() shuts the socket
    // once the queue drains.
    if (writing_) {
        return;
    }
    shutdown_socket();
}

std::string TcpConnection::remote_address() const {
    asio::error_code ec;
    const auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void TcpConnection::shutdown_socket() {
    // Errors here only mean the peer already went away.
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

asio::awaitable<void> TcpConnection::flush() {
    // Keeps the connection alive until the queue drains.
    auto self = shared_from_this();

    while (outbox_.empty() == false) {
        try {
            co_await asio::async_write(socket_, asio::buffer(outbox_.front()), asio::use_awaitable);
        } catch (const std::system_error& e) {
            if (closed_ == false) {
                UMCP_LOG_WARN("Write to {} failed: {}", remote_address(), e.what());
            }
            // The reader sees the closed socket and retires the connection.
            closed_ = true;
            outbox_.clear();
            break;
        }
        outbox_.pop_front();
    }
    writing_ = false;

    if (closed_) {
        shutdown_socket();
    }
}

}  // namespace umcp
