#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// TCP Connection
// ═══════════════════════════════════════════════════════════════════════════
// One accepted socket. Frames queued through write() are flushed in order by
// a single writer coroutine, so concurrent responses never interleave on the
// wire. The socket's executor must be the session strand.

#include "umcp/server/connection_manager.hpp"

#include <asio/awaitable.hpp>
#include <asio/ip/tcp.hpp>

#include <deque>
#include <memory>
#include <string>

namespace umcp {

class TcpConnection final : public IConnectionWriter,
                            public std::enable_shared_from_this<TcpConnection> {
public:
    explicit TcpConnection(asio::ip::tcp::socket socket);
    ~TcpConnection() override = default;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;
    TcpConnection(TcpConnection&&) = delete;
    TcpConnection& operator=(TcpConnection&&) = delete;

    void write(std::string frame) override;

    /// Stop accepting frames. The socket closes after queued frames are sent.
    void close() override;

    [[nodiscard]] asio::ip::tcp::socket& socket() noexcept { return socket_; }
    [[nodiscard]] bool is_closed() const noexcept { return closed_; }

    /// Remote address for logging, "unknown" if the socket is gone.
    [[nodiscard]] std::string remote_address() const;

private:
    asio::awaitable<void> flush();
    void shutdown_socket();

    asio::ip::tcp::socket socket_;
    std::deque<std::string> outbox_;
    bool writing_{false};
    bool closed_{false};
};

}  // namespace umcp
