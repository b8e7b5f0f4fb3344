#include "umcp/server/connection_manager.hpp"

#include "umcp/log/logger.hpp"
#include "umcp/protocol/validator.hpp"
#include "umcp/server/server_utils.hpp"

#include <asio/co_spawn.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <variant>

namespace umcp {

namespace {

constexpr const char* kNotInitializedMessage = "Server not initialized. Call initialize first";
constexpr const char* kMessageTooLarge = "Message too large";

// Observers must not be able to break the pipeline.
template <typename Callback, typename... Args>
void safe_invoke(const Callback& callback, std::string_view event, Args&&... args) {
    if (callback == nullptr) {
        return;
    }
    try {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        UMCP_LOG_WARN("{} callback threw: {}", event, e.what());
    }
}

std::string describe_id(const std::optional<JsonRpcId>& id) {
    return id.has_value() ? id->to_json().dump() : std::string("<notification>");
}

}  // namespace

ConnectionManager::ConnectionManager(
    asio::any_io_executor executor,
    HandlerRegistry& registry,
    AsyncOperationTracker& operations,
    ConnectionManagerConfig config
)
    : executor_(std::move(executor))
    , registry_(registry)
    , operations_(operations)
    , config_(std::move(config))
{}

ConnectionManager::~ConnectionManager() {
    close_all("Server shutting down");
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

tl::expected<std::string, ConnectionError> ConnectionManager::open(std::shared_ptr<IConnectionWriter> writer) {
    if (writer == nullptr) {
        return tl::unexpected(ConnectionError{
            ConnectionError::Code::InvalidWriter, "Connection writer must not be null"});
    }
    if (connections_.size() >= config_.max_connections) {
        return tl::unexpected(ConnectionError{
            ConnectionError::Code::CapacityReached,
            "Connection limit reached (" + std::to_string(config_.max_connections) + ")"});
    }

    std::string connection_id = make_random_id("client_");
    while (connections_.contains(connection_id)) {
        connection_id = make_random_id("client_");
    }

    auto connection = std::make_shared<Connection>();
    connection->context.connection_id = connection_id;
    connection->codec = MessageCodec(config_.codec);
    connection->writer = std::move(writer);

    connections_.emplace(connection_id, connection);
    connection->state = ConnectionState::Active;

    UMCP_LOG_INFO("Client connected: {}", connection_id);
    safe_invoke(on_connected_, "connected", connection_id);
    return connection_id;
}

void ConnectionManager::receive(const std::string& connection_id, std::string_view bytes) {
    const auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return;
    }
    std::shared_ptr<Connection> connection = it->second;
    if (connection->state != ConnectionState::Active) {
        return;
    }

    ConnectionContext& context = connection->context;
    auto fed = connection->codec.feed(std::move(context.buffer), bytes);
    context.buffer = std::move(fed.remaining);

    if (fed.dropped > 0) {
        context.dropped_segments += fed.dropped;
        UMCP_LOG_DEBUG("Dropped {} unparsable segment(s) from {} ({} total)",
                       fed.dropped, connection_id, context.dropped_segments);
    }

    // An oversized tail is fatal for the whole read: nothing framed from it is dispatched.
    if (context.buffer.size() > config_.max_message_size) {
        UMCP_LOG_WARN("Client {} exceeded max message size ({} > {} bytes), discarding {} framed message(s)",
                      connection_id, context.buffer.size(), config_.max_message_size, fed.messages.size());
        write_frame(*connection, make_error_response(JsonRpcId::null(),
                                                     JsonRpcError::internal(kMessageTooLarge)));
        safe_invoke(on_connection_error_, "connection-error", connection_id, std::string(kMessageTooLarge));
        close(connection_id, kMessageTooLarge);
        return;
    }

    for (auto& message : fed.messages) {
        asio::co_spawn(executor_,
                       process(connection, std::move(message)),
                       log_coroutine_failure("Message processing for " + connection_id));
    }
}

void ConnectionManager::close(const std::string& connection_id, const std::string& reason) {
    const auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return;
    }
    std::shared_ptr<Connection> connection = it->second;
    if (connection->state != ConnectionState::Active) {
        return;
    }

    connection->state = ConnectionState::Closing;

    const std::size_t cancelled = operations_.cancel_for_connection(connection_id, "Connection closed: " + reason);
    connection->writer->close();
    connection->context.buffer.clear();
    connections_.erase(it);

    connection->state = ConnectionState::Closed;

    UMCP_LOG_INFO("Client disconnected: {} ({}, {} operation(s) cancelled)",
                  connection_id, reason, cancelled);
    safe_invoke(on_disconnected_, "disconnected", connection_id, reason);
}

void ConnectionManager::close_all(const std::string& reason) {
    for (const auto& connection_id : connection_ids()) {
        close(connection_id, reason);
    }
}

void ConnectionManager::report_error(const std::string& connection_id, const std::string& message) {
    UMCP_LOG_WARN("Connection error on {}: {}", connection_id, message);
    safe_invoke(on_connection_error_, "connection-error", connection_id, message);
}

bool ConnectionManager::send_notification(const std::string& connection_id, const JsonRpcNotification& notification) {
    const auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return false;
    }
    Connection& connection = *it->second;
    if (connection.state != ConnectionState::Active) {
        return false;
    }
    write_frame(connection, notification.to_json());
    UMCP_LOG_TRACE("Sent {} notification to {}", notification.method(), connection_id);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

std::optional<ConnectionState> ConnectionManager::state(const std::string& connection_id) const {
    const auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second->state;
}

std::optional<ConnectionContext> ConnectionManager::context(const std::string& connection_id) const {
    const auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second->context;
}

std::vector<std::string> ConnectionManager::connection_ids() const {
    std::vector<std::string> ids;
    ids.reserve(connections_.size());
    for (const auto& [id, connection] : connections_) {
        ids.push_back(id);
    }
    return ids;
}

// ═══════════════════════════════════════════════════════════════════════════
// Pipeline
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> ConnectionManager::process(std::shared_ptr<Connection> connection, Json message) {
    const std::string connection_id = connection->context.connection_id;
    if (connection->state != ConnectionState::Active) {
        co_return;  // Closed before this envelope got its turn
    }

    auto envelope = validate_envelope(message);
    if (envelope.has_value() == false) {
        const EnvelopeError& rejected = envelope.error();
        UMCP_LOG_DEBUG("Rejected envelope from {}: {}", connection_id, rejected.error.message);
        if (connection->state == ConnectionState::Active) {
            write_frame(*connection, make_error_response(rejected.id.value_or(JsonRpcId::null()), rejected.error));
        }
        co_return;
    }

    const JsonRpcRequest& request = *envelope;
    ++connection->context.request_count;
    UMCP_LOG_DEBUG("Received {} (id {}) from {}", request.method(), describe_id(request.id()), connection_id);

    HandlerResult result = co_await dispatch(connection, request);

    if (request.id().has_value() && (connection->state == ConnectionState::Active)) {
        if (result.has_value()) {
            write_frame(*connection, make_result_response(*request.id(), std::move(*result)));
        } else {
            write_frame(*connection, make_error_response(*request.id(), result.error()));
        }
    }

    safe_invoke(on_message_processed_, "message-processed",
                MessageProcessedEvent{connection_id, request.method(), request.id(), result.has_value()});
}

asio::awaitable<HandlerResult> ConnectionManager::dispatch(
    std::shared_ptr<Connection> connection,
    const JsonRpcRequest& request
) {
    const bool is_initialize = (request.method() == config_.initialize_method);
    if ((is_initialize == false) && (connection->context.initialized == false)) {
        co_return tl::unexpected(JsonRpcError::invalid_request(kNotInitializedMessage));
    }

    std::shared_ptr<IHandler> handler = registry_.find(request.method());
    if (handler == nullptr) {
        co_return tl::unexpected(JsonRpcError::method_not_found(request.method()));
    }

    if (config_.request_timeout.count() <= 0) {
        co_return co_await handler->execute(request, connection->context);
    }
    co_return co_await run_with_deadline(std::move(handler), std::move(connection), request);
}

asio::awaitable<HandlerResult> ConnectionManager::run_with_deadline(
    std::shared_ptr<IHandler> handler,
    std::shared_ptr<Connection> connection,
    const JsonRpcRequest& request
) {
    using namespace asio::experimental::awaitable_operators;

    asio::steady_timer deadline(co_await asio::this_coro::executor);
    deadline.expires_after(config_.request_timeout);

    auto outcome = co_await (
        handler->execute(request, connection->context) ||
        deadline.async_wait(asio::use_awaitable)
    );

    if (outcome.index() == 0) {
        co_return std::get<0>(std::move(outcome));
    }

    UMCP_LOG_WARN("Request {} (id {}) on {} timed out after {} ms",
                  request.method(), describe_id(request.id()),
                  connection->context.connection_id, config_.request_timeout.count());
    co_return tl::unexpected(JsonRpcError::internal("Request timed out", Json{
        {"method", request.method()},
        {"timeoutMs", config_.request_timeout.count()}
    }));
}

void ConnectionManager::write_frame(Connection& connection, const Json& envelope) {
    connection.writer->write(MessageCodec::encode(envelope));
}

}  // namespace umcp
