#include "umcp/server/async_operation_tracker.hpp"

#include "umcp/log/logger.hpp"
#include "umcp/server/server_utils.hpp"

#include <asio/bind_executor.hpp>

namespace umcp {

std::optional<OperationStatus> parse_operation_status(std::string_view text) noexcept {
    if (text == "running") return OperationStatus::Running;
    if (text == "completed") return OperationStatus::Completed;
    if (text == "failed") return OperationStatus::Failed;
    if (text == "timeout") return OperationStatus::Timeout;
    return std::nullopt;
}

Json AsyncOperation::to_json() const {
    Json node = {
        {"operationId", operation_id},
        {"connectionId", connection_id},
        {"method", method},
        {"params", params},
        {"status", std::string(umcp::to_string(status))},
        {"progress", progress},
        {"startTime", format_iso8601(start_time)},
        {"lastUpdateTime", format_iso8601(last_update_time)}
    };
    if (result.has_value()) {
        node["result"] = *result;
    }
    if (error.has_value()) {
        node["error"] = *error;
    }
    return node;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

AsyncOperationTracker::AsyncOperationTracker(asio::any_io_executor executor, AsyncTrackerConfig config)
    : executor_(std::move(executor))
    , config_(config)
{}

AsyncOperationTracker::~AsyncOperationTracker() {
    shutdown();
}

void AsyncOperationTracker::set_notification_sink(NotificationSink sink) {
    sink_ = std::move(sink);
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

std::string AsyncOperationTracker::start(const std::string& connection_id, std::string method, Json params) {
    std::string operation_id = make_random_id("op_");
    while (operations_.contains(operation_id)) {
        operation_id = make_random_id("op_");
    }

    auto entry = std::make_unique<Entry>();
    const auto now = std::chrono::system_clock::now();
    entry->operation.operation_id = operation_id;
    entry->operation.connection_id = connection_id;
    entry->operation.method = std::move(method);
    entry->operation.params = std::move(params);
    entry->operation.start_time = now;
    entry->operation.last_update_time = now;

    auto& stored = *operations_.emplace(operation_id, std::move(entry)).first->second;
    arm_timeout(operation_id, stored);

    UMCP_LOG_INFO("Started async operation {} ({}) for {}",
                  operation_id, stored.operation.method, connection_id);
    return operation_id;
}

tl::expected<void, OperationError> AsyncOperationTracker::update(
    const std::string& operation_id,
    const OperationUpdate& delta
) {
    const auto it = operations_.find(operation_id);
    if (it == operations_.end()) {
        return tl::unexpected(OperationError::unknown(operation_id));
    }

    Entry& entry = *it->second;
    if (is_terminal(entry.operation.status)) {
        return tl::unexpected(OperationError::already_terminal(operation_id, entry.operation.status));
    }

    const bool sets_timeout = delta.status.has_value() && (*delta.status == OperationStatus::Timeout);
    if (sets_timeout) {
        return tl::unexpected(OperationError::reserved_status());
    }

    apply(entry, delta);
    return {};
}

std::size_t AsyncOperationTracker::cancel_for_connection(const std::string& connection_id, std::string_view reason) {
    std::size_t cancelled = 0;
    for (auto it = operations_.begin(); it != operations_.end();) {
        Entry& entry = *it->second;
        if (entry.operation.connection_id != connection_id) {
            ++it;
            continue;
        }

        if (entry.operation.status == OperationStatus::Running) {
            entry.operation.status = OperationStatus::Failed;
            entry.operation.error = std::string(reason);
            entry.operation.last_update_time = std::chrono::system_clock::now();
            ++cancelled;
            UMCP_LOG_INFO("Cancelled async operation {} due to disconnect of {}",
                          entry.operation.operation_id, connection_id);
        }
        it = operations_.erase(it);
    }
    return cancelled;
}

std::optional<AsyncOperation> AsyncOperationTracker::find(const std::string& operation_id) const {
    const auto it = operations_.find(operation_id);
    if (it == operations_.end()) {
        return std::nullopt;
    }
    return it->second->operation;
}

std::size_t AsyncOperationTracker::running_count(const std::string& connection_id) const {
    std::size_t count = 0;
    for (const auto& [id, entry] : operations_) {
        const bool owned = (entry->operation.connection_id == connection_id);
        if (owned && (entry->operation.status == OperationStatus::Running)) {
            ++count;
        }
    }
    return count;
}

void AsyncOperationTracker::shutdown() {
    // Destroying the timers completes their waits with operation_aborted.
    operations_.clear();
}

// ─────────────────────────────────────────────────────────────────────────────
// Internals
// ─────────────────────────────────────────────────────────────────────────────

void AsyncOperationTracker::apply(Entry& entry, const OperationUpdate& delta) {
    AsyncOperation& operation = entry.operation;
    if (delta.status.has_value()) {
        operation.status = *delta.status;
    }
    if (delta.progress.has_value()) {
        operation.progress = *delta.progress;
    }
    if (delta.result.has_value()) {
        operation.result = delta.result;
    }
    if (delta.error.has_value()) {
        operation.error = delta.error;
    }
    operation.last_update_time = std::chrono::system_clock::now();

    if (delta.notifies()) {
        notify(entry, delta);
    }

    if (is_terminal(operation.status)) {
        entry.timeout_timer.reset();
        UMCP_LOG_INFO("Async operation {} finished with status {}",
                      operation.operation_id, to_string(operation.status));
        schedule_purge(operation.operation_id, entry);
    }
}

void AsyncOperationTracker::notify(const Entry& entry, const OperationUpdate& delta) {
    if (sink_ == nullptr) {
        return;
    }

    const AsyncOperation& operation = entry.operation;
    Json params = {
        {"operationId", operation.operation_id},
        {"status", std::string(to_string(operation.status))},
        {"progress", operation.progress},
        {"method", operation.method}
    };
    if (delta.result.has_value()) {
        params["result"] = *delta.result;
    }
    if (delta.error.has_value()) {
        params["error"] = *delta.error;
    }

    const bool delivered = sink_(operation.connection_id,
                                 JsonRpcNotification(std::string(kProgressMethod), std::move(params)));
    if (delivered == false) {
        UMCP_LOG_DEBUG("Progress for {} dropped, connection {} is gone",
                       operation.operation_id, operation.connection_id);
    }
}

void AsyncOperationTracker::arm_timeout(const std::string& operation_id, Entry& entry) {
    entry.timeout_timer = std::make_unique<asio::steady_timer>(executor_);
    entry.timeout_timer->expires_after(config_.operation_timeout);
    entry.timeout_timer->async_wait(asio::bind_executor(executor_,
        [this, alive = std::weak_ptr<int>(lifetime_), operation_id](asio::error_code ec) {
            if (ec || alive.expired()) {
                return;  // Cancelled, or the tracker is gone
            }
            on_timeout(operation_id);
        }));
}

void AsyncOperationTracker::on_timeout(const std::string& operation_id) {
    const auto it = operations_.find(operation_id);
    if (it == operations_.end()) {
        return;
    }
    Entry& entry = *it->second;
    if (entry.operation.status != OperationStatus::Running) {
        return;
    }

    UMCP_LOG_WARN("Async operation {} timed out after {} ms",
                  operation_id, config_.operation_timeout.count());

    OperationUpdate expired;
    expired.status = OperationStatus::Timeout;
    expired.error = Json("Operation timed out");
    apply(entry, expired);
}

void AsyncOperationTracker::schedule_purge(const std::string& operation_id, Entry& entry) {
    entry.purge_timer = std::make_unique<asio::steady_timer>(executor_);
    entry.purge_timer->expires_after(config_.retention);
    entry.purge_timer->async_wait(asio::bind_executor(executor_,
        [this, alive = std::weak_ptr<int>(lifetime_), operation_id](asio::error_code ec) {
            if (ec || alive.expired()) {
                return;
            }
            const auto it = operations_.find(operation_id);
            if (it == operations_.end()) {
                return;
            }
            UMCP_LOG_INFO("Removed async operation {} with status {}",
                          operation_id, to_string(it->second->operation.status));
            operations_.erase(it);
        }));
}

}  // namespace umcp
