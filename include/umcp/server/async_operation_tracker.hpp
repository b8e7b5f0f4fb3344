#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Operation Tracker
// ═══════════════════════════════════════════════════════════════════════════
// Long-running work started by a handler and reported to the client through
// "progress" notifications, outside the request/response pair.
//
//   running ──update(completed)──▶ completed ┐
//      │    ──update(failed)─────▶ failed    ├──retention──▶ purged
//      └────timeout timer────────▶ timeout   ┘
//
// Only the tracker's own timer can produce `timeout`. A terminal record stays
// queryable for the retention window and accepts no further updates.
//
// Not thread-safe: every call must happen on the executor given to the
// constructor (a strand when the io_context runs on several threads).

#include "umcp/protocol/json_rpc.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/steady_timer.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace umcp {

enum class OperationStatus {
    Running,
    Completed,
    Failed,
    Timeout
};

[[nodiscard]] constexpr std::string_view to_string(OperationStatus status) noexcept {
    switch (status) {
        case OperationStatus::Running:   return "running";
        case OperationStatus::Completed: return "completed";
        case OperationStatus::Failed:    return "failed";
        case OperationStatus::Timeout:   return "timeout";
    }
    return "unknown";
}

[[nodiscard]] std::optional<OperationStatus> parse_operation_status(std::string_view text) noexcept;

[[nodiscard]] constexpr bool is_terminal(OperationStatus status) noexcept {
    return status != OperationStatus::Running;
}

struct AsyncOperation {
    std::string operation_id;
    std::string connection_id;
    std::string method;
    Json params;
    OperationStatus status{OperationStatus::Running};
    double progress{0.0};
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point last_update_time;
    std::optional<Json> result;
    std::optional<Json> error;

    [[nodiscard]] Json to_json() const;
};

/// Partial change merged into a record. Empty fields leave the record as is.
struct OperationUpdate {
    std::optional<OperationStatus> status;
    std::optional<double> progress;
    std::optional<Json> result;
    std::optional<Json> error;

    [[nodiscard]] bool notifies() const noexcept {
        return status.has_value() || progress.has_value();
    }
};

struct OperationError {
    enum class Code {
        UnknownOperation,
        AlreadyTerminal,
        ReservedStatus
    };

    Code code;
    std::string message;

    [[nodiscard]] static OperationError unknown(std::string_view id) {
        return {Code::UnknownOperation, "Unknown operation: " + std::string(id)};
    }

    [[nodiscard]] static OperationError already_terminal(std::string_view id, OperationStatus status) {
        return {Code::AlreadyTerminal,
                "Operation " + std::string(id) + " already " + std::string(to_string(status))};
    }

    [[nodiscard]] static OperationError reserved_status() {
        return {Code::ReservedStatus, "Only the operation timer may set status timeout"};
    }
};

struct AsyncTrackerConfig {
    /// Running operations are forced to `timeout` after this long.
    std::chrono::milliseconds operation_timeout{std::chrono::minutes(5)};

    /// How long a terminal record stays queryable before it is purged.
    std::chrono::milliseconds retention{std::chrono::seconds(60)};
};

class AsyncOperationTracker {
public:
    /// Delivers a notification to a connection. Returns false when the
    /// connection is gone; the tracker never retries.
    using NotificationSink = std::function<bool(const std::string& connection_id, const JsonRpcNotification& notification)>;

    static constexpr std::string_view kProgressMethod{"progress"};

    AsyncOperationTracker(asio::any_io_executor executor, AsyncTrackerConfig config = {});
    ~AsyncOperationTracker();

    AsyncOperationTracker(const AsyncOperationTracker&) = delete;
    AsyncOperationTracker& operator=(const AsyncOperationTracker&) = delete;
    AsyncOperationTracker(AsyncOperationTracker&&) = delete;
    AsyncOperationTracker& operator=(AsyncOperationTracker&&) = delete;

    void set_notification_sink(NotificationSink sink);

    /// Create a running record and arm its timeout. Returns the new id.
    [[nodiscard]] std::string start(const std::string& connection_id, std::string method, Json params);

    /// Merge delta into a running record and push a progress notification if
    /// status or progress changed.
    tl::expected<void, OperationError> update(const std::string& operation_id, const OperationUpdate& delta);

    /// Fail every running operation of the connection without notifying, then
    /// drop all of its records. Returns how many were still running.
    std::size_t cancel_for_connection(const std::string& connection_id, std::string_view reason);

    [[nodiscard]] std::optional<AsyncOperation> find(const std::string& operation_id) const;
    [[nodiscard]] std::size_t size() const noexcept { return operations_.size(); }
    [[nodiscard]] std::size_t running_count(const std::string& connection_id) const;

    /// Cancel all timers and forget every record.
    void shutdown();

    [[nodiscard]] const AsyncTrackerConfig& config() const noexcept { return config_; }

private:
    struct Entry {
        AsyncOperation operation;
        std::unique_ptr<asio::steady_timer> timeout_timer;
        std::unique_ptr<asio::steady_timer> purge_timer;
    };

    void apply(Entry& entry, const OperationUpdate& delta);
    void notify(const Entry& entry, const OperationUpdate& delta);
    void arm_timeout(const std::string& operation_id, Entry& entry);
    void schedule_purge(const std::string& operation_id, Entry& entry);
    void on_timeout(const std::string& operation_id);

    asio::any_io_executor executor_;
    AsyncTrackerConfig config_;
    NotificationSink sink_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> operations_;

    // Timer handlers hold a weak_ptr to this so they can tell the tracker
    // was destroyed while they were queued.
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

}  // namespace umcp
