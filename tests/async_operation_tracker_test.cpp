#include <catch2/catch_test_macros.hpp>

#include "mocks/session_fixtures.hpp"

#include "umcp/server/async_operation_tracker.hpp"

using namespace umcp;
using namespace umcp::testing;
using namespace std::chrono_literals;

namespace {

struct SentNotification {
    std::string connection_id;
    Json message;
};

struct TrackerHarness {
    explicit TrackerHarness(AsyncTrackerConfig config = {})
        : tracker(io.get_executor(), config)
    {
        tracker.set_notification_sink(
            [this](const std::string& connection_id, const JsonRpcNotification& notification) {
                sent.push_back({connection_id, notification.to_json()});
                return connection_accepts;
            });
    }

    asio::io_context io;
    AsyncOperationTracker tracker;
    std::vector<SentNotification> sent;
    bool connection_accepts{true};
};

OperationUpdate progress_to(double value) {
    OperationUpdate delta;
    delta.progress = value;
    return delta;
}

OperationUpdate finish_with(OperationStatus status, Json payload) {
    OperationUpdate delta;
    delta.status = status;
    if (status == OperationStatus::Completed) {
        delta.result = std::move(payload);
    } else {
        delta.error = std::move(payload);
    }
    return delta;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Status Names
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Operation status names round-trip", "[tracker]") {
    REQUIRE(to_string(OperationStatus::Timeout) == "timeout");
    REQUIRE(parse_operation_status("completed") == OperationStatus::Completed);
    REQUIRE(parse_operation_status("cancelled").has_value() == false);
    REQUIRE(is_terminal(OperationStatus::Running) == false);
    REQUIRE(is_terminal(OperationStatus::Failed));
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("start creates a running record", "[tracker]") {
    TrackerHarness h;
    const std::string id = h.tracker.start("client_a", "site.deploy", Json{{"siteId", "s1"}});

    REQUIRE(id.rfind("op_", 0) == 0);
    const auto op = h.tracker.find(id);
    REQUIRE(op.has_value());
    REQUIRE(op->status == OperationStatus::Running);
    REQUIRE(op->progress == 0.0);
    REQUIRE(op->connection_id == "client_a");
    REQUIRE(op->params.at("siteId") == "s1");
    REQUIRE(h.tracker.running_count("client_a") == 1);
    REQUIRE(h.sent.empty());
}

TEST_CASE("Operation ids are unique", "[tracker]") {
    TrackerHarness h;
    const auto a = h.tracker.start("c", "m", Json::object());
    const auto b = h.tracker.start("c", "m", Json::object());
    REQUIRE(a != b);
}

TEST_CASE("Progress updates notify the owning connection", "[tracker][notify]") {
    TrackerHarness h;
    const std::string id = h.tracker.start("client_a", "site.deploy", Json::object());

    REQUIRE(h.tracker.update(id, progress_to(40)).has_value());

    REQUIRE(h.sent.size() == 1);
    REQUIRE(h.sent[0].connection_id == "client_a");
    const Json& message = h.sent[0].message;
    REQUIRE(message.at("method") == "progress");
    REQUIRE(message.contains("id") == false);
    REQUIRE(message.at("params").at("operationId") == id);
    REQUIRE(message.at("params").at("status") == "running");
    REQUIRE(message.at("params").at("progress") == 40);
    REQUIRE(message.at("params").at("method") == "site.deploy");
}

TEST_CASE("Result-only updates do not notify", "[tracker][notify]") {
    TrackerHarness h;
    const std::string id = h.tracker.start("client_a", "m", Json::object());

    OperationUpdate delta;
    delta.result = Json{{"partial", true}};
    REQUIRE(h.tracker.update(id, delta).has_value());

    REQUIRE(h.sent.empty());
    REQUIRE(h.tracker.find(id)->result->at("partial") == true);
}

TEST_CASE("Completion notifies exactly once and freezes the record", "[tracker][terminal]") {
    TrackerHarness h(AsyncTrackerConfig{10ms, 10s});
    const std::string id = h.tracker.start("client_a", "site.deploy", Json::object());

    REQUIRE(h.tracker.update(id, finish_with(OperationStatus::Completed, Json{{"url", "https://x"}})).has_value());
    REQUIRE(h.sent.size() == 1);
    REQUIRE(h.sent[0].message.at("params").at("status") == "completed");
    REQUIRE(h.sent[0].message.at("params").at("result").at("url") == "https://x");

    SECTION("later updates are rejected") {
        const auto again = h.tracker.update(id, progress_to(90));
        REQUIRE(again.has_value() == false);
        REQUIRE(again.error().code == OperationError::Code::AlreadyTerminal);

        const auto fail = h.tracker.update(id, finish_with(OperationStatus::Failed, Json("late")));
        REQUIRE(fail.has_value() == false);

        REQUIRE(h.sent.size() == 1);
        REQUIRE(h.tracker.find(id)->status == OperationStatus::Completed);
    }

    SECTION("the timeout timer is disarmed") {
        run_for(h.io, 60ms);
        REQUIRE(h.tracker.find(id)->status == OperationStatus::Completed);
        REQUIRE(h.sent.size() == 1);
    }
}

TEST_CASE("Only the tracker may set timeout", "[tracker][terminal]") {
    TrackerHarness h;
    const std::string id = h.tracker.start("client_a", "m", Json::object());

    OperationUpdate delta;
    delta.status = OperationStatus::Timeout;
    const auto result = h.tracker.update(id, delta);

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == OperationError::Code::ReservedStatus);
    REQUIRE(h.tracker.find(id)->status == OperationStatus::Running);
    REQUIRE(h.sent.empty());
}

TEST_CASE("Updating an unknown operation fails", "[tracker]") {
    TrackerHarness h;
    const auto result = h.tracker.update("op_missing", progress_to(1));

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == OperationError::Code::UnknownOperation);
    REQUIRE(result.error().message == "Unknown operation: op_missing");
}

TEST_CASE("Undeliverable notifications do not fail the update", "[tracker][notify]") {
    TrackerHarness h;
    h.connection_accepts = false;
    const std::string id = h.tracker.start("client_gone", "m", Json::object());

    REQUIRE(h.tracker.update(id, progress_to(10)).has_value());
    REQUIRE(h.tracker.find(id)->progress == 10.0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Timers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Running operations time out once", "[tracker][timeout]") {
    TrackerHarness h(AsyncTrackerConfig{20ms, 10s});
    const std::string id = h.tracker.start("client_a", "site.backup", Json::object());

    run_for(h.io, 150ms);

    const auto op = h.tracker.find(id);
    REQUIRE(op.has_value());
    REQUIRE(op->status == OperationStatus::Timeout);
    REQUIRE(op->error == Json("Operation timed out"));
    REQUIRE(h.sent.size() == 1);
    REQUIRE(h.sent[0].message.at("params").at("status") == "timeout");
    REQUIRE(h.sent[0].message.at("params").at("error") == "Operation timed out");

    REQUIRE(h.tracker.update(id, progress_to(50)).has_value() == false);
}

TEST_CASE("Terminal records are purged after retention", "[tracker][retention]") {
    TrackerHarness h(AsyncTrackerConfig{10s, 20ms});
    const std::string done = h.tracker.start("client_a", "m", Json::object());
    const std::string running = h.tracker.start("client_a", "m", Json::object());

    REQUIRE(h.tracker.update(done, finish_with(OperationStatus::Failed, Json("boom"))).has_value());
    REQUIRE(h.tracker.find(done).has_value());

    run_for(h.io, 150ms);

    REQUIRE(h.tracker.find(done).has_value() == false);
    REQUIRE(h.tracker.find(running).has_value());
    REQUIRE(h.tracker.size() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Disconnect
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("cancel_for_connection drops only that connection's records", "[tracker][disconnect]") {
    TrackerHarness h;
    const auto a1 = h.tracker.start("client_a", "m", Json::object());
    const auto a2 = h.tracker.start("client_a", "m", Json::object());
    const auto a3 = h.tracker.start("client_a", "m", Json::object());
    const auto b1 = h.tracker.start("client_b", "m", Json::object());
    REQUIRE(h.tracker.update(a3, finish_with(OperationStatus::Completed, Json::object())).has_value());
    h.sent.clear();

    const std::size_t cancelled = h.tracker.cancel_for_connection("client_a", "Connection closed: test");

    REQUIRE(cancelled == 2);
    REQUIRE(h.sent.empty());
    REQUIRE(h.tracker.find(a1).has_value() == false);
    REQUIRE(h.tracker.find(a2).has_value() == false);
    REQUIRE(h.tracker.find(a3).has_value() == false);
    REQUIRE(h.tracker.find(b1)->status == OperationStatus::Running);
    REQUIRE(h.tracker.running_count("client_a") == 0);
    REQUIRE(h.tracker.running_count("client_b") == 1);
}

TEST_CASE("Records serialize with camelCase fields", "[tracker]") {
    TrackerHarness h;
    const std::string id = h.tracker.start("client_a", "site.deploy", Json{{"siteId", "s"}});
    const Json node = h.tracker.find(id)->to_json();

    REQUIRE(node.at("operationId") == id);
    REQUIRE(node.at("connectionId") == "client_a");
    REQUIRE(node.at("status") == "running");
    REQUIRE(node.at("startTime").get<std::string>().back() == 'Z');
    REQUIRE(node.contains("lastUpdateTime"));
    REQUIRE(node.contains("result") == false);
}
