#include <catch2/catch_test_macros.hpp>

#include "mocks/session_fixtures.hpp"

#include "umcp/server/handler.hpp"
#include "umcp/server/handler_registry.hpp"

#include <system_error>

using namespace umcp;
using namespace umcp::testing;

namespace {

HandlerResult execute(IHandler& handler, const Json& params) {
    asio::io_context io;
    ConnectionContext context;
    context.connection_id = "client_test";
    const JsonRpcRequest request("site.deploy", JsonRpcId::integer(1), params);
    return run_sync(io, handler.execute(request, context));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Exception Mapping
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("exception_kind names common exception types", "[handler][errors]") {
    REQUIRE(exception_kind(std::runtime_error("x")) == "RuntimeError");
    REQUIRE(exception_kind(std::invalid_argument("x")) == "InvalidArgument");
    REQUIRE(exception_kind(std::out_of_range("x")) == "OutOfRange");
    REQUIRE(exception_kind(std::logic_error("x")) == "LogicError");
    REQUIRE(exception_kind(std::system_error(std::make_error_code(std::errc::timed_out))) == "SystemError");
    REQUIRE(exception_kind(RpcException(ErrorCode::ProviderError, "x")) == "RpcException");
    REQUIRE(exception_kind(std::bad_alloc()) == "BadAlloc");
}

TEST_CASE("Plain exceptions become a generic internal error", "[handler][errors]") {
    const JsonRpcError error = map_exception(std::runtime_error("database password is hunter2"));

    REQUIRE(error.code == ErrorCode::InternalError);
    REQUIRE(error.message == "Internal server error");
    REQUIRE(error.data->at("errorType") == "RuntimeError");
}

TEST_CASE("RpcException keeps its code, message and data", "[handler][errors]") {
    const auto e = RpcException::provider_error("Shopify API unavailable", Json{{"provider", "shopify"}});
    const JsonRpcError error = map_exception(e);

    REQUIRE(error.code == ErrorCode::ProviderError);
    REQUIRE(error.message == "Shopify API unavailable");
    REQUIRE(error.data->at("provider") == "shopify");
    REQUIRE(error.data->at("errorType") == "RpcException");
}

TEST_CASE("RpcException with scalar data nests it under details", "[handler][errors]") {
    const JsonRpcError error = map_exception(RpcException::validation_error("bad", Json(17)));

    REQUIRE(error.code == ErrorCode::ValidationError);
    REQUIRE(error.data->at("details") == 17);
}

// ═══════════════════════════════════════════════════════════════════════════
// execute()
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("execute returns the handler result", "[handler][execute]") {
    CountingHandler handler(Json{{"deployed", true}});
    const auto result = execute(handler, Json::object());

    REQUIRE(result.has_value());
    REQUIRE(result->at("deployed") == true);
    REQUIRE(handler.calls == 1);
}

TEST_CASE("execute rejects invalid params without invoking the handler", "[handler][execute]") {
    CountingHandler handler(Json::object(), ParamSchema::from_json(Json::parse(
        R"({"required":["siteId"],"properties":{"siteId":{"type":"string"}}})")));

    SECTION("missing required field") {
        const auto result = execute(handler, Json::object());
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().code == ErrorCode::InvalidParams);
        REQUIRE(result.error().message == "Missing required parameter: siteId");
    }

    SECTION("wrong type") {
        const auto result = execute(handler, Json{{"siteId", 5}});
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().code == ErrorCode::InvalidParams);
    }

    REQUIRE(handler.calls == 0);
}

TEST_CASE("execute maps thrown exceptions", "[handler][execute]") {
    SECTION("standard exception") {
        ThrowingHandler handler([] { throw std::out_of_range("index 9"); });
        const auto result = execute(handler, Json::object());

        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().code == ErrorCode::InternalError);
        REQUIRE(result.error().message == "Internal server error");
        REQUIRE(result.error().data->at("errorType") == "OutOfRange");
    }

    SECTION("protocol exception") {
        ThrowingHandler handler([] { throw RpcException(ErrorCode::RateLimitExceeded, "Slow down"); });
        const auto result = execute(handler, Json::object());

        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().code == ErrorCode::RateLimitExceeded);
        REQUIRE(result.error().message == "Slow down");
    }

    SECTION("non-standard exception") {
        ThrowingHandler handler([] { throw 42; });
        const auto result = execute(handler, Json::object());

        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().code == ErrorCode::InternalError);
        REQUIRE(result.error().data->at("errorType") == "UnknownException");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// HandlerRegistry
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Registry finds registered handlers", "[registry]") {
    HandlerRegistry registry;
    auto handler = registry.emplace<CountingHandler>("site.list");

    REQUIRE(registry.contains("site.list"));
    REQUIRE(registry.find("site.list") == handler);
    REQUIRE(registry.find("site.delete") == nullptr);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Registry rejects conflicting registrations", "[registry]") {
    HandlerRegistry registry;
    auto first = std::make_shared<CountingHandler>();
    registry.register_handler("site.list", first);

    SECTION("same handler again is a no-op") {
        REQUIRE_NOTHROW(registry.register_handler("site.list", first));
        REQUIRE(registry.size() == 1);
    }

    SECTION("different handler under the same name") {
        REQUIRE_THROWS_AS(registry.register_handler("site.list", std::make_shared<CountingHandler>()),
                          RegistrationError);
        REQUIRE(registry.find("site.list") == first);
    }

    SECTION("empty name") {
        REQUIRE_THROWS_AS(registry.register_handler("", std::make_shared<CountingHandler>()), RegistrationError);
    }

    SECTION("null handler") {
        REQUIRE_THROWS_AS(registry.register_handler("site.stats", nullptr), RegistrationError);
    }
}

TEST_CASE("Registry lists methods in order and can unregister", "[registry]") {
    HandlerRegistry registry;
    registry.emplace<CountingHandler>("ping");
    registry.emplace<CountingHandler>("initialize");
    registry.emplace<CountingHandler>("site.list");

    REQUIRE(registry.methods() == std::vector<std::string>{"initialize", "ping", "site.list"});
    REQUIRE(registry.unregister_handler("ping"));
    REQUIRE(registry.unregister_handler("ping") == false);
    REQUIRE(registry.contains("ping") == false);
}
