#include <catch2/catch_test_macros.hpp>

#include "umcp/protocol/json_rpc.hpp"

using namespace umcp;

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonRpcId accepts string, number and null", "[jsonrpc][id]") {
    REQUIRE(JsonRpcId::from_json(Json(7)) == JsonRpcId::integer(7));
    REQUIRE(JsonRpcId::from_json(Json("abc")) == JsonRpcId::string("abc"));
    REQUIRE(JsonRpcId::from_json(Json(nullptr)) == JsonRpcId::null());
    REQUIRE(JsonRpcId::from_json(Json(1.5)) == JsonRpcId::number(1.5));
}

TEST_CASE("JsonRpcId rejects structured values", "[jsonrpc][id]") {
    REQUIRE(JsonRpcId::from_json(Json::object()).has_value() == false);
    REQUIRE(JsonRpcId::from_json(Json::array({1})).has_value() == false);
    REQUIRE(JsonRpcId::from_json(Json(true)).has_value() == false);
}

TEST_CASE("JsonRpcId is echoed back verbatim", "[jsonrpc][id]") {
    REQUIRE(JsonRpcId::integer(42).to_json() == Json(42));
    REQUIRE(JsonRpcId::string("req-1").to_json() == Json("req-1"));
    REQUIRE(JsonRpcId::null().to_json().is_null());
}

TEST_CASE("JsonRpcId keeps unsigned ids beyond int64 range", "[jsonrpc][id]") {
    const Json huge = Json::parse("18446744073709551615");
    const auto id = JsonRpcId::from_json(huge);
    REQUIRE(id.has_value());
    REQUIRE(*id == JsonRpcId::unsigned_integer(18446744073709551615ULL));
    REQUIRE(id->to_json() == huge);
    REQUIRE(id->to_json().dump() == "18446744073709551615");
}

TEST_CASE("JsonRpcId keeps the largest signed id as an integer", "[jsonrpc][id]") {
    const Json edge = Json::parse("9223372036854775807");
    const auto id = JsonRpcId::from_json(edge);
    REQUIRE(id.has_value());
    REQUIRE(*id == JsonRpcId::integer(9223372036854775807LL));
    REQUIRE(id->to_json().dump() == "9223372036854775807");
}

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Error codes cover the standard and application ranges", "[jsonrpc][error]") {
    REQUIRE(ErrorCode::ParseError == -32700);
    REQUIRE(ErrorCode::InvalidRequest == -32600);
    REQUIRE(ErrorCode::MethodNotFound == -32601);
    REQUIRE(ErrorCode::InvalidParams == -32602);
    REQUIRE(ErrorCode::InternalError == -32603);
    REQUIRE(ErrorCode::AuthenticationError == -32000);
    REQUIRE(ErrorCode::ValidationError == -32005);

    REQUIRE(ErrorCode::is_application_code(ErrorCode::ProviderError));
    REQUIRE(ErrorCode::is_application_code(ErrorCode::InternalError) == false);
}

TEST_CASE("JsonRpcError omits data when absent", "[jsonrpc][error]") {
    const auto error = JsonRpcError::method_not_found("unknown");
    const Json node = error.to_json();

    REQUIRE(node.at("code") == -32601);
    REQUIRE(node.at("message") == "Method not found: unknown");
    REQUIRE(node.contains("data") == false);
}

TEST_CASE("JsonRpcError parses from a response payload", "[jsonrpc][error]") {
    const Json node = {{"code", -32602}, {"message", "bad"}, {"data", {{"parameter", "x"}}}};
    const auto error = JsonRpcError::from_json(node);

    REQUIRE(error.has_value());
    REQUIRE(error->code == ErrorCode::InvalidParams);
    REQUIRE(error->data->at("parameter") == "x");

    REQUIRE(JsonRpcError::from_json(Json{{"message", "no code"}}).has_value() == false);
}

// ─────────────────────────────────────────────────────────────────────────────
// Envelopes
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Result response carries the request id", "[jsonrpc][response]") {
    const Json response = make_result_response(JsonRpcId::integer(1), Json{{"message", "pong"}});
    REQUIRE(response == Json::parse(R"({"jsonrpc":"2.0","id":1,"result":{"message":"pong"}})"));
}

TEST_CASE("Error response has no result member", "[jsonrpc][response]") {
    const Json response = make_error_response(JsonRpcId::null(), JsonRpcError::internal("Message too large"));

    REQUIRE(response.at("id").is_null());
    REQUIRE(response.contains("result") == false);
    REQUIRE(response.at("error").at("code") == ErrorCode::InternalError);
}

TEST_CASE("Notification serializes without id", "[jsonrpc][notification]") {
    const JsonRpcNotification notification("progress", Json{{"operationId", "op_1"}});
    const Json node = notification.to_json();

    REQUIRE(node.at("jsonrpc") == "2.0");
    REQUIRE(node.at("method") == "progress");
    REQUIRE(node.contains("id") == false);
    REQUIRE(node.at("params").at("operationId") == "op_1");
}

TEST_CASE("Request without params reports an empty object", "[jsonrpc][request]") {
    const JsonRpcRequest request("ping", JsonRpcId::integer(3), std::nullopt);

    REQUIRE(request.is_notification() == false);
    REQUIRE(request.params_or_empty() == Json::object());
    REQUIRE(request.to_json().contains("params") == false);

    const JsonRpcRequest notification("log", std::nullopt, std::nullopt);
    REQUIRE(notification.is_notification());
}
