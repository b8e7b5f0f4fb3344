#pragma once

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace umcp {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────────────────────────────────────
// -32768..-32000 is reserved by JSON-RPC. The standard codes sit at the top of
// that range; application codes use -32000..-32099.

namespace ErrorCode {
    inline constexpr int ParseError     = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams  = -32602;
    inline constexpr int InternalError  = -32603;

    inline constexpr int AuthenticationError = -32000;
    inline constexpr int AuthorizationError  = -32001;
    inline constexpr int RateLimitExceeded   = -32002;
    inline constexpr int ProviderError       = -32003;
    inline constexpr int AsyncOperationError = -32004;
    inline constexpr int ValidationError     = -32005;

    [[nodiscard]] constexpr bool is_application_code(int code) noexcept {
        return (code <= -32000) && (code >= -32099);
    }
}  // namespace ErrorCode

// ─────────────────────────────────────────────────────────────────────────────
// Request Id
// ─────────────────────────────────────────────────────────────────────────────

/// A request id as sent by the client. Null is a legal (if unusual) id and is
/// distinct from an absent id, which marks a notification.
struct JsonRpcId {
    std::variant<std::nullptr_t, std::int64_t, std::uint64_t, double, std::string> value{nullptr};

    static JsonRpcId null();
    static JsonRpcId integer(std::int64_t v);
    /// Only used for ids above INT64_MAX.
    static JsonRpcId unsigned_integer(std::uint64_t v);
    static JsonRpcId number(double v);
    static JsonRpcId string(std::string v);

    /// Accepts string, number or null nodes.
    [[nodiscard]] static std::optional<JsonRpcId> from_json(const Json& node);

    [[nodiscard]] Json to_json() const;

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Error Object
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcError {
    int code{ErrorCode::InternalError};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] static std::optional<JsonRpcError> from_json(const Json& node);

    [[nodiscard]] static JsonRpcError invalid_request(std::string msg) {
        return {ErrorCode::InvalidRequest, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static JsonRpcError method_not_found(std::string_view method) {
        return {ErrorCode::MethodNotFound, "Method not found: " + std::string(method), std::nullopt};
    }

    [[nodiscard]] static JsonRpcError invalid_params(std::string msg, Json data) {
        return {ErrorCode::InvalidParams, std::move(msg), std::move(data)};
    }

    [[nodiscard]] static JsonRpcError internal(std::string msg, std::optional<Json> data = std::nullopt) {
        return {ErrorCode::InternalError, std::move(msg), std::move(data)};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Request / Notification
// ─────────────────────────────────────────────────────────────────────────────

/// A validated inbound call. Without an id it is a notification and never
/// receives a response.
class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method,
                   std::optional<JsonRpcId> id,
                   std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] bool is_notification() const noexcept;

    /// params, or an empty object when the request carried none.
    [[nodiscard]] Json params_or_empty() const;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::optional<JsonRpcId> id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::optional<Json> params_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] Json make_result_response(const JsonRpcId& id, Json result);
[[nodiscard]] Json make_error_response(const JsonRpcId& id, const JsonRpcError& error);

}  // namespace umcp
