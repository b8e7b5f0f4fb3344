#include "umcp/protocol/json_rpc.hpp"

#include <limits>

namespace umcp {

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::null() {
    return JsonRpcId{nullptr};
}

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::unsigned_integer(std::uint64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::number(double value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

std::optional<JsonRpcId> JsonRpcId::from_json(const Json& node) {
    if (node.is_null() == true) {
        return JsonRpcId::null();
    }
    if (node.is_string() == true) {
        return JsonRpcId::string(node.get<std::string>());
    }
    if (node.is_number_integer() == true) {
        if (node.is_number_unsigned() && node.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return JsonRpcId::unsigned_integer(node.get<std::uint64_t>());
        }
        return JsonRpcId::integer(node.get<std::int64_t>());
    }
    if (node.is_number_float() == true) {
        return JsonRpcId::number(node.get<double>());
    }
    return std::nullopt;
}

Json JsonRpcId::to_json() const {
    Json node;
    std::visit([&](const auto& v) { node = v; }, value);
    return node;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload = Json::object();
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

std::optional<JsonRpcError> JsonRpcError::from_json(const Json& node) {
    if (node.is_object() == false) {
        return std::nullopt;
    }
    const bool has_code = node.contains("code") && node.at("code").is_number_integer();
    const bool has_message = node.contains("message") && node.at("message").is_string();
    if ((has_code == false) || (has_message == false)) {
        return std::nullopt;
    }

    JsonRpcError error;
    error.code = node.at("code").get<int>();
    error.message = node.at("message").get<std::string>();
    if (node.contains("data")) {
        error.data = node.at("data");
    }
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::optional<JsonRpcId> id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const std::optional<JsonRpcId>& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

bool JsonRpcRequest::is_notification() const noexcept {
    return id_.has_value() == false;
}

Json JsonRpcRequest::params_or_empty() const {
    if (params_.has_value()) {
        return *params_;
    }
    return Json::object();
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (id_.has_value()) {
        payload["id"] = id_->to_json();
    }
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

Json make_result_response(const JsonRpcId& id, Json result) {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id.to_json();
    payload["result"] = std::move(result);
    return payload;
}

Json make_error_response(const JsonRpcId& id, const JsonRpcError& error) {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id.to_json();
    payload["error"] = error.to_json();
    return payload;
}

}  // namespace umcp
