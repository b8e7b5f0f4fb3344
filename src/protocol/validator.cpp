#include "umcp/protocol/validator.hpp"

#include <cmath>

namespace umcp {

namespace {

tl::unexpected<EnvelopeError> reject(std::string message, std::optional<JsonRpcId> id) {
    return tl::unexpected(EnvelopeError{
        JsonRpcError::invalid_request(std::move(message)),
        std::move(id)});
}

std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::string join_values(const std::vector<Json>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty() == false) {
            joined += ", ";
        }
        joined += value.is_string() ? value.get<std::string>() : value.dump();
    }
    return joined;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Envelope
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<JsonRpcRequest, EnvelopeError> validate_envelope(const Json& message) {
    if (message.is_object() == false) {
        return reject("Invalid JSON-RPC 2.0 request: not an object", std::nullopt);
    }

    // Recover the id first so the rejection can still be addressed.
    std::optional<JsonRpcId> id;
    const bool has_id = message.contains("id");
    if (has_id == true) {
        id = JsonRpcId::from_json(message.at("id"));
    }

    const bool version_ok = message.contains("jsonrpc")
        && message.at("jsonrpc").is_string()
        && (message.at("jsonrpc").get<std::string>() == kJsonRpcVersion);
    if (version_ok == false) {
        return reject("Invalid JSON-RPC version, must be exactly \"2.0\"", id);
    }

    const bool method_is_string = message.contains("method") && message.at("method").is_string();
    if ((method_is_string == false) || trim(message.at("method").get<std::string>()).empty()) {
        return reject("Method must be a non-empty string", id);
    }

    if ((has_id == true) && (id.has_value() == false)) {
        return reject("ID must be string, number, or null", std::nullopt);
    }

    std::optional<Json> params;
    if (message.contains("params")) {
        const Json& params_node = message.at("params");
        const bool params_ok = params_node.is_object() || params_node.is_array();
        if (params_ok == false) {
            return reject("Params must be an object or array", id);
        }
        params = params_node;
    }

    return JsonRpcRequest(message.at("method").get<std::string>(), std::move(id), std::move(params));
}

// ─────────────────────────────────────────────────────────────────────────────
// Parameter Schemas
// ─────────────────────────────────────────────────────────────────────────────

ParamSchema ParamSchema::from_json(const Json& schema) {
    ParamSchema result;
    if (schema.is_object() == false) {
        return result;
    }

    if (schema.contains("required") && schema.at("required").is_array()) {
        for (const auto& field : schema.at("required")) {
            if (field.is_string()) {
                result.required.push_back(field.get<std::string>());
            }
        }
    }

    if (schema.contains("properties") && schema.at("properties").is_object()) {
        for (const auto& [name, rule_node] : schema.at("properties").items()) {
            PropertyRule rule;
            if (rule_node.contains("type") && rule_node.at("type").is_string()) {
                rule.type = rule_node.at("type").get<std::string>();
            }
            if (rule_node.contains("enum") && rule_node.at("enum").is_array()) {
                for (const auto& allowed : rule_node.at("enum")) {
                    rule.allowed_values.push_back(allowed);
                }
            }
            result.properties.emplace(name, std::move(rule));
        }
    }
    return result;
}

bool matches_type(const Json& value, std::string_view type) {
    if (type == "string") {
        return value.is_string();
    }
    if (type == "number") {
        return value.is_number();
    }
    if (type == "integer") {
        if (value.is_number_integer()) {
            return true;
        }
        if (value.is_number_float()) {
            const double number = value.get<double>();
            return std::isfinite(number) && (std::floor(number) == number);
        }
        return false;
    }
    if (type == "boolean") {
        return value.is_boolean();
    }
    if (type == "object") {
        return value.is_object();
    }
    if (type == "array") {
        return value.is_array();
    }
    if (type == "null") {
        return value.is_null();
    }
    return true;
}

tl::expected<void, JsonRpcError> validate_params(
    std::string_view method,
    const Json& params,
    const ParamSchema& schema
) {
    const bool is_named = params.is_object();

    for (const auto& field : schema.required) {
        const bool present = is_named && params.contains(field);
        if (present == false) {
            return tl::unexpected(JsonRpcError::invalid_params(
                "Missing required parameter: " + field,
                Json{{"method", std::string(method)}, {"parameter", field}}));
        }
    }

    if (is_named == false) {
        return {};
    }

    for (const auto& [field, rule] : schema.properties) {
        const auto it = params.find(field);
        if (it == params.end()) {
            continue;
        }

        if ((rule.type.empty() == false) && (matches_type(*it, rule.type) == false)) {
            return tl::unexpected(JsonRpcError::invalid_params(
                "Invalid type for parameter: " + field + ". Expected " + rule.type,
                Json{{"method", std::string(method)}, {"parameter", field}, {"expectedType", rule.type}}));
        }

        if (rule.allowed_values.empty() == false) {
            bool allowed = false;
            for (const auto& candidate : rule.allowed_values) {
                if (candidate == *it) {
                    allowed = true;
                    break;
                }
            }
            if (allowed == false) {
                return tl::unexpected(JsonRpcError::invalid_params(
                    "Invalid value for parameter: " + field + ". Must be one of: " + join_values(rule.allowed_values),
                    Json{{"method", std::string(method)}, {"parameter", field}, {"allowedValues", rule.allowed_values}}));
            }
        }
    }

    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Sanitization
// ─────────────────────────────────────────────────────────────────────────────

std::string sanitize_string(std::string_view input) {
    std::string output;
    output.reserve(input.size());
    for (const char c : input) {
        switch (c) {
            case '<':
            case '>':
                break;
            case '&':  output += "&amp;"; break;
            case '"':  output += "&quot;"; break;
            case '\'': output += "&#39;"; break;
            default:   output.push_back(c); break;
        }
    }
    return std::string(trim(output));
}

Json sanitize_value(const Json& value) {
    if (value.is_string()) {
        return sanitize_string(value.get<std::string>());
    }
    if (value.is_array()) {
        Json result = Json::array();
        for (const auto& item : value) {
            result.push_back(sanitize_value(item));
        }
        return result;
    }
    if (value.is_object()) {
        Json result = Json::object();
        for (const auto& [key, item] : value.items()) {
            result[key] = sanitize_value(item);
        }
        return result;
    }
    return value;
}

}  // namespace umcp
