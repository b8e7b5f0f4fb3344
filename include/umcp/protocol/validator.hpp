#pragma once

#include "umcp/protocol/json_rpc.hpp"

#include <tl/expected.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace umcp {

// ─────────────────────────────────────────────────────────────────────────────
// Envelope Validation
// ─────────────────────────────────────────────────────────────────────────────

/// Failed envelope check. `id` is the request id when one could be recovered,
/// so the rejection can still be paired with its request.
struct EnvelopeError {
    JsonRpcError error;
    std::optional<JsonRpcId> id;
};

/// Check version, method, id and params of a decoded message and build the
/// typed request. Every failure is an INVALID_REQUEST.
[[nodiscard]] tl::expected<JsonRpcRequest, EnvelopeError> validate_envelope(const Json& message);

// ─────────────────────────────────────────────────────────────────────────────
// Parameter Schemas
// ─────────────────────────────────────────────────────────────────────────────

struct PropertyRule {
    /// string, number, integer, boolean, object, array or null. Any other
    /// value (including empty) accepts everything.
    std::string type;
    std::vector<Json> allowed_values;
};

/// Additive constraints over named params.
struct ParamSchema {
    std::vector<std::string> required;
    std::map<std::string, PropertyRule> properties;

    /// Read `{required:[...], properties:{name:{type, enum}}}`.
    [[nodiscard]] static ParamSchema from_json(const Json& schema);
};

/// True when `value` satisfies the declared primitive type.
[[nodiscard]] bool matches_type(const Json& value, std::string_view type);

/// Check params against the schema. Array params are positional and only pass
/// through the required-field check when the schema requires nothing.
[[nodiscard]] tl::expected<void, JsonRpcError> validate_params(
    std::string_view method,
    const Json& params,
    const ParamSchema& schema
);

// ─────────────────────────────────────────────────────────────────────────────
// Sanitization
// ─────────────────────────────────────────────────────────────────────────────

/// Drop angle brackets, escape &, " and ', trim surrounding whitespace.
[[nodiscard]] std::string sanitize_string(std::string_view input);

/// sanitize_string applied to every string inside objects and arrays.
[[nodiscard]] Json sanitize_value(const Json& value);

}  // namespace umcp
