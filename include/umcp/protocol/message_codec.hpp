#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Message Codec
// ─────────────────────────────────────────────────────────────────────────────
// Newline-delimited JSON framing for a byte stream.
//
// Inbound segments are parsed with simdjson and handed out as nlohmann::json;
// outbound envelopes are serialized with nlohmann. The serializer escapes
// control characters, so an encoded message never contains a raw '\n' and the
// delimiter is unambiguous.

#include "umcp/protocol/json_rpc.hpp"

#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace umcp {

struct ParseError {
    std::string message;
};

struct CodecConfig {
    /// Deeper documents are treated as unparsable.
    std::size_t max_depth{64};
};

struct FeedResult {
    std::vector<Json> messages;
    /// Bytes after the last delimiter; carry into the next feed().
    std::string remaining;
    /// Delimited segments that were not valid JSON and were discarded.
    std::size_t dropped{0};
};

class MessageCodec {
public:
    static constexpr char kDelimiter = '\n';

    MessageCodec() = default;
    explicit MessageCodec(CodecConfig config) : config_(config) {}

    // simdjson parser buffers are per instance; one codec per connection.
    MessageCodec(const MessageCodec&) = delete;
    MessageCodec& operator=(const MessageCodec&) = delete;
    MessageCodec(MessageCodec&&) noexcept = default;
    MessageCodec& operator=(MessageCodec&&) noexcept = default;

    /// Serialize and append the delimiter. Invalid UTF-8 in strings is replaced
    /// rather than throwing.
    [[nodiscard]] static std::string encode(const Json& envelope);

    /// Append new_bytes to buffer and extract every complete segment.
    /// `buffer` must be the `remaining` of an earlier feed (or empty), so it
    /// holds no delimiter. Blank segments are skipped, unparsable ones counted
    /// in `dropped`.
    [[nodiscard]] FeedResult feed(std::string buffer, std::string_view new_bytes);

    /// Parse one segment (no delimiter).
    [[nodiscard]] tl::expected<Json, ParseError> parse(std::string_view segment);

    [[nodiscard]] const CodecConfig& config() const noexcept { return config_; }

private:
    simdjson::dom::parser parser_;
    CodecConfig config_;

    [[nodiscard]] tl::expected<Json, ParseError> convert(simdjson::dom::element element, std::size_t depth) const;
};

}  // namespace umcp
