#include "umcp/protocol/message_codec.hpp"

#include "umcp/log/logger.hpp"

namespace umcp {

namespace {

bool is_blank(std::string_view segment) noexcept {
    for (const char c : segment) {
        const bool is_space = (c == ' ') || (c == '\t') || (c == '\r') || (c == '\f') || (c == '\v');
        if (is_space == false) {
            return false;
        }
    }
    return true;
}

tl::unexpected<ParseError> simdjson_failure(simdjson::error_code code) {
    return tl::unexpected(ParseError{std::string(simdjson::error_message(code))});
}

}  // namespace

std::string MessageCodec::encode(const Json& envelope) {
    std::string frame = envelope.dump(-1, ' ', false, Json::error_handler_t::replace);
    frame.push_back(kDelimiter);
    return frame;
}

FeedResult MessageCodec::feed(std::string buffer, std::string_view new_bytes) {
    // The carried tail holds no delimiter; only the new bytes need scanning.
    std::size_t scan_from = buffer.size();
    buffer.append(new_bytes.data(), new_bytes.size());

    FeedResult result;
    std::size_t start = 0;
    while (true) {
        const std::size_t end = buffer.find(kDelimiter, scan_from);
        if (end == std::string::npos) {
            break;
        }

        const std::string_view segment(buffer.data() + start, end - start);
        start = end + 1;
        scan_from = start;

        if (is_blank(segment)) {
            continue;
        }

        auto parsed = parse(segment);
        if (parsed.has_value() == false) {
            ++result.dropped;
            UMCP_LOG_DEBUG("Dropping unparsable segment ({} bytes): {}",
                           segment.size(), parsed.error().message);
            continue;
        }
        result.messages.push_back(std::move(*parsed));
    }

    buffer.erase(0, start);
    result.remaining = std::move(buffer);
    return result;
}

tl::expected<Json, ParseError> MessageCodec::parse(std::string_view segment) {
    simdjson::dom::element root;
    const auto error = parser_.parse(segment.data(), segment.size(), true).get(root);
    if (error != simdjson::SUCCESS) {
        return simdjson_failure(error);
    }
    return convert(root, 0);
}

tl::expected<Json, ParseError> MessageCodec::convert(simdjson::dom::element element, std::size_t depth) const {
    if (depth > config_.max_depth) {
        return tl::unexpected(ParseError{
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"});
    }

    switch (element.type()) {
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object object;
            const auto error = element.get_object().get(object);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            Json node = Json::object();
            for (simdjson::dom::key_value_pair field : object) {
                auto child = convert(field.value, depth + 1);
                if (child.has_value() == false) {
                    return child;
                }
                node[std::string(field.key)] = std::move(*child);
            }
            return node;
        }

        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array array;
            const auto error = element.get_array().get(array);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            Json node = Json::array();
            for (simdjson::dom::element item : array) {
                auto child = convert(item, depth + 1);
                if (child.has_value() == false) {
                    return child;
                }
                node.push_back(std::move(*child));
            }
            return node;
        }

        case simdjson::dom::element_type::STRING: {
            std::string_view text;
            const auto error = element.get_string().get(text);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            return Json(std::string(text));
        }

        case simdjson::dom::element_type::INT64: {
            std::int64_t value = 0;
            const auto error = element.get_int64().get(value);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            return Json(value);
        }

        case simdjson::dom::element_type::UINT64: {
            std::uint64_t value = 0;
            const auto error = element.get_uint64().get(value);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            return Json(value);
        }

        case simdjson::dom::element_type::DOUBLE: {
            double value = 0.0;
            const auto error = element.get_double().get(value);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            return Json(value);
        }

        case simdjson::dom::element_type::BOOL: {
            bool value = false;
            const auto error = element.get_bool().get(value);
            if (error != simdjson::SUCCESS) {
                return simdjson_failure(error);
            }
            return Json(value);
        }

        case simdjson::dom::element_type::NULL_VALUE:
            return Json(nullptr);
    }

    return tl::unexpected(ParseError{"Unknown JSON element type"});
}

}  // namespace umcp
