#include "umcp/config/server_config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace umcp {

namespace {

tl::unexpected<ConfigError> config_error(std::string key, std::string message) {
    return tl::unexpected(ConfigError{std::move(key), std::move(message)});
}

ConfigResult<std::uint64_t> parse_unsigned(const std::string& key, const std::string& text) {
    std::uint64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [end, ec] = std::from_chars(first, last, value);
    if ((ec != std::errc{}) || (end != last) || text.empty()) {
        return config_error(key, "expected a non-negative integer, got '" + text + "'");
    }
    return value;
}

// Longest timer the server accepts, in milliseconds (2^31 - 1, about 24.8 days).
constexpr std::uint64_t kMaxDurationMs = static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());

ConfigResult<std::chrono::milliseconds> duration_ms(const std::string& key, std::uint64_t value) {
    if (value > kMaxDurationMs) {
        return config_error(key, "duration out of range: " + std::to_string(value) +
                                 " ms (max " + std::to_string(kMaxDurationMs) + ")");
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
}

ConfigResult<std::uint64_t> unsigned_field(const Json& node, const std::string& key) {
    const Json& value = node.at(key);
    if (value.is_number_unsigned() || (value.is_number_integer() && value.get<std::int64_t>() >= 0)) {
        return value.get<std::uint64_t>();
    }
    return config_error(key, "expected a non-negative integer");
}

ConfigResult<std::string> string_field(const Json& node, const std::string& key) {
    const Json& value = node.at(key);
    if (value.is_string() == false) {
        return config_error(key, "expected a string");
    }
    return value.get<std::string>();
}

ConfigResult<LogLevel> level_from(const std::string& key, const std::string& text) {
    const auto level = parse_log_level(text);
    if (level.has_value() == false) {
        return config_error(key, "unknown log level '" + text + "'");
    }
    return *level;
}

ConfigResult<void> apply_logging(LoggingConfig& logging, const Json& node) {
    if (node.is_object() == false) {
        return config_error("logging", "expected an object");
    }
    if (node.contains("level")) {
        auto text = string_field(node, "level");
        if (text.has_value() == false) return tl::unexpected(text.error());
        auto level = level_from("logging.level", *text);
        if (level.has_value() == false) return tl::unexpected(level.error());
        logging.level = *level;
    }
    if (node.contains("file")) {
        auto file = string_field(node, "file");
        if (file.has_value() == false) return tl::unexpected(file.error());
        logging.file = *file;
    }
    if (node.contains("maxSize")) {
        auto size = unsigned_field(node, "maxSize");
        if (size.has_value() == false) return tl::unexpected(size.error());
        logging.max_file_size = static_cast<std::size_t>(*size);
    }
    if (node.contains("maxFiles")) {
        auto files = unsigned_field(node, "maxFiles");
        if (files.has_value() == false) return tl::unexpected(files.error());
        logging.max_files = static_cast<std::size_t>(*files);
    }
    return {};
}

ConfigResult<void> apply_identity(ServerIdentity& identity, const Json& node) {
    if (node.is_object() == false) {
        return config_error("server", "expected an object");
    }
    if (node.contains("name")) {
        auto name = string_field(node, "name");
        if (name.has_value() == false) return tl::unexpected(name.error());
        identity.name = *name;
    }
    if (node.contains("version")) {
        auto version = string_field(node, "version");
        if (version.has_value() == false) return tl::unexpected(version.error());
        identity.version = *version;
    }
    if (node.contains("capabilities")) {
        const Json& extra = node.at("capabilities");
        if (extra.is_object() == false) {
            return config_error("server.capabilities", "expected an object");
        }
        identity.extra_capabilities = extra;
    }
    return {};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// ServerIdentity
// ─────────────────────────────────────────────────────────────────────────────

Json ServerIdentity::capabilities() const {
    Json caps = {
        {"serverName", name},
        {"serverVersion", version},
        {"supportedProviders", supported_providers},
        {"supportedFeatures", supported_features}
    };
    if (extra_capabilities.is_object()) {
        for (const auto& [key, value] : extra_capabilities.items()) {
            caps[key] = value;
        }
    }
    return caps;
}

// ─────────────────────────────────────────────────────────────────────────────
// Environment
// ─────────────────────────────────────────────────────────────────────────────

EnvLookup system_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

ConfigResult<void> apply_environment(ServerConfig& config, const EnvLookup& lookup) {
    if (auto host = lookup("MCP_HOST"); host.has_value()) {
        config.host = *host;
    }
    if (auto port = lookup("MCP_PORT"); port.has_value()) {
        auto value = parse_unsigned("MCP_PORT", *port);
        if (value.has_value() == false) return tl::unexpected(value.error());
        if (*value > std::numeric_limits<std::uint16_t>::max()) {
            return config_error("MCP_PORT", "port out of range: " + *port);
        }
        config.port = static_cast<std::uint32_t>(*value);
    }
    if (auto max_connections = lookup("MCP_MAX_CONNECTIONS"); max_connections.has_value()) {
        auto value = parse_unsigned("MCP_MAX_CONNECTIONS", *max_connections);
        if (value.has_value() == false) return tl::unexpected(value.error());
        config.max_connections = static_cast<std::size_t>(*value);
    }
    if (auto level = lookup("MCP_LOG_LEVEL"); level.has_value()) {
        auto parsed = level_from("MCP_LOG_LEVEL", *level);
        if (parsed.has_value() == false) return tl::unexpected(parsed.error());
        config.logging.level = *parsed;
    }
    if (auto file = lookup("MCP_LOG_FILE"); file.has_value()) {
        config.logging.file = *file;
    }
    if (auto size = lookup("MCP_MAX_MESSAGE_SIZE"); size.has_value()) {
        auto value = parse_unsigned("MCP_MAX_MESSAGE_SIZE", *size);
        if (value.has_value() == false) return tl::unexpected(value.error());
        config.max_message_size = static_cast<std::size_t>(*value);
    }
    if (auto timeout = lookup("MCP_REQUEST_TIMEOUT"); timeout.has_value()) {
        auto value = parse_unsigned("MCP_REQUEST_TIMEOUT", *timeout);
        if (value.has_value() == false) return tl::unexpected(value.error());
        auto duration = duration_ms("MCP_REQUEST_TIMEOUT", *value);
        if (duration.has_value() == false) return tl::unexpected(duration.error());
        config.request_timeout = *duration;
    }
    if (auto timeout = lookup("MCP_ASYNC_TIMEOUT"); timeout.has_value()) {
        auto value = parse_unsigned("MCP_ASYNC_TIMEOUT", *timeout);
        if (value.has_value() == false) return tl::unexpected(value.error());
        auto duration = duration_ms("MCP_ASYNC_TIMEOUT", *value);
        if (duration.has_value() == false) return tl::unexpected(duration.error());
        config.async_operation_timeout = *duration;
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON Documents
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<void> apply_json(ServerConfig& config, const Json& document) {
    if (document.is_object() == false) {
        return config_error("", "configuration document must be a JSON object");
    }

    if (document.contains("host")) {
        auto host = string_field(document, "host");
        if (host.has_value() == false) return tl::unexpected(host.error());
        config.host = *host;
    }

    struct NumericKey {
        const char* key;
        std::function<void(std::uint64_t)> assign;
    };
    const NumericKey numeric_keys[] = {
        {"port", [&](std::uint64_t v) { config.port = static_cast<std::uint32_t>(std::min<std::uint64_t>(v, 0xFFFFFFFFu)); }},
        {"maxConnections", [&](std::uint64_t v) { config.max_connections = static_cast<std::size_t>(v); }},
        {"maxMessageSize", [&](std::uint64_t v) { config.max_message_size = static_cast<std::size_t>(v); }},
        {"ioThreads", [&](std::uint64_t v) { config.io_threads = static_cast<std::size_t>(v); }},
    };
    for (const auto& entry : numeric_keys) {
        if (document.contains(entry.key) == false) {
            continue;
        }
        auto value = unsigned_field(document, entry.key);
        if (value.has_value() == false) return tl::unexpected(value.error());
        entry.assign(*value);
    }

    struct DurationKey {
        const char* key;
        std::chrono::milliseconds& target;
    };
    const DurationKey duration_keys[] = {
        {"requestTimeout", config.request_timeout},
        {"asyncOperationTimeout", config.async_operation_timeout},
        {"operationRetention", config.operation_retention},
    };
    for (const auto& entry : duration_keys) {
        if (document.contains(entry.key) == false) {
            continue;
        }
        auto value = unsigned_field(document, entry.key);
        if (value.has_value() == false) return tl::unexpected(value.error());
        auto duration = duration_ms(entry.key, *value);
        if (duration.has_value() == false) return tl::unexpected(duration.error());
        entry.target = *duration;
    }

    if (document.contains("logging")) {
        auto applied = apply_logging(config.logging, document.at("logging"));
        if (applied.has_value() == false) return applied;
    }
    if (document.contains("server")) {
        auto applied = apply_identity(config.identity, document.at("server"));
        if (applied.has_value() == false) return applied;
    }
    return {};
}

ConfigResult<void> apply_config_file(ServerConfig& config, const std::string& path) {
    std::ifstream input(path);
    if (input.is_open() == false) {
        return config_error(path, "cannot open configuration file");
    }

    Json document;
    try {
        document = Json::parse(input);
    } catch (const Json::parse_error& e) {
        return config_error(path, std::string("invalid JSON: ") + e.what());
    }
    return apply_json(config, document);
}

ConfigResult<void> validate(const ServerConfig& config) {
    if ((config.port == 0) || (config.port > std::numeric_limits<std::uint16_t>::max())) {
        // Port 0 is only meaningful for in-process tests, which skip validate().
        return config_error("port", "must be between 1 and 65535");
    }
    if (config.host.empty()) {
        return config_error("host", "must not be empty");
    }
    if (config.max_connections == 0) {
        return config_error("maxConnections", "must be at least 1");
    }
    if (config.max_message_size == 0) {
        return config_error("maxMessageSize", "must be at least 1");
    }
    if (config.request_timeout.count() < 0) {
        return config_error("requestTimeout", "must not be negative");
    }
    if (config.async_operation_timeout.count() <= 0) {
        return config_error("asyncOperationTimeout", "must be positive");
    }
    if (config.operation_retention.count() < 0) {
        return config_error("operationRetention", "must not be negative");
    }
    if (config.io_threads == 0) {
        return config_error("ioThreads", "must be at least 1");
    }
    return {};
}

}  // namespace umcp
