#ifndef UMCP_CONFIG_SERVER_CONFIG_HPP
#define UMCP_CONFIG_SERVER_CONFIG_HPP

#include "umcp/log/logger.hpp"
#include "umcp/protocol/json_rpc.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace umcp {

// ─────────────────────────────────────────────────────────────────────────────
// Logging Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct LoggingConfig {
    LogLevel level{LogLevel::Info};

    // Rotating log file. Empty = console only.
    std::string file;

    std::size_t max_file_size{10 * 1024 * 1024};
    std::size_t max_files{5};
};

// ─────────────────────────────────────────────────────────────────────────────
// Server Identity
// ─────────────────────────────────────────────────────────────────────────────
// What the initialize handshake reports back to the client.

struct ServerIdentity {
    std::string name{"PHP Universal MCP Server"};
    std::string version{"1.0.0"};

    std::vector<std::string> supported_providers{"hostinger", "woocommerce", "shopify"};

    Json supported_features = {
        {"siteManagement", true},
        {"ecommerce", true},
        {"hosting", true},
        {"design", true},
        {"asyncOperations", true}
    };

    // Merged into the capabilities object last, so it may override the above.
    Json extra_capabilities = Json::object();

    [[nodiscard]] Json capabilities() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Server Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct ServerConfig {
    std::string host{"127.0.0.1"};

    // 0 binds an ephemeral port (tests).
    std::uint32_t port{7654};

    std::size_t max_connections{10};

    // Largest unterminated message a connection may buffer before it is closed.
    std::size_t max_message_size{1024 * 1024};

    // Handler deadline per request. 0 disables it.
    std::chrono::milliseconds request_timeout{30000};

    std::chrono::milliseconds async_operation_timeout{std::chrono::minutes(5)};

    // Terminal async operations stay queryable this long.
    std::chrono::milliseconds operation_retention{std::chrono::seconds(60)};

    // Threads running the io_context. All session state stays on one strand.
    std::size_t io_threads{1};

    LoggingConfig logging;
    ServerIdentity identity;
};

// ─────────────────────────────────────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────────────────────────────────────

struct ConfigError {
    std::string key;
    std::string message;

    [[nodiscard]] std::string describe() const {
        return key.empty() ? message : key + ": " + message;
    }
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

/// Environment lookup; returns nullopt for unset variables.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Reads the real process environment.
[[nodiscard]] EnvLookup system_environment();

/// Overlay MCP_PORT, MCP_HOST, MCP_MAX_CONNECTIONS, MCP_LOG_LEVEL,
/// MCP_LOG_FILE, MCP_MAX_MESSAGE_SIZE, MCP_REQUEST_TIMEOUT and
/// MCP_ASYNC_TIMEOUT onto config.
[[nodiscard]] ConfigResult<void> apply_environment(ServerConfig& config, const EnvLookup& lookup);

/// Overlay a camelCase JSON document onto config. Unknown keys are ignored.
[[nodiscard]] ConfigResult<void> apply_json(ServerConfig& config, const Json& document);

/// Read and overlay a JSON config file.
[[nodiscard]] ConfigResult<void> apply_config_file(ServerConfig& config, const std::string& path);

[[nodiscard]] ConfigResult<void> validate(const ServerConfig& config);

}  // namespace umcp

#endif  // UMCP_CONFIG_SERVER_CONFIG_HPP
