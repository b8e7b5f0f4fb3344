#pragma once

#include "umcp/protocol/json_rpc.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace umcp {

// ─────────────────────────────────────────────────────────────────────────────
// Connection State
// ─────────────────────────────────────────────────────────────────────────────

/// Lifecycle of one client connection.
///
///   ┌────────────┐  accepted   ┌──────────┐  peer close / disconnect   ┌──────────┐
///   │ Connecting │────────────▶│  Active  │───────────────────────────▶│ Closing  │
///   └────────────┘             └──────────┘  oversized buffer          └────┬─────┘
///                                                                           │ operations
///                                                                           │ cancelled,
///                                                          ┌──────────┐     │ context
///                                                          │  Closed  │◀────┘ removed
///                                                          └──────────┘
///
enum class ConnectionState {
    Connecting,
    Active,
    Closing,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Active:     return "Active";
        case ConnectionState::Closing:    return "Closing";
        case ConnectionState::Closed:     return "Closed";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection Context
// ─────────────────────────────────────────────────────────────────────────────

/// Per-connection state handed to every handler. Owned by the connection
/// manager; handlers may mutate it (initialize does).
struct ConnectionContext {
    std::string connection_id;
    std::chrono::system_clock::time_point connected_at{std::chrono::system_clock::now()};

    /// Set by the initialize handshake. Every other method is refused until then.
    bool initialized{false};
    std::optional<std::chrono::system_clock::time_point> initialized_at;

    Json client_capabilities = Json::object();
    std::string client_name{"unknown"};
    std::string client_version{"unknown"};

    /// Envelopes that passed validation, whatever their outcome.
    std::uint64_t request_count{0};

    /// Delimited segments discarded because they were not JSON.
    std::uint64_t dropped_segments{0};

    /// Unterminated tail of the inbound stream.
    std::string buffer;
};

}  // namespace umcp
