#pragma once

#include <chrono>
#include <functional>
#include <exception>
#include <string>
#include <string_view>

namespace umcp {

/// prefix followed by 16 lowercase hex digits drawn from a 64-bit random value.
[[nodiscard]] std::string make_random_id(std::string_view prefix);

/// UTC ISO-8601 with milliseconds, e.g. 2024-05-01T12:00:00.123Z
[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point tp);

/// Completion handler for co_spawn that logs an escaped exception instead of
/// dropping it silently the way asio::detached does.
[[nodiscard]] std::function<void(std::exception_ptr)> log_coroutine_failure(std::string what);

}  // namespace umcp
