#include "umcp/server/server_utils.hpp"

#include "umcp/log/logger.hpp"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace umcp {

std::string make_random_id(std::string_view prefix) {
    thread_local std::mt19937_64 engine{std::random_device{}()};

    std::ostringstream oss;
    oss << prefix << std::hex << std::setfill('0') << std::setw(16) << engine();
    return oss.str();
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::function<void(std::exception_ptr)> log_coroutine_failure(std::string what) {
    return [what = std::move(what)](std::exception_ptr failure) {
        if (failure == nullptr) {
            return;
        }
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            UMCP_LOG_ERROR("{} terminated with exception: {}", what, e.what());
        } catch (...) {
            UMCP_LOG_ERROR("{} terminated with a non-standard exception", what);
        }
    };
}

}  // namespace umcp
