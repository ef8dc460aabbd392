// include/trade_guard/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace trade_guard {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Milliseconds since the Unix epoch
 */
inline int64_t to_unix_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

/**
 * @brief ISO-8601 UTC rendering with millisecond precision, e.g. 2024-05-01T12:00:00.250Z
 */
inline std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    std::tm result;
    safe_gmtime(&secs, &result);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &result);

    auto millis = to_unix_ms(tp) % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    char frac[8];
    std::snprintf(frac, sizeof(frac), ".%03lldZ", static_cast<long long>(millis));
    return std::string(buffer) + frac;
}

/**
 * @brief Current time as a string with specified strftime format
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace trade_guard
