#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>

namespace ta_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
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
 * @brief Format the current local time with a strftime pattern
 */
inline std::string format_now(const char* format) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm time_info{};
    if (safe_localtime(&now_c, &time_info) == nullptr) {
        return "";
    }

    char buffer[64];
    std::strftime(buffer, sizeof(buffer), format, &time_info);
    return std::string(buffer);
}

}  // namespace core
}  // namespace ta_ngin
