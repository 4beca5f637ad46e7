// include/ta_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ta_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 * Used for all price-related calculations
 */
using Price = double;

/**
 * @brief One OHLCV sample for a fixed time bucket
 *
 * A candle sequence is ordered by open_time ascending. Only close is consumed
 * by the indicator algorithms.
 */
struct Candle {
    Timestamp open_time;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};

    Candle() = default;
    Candle(Timestamp ts, Price o, Price h, Price l, Price c, double v)
        : open_time(ts), open(o), high(h), low(l), close(c), volume(v) {}
};

/**
 * @brief One indicator output slot; std::nullopt marks the warm-up period
 */
using IndicatorValue = std::optional<double>;

/**
 * @brief Indicator output aligned 1:1 with the input sequence by index
 */
using IndicatorSeries = std::vector<IndicatorValue>;

/**
 * @brief Convert a timestamp to Unix milliseconds
 */
inline std::int64_t to_unix_millis(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/**
 * @brief Convert Unix milliseconds to a timestamp
 */
inline Timestamp from_unix_millis(std::int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

}  // namespace ta_ngin
