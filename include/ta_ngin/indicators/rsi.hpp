// include/ta_ngin/indicators/rsi.hpp
#pragma once

#include <vector>
#include "ta_ngin/core/types.hpp"

namespace ta_ngin {
namespace indicators {

constexpr int DEFAULT_RSI_PERIOD = 14;

/**
 * @brief Relative strength index with Wilder smoothing
 *
 * The first present value is at index period. Whenever the average loss is
 * zero the RSI is exactly 100, including an all-gains warm-up window.
 *
 * @param closes Closing prices
 * @param period Lookback period
 * @return Series of closes.size() slots with present values in [0, 100],
 *         entirely absent when closes.size() < period + 1 or period < 1
 */
IndicatorSeries compute_rsi(const std::vector<double>& closes, int period = DEFAULT_RSI_PERIOD);

}  // namespace indicators
}  // namespace ta_ngin
