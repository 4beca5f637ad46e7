// include/ta_ngin/indicators/macd.hpp
#pragma once

#include <vector>
#include "ta_ngin/core/types.hpp"

namespace ta_ngin {
namespace indicators {

constexpr int DEFAULT_MACD_FAST_PERIOD = 12;
constexpr int DEFAULT_MACD_SLOW_PERIOD = 26;
constexpr int DEFAULT_MACD_SIGNAL_PERIOD = 9;

/**
 * @brief MACD line, signal line and histogram, each aligned with the closes
 */
struct MacdResult {
    IndicatorSeries macd_line;
    IndicatorSeries signal_line;
    IndicatorSeries histogram;
};

/**
 * @brief Moving average convergence divergence
 *
 * macd_line[i] = ema_fast[i] - ema_slow[i] wherever both averages are present.
 * The signal line is an EMA over the present MACD samples only: they are
 * compacted into a dense sequence, smoothed, and scattered back to the indices
 * they came from, so the signal warm-up counts valid MACD samples rather than
 * candles.
 *
 * @param closes Closing prices
 * @param fast Fast EMA period
 * @param slow Slow EMA period
 * @param signal_period EMA period of the signal line
 */
MacdResult compute_macd(const std::vector<double>& closes,
                        int fast = DEFAULT_MACD_FAST_PERIOD,
                        int slow = DEFAULT_MACD_SLOW_PERIOD,
                        int signal_period = DEFAULT_MACD_SIGNAL_PERIOD);

}  // namespace indicators
}  // namespace ta_ngin
