// include/ta_ngin/indicators/ema.hpp
#pragma once

#include <vector>
#include "ta_ngin/core/types.hpp"

namespace ta_ngin {
namespace indicators {

/**
 * @brief Exponential moving average
 *
 * The first present slot is at period - 1 and holds the simple mean of the
 * first period values. Every later slot is values[i] * k + ema[i - 1] * (1 - k)
 * with k = 2 / (period + 1).
 *
 * @param values Input sequence
 * @param period Smoothing period
 * @return Series of values.size() slots, entirely absent when
 *         values.size() < period or period < 1
 */
IndicatorSeries compute_ema(const std::vector<double>& values, int period);

/**
 * @brief Smoothing constant 2 / (period + 1)
 */
double ema_smoothing_factor(int period);

}  // namespace indicators
}  // namespace ta_ngin
