// include/ta_ngin/indicators/bollinger.hpp
#pragma once

#include <vector>
#include "ta_ngin/core/types.hpp"

namespace ta_ngin {
namespace indicators {

constexpr int DEFAULT_BOLLINGER_PERIOD = 20;
constexpr double DEFAULT_BOLLINGER_STD_DEV = 2.0;

/**
 * @brief Bollinger band series aligned with the closes
 */
struct BollingerResult {
    IndicatorSeries upper;
    IndicatorSeries middle;
    IndicatorSeries lower;
};

/**
 * @brief Bollinger bands over a trailing window
 *
 * middle is the window mean, the band half-width is std_dev_multiplier times
 * the population standard deviation of the window (divided by period, not
 * period - 1). Slots before period - 1 are absent in all three series.
 *
 * @param closes Closing prices
 * @param period Window length
 * @param std_dev_multiplier Band width in standard deviations
 */
BollingerResult compute_bollinger(const std::vector<double>& closes,
                                  int period = DEFAULT_BOLLINGER_PERIOD,
                                  double std_dev_multiplier = DEFAULT_BOLLINGER_STD_DEV);

}  // namespace indicators
}  // namespace ta_ngin
