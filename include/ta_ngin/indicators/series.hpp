// include/ta_ngin/indicators/series.hpp
#pragma once

#include <cstddef>
#include <vector>
#include "ta_ngin/core/types.hpp"

namespace ta_ngin {
namespace indicators {

/**
 * @brief Dense projection of a partially absent series
 *
 * values[j] was taken from position indices[j] of the original series.
 * indices is strictly increasing.
 */
struct SparseSeries {
    std::vector<double> values;
    std::vector<std::size_t> indices;
};

/**
 * @brief Series of the given length with every slot absent
 */
IndicatorSeries make_absent_series(std::size_t length);

/**
 * @brief Project the close of each candle, preserving order and length
 */
std::vector<double> project_closes(const std::vector<Candle>& candles);

/**
 * @brief Collect the present values of a series together with their positions
 */
SparseSeries compact(const IndicatorSeries& series);

/**
 * @brief Map a dense result back onto a series of the original length
 *
 * dense[j] lands at position map.indices[j]. Absent dense slots stay absent and
 * every position not named in the index map is absent.
 *
 * @param dense Series aligned with map.values
 * @param map Index map produced by compact()
 * @param length Length of the original series
 */
IndicatorSeries scatter(const IndicatorSeries& dense, const SparseSeries& map,
                        std::size_t length);

/**
 * @brief Number of present slots
 */
std::size_t count_present(const IndicatorSeries& series);

}  // namespace indicators
}  // namespace ta_ngin
