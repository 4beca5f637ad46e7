// src/indicators/series.cpp

#include "ta_ngin/indicators/series.hpp"
#include <algorithm>

namespace ta_ngin {
namespace indicators {

IndicatorSeries make_absent_series(std::size_t length) {
    return IndicatorSeries(length, std::nullopt);
}

std::vector<double> project_closes(const std::vector<Candle>& candles) {
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& candle : candles) {
        closes.push_back(candle.close);
    }
    return closes;
}

SparseSeries compact(const IndicatorSeries& series) {
    SparseSeries sparse;
    for (std::size_t i = 0; i < series.size(); ++i) {
        if (series[i].has_value()) {
            sparse.values.push_back(*series[i]);
            sparse.indices.push_back(i);
        }
    }
    return sparse;
}

IndicatorSeries scatter(const IndicatorSeries& dense, const SparseSeries& map,
                        std::size_t length) {
    IndicatorSeries result = make_absent_series(length);
    const std::size_t n = std::min(dense.size(), map.indices.size());
    for (std::size_t j = 0; j < n; ++j) {
        const std::size_t target = map.indices[j];
        if (target < length && dense[j].has_value()) {
            result[target] = dense[j];
        }
    }
    return result;
}

std::size_t count_present(const IndicatorSeries& series) {
    return static_cast<std::size_t>(std::count_if(
        series.begin(), series.end(), [](const IndicatorValue& v) { return v.has_value(); }));
}

}  // namespace indicators
}  // namespace ta_ngin
