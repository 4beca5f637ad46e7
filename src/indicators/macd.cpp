// src/indicators/macd.cpp

#include "ta_ngin/indicators/macd.hpp"
#include "ta_ngin/indicators/ema.hpp"
#include "ta_ngin/indicators/series.hpp"

namespace ta_ngin {
namespace indicators {

MacdResult compute_macd(const std::vector<double>& closes, int fast, int slow,
                        int signal_period) {
    const size_t n = closes.size();
    const IndicatorSeries ema_fast = compute_ema(closes, fast);
    const IndicatorSeries ema_slow = compute_ema(closes, slow);

    MacdResult result;
    result.macd_line = make_absent_series(n);
    for (size_t i = 0; i < n; ++i) {
        if (ema_fast[i].has_value() && ema_slow[i].has_value()) {
            result.macd_line[i] = *ema_fast[i] - *ema_slow[i];
        }
    }

    // Pass 1: smooth the dense run of valid MACD samples
    const SparseSeries dense_macd = compact(result.macd_line);
    const IndicatorSeries dense_signal = compute_ema(dense_macd.values, signal_period);

    // Pass 2: put each smoothed sample back at the candle index it came from
    result.signal_line = scatter(dense_signal, dense_macd, n);

    result.histogram = make_absent_series(n);
    for (size_t i = 0; i < n; ++i) {
        if (result.macd_line[i].has_value() && result.signal_line[i].has_value()) {
            result.histogram[i] = *result.macd_line[i] - *result.signal_line[i];
        }
    }

    return result;
}

}  // namespace indicators
}  // namespace ta_ngin
