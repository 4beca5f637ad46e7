// src/indicators/ema.cpp

#include "ta_ngin/indicators/ema.hpp"
#include "ta_ngin/indicators/series.hpp"

namespace ta_ngin {
namespace indicators {

double ema_smoothing_factor(int period) {
    return 2.0 / (static_cast<double>(period) + 1.0);
}

IndicatorSeries compute_ema(const std::vector<double>& values, int period) {
    IndicatorSeries result = make_absent_series(values.size());
    if (period < 1 || values.size() < static_cast<size_t>(period)) {
        return result;
    }

    const size_t seed_index = static_cast<size_t>(period) - 1;

    // Seed with the simple mean of the first window
    double sum = 0.0;
    for (size_t i = 0; i <= seed_index; ++i) {
        sum += values[i];
    }
    double ema = sum / period;
    result[seed_index] = ema;

    const double k = ema_smoothing_factor(period);
    for (size_t i = seed_index + 1; i < values.size(); ++i) {
        ema = values[i] * k + ema * (1.0 - k);
        result[i] = ema;
    }

    return result;
}

}  // namespace indicators
}  // namespace ta_ngin
