// src/indicators/rsi.cpp

#include "ta_ngin/indicators/rsi.hpp"
#include <cmath>
#include "ta_ngin/indicators/series.hpp"

namespace ta_ngin {
namespace indicators {

namespace {

double rsi_from_averages(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) {
        return 100.0;
    }
    const double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

}  // namespace

IndicatorSeries compute_rsi(const std::vector<double>& closes, int period) {
    IndicatorSeries result = make_absent_series(closes.size());
    if (period < 1 || closes.size() < static_cast<size_t>(period) + 1) {
        return result;
    }

    const size_t p = static_cast<size_t>(period);

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (size_t i = 1; i <= p; ++i) {
        const double change = closes[i] - closes[i - 1];
        if (change > 0) {
            avg_gain += change;
        } else {
            avg_loss += std::abs(change);
        }
    }
    avg_gain /= period;
    avg_loss /= period;
    result[p] = rsi_from_averages(avg_gain, avg_loss);

    for (size_t i = p + 1; i < closes.size(); ++i) {
        const double change = closes[i] - closes[i - 1];
        const double gain = change > 0 ? change : 0.0;
        const double loss = change < 0 ? std::abs(change) : 0.0;

        avg_gain = (avg_gain * (period - 1) + gain) / period;
        avg_loss = (avg_loss * (period - 1) + loss) / period;
        result[i] = rsi_from_averages(avg_gain, avg_loss);
    }

    return result;
}

}  // namespace indicators
}  // namespace ta_ngin
