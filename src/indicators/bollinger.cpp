// src/indicators/bollinger.cpp

#include "ta_ngin/indicators/bollinger.hpp"
#include <Eigen/Dense>
#include <cmath>
#include "ta_ngin/indicators/series.hpp"

namespace ta_ngin {
namespace indicators {

BollingerResult compute_bollinger(const std::vector<double>& closes, int period,
                                  double std_dev_multiplier) {
    const size_t n = closes.size();
    BollingerResult result{make_absent_series(n), make_absent_series(n), make_absent_series(n)};
    if (period < 1 || n < static_cast<size_t>(period)) {
        return result;
    }

    const size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < n; ++i) {
        Eigen::Map<const Eigen::VectorXd> window(closes.data() + (i + 1 - p),
                                                 static_cast<Eigen::Index>(p));

        const double sma = window.mean();
        const double variance = (window.array() - sma).square().sum() / period;
        const double std_dev = std::sqrt(variance);

        result.middle[i] = sma;
        result.upper[i] = sma + std_dev_multiplier * std_dev;
        result.lower[i] = sma - std_dev_multiplier * std_dev;
    }

    return result;
}

}  // namespace indicators
}  // namespace ta_ngin
