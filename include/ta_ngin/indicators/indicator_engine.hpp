// include/ta_ngin/indicators/indicator_engine.hpp
#pragma once

#include <memory>
#include <vector>
#include "ta_ngin/core/error.hpp"
#include "ta_ngin/core/types.hpp"
#include "ta_ngin/indicators/indicator_config.hpp"

namespace ta_ngin {

/**
 * @brief Chart overlay indicators for one candle sequence
 *
 * Every series has exactly one slot per input candle, keyed by index.
 */
struct IndicatorBundle {
    IndicatorSeries rsi;
    IndicatorSeries macd;
    IndicatorSeries macd_signal;
    IndicatorSeries macd_histogram;
    IndicatorSeries ema_short;
    IndicatorSeries ema_medium;
    IndicatorSeries ema_long;
    IndicatorSeries bb_upper;
    IndicatorSeries bb_middle;
    IndicatorSeries bb_lower;

    /**
     * @brief Common length of the series (the candle count)
     */
    size_t size() const {
        return rsi.size();
    }

    bool operator==(const IndicatorBundle& other) const;
    bool operator!=(const IndicatorBundle& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Computes the indicator bundle for a candle sequence
 *
 * Stateless apart from its configuration; compute() is const and may be
 * called concurrently for different candle sets.
 */
class IndicatorEngine {
public:
    IndicatorEngine() = default;
    explicit IndicatorEngine(IndicatorConfig config);

    /**
     * @brief Build an engine after validating the configuration
     * @param config Indicator periods
     * @return Engine or INVALID_CONFIG error
     */
    static Result<std::unique_ptr<IndicatorEngine>> create(const IndicatorConfig& config);

    /**
     * @brief Project closes once and run every indicator over them
     * @param candles Candles ordered by open time ascending
     * @return Bundle whose series all have candles.size() slots
     */
    IndicatorBundle compute(const std::vector<Candle>& candles) const;

    const IndicatorConfig& config() const {
        return config_;
    }

private:
    IndicatorBundle compute_sequential(const std::vector<double>& closes) const;
    IndicatorBundle compute_parallel(const std::vector<double>& closes) const;

    IndicatorConfig config_;
};

/**
 * @brief RSI(14), MACD(12, 26, 9), EMA(20/50/200) and Bollinger(20, 2) for a
 *        candle sequence
 */
IndicatorBundle compute_indicators(const std::vector<Candle>& candles);

}  // namespace ta_ngin
