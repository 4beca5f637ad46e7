// src/indicators/indicator_engine.cpp

#include "ta_ngin/indicators/indicator_engine.hpp"
#include <future>
#include <utility>
#include "ta_ngin/core/logger.hpp"
#include "ta_ngin/indicators/bollinger.hpp"
#include "ta_ngin/indicators/ema.hpp"
#include "ta_ngin/indicators/macd.hpp"
#include "ta_ngin/indicators/rsi.hpp"
#include "ta_ngin/indicators/series.hpp"

namespace ta_ngin {

bool IndicatorBundle::operator==(const IndicatorBundle& other) const {
    return rsi == other.rsi && macd == other.macd && macd_signal == other.macd_signal &&
           macd_histogram == other.macd_histogram && ema_short == other.ema_short &&
           ema_medium == other.ema_medium && ema_long == other.ema_long &&
           bb_upper == other.bb_upper && bb_middle == other.bb_middle &&
           bb_lower == other.bb_lower;
}

IndicatorEngine::IndicatorEngine(IndicatorConfig config) : config_(std::move(config)) {}

Result<std::unique_ptr<IndicatorEngine>> IndicatorEngine::create(const IndicatorConfig& config) {
    auto valid = config.validate();
    if (valid.is_error()) {
        return make_error<std::unique_ptr<IndicatorEngine>>(
            valid.error()->code(), valid.error()->what(), "IndicatorEngine");
    }
    return std::make_unique<IndicatorEngine>(config);
}

IndicatorBundle IndicatorEngine::compute(const std::vector<Candle>& candles) const {
    const std::vector<double> closes = indicators::project_closes(candles);

    DEBUG("Computing indicators over " << closes.size() << " candles"
                                       << (config_.parallel ? " (parallel)" : ""));

    IndicatorBundle bundle =
        config_.parallel ? compute_parallel(closes) : compute_sequential(closes);

    TRACE("RSI present=" << indicators::count_present(bundle.rsi)
                         << " MACD signal present="
                         << indicators::count_present(bundle.macd_signal)
                         << " EMA(" << config_.ema_long_period
                         << ") present=" << indicators::count_present(bundle.ema_long));
    return bundle;
}

IndicatorBundle IndicatorEngine::compute_sequential(const std::vector<double>& closes) const {
    IndicatorBundle bundle;
    bundle.rsi = indicators::compute_rsi(closes, config_.rsi_period);

    auto macd = indicators::compute_macd(closes, config_.macd_fast_period,
                                         config_.macd_slow_period, config_.macd_signal_period);
    bundle.macd = std::move(macd.macd_line);
    bundle.macd_signal = std::move(macd.signal_line);
    bundle.macd_histogram = std::move(macd.histogram);

    bundle.ema_short = indicators::compute_ema(closes, config_.ema_short_period);
    bundle.ema_medium = indicators::compute_ema(closes, config_.ema_medium_period);
    bundle.ema_long = indicators::compute_ema(closes, config_.ema_long_period);

    auto bands =
        indicators::compute_bollinger(closes, config_.bollinger_period, config_.bollinger_std_dev);
    bundle.bb_upper = std::move(bands.upper);
    bundle.bb_middle = std::move(bands.middle);
    bundle.bb_lower = std::move(bands.lower);
    return bundle;
}

IndicatorBundle IndicatorEngine::compute_parallel(const std::vector<double>& closes) const {
    const IndicatorConfig& cfg = config_;

    auto rsi_future = std::async(std::launch::async, [&closes, &cfg]() {
        return indicators::compute_rsi(closes, cfg.rsi_period);
    });
    auto macd_future = std::async(std::launch::async, [&closes, &cfg]() {
        return indicators::compute_macd(closes, cfg.macd_fast_period, cfg.macd_slow_period,
                                        cfg.macd_signal_period);
    });
    auto ema_short_future = std::async(std::launch::async, [&closes, &cfg]() {
        return indicators::compute_ema(closes, cfg.ema_short_period);
    });
    auto ema_medium_future = std::async(std::launch::async, [&closes, &cfg]() {
        return indicators::compute_ema(closes, cfg.ema_medium_period);
    });
    auto ema_long_future = std::async(std::launch::async, [&closes, &cfg]() {
        return indicators::compute_ema(closes, cfg.ema_long_period);
    });
    auto bands_future = std::async(std::launch::async, [&closes, &cfg]() {
        return indicators::compute_bollinger(closes, cfg.bollinger_period, cfg.bollinger_std_dev);
    });

    IndicatorBundle bundle;
    bundle.rsi = rsi_future.get();

    auto macd = macd_future.get();
    bundle.macd = std::move(macd.macd_line);
    bundle.macd_signal = std::move(macd.signal_line);
    bundle.macd_histogram = std::move(macd.histogram);

    bundle.ema_short = ema_short_future.get();
    bundle.ema_medium = ema_medium_future.get();
    bundle.ema_long = ema_long_future.get();

    auto bands = bands_future.get();
    bundle.bb_upper = std::move(bands.upper);
    bundle.bb_middle = std::move(bands.middle);
    bundle.bb_lower = std::move(bands.lower);
    return bundle;
}

IndicatorBundle compute_indicators(const std::vector<Candle>& candles) {
    return IndicatorEngine().compute(candles);
}

}  // namespace ta_ngin
