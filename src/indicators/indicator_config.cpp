// src/indicators/indicator_config.cpp

#include "ta_ngin/indicators/indicator_config.hpp"
#include <cmath>
#include <string>
#include <utility>

namespace ta_ngin {

nlohmann::json IndicatorConfig::to_json() const {
    nlohmann::json j;
    j["rsi_period"] = rsi_period;
    j["macd_fast_period"] = macd_fast_period;
    j["macd_slow_period"] = macd_slow_period;
    j["macd_signal_period"] = macd_signal_period;
    j["ema_short_period"] = ema_short_period;
    j["ema_medium_period"] = ema_medium_period;
    j["ema_long_period"] = ema_long_period;
    j["bollinger_period"] = bollinger_period;
    j["bollinger_std_dev"] = bollinger_std_dev;
    j["parallel"] = parallel;
    j["version"] = version;
    return j;
}

void IndicatorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("rsi_period"))
        rsi_period = j.at("rsi_period").get<int>();
    if (j.contains("macd_fast_period"))
        macd_fast_period = j.at("macd_fast_period").get<int>();
    if (j.contains("macd_slow_period"))
        macd_slow_period = j.at("macd_slow_period").get<int>();
    if (j.contains("macd_signal_period"))
        macd_signal_period = j.at("macd_signal_period").get<int>();
    if (j.contains("ema_short_period"))
        ema_short_period = j.at("ema_short_period").get<int>();
    if (j.contains("ema_medium_period"))
        ema_medium_period = j.at("ema_medium_period").get<int>();
    if (j.contains("ema_long_period"))
        ema_long_period = j.at("ema_long_period").get<int>();
    if (j.contains("bollinger_period"))
        bollinger_period = j.at("bollinger_period").get<int>();
    if (j.contains("bollinger_std_dev"))
        bollinger_std_dev = j.at("bollinger_std_dev").get<double>();
    if (j.contains("parallel"))
        parallel = j.at("parallel").get<bool>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> IndicatorConfig::validate() const {
    const std::pair<const char*, int> periods[] = {
        {"rsi_period", rsi_period},
        {"macd_fast_period", macd_fast_period},
        {"macd_slow_period", macd_slow_period},
        {"macd_signal_period", macd_signal_period},
        {"ema_short_period", ema_short_period},
        {"ema_medium_period", ema_medium_period},
        {"ema_long_period", ema_long_period},
        {"bollinger_period", bollinger_period},
    };
    for (const auto& [name, value] : periods) {
        if (value < 1) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    std::string(name) + " must be at least 1, got " +
                                        std::to_string(value),
                                    "IndicatorConfig");
        }
    }

    if (macd_fast_period >= macd_slow_period) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "macd_fast_period must be less than macd_slow_period",
                                "IndicatorConfig");
    }

    // Each EMA overlay is keyed by its period in the chart output
    if (ema_short_period == ema_medium_period || ema_short_period == ema_long_period ||
        ema_medium_period == ema_long_period) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "ema_short_period, ema_medium_period and ema_long_period must "
                                "be distinct",
                                "IndicatorConfig");
    }

    if (!std::isfinite(bollinger_std_dev) || bollinger_std_dev < 0.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "bollinger_std_dev must be a finite non-negative number",
                                "IndicatorConfig");
    }

    return Result<void>();
}

}  // namespace ta_ngin
