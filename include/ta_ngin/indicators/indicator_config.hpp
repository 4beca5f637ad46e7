// include/ta_ngin/indicators/indicator_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "ta_ngin/core/config_base.hpp"
#include "ta_ngin/core/error.hpp"
#include "ta_ngin/indicators/bollinger.hpp"
#include "ta_ngin/indicators/macd.hpp"
#include "ta_ngin/indicators/rsi.hpp"

namespace ta_ngin {

/**
 * @brief Periods and parameters of the chart indicator bundle
 */
struct IndicatorConfig : public ConfigBase {
    int rsi_period{indicators::DEFAULT_RSI_PERIOD};

    int macd_fast_period{indicators::DEFAULT_MACD_FAST_PERIOD};
    int macd_slow_period{indicators::DEFAULT_MACD_SLOW_PERIOD};
    int macd_signal_period{indicators::DEFAULT_MACD_SIGNAL_PERIOD};

    // EMA overlays
    int ema_short_period{20};
    int ema_medium_period{50};
    int ema_long_period{200};

    int bollinger_period{indicators::DEFAULT_BOLLINGER_PERIOD};
    double bollinger_std_dev{indicators::DEFAULT_BOLLINGER_STD_DEV};

    // Evaluate the independent indicators on worker threads
    bool parallel{false};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Check that every period is usable
     * @return INVALID_CONFIG naming the first offending field
     */
    Result<void> validate() const;
};

}  // namespace ta_ngin
