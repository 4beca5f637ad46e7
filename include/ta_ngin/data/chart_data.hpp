// include/ta_ngin/data/chart_data.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "ta_ngin/core/error.hpp"
#include "ta_ngin/core/types.hpp"
#include "ta_ngin/indicators/indicator_engine.hpp"

namespace ta_ngin {

constexpr int DEFAULT_CHART_LIMIT = 200;
constexpr int MIN_CHART_LIMIT = 50;
constexpr int MAX_CHART_LIMIT = 1000;

/**
 * @brief Validated request for one symbol's chart
 */
struct ChartRequest {
    std::string symbol;     // upper case, 2-20 alphanumerics
    std::string timeframe;  // 15m, 30m, 1h, 4h, 1d or 1w
    int limit{DEFAULT_CHART_LIMIT};
};

/**
 * @brief Candles plus their indicator bundle, as handed to the chart
 */
struct ChartData {
    std::string symbol;
    std::string timeframe;
    std::vector<Candle> candles;
    IndicatorBundle indicators;
};

/**
 * @brief Check whether a timeframe is one the chart supports
 */
bool is_supported_timeframe(const std::string& timeframe);

/**
 * @brief Validate and normalize chart request parameters
 *
 * The symbol is upper-cased before matching. A missing, zero or non-numeric
 * limit falls back to 200; the limit is then clamped to [50, 1000].
 *
 * @return ChartRequest or INVALID_REQUEST error
 */
Result<ChartRequest> validate_chart_request(const std::string& symbol,
                                            const std::string& timeframe,
                                            const std::optional<std::string>& limit_param);

/**
 * @brief Parse exchange klines into candles
 *
 * Each row is [openTime(ms), open, high, low, close, volume, ...] where the
 * price and volume fields may be strings or numbers. Extra fields are ignored.
 *
 * @return Candles in row order, or INVALID_DATA naming the first bad row
 */
Result<std::vector<Candle>> parse_klines(const nlohmann::json& rows);

/**
 * @brief The most recent limit candles, or all of them when there are fewer
 */
std::vector<Candle> take_last(const std::vector<Candle>& candles, size_t limit);

/**
 * @brief Compute the indicator bundle for a request's candles
 */
ChartData build_chart_data(const ChartRequest& request, std::vector<Candle> candles,
                           const IndicatorEngine& engine);

/**
 * @brief Serialize an indicator series, absent slots as null
 */
nlohmann::json series_to_json(const IndicatorSeries& series);

nlohmann::json candle_to_json(const Candle& candle);

/**
 * @brief Serialize the bundle with the chart's key names
 *
 * EMA keys carry their period (ema20, ema50, ema200 with the default config).
 */
nlohmann::json indicators_to_json(const IndicatorBundle& bundle, const IndicatorConfig& config);

nlohmann::json chart_data_to_json(const ChartData& data, const IndicatorConfig& config);

}  // namespace ta_ngin
