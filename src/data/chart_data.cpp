// src/data/chart_data.cpp

#include "ta_ngin/data/chart_data.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <utility>

namespace ta_ngin {

namespace {

const char* const SUPPORTED_TIMEFRAMES[] = {"15m", "30m", "1h", "4h", "1d", "1w"};

std::string trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
                                 [](unsigned char c) { return std::isspace(c); })
                    .base();
    return first < last ? std::string(first, last) : std::string();
}

bool is_infinity_literal(const std::string& text) {
    return text == "Infinity" || text == "+Infinity" || text == "-Infinity";
}

// NaN when the text is not a number in full. strtod's inf/nan spellings are
// not numbers here; only the Infinity literals are.
double parse_limit(const std::optional<std::string>& limit_param) {
    if (!limit_param) {
        return 0.0;
    }
    const std::string text = trim(*limit_param);
    if (text.empty()) {
        return 0.0;
    }
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nan("");
    }
    if (!std::isfinite(value) && !is_infinity_literal(text)) {
        return std::nan("");
    }
    return value;
}

// Finite and inside the range a Timestamp can hold
bool is_valid_open_time(double millis) {
    const double max_ms = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Timestamp::duration::max())
            .count());
    const double min_ms = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Timestamp::duration::min())
            .count());
    return std::isfinite(millis) && millis > min_ms && millis < max_ms;
}

Result<double> parse_number_field(const nlohmann::json& field, size_t row, size_t column) {
    if (field.is_number()) {
        return field.get<double>();
    }
    if (field.is_string()) {
        const std::string& text = field.get_ref<const std::string&>();
        char* end = nullptr;
        const double value = std::strtod(text.c_str(), &end);
        if (end != text.c_str()) {
            return value;
        }
    }
    return make_error<double>(ErrorCode::INVALID_DATA,
                              "Kline row " + std::to_string(row) + " field " +
                                  std::to_string(column) + " is not numeric: " + field.dump(),
                              "ChartData");
}

}  // namespace

bool is_supported_timeframe(const std::string& timeframe) {
    return std::any_of(std::begin(SUPPORTED_TIMEFRAMES), std::end(SUPPORTED_TIMEFRAMES),
                       [&timeframe](const char* tf) { return timeframe == tf; });
}

Result<ChartRequest> validate_chart_request(const std::string& symbol,
                                            const std::string& timeframe,
                                            const std::optional<std::string>& limit_param) {
    static const std::regex symbol_pattern("^[A-Z0-9]{2,20}$");

    ChartRequest request;
    request.symbol = symbol;
    std::transform(request.symbol.begin(), request.symbol.end(), request.symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (!std::regex_match(request.symbol, symbol_pattern)) {
        return make_error<ChartRequest>(ErrorCode::INVALID_REQUEST, "Invalid symbol format",
                                        "ChartData");
    }

    if (!is_supported_timeframe(timeframe)) {
        return make_error<ChartRequest>(ErrorCode::INVALID_REQUEST, "Invalid timeframe",
                                        "ChartData");
    }
    request.timeframe = timeframe;

    double limit = parse_limit(limit_param);
    if (std::isnan(limit) || limit == 0.0) {
        limit = DEFAULT_CHART_LIMIT;
    }
    limit = std::min(std::max(limit, static_cast<double>(MIN_CHART_LIMIT)),
                     static_cast<double>(MAX_CHART_LIMIT));
    request.limit = static_cast<int>(limit);

    return request;
}

Result<std::vector<Candle>> parse_klines(const nlohmann::json& rows) {
    if (!rows.is_array()) {
        return make_error<std::vector<Candle>>(ErrorCode::INVALID_DATA,
                                               "Klines payload must be an array", "ChartData");
    }

    std::vector<Candle> candles;
    candles.reserve(rows.size());

    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        if (!row.is_array() || row.size() < 6) {
            return make_error<std::vector<Candle>>(
                ErrorCode::INVALID_DATA,
                "Kline row " + std::to_string(i) + " must be an array of at least 6 fields",
                "ChartData");
        }

        double fields[6];
        for (size_t column = 0; column < 6; ++column) {
            auto parsed = parse_number_field(row[column], i, column);
            if (parsed.is_error()) {
                return make_error<std::vector<Candle>>(parsed.error()->code(),
                                                       parsed.error()->what(), "ChartData");
            }
            fields[column] = parsed.value();
        }

        if (!is_valid_open_time(fields[0])) {
            return make_error<std::vector<Candle>>(
                ErrorCode::INVALID_DATA,
                "Kline row " + std::to_string(i) + " open time is out of range: " +
                    row[0].dump(),
                "ChartData");
        }

        candles.emplace_back(from_unix_millis(static_cast<std::int64_t>(fields[0])), fields[1],
                             fields[2], fields[3], fields[4], fields[5]);
    }

    return candles;
}

std::vector<Candle> take_last(const std::vector<Candle>& candles, size_t limit) {
    if (candles.size() <= limit) {
        return candles;
    }
    return std::vector<Candle>(candles.end() - static_cast<std::ptrdiff_t>(limit), candles.end());
}

ChartData build_chart_data(const ChartRequest& request, std::vector<Candle> candles,
                           const IndicatorEngine& engine) {
    ChartData data;
    data.symbol = request.symbol;
    data.timeframe = request.timeframe;
    data.indicators = engine.compute(candles);
    data.candles = std::move(candles);
    return data;
}

nlohmann::json series_to_json(const IndicatorSeries& series) {
    nlohmann::json values = nlohmann::json::array();
    for (const auto& value : series) {
        if (value.has_value()) {
            values.push_back(*value);
        } else {
            values.push_back(nullptr);
        }
    }
    return values;
}

nlohmann::json candle_to_json(const Candle& candle) {
    return nlohmann::json{{"openTime", to_unix_millis(candle.open_time)},
                          {"open", candle.open},
                          {"high", candle.high},
                          {"low", candle.low},
                          {"close", candle.close},
                          {"volume", candle.volume}};
}

nlohmann::json indicators_to_json(const IndicatorBundle& bundle, const IndicatorConfig& config) {
    nlohmann::json j;
    j["rsi"] = series_to_json(bundle.rsi);
    j["macd"] = series_to_json(bundle.macd);
    j["macdSignal"] = series_to_json(bundle.macd_signal);
    j["macdHistogram"] = series_to_json(bundle.macd_histogram);
    j["ema" + std::to_string(config.ema_short_period)] = series_to_json(bundle.ema_short);
    j["ema" + std::to_string(config.ema_medium_period)] = series_to_json(bundle.ema_medium);
    j["ema" + std::to_string(config.ema_long_period)] = series_to_json(bundle.ema_long);
    j["bbUpper"] = series_to_json(bundle.bb_upper);
    j["bbMiddle"] = series_to_json(bundle.bb_middle);
    j["bbLower"] = series_to_json(bundle.bb_lower);
    return j;
}

nlohmann::json chart_data_to_json(const ChartData& data, const IndicatorConfig& config) {
    nlohmann::json candles = nlohmann::json::array();
    for (const auto& candle : data.candles) {
        candles.push_back(candle_to_json(candle));
    }

    nlohmann::json j;
    j["symbol"] = data.symbol;
    j["timeframe"] = data.timeframe;
    j["candles"] = std::move(candles);
    j["indicators"] = indicators_to_json(data.indicators, config);
    return j;
}

}  // namespace ta_ngin
