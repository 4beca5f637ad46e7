#include <gtest/gtest.h>
#include <cmath>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "ta_ngin/data/chart_data.hpp"
#include "indicators/test_utils.hpp"

using namespace ta_ngin;
using ta_ngin::testing::make_candles;
using ta_ngin::testing::make_zigzag_closes;

class ChartRequestTest : public ::testing::Test {
protected:
    int limit_for(const std::optional<std::string>& limit) {
        auto result = validate_chart_request("BTCUSDT", "1h", limit);
        EXPECT_TRUE(result.is_ok());
        return result.is_ok() ? result.value().limit : -1;
    }
};

TEST_F(ChartRequestTest, NormalizesSymbolToUpperCase) {
    auto result = validate_chart_request("ethusdt", "4h", std::nullopt);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().symbol, "ETHUSDT");
    EXPECT_EQ(result.value().timeframe, "4h");
    EXPECT_EQ(result.value().limit, DEFAULT_CHART_LIMIT);
}

TEST_F(ChartRequestTest, RejectsMalformedSymbols) {
    for (const std::string symbol : {"B", "BTC-USDT", "", "ABCDEFGHIJKLMNOPQRSTU", "BTC USDT"}) {
        auto result = validate_chart_request(symbol, "1h", std::nullopt);
        ASSERT_TRUE(result.is_error()) << symbol;
        EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_REQUEST);
        EXPECT_STREQ(result.error()->what(), "Invalid symbol format");
    }
    EXPECT_TRUE(validate_chart_request("ABCDEFGHIJKLMNOPQRST", "1h", std::nullopt).is_ok());
}

TEST_F(ChartRequestTest, AcceptsOnlySupportedTimeframes) {
    for (const std::string tf : {"15m", "30m", "1h", "4h", "1d", "1w"}) {
        EXPECT_TRUE(is_supported_timeframe(tf)) << tf;
        EXPECT_TRUE(validate_chart_request("BTCUSDT", tf, std::nullopt).is_ok()) << tf;
    }

    for (const std::string tf : {"1m", "5m", "2h", "1H", "1M", ""}) {
        auto result = validate_chart_request("BTCUSDT", tf, std::nullopt);
        ASSERT_TRUE(result.is_error()) << tf;
        EXPECT_STREQ(result.error()->what(), "Invalid timeframe");
    }
}

TEST_F(ChartRequestTest, LimitDefaultsAndClamps) {
    EXPECT_EQ(limit_for(std::nullopt), 200);
    EXPECT_EQ(limit_for(std::string("")), 200);
    EXPECT_EQ(limit_for(std::string("abc")), 200);
    EXPECT_EQ(limit_for(std::string("12abc")), 200);
    EXPECT_EQ(limit_for(std::string("0")), 200);
    EXPECT_EQ(limit_for(std::string("300")), 300);
    EXPECT_EQ(limit_for(std::string("10")), 50);
    EXPECT_EQ(limit_for(std::string("-5")), 50);
    EXPECT_EQ(limit_for(std::string("5000")), 1000);
    EXPECT_EQ(limit_for(std::string("1e3")), 1000);
    EXPECT_EQ(limit_for(std::string("120.7")), 120);
}

TEST_F(ChartRequestTest, InfAndNanSpellingsAreNotNumbers) {
    EXPECT_EQ(limit_for(std::string("inf")), 200);
    EXPECT_EQ(limit_for(std::string("-inf")), 200);
    EXPECT_EQ(limit_for(std::string("nan")), 200);
    EXPECT_EQ(limit_for(std::string("nan(1)")), 200);
    EXPECT_EQ(limit_for(std::string("Infinity")), 1000);
    EXPECT_EQ(limit_for(std::string("-Infinity")), 50);
}

TEST(KlinesTest, ParsesStringAndNumberFields) {
    auto rows = nlohmann::json::parse(R"([
        [1700000000000, "100.5", "101.0", "99.5", "100.75", "12.5", 1700003599999, "0", 10],
        [1700003600000, 100.75, 102, 100, 101.25, 8]
    ])");

    auto result = parse_klines(rows);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& candles = result.value();
    ASSERT_EQ(candles.size(), 2u);

    EXPECT_EQ(to_unix_millis(candles[0].open_time), 1700000000000);
    EXPECT_DOUBLE_EQ(candles[0].open, 100.5);
    EXPECT_DOUBLE_EQ(candles[0].high, 101.0);
    EXPECT_DOUBLE_EQ(candles[0].low, 99.5);
    EXPECT_DOUBLE_EQ(candles[0].close, 100.75);
    EXPECT_DOUBLE_EQ(candles[0].volume, 12.5);

    EXPECT_EQ(to_unix_millis(candles[1].open_time), 1700003600000);
    EXPECT_DOUBLE_EQ(candles[1].high, 102.0);
    EXPECT_DOUBLE_EQ(candles[1].close, 101.25);
}

TEST(KlinesTest, RejectsMalformedPayloads) {
    auto not_array = parse_klines(nlohmann::json::object());
    ASSERT_TRUE(not_array.is_error());
    EXPECT_EQ(not_array.error()->code(), ErrorCode::INVALID_DATA);

    auto short_row = parse_klines(nlohmann::json::parse(R"([[1700000000000, "1", "2", "0.5"]])"));
    ASSERT_TRUE(short_row.is_error());
    EXPECT_NE(std::string(short_row.error()->what()).find("row 0"), std::string::npos);

    auto bad_field = parse_klines(nlohmann::json::parse(
        R"([[1700000000000, "1", "2", "0.5", "1.5", "3"], [1700003600000, "1", "x", "0.5", "1.5", "3"]])"));
    ASSERT_TRUE(bad_field.is_error());
    EXPECT_EQ(bad_field.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_NE(std::string(bad_field.error()->what()).find("row 1 field 2"), std::string::npos)
        << bad_field.error()->what();

    auto null_field = parse_klines(
        nlohmann::json::parse(R"([[1700000000000, null, "2", "0.5", "1.5", "3"]])"));
    EXPECT_TRUE(null_field.is_error());
}

TEST(KlinesTest, RejectsUnrepresentableOpenTime) {
    auto not_a_number =
        parse_klines(nlohmann::json::parse(R"([["nan", "1", "1", "1", "1", "1"]])"));
    ASSERT_TRUE(not_a_number.is_error());
    EXPECT_EQ(not_a_number.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_NE(std::string(not_a_number.error()->what()).find("row 0 open time"),
              std::string::npos)
        << not_a_number.error()->what();

    auto huge = parse_klines(nlohmann::json::parse(
        R"([[1700000000000, "1", "1", "1", "1", "1"], [1e300, "1", "1", "1", "1", "1"]])"));
    ASSERT_TRUE(huge.is_error());
    EXPECT_NE(std::string(huge.error()->what()).find("row 1 open time"), std::string::npos)
        << huge.error()->what();

    auto infinite = parse_klines(nlohmann::json::parse(R"([["-inf", "1", "1", "1", "1", "1"]])"));
    EXPECT_TRUE(infinite.is_error());

    // Prices are not range-checked
    auto odd_prices =
        parse_klines(nlohmann::json::parse(R"([[1700000000000, "nan", "inf", "-1", "1e300", "0"]])"));
    ASSERT_TRUE(odd_prices.is_ok());
    EXPECT_TRUE(std::isnan(odd_prices.value()[0].open));
    EXPECT_DOUBLE_EQ(odd_prices.value()[0].low, -1.0);
}

TEST(KlinesTest, EmptyPayloadIsEmptySequence) {
    auto result = parse_klines(nlohmann::json::array());
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}

TEST(ChartDataTest, TakeLastKeepsMostRecentCandles) {
    auto candles = make_candles(make_zigzag_closes(10));

    auto tail = take_last(candles, 4);
    ASSERT_EQ(tail.size(), 4u);
    EXPECT_EQ(tail.front().open_time, candles[6].open_time);
    EXPECT_EQ(tail.back().open_time, candles[9].open_time);

    EXPECT_EQ(take_last(candles, 50).size(), 10u);
}

TEST(ChartDataTest, SeriesSerializeAbsentAsNull) {
    IndicatorSeries series{std::nullopt, 1.5, std::nullopt, 2.0};
    auto j = series_to_json(series);

    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 4u);
    EXPECT_TRUE(j[0].is_null());
    EXPECT_DOUBLE_EQ(j[1].get<double>(), 1.5);
    EXPECT_TRUE(j[2].is_null());
    EXPECT_DOUBLE_EQ(j[3].get<double>(), 2.0);
    EXPECT_TRUE(series_to_json({}).is_array());
}

TEST(ChartDataTest, BuildsChartPayload) {
    auto request = validate_chart_request("btcusdt", "1d", std::string("60"));
    ASSERT_TRUE(request.is_ok());
    auto candles = make_candles(make_zigzag_closes(60));

    IndicatorConfig config;
    IndicatorEngine engine(config);
    ChartData data = build_chart_data(request.value(), candles, engine);

    EXPECT_EQ(data.symbol, "BTCUSDT");
    EXPECT_EQ(data.timeframe, "1d");
    EXPECT_EQ(data.candles.size(), 60u);
    EXPECT_EQ(data.indicators.size(), 60u);

    auto j = chart_data_to_json(data, config);
    EXPECT_EQ(j["symbol"].get<std::string>(), "BTCUSDT");
    EXPECT_EQ(j["timeframe"].get<std::string>(), "1d");
    ASSERT_EQ(j["candles"].size(), 60u);

    const auto& first = j["candles"][0];
    EXPECT_EQ(first["openTime"].get<std::int64_t>(), 1700000000000);
    EXPECT_DOUBLE_EQ(first["close"].get<double>(), candles[0].close);
    EXPECT_DOUBLE_EQ(first["volume"].get<double>(), 100.0);

    const auto& indicators = j["indicators"];
    for (const char* key : {"rsi", "macd", "macdSignal", "macdHistogram", "ema20", "ema50",
                            "ema200", "bbUpper", "bbMiddle", "bbLower"}) {
        ASSERT_TRUE(indicators.contains(key)) << key;
        EXPECT_EQ(indicators[key].size(), 60u) << key;
    }
    EXPECT_EQ(indicators.size(), 10u);

    EXPECT_TRUE(indicators["ema20"][18].is_null());
    EXPECT_TRUE(indicators["ema20"][19].is_number());
    EXPECT_TRUE(indicators["ema50"][49].is_number());
    for (const auto& slot : indicators["ema200"]) {
        EXPECT_TRUE(slot.is_null());
    }
}

TEST(ChartDataTest, EmaKeysFollowConfiguredPeriods) {
    IndicatorConfig config;
    config.ema_short_period = 9;
    config.ema_medium_period = 21;
    config.ema_long_period = 55;

    IndicatorEngine engine(config);
    auto bundle = engine.compute(make_candles(make_zigzag_closes(30)));
    auto j = indicators_to_json(bundle, config);

    EXPECT_TRUE(j.contains("ema9"));
    EXPECT_TRUE(j.contains("ema21"));
    EXPECT_TRUE(j.contains("ema55"));
    EXPECT_FALSE(j.contains("ema20"));
}
