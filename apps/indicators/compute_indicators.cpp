#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "ta_ngin/core/logger.hpp"
#include "ta_ngin/data/chart_data.hpp"
#include "ta_ngin/indicators/indicator_config.hpp"
#include "ta_ngin/indicators/indicator_engine.hpp"

using namespace ta_ngin;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <klines.json> <SYMBOL> <timeframe> [limit] [--config indicators.json]"
                 " [--log-config logger.json]"
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    std::optional<std::string> config_path;
    std::optional<std::string> log_config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--log-config") && i + 1 < argc) {
            (arg == "--config" ? config_path : log_config_path) = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 3 || positional.size() > 4) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        // stdout carries the chart JSON, so logs go to file only
        LoggerConfig logger_config;
        logger_config.destination = LogDestination::FILE;
        logger_config.filename_prefix = "compute_indicators";
        if (log_config_path) {
            auto loaded = logger_config.load_from_file(*log_config_path);
            if (loaded.is_error()) {
                std::cerr << "Failed to load logger config: " << loaded.error()->what()
                          << std::endl;
                return 1;
            }
        }
        Logger::instance().initialize(logger_config);
        Logger::register_component("compute_indicators");

        IndicatorConfig indicator_config;
        if (config_path) {
            auto loaded = indicator_config.load_from_file(*config_path);
            if (loaded.is_error()) {
                ERROR("Failed to load indicator config: " << loaded.error()->to_string());
                std::cerr << loaded.error()->what() << std::endl;
                return 1;
            }
        }

        auto engine_result = IndicatorEngine::create(indicator_config);
        if (engine_result.is_error()) {
            ERROR(engine_result.error()->to_string());
            std::cerr << engine_result.error()->what() << std::endl;
            return 1;
        }
        const auto& engine = engine_result.value();

        std::optional<std::string> limit_param;
        if (positional.size() == 4) {
            limit_param = positional[3];
        }
        auto request_result = validate_chart_request(positional[1], positional[2], limit_param);
        if (request_result.is_error()) {
            ERROR(request_result.error()->to_string());
            std::cerr << request_result.error()->what() << std::endl;
            return 1;
        }
        const ChartRequest& request = request_result.value();

        std::ifstream klines_file(positional[0]);
        if (!klines_file.is_open()) {
            ERROR("Failed to open klines file: " << positional[0]);
            std::cerr << "Failed to open klines file: " << positional[0] << std::endl;
            return 1;
        }
        nlohmann::json raw = nlohmann::json::parse(klines_file);

        auto candles_result = parse_klines(raw);
        if (candles_result.is_error()) {
            ERROR(candles_result.error()->to_string());
            std::cerr << candles_result.error()->what() << std::endl;
            return 1;
        }

        std::vector<Candle> candles =
            take_last(candles_result.value(), static_cast<size_t>(request.limit));
        INFO("Computing indicators for " << request.symbol << " " << request.timeframe << " over "
                                         << candles.size() << " candles");

        ChartData data = build_chart_data(request, std::move(candles), *engine);
        std::cout << std::setw(2) << chart_data_to_json(data, engine->config()) << std::endl;

        INFO("Chart data written for " << request.symbol);
        return 0;
    } catch (const nlohmann::json::parse_error& e) {
        ERROR("Invalid klines JSON: " << e.what());
        std::cerr << "Invalid klines JSON: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        ERROR("Error: " << e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
