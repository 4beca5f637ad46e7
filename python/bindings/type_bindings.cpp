#include "type_bindings.hpp"

#include <pybind11/chrono.h>
#include <pybind11/stl.h>
#include <pybind11_json/pybind11_json.hpp>

#include "ta_ngin/core/error.hpp"
#include "ta_ngin/core/types.hpp"
#include "ta_ngin/indicators/bollinger.hpp"
#include "ta_ngin/indicators/indicator_config.hpp"
#include "ta_ngin/indicators/indicator_engine.hpp"
#include "ta_ngin/indicators/macd.hpp"

using namespace ta_ngin;

// Bind types in ta_ngin/core/types.hpp
void bind_core_types(py::module_& m) {
    py::class_<Candle>(m, "Candle")
        .def(py::init<>())
        .def(py::init<Timestamp, Price, Price, Price, Price, double>(), py::arg("open_time"),
             py::arg("open"), py::arg("high"), py::arg("low"), py::arg("close"),
             py::arg("volume"))
        .def_readwrite("open_time", &Candle::open_time)
        .def_readwrite("open", &Candle::open)
        .def_readwrite("high", &Candle::high)
        .def_readwrite("low", &Candle::low)
        .def_readwrite("close", &Candle::close)
        .def_readwrite("volume", &Candle::volume);
}

// Bind types in ta_ngin/core/error.hpp
// Only Result<void> is bound; functions returning other Result<T> raise TaError instead.
void bind_error_types(py::module_& m) {
    py::enum_<ErrorCode>(m, "ErrorCode")
        .value("NONE", ErrorCode::NONE)
        .value("UNKNOWN_ERROR", ErrorCode::UNKNOWN_ERROR)
        .value("INVALID_DATA", ErrorCode::INVALID_DATA)
        .value("FILE_NOT_FOUND", ErrorCode::FILE_NOT_FOUND)
        .value("FILE_IO_ERROR", ErrorCode::FILE_IO_ERROR)
        .value("JSON_PARSE_ERROR", ErrorCode::JSON_PARSE_ERROR)
        .value("INVALID_CONFIG", ErrorCode::INVALID_CONFIG)
        .value("INVALID_REQUEST", ErrorCode::INVALID_REQUEST)
        .value("CUSTOM_ERROR_START", ErrorCode::CUSTOM_ERROR_START);

    py::class_<TaError>(m, "TaError")
        .def(py::init<ErrorCode, std::string, std::string>(), py::arg("code"), py::arg("message"),
             py::arg("component") = "")
        .def_property_readonly("code", &TaError::code)
        .def_property_readonly("message", &TaError::what)
        .def_property_readonly("component", &TaError::component)
        .def("to_string", &TaError::to_string);

    py::class_<Result<void>>(m, "ResultVoid")
        .def(py::init<>())
        .def_property_readonly("is_ok", &Result<void>::is_ok)
        .def_property_readonly("error", &Result<void>::error,
                               py::return_value_policy::reference_internal);
}

// Bind types in ta_ngin/indicators/*.hpp
void bind_indicator_types(py::module_& m) {
    py::class_<IndicatorConfig>(m, "IndicatorConfig")
        .def(py::init<>())
        .def_readwrite("rsi_period", &IndicatorConfig::rsi_period)
        .def_readwrite("macd_fast_period", &IndicatorConfig::macd_fast_period)
        .def_readwrite("macd_slow_period", &IndicatorConfig::macd_slow_period)
        .def_readwrite("macd_signal_period", &IndicatorConfig::macd_signal_period)
        .def_readwrite("ema_short_period", &IndicatorConfig::ema_short_period)
        .def_readwrite("ema_medium_period", &IndicatorConfig::ema_medium_period)
        .def_readwrite("ema_long_period", &IndicatorConfig::ema_long_period)
        .def_readwrite("bollinger_period", &IndicatorConfig::bollinger_period)
        .def_readwrite("bollinger_std_dev", &IndicatorConfig::bollinger_std_dev)
        .def_readwrite("parallel", &IndicatorConfig::parallel)
        .def_readwrite("version", &IndicatorConfig::version)
        .def("to_json", &IndicatorConfig::to_json)
        .def("from_json", &IndicatorConfig::from_json)
        .def("validate", &IndicatorConfig::validate);

    py::class_<indicators::MacdResult>(m, "MacdResult")
        .def_readonly("macd_line", &indicators::MacdResult::macd_line)
        .def_readonly("signal_line", &indicators::MacdResult::signal_line)
        .def_readonly("histogram", &indicators::MacdResult::histogram);

    py::class_<indicators::BollingerResult>(m, "BollingerResult")
        .def_readonly("upper", &indicators::BollingerResult::upper)
        .def_readonly("middle", &indicators::BollingerResult::middle)
        .def_readonly("lower", &indicators::BollingerResult::lower);

    py::class_<IndicatorBundle>(m, "IndicatorBundle")
        .def_readonly("rsi", &IndicatorBundle::rsi)
        .def_readonly("macd", &IndicatorBundle::macd)
        .def_readonly("macd_signal", &IndicatorBundle::macd_signal)
        .def_readonly("macd_histogram", &IndicatorBundle::macd_histogram)
        .def_readonly("ema_short", &IndicatorBundle::ema_short)
        .def_readonly("ema_medium", &IndicatorBundle::ema_medium)
        .def_readonly("ema_long", &IndicatorBundle::ema_long)
        .def_readonly("bb_upper", &IndicatorBundle::bb_upper)
        .def_readonly("bb_middle", &IndicatorBundle::bb_middle)
        .def_readonly("bb_lower", &IndicatorBundle::bb_lower)
        .def("__len__", &IndicatorBundle::size);

    py::class_<IndicatorEngine>(m, "IndicatorEngine")
        .def(py::init<>())
        .def(py::init<IndicatorConfig>(), py::arg("config"))
        .def("compute", &IndicatorEngine::compute, py::arg("candles"),
             py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("config", &IndicatorEngine::config,
                               py::return_value_policy::reference_internal);
}
