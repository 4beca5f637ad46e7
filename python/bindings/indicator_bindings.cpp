#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ta_ngin/indicators/bollinger.hpp"
#include "ta_ngin/indicators/ema.hpp"
#include "ta_ngin/indicators/indicator_engine.hpp"
#include "ta_ngin/indicators/macd.hpp"
#include "ta_ngin/indicators/rsi.hpp"
#include "type_bindings.hpp"

using namespace ta_ngin;

// Absent slots come back to Python as None
void bind_indicator_functions(py::module_& m) {
    m.def("compute_ema", &indicators::compute_ema, py::arg("values"), py::arg("period"));
    m.def("compute_rsi", &indicators::compute_rsi, py::arg("closes"),
          py::arg("period") = indicators::DEFAULT_RSI_PERIOD);
    m.def("compute_macd", &indicators::compute_macd, py::arg("closes"),
          py::arg("fast") = indicators::DEFAULT_MACD_FAST_PERIOD,
          py::arg("slow") = indicators::DEFAULT_MACD_SLOW_PERIOD,
          py::arg("signal_period") = indicators::DEFAULT_MACD_SIGNAL_PERIOD);
    m.def("compute_bollinger", &indicators::compute_bollinger, py::arg("closes"),
          py::arg("period") = indicators::DEFAULT_BOLLINGER_PERIOD,
          py::arg("std_dev_multiplier") = indicators::DEFAULT_BOLLINGER_STD_DEV);
    m.def("compute_indicators", &compute_indicators, py::arg("candles"));
}

PYBIND11_MODULE(ta_ngin_py, m) {
    m.doc() = "Technical indicator engine for chart overlays";

    py::register_exception<TaError>(m, "TaErrorException");

    bind_core_types(m);
    bind_error_types(m);
    bind_indicator_types(m);
    bind_indicator_functions(m);
}
