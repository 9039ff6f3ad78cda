#include "diagonal_filter.hpp"
#include "errors.hpp"
#include "lag.hpp"
#include "path_enhance.hpp"
#include "recurrence.hpp"

#include <torch/extension.h>

#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <vector>

namespace {

py::object recurrence_matrix_wrapper(
    torch::Tensor const& data,
    std::optional<int64_t> k,
    int64_t width,
    std::string const& metric,
    bool sym,
    bool sparse,
    std::string const& mode,
    std::optional<double> bandwidth,
    bool self_loops,
    int64_t axis,
    bool return_bandwidth) {

    RecurrenceOptions const options{
        .k = k,
        .width = width,
        .metric = parse_metric(metric),
        .sym = sym,
        .sparse = sparse,
        .mode = parse_recurrence_mode(mode),
        .bandwidth = bandwidth,
        .self_loops = self_loops,
        .axis = axis,
    };
    auto result = recurrence_matrix(data, options);
    if (return_bandwidth) {
        return py::make_tuple(result.matrix, result.bandwidth);
    }
    return py::cast(result.matrix);
}

torch::Tensor timelag_apply_wrapper(
    py::function const& function,
    std::vector<torch::Tensor> args,
    bool pad,
    size_t index) {
    MatrixFilter filter = [&function](std::vector<torch::Tensor> filter_args) {
        return function(filter_args).cast<torch::Tensor>();
    };
    return timelag_filter(filter, pad, index)(std::move(args));
}

torch::Tensor path_enhance_wrapper(
    torch::Tensor const& R,
    int64_t n,
    std::string const& window,
    double max_ratio,
    std::optional<double> min_ratio,
    int64_t n_filters,
    bool zero_mean,
    bool clip,
    std::string const& mode,
    double cval) {

    PathEnhanceOptions const options{
        .window = parse_window(window),
        .max_ratio = max_ratio,
        .min_ratio = min_ratio,
        .n_filters = n_filters,
        .zero_mean = zero_mean,
        .clip = clip,
        .convolve = {.mode = parse_boundary_mode(mode), .cval = cval},
    };
    return path_enhance(R, n, options);
}

torch::Tensor diagonal_filter_wrapper(
    std::string const& window,
    int64_t n,
    double slope,
    bool zero_mean) {
    return diagonal_filter(parse_window(window), n, slope, zero_mean);
}

}  // namespace

PYBIND11_MODULE(recseg, m) {
    m.doc() = "Recurrence matrices, time-lag transforms and path enhancement (C++ / LibTorch)";

    py::register_exception<ParameterError>(m, "ParameterError", PyExc_ValueError);

    m.def("recurrence_matrix", &recurrence_matrix_wrapper,
          "Compute a k-nearest-neighbor recurrence matrix from a feature tensor",
          py::arg("data"),
          py::arg("k") = py::none(),
          py::arg("width") = 1,
          py::arg("metric") = "euclidean",
          py::arg("sym") = false,
          py::arg("sparse") = false,
          py::arg("mode") = "connectivity",
          py::arg("bandwidth") = py::none(),
          py::arg("self_loops") = false,
          py::arg("axis") = -1,
          py::arg("return_bandwidth") = false);

    m.def("recurrence_to_lag", &recurrence_to_lag,
          "Convert a recurrence matrix into a lag matrix",
          py::arg("rec"),
          py::arg("pad") = true,
          py::arg("axis") = -1);

    m.def("lag_to_recurrence", &lag_to_recurrence,
          "Convert a lag matrix into a recurrence matrix",
          py::arg("lag"),
          py::arg("axis") = -1);

    m.def("timelag_apply", &timelag_apply_wrapper,
          "Call function(args) with args[index] mapped into time-lag coordinates",
          py::arg("function"),
          py::arg("args"),
          py::arg("pad") = true,
          py::arg("index") = 0);

    m.def("path_enhance", &path_enhance_wrapper,
          "Multi-angle diagonal path enhancement for similarity matrices",
          py::arg("R"),
          py::arg("n"),
          py::arg("window") = "hann",
          py::arg("max_ratio") = 2.0,
          py::arg("min_ratio") = py::none(),
          py::arg("n_filters") = 7,
          py::arg("zero_mean") = false,
          py::arg("clip") = true,
          py::arg("mode") = "reflect",
          py::arg("cval") = 0.0);

    m.def("diagonal_filter", &diagonal_filter_wrapper,
          "Diagonal smoothing filter of length n at the given slope",
          py::arg("window"),
          py::arg("n"),
          py::arg("slope") = 1.0,
          py::arg("zero_mean") = false);

    m.def("tempo_ratios", &tempo_ratios,
          "Slope ratios spaced uniformly in log2 between min_ratio and max_ratio",
          py::arg("min_ratio"),
          py::arg("max_ratio"),
          py::arg("count"));
}
