#include "path_enhance.hpp"

#include "diagonal_filter.hpp"
#include "errors.hpp"
#include "tensor_util.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <string>

std::vector<double> tempo_ratios(double min_ratio, double max_ratio, int64_t count) {
    if (count < 1) {
        throw ParameterError("n_filters must be >= 1, got " + std::to_string(count));
    }
    auto ratios = torch::logspace(
        std::log2(min_ratio), std::log2(max_ratio), count, /*base=*/2.0,
        torch::TensorOptions().dtype(torch::kFloat64));
    return std::vector<double>(ratios.data_ptr<double>(), ratios.data_ptr<double>() + count);
}

torch::Tensor path_enhance(
    torch::Tensor const& R,
    int64_t n,
    PathEnhanceOptions const& options) {

    if (R.is_sparse()) {
        throw ParameterError("path_enhance does not support sparse input");
    }
    if (R.dim() != 2) {
        throw ParameterError("path_enhance expects a 2-D matrix, got " + shape_string(R));
    }
    if (n < 1) {
        throw ParameterError("filter length n must be >= 1, got " + std::to_string(n));
    }
    if (!(options.max_ratio > 0.0)) {
        throw ParameterError(
            "max_ratio=" + std::to_string(options.max_ratio) + " must be strictly positive");
    }

    double const max_ratio = options.max_ratio;
    double const min_ratio = options.min_ratio.value_or(1.0 / max_ratio);
    if (!(min_ratio > 0.0)) {
        throw ParameterError(
            "min_ratio=" + std::to_string(min_ratio) + " must be strictly positive");
    }
    if (min_ratio > max_ratio) {
        throw ParameterError(
            "min_ratio=" + std::to_string(min_ratio) +
            " cannot exceed max_ratio=" + std::to_string(max_ratio));
    }

    auto const ratios = tempo_ratios(min_ratio, max_ratio, options.n_filters);
    spdlog::debug("path_enhance: n={}, {} filters, ratios [{}, {}]",
                  n, ratios.size(), ratios.front(), ratios.back());

    torch::Tensor smooth;
    for (double ratio : ratios) {
        auto kernel = diagonal_filter(options.window, n, ratio, options.zero_mean);
        auto response = convolve2d(R, kernel, options.convolve);
        smooth = smooth.defined() ? torch::maximum(smooth, response) : response;
    }

    if (options.clip) {
        smooth = smooth.clamp_min(0.0);
    }
    return smooth;
}
