#pragma once

#include <torch/torch.h>

#include <optional>
#include <vector>

#include "convolve.hpp"
#include "window.hpp"

struct PathEnhanceOptions {
    WindowType window = WindowType::hann;
    double max_ratio = 2.0;             // fastest tempo ratio to support
    std::optional<double> min_ratio;    // slowest tempo ratio; default 1 / max_ratio
    int64_t n_filters = 7;              // odd counts include ratio 1 for the default range
    bool zero_mean = false;             // zero-sum filters, suppress blocks
    bool clip = true;                   // clamp negative output to 0
    ConvolveOptions convolve;
};

/// Slope ratios spaced uniformly in log2 between min_ratio and max_ratio,
/// both included. A single ratio is min_ratio.
std::vector<double> tempo_ratios(double min_ratio, double max_ratio, int64_t count);

/// Multi-angle path enhancement for self- and cross-similarity matrices.
///
/// Convolves R with options.n_filters diagonal smoothing filters of length n,
/// one per tempo ratio, and aggregates the responses by elementwise maximum.
/// R must be a dense 2-D matrix; non-floating input is promoted to float64.
/// Throws ParameterError if min_ratio > max_ratio or for sparse R.
torch::Tensor path_enhance(
    torch::Tensor const& R,
    int64_t n,
    PathEnhanceOptions const& options = {});
