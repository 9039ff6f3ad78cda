#pragma once

#include <torch/torch.h>

#include "window.hpp"

/// Build a two-dimensional diagonal smoothing filter.
///
/// The window of length n is laid along the main diagonal of an n x n matrix
/// and, unless slope == 1, rotated about its center so the line has the given
/// slope (rows advanced per column). Rotated kernels are resampled with
/// quintic B-splines (unfiltered) into a square grid large enough to hold the
/// whole line.
///
/// The result is non-negative and sums to 1. With zero_mean=true its mean is
/// subtracted afterwards, so it sums to 0.
/// Returns a dense float64 tensor of shape (m, m), m == n when slope == 1.
torch::Tensor diagonal_filter(
    WindowType window,
    int64_t n,
    double slope = 1.0,
    bool zero_mean = false);
