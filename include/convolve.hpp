#pragma once

#include <torch/torch.h>

#include <string>

/// How the input is extended beyond its edges during convolution.
///   reflect:  d c b a | a b c d | d c b a
///   mirror:   d c b | a b c d | c b a
///   nearest:  a a a | a b c d | d d d
///   wrap:     b c d | a b c d | a b c
///   constant: k k k | a b c d | k k k   (k = cval)
enum class BoundaryMode { reflect, mirror, nearest, wrap, constant };

/// Parse a boundary mode from a string.
/// Accepted values: "reflect", "mirror", "nearest", "wrap", "constant".
BoundaryMode parse_boundary_mode(std::string const& name);

struct ConvolveOptions {
    BoundaryMode mode = BoundaryMode::reflect;
    double cval = 0.0;    // fill value for BoundaryMode::constant
};

/// Same-shape 2-D convolution of a dense matrix with a dense kernel.
/// out[i, j] = sum_{a, b} kernel[a, b] * input[i - a + ka / 2, j - b + kb / 2]
/// with out-of-range input positions resolved by options.mode.
/// Non-floating input is promoted to float64; the kernel is cast to the
/// input's dtype.
torch::Tensor convolve2d(
    torch::Tensor const& input,
    torch::Tensor const& kernel,
    ConvolveOptions const& options = {});
