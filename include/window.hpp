#pragma once

#include <torch/torch.h>

#include <string>

/// Supported smoothing windows. All are generated in symmetric form
/// (first and last taps equal), as used for filter design.
enum class WindowType { boxcar, hann, hamming, blackman, bartlett };

/// Parse a window from a string.
/// Accepted values: "boxcar" (or "rect"), "hann", "hamming", "blackman",
/// "bartlett" (or "triangle").
WindowType parse_window(std::string const& name);

/// Symmetric window of the given length. Returns a 1-D tensor of shape [length].
torch::Tensor make_window(
    WindowType window,
    int64_t length,
    torch::TensorOptions const& opts);
