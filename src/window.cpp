#include "window.hpp"

#include "errors.hpp"

#include <stdexcept>

WindowType parse_window(std::string const& name) {
    if (name == "boxcar" || name == "rect") return WindowType::boxcar;
    if (name == "hann") return WindowType::hann;
    if (name == "hamming") return WindowType::hamming;
    if (name == "blackman") return WindowType::blackman;
    if (name == "bartlett" || name == "triangle") return WindowType::bartlett;
    throw ParameterError("Unknown window: " + name);
}

torch::Tensor make_window(
    WindowType window,
    int64_t length,
    torch::TensorOptions const& opts) {

    if (length < 1) {
        throw ParameterError("window length must be >= 1, got " + std::to_string(length));
    }

    // periodic=false gives the symmetric (filter design) variant.
    switch (window) {
        case WindowType::boxcar:
            return torch::ones(length, opts);
        case WindowType::hann:
            return torch::hann_window(length, /*periodic=*/false, opts);
        case WindowType::hamming:
            return torch::hamming_window(length, /*periodic=*/false, opts);
        case WindowType::blackman:
            return torch::blackman_window(length, /*periodic=*/false, opts);
        case WindowType::bartlett:
            return torch::bartlett_window(length, /*periodic=*/false, opts);
    }
    throw std::logic_error("Invalid WindowType");
}
