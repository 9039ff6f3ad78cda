#include "convolve.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

BoundaryMode parse_boundary_mode(std::string const& name) {
    if (name == "reflect") return BoundaryMode::reflect;
    if (name == "mirror") return BoundaryMode::mirror;
    if (name == "nearest") return BoundaryMode::nearest;
    if (name == "wrap") return BoundaryMode::wrap;
    if (name == "constant") return BoundaryMode::constant;
    throw ParameterError("Unknown boundary mode: " + name);
}

/// Non-negative remainder.
static int64_t positive_mod(int64_t value, int64_t period) {
    int64_t const r = value % period;
    return r < 0 ? r + period : r;
}

/// Source index for every position of an axis of length `length` extended by
/// pad_before / pad_after cells. Positions run from -pad_before to
/// length + pad_after - 1.
static torch::Tensor extension_indices(
    int64_t length,
    int64_t pad_before,
    int64_t pad_after,
    BoundaryMode mode) {

    std::vector<int64_t> indices;
    indices.reserve(pad_before + length + pad_after);

    for (int64_t pos = -pad_before; pos < length + pad_after; ++pos) {
        int64_t src = pos;
        switch (mode) {
            case BoundaryMode::reflect: {
                int64_t const q = positive_mod(pos, 2 * length);
                src = q < length ? q : 2 * length - 1 - q;
                break;
            }
            case BoundaryMode::mirror: {
                if (length == 1) {
                    src = 0;
                    break;
                }
                int64_t const q = positive_mod(pos, 2 * length - 2);
                src = q < length ? q : 2 * length - 2 - q;
                break;
            }
            case BoundaryMode::nearest:
                src = std::clamp<int64_t>(pos, 0, length - 1);
                break;
            case BoundaryMode::wrap:
                src = positive_mod(pos, length);
                break;
            case BoundaryMode::constant:
                throw std::logic_error("constant mode is padded directly");
        }
        indices.push_back(src);
    }
    return torch::tensor(indices, torch::kLong);
}

torch::Tensor convolve2d(
    torch::Tensor const& input,
    torch::Tensor const& kernel,
    ConvolveOptions const& options) {

    if (input.dim() != 2 || kernel.dim() != 2) {
        throw ParameterError(
            "convolve2d expects 2-D input and kernel, got " +
            shape_string(input) + " and " + shape_string(kernel));
    }
    if (input.is_sparse()) {
        throw ParameterError("convolve2d does not support sparse input");
    }
    if (kernel.numel() == 0) {
        throw ParameterError("convolve2d kernel must not be empty");
    }

    auto x = input.is_floating_point() ? input : input.to(torch::kFloat64);
    auto w = kernel.to(x.dtype()).to(x.device());

    int64_t const kh = w.size(0);
    int64_t const kw = w.size(1);

    // Kernel center sits at (kh / 2, kw / 2); convolution flips the kernel,
    // so the extension before each axis is k - 1 - k / 2 and after it k / 2.
    int64_t const top = kh - 1 - kh / 2;
    int64_t const bottom = kh / 2;
    int64_t const left = kw - 1 - kw / 2;
    int64_t const right = kw / 2;

    torch::Tensor padded;
    if (options.mode == BoundaryMode::constant) {
        padded = torch::constant_pad_nd(x, {left, right, top, bottom}, options.cval);
    } else {
        auto const long_opts = long_opts_like(x);
        auto rows = extension_indices(x.size(0), top, bottom, options.mode).to(long_opts);
        auto cols = extension_indices(x.size(1), left, right, options.mode).to(long_opts);
        padded = x.index_select(0, rows).index_select(1, cols);
    }

    // conv2d computes cross-correlation: flip both axes to convolve.
    auto weight = w.flip({0, 1}).unsqueeze(0).unsqueeze(0);
    auto out = torch::conv2d(padded.unsqueeze(0).unsqueeze(0), weight);
    return out.squeeze(0).squeeze(0);
}
