#pragma once

#include <torch/torch.h>

#include <string>

#include "errors.hpp"

/// Build TensorOptions with only dtype and device from an existing tensor.
/// Necessary because tensor.options() includes layout (e.g. Sparse), which
/// would leak into dense temporaries built from it.
inline torch::TensorOptions sparse_opts(torch::Tensor const& t) {
    return torch::TensorOptions().dtype(t.dtype()).device(t.device());
}

/// Build int64 TensorOptions on the same device as the given tensor.
/// Used for index tensors (row/col indices) in sparse matrix construction.
inline torch::TensorOptions long_opts_like(torch::Tensor const& t) {
    return torch::TensorOptions().dtype(torch::kLong).device(t.device());
}

/// Resolve a possibly-negative dim index and validate it.
inline int64_t resolve_dim(int64_t dim, int64_t ndim) {
    int64_t const resolved = dim < 0 ? dim + ndim : dim;
    if (resolved < 0 || resolved >= ndim) {
        throw ParameterError(
            "dim " + std::to_string(dim) + " out of range for tensor with " +
            std::to_string(ndim) + " dimensions");
    }
    return resolved;
}

/// Time axis of a 2-D (time, time) or (time, lag) matrix: 0, 1 or -1.
inline int64_t resolve_matrix_axis(int64_t axis) {
    if (axis != 0 && axis != 1 && axis != -1) {
        throw ParameterError("Invalid target axis: " + std::to_string(axis));
    }
    return axis < 0 ? 1 : axis;
}

inline std::string shape_string(torch::Tensor const& t) {
    std::string out = "(";
    for (int64_t i = 0; i < t.dim(); ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(t.size(i));
    }
    return out + ")";
}
