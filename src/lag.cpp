#include "lag.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <string>
#include <utility>

/// Source position along the lag axis for every cell of a (time, lag) grid,
/// shaped to broadcast as the matrix: (position + direction * time) mod period.
/// time_axis selects which matrix dimension indexes time.
static torch::Tensor rotation_index(
    int64_t time_len,
    int64_t lag_len,
    int64_t period,
    int64_t time_axis,
    int64_t direction,
    torch::TensorOptions const& long_opts) {

    auto time = torch::arange(time_len, long_opts);
    auto lag = torch::arange(lag_len, long_opts);
    if (time_axis == 1) {
        // Rows are lag positions, columns are time.
        return torch::remainder(lag.unsqueeze(1) + direction * time.unsqueeze(0), period);
    }
    // Rows are time, columns are lag positions.
    return torch::remainder(lag.unsqueeze(0) + direction * time.unsqueeze(1), period);
}

/// Move the stored entries of a sparse COO matrix along the lag axis by
/// direction * time (mod period), keeping those that land below keep_len.
static torch::Tensor rotate_sparse(
    torch::Tensor const& matrix,
    int64_t time_axis,
    int64_t direction,
    int64_t period,
    int64_t keep_len) {

    int64_t const lag_axis = 1 - time_axis;
    auto coalesced = matrix.coalesce();
    auto indices = coalesced.indices();
    auto values = coalesced.values();

    auto time = indices[time_axis];
    auto shifted = torch::remainder(indices[lag_axis] + direction * time, period);

    auto keep = torch::nonzero(shifted < keep_len).reshape({-1});
    time = time.index_select(0, keep);
    shifted = shifted.index_select(0, keep);
    values = values.index_select(0, keep);

    auto new_indices = time_axis == 1
        ? torch::stack({shifted, time})
        : torch::stack({time, shifted});

    std::vector<int64_t> sizes = {matrix.size(0), matrix.size(1)};
    sizes[lag_axis] = keep_len;

    return torch::sparse_coo_tensor(new_indices, values, sizes, sparse_opts(values)).coalesce();
}

torch::Tensor recurrence_to_lag(
    torch::Tensor const& rec,
    bool pad,
    int64_t axis) {

    int64_t const time_axis = resolve_matrix_axis(axis);
    int64_t const lag_axis = 1 - time_axis;

    if (rec.dim() != 2 || rec.size(0) != rec.size(1)) {
        throw ParameterError("non-square recurrence matrix shape: " + shape_string(rec));
    }

    int64_t const n = rec.size(time_axis);
    int64_t const period = pad ? 2 * n : n;

    if (rec.is_sparse()) {
        // Padding only enlarges the lag axis; stored entries all sit below n.
        return rotate_sparse(rec, time_axis, /*direction=*/-1, period, period);
    }

    auto source = pad
        ? torch::cat({rec, torch::zeros_like(rec)}, lag_axis)
        : rec;
    auto index = rotation_index(n, period, period, time_axis, /*direction=*/1, long_opts_like(rec));
    return torch::gather(source, lag_axis, index);
}

torch::Tensor lag_to_recurrence(
    torch::Tensor const& lag,
    int64_t axis) {

    int64_t const time_axis = resolve_matrix_axis(axis);
    int64_t const lag_axis = 1 - time_axis;

    if (lag.dim() != 2 ||
        (lag.size(0) != lag.size(1) && lag.size(lag_axis) != 2 * lag.size(time_axis))) {
        throw ParameterError("Invalid lag matrix shape: " + shape_string(lag));
    }

    int64_t const n = lag.size(time_axis);
    int64_t const period = lag.size(lag_axis);

    if (lag.is_sparse()) {
        return rotate_sparse(lag, time_axis, /*direction=*/1, period, n);
    }

    // rec[r, i] = lag[(r - i) mod T, i] for r < n (time axis 1).
    auto index = rotation_index(n, n, period, time_axis, /*direction=*/-1, long_opts_like(lag));
    return torch::gather(lag, lag_axis, index);
}

MatrixFilter timelag_filter(
    MatrixFilter function,
    bool pad,
    size_t index) {

    return [function = std::move(function), pad, index](std::vector<torch::Tensor> args) {
        if (index >= args.size()) {
            throw ParameterError(
                "timelag_filter: argument index " + std::to_string(index) +
                " out of range for " + std::to_string(args.size()) + " arguments");
        }
        args[index] = recurrence_to_lag(args[index], pad);
        auto result = function(std::move(args));
        return lag_to_recurrence(result);
    };
}
