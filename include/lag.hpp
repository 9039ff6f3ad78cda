#pragma once

#include <torch/torch.h>

#include <functional>
#include <vector>

/// Convert a recurrence matrix into a lag matrix.
///
/// For each time index i along `axis`, the slice at i is rotated by -i along
/// the other (lag) axis. With axis = -1: lag[l, i] = rec[(l + i) mod T, i].
///
/// pad=true first extends the lag axis with n zeros (T = 2n), which makes the
/// transform injective. pad=false keeps n x n (T = n) and implicitly assumes
/// the sequence repeats periodically.
///
/// Sparse COO input yields sparse COO output; only stored entries move.
/// Throws ParameterError if rec is not a square 2-D matrix or axis is not
/// 0, 1 or -1.
torch::Tensor recurrence_to_lag(
    torch::Tensor const& rec,
    bool pad = true,
    int64_t axis = -1);

/// Convert a lag matrix back into a recurrence matrix.
///
/// Inverse of recurrence_to_lag: slice i along `axis` is rotated by +i along
/// the lag axis, which is then truncated to n. The lag matrix must be square
/// (unpadded) or have a lag axis exactly twice the time axis (padded).
torch::Tensor lag_to_recurrence(
    torch::Tensor const& lag,
    int64_t axis = -1);

/// A matrix filter taking its operands as a positional argument list.
using MatrixFilter = std::function<torch::Tensor(std::vector<torch::Tensor>)>;

/// Wrap a filter so that it operates in time-lag coordinates.
///
/// The returned filter replaces args[index] with recurrence_to_lag(args[index], pad),
/// calls `function` with the rewritten list, and maps the result back with
/// lag_to_recurrence. Rectangular filters (median, box) then smooth along
/// the diagonals of the original matrix.
/// Calling it with fewer than index + 1 arguments throws ParameterError.
MatrixFilter timelag_filter(
    MatrixFilter function,
    bool pad = true,
    size_t index = 0);
