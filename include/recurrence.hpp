#pragma once

#include <torch/torch.h>

#include <optional>
#include <string>

#include "neighbors.hpp"

/// Value carried by the entries of a recurrence matrix.
///   connectivity: bool, true where frames i and j are linked
///   distance:     float64 >= 0, distance between linked frames
///   affinity:     float64 in (0, 1], exp(-distance / bandwidth)
enum class RecurrenceMode { connectivity, distance, affinity };

/// Parse a recurrence mode from a string.
/// Accepted values: "connectivity", "distance", "affinity".
RecurrenceMode parse_recurrence_mode(std::string const& name);

struct RecurrenceOptions {
    std::optional<int64_t> k;           // neighbors kept per frame; default from n and width
    int64_t width = 1;                  // frames i, j link only if |i - j| >= width
    Metric metric = Metric::euclidean;  // used by the default index
    bool sym = false;                   // keep only mutual neighbors
    bool sparse = false;                // sparse COO output instead of dense
    RecurrenceMode mode = RecurrenceMode::connectivity;
    std::optional<double> bandwidth;    // affinity bandwidth; estimated when unset
    bool self_loops = false;            // link every frame to itself
    int64_t axis = -1;                  // time axis of the feature tensor
};

struct RecurrenceMatrix {
    torch::Tensor matrix;     // [n, n], sparse COO or dense
    RecurrenceMode mode;
    double bandwidth;         // affinity bandwidth in use; NaN for other modes
};

/// Default number of neighbors for n frames and exclusion width:
/// 2 * ceil(sqrt(n - 2 * width + 1)) if n > 2 * width + 1, else 2.
int64_t default_neighbor_count(int64_t n, int64_t width);

/// Compute a recurrence matrix from a feature tensor using the brute-force
/// index for options.metric.
///
/// Entry (i, j) is present if frame j is among the k nearest neighbors of
/// frame i and |i - j| >= width. With sym=true only mutual neighbors are kept.
/// Throws ParameterError on invalid width, k, bandwidth or axis.
RecurrenceMatrix recurrence_matrix(
    torch::Tensor const& data,
    RecurrenceOptions const& options = {});

/// Same as above with a caller-supplied neighbor index (options.metric is
/// ignored). The index is fitted on the flattened [n, d] features.
RecurrenceMatrix recurrence_matrix(
    torch::Tensor const& data,
    RecurrenceOptions const& options,
    NeighborIndex& index);
