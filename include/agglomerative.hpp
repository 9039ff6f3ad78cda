#pragma once

#include <torch/torch.h>

/// Connectivity-constrained clustering of a feature sequence.
/// Implementations assign one label per point; the connectivity graph
/// restricts merges to temporally adjacent points.
class TemporalClusterer {
public:
    virtual ~TemporalClusterer() = default;

    /// points: [n, d] float64. connectivity: sparse COO [n, n].
    /// Returns a 1-D int64 tensor of n cluster labels.
    virtual torch::Tensor fit(
        torch::Tensor const& points,
        int64_t n_clusters,
        torch::Tensor const& connectivity) = 0;
};

/// Chain graph linking each frame to itself and its immediate neighbors.
/// Returns a sparse COO int64 tensor of shape (n, n).
torch::Tensor temporal_connectivity(int64_t n);

/// Bottom-up temporal segmentation into k contiguous segments.
/// Returns the segment start frames [0, b_1, ..., b_{k-1}] as a 1-D int64 tensor.
/// Throws ParameterError if k < 1.
torch::Tensor agglomerative(
    torch::Tensor const& data,
    int64_t k,
    TemporalClusterer& clusterer,
    int64_t axis = -1);

/// Sub-divide a segmentation by feature clustering.
///
/// `frames` are boundary frame indices; they are clipped to [0, n], extended
/// with 0 and n, and deduplicated. Each resulting interval is split into at
/// most n_segments pieces with agglomerative().
/// Returns the refined boundaries as a sorted 1-D int64 tensor.
/// Throws ParameterError if n_segments < 1.
torch::Tensor subsegment(
    torch::Tensor const& data,
    torch::Tensor const& frames,
    TemporalClusterer& clusterer,
    int64_t n_segments = 4,
    int64_t axis = -1);
