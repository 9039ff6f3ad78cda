#pragma once

#include <torch/torch.h>

#include <string>

/// Distance metrics supported by BruteForceIndex.
enum class Metric { euclidean, manhattan, chebyshev, cosine };

/// Parse a metric from a string.
/// Accepted values: "euclidean" ("l2"), "manhattan" ("cityblock", "l1"),
/// "chebyshev" ("linf"), "cosine".
Metric parse_metric(std::string const& name);

/// Value stored for each edge of a k-nearest-neighbor graph.
enum class KnnGraphMode { connectivity, distance };

/// Pairwise distance matrix between the rows of a [n, d] tensor.
/// Returns a dense float64 tensor of shape (n, n).
torch::Tensor pairwise_distances(torch::Tensor const& points, Metric metric);

/// Nearest-neighbor search over a fixed set of points.
class NeighborIndex {
public:
    virtual ~NeighborIndex() = default;

    /// Index the rows of a [n, d] tensor.
    virtual void fit(torch::Tensor const& points) = 0;

    /// k-nearest-neighbor graph over the fitted points, excluding each
    /// point itself. Row i holds the n_neighbors nearest points to point i.
    /// Returns a coalesced sparse COO float64 tensor of shape (n, n) whose
    /// values are distances (KnnGraphMode::distance) or ones.
    virtual torch::Tensor kneighbors_graph(
        int64_t n_neighbors,
        KnnGraphMode mode) const = 0;
};

/// Exhaustive search: full pairwise distance matrix plus a stable sort.
/// Neighbors at equal distance are ranked by ascending index.
class BruteForceIndex : public NeighborIndex {
public:
    explicit BruteForceIndex(Metric metric = Metric::euclidean)
        : metric_(metric) {}

    void fit(torch::Tensor const& points) override;

    torch::Tensor kneighbors_graph(
        int64_t n_neighbors,
        KnnGraphMode mode) const override;

    Metric metric() const { return metric_; }

private:
    Metric metric_;
    torch::Tensor points_;    // [n, d] float64
};
