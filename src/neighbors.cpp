#include "neighbors.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <limits>
#include <stdexcept>

Metric parse_metric(std::string const& name) {
    if (name == "euclidean" || name == "l2") return Metric::euclidean;
    if (name == "manhattan" || name == "cityblock" || name == "l1") return Metric::manhattan;
    if (name == "chebyshev" || name == "linf") return Metric::chebyshev;
    if (name == "cosine") return Metric::cosine;
    throw ParameterError("Unknown metric: " + name);
}

torch::Tensor pairwise_distances(torch::Tensor const& points, Metric metric) {
    if (points.dim() != 2) {
        throw ParameterError("points must be 2-D [n, d], got " + shape_string(points));
    }
    auto x = points.to(torch::kFloat64);

    // compute_mode 2 = never use the matmul shortcut for p=2, so that
    // distances are exactly symmetric and the self-distance is exactly zero.
    constexpr int64_t donot_use_mm = 2;

    switch (metric) {
        case Metric::euclidean:
            return torch::cdist(x, x, 2.0, donot_use_mm);
        case Metric::manhattan:
            return torch::cdist(x, x, 1.0, donot_use_mm);
        case Metric::chebyshev:
            return torch::cdist(x, x, std::numeric_limits<double>::infinity(), donot_use_mm);
        case Metric::cosine: {
            auto norms = x.norm(2, /*dim=*/{1}, /*keepdim=*/true).clamp_min(1e-300);
            auto unit = x / norms;
            auto similarity = torch::mm(unit, unit.t());
            // Symmetrize away rounding differences between (i, j) and (j, i).
            similarity = (similarity + similarity.t()) / 2.0;
            return (1.0 - similarity).clamp_min(0.0);
        }
    }
    throw std::logic_error("Invalid Metric");
}

void BruteForceIndex::fit(torch::Tensor const& points) {
    if (points.dim() != 2) {
        throw ParameterError("points must be 2-D [n, d], got " + shape_string(points));
    }
    points_ = points.to(torch::kFloat64).contiguous();
}

torch::Tensor BruteForceIndex::kneighbors_graph(
    int64_t n_neighbors,
    KnnGraphMode mode) const {

    if (!points_.defined()) {
        throw std::logic_error("BruteForceIndex queried before fit()");
    }

    int64_t const n = points_.size(0);
    if (n_neighbors < 0 || (n_neighbors > 0 && n_neighbors >= n)) {
        throw ParameterError(
            "n_neighbors must be in [0, " + std::to_string(n) + "), got " +
            std::to_string(n_neighbors));
    }

    auto const opts = sparse_opts(points_);
    auto const long_opts = long_opts_like(points_);

    if (n_neighbors == 0) {
        return torch::sparse_coo_tensor(
            torch::empty({2, 0}, long_opts), torch::empty(0, opts), {n, n}, opts).coalesce();
    }

    auto distances = pairwise_distances(points_, metric_);
    // A point is never its own neighbor.
    distances.fill_diagonal_(std::numeric_limits<double>::infinity());

    auto [sorted, order] = torch::sort(distances, /*stable=*/true, /*dim=*/1, /*descending=*/false);
    auto nearest = order.slice(1, 0, n_neighbors);          // [n, n_neighbors]
    auto nearest_dist = sorted.slice(1, 0, n_neighbors);    // [n, n_neighbors]

    auto rows = torch::arange(n, long_opts).repeat_interleave(n_neighbors);
    auto cols = nearest.reshape({-1});
    auto values = mode == KnnGraphMode::distance
        ? nearest_dist.reshape({-1})
        : torch::ones(n * n_neighbors, opts);

    return torch::sparse_coo_tensor(
        torch::stack({rows, cols}), values, {n, n}, opts).coalesce();
}
