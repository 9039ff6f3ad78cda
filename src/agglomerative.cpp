#include "agglomerative.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

torch::Tensor temporal_connectivity(int64_t n) {
    if (n < 1) {
        throw ParameterError("number of frames must be >= 1, got " + std::to_string(n));
    }
    auto const long_opts = torch::TensorOptions().dtype(torch::kLong);

    auto frames = torch::arange(n, long_opts);
    auto next = torch::arange(1, n, long_opts);
    auto prev = torch::arange(0, n - 1, long_opts);

    auto rows = torch::cat({frames, prev, next});
    auto cols = torch::cat({frames, next, prev});
    auto values = torch::ones(rows.size(0), long_opts);

    return torch::sparse_coo_tensor(torch::stack({rows, cols}), values, {n, n}, long_opts).coalesce();
}

torch::Tensor agglomerative(
    torch::Tensor const& data,
    int64_t k,
    TemporalClusterer& clusterer,
    int64_t axis) {

    if (k < 1) {
        throw ParameterError("number of segments k must be >= 1, got " + std::to_string(k));
    }
    if (data.dim() < 1) {
        throw ParameterError("data must have at least 1 dimension");
    }

    auto x = data.dim() == 1 ? data.unsqueeze(0) : data;
    int64_t const time_dim = resolve_dim(axis, x.dim());
    int64_t const n = x.size(time_dim);
    if (n < 1) {
        throw ParameterError("data has no frames along axis " + std::to_string(axis));
    }

    auto points = torch::movedim(x, time_dim, 0).reshape({n, -1}).to(torch::kFloat64);
    auto labels = clusterer.fit(points, k, temporal_connectivity(n));

    if (labels.dim() != 1 || labels.size(0) != n) {
        throw std::runtime_error(
            "clusterer returned labels of shape " + shape_string(labels) +
            " for " + std::to_string(n) + " points");
    }

    // A boundary starts wherever the label changes.
    auto changes = torch::nonzero(labels.to(torch::kLong).diff()).reshape({-1}) + 1;
    return torch::cat({torch::zeros(1, torch::kLong), changes});
}

torch::Tensor subsegment(
    torch::Tensor const& data,
    torch::Tensor const& frames,
    TemporalClusterer& clusterer,
    int64_t n_segments,
    int64_t axis) {

    if (n_segments < 1) {
        throw ParameterError("n_segments must be a positive integer, got " + std::to_string(n_segments));
    }
    if (data.dim() < 1) {
        throw ParameterError("data must have at least 1 dimension");
    }

    auto x = data.dim() == 1 ? data.unsqueeze(0) : data;
    int64_t const time_dim = resolve_dim(axis, x.dim());
    int64_t const n = x.size(time_dim);

    // Clip to [0, n], add both ends, sort and deduplicate.
    auto clipped = frames.reshape({-1}).to(torch::kLong).clamp(0, n);
    auto padded = torch::cat({torch::zeros(1, torch::kLong), clipped, torch::full({1}, n, torch::kLong)});
    auto sorted = std::get<0>(torch::sort(padded));
    auto bounds = std::get<0>(torch::unique_consecutive(sorted));

    auto const b = bounds.accessor<int64_t, 1>();
    std::vector<torch::Tensor> boundaries;
    for (int64_t i = 0; i + 1 < bounds.size(0); ++i) {
        int64_t const start = b[i];
        int64_t const stop = b[i + 1];
        auto segment = x.slice(time_dim, start, stop);
        auto local = agglomerative(segment, std::min(stop - start, n_segments), clusterer, time_dim);
        boundaries.push_back(local + start);
    }
    spdlog::debug("subsegment: {} intervals split into at most {} pieces each",
                  boundaries.size(), n_segments);

    if (boundaries.empty()) {
        return torch::zeros(0, torch::kLong);
    }
    return torch::cat(boundaries);
}
