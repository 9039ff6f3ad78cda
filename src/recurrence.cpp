#include "recurrence.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

/// A staged edge either carries a real value, or is a self-loop whose value
/// is only assigned at finalization (affinity and distance modes). Keeping
/// the two apart lets self-loops pass symmetrization and zero elimination
/// without skewing the bandwidth estimate.
enum class CellState : uint8_t { value, pending_self_loop };

struct Edge {
    int64_t col;
    double value;
    CellState state;
};

using EdgeRows = std::vector<std::vector<Edge>>;

/// Split a sparse [n, n] graph into per-row edge lists in column order.
/// Throws std::runtime_error if the neighbor index returned anything else.
EdgeRows graph_to_rows(torch::Tensor const& graph, int64_t n) {
    if (!graph.defined() || !graph.is_sparse() || graph.dim() != 2 ||
        graph.size(0) != n || graph.size(1) != n) {
        throw std::runtime_error(
            "neighbor index returned a graph of shape " +
            (graph.defined() ? shape_string(graph) : std::string("(undefined)")) +
            ", expected sparse (" + std::to_string(n) + ", " + std::to_string(n) + ")");
    }

    // Checked before coalescing: an out-of-range index would alias another cell.
    auto raw = graph._indices();
    if (raw.numel() > 0 &&
        (raw.min().item<int64_t>() < 0 || raw.max().item<int64_t>() >= n)) {
        throw std::runtime_error(
            "neighbor index returned edges outside " + std::to_string(n) + " frames");
    }

    auto coalesced = graph.coalesce();
    auto indices = coalesced.indices().to(torch::kCPU, torch::kLong).contiguous();
    auto values = coalesced.values().to(torch::kCPU, torch::kFloat64).contiguous();
    auto idx = indices.accessor<int64_t, 2>();
    auto val = values.accessor<double, 1>();

    EdgeRows rows(n);
    for (int64_t e = 0; e < values.size(0); ++e) {
        rows[idx[0][e]].push_back({idx[1][e], val[e], CellState::value});
    }
    return rows;
}

/// Drop links inside the exclusion band, then keep the k smallest values per
/// row. The sort is stable, so equal values keep the index's column order.
void prune_rows(EdgeRows& rows, int64_t width, int64_t k) {
    for (int64_t i = 0; i < static_cast<int64_t>(rows.size()); ++i) {
        auto& row = rows[i];
        std::erase_if(row, [&](Edge const& e) { return std::abs(e.col - i) < width; });
        std::stable_sort(row.begin(), row.end(),
            [](Edge const& a, Edge const& b) { return a.value < b.value; });
        if (static_cast<int64_t>(row.size()) > k) {
            row.resize(k);
        }
    }
}

void sort_by_column(EdgeRows& rows) {
    for (auto& row : rows) {
        std::sort(row.begin(), row.end(),
            [](Edge const& a, Edge const& b) { return a.col < b.col; });
    }
}

/// Elementwise minimum of the staged matrix and its transpose: an edge
/// survives only if its mirror exists, carrying the smaller value.
/// Diagonal entries are their own mirror.
EdgeRows symmetrize(EdgeRows rows) {
    sort_by_column(rows);

    auto find = [&](int64_t row, int64_t col) -> Edge const* {
        auto const& r = rows[row];
        auto it = std::lower_bound(r.begin(), r.end(), col,
            [](Edge const& e, int64_t c) { return e.col < c; });
        return (it != r.end() && it->col == col) ? &*it : nullptr;
    };

    EdgeRows result(rows.size());
    for (int64_t i = 0; i < static_cast<int64_t>(rows.size()); ++i) {
        for (auto const& edge : rows[i]) {
            if (edge.col == i) {
                result[i].push_back(edge);
                continue;
            }
            auto const* mirror = find(edge.col, i);
            if (mirror == nullptr) continue;
            result[i].push_back({edge.col, std::min(edge.value, mirror->value), edge.state});
        }
    }
    return result;
}

/// Median over rows of each row's largest finite value. Rows holding no
/// finite real value (only a pending self-loop, or nothing) are skipped.
double estimate_bandwidth(EdgeRows const& rows) {
    std::vector<double> row_max;
    for (auto const& row : rows) {
        double best = -std::numeric_limits<double>::infinity();
        for (auto const& e : row) {
            if (e.state == CellState::value && std::isfinite(e.value)) {
                best = std::max(best, e.value);
            }
        }
        if (std::isfinite(best)) row_max.push_back(best);
    }
    if (row_max.empty()) {
        spdlog::warn("recurrence_matrix: no edges to estimate the affinity bandwidth from");
        return std::numeric_limits<double>::quiet_NaN();
    }
    auto maxima = torch::tensor(row_max, torch::kFloat64);
    return torch::quantile(maxima, 0.5).item<double>();
}

torch::Tensor assemble(EdgeRows rows, int64_t n, RecurrenceMode mode, bool sparse) {
    sort_by_column(rows);

    std::vector<int64_t> row_idx;
    std::vector<int64_t> col_idx;
    std::vector<double> values;
    for (int64_t i = 0; i < n; ++i) {
        for (auto const& e : rows[i]) {
            row_idx.push_back(i);
            col_idx.push_back(e.col);
            values.push_back(e.value);
        }
    }

    auto const long_opts = torch::TensorOptions().dtype(torch::kLong);
    auto indices = torch::stack({
        torch::tensor(row_idx, long_opts).reshape({-1}),
        torch::tensor(col_idx, long_opts).reshape({-1})});
    auto vals = torch::tensor(values, torch::kFloat64).reshape({-1});
    if (mode == RecurrenceMode::connectivity) {
        vals = vals.to(torch::kBool);
    }

    if (sparse) {
        return torch::sparse_coo_tensor(indices, vals, {n, n}, sparse_opts(vals)).coalesce();
    }
    auto dense = torch::zeros({n, n}, vals.options());
    dense.index_put_({indices[0], indices[1]}, vals);
    return dense;
}

}  // namespace

RecurrenceMode parse_recurrence_mode(std::string const& name) {
    if (name == "connectivity") return RecurrenceMode::connectivity;
    if (name == "distance") return RecurrenceMode::distance;
    if (name == "affinity") return RecurrenceMode::affinity;
    throw ParameterError(
        "Invalid mode='" + name + "'. Must be one of ['connectivity', 'distance', 'affinity']");
}

int64_t default_neighbor_count(int64_t n, int64_t width) {
    if (n > 2 * width + 1) {
        return 2 * static_cast<int64_t>(std::ceil(std::sqrt(static_cast<double>(n - 2 * width + 1))));
    }
    return 2;
}

RecurrenceMatrix recurrence_matrix(
    torch::Tensor const& data,
    RecurrenceOptions const& options) {

    BruteForceIndex index(options.metric);
    return recurrence_matrix(data, options, index);
}

RecurrenceMatrix recurrence_matrix(
    torch::Tensor const& data,
    RecurrenceOptions const& options,
    NeighborIndex& index) {

    if (data.dim() < 1) {
        throw ParameterError("data must have at least 1 dimension");
    }
    if (data.is_sparse()) {
        throw ParameterError("data must be a dense tensor");
    }

    // A 1-D input is a sequence of scalar features.
    auto x = data.dim() == 1 ? data.unsqueeze(0) : data;
    int64_t const time_dim = resolve_dim(options.axis, x.dim());
    int64_t const n = x.size(time_dim);
    int64_t const width = options.width;

    if (width < 1 || width > n) {
        throw ParameterError(
            "width=" + std::to_string(width) + " must be at least 1 and at most data.shape[" +
            std::to_string(options.axis) + "]=" + std::to_string(n));
    }
    if (options.k && *options.k < 1) {
        throw ParameterError("k=" + std::to_string(*options.k) + " must be at least 1");
    }
    if (options.bandwidth && !(*options.bandwidth > 0.0)) {
        throw ParameterError(
            "Invalid bandwidth=" + std::to_string(*options.bandwidth) +
            ". Must be strictly positive.");
    }

    int64_t const k = options.k.value_or(default_neighbor_count(n, width));
    int64_t const n_neighbors = std::min(n - 1, k + 2 * width);
    spdlog::debug("recurrence_matrix: n={}, width={}, k={}, querying {} neighbors",
                  n, width, k, n_neighbors);

    auto points = torch::movedim(x, time_dim, 0).reshape({n, -1});
    index.fit(points);

    // Always rank by distance, whatever the output mode.
    auto rows = graph_to_rows(index.kneighbors_graph(n_neighbors, KnnGraphMode::distance), n);
    prune_rows(rows, width, k);

    if (options.mode == RecurrenceMode::connectivity) {
        for (auto& row : rows) {
            for (auto& e : row) e.value = 1.0;
        }
    }

    if (options.self_loops) {
        for (int64_t i = 0; i < n; ++i) {
            if (options.mode == RecurrenceMode::connectivity) {
                rows[i].push_back({i, 1.0, CellState::value});
            } else {
                rows[i].push_back({i, 0.0, CellState::pending_self_loop});
            }
        }
    }

    if (options.sym) {
        rows = symmetrize(std::move(rows));
    }

    for (auto& row : rows) {
        std::erase_if(row, [](Edge const& e) {
            return e.state == CellState::value && e.value == 0.0;
        });
    }

    double bandwidth = std::numeric_limits<double>::quiet_NaN();
    switch (options.mode) {
        case RecurrenceMode::connectivity:
            break;
        case RecurrenceMode::distance:
            // Self-loops are explicit zero distances.
            for (auto& row : rows) {
                for (auto& e : row) {
                    if (e.state == CellState::pending_self_loop) e.value = 0.0;
                }
            }
            break;
        case RecurrenceMode::affinity: {
            bandwidth = options.bandwidth ? *options.bandwidth : estimate_bandwidth(rows);
            spdlog::debug("recurrence_matrix: affinity bandwidth={}", bandwidth);
            for (auto& row : rows) {
                for (auto& e : row) {
                    double const d = e.state == CellState::pending_self_loop ? 0.0 : e.value;
                    e.value = std::exp(-d / bandwidth);
                }
            }
            break;
        }
        default:
            throw std::logic_error("Invalid RecurrenceMode");
    }

    return RecurrenceMatrix{
        .matrix = assemble(std::move(rows), n, options.mode, options.sparse),
        .mode = options.mode,
        .bandwidth = bandwidth,
    };
}
