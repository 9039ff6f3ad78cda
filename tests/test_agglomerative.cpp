#include "agglomerative.hpp"

#include "test_util.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

/// Splits the sequence into n_clusters equal runs, recording what it was given.
class EqualRunsClusterer : public TemporalClusterer {
public:
    torch::Tensor fit(
        torch::Tensor const& points,
        int64_t n_clusters,
        torch::Tensor const& connectivity) override {
        calls.push_back(points.size(0));
        last_dims = points.size(1);
        last_connectivity = connectivity;
        int64_t const n = points.size(0);
        return torch::div(torch::arange(n, torch::kLong) * n_clusters, n, /*rounding_mode=*/"floor");
    }

    std::vector<int64_t> calls;
    int64_t last_dims = 0;
    torch::Tensor last_connectivity;
};

/// Labels every frame by the sign of its first feature.
class SignClusterer : public TemporalClusterer {
public:
    torch::Tensor fit(torch::Tensor const& points, int64_t, torch::Tensor const&) override {
        return (points.select(1, 0) > 0).to(torch::kLong);
    }
};

class BrokenClusterer : public TemporalClusterer {
public:
    torch::Tensor fit(torch::Tensor const& points, int64_t, torch::Tensor const&) override {
        return torch::zeros(points.size(0) + 1, torch::kLong);
    }
};

static void test_temporal_connectivity() {
    auto graph = temporal_connectivity(4);
    assert(graph.is_sparse());
    auto dense = graph.to_dense();
    auto expected = torch::tensor({
        {1, 1, 0, 0},
        {1, 1, 1, 0},
        {0, 1, 1, 1},
        {0, 0, 1, 1}}, torch::kLong);
    assert(dense.equal(expected));

    assert(temporal_connectivity(1).to_dense().equal(torch::ones({1, 1}, torch::kLong)));
    expect_parameter_error([] { temporal_connectivity(0); }, "no frames");
    std::cout << "  test_temporal_connectivity passed." << std::endl;
}

static void test_agglomerative_boundaries() {
    EqualRunsClusterer clusterer;
    auto data = torch::rand({5, 12}, torch::kFloat64);

    auto bounds = agglomerative(data, 3, clusterer);
    assert(bounds.equal(torch::tensor({0, 4, 8}, torch::kLong)));
    assert(clusterer.last_dims == 5);
    assert(clusterer.last_connectivity.size(0) == 12);

    // One cluster: a single segment starting at 0.
    assert(agglomerative(data, 1, clusterer).equal(torch::tensor({0}, torch::kLong)));
    std::cout << "  test_agglomerative_boundaries passed." << std::endl;
}

// Boundaries come from label changes, even when a label recurs.
static void test_agglomerative_label_changes() {
    SignClusterer clusterer;
    auto data = torch::tensor({{-1.0, -2.0, 3.0, 4.0, -5.0, 6.0}}, torch::kFloat64);
    auto bounds = agglomerative(data, 2, clusterer);
    assert(bounds.equal(torch::tensor({0, 2, 4, 5}, torch::kLong)));

    // Time on the first axis.
    auto by_rows = agglomerative(data.t().contiguous(), 2, clusterer, 0);
    assert(by_rows.equal(bounds));
    std::cout << "  test_agglomerative_label_changes passed." << std::endl;
}

static void test_subsegment() {
    EqualRunsClusterer clusterer;
    auto data = torch::rand({3, 12}, torch::kFloat64);

    auto bounds = subsegment(data, torch::tensor({4, 8}, torch::kLong), clusterer, 2);
    assert(bounds.equal(torch::tensor({0, 2, 4, 6, 8, 10}, torch::kLong)));
    assert((clusterer.calls == std::vector<int64_t>{4, 4, 4}));

    // Frames are clipped, sorted and deduplicated; short intervals split less.
    clusterer.calls.clear();
    auto messy = subsegment(data, torch::tensor({11, 4, 4, 20, -3}, torch::kLong), clusterer, 4);
    assert(messy.equal(torch::tensor({0, 1, 2, 3, 4, 6, 8, 10, 11}, torch::kLong)));
    assert((clusterer.calls == std::vector<int64_t>{4, 7, 1}));
    std::cout << "  test_subsegment passed." << std::endl;
}

static void test_invalid_arguments() {
    EqualRunsClusterer clusterer;
    auto data = torch::rand({2, 6}, torch::kFloat64);
    expect_parameter_error([&] { agglomerative(data, 0, clusterer); }, "k = 0");
    expect_parameter_error([&] { subsegment(data, torch::tensor({3}), clusterer, 0); }, "n_segments = 0");

    BrokenClusterer broken;
    bool threw = false;
    try {
        agglomerative(data, 2, broken);
    } catch (std::runtime_error const&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  test_invalid_arguments passed." << std::endl;
}

int main() {
    init_test_logging();

    test_temporal_connectivity();
    test_agglomerative_boundaries();
    test_agglomerative_label_changes();
    test_subsegment();
    test_invalid_arguments();

    std::cout << "All agglomerative tests passed." << std::endl;
    return 0;
}
