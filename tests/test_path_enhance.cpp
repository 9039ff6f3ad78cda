#include "path_enhance.hpp"

#include "diagonal_filter.hpp"
#include "test_util.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

static constexpr double TOL = 1e-12;

static torch::Tensor striped_matrix(int64_t n) {
    torch::manual_seed(42);
    auto r = 0.1 * torch::rand({n, n}, torch::kFloat64);
    for (int64_t i = 0; i + 5 < n; ++i) {
        r[i + 5][i] = 1.0;
        r[i][i + 5] = 1.0;
    }
    return r;
}

// max_ratio = 2, min_ratio omitted, 3 filters: ratios are 1/2, 1 and 2.
static void test_default_ratio_range() {
    auto ratios = tempo_ratios(0.5, 2.0, 3);
    assert(ratios.size() == 3);
    assert_near(ratios[0], 0.5, TOL, "ratio 0");
    assert_near(ratios[1], 1.0, TOL, "ratio 1");
    assert_near(ratios[2], 2.0, TOL, "ratio 2");

    // Odd counts over a reciprocal range include the main diagonal.
    auto seven = tempo_ratios(0.5, 2.0, 7);
    assert_near(seven[3], 1.0, TOL, "middle of seven");
    for (size_t i = 0; i < seven.size(); ++i) {
        assert_near(seven[i] * seven[seven.size() - 1 - i], 1.0, TOL, "reciprocal pairs");
    }

    auto single = tempo_ratios(0.25, 4.0, 1);
    assert(single.size() == 1);
    assert_near(single[0], 0.25, TOL, "single ratio is min_ratio");
    std::cout << "  test_default_ratio_range passed." << std::endl;
}

// Without min_ratio the filters span 1/max_ratio .. max_ratio: {1/2, 1, 2}.
static void test_default_min_ratio_filters() {
    auto r = striped_matrix(18);
    PathEnhanceOptions options;
    options.n_filters = 3;
    options.clip = false;

    auto enhanced = path_enhance(r, 5, options);

    torch::Tensor expected;
    for (double ratio : {0.5, 1.0, 2.0}) {
        auto response = convolve2d(r, diagonal_filter(WindowType::hann, 5, ratio), options.convolve);
        expected = expected.defined() ? torch::maximum(expected, response) : response;
    }
    assert_tensor_near(enhanced, expected, TOL, "default ratio range");
    std::cout << "  test_default_min_ratio_filters passed." << std::endl;
}

// One filter at ratio 1 is exactly one diagonal convolution.
static void test_single_filter_is_single_convolution() {
    auto r = striped_matrix(24);
    PathEnhanceOptions options;
    options.max_ratio = 1.0;
    options.n_filters = 1;
    options.clip = false;

    auto enhanced = path_enhance(r, 9, options);
    auto expected = convolve2d(r, diagonal_filter(WindowType::hann, 9, 1.0), options.convolve);
    assert_tensor_near(enhanced, expected, 0.0, "single filter");
    std::cout << "  test_single_filter_is_single_convolution passed." << std::endl;
}

// The aggregate is the elementwise maximum of the per-ratio responses.
static void test_max_aggregation() {
    auto r = striped_matrix(20);
    PathEnhanceOptions options;
    options.n_filters = 5;
    options.clip = false;

    auto enhanced = path_enhance(r, 7, options);

    torch::Tensor expected;
    for (double ratio : tempo_ratios(0.5, 2.0, 5)) {
        auto response = convolve2d(r, diagonal_filter(WindowType::hann, 7, ratio), options.convolve);
        assert((enhanced - response).min().item<double>() >= -TOL);
        expected = expected.defined() ? torch::maximum(expected, response) : response;
    }
    assert_tensor_near(enhanced, expected, TOL, "running maximum");
    std::cout << "  test_max_aggregation passed." << std::endl;
}

// An impulse spreads each zero-mean kernel into the output; cells off every
// line carry the negative offset.
static void test_clip_removes_negatives() {
    auto r = torch::zeros({21, 21}, torch::kFloat64);
    r[10][10] = 1.0;

    PathEnhanceOptions options;
    options.zero_mean = true;
    options.clip = false;

    auto raw = path_enhance(r, 7, options);
    assert(raw[12][8].item<double>() < 0.0);

    options.clip = true;
    auto clipped = path_enhance(r, 7, options);
    assert(clipped.min().item<double>() >= 0.0);
    assert_tensor_near(clipped, raw.clamp_min(0.0), TOL, "clip");
    std::cout << "  test_clip_removes_negatives passed." << std::endl;
}

// Smoothing along the stripe keeps it above the unstructured background.
static void test_enhances_diagonal_stripe() {
    int64_t const n = 30;
    auto r = striped_matrix(n);
    auto enhanced = path_enhance(r, 5);
    assert(enhanced.sizes() == r.sizes());

    double const on_stripe = enhanced[15][10].item<double>();
    double const off_stripe = enhanced[15][25].item<double>();
    assert(on_stripe > 0.5);
    assert(off_stripe < 0.2);
    std::cout << "  test_enhances_diagonal_stripe passed." << std::endl;
}

// Cross-similarity matrices need not be square; bool input is promoted.
static void test_rectangular_and_bool_input() {
    auto cross = torch::rand({10, 14}, torch::kFloat64);
    auto out = path_enhance(cross, 3);
    assert(out.size(0) == 10);
    assert(out.size(1) == 14);

    auto boolean = torch::eye(12, torch::kBool);
    auto promoted = path_enhance(boolean, 3);
    assert(promoted.scalar_type() == torch::kFloat64);
    std::cout << "  test_rectangular_and_bool_input passed." << std::endl;
}

static void test_invalid_parameters() {
    auto r = torch::rand({8, 8}, torch::kFloat64);

    PathEnhanceOptions inverted;
    inverted.max_ratio = 1.5;
    inverted.min_ratio = 2.0;
    expect_parameter_error([&] { path_enhance(r, 3, inverted); }, "min_ratio > max_ratio");

    PathEnhanceOptions non_positive;
    non_positive.max_ratio = 0.0;
    expect_parameter_error([&] { path_enhance(r, 3, non_positive); }, "max_ratio 0");

    PathEnhanceOptions no_filters;
    no_filters.n_filters = 0;
    expect_parameter_error([&] { path_enhance(r, 3, no_filters); }, "n_filters 0");

    expect_parameter_error([&] { path_enhance(r.to_sparse(), 3); }, "sparse input");
    expect_parameter_error([&] { path_enhance(r, 0); }, "n 0");
    std::cout << "  test_invalid_parameters passed." << std::endl;
}

int main() {
    init_test_logging();

    test_default_ratio_range();
    test_default_min_ratio_filters();
    test_single_filter_is_single_convolution();
    test_max_aggregation();
    test_clip_removes_negatives();
    test_enhances_diagonal_stripe();
    test_rectangular_and_bool_input();
    test_invalid_parameters();

    std::cout << "All path_enhance tests passed." << std::endl;
    return 0;
}
