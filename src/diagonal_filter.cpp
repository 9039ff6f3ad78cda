#include "diagonal_filter.hpp"

#include "errors.hpp"

#include <array>
#include <cmath>
#include <numbers>

/// Quintic B-spline basis, supported on |t| < 3.
static double bspline5(double t) {
    double const a = std::abs(t);
    if (a >= 3.0) return 0.0;
    double value = std::pow(3.0 - a, 5);
    if (a < 2.0) value -= 6.0 * std::pow(2.0 - a, 5);
    if (a < 1.0) value += 15.0 * std::pow(1.0 - a, 5);
    return value / 120.0;
}

/// Mirror an out-of-range sample index back into [0, n): -1 -> 1, n -> n - 2.
static int64_t mirror_index(int64_t i, int64_t n) {
    if (n == 1) return 0;
    int64_t const period = 2 * n - 2;
    int64_t q = i % period;
    if (q < 0) q += period;
    return q < n ? q : period - q;
}

/// Rotate a square kernel about its center so that its main diagonal (45
/// degrees in row-down coordinates) ends up at 45 degrees minus `radians`.
///
/// Samples are quintic B-spline combinations of the source values (no
/// prefilter), with spline taps past the edge mirrored back inside. Cells
/// whose source position falls outside the source grid are zero.
static torch::Tensor rotate_kernel(torch::Tensor const& source, double radians) {
    int64_t const n = source.size(0);
    double const c = std::cos(radians);
    double const s = std::sin(radians);

    // Output grid is the bounding box of the rotated source square.
    auto const m = static_cast<int64_t>(
        static_cast<double>(n) * (std::abs(c) + std::abs(s)) + 0.5);

    double const in_center = (static_cast<double>(n) - 1.0) / 2.0;
    double const out_center = (static_cast<double>(m) - 1.0) / 2.0;
    double const edge = static_cast<double>(n) - 1.0;
    constexpr double eps = 1e-9;
    constexpr int64_t taps = 6;

    auto result = torch::zeros({m, m}, source.options());
    auto src = source.accessor<double, 2>();
    auto dst = result.accessor<double, 2>();

    std::array<int64_t, taps> row_idx{};
    std::array<int64_t, taps> col_idx{};
    std::array<double, taps> row_w{};
    std::array<double, taps> col_w{};

    auto fill_taps = [&](double pos, std::array<int64_t, taps>& idx, std::array<double, taps>& w) {
        auto const first = static_cast<int64_t>(std::floor(pos)) - 2;
        for (int64_t t = 0; t < taps; ++t) {
            idx[t] = mirror_index(first + t, n);
            w[t] = bspline5(pos - static_cast<double>(first + t));
        }
    };

    for (int64_t r = 0; r < m; ++r) {
        for (int64_t col = 0; col < m; ++col) {
            // Map the output cell back into the source frame: a line at angle
            // a in the output lands on the source diagonal (45 degrees).
            double const x = static_cast<double>(col) - out_center;
            double const y = static_cast<double>(r) - out_center;
            double const src_col = x * c - y * s + in_center;
            double const src_row = x * s + y * c + in_center;

            if (src_row < -eps || src_row > edge + eps || src_col < -eps || src_col > edge + eps) {
                continue;
            }

            fill_taps(src_row, row_idx, row_w);
            fill_taps(src_col, col_idx, col_w);

            double value = 0.0;
            for (int64_t a = 0; a < taps; ++a) {
                double line = 0.0;
                for (int64_t b = 0; b < taps; ++b) {
                    line += col_w[b] * src[row_idx[a]][col_idx[b]];
                }
                value += row_w[a] * line;
            }
            dst[r][col] = value;
        }
    }
    return result;
}

torch::Tensor diagonal_filter(
    WindowType window,
    int64_t n,
    double slope,
    bool zero_mean) {

    if (n < 1) {
        throw ParameterError("filter length n must be >= 1, got " + std::to_string(n));
    }
    if (!(slope > 0.0) || !std::isfinite(slope)) {
        throw ParameterError("slope must be positive and finite, got " + std::to_string(slope));
    }

    auto const opts = torch::TensorOptions().dtype(torch::kFloat64);
    auto kernel = torch::diag(make_window(window, n, opts));

    double const rotation = std::numbers::pi / 4.0 - std::atan(slope);
    if (std::abs(rotation) > 1e-12) {
        kernel = rotate_kernel(kernel, rotation);
    }

    kernel = kernel.clamp_min(0.0);

    double const total = kernel.sum().item<double>();
    if (!(total > 0.0)) {
        throw ParameterError(
            "window of length " + std::to_string(n) + " has no positive mass");
    }
    kernel = kernel / total;

    if (zero_mean) {
        kernel = kernel - kernel.mean();
    }
    return kernel;
}
