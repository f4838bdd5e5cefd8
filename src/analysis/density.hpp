#pragma once

#include "analysis/sample_stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <stdexcept>
#include <vector>

// ---------------------------------------------------------------------------
// DensityEstimate — kernel density evaluated on a regular grid over [from, to]
// ---------------------------------------------------------------------------
struct DensityEstimate {
    std::vector<double> x;
    std::vector<double> y;
    double bandwidth = 0.0;
    int sample_count = 0;

    double from() const { return x.empty() ? 0.0 : x.front(); }
    double to() const { return x.empty() ? 0.0 : x.back(); }
};

namespace density {

constexpr int DEFAULT_GRID_POINTS = 512;

// Silverman's rule of thumb: 0.9 * min(sd, IQR / 1.34) * k^(-1/5).
// Degenerate spread falls back to sd, then |x_0|, then 1.
inline double silverman_bandwidth(const std::vector<double>& samples) {
    if (samples.size() < 2) {
        throw std::invalid_argument("bandwidth selection needs at least 2 samples");
    }
    double sd = sample_stats::sample_sd(samples);
    auto q = sample_stats::quantiles(samples, {0.25, 0.75});
    double iqr = q[1] - q[0];

    double spread = std::min(sd, iqr / 1.34);
    if (spread <= 0.0) spread = sd;
    if (spread <= 0.0) spread = std::abs(samples.front());
    if (spread <= 0.0) spread = 1.0;

    return 0.9 * spread * std::pow(static_cast<double>(samples.size()), -0.2);
}

// Gaussian kernel density estimate on `grid_points` equally spaced points.
inline DensityEstimate gaussian_kde(const std::vector<double>& samples, double from, double to,
                                    int grid_points = DEFAULT_GRID_POINTS) {
    if (samples.size() < 2) {
        throw std::invalid_argument("density estimation needs at least 2 samples");
    }
    if (grid_points < 2) {
        throw std::invalid_argument("density grid needs at least 2 points");
    }
    if (to < from) {
        throw std::invalid_argument("density support must satisfy from <= to");
    }

    DensityEstimate est;
    est.bandwidth = silverman_bandwidth(samples);
    est.sample_count = static_cast<int>(samples.size());
    est.x.resize(grid_points);
    est.y.resize(grid_points);

    const double h = est.bandwidth;
    const double norm = 1.0 / (static_cast<double>(samples.size()) * h *
                               std::sqrt(2.0 * std::numbers::pi));
    const double step = (to - from) / static_cast<double>(grid_points - 1);

    for (int i = 0; i < grid_points; ++i) {
        double xi = (i == grid_points - 1) ? to : from + step * static_cast<double>(i);
        double sum = 0.0;
        for (double s : samples) {
            double u = (xi - s) / h;
            sum += std::exp(-0.5 * u * u);
        }
        est.x[i] = xi;
        est.y[i] = sum * norm;
    }
    return est;
}

}  // namespace density
