#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace sample_stats {

inline double mean(const std::vector<double>& x) {
    if (x.empty()) {
        throw std::invalid_argument("mean of an empty sample");
    }
    double sum = 0.0;
    for (double v : x) sum += v;
    return sum / static_cast<double>(x.size());
}

// Sample standard deviation (n - 1 denominator). Zero for a single value.
inline double sample_sd(const std::vector<double>& x) {
    if (x.size() < 2) return 0.0;
    double m = mean(x);
    double ss = 0.0;
    for (double v : x) {
        double d = v - m;
        ss += d * d;
    }
    return std::sqrt(ss / static_cast<double>(x.size() - 1));
}

// Quantile by linear interpolation between order statistics at position
// p * (k - 1) (Hyndman & Fan type 7).
inline double quantile_sorted(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        throw std::invalid_argument("quantile of an empty sample");
    }
    if (p < 0.0 || p > 1.0) {
        throw std::invalid_argument("quantile probability must lie in [0, 1]");
    }
    size_t k = sorted.size();
    if (k == 1) return sorted[0];

    double pos = p * static_cast<double>(k - 1);
    size_t i0 = static_cast<size_t>(std::floor(pos));
    size_t i1 = std::min(k - 1, i0 + 1);
    double t = pos - static_cast<double>(i0);
    return sorted[i0] + t * (sorted[i1] - sorted[i0]);
}

inline double quantile(std::vector<double> x, double p) {
    std::sort(x.begin(), x.end());
    return quantile_sorted(x, p);
}

inline std::vector<double> quantiles(std::vector<double> x, const std::vector<double>& probs) {
    std::sort(x.begin(), x.end());
    std::vector<double> out;
    out.reserve(probs.size());
    for (double p : probs) out.push_back(quantile_sorted(x, p));
    return out;
}

}  // namespace sample_stats
