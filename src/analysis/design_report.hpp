#pragma once

#include "analysis/design_analysis.hpp"
#include "analysis/sample_stats.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// design_report — human-readable summary of a DesignAnalysisResult
// ---------------------------------------------------------------------------
namespace design_report {

// Stopping-n quantiles shown in the report.
inline const std::vector<double> STOPPING_N_PROBS = {0.50, 0.80, 0.90, 0.95};

// Largest number of decimals format_number honors.
constexpr int MAX_DIGITS = 12;

// Round to `digits` decimals (clamped to [0, MAX_DIGITS]), halves to even;
// trailing zeros are dropped ("50", "12.3"). Infinities print as "Inf"/"-Inf".
inline std::string format_number(double value, int digits) {
    if (std::isinf(value)) return value > 0 ? "Inf" : "-Inf";
    double scale = std::pow(10.0, std::clamp(digits, 0, MAX_DIGITS));
    double rounded = std::nearbyint(value * scale) / scale;
    if (rounded == 0.0) rounded = 0.0;  // no "-0"
    std::ostringstream ss;
    ss << std::setprecision(15) << rounded;
    return ss.str();
}

inline std::string format_percent(double fraction, int digits) {
    return format_number(fraction * 100.0, digits) + "%";
}

// Stopping-n quantiles (type 7 interpolation), rounded up to whole samples.
inline std::vector<int> stopping_n_quantiles(const DesignAnalysisResult& result) {
    std::vector<int> out;
    if (result.endpoint_n.empty()) return out;
    for (double q : sample_stats::quantiles(result.endpoint_n, STOPPING_N_PROBS)) {
        out.push_back(static_cast<int>(std::ceil(q)));
    }
    return out;
}

namespace detail {

inline void render_settings(std::ostringstream& ss, const DesignAnalysisResult& r) {
    ss << "Analysis settings: boundary = {" << format_number(r.boundary.lower(), 4)
       << ", " << format_number(r.boundary.upper(), 4) << "}"
       << ", n_min = " << r.n_min << ", n_max = " << r.n_max
       << ", trajectories = " << r.all_traj_n << "\n\n";
}

inline void render_outcome_table(std::ostringstream& ss, const DesignAnalysisResult& r,
                                 int digits) {
    const std::vector<std::pair<std::string, double>> rows = {
        {"Studies terminating at n.max (n = " + std::to_string(r.n_max) + ")", r.n_max_hit_frac},
        {"Studies terminating at a boundary", r.boundary_hit_frac},
        {"--> Terminating at H1 boundary", r.upper_hit_frac},
        {"--> Terminating at H0 boundary", r.lower_hit_frac},
    };

    size_t label_width = std::string("outcome").size();
    for (const auto& [label, frac] : rows) label_width = std::max(label_width, label.size());
    const int pct_width = 10;

    ss << std::left << std::setw(static_cast<int>(label_width)) << "outcome"
       << std::right << std::setw(pct_width) << "percentage" << "\n";
    for (const auto& [label, frac] : rows) {
        ss << std::left << std::setw(static_cast<int>(label_width)) << label
           << std::right << std::setw(pct_width) << format_percent(frac, digits) << "\n";
    }
}

inline void render_n_max_breakdown(std::ostringstream& ss, const DesignAnalysisResult& r,
                                   int digits) {
    ss << "\nOf " << format_percent(r.n_max_hit_frac, digits)
       << " of studies terminating at n.max:\n"
       << format_percent(r.n_max_hit_h1, digits) << " showed evidence for H1 (BF > 3)\n"
       << format_percent(r.n_max_hit_inconclusive, digits)
       << " were inconclusive (3 > BF > 1/3)\n"
       << format_percent(r.n_max_hit_h0, digits) << " showed evidence for H0 (BF < 1/3)\n";
}

inline void render_stopping_n(std::ostringstream& ss, const DesignAnalysisResult& r) {
    if (r.asn) {
        ss << "\nAverage sample number (ASN) at stopping point "
           << "(both boundary hits and n.max): n = " << *r.asn << "\n";
    }

    auto q = stopping_n_quantiles(r);
    if (q.empty()) return;

    ss << "\nSample number quantiles (50/80/90/95%) at stopping point:\n";
    for (double p : STOPPING_N_PROBS) {
        ss << std::setw(8) << (format_number(p * 100.0, 0) + "%");
    }
    ss << "\n";
    for (int v : q) ss << std::setw(8) << v;
    ss << "\n";
}

inline void render_power(std::ostringstream& ss, const DesignAnalysisResult& r, int digits) {
    ss << "\nFor fixed-n designs:\n--------------------\n"
       << "Frequentist power estimate (studies with p < " << format_number(r.alpha, 4)
       << ") = " << format_percent(*r.p_value_power, digits) << "\n";
}

inline void render_warnings(std::ostringstream& ss, const DesignAnalysisResult& r) {
    ss << "\nWarnings:\n";
    for (const auto& w : r.warnings) {
        ss << "  [" << warning_kind_str(w.kind) << "] " << w.message << "\n";
    }
}

}  // namespace detail

// Render the outcome table, n_max breakdown, ASN/quantiles and (fixed-n only)
// frequentist power. Sections without data are skipped.
inline std::string render_report(const DesignAnalysisResult& result, int digits = 1) {
    std::ostringstream ss;
    detail::render_settings(ss, result);
    detail::render_outcome_table(ss, result, digits);

    if (result.n_max_traj_n > 0) {
        detail::render_n_max_breakdown(ss, result, digits);
    }
    if (result.boundary_traj_n > 0) {
        detail::render_stopping_n(ss, result);
    }
    if (result.is_fixed_design && result.p_value_power) {
        detail::render_power(ss, result, digits);
    }
    if (!result.warnings.empty()) {
        detail::render_warnings(ss, result);
    }
    return ss.str();
}

}  // namespace design_report
