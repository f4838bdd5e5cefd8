#pragma once

#include "analysis/density.hpp"
#include "analysis/evidence_boundary.hpp"
#include "analysis/sample_stats.hpp"
#include "analysis/trajectory_classifier.hpp"
#include "data/trajectory_table.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// AnalysisParams — which region of the simulation to analyze
// Unset fields default to the data: n range of the table, largest boundary.
// ---------------------------------------------------------------------------
struct AnalysisParams {
    std::optional<int> n_min;
    std::optional<int> n_max;
    std::optional<EvidenceBoundary> boundary;
    double alpha = 0.05;
};

// ---------------------------------------------------------------------------
// AnalysisWarning — non-fatal condition detected during analysis
// ---------------------------------------------------------------------------
enum class WarningKind {
    BOUNDARY_EXCEEDS_SIMULATION,
    N_MAX_EXCEEDS_SIMULATION,
    OUTCOMES_DO_NOT_PARTITION,
    EMPTY_SELECTION,
};

inline std::string warning_kind_str(WarningKind kind) {
    switch (kind) {
        case WarningKind::BOUNDARY_EXCEEDS_SIMULATION: return "BOUNDARY_EXCEEDS_SIMULATION";
        case WarningKind::N_MAX_EXCEEDS_SIMULATION:    return "N_MAX_EXCEEDS_SIMULATION";
        case WarningKind::OUTCOMES_DO_NOT_PARTITION:   return "OUTCOMES_DO_NOT_PARTITION";
        case WarningKind::EMPTY_SELECTION:             return "EMPTY_SELECTION";
    }
    return "UNKNOWN";
}

struct AnalysisWarning {
    WarningKind kind;
    std::string message;
};

// ---------------------------------------------------------------------------
// DesignAnalysisResult — outcome distribution of a batch of trajectories
// ---------------------------------------------------------------------------
struct DesignAnalysisResult {
    explicit DesignAnalysisResult(EvidenceBoundary b) : boundary(b) {}

    // Settings the analysis ran with
    int n_min = 0;
    int n_max = 0;
    EvidenceBoundary boundary;
    double alpha = 0.05;
    bool is_fixed_design = false;

    // Disjoint outcome buckets
    std::vector<int64_t> upper_hit_ids;
    std::vector<int64_t> lower_hit_ids;
    std::vector<int64_t> n_max_hit_ids;
    std::vector<int64_t> unclassified_ids;

    int all_traj_n = 0;
    int boundary_traj_n = 0;
    int upper_hit_n = 0;
    int lower_hit_n = 0;
    int n_max_traj_n = 0;

    double n_max_hit_frac = 0.0;
    double boundary_hit_frac = 0.0;
    double upper_hit_frac = 0.0;
    double lower_hit_frac = 0.0;

    // Stopping sample sizes per outcome, and the pooled endpoint n
    std::vector<double> upper_hit_n_samples;
    std::vector<double> lower_hit_n_samples;
    std::vector<double> endpoint_n;

    // log BF at n_max for trajectories that never crossed a boundary
    std::vector<double> n_max_hit_log_bf;

    // Absent when the bucket has fewer than 2 trajectories
    std::optional<DensityEstimate> upper_density;
    std::optional<DensityEstimate> lower_density;
    std::optional<DensityEstimate> n_max_log_bf_density;

    // Average sample number, ceil(mean(endpoint_n)); absent with no endpoints
    std::optional<int> asn;

    // n_max outcomes by evidence category, as fractions of all_traj_n
    double n_max_hit_h1 = 0.0;            // BF > 3
    double n_max_hit_inconclusive = 0.0;  // 1/3 < BF < 3
    double n_max_hit_h0 = 0.0;            // BF < 1/3

    // Fraction of trajectories with p < alpha; fixed-n designs only
    std::optional<double> p_value_power;

    std::vector<AnalysisWarning> warnings;

    bool has_warning(WarningKind kind) const {
        return std::any_of(warnings.begin(), warnings.end(),
                           [kind](const AnalysisWarning& w) { return w.kind == kind; });
    }
};

// ---------------------------------------------------------------------------
// DesignAnalyzer — classifies every trajectory into upper-boundary hit,
// lower-boundary hit or n_max survival, then summarizes the outcomes.
//
// Coverage gaps and partition failures are reported as warnings on the
// result; the analysis always runs to completion. Only malformed arguments
// (empty table, alpha outside (0, 1), n_min > n_max) throw.
// ---------------------------------------------------------------------------
class DesignAnalyzer {
public:
    DesignAnalysisResult analyze(const TrajectoryTable& table,
                                 const AnalysisParams& params = {}) const {
        if (table.empty()) {
            throw std::invalid_argument("cannot analyze an empty trajectory table");
        }
        if (!(params.alpha > 0.0 && params.alpha < 1.0)) {
            throw std::invalid_argument("alpha must lie in (0, 1)");
        }

        EvidenceBoundary boundary = params.boundary
            ? *params.boundary
            : EvidenceBoundary::symmetric(table.max_boundary());

        DesignAnalysisResult result(boundary);
        result.n_min = params.n_min.value_or(table.min_n());
        result.n_max = params.n_max.value_or(table.max_n());
        result.alpha = params.alpha;

        if (result.n_min > result.n_max) {
            throw std::invalid_argument("n_min (" + std::to_string(result.n_min) +
                                        ") exceeds n_max (" + std::to_string(result.n_max) + ")");
        }

        check_coverage(table, result);

        TrajectoryTable working = table.restrict_n(result.n_min, result.n_max);
        if (working.empty()) {
            warn(result, WarningKind::EMPTY_SELECTION,
                 "No observations with " + std::to_string(result.n_min) + " <= n <= " +
                 std::to_string(result.n_max) + "; nothing to analyze.");
            return result;
        }

        std::vector<Trajectory> trajectories = working.group_by_id();
        classify(trajectories, result);
        summarize(working, trajectories, result);
        return result;
    }

private:
    static void warn(DesignAnalysisResult& result, WarningKind kind, std::string message) {
        result.warnings.push_back({kind, std::move(message)});
    }

    static std::string fmt(double v) {
        std::ostringstream ss;
        ss << v;
        return ss.str();
    }

    // Requested region must lie inside what the simulation stage produced.
    static void check_coverage(const TrajectoryTable& table, DesignAnalysisResult& result) {
        double sim_boundary = table.min_boundary();
        if (result.boundary.upper() > sim_boundary) {
            warn(result, WarningKind::BOUNDARY_EXCEEDS_SIMULATION,
                 "The selected boundary (" + fmt(result.boundary.upper()) +
                 ") is larger than the smallest stopping boundary (" + fmt(sim_boundary) +
                 ") in the simulation stage. Cannot produce a meaningful analysis.");
        }
        int sim_n_max = table.max_n();
        if (result.n_max > sim_n_max) {
            warn(result, WarningKind::N_MAX_EXCEEDS_SIMULATION,
                 "The selected n_max (" + std::to_string(result.n_max) +
                 ") is larger than the largest n (" + std::to_string(sim_n_max) +
                 ") in the simulation stage. Cannot produce a meaningful analysis.");
        }
    }

    static void classify(const std::vector<Trajectory>& trajectories,
                         DesignAnalysisResult& result) {
        int boundary_test_n = 0;
        int ceiling_test_n = 0;

        for (const auto& traj : trajectories) {
            TrajectoryOutcome outcome = classify_trajectory(traj, result.boundary, result.n_max);
            ++result.all_traj_n;
            if (outcome.boundary_test_hit) ++boundary_test_n;
            if (outcome.ceiling_test_hit) ++ceiling_test_n;

            const double stop_n = static_cast<double>(outcome.endpoint.n);
            switch (outcome.kind) {
                case OutcomeKind::UPPER_HIT:
                    result.upper_hit_ids.push_back(traj.id);
                    result.upper_hit_n_samples.push_back(stop_n);
                    result.endpoint_n.push_back(stop_n);
                    break;
                case OutcomeKind::LOWER_HIT:
                    result.lower_hit_ids.push_back(traj.id);
                    result.lower_hit_n_samples.push_back(stop_n);
                    result.endpoint_n.push_back(stop_n);
                    break;
                case OutcomeKind::N_MAX_HIT:
                    result.n_max_hit_ids.push_back(traj.id);
                    result.n_max_hit_log_bf.push_back(outcome.endpoint.log_bf);
                    result.endpoint_n.push_back(stop_n);
                    break;
                case OutcomeKind::UNCLASSIFIED:
                    result.unclassified_ids.push_back(traj.id);
                    break;
            }
        }

        result.upper_hit_n = static_cast<int>(result.upper_hit_ids.size());
        result.lower_hit_n = static_cast<int>(result.lower_hit_ids.size());
        result.boundary_traj_n = result.upper_hit_n + result.lower_hit_n;
        result.n_max_traj_n = static_cast<int>(result.n_max_hit_ids.size());

        // Each trajectory must pass exactly one of the two tests.
        if (result.all_traj_n != boundary_test_n + ceiling_test_n ||
            result.all_traj_n != ceiling_test_n + result.upper_hit_n + result.lower_hit_n) {
            warn(result, WarningKind::OUTCOMES_DO_NOT_PARTITION,
                 "Outcomes do not sum up to 100%: " + std::to_string(result.all_traj_n) +
                 " trajectories, " + std::to_string(boundary_test_n) + " boundary hits, " +
                 std::to_string(ceiling_test_n) + " reached n_max inside the boundaries, " +
                 std::to_string(result.unclassified_ids.size()) + " unclassified.");
        }
    }

    static void summarize(const TrajectoryTable& working,
                          const std::vector<Trajectory>& trajectories,
                          DesignAnalysisResult& result) {
        const double all = static_cast<double>(result.all_traj_n);
        result.n_max_hit_frac = result.n_max_traj_n / all;
        result.boundary_hit_frac = result.boundary_traj_n / all;
        result.upper_hit_frac = result.upper_hit_n / all;
        result.lower_hit_frac = result.lower_hit_n / all;

        if (!result.endpoint_n.empty()) {
            result.asn = static_cast<int>(std::ceil(sample_stats::mean(result.endpoint_n)));
        }

        // Stopping-n densities share the lower support bound min(n) of the working table.
        const double n_floor = static_cast<double>(working.min_n());
        if (result.upper_hit_n_samples.size() >= 2) {
            double to = *std::max_element(result.upper_hit_n_samples.begin(),
                                          result.upper_hit_n_samples.end());
            result.upper_density = density::gaussian_kde(result.upper_hit_n_samples, n_floor, to);
        }
        if (result.lower_hit_n_samples.size() >= 2) {
            double to = *std::max_element(result.lower_hit_n_samples.begin(),
                                          result.lower_hit_n_samples.end());
            result.lower_density = density::gaussian_kde(result.lower_hit_n_samples, n_floor, to);
        }
        if (result.n_max_hit_log_bf.size() >= 2) {
            auto [lo, hi] = std::minmax_element(result.n_max_hit_log_bf.begin(),
                                                result.n_max_hit_log_bf.end());
            result.n_max_log_bf_density = density::gaussian_kde(result.n_max_hit_log_bf, *lo, *hi);
        }

        // BF exactly 3 or 1/3 falls in no category.
        const double log3 = std::log(3.0);
        const double log_third = std::log(1.0 / 3.0);
        int h1 = 0, inconclusive = 0, h0 = 0;
        for (double lbf : result.n_max_hit_log_bf) {
            if (lbf > log3) ++h1;
            else if (lbf < log_third) ++h0;
            else if (lbf > log_third && lbf < log3) ++inconclusive;
        }
        result.n_max_hit_h1 = h1 / all;
        result.n_max_hit_inconclusive = inconclusive / all;
        result.n_max_hit_h0 = h0 / all;

        result.is_fixed_design = working.has_constant_n();
        if (result.is_fixed_design) {
            int significant = 0;
            for (const auto& traj : trajectories) {
                if (traj.rows.front().p_value < result.alpha) ++significant;
            }
            result.p_value_power = significant / all;
        }
    }
};
