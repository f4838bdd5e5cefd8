#pragma once

#include "analysis/evidence_boundary.hpp"
#include "data/trajectory_table.hpp"

#include <cstdint>
#include <string>

enum class OutcomeKind { UPPER_HIT, LOWER_HIT, N_MAX_HIT, UNCLASSIFIED };

inline std::string outcome_kind_str(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::UPPER_HIT:    return "upper_hit";
        case OutcomeKind::LOWER_HIT:    return "lower_hit";
        case OutcomeKind::N_MAX_HIT:    return "n_max_hit";
        case OutcomeKind::UNCLASSIFIED: return "unclassified";
    }
    return "unclassified";
}

// ---------------------------------------------------------------------------
// TrajectoryOutcome — where and how one trajectory stopped
// ---------------------------------------------------------------------------
struct TrajectoryOutcome {
    int64_t id = 0;
    OutcomeKind kind = OutcomeKind::UNCLASSIFIED;
    TrajectoryRow endpoint;          // valid unless kind == UNCLASSIFIED

    // Raw results of the two independent tests. Both can be true when a
    // trajectory touches a boundary exactly and still ends at n_max; the
    // boundary crossing wins `kind` in that case.
    bool boundary_test_hit = false;
    bool ceiling_test_hit = false;
};

// Classify one trajectory whose rows are sorted by increasing n and already
// restricted to [n_min, n_max].
//
// One scan computes both tests:
//   boundary test: first row with log BF >= log(upper) or <= log(lower)
//   ceiling test:  a row at n == n_max exists and every row stays inside
//                  the closed interval [log(lower), log(upper)]
inline TrajectoryOutcome classify_trajectory(const Trajectory& traj,
                                             const EvidenceBoundary& boundary,
                                             int n_max) {
    TrajectoryOutcome out;
    out.id = traj.id;

    const TrajectoryRow* first_crossing = nullptr;
    const TrajectoryRow* ceiling_row = nullptr;
    bool contained = true;

    for (const auto& row : traj.rows) {
        if (first_crossing == nullptr && boundary.crossed(row.log_bf)) {
            first_crossing = &row;
        }
        if (!boundary.contains(row.log_bf)) contained = false;
        if (row.n == n_max && ceiling_row == nullptr) ceiling_row = &row;
    }

    out.boundary_test_hit = first_crossing != nullptr;
    out.ceiling_test_hit = contained && ceiling_row != nullptr;

    if (first_crossing != nullptr) {
        out.endpoint = *first_crossing;
        out.kind = boundary.crosses_upper(first_crossing->log_bf) ? OutcomeKind::UPPER_HIT
                                                                  : OutcomeKind::LOWER_HIT;
    } else if (out.ceiling_test_hit) {
        out.endpoint = *ceiling_row;
        out.kind = OutcomeKind::N_MAX_HIT;
    }
    return out;
}
