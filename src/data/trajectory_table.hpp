#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// TrajectoryRow — one observation along one simulated sequential trial
// ---------------------------------------------------------------------------
struct TrajectoryRow {
    int64_t id = 0;
    int n = 0;                // sample size at this observation
    double log_bf = 0.0;      // natural-log Bayes factor
    double boundary = 0.0;    // stopping boundary used by the simulation stage
    double p_value = 1.0;
};

// ---------------------------------------------------------------------------
// Trajectory — all rows of one id, sorted by increasing n
// ---------------------------------------------------------------------------
struct Trajectory {
    int64_t id = 0;
    std::vector<TrajectoryRow> rows;
};

// ---------------------------------------------------------------------------
// TrajectoryTable — long-format table of simulated trajectories
// (one row per id × n). Rows keep insertion order.
// ---------------------------------------------------------------------------
class TrajectoryTable {
public:
    TrajectoryTable() = default;
    explicit TrajectoryTable(std::vector<TrajectoryRow> rows) : rows_(std::move(rows)) {}

    void add_row(const TrajectoryRow& row) { rows_.push_back(row); }

    void add_row(int64_t id, int n, double log_bf, double boundary, double p_value = 1.0) {
        rows_.push_back({id, n, log_bf, boundary, p_value});
    }

    const std::vector<TrajectoryRow>& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    int min_n() const {
        require_rows("min_n");
        return std::min_element(rows_.begin(), rows_.end(), by_n)->n;
    }

    int max_n() const {
        require_rows("max_n");
        return std::max_element(rows_.begin(), rows_.end(), by_n)->n;
    }

    double min_boundary() const {
        require_rows("min_boundary");
        return std::min_element(rows_.begin(), rows_.end(), by_boundary)->boundary;
    }

    double max_boundary() const {
        require_rows("max_boundary");
        return std::max_element(rows_.begin(), rows_.end(), by_boundary)->boundary;
    }

    // Rows with n_min <= n <= n_max, original order preserved.
    TrajectoryTable restrict_n(int n_min, int n_max) const {
        std::vector<TrajectoryRow> kept;
        kept.reserve(rows_.size());
        for (const auto& r : rows_) {
            if (r.n >= n_min && r.n <= n_max) kept.push_back(r);
        }
        return TrajectoryTable(std::move(kept));
    }

    // Trajectories in order of first appearance. Rows within a trajectory are
    // stably sorted by n so that interleaved input still yields first-crossing order.
    std::vector<Trajectory> group_by_id() const {
        std::vector<Trajectory> groups;
        std::unordered_map<int64_t, size_t> index;
        for (const auto& r : rows_) {
            auto it = index.find(r.id);
            if (it == index.end()) {
                index.emplace(r.id, groups.size());
                groups.push_back({r.id, {r}});
            } else {
                groups[it->second].rows.push_back(r);
            }
        }
        for (auto& g : groups) {
            std::stable_sort(g.rows.begin(), g.rows.end(), by_n);
        }
        return groups;
    }

    std::vector<int64_t> distinct_ids() const {
        std::vector<int64_t> ids;
        std::unordered_set<int64_t> seen;
        for (const auto& r : rows_) {
            if (seen.insert(r.id).second) ids.push_back(r.id);
        }
        return ids;
    }

    // True when every row shares one sample size (fixed-n design).
    bool has_constant_n() const {
        if (rows_.empty()) return false;
        int first = rows_.front().n;
        return std::all_of(rows_.begin(), rows_.end(),
                           [first](const TrajectoryRow& r) { return r.n == first; });
    }

private:
    std::vector<TrajectoryRow> rows_;

    static bool by_n(const TrajectoryRow& a, const TrajectoryRow& b) { return a.n < b.n; }
    static bool by_boundary(const TrajectoryRow& a, const TrajectoryRow& b) {
        return a.boundary < b.boundary;
    }

    void require_rows(const char* what) const {
        if (rows_.empty()) {
            throw std::logic_error(std::string(what) + " called on an empty TrajectoryTable");
        }
    }
};
