#pragma once

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// EvidenceBoundary — pair of Bayes factor thresholds {lower, upper}.
// A trial stops as soon as log BF >= log(upper) or log BF <= log(lower).
// ---------------------------------------------------------------------------
class EvidenceBoundary {
public:
    // Symmetric pair {1/b, b} (or {b, 1/b} when b < 1). b = +inf gives the
    // open boundary {0, +inf}: nothing crosses it.
    static EvidenceBoundary symmetric(double b) {
        if (std::isnan(b) || b <= 0.0) {
            throw std::invalid_argument("boundary must be a positive number, got " +
                                        std::to_string(b));
        }
        if (b == 1.0) {
            throw std::invalid_argument("boundary of 1 collapses both thresholds onto BF = 1");
        }
        if (std::isinf(b)) return EvidenceBoundary(0.0, b);
        return EvidenceBoundary(std::min(b, 1.0 / b), std::max(b, 1.0 / b));
    }

    // Explicit pair. lower may be 0 and upper may be +inf (open on that side).
    static EvidenceBoundary pair(double lower, double upper) {
        if (std::isnan(lower) || std::isnan(upper) || lower < 0.0 || upper <= 0.0 ||
            std::isinf(lower)) {
            throw std::invalid_argument(
                "boundary pair must satisfy 0 <= lower < upper <= +inf");
        }
        if (lower >= upper) {
            throw std::invalid_argument("lower boundary (" + std::to_string(lower) +
                                        ") must be below upper boundary (" +
                                        std::to_string(upper) + ")");
        }
        return EvidenceBoundary(lower, upper);
    }

    double lower() const { return lower_; }
    double upper() const { return upper_; }
    double log_lower() const { return log_lower_; }
    double log_upper() const { return log_upper_; }

    bool crosses_upper(double log_bf) const { return log_bf >= log_upper_; }
    bool crosses_lower(double log_bf) const { return log_bf <= log_lower_; }
    bool crossed(double log_bf) const { return crosses_upper(log_bf) || crosses_lower(log_bf); }

    // Closed interval [log(lower), log(upper)].
    bool contains(double log_bf) const { return log_bf >= log_lower_ && log_bf <= log_upper_; }

    bool operator==(const EvidenceBoundary& other) const {
        return lower_ == other.lower_ && upper_ == other.upper_;
    }

private:
    EvidenceBoundary(double lower, double upper)
        : lower_(lower), upper_(upper),
          log_lower_(std::log(lower)), log_upper_(std::log(upper)) {}

    double lower_;
    double upper_;
    double log_lower_;
    double log_upper_;
};
