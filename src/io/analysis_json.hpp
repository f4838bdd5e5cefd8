#pragma once

#include "analysis/design_analysis.hpp"
#include "analysis/density.hpp"

#include <cmath>
#include <cstdio>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace bfda_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

namespace detail {

// JSON has no NaN/Inf; those become null.
inline void write_number(std::ostringstream& ss, double v) {
    if (std::isfinite(v)) ss << v;
    else ss << "null";
}

inline void write_array(std::ostringstream& ss, const std::vector<double>& values) {
    ss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) ss << ",";
        write_number(ss, values[i]);
    }
    ss << "]";
}

inline void write_array(std::ostringstream& ss, const std::vector<int64_t>& values) {
    ss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) ss << ",";
        ss << values[i];
    }
    ss << "]";
}

inline void write_density(std::ostringstream& ss, const std::optional<DensityEstimate>& d) {
    if (!d) {
        ss << "null";
        return;
    }
    ss << "{\"bandwidth\":";
    write_number(ss, d->bandwidth);
    ss << ",\"sample_count\":" << d->sample_count;
    ss << ",\"x\":";
    write_array(ss, d->x);
    ss << ",\"y\":";
    write_array(ss, d->y);
    ss << "}";
}

}  // namespace detail

// Serialize a DesignAnalysisResult to JSON. Absent optionals are null.
inline std::string to_json(const DesignAnalysisResult& r) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "{";

    ss << "\"settings\":{";
    ss << "\"n_min\":" << r.n_min;
    ss << ",\"n_max\":" << r.n_max;
    ss << ",\"boundary\":";
    detail::write_array(ss, std::vector<double>{r.boundary.lower(), r.boundary.upper()});
    ss << ",\"log_boundary\":";
    detail::write_array(ss, std::vector<double>{r.boundary.log_lower(), r.boundary.log_upper()});
    ss << ",\"alpha\":" << r.alpha;
    ss << ",\"design\":\"" << (r.is_fixed_design ? "fixed" : "sequential") << "\"";
    ss << "}";

    ss << ",\"all_traj_n\":" << r.all_traj_n;
    ss << ",\"boundary_traj_n\":" << r.boundary_traj_n;
    ss << ",\"upper_hit_n\":" << r.upper_hit_n;
    ss << ",\"lower_hit_n\":" << r.lower_hit_n;
    ss << ",\"n_max_traj_n\":" << r.n_max_traj_n;

    ss << ",\"n_max_hit_frac\":" << r.n_max_hit_frac;
    ss << ",\"boundary_hit_frac\":" << r.boundary_hit_frac;
    ss << ",\"upper_hit_frac\":" << r.upper_hit_frac;
    ss << ",\"lower_hit_frac\":" << r.lower_hit_frac;

    ss << ",\"n_max_hit_h1\":" << r.n_max_hit_h1;
    ss << ",\"n_max_hit_inconclusive\":" << r.n_max_hit_inconclusive;
    ss << ",\"n_max_hit_h0\":" << r.n_max_hit_h0;

    ss << ",\"asn\":";
    if (r.asn) ss << *r.asn;
    else ss << "null";

    ss << ",\"p_value_power\":";
    if (r.p_value_power) detail::write_number(ss, *r.p_value_power);
    else ss << "null";

    ss << ",\"upper_hit_ids\":";
    detail::write_array(ss, r.upper_hit_ids);
    ss << ",\"lower_hit_ids\":";
    detail::write_array(ss, r.lower_hit_ids);
    ss << ",\"n_max_hit_ids\":";
    detail::write_array(ss, r.n_max_hit_ids);
    ss << ",\"unclassified_ids\":";
    detail::write_array(ss, r.unclassified_ids);

    ss << ",\"endpoint_n\":";
    detail::write_array(ss, r.endpoint_n);
    ss << ",\"n_max_hit_log_bf\":";
    detail::write_array(ss, r.n_max_hit_log_bf);

    ss << ",\"densities\":{";
    ss << "\"upper\":";
    detail::write_density(ss, r.upper_density);
    ss << ",\"lower\":";
    detail::write_density(ss, r.lower_density);
    ss << ",\"n_max_log_bf\":";
    detail::write_density(ss, r.n_max_log_bf_density);
    ss << "}";

    ss << ",\"warnings\":[";
    for (size_t i = 0; i < r.warnings.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "{\"kind\":\"" << warning_kind_str(r.warnings[i].kind) << "\"";
        ss << ",\"message\":\"" << json_escape(r.warnings[i].message) << "\"}";
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

}  // namespace bfda_io
