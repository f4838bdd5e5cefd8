// bfda_analyze.cpp — Bayes factor design analysis of simulated trajectories
// Reads a trajectory table (.csv or .parquet) produced by the simulation
// stage, classifies every trajectory against the chosen boundary and n_max,
// and prints the design report. Optionally writes the full result as JSON.

#include "analysis/design_analysis.hpp"
#include "analysis/design_report.hpp"
#include "analysis/evidence_boundary.hpp"
#include "io/analysis_json.hpp"
#include "io/trajectory_io.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

// ===========================================================================
// Config
// ===========================================================================
struct CliConfig {
    std::string input_path;
    std::string json_path;
    std::string boundary_str;
    std::string n_min_str;
    std::string n_max_str;
    std::string alpha_str = "0.05";
    std::string digits_str = "1";
};

// Whole-string numeric parsing; trailing characters are an error.
double parse_number(const std::string& s, const char* what) {
    size_t pos = 0;
    double v = std::stod(s, &pos);
    if (pos != s.size()) {
        throw std::invalid_argument(std::string(what) + " '" + s + "' is not a number");
    }
    return v;
}

int parse_integer(const std::string& s, const char* what) {
    size_t pos = 0;
    int v = std::stoi(s, &pos);
    if (pos != s.size()) {
        throw std::invalid_argument(std::string(what) + " '" + s + "' is not an integer");
    }
    return v;
}

// "6" → {1/6, 6}; "0.1,10" → {0.1, 10}; "Inf" → open boundary {0, Inf}
EvidenceBoundary parse_boundary(const std::string& s) {
    auto comma = s.find(',');
    if (comma == std::string::npos) {
        return EvidenceBoundary::symmetric(parse_number(s, "--boundary"));
    }
    return EvidenceBoundary::pair(parse_number(s.substr(0, comma), "--boundary"),
                                  parse_number(s.substr(comma + 1), "--boundary"));
}

AnalysisParams build_params(const CliConfig& cfg) {
    AnalysisParams params;
    if (!cfg.boundary_str.empty()) params.boundary = parse_boundary(cfg.boundary_str);
    if (!cfg.n_min_str.empty()) params.n_min = parse_integer(cfg.n_min_str, "--n-min");
    if (!cfg.n_max_str.empty()) params.n_max = parse_integer(cfg.n_max_str, "--n-max");
    params.alpha = parse_number(cfg.alpha_str, "--alpha");
    return params;
}

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --input <path> [options]\n"
              << "\n"
              << "  --input     Trajectory table (.csv or .parquet) with columns\n"
              << "              id, n, logBF, boundary, p.value\n"
              << "  --boundary  Stopping boundary: b (for {1/b, b}), lower,upper, or Inf\n"
              << "              (default: largest boundary in the table)\n"
              << "  --n-min     Smallest n to analyze (default: smallest n in the table)\n"
              << "  --n-max     Largest n to analyze (default: largest n in the table)\n"
              << "  --alpha     Significance level for fixed-n power (default: 0.05)\n"
              << "  --digits    Decimals in reported percentages (default: 1)\n"
              << "  --json      Also write the full result as JSON to this path\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    CliConfig cfg;

    // Parse CLI args
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            cfg.input_path = argv[++i];
        } else if (arg == "--boundary" && i + 1 < argc) {
            cfg.boundary_str = argv[++i];
        } else if (arg == "--n-min" && i + 1 < argc) {
            cfg.n_min_str = argv[++i];
        } else if (arg == "--n-max" && i + 1 < argc) {
            cfg.n_max_str = argv[++i];
        } else if (arg == "--alpha" && i + 1 < argc) {
            cfg.alpha_str = argv[++i];
        } else if (arg == "--digits" && i + 1 < argc) {
            cfg.digits_str = argv[++i];
        } else if (arg == "--json" && i + 1 < argc) {
            cfg.json_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (cfg.input_path.empty()) {
        std::cerr << "Missing required argument: --input\n";
        print_usage(argv[0]);
        return 1;
    }

    AnalysisParams params;
    int digits = 1;
    try {
        params = build_params(cfg);
        digits = parse_integer(cfg.digits_str, "--digits");
        if (digits < 0 || digits > design_report::MAX_DIGITS) {
            throw std::invalid_argument("--digits must lie in [0, " +
                                        std::to_string(design_report::MAX_DIGITS) + "]");
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Invalid argument: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::cout << "Reading " << cfg.input_path << " ..." << std::flush;
        TrajectoryTable table = bfda_io::read_trajectory_table(cfg.input_path);
        std::cout << " " << table.size() << " rows\n\n";

        DesignAnalyzer analyzer;
        DesignAnalysisResult result = analyzer.analyze(table, params);

        for (const auto& w : result.warnings) {
            std::cerr << "WARNING: " << w.message << "\n";
        }

        std::cout << design_report::render_report(result, digits);

        if (!cfg.json_path.empty()) {
            std::ofstream out(cfg.json_path);
            if (!out.is_open()) {
                std::cerr << "ERROR: Cannot open output file: " << cfg.json_path << "\n";
                return 1;
            }
            out << bfda_io::to_json(result) << "\n";
            std::cout << "\nWrote " << cfg.json_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "\nERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
