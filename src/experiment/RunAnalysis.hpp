#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Types.hpp"

namespace axiom::experiment {

// Summary of one per-run metric across completed runs
struct MetricStats {
    int n = 0;
    double mean = 0.0;
    double stddev = 0.0;     // Sample standard deviation, 0 for a single run
    double ci_lower = 0.0;   // mean - 1.96 * stddev / sqrt(n)
    double ci_upper = 0.0;   // mean + 1.96 * stddev / sqrt(n)

    // Throws std::invalid_argument on an empty sample
    static MetricStats from_samples(const std::vector<double>& samples);

    nlohmann::json to_json() const;
};

// One strategy's results pooled over completed runs
struct StrategyStats {
    int appearances = 0;            // Completed runs it was ranked in
    double mean_score = 0.0;
    double mean_cooperation_rate = 0.0;
    int wins = 0;                   // Runs it won

    nlohmann::json to_json() const;
};

struct ExperimentAnalysis {
    std::string experiment_id;
    int total_runs = 0;
    int successful_runs = 0;
    int failed_runs = 0;

    // Absent until at least one run has completed
    std::optional<MetricStats> cooperation_rate;   // Per run: mean of the strategies' rates
    std::optional<MetricStats> average_score;      // Per run: mean of the strategies' scores

    std::map<std::string, StrategyStats> strategies;
    Timestamp computed_at;

    nlohmann::json to_json() const;
};

// Aggregate the given runs of one experiment. Runs still pending or running
// only count towards total_runs.
ExperimentAnalysis analyze_runs(const std::string& experiment_id, const std::vector<ExperimentRun>& runs);

} // namespace axiom::experiment
