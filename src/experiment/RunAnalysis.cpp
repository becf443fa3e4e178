#include "RunAnalysis.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>

namespace axiom::experiment {

namespace {

constexpr double kZ95 = 1.96;

double mean_of(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

} // namespace

MetricStats MetricStats::from_samples(const std::vector<double>& samples) {
    if (samples.empty()) {
        throw std::invalid_argument("MetricStats needs at least one sample");
    }

    MetricStats s;
    s.n = static_cast<int>(samples.size());
    s.mean = mean_of(samples);

    if (s.n > 1) {
        double ss = 0.0;
        for (double x : samples) {
            ss += (x - s.mean) * (x - s.mean);
        }
        s.stddev = std::sqrt(ss / (s.n - 1));
    }

    double half_width = kZ95 * s.stddev / std::sqrt(static_cast<double>(s.n));
    s.ci_lower = s.mean - half_width;
    s.ci_upper = s.mean + half_width;
    return s;
}

nlohmann::json MetricStats::to_json() const {
    return {
        {"n", n},
        {"mean", mean},
        {"std", stddev},
        {"ci_95", {ci_lower, ci_upper}}
    };
}

nlohmann::json StrategyStats::to_json() const {
    return {
        {"appearances", appearances},
        {"mean_score", mean_score},
        {"mean_cooperation_rate", mean_cooperation_rate},
        {"wins", wins}
    };
}

nlohmann::json ExperimentAnalysis::to_json() const {
    nlohmann::json j;
    j["experiment_id"] = experiment_id;
    j["total_runs"] = total_runs;
    j["successful_runs"] = successful_runs;
    j["failed_runs"] = failed_runs;
    j["cooperation_rate"] = cooperation_rate ? cooperation_rate->to_json() : nlohmann::json(nullptr);
    j["average_score"] = average_score ? average_score->to_json() : nlohmann::json(nullptr);
    j["strategies"] = nlohmann::json::object();
    for (const auto& [name, stats] : strategies) {
        j["strategies"][name] = stats.to_json();
    }
    j["computed_at"] = to_iso8601(computed_at);
    return j;
}

ExperimentAnalysis analyze_runs(const std::string& experiment_id, const std::vector<ExperimentRun>& runs) {
    ExperimentAnalysis analysis;
    analysis.experiment_id = experiment_id;
    analysis.total_runs = static_cast<int>(runs.size());
    analysis.computed_at = now();

    std::vector<double> run_cooperation;
    std::vector<double> run_scores;

    // Running sums, divided by appearances at the end
    std::map<std::string, StrategyStats> totals;

    for (const auto& run : runs) {
        if (run.status == RunStatus::Failed) {
            analysis.failed_runs++;
            continue;
        }
        if (run.status != RunStatus::Completed || !run.results) {
            continue;
        }
        analysis.successful_runs++;

        const game::TournamentResult& result = *run.results;
        if (result.rankings.empty()) {
            continue;
        }

        double coop_sum = 0.0;
        double score_sum = 0.0;
        for (const auto& ranking : result.rankings) {
            coop_sum += ranking.cooperation_rate;
            score_sum += ranking.score;

            StrategyStats& t = totals[ranking.strategy];
            t.appearances++;
            t.mean_score += ranking.score;
            t.mean_cooperation_rate += ranking.cooperation_rate;
        }
        totals[result.winner].wins++;

        run_cooperation.push_back(coop_sum / result.rankings.size());
        run_scores.push_back(score_sum / result.rankings.size());
    }

    for (auto& [name, t] : totals) {
        if (t.appearances > 0) {
            t.mean_score /= t.appearances;
            t.mean_cooperation_rate /= t.appearances;
        }
    }
    analysis.strategies = std::move(totals);

    if (!run_cooperation.empty()) {
        analysis.cooperation_rate = MetricStats::from_samples(run_cooperation);
        analysis.average_score = MetricStats::from_samples(run_scores);
    }
    return analysis;
}

} // namespace axiom::experiment
