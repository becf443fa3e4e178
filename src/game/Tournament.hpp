#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "GameTypes.hpp"
#include "StrategyRegistry.hpp"

namespace axiom::game {

// One row of the final standings
struct StrategyRanking {
    int rank = 0;                 // 1-based
    std::string strategy;
    double score = 0.0;           // Mean match score
    double cooperation_rate = 0.0;

    bool operator==(const StrategyRanking& other) const {
        return rank == other.rank && strategy == other.strategy &&
               score == other.score && cooperation_rate == other.cooperation_rate;
    }

    nlohmann::json to_json() const;
    static StrategyRanking from_json(const nlohmann::json& j);
};

struct TournamentResult {
    std::vector<StrategyRanking> rankings;    // Best first
    int total_matches = 0;
    std::string winner;
    std::map<std::string, double> cooperation_rates;

    bool operator==(const TournamentResult& other) const {
        return rankings == other.rankings && total_matches == other.total_matches &&
               winner == other.winner && cooperation_rates == other.cooperation_rates;
    }

    nlohmann::json to_json() const;
    static TournamentResult from_json(const nlohmann::json& j);
};

struct TournamentOptions {
    std::uint64_t seed = 0;         // Base seed for stochastic strategies
    bool parallel_matches = false;  // Spread matches over OpenMP threads when available
    int max_strategies = 0;         // 0 = no cap
    StagePayoffs payoffs;
};

// Round-robin tournament
//
// Every ordered pair of distinct strategies plays `repetitions` matches of
// `turns` turns, each with freshly created instances, so N strategies give
// N * (N - 1) * repetitions matches. A strategy's score and cooperation rate
// are means over all matches it took part in. Rankings are by mean score,
// descending, ties kept in input order.
//
// Match seeds depend only on the match's position in the schedule, so the
// result is the same whether matches run sequentially or in parallel.
class TournamentRunner {
public:
    explicit TournamentRunner(const StrategyRegistry& registry, TournamentOptions options = {});

    // Throws StrategyNotFound before any match is played if a name does not
    // resolve, InvalidTurnCount for turns < 1 or repetitions < 1, and
    // InvalidTournament for fewer than two (or duplicate, or too many) names.
    TournamentResult run_tournament(
        const std::vector<std::string>& strategy_names,
        int turns = 200,
        int repetitions = 10
    ) const;

    const TournamentOptions& options() const { return options_; }
    TournamentOptions& options() { return options_; }

    const StrategyRegistry& registry() const { return registry_; }

private:
    const StrategyRegistry& registry_;
    TournamentOptions options_;
};

} // namespace axiom::game
