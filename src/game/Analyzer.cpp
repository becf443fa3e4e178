#include "Analyzer.hpp"
#include "Match.hpp"
#include "../core/Errors.hpp"

namespace axiom::game {

nlohmann::json AnalysisResult::to_json() const {
    return {
        {"strategy_name", strategy_name},
        {"cooperation_rate", cooperation_rate},
        {"average_score", average_score},
        {"vs_cooperator", vs_cooperator.to_json()},
        {"vs_defector", vs_defector.to_json()},
        {"vs_tit_for_tat", vs_tit_for_tat.to_json()},
        {"classifier", classifier.to_json()}
    };
}

StrategyAnalyzer::StrategyAnalyzer(const StrategyRegistry& registry, std::uint64_t seed)
    : registry_(registry), seed_(seed) {}

AnalysisResult StrategyAnalyzer::analyze_strategy(const std::string& strategy_name, int turns) const {
    // Resolve once up front so an unknown name fails before any play
    StrategyPtr target = registry_.resolve(strategy_name, seed_);
    if (turns < 1) {
        throw InvalidTurnCount("Turns must be at least 1, got " + std::to_string(turns));
    }

    auto probe = [&](Strategy& opponent) {
        StrategyPtr fresh = registry_.resolve(strategy_name, seed_);
        MatchResult m = play_match(*fresh, opponent, turns);
        return ProbeResult{opponent.name(), m.score_a, m.cooperation_rate_a};
    };

    Cooperator cooperator;
    Defector defector;
    TitForTat tit_for_tat;

    AnalysisResult result;
    result.strategy_name = target->name();
    result.classifier = target->classifier();
    result.vs_cooperator = probe(cooperator);
    result.vs_defector = probe(defector);
    result.vs_tit_for_tat = probe(tit_for_tat);

    result.cooperation_rate = (result.vs_cooperator.cooperation_rate +
                               result.vs_defector.cooperation_rate +
                               result.vs_tit_for_tat.cooperation_rate) / 3.0;
    result.average_score = (result.vs_cooperator.score +
                            result.vs_defector.score +
                            result.vs_tit_for_tat.score) / 3.0;
    return result;
}

} // namespace axiom::game
