#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "StrategyRegistry.hpp"
#include "Strategy.hpp"

namespace axiom::game {

// Target's result against one probe opponent
struct ProbeResult {
    std::string opponent;
    double score = 0.0;
    double cooperation_rate = 0.0;

    nlohmann::json to_json() const {
        return {{"opponent", opponent}, {"score", score}, {"cooperation_rate", cooperation_rate}};
    }
};

struct AnalysisResult {
    std::string strategy_name;
    double cooperation_rate = 0.0;   // Mean over the three probes
    double average_score = 0.0;      // Mean over the three probes
    ProbeResult vs_cooperator;
    ProbeResult vs_defector;
    ProbeResult vs_tit_for_tat;
    Classifier classifier;

    nlohmann::json to_json() const;
};

// Characterizes a strategy by playing it against an unconditional
// cooperator, an unconditional defector, and tit for tat
class StrategyAnalyzer {
public:
    explicit StrategyAnalyzer(const StrategyRegistry& registry, std::uint64_t seed = 0);

    // Three matches, each with a freshly created target instance.
    // Throws StrategyNotFound or InvalidTurnCount.
    AnalysisResult analyze_strategy(const std::string& strategy_name, int turns = 200) const;

private:
    const StrategyRegistry& registry_;
    std::uint64_t seed_;
};

} // namespace axiom::game
