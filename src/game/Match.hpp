#pragma once

#include <vector>
#include <nlohmann/json.hpp>
#include "GameTypes.hpp"
#include "Strategy.hpp"

namespace axiom::game {

// Outcome of one repeated game
struct MatchResult {
    std::vector<Action> actions_a;
    std::vector<Action> actions_b;
    double score_a = 0.0;              // Sum of per-turn stage payoffs
    double score_b = 0.0;
    double cooperation_rate_a = 0.0;   // Fraction of turns played C
    double cooperation_rate_b = 0.0;

    int turns() const { return static_cast<int>(actions_a.size()); }

    nlohmann::json to_json() const;
};

// Fraction of Cooperate in a sequence, 0 for an empty one
double cooperation_rate(const std::vector<Action>& actions);

// Play `turns` rounds of the stage game between a and b.
//
// Both strategies are reset first. Each turn, both choose from the history
// accumulated so far (their own view of it), never seeing the other's
// current-turn move. Throws InvalidTurnCount if turns < 1.
MatchResult play_match(Strategy& a, Strategy& b, int turns,
                       const StagePayoffs& payoffs = {});

} // namespace axiom::game
