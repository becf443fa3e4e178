#include "Match.hpp"
#include "../core/Errors.hpp"

#include <string>

namespace axiom::game {

double cooperation_rate(const std::vector<Action>& actions) {
    if (actions.empty()) return 0.0;
    int coop = 0;
    for (Action a : actions) {
        if (a == Action::Cooperate) ++coop;
    }
    return static_cast<double>(coop) / static_cast<double>(actions.size());
}

MatchResult play_match(Strategy& a, Strategy& b, int turns, const StagePayoffs& payoffs) {
    if (turns < 1) {
        throw InvalidTurnCount("Match needs at least one turn, got " + std::to_string(turns));
    }

    a.reset();
    b.reset();

    ActionHistory history_a;
    ActionHistory history_b;

    MatchResult result;
    result.actions_a.reserve(static_cast<size_t>(turns));
    result.actions_b.reserve(static_cast<size_t>(turns));

    for (int turn = 0; turn < turns; ++turn) {
        // Decide simultaneously from the same past
        const Action move_a = a.next_action(history_a);
        const Action move_b = b.next_action(history_b);

        const auto [pay_a, pay_b] = payoffs.score(move_a, move_b);
        result.score_a += pay_a;
        result.score_b += pay_b;

        result.actions_a.push_back(move_a);
        result.actions_b.push_back(move_b);
        history_a.push(move_a, move_b);
        history_b.push(move_b, move_a);
    }

    result.cooperation_rate_a = cooperation_rate(result.actions_a);
    result.cooperation_rate_b = cooperation_rate(result.actions_b);
    return result;
}

nlohmann::json MatchResult::to_json() const {
    std::string seq_a;
    std::string seq_b;
    for (Action x : actions_a) seq_a += action_to_char(x);
    for (Action x : actions_b) seq_b += action_to_char(x);

    return {
        {"turns", turns()},
        {"actions_a", seq_a},
        {"actions_b", seq_b},
        {"score_a", score_a},
        {"score_b", score_b},
        {"cooperation_rate_a", cooperation_rate_a},
        {"cooperation_rate_b", cooperation_rate_b}
    };
}

} // namespace axiom::game
