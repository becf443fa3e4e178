#include "Strategy.hpp"

#include <algorithm>

namespace axiom::game {

Action TitForTat::next_action(const ActionHistory& history) {
    if (history.empty()) return Action::Cooperate;
    return history.last().opponent;
}

Action TitForTwoTats::next_action(const ActionHistory& history) {
    const int n = history.size();
    if (n < 2) return Action::Cooperate;
    if (history.at(n - 1).opponent == Action::Defect &&
        history.at(n - 2).opponent == Action::Defect) {
        return Action::Defect;
    }
    return Action::Cooperate;
}

Action SuspiciousTitForTat::next_action(const ActionHistory& history) {
    if (history.empty()) return Action::Defect;
    return history.last().opponent;
}

Action Grudger::next_action(const ActionHistory& history) {
    return history.opponent_count(Action::Defect) > 0 ? Action::Defect : Action::Cooperate;
}

Action WinStayLoseShift::next_action(const ActionHistory& history) {
    if (history.empty()) return Action::Cooperate;
    const Round& last = history.last();
    return last.own == last.opponent ? Action::Cooperate : Action::Defect;
}

Action Alternator::next_action(const ActionHistory& history) {
    if (history.empty()) return Action::Cooperate;
    return flip(history.last().own);
}

Action HardMajority::next_action(const ActionHistory& history) {
    if (history.empty()) return Action::Defect;
    const int coop = history.opponent_count(Action::Cooperate);
    const int defect = history.opponent_count(Action::Defect);
    return coop > defect ? Action::Cooperate : Action::Defect;
}

Action SoftMajority::next_action(const ActionHistory& history) {
    if (history.empty()) return Action::Cooperate;
    const int coop = history.opponent_count(Action::Cooperate);
    const int defect = history.opponent_count(Action::Defect);
    return coop >= defect ? Action::Cooperate : Action::Defect;
}

Action TwoTitsForTat::next_action(const ActionHistory& history) {
    const int n = history.size();
    for (int i = std::max(0, n - 2); i < n; ++i) {
        if (history.at(i).opponent == Action::Defect) return Action::Defect;
    }
    return Action::Cooperate;
}

Action CyclerCCD::next_action(const ActionHistory& history) {
    return history.size() % 3 == 2 ? Action::Defect : Action::Cooperate;
}

Action RandomStrategy::next_action(const ActionHistory&) {
    return draw(p_) ? Action::Cooperate : Action::Defect;
}

GenerousTitForTat::GenerousTitForTat(std::uint64_t seed, const StagePayoffs& payoffs)
    : StochasticStrategy(seed)
{
    const double R = payoffs.reward;
    const double S = payoffs.sucker;
    const double T = payoffs.temptation;
    const double P = payoffs.punishment;
    forgiveness_ = std::min(1.0 - (T - R) / (R - S), (R - P) / (T - P));
}

Action GenerousTitForTat::next_action(const ActionHistory& history) {
    if (history.empty()) return Action::Cooperate;
    if (history.last().opponent == Action::Cooperate) return Action::Cooperate;
    return draw(forgiveness_) ? Action::Cooperate : Action::Defect;
}

Action Joss::next_action(const ActionHistory& history) {
    if (history.empty()) return Action::Cooperate;
    if (history.last().opponent == Action::Defect) return Action::Defect;
    return draw(p_) ? Action::Cooperate : Action::Defect;
}

} // namespace axiom::game
