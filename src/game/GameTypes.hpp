#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace axiom::game {

// Moves of the iterated prisoner's dilemma
enum class Action : uint8_t {
    Cooperate = 0,
    Defect = 1
};

inline char action_to_char(Action a) {
    switch (a) {
        case Action::Cooperate: return 'C';
        case Action::Defect:    return 'D';
    }
    return '?';
}

inline std::string action_to_string(Action a) {
    return std::string(1, action_to_char(a));
}

inline Action action_from_char(char c) {
    switch (c) {
        case 'C': case 'c': return Action::Cooperate;
        case 'D': case 'd': return Action::Defect;
    }
    throw std::invalid_argument(std::string("Unknown action: ") + c);
}

inline Action flip(Action a) {
    return a == Action::Cooperate ? Action::Defect : Action::Cooperate;
}

// One completed round, seen from one player's side
struct Round {
    int round = 0;        // 1-based
    Action own = Action::Cooperate;
    Action opponent = Action::Cooperate;
};

// Rounds played so far from one player's perspective.
// Append-only; round numbers run 1, 2, 3, ... without gaps.
class ActionHistory {
public:
    ActionHistory() = default;

    // Record the next round
    void push(Action own, Action opponent) {
        rounds_.push_back({static_cast<int>(rounds_.size()) + 1, own, opponent});
    }

    // Record a round with an explicit number; it must be the next one
    void append(const Round& r) {
        if (r.round != static_cast<int>(rounds_.size()) + 1) {
            throw std::invalid_argument(
                "Round " + std::to_string(r.round) + " out of sequence, expected " +
                std::to_string(rounds_.size() + 1));
        }
        rounds_.push_back(r);
    }

    bool empty() const { return rounds_.empty(); }
    int size() const { return static_cast<int>(rounds_.size()); }
    const Round& last() const { return rounds_.back(); }
    const Round& at(int i) const { return rounds_.at(static_cast<size_t>(i)); }
    const std::vector<Round>& rounds() const { return rounds_; }

    int opponent_count(Action a) const {
        int n = 0;
        for (const auto& r : rounds_) {
            if (r.opponent == a) ++n;
        }
        return n;
    }

    int own_count(Action a) const {
        int n = 0;
        for (const auto& r : rounds_) {
            if (r.own == a) ++n;
        }
        return n;
    }

private:
    std::vector<Round> rounds_;
};

// Stage-game payoffs of the prisoner's dilemma, T > R > P > S
struct StagePayoffs {
    double reward = 3.0;      // R: both cooperate
    double sucker = 0.0;      // S: cooperate against a defector
    double temptation = 5.0;  // T: defect against a cooperator
    double punishment = 1.0;  // P: both defect

    // Payoff pair (first player, second player) for one round
    std::pair<double, double> score(Action a, Action b) const {
        if (a == Action::Cooperate && b == Action::Cooperate) return {reward, reward};
        if (a == Action::Cooperate && b == Action::Defect)    return {sucker, temptation};
        if (a == Action::Defect && b == Action::Cooperate)    return {temptation, sucker};
        return {punishment, punishment};
    }
};

} // namespace axiom::game
