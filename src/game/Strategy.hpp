#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <nlohmann/json.hpp>
#include "GameTypes.hpp"

namespace axiom::game {

// Static description of how a strategy behaves
struct Classifier {
    int memory_depth = 0;     // Rounds of history consulted, -1 = unbounded
    bool stochastic = false;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["memory_depth"] = memory_depth < 0 ? nlohmann::json("inf") : nlohmann::json(memory_depth);
        j["stochastic"] = stochastic;
        return j;
    }
};

// Decision rule of one player in the repeated game
//
// next_action() sees only the rounds already played, from this player's side.
// Implementations derive everything from that history (plus their own random
// stream), so a fresh or reset() instance behaves identically on equal input.
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual Action next_action(const ActionHistory& history) = 0;

    // Return to the initial state before a new match
    virtual void reset() {}

    virtual std::string name() const = 0;
    virtual Classifier classifier() const = 0;
};

using StrategyPtr = std::unique_ptr<Strategy>;

// Always cooperates
class Cooperator : public Strategy {
public:
    Action next_action(const ActionHistory&) override { return Action::Cooperate; }
    std::string name() const override { return "Cooperator"; }
    Classifier classifier() const override { return {0, false}; }
};

// Always defects
class Defector : public Strategy {
public:
    Action next_action(const ActionHistory&) override { return Action::Defect; }
    std::string name() const override { return "Defector"; }
    Classifier classifier() const override { return {0, false}; }
};

// Cooperates first, then copies the opponent's last move
class TitForTat : public Strategy {
public:
    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "TitForTat"; }
    Classifier classifier() const override { return {1, false}; }
};

// Defects only after two consecutive opponent defections
class TitForTwoTats : public Strategy {
public:
    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "TitForTwoTats"; }
    Classifier classifier() const override { return {2, false}; }
};

// Defects first, then copies the opponent's last move
class SuspiciousTitForTat : public Strategy {
public:
    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "SuspiciousTitForTat"; }
    Classifier classifier() const override { return {1, false}; }
};

// Cooperates until the opponent defects once, then defects forever
class Grudger : public Strategy {
public:
    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "Grudger"; }
    Classifier classifier() const override { return {-1, false}; }
};

// Pavlov: repeat the last move after R or T, switch after S or P.
// Equivalently, cooperate iff both players made the same move last round.
class WinStayLoseShift : public Strategy {
public:
    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "WinStayLoseShift"; }
    Classifier classifier() const override { return {1, false}; }
};

// C, D, C, D, ...
class Alternator : public Strategy {
public:
    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "Alternator"; }
    Classifier classifier() const override { return {1, false}; }
};

// Defects first; afterwards cooperates only while the opponent has
// cooperated strictly more often than it has defected
class HardMajority : public Strategy {
public:
    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "HardMajority"; }
    Classifier classifier() const override { return {-1, false}; }
};

// Cooperates first; afterwards cooperates while the opponent's cooperations
// are at least as many as its defections
class SoftMajority : public Strategy {
public:
    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "SoftMajority"; }
    Classifier classifier() const override { return {-1, false}; }
};

// Defects twice in response to each opponent defection
class TwoTitsForTat : public Strategy {
public:
    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "TwoTitsForTat"; }
    Classifier classifier() const override { return {2, false}; }
};

// Repeats the cycle C, C, D
class CyclerCCD : public Strategy {
public:
    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "CyclerCCD"; }
    Classifier classifier() const override { return {2, false}; }
};

// Base for strategies that draw from a private random stream.
// reset() rewinds the stream so replays are reproducible.
class StochasticStrategy : public Strategy {
public:
    explicit StochasticStrategy(std::uint64_t seed) : seed_(seed), gen_(seed) {}

    void reset() override {
        gen_.seed(seed_);
        dist_.reset();
    }

protected:
    // True with probability p
    bool draw(double p) { return dist_(gen_) < p; }

private:
    std::uint64_t seed_;
    std::mt19937_64 gen_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

// Cooperates with probability p
class RandomStrategy : public StochasticStrategy {
public:
    explicit RandomStrategy(std::uint64_t seed, double p = 0.5)
        : StochasticStrategy(seed), p_(p) {}

    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "Random"; }
    Classifier classifier() const override { return {0, true}; }

private:
    double p_;
};

// Tit for tat that forgives a defection with probability
// min(1 - (T - R) / (R - S), (R - P) / (T - P)), which is 1/3 for 5,3,1,0
class GenerousTitForTat : public StochasticStrategy {
public:
    explicit GenerousTitForTat(std::uint64_t seed, const StagePayoffs& payoffs = {});

    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "GTFT"; }
    Classifier classifier() const override { return {1, true}; }

    double forgiveness() const { return forgiveness_; }

private:
    double forgiveness_;
};

// Tit for tat that defects instead of cooperating 10% of the time
class Joss : public StochasticStrategy {
public:
    explicit Joss(std::uint64_t seed, double p = 0.9)
        : StochasticStrategy(seed), p_(p) {}

    Action next_action(const ActionHistory& history) override;
    std::string name() const override { return "Joss"; }
    Classifier classifier() const override { return {1, true}; }

private:
    double p_;  // Probability of cooperating after an opponent cooperation
};

} // namespace axiom::game
