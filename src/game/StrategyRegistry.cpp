#include "StrategyRegistry.hpp"
#include "../core/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace axiom::game {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template<typename T>
StrategyRegistry::Factory deterministic() {
    return [](std::uint64_t) { return std::make_unique<T>(); };
}

template<typename T>
StrategyRegistry::Factory seeded() {
    return [](std::uint64_t seed) { return std::make_unique<T>(seed); };
}

} // namespace

StrategyRegistry StrategyRegistry::with_defaults() {
    StrategyRegistry r;

    r.add({"Cooperator", "Always cooperates.", {0, false}, true},
          deterministic<Cooperator>());
    r.add({"Defector", "Always defects.", {0, false}, true},
          deterministic<Defector>());
    r.add({"TitForTat", "Cooperates first, then copies the opponent's last move.",
           {1, false}, true},
          deterministic<TitForTat>());
    r.add({"TitForTwoTats", "Defects only after two consecutive opponent defections.",
           {2, false}, true},
          deterministic<TitForTwoTats>());
    r.add({"Grudger", "Cooperates until the opponent defects, then always defects.",
           {-1, false}, true},
          deterministic<Grudger>());
    r.add({"WinStayLoseShift",
           "Repeats its move after a good payoff, switches after a bad one.",
           {1, false}, true},
          deterministic<WinStayLoseShift>());
    r.add({"SuspiciousTitForTat", "Defects first, then copies the opponent's last move.",
           {1, false}, true},
          deterministic<SuspiciousTitForTat>());
    r.add({"Alternator", "Alternates between cooperating and defecting.",
           {1, false}, true},
          deterministic<Alternator>());
    r.add({"HardMajority",
           "Defects unless the opponent has cooperated more often than defected.",
           {-1, false}, true},
          deterministic<HardMajority>());
    r.add({"SoftMajority",
           "Cooperates while the opponent has cooperated at least as often as defected.",
           {-1, false}, true},
          deterministic<SoftMajority>());
    r.add({"Random", "Cooperates with probability 0.5.", {0, true}, true},
          seeded<RandomStrategy>());
    r.add({"GTFT", "Tit for tat that forgives a defection with probability 1/3.",
           {1, true}, true},
          seeded<GenerousTitForTat>());
    r.add({"Joss", "Tit for tat that sneaks in a defection 10% of the time.",
           {1, true}, true},
          seeded<Joss>());
    r.add({"TwoTitsForTat", "Answers each opponent defection with two defections.",
           {2, false}, false},
          deterministic<TwoTitsForTat>());
    r.add({"CyclerCCD", "Plays the fixed cycle C, C, D.", {2, false}, false},
          deterministic<CyclerCCD>());

    r.add_alias("Pavlov", "WinStayLoseShift");
    r.add_alias("AlwaysCooperate", "Cooperator");
    r.add_alias("AlwaysDefect", "Defector");
    r.add_alias("TFT", "TitForTat");
    r.add_alias("AlternatingCooperator", "Alternator");
    r.add_alias("GenerousTitForTat", "GTFT");

    return r;
}

void StrategyRegistry::add(const StrategyInfo& info, Factory factory) {
    const std::string key = lowercase(info.name);
    if (index_.count(key) || aliases_.count(key)) {
        throw std::invalid_argument("Strategy name already registered: " + info.name);
    }
    index_[key] = entries_.size();
    entries_.push_back({info, std::move(factory)});
}

void StrategyRegistry::add_alias(const std::string& alias, const std::string& canonical) {
    const Entry* target = find(canonical);
    if (!target) {
        throw StrategyNotFound(canonical);
    }
    const std::string key = lowercase(alias);
    if (index_.count(key)) {
        throw std::invalid_argument("Alias shadows a registered strategy: " + alias);
    }
    aliases_[key] = target->info.name;
}

const StrategyRegistry::Entry* StrategyRegistry::find(const std::string& name) const {
    std::string key = lowercase(name);

    auto alias_it = aliases_.find(key);
    if (alias_it != aliases_.end()) {
        key = lowercase(alias_it->second);
    }

    auto it = index_.find(key);
    return it != index_.end() ? &entries_[it->second] : nullptr;
}

std::string StrategyRegistry::canonical_name(const std::string& name) const {
    const Entry* entry = find(name);
    if (!entry) throw StrategyNotFound(name);
    return entry->info.name;
}

bool StrategyRegistry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

StrategyPtr StrategyRegistry::resolve(const std::string& name, std::uint64_t seed) const {
    const Entry* entry = find(name);
    if (!entry) throw StrategyNotFound(name);
    return entry->factory(seed);
}

std::vector<StrategyInfo> StrategyRegistry::list_strategies(bool basic_only) const {
    std::vector<StrategyInfo> out;
    for (const auto& entry : entries_) {
        if (!basic_only || entry.info.basic) {
            out.push_back(entry.info);
        }
    }
    return out;
}

Action StrategyRegistry::play_action(
    const std::string& name,
    const ActionHistory& history,
    std::uint64_t seed
) const {
    StrategyPtr strategy = resolve(name, seed);
    return strategy->next_action(history);
}

} // namespace axiom::game
