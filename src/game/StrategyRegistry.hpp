#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "GameTypes.hpp"
#include "Strategy.hpp"

namespace axiom::game {

// Catalog entry as shown to callers
struct StrategyInfo {
    std::string name;
    std::string description;
    Classifier classifier;
    bool basic = false;   // Part of the short list of well-known strategies

    nlohmann::json to_json() const {
        return {
            {"name", name},
            {"description", description},
            {"classifier", classifier.to_json()},
            {"basic", basic}
        };
    }
};

// Name -> constructor catalog of strategies
//
// Lookup is case-insensitive. Aliases ("Pavlov" for "WinStayLoseShift") are
// resolved before the lookup. New strategies are added by registering a
// factory; match and tournament code never names a concrete strategy.
class StrategyRegistry {
public:
    // Creates a fresh instance; the seed feeds stochastic strategies only
    using Factory = std::function<StrategyPtr(std::uint64_t seed)>;

    StrategyRegistry() = default;

    // Registry populated with the built-in catalog and aliases
    static StrategyRegistry with_defaults();

    // Throws std::invalid_argument if the name is already taken
    void add(const StrategyInfo& info, Factory factory);

    // Throws StrategyNotFound if canonical is not registered
    void add_alias(const std::string& alias, const std::string& canonical);

    // Canonical spelling of name after alias resolution.
    // Throws StrategyNotFound.
    std::string canonical_name(const std::string& name) const;

    bool contains(const std::string& name) const;

    // Fresh instance by name. Throws StrategyNotFound.
    StrategyPtr resolve(const std::string& name, std::uint64_t seed = 0) const;

    // Catalog in registration order
    std::vector<StrategyInfo> list_strategies(bool basic_only = false) const;

    // Single decision of a fresh instance given a history
    Action play_action(const std::string& name, const ActionHistory& history,
                       std::uint64_t seed = 0) const;

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        StrategyInfo info;
        Factory factory;
    };

    const Entry* find(const std::string& name) const;

    std::vector<Entry> entries_;
    std::map<std::string, size_t> index_;          // lowercase name -> entry
    std::map<std::string, std::string> aliases_;   // lowercase alias -> canonical
};

} // namespace axiom::game
