#include "Tournament.hpp"
#include "Match.hpp"
#include "../core/Errors.hpp"
#include "../core/Logging.hpp"

#include <algorithm>
#include <exception>
#include <numeric>
#include <set>

namespace axiom::game {

namespace {

struct ScheduledMatch {
    int a = 0;
    int b = 0;
    int repetition = 0;
};

} // namespace

nlohmann::json StrategyRanking::to_json() const {
    return {
        {"rank", rank},
        {"strategy", strategy},
        {"score", score},
        {"cooperation_rate", cooperation_rate}
    };
}

StrategyRanking StrategyRanking::from_json(const nlohmann::json& j) {
    StrategyRanking r;
    r.rank = j.at("rank").get<int>();
    r.strategy = j.at("strategy").get<std::string>();
    r.score = j.at("score").get<double>();
    r.cooperation_rate = j.at("cooperation_rate").get<double>();
    return r;
}

nlohmann::json TournamentResult::to_json() const {
    nlohmann::json j;
    j["rankings"] = nlohmann::json::array();
    for (const auto& r : rankings) {
        j["rankings"].push_back(r.to_json());
    }
    j["total_matches"] = total_matches;
    j["winner"] = winner;
    j["cooperation_rates"] = cooperation_rates;
    return j;
}

TournamentResult TournamentResult::from_json(const nlohmann::json& j) {
    TournamentResult t;
    for (const auto& r : j.at("rankings")) {
        t.rankings.push_back(StrategyRanking::from_json(r));
    }
    t.total_matches = j.at("total_matches").get<int>();
    t.winner = j.at("winner").get<std::string>();
    t.cooperation_rates = j.at("cooperation_rates").get<std::map<std::string, double>>();
    return t;
}

TournamentRunner::TournamentRunner(const StrategyRegistry& registry, TournamentOptions options)
    : registry_(registry), options_(std::move(options)) {}

TournamentResult TournamentRunner::run_tournament(
    const std::vector<std::string>& strategy_names,
    int turns,
    int repetitions
) const {
    auto log = logging::get_logger("axiom.tournament");

    // Validate everything before playing anything
    std::vector<std::string> names;
    names.reserve(strategy_names.size());
    for (const auto& name : strategy_names) {
        names.push_back(registry_.canonical_name(name));
    }

    if (turns < 1) {
        throw InvalidTurnCount("Turns must be at least 1, got " + std::to_string(turns));
    }
    if (repetitions < 1) {
        throw InvalidTurnCount(
            "Repetitions must be at least 1, got " + std::to_string(repetitions));
    }
    if (names.size() < 2) {
        throw InvalidTournament("A tournament needs at least two strategies");
    }
    if (options_.max_strategies > 0 &&
        static_cast<int>(names.size()) > options_.max_strategies) {
        throw InvalidTournament("Too many strategies: " + std::to_string(names.size()) +
            " (limit " + std::to_string(options_.max_strategies) + ")");
    }
    std::set<std::string> seen;
    for (const auto& name : names) {
        if (!seen.insert(name).second) {
            throw InvalidTournament("Strategy listed twice: " + name);
        }
    }

    const int n = static_cast<int>(names.size());

    std::vector<ScheduledMatch> schedule;
    schedule.reserve(static_cast<size_t>(n * (n - 1) * repetitions));
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (i == j) continue;
            for (int rep = 0; rep < repetitions; ++rep) {
                schedule.push_back({i, j, rep});
            }
        }
    }

    log->debug("Playing {} matches between {} strategies ({} turns, {} repetitions)",
        schedule.size(), n, turns, repetitions);

    std::vector<MatchResult> results(schedule.size());
    std::vector<std::exception_ptr> errors(schedule.size());

    auto play = [&](size_t k) {
        const ScheduledMatch& m = schedule[k];
        const std::uint64_t seed = options_.seed + 2 * static_cast<std::uint64_t>(k);
        StrategyPtr a = registry_.resolve(names[m.a], seed);
        StrategyPtr b = registry_.resolve(names[m.b], seed + 1);
        results[k] = play_match(*a, *b, turns, options_.payoffs);
    };

#ifdef _OPENMP
    if (options_.parallel_matches) {
        const long count = static_cast<long>(schedule.size());
        #pragma omp parallel for schedule(dynamic)
        for (long k = 0; k < count; ++k) {
            try {
                play(static_cast<size_t>(k));
            } catch (...) {
                errors[static_cast<size_t>(k)] = std::current_exception();
            }
        }
    } else
#endif
    {
        for (size_t k = 0; k < schedule.size(); ++k) {
            play(k);
        }
    }

    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    // Aggregate in schedule order
    std::vector<double> score_sum(n, 0.0);
    std::vector<double> coop_sum(n, 0.0);
    std::vector<int> played(n, 0);

    for (size_t k = 0; k < schedule.size(); ++k) {
        const ScheduledMatch& m = schedule[k];
        const MatchResult& r = results[k];

        score_sum[m.a] += r.score_a;
        coop_sum[m.a] += r.cooperation_rate_a;
        played[m.a]++;

        score_sum[m.b] += r.score_b;
        coop_sum[m.b] += r.cooperation_rate_b;
        played[m.b]++;
    }

    std::vector<double> mean_score(n);
    std::vector<double> mean_coop(n);
    for (int i = 0; i < n; ++i) {
        mean_score[i] = score_sum[i] / played[i];
        mean_coop[i] = coop_sum[i] / played[i];
    }

    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&](int x, int y) { return mean_score[x] > mean_score[y]; });

    TournamentResult result;
    result.total_matches = static_cast<int>(schedule.size());
    for (int pos = 0; pos < n; ++pos) {
        const int i = order[pos];
        result.rankings.push_back({pos + 1, names[i], mean_score[i], mean_coop[i]});
        result.cooperation_rates[names[i]] = mean_coop[i];
    }
    result.winner = result.rankings.front().strategy;

    log->debug("Tournament winner: {} (mean score {:.3f})",
        result.winner, result.rankings.front().score);
    return result;
}

} // namespace axiom::game
