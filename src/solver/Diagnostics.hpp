#pragma once

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace axiom::solver {

// Outcome of testing one candidate support pair
enum class CandidateOutcome {
    Equilibrium,      // Feasible, best response, new
    Duplicate,        // Feasible but already found
    Singular,         // Indifference system has no unique solution
    Infeasible,       // Solution leaves the probability simplex
    NotBestResponse   // Some strategy outside the support does better
};

inline std::string candidate_outcome_to_string(CandidateOutcome o) {
    switch (o) {
        case CandidateOutcome::Equilibrium:     return "equilibrium";
        case CandidateOutcome::Duplicate:       return "duplicate";
        case CandidateOutcome::Singular:        return "singular";
        case CandidateOutcome::Infeasible:      return "infeasible";
        case CandidateOutcome::NotBestResponse: return "not_best_response";
    }
    return "unknown";
}

// One candidate support pair
struct CandidateStats {
    std::vector<int> row_support;
    std::vector<int> col_support;
    CandidateOutcome outcome = CandidateOutcome::Singular;

    nlohmann::json to_json() const {
        return {
            {"row_support", row_support},
            {"col_support", col_support},
            {"outcome", candidate_outcome_to_string(outcome)}
        };
    }
};

// Tally of a support enumeration run
struct SearchTrace {
    int candidates = 0;
    int equilibria = 0;
    int duplicates = 0;
    int singular = 0;
    int infeasible = 0;
    int not_best_response = 0;

    void add_candidate(const CandidateStats& stats) {
        candidates++;
        switch (stats.outcome) {
            case CandidateOutcome::Equilibrium:     equilibria++; break;
            case CandidateOutcome::Duplicate:       duplicates++; break;
            case CandidateOutcome::Singular:        singular++; break;
            case CandidateOutcome::Infeasible:      infeasible++; break;
            case CandidateOutcome::NotBestResponse: not_best_response++; break;
        }
    }

    nlohmann::json to_json() const {
        return {
            {"candidates", candidates},
            {"equilibria", equilibria},
            {"duplicates", duplicates},
            {"singular", singular},
            {"infeasible", infeasible},
            {"not_best_response", not_best_response}
        };
    }
};

// Receives every candidate as it is classified
using CandidateCallback = std::function<void(const CandidateStats&)>;

} // namespace axiom::solver
