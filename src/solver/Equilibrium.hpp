#pragma once

#include <Eigen/Dense>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "Diagnostics.hpp"

namespace axiom::solver {

// Row-player payoffs as submitted by callers, matrix[i][j] for row i, column j.
// The column player's payoffs are the transpose (symmetric game).
using PayoffMatrix = std::vector<std::vector<double>>;

// Which side of the matrix a strategy belongs to
enum class Player : int {
    Row = 0,
    Column = 1
};

// Mixed strategy for each player
struct StrategyProfile {
    Eigen::VectorXd row;
    Eigen::VectorXd col;

    // Both vectors non-negative and summing to 1 within tol
    bool is_valid(double tol = 1e-9) const;

    bool operator==(const StrategyProfile& other) const {
        return row.size() == other.row.size() && col.size() == other.col.size() &&
               row == other.row && col == other.col;
    }

    nlohmann::json to_json() const;
    static StrategyProfile from_json(const nlohmann::json& j);
};

struct PureEquilibrium {
    int row = 0;
    int col = 0;

    bool operator==(const PureEquilibrium& other) const {
        return row == other.row && col == other.col;
    }
};

struct EquilibriumResult {
    std::vector<StrategyProfile> equilibria;        // From support enumeration
    std::vector<PureEquilibrium> pure_equilibria;   // Row-major order
    bool is_unique = false;                         // Exactly one profile found
    SearchTrace trace;                              // Not serialized

    int num_equilibria() const { return static_cast<int>(equilibria.size()); }

    nlohmann::json to_json() const;
    static EquilibriumResult from_json(const nlohmann::json& j);
};

struct EquilibriumConfig {
    double tol = 1e-9;           // Feasibility / best-response slack
    double dedup_tol = 1e-6;     // Max coordinate gap for two profiles to be the same
};

// Nash equilibria of a two-player symmetric bimatrix game (A, A^T)
//
// Pure equilibria: every cell where the row is a best response to the column
// and the column is a best response to the row.
//
// Mixed equilibria: support enumeration. For every pair of equal-size
// supports (I, J), solve for the column mixture on J that makes all rows in
// I indifferent, and the row mixture on I that makes all columns in J
// indifferent; keep the pair if both are strictly positive on their support
// and no strategy outside the support earns more. Candidate count grows as
// C(n, k)^2 summed over k, fine for the small games this is meant for.
class EquilibriumCalculator {
public:
    explicit EquilibriumCalculator(EquilibriumConfig config = {});

    // Receive each candidate support pair as it is classified
    void set_callback(CandidateCallback callback);

    // Throws InvalidMatrix if the matrix is empty, ragged, non-finite or not square
    EquilibriumResult compute_equilibria(const PayoffMatrix& matrix) const;

    // True iff the payoff vector of `index` for `player` is component-wise >=
    // that of every other strategy of the same player. Throws InvalidMatrix on
    // a bad matrix or index; the column player needs a square matrix.
    bool is_dominant_strategy(const PayoffMatrix& matrix, int index, Player player = Player::Row) const;

    // row^T * A * col. Throws InvalidMatrix if the profile does not fit the matrix.
    double compute_expected_payoff(const PayoffMatrix& matrix, const StrategyProfile& profile) const;

    const EquilibriumConfig& config() const { return config_; }

private:
    EquilibriumConfig config_;
    std::optional<CandidateCallback> callback_;

    std::vector<PureEquilibrium> find_pure_equilibria(
        const Eigen::MatrixXd& A, const Eigen::MatrixXd& B) const;

    std::vector<StrategyProfile> support_enumeration(
        const Eigen::MatrixXd& A, const Eigen::MatrixXd& B, SearchTrace& trace) const;
};

// Copy into an Eigen matrix, validating shape and values.
// Throws InvalidMatrix if empty, ragged or containing NaN/inf.
Eigen::MatrixXd to_eigen(const PayoffMatrix& matrix);

} // namespace axiom::solver
