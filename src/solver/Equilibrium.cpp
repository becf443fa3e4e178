#include "Equilibrium.hpp"
#include "../core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace axiom::solver {

namespace {

std::vector<double> to_std(const Eigen::VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

Eigen::VectorXd from_std(const std::vector<double>& v) {
    Eigen::VectorXd out(static_cast<Eigen::Index>(v.size()));
    for (size_t i = 0; i < v.size(); ++i) {
        out(static_cast<Eigen::Index>(i)) = v[i];
    }
    return out;
}

// All k-element subsets of {0, ..., n-1} in lexicographic order
std::vector<std::vector<int>> subsets_of_size(int n, int k) {
    std::vector<std::vector<int>> out;
    std::vector<int> current(k);
    for (int i = 0; i < k; ++i) current[i] = i;

    while (true) {
        out.push_back(current);

        int pos = k - 1;
        while (pos >= 0 && current[pos] == n - k + pos) --pos;
        if (pos < 0) break;

        current[pos]++;
        for (int i = pos + 1; i < k; ++i) current[i] = current[i - 1] + 1;
    }
    return out;
}

// Mixture over `mix` (indices into P's columns) that makes every row in
// `indiff` earn the same payoff under P. Solves
//   [ P(indiff, mix)  -1 ] [ p ]   [ 0 ]
//   [ 1 ... 1          0 ] [ v ] = [ 1 ]
// Returns the mixture padded to P.cols() entries, or nullopt if singular.
std::optional<Eigen::VectorXd> indifference_mixture(
    const Eigen::MatrixXd& P,
    const std::vector<int>& indiff,
    const std::vector<int>& mix
) {
    const int k = static_cast<int>(mix.size());
    Eigen::MatrixXd M = Eigen::MatrixXd::Zero(k + 1, k + 1);
    Eigen::VectorXd rhs = Eigen::VectorXd::Zero(k + 1);

    for (int r = 0; r < k; ++r) {
        for (int c = 0; c < k; ++c) {
            M(r, c) = P(indiff[r], mix[c]);
        }
        M(r, k) = -1.0;
    }
    for (int c = 0; c < k; ++c) {
        M(k, c) = 1.0;
    }
    rhs(k) = 1.0;

    Eigen::FullPivLU<Eigen::MatrixXd> lu(M);
    if (!lu.isInvertible()) {
        return std::nullopt;
    }
    Eigen::VectorXd sol = lu.solve(rhs);
    if ((M * sol - rhs).norm() > 1e-8) {
        return std::nullopt;
    }

    Eigen::VectorXd p = Eigen::VectorXd::Zero(P.cols());
    for (int c = 0; c < k; ++c) {
        p(mix[c]) = sol(c);
    }
    return p;
}

// Strictly positive on the support (zero elsewhere by construction)
bool obeys_support(const Eigen::VectorXd& p, const std::vector<int>& support, double tol) {
    for (int i : support) {
        if (!(p(i) > tol)) return false;
    }
    return true;
}

} // namespace

bool StrategyProfile::is_valid(double tol) const {
    if (row.size() == 0 || col.size() == 0) return false;
    if (row.minCoeff() < -tol || col.minCoeff() < -tol) return false;
    return std::abs(row.sum() - 1.0) <= tol && std::abs(col.sum() - 1.0) <= tol;
}

nlohmann::json StrategyProfile::to_json() const {
    return {
        {"player1_strategy", to_std(row)},
        {"player2_strategy", to_std(col)}
    };
}

StrategyProfile StrategyProfile::from_json(const nlohmann::json& j) {
    StrategyProfile p;
    p.row = from_std(j.at("player1_strategy").get<std::vector<double>>());
    p.col = from_std(j.at("player2_strategy").get<std::vector<double>>());
    return p;
}

nlohmann::json EquilibriumResult::to_json() const {
    nlohmann::json j;
    j["equilibria"] = nlohmann::json::array();
    for (const auto& eq : equilibria) {
        j["equilibria"].push_back(eq.to_json());
    }
    j["pure_equilibria"] = nlohmann::json::array();
    for (const auto& pe : pure_equilibria) {
        j["pure_equilibria"].push_back({{"row", pe.row}, {"col", pe.col}});
    }
    j["is_unique"] = is_unique;
    j["num_equilibria"] = num_equilibria();
    return j;
}

EquilibriumResult EquilibriumResult::from_json(const nlohmann::json& j) {
    EquilibriumResult r;
    for (const auto& eq : j.at("equilibria")) {
        r.equilibria.push_back(StrategyProfile::from_json(eq));
    }
    for (const auto& pe : j.at("pure_equilibria")) {
        r.pure_equilibria.push_back({pe.at("row").get<int>(), pe.at("col").get<int>()});
    }
    r.is_unique = j.at("is_unique").get<bool>();
    return r;
}

Eigen::MatrixXd to_eigen(const PayoffMatrix& matrix) {
    if (matrix.empty() || matrix.front().empty()) {
        throw InvalidMatrix("Payoff matrix is empty");
    }

    const size_t rows = matrix.size();
    const size_t cols = matrix.front().size();
    Eigen::MatrixXd A(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));

    for (size_t i = 0; i < rows; ++i) {
        if (matrix[i].size() != cols) {
            throw InvalidMatrix("Payoff matrix is ragged: row " + std::to_string(i) +
                " has " + std::to_string(matrix[i].size()) + " entries, expected " +
                std::to_string(cols));
        }
        for (size_t j = 0; j < cols; ++j) {
            if (!std::isfinite(matrix[i][j])) {
                throw InvalidMatrix("Payoff matrix has a non-finite entry at (" +
                    std::to_string(i) + ", " + std::to_string(j) + ")");
            }
            A(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = matrix[i][j];
        }
    }
    return A;
}

EquilibriumCalculator::EquilibriumCalculator(EquilibriumConfig config)
    : config_(std::move(config)) {}

void EquilibriumCalculator::set_callback(CandidateCallback callback) {
    callback_ = std::move(callback);
}

EquilibriumResult EquilibriumCalculator::compute_equilibria(const PayoffMatrix& matrix) const {
    const Eigen::MatrixXd A = to_eigen(matrix);
    if (A.rows() != A.cols()) {
        throw InvalidMatrix("Equilibrium search needs a square matrix, got " +
            std::to_string(A.rows()) + "x" + std::to_string(A.cols()));
    }
    const Eigen::MatrixXd B = A.transpose();

    EquilibriumResult result;
    result.pure_equilibria = find_pure_equilibria(A, B);
    result.equilibria = support_enumeration(A, B, result.trace);
    result.is_unique = result.equilibria.size() == 1;
    return result;
}

std::vector<PureEquilibrium> EquilibriumCalculator::find_pure_equilibria(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B
) const {
    std::vector<PureEquilibrium> out;
    for (int i = 0; i < A.rows(); ++i) {
        for (int j = 0; j < A.cols(); ++j) {
            // Row i is a best response to column j, and column j to row i
            const bool row_best = A(i, j) >= A.col(j).maxCoeff() - config_.tol;
            const bool col_best = B(i, j) >= B.row(i).maxCoeff() - config_.tol;
            if (row_best && col_best) {
                out.push_back({i, j});
            }
        }
    }
    return out;
}

std::vector<StrategyProfile> EquilibriumCalculator::support_enumeration(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    SearchTrace& trace
) const {
    std::vector<StrategyProfile> found;

    const int m = static_cast<int>(A.rows());
    const int n = static_cast<int>(A.cols());
    const Eigen::MatrixXd Bt = B.transpose();

    for (int k = 1; k <= std::min(m, n); ++k) {
        const auto row_supports = subsets_of_size(m, k);
        const auto col_supports = subsets_of_size(n, k);

        for (const auto& I : row_supports) {
            for (const auto& J : col_supports) {
                CandidateStats stats;
                stats.row_support = I;
                stats.col_support = J;

                // Column mixture equalizes the row player over I (payoffs A),
                // row mixture equalizes the column player over J (payoffs B^T)
                auto y = indifference_mixture(A, I, J);
                auto x = indifference_mixture(Bt, J, I);

                if (!x || !y) {
                    stats.outcome = CandidateOutcome::Singular;
                } else if (!obeys_support(*x, I, config_.tol) ||
                           !obeys_support(*y, J, config_.tol)) {
                    stats.outcome = CandidateOutcome::Infeasible;
                } else {
                    const Eigen::VectorXd row_payoffs = A * (*y);
                    const Eigen::VectorXd col_payoffs = Bt * (*x);
                    const double v = row_payoffs(I.front());
                    const double u = col_payoffs(J.front());

                    if (row_payoffs.maxCoeff() > v + config_.tol ||
                        col_payoffs.maxCoeff() > u + config_.tol) {
                        stats.outcome = CandidateOutcome::NotBestResponse;
                    } else {
                        bool duplicate = false;
                        for (const auto& eq : found) {
                            if ((eq.row - *x).cwiseAbs().maxCoeff() < config_.dedup_tol &&
                                (eq.col - *y).cwiseAbs().maxCoeff() < config_.dedup_tol) {
                                duplicate = true;
                                break;
                            }
                        }
                        if (duplicate) {
                            stats.outcome = CandidateOutcome::Duplicate;
                        } else {
                            stats.outcome = CandidateOutcome::Equilibrium;
                            found.push_back({*x, *y});
                        }
                    }
                }

                trace.add_candidate(stats);
                if (callback_) (*callback_)(stats);
            }
        }
    }

    return found;
}

bool EquilibriumCalculator::is_dominant_strategy(
    const PayoffMatrix& matrix,
    int index,
    Player player
) const {
    const Eigen::MatrixXd A = to_eigen(matrix);

    if (player == Player::Row) {
        if (index < 0 || index >= A.rows()) {
            throw InvalidMatrix("Row strategy index out of range: " + std::to_string(index));
        }
        for (int k = 0; k < A.rows(); ++k) {
            if (k == index) continue;
            if ((A.row(index).array() < A.row(k).array()).any()) return false;
        }
        return true;
    }

    if (player != Player::Column) {
        throw InvalidMatrix("Unknown player: " + std::to_string(static_cast<int>(player)));
    }
    if (A.rows() != A.cols()) {
        throw InvalidMatrix("Column player payoffs need a square matrix");
    }
    if (index < 0 || index >= A.cols()) {
        throw InvalidMatrix("Column strategy index out of range: " + std::to_string(index));
    }

    // Column player's payoff for column j against row i is B(i, j) = A(j, i)
    const Eigen::MatrixXd B = A.transpose();
    for (int k = 0; k < B.cols(); ++k) {
        if (k == index) continue;
        if ((B.col(index).array() < B.col(k).array()).any()) return false;
    }
    return true;
}

double EquilibriumCalculator::compute_expected_payoff(
    const PayoffMatrix& matrix,
    const StrategyProfile& profile
) const {
    const Eigen::MatrixXd A = to_eigen(matrix);
    if (profile.row.size() != A.rows() || profile.col.size() != A.cols()) {
        throw InvalidMatrix("Strategy profile of size " + std::to_string(profile.row.size()) +
            "x" + std::to_string(profile.col.size()) + " does not fit a " +
            std::to_string(A.rows()) + "x" + std::to_string(A.cols()) + " matrix");
    }
    return profile.row.dot(A * profile.col);
}

} // namespace axiom::solver
