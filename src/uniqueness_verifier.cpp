// ============================================================================
// uniqueness_verifier.cpp — Rank, consistency, redundancy and conditioning
// ============================================================================

#include "awp/uniqueness_verifier.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace awp {

// ── Helpers ─────────────────────────────────────────────────────────────────

static VerificationResult trivially_unique() {
    VerificationResult r;
    r.solvable = true;
    r.is_unique = true;
    r.rank_deficiency = 0;
    r.message = "unique";
    return r;
}

static Eigen::MatrixXd select_rows(const Eigen::MatrixXd& a,
                                   const std::vector<Eigen::Index>& rows) {
    Eigen::MatrixXd out(static_cast<Eigen::Index>(rows.size()), a.cols());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) = a.row(rows[i]);
    }
    return out;
}

// ── UniquenessVerifier ──────────────────────────────────────────────────────

UniquenessVerifier::UniquenessVerifier(VerifierConfig config)
    : config_(config) {}

std::size_t UniquenessVerifier::rank(const Eigen::MatrixXd& m) const {
    if (m.rows() == 0 || m.cols() == 0) {
        return 0;
    }
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(m);
    const Eigen::VectorXd& s = svd.singularValues();
    std::size_t r = 0;
    for (Eigen::Index i = 0; i < s.size(); ++i) {
        if (s(i) > config_.tolerance) ++r;
    }
    return r;
}

// Rows with at least one coefficient above tolerance.
std::vector<Eigen::Index> UniquenessVerifier::constraining_rows(const Eigen::MatrixXd& a) const {
    std::vector<Eigen::Index> rows;
    for (Eigen::Index i = 0; i < a.rows(); ++i) {
        if (a.cols() > 0 && a.row(i).cwiseAbs().maxCoeff() > config_.tolerance) {
            rows.push_back(i);
        }
    }
    return rows;
}

// Column-pivoted QR of Aᵀ: the columns of Aᵀ are the rows of A, and the
// pivot order puts independent rows first.  A row whose pivot falls below
// tolerance, or that lies past the diagonal, depends on the rows before it.
std::vector<int> UniquenessVerifier::find_redundant_rows(
        const Eigen::MatrixXd& a, const std::vector<Eigen::Index>& rows) const {
    const Eigen::Index m = static_cast<Eigen::Index>(rows.size());
    const Eigen::Index n = a.cols();
    if (m <= n || n == 0) {
        return {};
    }

    Eigen::MatrixXd at = select_rows(a, rows).transpose();   // n x m
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(at);
    const Eigen::MatrixXd& r = qr.matrixQR();
    const auto& perm = qr.colsPermutation().indices();
    const Eigen::Index diag = std::min(n, m);

    std::vector<int> redundant;
    for (Eigen::Index i = 0; i < m; ++i) {
        double pivot = i < diag ? std::abs(r(i, i)) : 0.0;
        if (pivot < config_.tolerance) {
            redundant.push_back(static_cast<int>(rows[static_cast<std::size_t>(perm(i))]));
        }
    }
    std::sort(redundant.begin(), redundant.end());
    return redundant;
}

// ── verify ──────────────────────────────────────────────────────────────────

VerificationResult UniquenessVerifier::verify(const ConstraintSystem& system) const {
    if (system.masked_variables.empty()) {
        return trivially_unique();
    }
    MaskedSubsystem sub = builder_.extract_masked_system(system);
    if (sub.empty() || sub.matrix.size() == 0) {
        return trivially_unique();
    }
    return analyze(sub);
}

// ── analyze ─────────────────────────────────────────────────────────────────

VerificationResult UniquenessVerifier::analyze(const MaskedSubsystem& sub) const {
    const Eigen::MatrixXd& a = sub.matrix;
    const Eigen::Index n = a.cols();
    if (n == 0) {
        return trivially_unique();
    }

    const std::vector<Eigen::Index> rows = constraining_rows(a);
    const Eigen::Index m = static_cast<Eigen::Index>(rows.size());

    Eigen::MatrixXd augmented(a.rows(), n + 1);
    augmented.leftCols(n) = a;
    augmented.col(n) = sub.rhs;

    const std::size_t rank_a = rank(a);
    const std::size_t rank_ab = rank(augmented);

    VerificationResult result;
    result.solvable = (rank_a == rank_ab);

    if (!result.solvable) {
        result.is_unique = false;
        result.rank_deficiency =
            static_cast<int>(rank_a) - static_cast<int>(std::min(a.rows(), n));
        result.message = "inconsistent";
        return result;
    }

    result.rank_deficiency = static_cast<int>(n) - static_cast<int>(rank_a);
    result.is_unique = (result.rank_deficiency == 0);

    if (m == n && static_cast<Eigen::Index>(rank_a) == n) {
        Eigen::JacobiSVD<Eigen::MatrixXd> svd(select_rows(a, rows));
        const Eigen::VectorXd& s = svd.singularValues();
        result.condition_number = s(0) / s(s.size() - 1);
    }

    result.redundant_rows = find_redundant_rows(a, rows);

    // Redundant rows do not change the verdict of a unique system; they are
    // still listed in redundant_rows.
    std::ostringstream msg;
    if (result.is_unique) {
        msg << "unique";
    } else if (result.rank_deficiency > 0) {
        msg << "under-determined: " << result.rank_deficiency << " degrees of freedom";
    } else {
        msg << "over-determined: " << (m - static_cast<Eigen::Index>(rank_a))
            << " redundant constraints";
    }
    result.message = msg.str();
    return result;
}

// ── deduce ──────────────────────────────────────────────────────────────────

std::optional<std::map<std::string, double>>
UniquenessVerifier::deduce(const ConstraintSystem& system) const {
    if (system.masked_variables.empty()) {
        return std::map<std::string, double>{};
    }
    MaskedSubsystem sub = builder_.extract_masked_system(system);
    VerificationResult vr = analyze(sub);
    if (!vr.solvable || !vr.is_unique) {
        return std::nullopt;
    }

    // Full column rank, consistent: the least-squares solution is exact.
    Eigen::VectorXd x = sub.matrix.colPivHouseholderQr().solve(sub.rhs);

    std::map<std::string, double> values;
    for (std::size_t i = 0; i < sub.names.size(); ++i) {
        values[sub.names[i]] = x(static_cast<Eigen::Index>(i));
    }
    return values;
}

// ── suggest_fixes ───────────────────────────────────────────────────────────

std::vector<std::string> UniquenessVerifier::suggest_fixes(const VerificationResult& result) const {
    std::vector<std::string> hints;

    if (!result.solvable) {
        hints.push_back("System is inconsistent; check for contradictory constraints.");
        hints.push_back("Verify that transfer quantities and inventories are compatible.");
    } else if (!result.is_unique && result.rank_deficiency > 0) {
        hints.push_back("System is under-determined (" +
                        std::to_string(result.rank_deficiency) + " degrees of freedom).");
        hints.push_back("Mask fewer variables, or mask variables from different equations.");
    }

    if (!result.redundant_rows.empty()) {
        std::string rows;
        for (int r : result.redundant_rows) {
            if (!rows.empty()) rows += ", ";
            rows += std::to_string(r);
        }
        hints.push_back("Redundant constraints: [" + rows + "]");
    }

    if (result.condition_number && *result.condition_number > config_.max_condition) {
        hints.push_back("System is ill-conditioned; small changes may move the solution.");
    }

    return hints;
}

// ── is_well_posed ───────────────────────────────────────────────────────────

bool UniquenessVerifier::is_well_posed(const ConstraintSystem& system) const {
    VerificationResult r = verify(system);
    if (!r.solvable || !r.is_unique) return false;
    return !r.condition_number || *r.condition_number < config_.max_condition;
}

}  // namespace awp
