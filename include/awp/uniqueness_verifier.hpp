// ============================================================================
// awp/uniqueness_verifier.hpp — Numerical solvability / uniqueness analysis
// ============================================================================
//
// Decides whether the masked quantities of a ConstraintSystem can be
// deduced, and whether the deduction is unique, by looking at the masked
// sub-system A·x = b:
//
//   solvable   rank(A) == rank([A | b])
//   unique     solvable and rank(A) == number of masked variables
//
// Ranks are counted from singular values above the configured tolerance.
// Linearly dependent rows are located with a column-pivoted QR of Aᵀ.
// Rows of A that are zero (no masked variable takes part in them) still
// count for consistency but are not treated as constraints on the unknowns.
//
// verify() never throws on degenerate input: an empty masked set, zero rows
// or zero columns all have defined results.
//
// ============================================================================

#ifndef AWP_UNIQUENESS_VERIFIER_HPP
#define AWP_UNIQUENESS_VERIFIER_HPP

#include "awp/constraint_system.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace awp {

// ── VerifierConfig ──────────────────────────────────────────────────────────

struct VerifierConfig {
    double tolerance     = 1e-10;   // shared by every rank / pivot test
    double max_condition = 1e10;    // is_well_posed() threshold
};

// ── VerificationResult ──────────────────────────────────────────────────────

struct VerificationResult {
    bool                   solvable        = false;
    bool                   is_unique       = false;
    int                    rank_deficiency = 0;
    std::optional<double>  condition_number;     // square, full-rank only
    std::vector<int>       redundant_rows;       // row indices of the system
    std::string            message;
};

// ── UniquenessVerifier ──────────────────────────────────────────────────────

class UniquenessVerifier {
public:
    explicit UniquenessVerifier(VerifierConfig config = {});

    /// Analyse the masked sub-system of `system`.
    VerificationResult verify(const ConstraintSystem& system) const;

    /// Analyse an already extracted sub-system.
    VerificationResult analyze(const MaskedSubsystem& sub) const;

    /// Values of the masked variables when they are uniquely determined;
    /// nullopt otherwise.
    std::optional<std::map<std::string, double>> deduce(const ConstraintSystem& system) const;

    /// Human-readable hints for making a rejected system acceptable.
    std::vector<std::string> suggest_fixes(const VerificationResult& result) const;

    /// Solvable, unique, and (when defined) condition number below
    /// VerifierConfig::max_condition.
    bool is_well_posed(const ConstraintSystem& system) const;

    const VerifierConfig& config() const noexcept { return config_; }

private:
    std::size_t rank(const Eigen::MatrixXd& m) const;
    std::vector<Eigen::Index> constraining_rows(const Eigen::MatrixXd& a) const;
    std::vector<int> find_redundant_rows(const Eigen::MatrixXd& a,
                                         const std::vector<Eigen::Index>& rows) const;

    VerifierConfig           config_;
    ConstraintSystemBuilder  builder_;
};

}  // namespace awp

#endif  // AWP_UNIQUENESS_VERIFIER_HPP
