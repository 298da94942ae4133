// ============================================================================
// awp/comparator.hpp — Linear algebra vs. SMT agreement check
// ============================================================================
//
// Runs the numerical and the formal verifier on the same system and reports
// whether they agree on solvability and uniqueness.  Used by the fuzz
// harness and by `--compare`.
//
// Divergence is reported, never resolved: neither verdict overrides the
// other.
//
// ============================================================================

#ifndef AWP_COMPARATOR_HPP
#define AWP_COMPARATOR_HPP

#include "awp/constraint_system.hpp"
#include "awp/smt_verifier.hpp"
#include "awp/uniqueness_verifier.hpp"

#include <optional>
#include <string>

namespace awp {

// ── Agreement ───────────────────────────────────────────────────────────────
// `uniqueness` is only compared when both sides found the system solvable.

struct Agreement {
    bool                 solvability = true;
    std::optional<bool>  uniqueness;

    bool agrees() const noexcept { return solvability && uniqueness.value_or(true); }
};

// ── Comparison ──────────────────────────────────────────────────────────────

struct Comparison {
    VerificationResult        linear_algebra;
    SmtResult                 smt;
    std::optional<Agreement>  agreement;   // nullopt: SMT unavailable or inconclusive

    /// True when a conclusive SMT verdict contradicts the linear algebra.
    bool diverges() const noexcept { return agreement && !agreement->agrees(); }
};

// ── Comparator ──────────────────────────────────────────────────────────────

class Comparator {
public:
    Comparator(const UniquenessVerifier& linear, SmtVerifier& smt);

    Comparison compare(const ConstraintSystem& system) const;

private:
    const UniquenessVerifier& linear_;
    SmtVerifier&              smt_;
};

/// One-line summary, e.g.
///   "la=unique smt=SAT/unique agree"
///   "la=under-determined: 1 degrees of freedom smt=SAT/unique DIVERGES(uniqueness)"
std::string describe(const Comparison& comparison);

}  // namespace awp

#endif  // AWP_COMPARATOR_HPP
