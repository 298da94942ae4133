// ============================================================================
// awp/acceptance.hpp — Accept or reject a candidate masked question
// ============================================================================
//
// A candidate is accepted only if its masked quantities are solvable and
// uniquely determined.  The SMT backend, when enabled and available, must
// confirm the verdict; an unavailable backend degrades to the linear
// algebra answer alone.
//
// ============================================================================

#ifndef AWP_ACCEPTANCE_HPP
#define AWP_ACCEPTANCE_HPP

#include "awp/constraint_system.hpp"
#include "awp/smt_verifier.hpp"
#include "awp/uniqueness_verifier.hpp"

#include <cstdint>
#include <optional>

namespace awp {

// ── Verdict ─────────────────────────────────────────────────────────────────

enum class Verdict : std::uint8_t {
    Accepted,
    Inconsistent,     // no solution exists
    NotUnique,        // more than one solution
    IllConditioned,   // unique, but condition number above the limit
    SmtUnsat,         // SMT found the scenario itself inconsistent
    SmtUnknown,       // SMT timed out; caller may retry
    SmtDisagrees      // conclusive SMT verdict contradicts linear algebra
};

const char* verdict_name(Verdict v) noexcept;

// ── AcceptancePolicy ────────────────────────────────────────────────────────

struct AcceptancePolicy {
    bool require_unique     = true;
    bool require_well_posed = false;
    bool use_smt            = false;
};

// ── AcceptanceDecision ──────────────────────────────────────────────────────

struct AcceptanceDecision {
    bool                      accepted = false;
    Verdict                   verdict  = Verdict::Inconsistent;
    VerificationResult        verification;
    std::optional<SmtResult>  smt;    // set only when SMT was consulted
};

/// Verdict for an already computed linear-algebra result and, optionally,
/// an SMT result.  An SMT result whose backend was unavailable is ignored.
Verdict classify(const AcceptancePolicy& policy, const VerificationResult& verification,
                 const SmtResult* smt, double max_condition);

// ── AcceptanceGate ──────────────────────────────────────────────────────────

class AcceptanceGate {
public:
    AcceptanceGate(AcceptancePolicy policy, const UniquenessVerifier& linear,
                   SmtVerifier& smt);

    AcceptanceDecision evaluate(const ConstraintSystem& system) const;

private:
    AcceptancePolicy           policy_;
    const UniquenessVerifier&  linear_;
    SmtVerifier&               smt_;
};

}  // namespace awp

#endif  // AWP_ACCEPTANCE_HPP
