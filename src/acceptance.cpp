// ============================================================================
// acceptance.cpp — Acceptance policy over both verifiers
// ============================================================================

#include "awp/acceptance.hpp"

namespace awp {

const char* verdict_name(Verdict v) noexcept {
    switch (v) {
        case Verdict::Accepted:       return "accepted";
        case Verdict::Inconsistent:   return "inconsistent";
        case Verdict::NotUnique:      return "not-unique";
        case Verdict::IllConditioned: return "ill-conditioned";
        case Verdict::SmtUnsat:       return "smt-unsat";
        case Verdict::SmtUnknown:     return "smt-unknown";
        case Verdict::SmtDisagrees:   return "smt-disagrees";
    }
    return "?";
}

AcceptanceGate::AcceptanceGate(AcceptancePolicy policy, const UniquenessVerifier& linear,
                               SmtVerifier& smt)
    : policy_(policy), linear_(linear), smt_(smt) {}

// ── classify ────────────────────────────────────────────────────────────────

Verdict classify(const AcceptancePolicy& policy, const VerificationResult& vr,
                 const SmtResult* smt, double max_condition) {
    if (!vr.solvable) {
        return Verdict::Inconsistent;
    }
    if (policy.require_unique && !vr.is_unique) {
        return Verdict::NotUnique;
    }
    if (policy.require_well_posed && vr.condition_number &&
        *vr.condition_number >= max_condition) {
        return Verdict::IllConditioned;
    }

    if (smt && smt->available) {
        if (smt->status == SmtStatus::Unsat) {
            return Verdict::SmtUnsat;
        }
        if (smt->status == SmtStatus::Unknown ||
            smt->uniqueness == UniquenessStatus::Inconclusive) {
            return Verdict::SmtUnknown;
        }
        if (policy.require_unique && smt->is_unique != vr.is_unique) {
            return Verdict::SmtDisagrees;
        }
    }

    return Verdict::Accepted;
}

// ── AcceptanceGate ──────────────────────────────────────────────────────────

AcceptanceDecision AcceptanceGate::evaluate(const ConstraintSystem& system) const {
    AcceptanceDecision d;
    d.verification = linear_.verify(system);
    const double max_condition = linear_.config().max_condition;

    // Only candidates the linear algebra accepts reach the SMT check.
    d.verdict = classify(policy_, d.verification, nullptr, max_condition);
    if (d.verdict == Verdict::Accepted && policy_.use_smt && smt_.available()) {
        d.smt = smt_.verify(system);
        d.verdict = classify(policy_, d.verification, &*d.smt, max_condition);
    }

    d.accepted = (d.verdict == Verdict::Accepted);
    return d;
}

}  // namespace awp
