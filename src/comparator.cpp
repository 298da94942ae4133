// ============================================================================
// comparator.cpp — Agreement between the two verifiers
// ============================================================================

#include "awp/comparator.hpp"

#include <sstream>

namespace awp {

Comparator::Comparator(const UniquenessVerifier& linear, SmtVerifier& smt)
    : linear_(linear), smt_(smt) {}

Comparison Comparator::compare(const ConstraintSystem& system) const {
    Comparison cmp;
    cmp.linear_algebra = linear_.verify(system);
    cmp.smt = smt_.verify(system);

    const bool conclusive = cmp.smt.status == SmtStatus::Sat ||
                            cmp.smt.status == SmtStatus::Unsat;
    if (!cmp.smt.available || !conclusive) {
        return cmp;
    }

    // A SAT base check with an inconclusive negation check still settles
    // solvability, but not uniqueness.
    Agreement agreement;
    agreement.solvability = (cmp.smt.satisfiable == cmp.linear_algebra.solvable);
    if (cmp.smt.satisfiable && cmp.linear_algebra.solvable &&
        cmp.smt.uniqueness != UniquenessStatus::Inconclusive) {
        agreement.uniqueness = (cmp.smt.is_unique == cmp.linear_algebra.is_unique);
    }
    cmp.agreement = agreement;
    return cmp;
}

std::string describe(const Comparison& comparison) {
    std::ostringstream oss;
    oss << "la=" << comparison.linear_algebra.message
        << " smt=" << smt_status_name(comparison.smt.status);
    if (comparison.smt.status == SmtStatus::Sat) {
        oss << "/" << uniqueness_status_name(comparison.smt.uniqueness);
    }

    if (!comparison.agreement) {
        oss << " n/a";
    } else if (comparison.agreement->agrees()) {
        oss << " agree";
    } else {
        oss << " DIVERGES(";
        if (!comparison.agreement->solvability) {
            oss << "solvability";
        } else {
            oss << "uniqueness";
        }
        oss << ")";
    }
    return oss.str();
}

}  // namespace awp
