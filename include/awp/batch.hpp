// ============================================================================
// awp/batch.hpp — Verifying many cases, optionally in parallel
// ============================================================================
//
// Every case is self-contained, so cases are verified independently.  When
// built with AWP_USE_OPENMP the loop is shared between OpenMP threads;
// each thread constructs its own verifiers, so no Z3 context is ever
// touched by two threads.
//
// ============================================================================

#ifndef AWP_BATCH_HPP
#define AWP_BATCH_HPP

#include "awp/acceptance.hpp"
#include "awp/comparator.hpp"
#include "awp/scenario_reader.hpp"
#include "awp/smt_verifier.hpp"
#include "awp/uniqueness_verifier.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace awp {

// ── BatchOptions ────────────────────────────────────────────────────────────

struct BatchOptions {
    VerifierConfig    verifier;
    SmtConfig         smt;
    AcceptancePolicy  policy;
    bool              compare     = false;   // also run SMT and the comparator
    int               num_threads = 0;       // OpenMP threads (0 = default)
};

// ── CaseReport ──────────────────────────────────────────────────────────────

struct CaseReport {
    std::size_t    index       = 0;
    std::uint32_t  first_line  = 0;
    int            scenario_id = 0;

    bool           built = false;   // false: `error` holds the BuildError text
    std::string    error;

    VerificationResult                            verification;
    Verdict                                       verdict = Verdict::Inconsistent;
    std::optional<std::map<std::string, double>>  deduced;
    std::optional<Comparison>                     comparison;
};

/// Verify every case.  Reports are returned in input order; a case that
/// fails to build is reported, never aborts the batch.
std::vector<CaseReport> verify_batch(const std::vector<VerificationCase>& cases,
                                     const BatchOptions& opts);

/// Render a report as one line, e.g. "3: accepted unique init_A_marble=10".
std::string format_report(const CaseReport& report);

}  // namespace awp

#endif  // AWP_BATCH_HPP
