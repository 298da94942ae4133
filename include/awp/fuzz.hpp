// ============================================================================
// awp/fuzz.hpp — Randomized agreement check between the two verifiers
// ============================================================================
//
// Generates random feasible scenarios from a fixed seed, masks a random
// handful of quantities, runs the Comparator on each and writes a CSV row
// per case plus a summary.  Called via `--fuzz N` from the CLI.
//
// ============================================================================

#ifndef AWP_FUZZ_HPP
#define AWP_FUZZ_HPP

#include "awp/scenario_reader.hpp"
#include "awp/smt_verifier.hpp"
#include "awp/uniqueness_verifier.hpp"

#include <cstdint>
#include <random>
#include <string>

namespace awp {

// ── FuzzOptions ─────────────────────────────────────────────────────────────

struct FuzzOptions {
    int             iterations   = 200;
    std::uint64_t   seed         = 1337;     // fixed seed
    int             max_agents   = 4;
    int             max_objects  = 2;
    int             max_transfers = 5;
    int             max_masks    = 3;
    std::int64_t    max_initial  = 20;       // per (agent, object)
    VerifierConfig  verifier;
    SmtConfig       smt;
    std::string     out_dir_override;        // optional output dir
    bool            write_files  = true;
};

// ── FuzzSummary ─────────────────────────────────────────────────────────────

struct FuzzSummary {
    int runs         = 0;
    int unique       = 0;   // linear algebra said unique
    int agreements   = 0;
    int divergences  = 0;
    int inconclusive = 0;   // SMT unknown or unavailable
    int build_errors = 0;
};

/// Draw one random feasible scenario and a random non-empty masking for it.
VerificationCase random_case(std::mt19937_64& rng, const FuzzOptions& opt);

/// Run the fuzz loop, writing results.csv, summary.txt and one
/// divergence_<iteration>.smt2 per divergence when opt.write_files is set.
FuzzSummary fuzz(const FuzzOptions& opt);

/// CLI entry point.  Returns 0 if no divergence was found, 1 otherwise.
int run_fuzz(const FuzzOptions& opt);

}  // namespace awp

#endif  // AWP_FUZZ_HPP
