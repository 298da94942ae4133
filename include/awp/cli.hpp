// ============================================================================
// awp/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver loop: read .awp file → build → verify → print one line per case.
//
// ============================================================================

#ifndef AWP_CLI_HPP
#define AWP_CLI_HPP

#include <cstdint>
#include <string>

namespace awp {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string    input;             // path to the .awp input (empty if --selftest / --fuzz)
    bool           selftest    = false;
    bool           use_smt     = false;   // SMT must confirm accepted cases
    bool           compare     = false;   // run the Comparator on every case
    bool           well_posed  = false;   // also reject ill-conditioned systems
    bool           verbose     = false;
    bool           help        = false;
    double         tolerance   = 1e-10;
    std::int64_t   upper_bound = 1000;
    unsigned       timeout_ms  = 10000;
    int            num_threads = 0;       // OpenMP threads (0 = default)
    int            fuzz_iterations = 0;   // > 0 selects fuzz mode
    std::uint64_t  seed        = 1337;
    std::string    output_dir;            // fuzz output directory
    std::string    smt_lib_dir;           // write case_<line>.smt2 here if set
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Main driver: read file, verify cases, print results.
/// Returns the process exit code (0 = ok, 1 = errors or divergence).
int run(const Options& opts);

}  // namespace awp

#endif  // AWP_CLI_HPP
