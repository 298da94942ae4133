// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "awp/cli.hpp"
#include "awp/batch.hpp"
#include "awp/constraint_system.hpp"
#include "awp/fuzz.hpp"
#include "awp/scenario_reader.hpp"
#include "awp/smt_verifier.hpp"
#include "awp/test.hpp"
#include "awp/uniqueness_verifier.hpp"
#include "awp/utils.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace awp {

// ── Argument helpers ────────────────────────────────────────────────────────

static std::string next_arg(int argc, char* argv[], int& i, const std::string& opt,
                            const std::string& what) {
    if (i + 1 >= argc) {
        throw std::runtime_error(opt + " requires " + what + " argument");
    }
    return argv[++i];
}

static std::int64_t int_arg(int argc, char* argv[], int& i, const std::string& opt) {
    std::string text = next_arg(argc, argv, i, opt, "a number");
    auto value = parse_int(text);
    if (!value) {
        throw std::runtime_error(opt + ": not an integer: " + text);
    }
    return *value;
}

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--smt") {
            opts.use_smt = true;
        } else if (arg == "--compare") {
            opts.compare = true;
        } else if (arg == "--well-posed") {
            opts.well_posed = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--tolerance") {
            std::string text = next_arg(argc, argv, i, arg, "a number");
            auto value = parse_double(text);
            if (!value || *value <= 0.0) {
                throw std::runtime_error("--tolerance must be a positive number, got " + text);
            }
            opts.tolerance = *value;
        } else if (arg == "--upper-bound") {
            opts.upper_bound = int_arg(argc, argv, i, arg);
            if (opts.upper_bound < 0) {
                throw std::runtime_error("--upper-bound must be >= 0");
            }
        } else if (arg == "--timeout") {
            std::int64_t ms = int_arg(argc, argv, i, arg);
            if (ms < 0) {
                throw std::runtime_error("--timeout must be >= 0");
            }
            opts.timeout_ms = static_cast<unsigned>(ms);
        } else if (arg == "--threads" || arg == "-j") {
            opts.num_threads = static_cast<int>(int_arg(argc, argv, i, arg));
            if (opts.num_threads < 0) {
                throw std::runtime_error("--threads must be >= 0");
            }
        } else if (arg == "--fuzz") {
            opts.fuzz_iterations = static_cast<int>(int_arg(argc, argv, i, arg));
            if (opts.fuzz_iterations <= 0) {
                throw std::runtime_error("--fuzz must be > 0");
            }
        } else if (arg == "--seed") {
            std::int64_t seed = int_arg(argc, argv, i, arg);
            if (seed < 0) {
                throw std::runtime_error("--seed must be >= 0");
            }
            opts.seed = static_cast<std::uint64_t>(seed);
        } else if (arg == "--output") {
            opts.output_dir = next_arg(argc, argv, i, arg, "a directory");
        } else if (arg == "--smt-lib") {
            opts.smt_lib_dir = next_arg(argc, argv, i, arg, "a directory");
        } else if (arg.starts_with("-")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            if (!opts.input.empty()) {
                throw std::runtime_error("multiple input files not supported");
            }
            opts.input = arg;
        }
    }

    // Validate: need --selftest, --fuzz or an input file.
    if (!opts.selftest && !opts.help && opts.fuzz_iterations == 0 && opts.input.empty()) {
        throw std::runtime_error("no input file specified (use --help for usage)");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " [OPTIONS] <input.awp>\n"
        << "       " << program_name << " --fuzz N [--seed S] [--output <dir>]\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Solvability and uniqueness checker for masked transfer problems.\n"
        << "\n"
        << "Options:\n"
        << "  <input.awp>         File with one or more cases separated by ---\n"
        << "  --selftest          Run built-in tests\n"
        << "  --smt               Require Z3 to confirm every accepted case\n"
        << "  --compare           Run linear algebra and Z3 side by side\n"
        << "  --well-posed        Reject ill-conditioned systems too\n"
        << "  --tolerance T       Rank / pivot tolerance (default 1e-10)\n"
        << "  --upper-bound N     Largest value Z3 may assign (default 1000)\n"
        << "  --timeout MS        Z3 timeout per check in ms, 0 = none (default 10000)\n"
        << "  --threads N, -j N   Set number of OpenMP threads (0 = auto, default)\n"
        << "  --fuzz N            Compare both verifiers on N random scenarios\n"
        << "  --seed S            Fuzz seed (default 1337)\n"
        << "  --output <dir>      Fuzz output directory (default: fuzz_<timestamp>)\n"
        << "  --smt-lib <dir>     Write each case's SMT-LIB 2 problem to <dir>/case_<line>.smt2\n"
        << "  --verbose, -v       Print equations and hints for every case\n"
        << "  --help, -h          Show this message\n"
        << "\n"
        << "Input format:\n"
        << "  scenario <id>\n"
        << "  object <name> [<name> ...]\n"
        << "  agent <name> <object>=<count> ...\n"
        << "  transfer <id> <from> <to> <object> <quantity>\n"
        << "  mask initial|final <agent> <object>\n"
        << "  mask transfer <id> [<id> ...]\n"
        << "  ---                 ends a case\n"
        << "  Empty lines and everything after # are ignored\n";
}

// ── Verbose detail ──────────────────────────────────────────────────────────

static void print_detail(const VerificationCase& vc, const CaseReport& report,
                         const UniquenessVerifier& linear) {
    ConstraintSystemBuilder builder;
    ConstraintSystem system = builder.build(vc.scenario, vc.masking);

    std::istringstream equations(system.to_string());
    std::string line;
    while (std::getline(equations, line)) {
        std::cout << "    " << line << "\n";
    }
    std::cout << "    masked:";
    for (const auto& name : system.masked_variables) {
        std::cout << " " << name;
    }
    std::cout << "\n";

    for (const auto& hint : linear.suggest_fixes(report.verification)) {
        std::cout << "    hint: " << hint << "\n";
    }
    if (report.comparison && report.comparison->smt.diagnostic) {
        std::cout << "    smt: " << *report.comparison->smt.diagnostic << "\n";
    }
}

// ── SMT-LIB export ──────────────────────────────────────────────────────────

static void export_cases(const std::vector<VerificationCase>& cases,
                         const std::vector<CaseReport>& reports, const std::string& dir,
                         const SmtConfig& smt) {
    std::filesystem::create_directories(dir);
    ConstraintSystemBuilder builder;
    int written = 0;
    for (std::size_t i = 0; i < reports.size(); ++i) {
        if (!reports[i].built) continue;
        ConstraintSystem system = builder.build(cases[i].scenario, cases[i].masking);
        export_smt_lib(system, dir + "/case_" + std::to_string(cases[i].first_line) + ".smt2",
                       smt);
        ++written;
    }
    std::cerr << "[smt] wrote " << written << " SMT-LIB files to " << dir << "/\n";
}

// ── run ─────────────────────────────────────────────────────────────────────
// Main driver.  Reads the input file, verifies each case, prints results.

int run(const Options& opts) {
    // ── Handle --selftest ───────────────────────────────────────────────
    if (opts.selftest) {
        return run_selftests();
    }

    VerifierConfig verifier;
    verifier.tolerance = opts.tolerance;

    SmtConfig smt;
    smt.upper_bound = opts.upper_bound;
    smt.timeout_ms = opts.timeout_ms;

    // ── Handle --fuzz ───────────────────────────────────────────────────
    if (opts.fuzz_iterations > 0) {
        FuzzOptions fo;
        fo.iterations = opts.fuzz_iterations;
        fo.seed = opts.seed;
        fo.verifier = verifier;
        fo.smt = smt;
        fo.out_dir_override = opts.output_dir;
        return run_fuzz(fo);
    }

    // ── Read input file ─────────────────────────────────────────────────
    if (opts.input.empty()) {
        std::cerr << "ERROR: no input specified (use --help for usage)\n";
        return 1;
    }

    std::vector<VerificationCase> cases;
    try {
        cases = read_cases(opts.input);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    BatchOptions bo;
    bo.verifier = verifier;
    bo.smt = smt;
    bo.compare = opts.compare;
    bo.policy.use_smt = opts.use_smt;
    bo.policy.require_well_posed = opts.well_posed;
    bo.num_threads = opts.num_threads;

    if (opts.verbose && (opts.compare || opts.use_smt)) {
        std::cerr << "[smt] backend: " << make_smt_verifier(smt)->backend_info() << "\n";
    }

    // ── Verify and print each case ──────────────────────────────────────
    std::vector<CaseReport> reports = verify_batch(cases, bo);
    UniquenessVerifier linear(verifier);

    int accepted = 0;
    int errors = 0;
    int divergences = 0;
    for (std::size_t i = 0; i < reports.size(); ++i) {
        const CaseReport& report = reports[i];
        std::cout << format_report(report) << "\n";

        if (!report.built) {
            ++errors;
            continue;
        }
        if (report.verdict == Verdict::Accepted) ++accepted;
        if (report.comparison && report.comparison->diverges()) ++divergences;

        if (opts.verbose) {
            print_detail(cases[i], report, linear);
        }
    }

    if (!opts.smt_lib_dir.empty()) {
        export_cases(cases, reports, opts.smt_lib_dir, smt);
    }

    std::cerr << "[batch] " << reports.size() << " cases, " << accepted << " accepted, "
              << errors << " errors, " << divergences << " divergences\n";

    return (errors > 0 || divergences > 0) ? 1 : 0;
}

}  // namespace awp
