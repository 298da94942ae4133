// ============================================================================
// awp/smt_verifier.hpp — Formal cross-check with an SMT backend
// ============================================================================
//
// Re-verifies a ConstraintSystem over bounded non-negative integers:
//
//   1. declare  0 <= v <= upper_bound        for every variable
//   2. assert   v == ground truth            for every known variable
//   3. assert   each row of the full system  (integer coefficients)
//   4. check    SAT     → witness; go to 5
//               UNSAT   → the scenario itself is inconsistent
//               UNKNOWN → timeout / indeterminate, reported as such
//   5. push; assert "some masked variable differs from the witness";
//      check again: UNSAT → unique, SAT → alternative found; pop
//
// The backend is a capability chosen once at startup: make_smt_verifier()
// returns either the Z3 implementation or a stub whose results all say
// available = false.  Callers hold the interface and never branch on the
// backend themselves.
//
// ============================================================================

#ifndef AWP_SMT_VERIFIER_HPP
#define AWP_SMT_VERIFIER_HPP

#include "awp/constraint_system.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace awp {

// ── SmtConfig ───────────────────────────────────────────────────────────────

struct SmtConfig {
    bool          enabled     = true;
    std::int64_t  upper_bound = 1000;    // realistic inventory ceiling
    unsigned      timeout_ms  = 10000;   // per check(); 0 = none
};

// ── SmtStatus / UniquenessStatus ────────────────────────────────────────────

enum class SmtStatus {
    Unavailable,   // no backend; fall back to linear algebra
    Sat,
    Unsat,         // hard inconsistency in the scenario
    Unknown        // timeout or indeterminate; inconclusive
};

enum class UniquenessStatus {
    NotChecked,        // base check was not SAT
    UniqueConfirmed,
    AlternativeFound,
    Inconclusive       // negation check returned UNKNOWN
};

const char* smt_status_name(SmtStatus s) noexcept;
const char* uniqueness_status_name(UniquenessStatus s) noexcept;

// ── SmtPhase ────────────────────────────────────────────────────────────────
// Progress of one verify() call:
//   Idle → Asserting → Checking → {Sat, Unsat, Unknown}
//   Sat → NegationCheck → {UniqueConfirmed, AlternativeFound} → Done

enum class SmtPhase {
    Idle,
    Asserting,
    Checking,
    Sat,
    Unsat,
    Unknown,
    NegationCheck,
    UniqueConfirmed,
    AlternativeFound,
    Done
};

const char* smt_phase_name(SmtPhase p) noexcept;

// ── SmtResult ───────────────────────────────────────────────────────────────

using Assignment = std::map<std::string, std::int64_t>;

struct SmtResult {
    bool                        available   = false;
    bool                        satisfiable = false;
    bool                        is_unique   = false;
    SmtStatus                   status      = SmtStatus::Unavailable;
    UniquenessStatus            uniqueness  = UniquenessStatus::NotChecked;
    SmtPhase                    last_phase  = SmtPhase::Idle;
    std::optional<Assignment>   witness;
    std::optional<Assignment>   alternative;   // masked values of a second solution
    double                      elapsed_s   = 0.0;
    std::optional<std::string>  diagnostic;
    std::string                 smt_lib;       // base problem, SMT-LIB 2
};

// ── SmtVerifier ─────────────────────────────────────────────────────────────

class SmtVerifier {
public:
    virtual ~SmtVerifier() = default;

    /// Whether verify() can produce a verdict at all.
    virtual bool available() const noexcept = 0;

    virtual SmtResult verify(const ConstraintSystem& system) = 0;

    /// Backend name and version, e.g. "z3 4.12.2" or "unavailable".
    virtual std::string backend_info() const = 0;
};

// ── Z3SmtVerifier ───────────────────────────────────────────────────────────
// Every verify() call creates its own Z3 context, so one instance may be
// reused sequentially.  Do not share an instance between threads.

class Z3SmtVerifier final : public SmtVerifier {
public:
    explicit Z3SmtVerifier(SmtConfig config = {});

    bool available() const noexcept override { return true; }
    SmtResult verify(const ConstraintSystem& system) override;
    std::string backend_info() const override;

    const SmtConfig& config() const noexcept { return config_; }

private:
    SmtConfig config_;
};

// ── UnavailableSmtVerifier ──────────────────────────────────────────────────

class UnavailableSmtVerifier final : public SmtVerifier {
public:
    explicit UnavailableSmtVerifier(std::string reason = "SMT backend disabled");

    bool available() const noexcept override { return false; }
    SmtResult verify(const ConstraintSystem& system) override;
    std::string backend_info() const override { return "unavailable"; }

private:
    std::string reason_;
};

/// Select the backend once, from configuration.
std::unique_ptr<SmtVerifier> make_smt_verifier(const SmtConfig& config);

/// Write the base problem of `system` (bounds, known values, one equality
/// per row) to `path` as SMT-LIB 2.  Throws std::runtime_error if the file
/// cannot be written.
void export_smt_lib(const ConstraintSystem& system, const std::string& path,
                    const SmtConfig& config = {});

}  // namespace awp

#endif  // AWP_SMT_VERIFIER_HPP
