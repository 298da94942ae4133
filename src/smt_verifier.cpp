// ============================================================================
// smt_verifier.cpp — Z3 cross-check of conservation systems
// ============================================================================

#include "awp/smt_verifier.hpp"
#include "awp/z3_solver.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace awp {

const char* smt_status_name(SmtStatus s) noexcept {
    switch (s) {
        case SmtStatus::Unavailable: return "UNAVAILABLE";
        case SmtStatus::Sat:         return "SAT";
        case SmtStatus::Unsat:       return "UNSAT";
        case SmtStatus::Unknown:     return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* uniqueness_status_name(UniquenessStatus s) noexcept {
    switch (s) {
        case UniquenessStatus::NotChecked:       return "not-checked";
        case UniquenessStatus::UniqueConfirmed:  return "unique";
        case UniquenessStatus::AlternativeFound: return "alternative-found";
        case UniquenessStatus::Inconclusive:     return "inconclusive";
    }
    return "?";
}

const char* smt_phase_name(SmtPhase p) noexcept {
    switch (p) {
        case SmtPhase::Idle:             return "idle";
        case SmtPhase::Asserting:        return "asserting";
        case SmtPhase::Checking:         return "checking";
        case SmtPhase::Sat:              return "sat";
        case SmtPhase::Unsat:            return "unsat";
        case SmtPhase::Unknown:          return "unknown";
        case SmtPhase::NegationCheck:    return "negation-check";
        case SmtPhase::UniqueConfirmed:  return "unique-confirmed";
        case SmtPhase::AlternativeFound: return "alternative-found";
        case SmtPhase::Done:             return "done";
    }
    return "?";
}

// ── Base problem ────────────────────────────────────────────────────────────
// Bounds, known values and one equality per row.  Returns every variable
// name in column order.

static std::vector<std::string> assert_base_problem(Z3Session& session,
                                                    const ConstraintSystem& system,
                                                    const SmtConfig& config) {
    std::vector<std::string> all_names;
    all_names.reserve(system.variables.size());
    for (const auto& var : system.variables) {
        session.declare_bounded_int(var.name, 0, config.upper_bound);
        all_names.push_back(var.name);
    }

    for (const auto& [name, value] : system.known_values) {
        session.add_equality(name, value);
    }

    for (Eigen::Index r = 0; r < system.matrix.rows(); ++r) {
        std::vector<std::pair<std::string, std::int64_t>> terms;
        for (Eigen::Index c = 0; c < system.matrix.cols(); ++c) {
            std::int64_t coeff = std::llround(system.matrix(r, c));
            if (coeff == 0) continue;
            terms.emplace_back(system.variables[static_cast<std::size_t>(c)].name, coeff);
        }
        session.add_linear_equality(terms, std::llround(system.rhs(r)));
    }
    return all_names;
}

// ── Z3SmtVerifier ───────────────────────────────────────────────────────────

Z3SmtVerifier::Z3SmtVerifier(SmtConfig config)
    : config_(config) {}

std::string Z3SmtVerifier::backend_info() const {
    return "z3 " + z3_version_string();
}

SmtResult Z3SmtVerifier::verify(const ConstraintSystem& system) {
    SmtResult result;
    result.available = true;
    result.status = SmtStatus::Unknown;

    const auto t_start = std::chrono::steady_clock::now();
    auto elapsed = [&t_start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - t_start).count();
    };

    try {
        Z3Session session(config_.timeout_ms);

        // ── Asserting ───────────────────────────────────────────────────
        result.last_phase = SmtPhase::Asserting;
        std::vector<std::string> all_names = assert_base_problem(session, system, config_);

        result.smt_lib = session.to_smt2();

        // ── Checking ────────────────────────────────────────────────────
        result.last_phase = SmtPhase::Checking;
        Z3Result base = session.check();

        if (base == Z3Result::UNSAT) {
            result.last_phase = SmtPhase::Unsat;
            result.status = SmtStatus::Unsat;
            result.diagnostic = "conservation system is unsatisfiable within [0, " +
                                std::to_string(config_.upper_bound) + "]";
            result.elapsed_s = elapsed();
            return result;
        }
        if (base == Z3Result::UNKNOWN) {
            result.last_phase = SmtPhase::Unknown;
            result.status = SmtStatus::Unknown;
            result.diagnostic = "solver returned unknown (timeout after " +
                                std::to_string(config_.timeout_ms) + " ms or indeterminate)";
            result.elapsed_s = elapsed();
            return result;
        }

        result.last_phase = SmtPhase::Sat;
        result.status = SmtStatus::Sat;
        result.satisfiable = true;
        result.witness = session.model_values(all_names);

        // ── NegationCheck ───────────────────────────────────────────────
        if (system.masked_variables.empty()) {
            result.last_phase = SmtPhase::UniqueConfirmed;
            result.uniqueness = UniquenessStatus::UniqueConfirmed;
            result.is_unique = true;
        } else {
            Assignment masked_witness;
            for (const auto& name : system.masked_variables) {
                masked_witness[name] = result.witness->at(name);
            }

            result.last_phase = SmtPhase::NegationCheck;
            ScopedAssertions scope(session);
            session.add_any_differs(masked_witness);
            Z3Result again = session.check();

            if (again == Z3Result::UNSAT) {
                result.last_phase = SmtPhase::UniqueConfirmed;
                result.uniqueness = UniquenessStatus::UniqueConfirmed;
                result.is_unique = true;
            } else if (again == Z3Result::SAT) {
                result.last_phase = SmtPhase::AlternativeFound;
                result.uniqueness = UniquenessStatus::AlternativeFound;
                result.is_unique = false;
                result.alternative = session.model_values(system.masked_variables);
            } else {
                result.uniqueness = UniquenessStatus::Inconclusive;
                result.is_unique = false;
                result.diagnostic = "uniqueness check returned unknown";
            }
        }

        if (result.uniqueness != UniquenessStatus::Inconclusive) {
            result.last_phase = SmtPhase::Done;
        }
    } catch (const z3::exception& e) {
        result.status = SmtStatus::Unknown;
        result.satisfiable = false;
        result.is_unique = false;
        result.diagnostic = std::string("z3 error: ") + e.msg();
    } catch (const std::exception& e) {
        result.status = SmtStatus::Unknown;
        result.satisfiable = false;
        result.is_unique = false;
        result.diagnostic = std::string("smt check failed: ") + e.what();
    }

    result.elapsed_s = elapsed();
    return result;
}

// ── UnavailableSmtVerifier ──────────────────────────────────────────────────

UnavailableSmtVerifier::UnavailableSmtVerifier(std::string reason)
    : reason_(std::move(reason)) {}

SmtResult UnavailableSmtVerifier::verify(const ConstraintSystem&) {
    SmtResult result;
    result.available = false;
    result.status = SmtStatus::Unavailable;
    result.diagnostic = reason_;
    return result;
}

// ── export_smt_lib ─────────────────────────────────────────────────────────

void export_smt_lib(const ConstraintSystem& system, const std::string& path,
                    const SmtConfig& config) {
    Z3Session session(config.timeout_ms);
    assert_base_problem(session, system, config);

    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot write " + path);
    }
    out << session.to_smt2();
    if (!out) {
        throw std::runtime_error("error writing " + path);
    }
}

// ── make_smt_verifier ───────────────────────────────────────────────────────

std::unique_ptr<SmtVerifier> make_smt_verifier(const SmtConfig& config) {
    if (!config.enabled) {
        return std::make_unique<UnavailableSmtVerifier>();
    }
    return std::make_unique<Z3SmtVerifier>(config);
}

}  // namespace awp
