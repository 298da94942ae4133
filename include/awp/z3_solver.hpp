// ============================================================================
// awp/z3_solver.hpp — Z3 wrapper for bounded integer linear problems
// ============================================================================
//
// This module provides a thin wrapper around a Z3 context and solver for
// the integer linear equalities of a conservation system.
//
// Usage:
//   Z3Session session(timeout_ms);
//   session.declare_bounded_int("x", 0, 1000);
//   session.add_linear_equality({{"x", 1}, {"y", -1}}, 0);
//   if (session.check() == Z3Result::SAT) {
//       auto values = session.model_values({"x", "y"});
//   }
//
// A session owns its context.  Contexts are not thread-safe, so a session
// must never be shared between threads; create one per verification.
//
// ============================================================================

#ifndef AWP_Z3_SOLVER_HPP
#define AWP_Z3_SOLVER_HPP

#include <z3++.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace awp {

// ── Z3Result ────────────────────────────────────────────────────────────────

enum class Z3Result {
    SAT,
    UNSAT,
    UNKNOWN
};

const char* z3_result_name(Z3Result r) noexcept;

/// Version string of the linked Z3 library, e.g. "4.12.2".
std::string z3_version_string();

// ── Z3Session ───────────────────────────────────────────────────────────────

class Z3Session {
public:
    /// timeout_ms == 0 means no timeout.
    explicit Z3Session(unsigned timeout_ms = 0);

    Z3Session(const Z3Session&) = delete;
    Z3Session& operator=(const Z3Session&) = delete;

    /// Declare an integer constant and assert lower <= name <= upper.
    z3::expr declare_bounded_int(const std::string& name, std::int64_t lower,
                                 std::int64_t upper);

    /// Assert name == value.
    void add_equality(const std::string& name, std::int64_t value);

    /// Assert Σ coeff·var == rhs.  Terms with coefficient 0 are skipped.
    void add_linear_equality(const std::vector<std::pair<std::string, std::int64_t>>& terms,
                             std::int64_t rhs);

    /// Assert that at least one of the named variables differs from the
    /// given value.  An empty assignment asserts false.
    void add_any_differs(const std::map<std::string, std::int64_t>& assignment);

    /// Check satisfiability of all assertions in scope.
    Z3Result check();

    /// Values of the named variables in the last model (check() must have
    /// returned SAT).
    std::map<std::string, std::int64_t> model_values(const std::vector<std::string>& names);

    /// SMT-LIB 2 rendering of the current assertions.
    std::string to_smt2();

    void push();
    void pop();

private:
    // Get or create a Z3 integer variable for the given name.
    z3::expr get_int_var(const std::string& name);

    z3::context  ctx_;
    z3::solver   solver_;

    std::unordered_map<std::string, std::unique_ptr<z3::expr>> int_vars_;
};

// ── ScopedAssertions ────────────────────────────────────────────────────────
// push() on construction, pop() on destruction, so assertions added inside
// the scope never leak into later checks on the same session.

class ScopedAssertions {
public:
    explicit ScopedAssertions(Z3Session& session);
    ~ScopedAssertions();

    ScopedAssertions(const ScopedAssertions&) = delete;
    ScopedAssertions& operator=(const ScopedAssertions&) = delete;

private:
    Z3Session& session_;
};

}  // namespace awp

#endif  // AWP_Z3_SOLVER_HPP
