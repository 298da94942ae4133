// ============================================================================
// z3_solver.cpp — Implementation of the Z3 integer session
// ============================================================================

#include "awp/z3_solver.hpp"

#include <iostream>
#include <stdexcept>

namespace awp {

const char* z3_result_name(Z3Result r) noexcept {
    switch (r) {
        case Z3Result::SAT:     return "SAT";
        case Z3Result::UNSAT:   return "UNSAT";
        case Z3Result::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string z3_version_string() {
    unsigned major = 0, minor = 0, build = 0, revision = 0;
    Z3_get_version(&major, &minor, &build, &revision);
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(build);
}

// ── Z3Session ───────────────────────────────────────────────────────────────

Z3Session::Z3Session(unsigned timeout_ms)
    : ctx_(), solver_(ctx_) {
    if (timeout_ms > 0) {
        z3::params p(ctx_);
        p.set("timeout", timeout_ms);
        solver_.set(p);
    }
}

z3::expr Z3Session::get_int_var(const std::string& name) {
    auto it = int_vars_.find(name);
    if (it != int_vars_.end()) {
        return *it->second;
    }
    auto var = std::make_unique<z3::expr>(ctx_.int_const(name.c_str()));
    z3::expr result = *var;
    int_vars_[name] = std::move(var);
    return result;
}

z3::expr Z3Session::declare_bounded_int(const std::string& name, std::int64_t lower,
                                        std::int64_t upper) {
    z3::expr var = get_int_var(name);
    solver_.add(var >= ctx_.int_val(lower));
    solver_.add(var <= ctx_.int_val(upper));
    return var;
}

void Z3Session::add_equality(const std::string& name, std::int64_t value) {
    solver_.add(get_int_var(name) == ctx_.int_val(value));
}

void Z3Session::add_linear_equality(
        const std::vector<std::pair<std::string, std::int64_t>>& terms, std::int64_t rhs) {
    z3::expr sum = ctx_.int_val(0);
    for (const auto& [name, coeff] : terms) {
        if (coeff == 0) continue;
        sum = sum + ctx_.int_val(coeff) * get_int_var(name);
    }
    solver_.add(sum == ctx_.int_val(rhs));
}

void Z3Session::add_any_differs(const std::map<std::string, std::int64_t>& assignment) {
    z3::expr_vector alternatives(ctx_);
    for (const auto& [name, value] : assignment) {
        alternatives.push_back(get_int_var(name) != ctx_.int_val(value));
    }
    if (alternatives.empty()) {
        solver_.add(ctx_.bool_val(false));
        return;
    }
    solver_.add(z3::mk_or(alternatives));
}

Z3Result Z3Session::check() {
    z3::check_result result = solver_.check();

    switch (result) {
        case z3::sat:
            return Z3Result::SAT;
        case z3::unsat:
            return Z3Result::UNSAT;
        case z3::unknown:
            return Z3Result::UNKNOWN;
    }

    return Z3Result::UNKNOWN;
}

std::map<std::string, std::int64_t> Z3Session::model_values(const std::vector<std::string>& names) {
    z3::model model = solver_.get_model();
    std::map<std::string, std::int64_t> values;
    for (const auto& name : names) {
        z3::expr value = model.eval(get_int_var(name), true);
        if (!value.is_numeral()) {
            throw std::runtime_error("model value for " + name + " is not a numeral");
        }
        values[name] = value.get_numeral_int64();
    }
    return values;
}

std::string Z3Session::to_smt2() {
    return solver_.to_smt2();
}

void Z3Session::push() {
    solver_.push();
}

void Z3Session::pop() {
    solver_.pop();
}

// ── ScopedAssertions ────────────────────────────────────────────────────────

ScopedAssertions::ScopedAssertions(Z3Session& session)
    : session_(session) {
    session_.push();
}

ScopedAssertions::~ScopedAssertions() {
    try {
        session_.pop();
    } catch (const z3::exception& e) {
        std::cerr << "[smt] failed to pop assertion scope: " << e.msg() << "\n";
    }
}

}  // namespace awp
