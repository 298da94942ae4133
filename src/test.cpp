// ============================================================================
// test.cpp — Self-test suite for awp_verify
// ============================================================================
//
// Contains tests covering:
//   - Scenario simulation, validation and structural errors
//   - Constraint system layout, masking and masked extraction
//   - Rank-based solvability / uniqueness analysis and deduction
//   - Z3 session scoping and the SMT cross-check
//   - Comparator agreement and the acceptance gate
//   - .awp reader, batch driver and fuzz harness
//
// ============================================================================

#include "awp/test.hpp"
#include "awp/acceptance.hpp"
#include "awp/batch.hpp"
#include "awp/comparator.hpp"
#include "awp/constraint_system.hpp"
#include "awp/fuzz.hpp"
#include "awp/masking.hpp"
#include "awp/scenario.hpp"
#include "awp/scenario_reader.hpp"
#include "awp/smt_verifier.hpp"
#include "awp/uniqueness_verifier.hpp"
#include "awp/utils.hpp"
#include "awp/z3_solver.hpp"

#include <cmath>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace awp {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

void TestContext::check_near(double actual, double expected, double tolerance,
                             const std::string& description) {
    ++total_;
    if (!(std::abs(actual - expected) <= tolerance)) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << " (+/- " << tolerance << ")\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Fixtures
// ============================================================================

// A gives B 4 marbles.  A starts with 10, B with 0; A ends with 6, B with 4.
static Scenario marbles() {
    Scenario s;
    s.scenario_id = 1;
    s.object_types = {"marble"};

    Agent a;
    a.name = "A";
    a.initial_inventory["marble"] = 10;
    Agent b;
    b.name = "B";
    b.initial_inventory["marble"] = 0;
    s.agents = {a, b};

    Transfer t;
    t.transfer_id = 1;
    t.from_agent = "A";
    t.to_agent = "B";
    t.object_type = "marble";
    t.quantity = 4;
    s.transfers = {t};

    simulate(s);
    return s;
}

static ConstraintSystem build(const Scenario& s, const MaskingSpec& masking) {
    ConstraintSystemBuilder builder;
    return builder.build(s, masking);
}

// Hidden transfer, and a corrupted final count for B that no longer matches
// what A gave away.
static ConstraintSystem contradictory_system() {
    ConstraintSystem sys = build(marbles(), MaskingSpec::transfers({1}));
    sys.known_values["final_B_marble"] = 5;
    return sys;
}

static bool simulate_fails(Scenario s) {
    try {
        simulate(s);
        return false;
    } catch (const ScenarioError&) {
        return true;
    }
}

static bool build_fails(const Scenario& s, const MaskingSpec& masking) {
    try {
        build(s, masking);
        return false;
    } catch (const BuildError&) {
        return true;
    }
}

// Message of the ReadError thrown for `lines`, or "" if reading succeeds.
static std::string read_error(const std::vector<std::string>& lines) {
    try {
        ScenarioReader reader;
        reader.read(lines);
        return "";
    } catch (const ReadError& e) {
        return e.what();
    }
}

static SmtConfig z3_config() {
    SmtConfig cfg;
    cfg.upper_bound = 1000;
    cfg.timeout_ms = 10000;
    return cfg;
}

// ============================================================================
// Scenario Tests
// ============================================================================

static void test_scenario_simulate(TestContext& ctx) {
    Scenario s = marbles();
    ctx.check(s.find_agent("A")->final_count("marble") == 6, "A ends with 6 marbles");
    ctx.check(s.find_agent("B")->final_count("marble") == 4, "B ends with 4 marbles");
    ctx.check(s.find_agent("C") == nullptr, "unknown agent lookup returns null");
    ctx.check(s.find_transfer(1) != nullptr, "transfer 1 is found");
    ctx.check(s.find_agent("A")->initial_count("apple") == 0, "missing object counts as zero");

    bool ok = true;
    try {
        validate(s);
    } catch (const ScenarioError&) {
        ok = false;
    }
    ctx.check(ok, "simulated scenario satisfies conservation");
}

static void test_scenario_conservation(TestContext& ctx) {
    Scenario s = marbles();
    s.agents[0].final_inventory["marble"] = 7;

    bool threw = false;
    try {
        validate(s);
    } catch (const ScenarioError& e) {
        threw = std::string(e.what()).find("conservation violated for A/marble") !=
                std::string::npos;
    }
    ctx.check(threw, "tampered final count violates conservation");
}

static void test_scenario_structural_errors(TestContext& ctx) {
    Scenario overdraft = marbles();
    overdraft.transfers[0].quantity = 11;
    ctx.check(simulate_fails(overdraft), "sender cannot give more than it holds");

    Scenario self = marbles();
    self.transfers[0].to_agent = "A";
    ctx.check(simulate_fails(self), "self-transfer is rejected");

    Scenario ghost = marbles();
    ghost.transfers[0].to_agent = "C";
    ctx.check(simulate_fails(ghost), "unknown receiver is rejected");

    Scenario negative = marbles();
    negative.transfers[0].quantity = -1;
    ctx.check(simulate_fails(negative), "negative quantity is rejected");

    Scenario dup_transfer = marbles();
    dup_transfer.transfers.push_back(dup_transfer.transfers[0]);
    dup_transfer.transfers[1].quantity = 1;
    ctx.check(simulate_fails(dup_transfer), "duplicate transfer id is rejected");

    Scenario dup_agent = marbles();
    dup_agent.agents.push_back(dup_agent.agents[1]);
    ctx.check(simulate_fails(dup_agent), "duplicate agent is rejected");

    Scenario undeclared = marbles();
    undeclared.agents[0].initial_inventory["apple"] = 2;
    ctx.check(simulate_fails(undeclared), "undeclared object in inventory is rejected");
}

// ============================================================================
// Constraint System Tests
// ============================================================================

static void test_build_layout(TestContext& ctx) {
    ConstraintSystem sys = build(marbles(), MaskingSpec::none());

    ctx.check(sys.num_vars() == 5, "2 agents x 1 object x 2 + 1 transfer = 5 variables");
    ctx.check(sys.num_rows() == 2, "one row per (agent, object)");
    ctx.check(sys.matrix.cols() == 5, "one column per variable");
    ctx.check(sys.rhs.size() == 2, "rhs has one entry per row");
    ctx.check(sys.rhs.isZero(), "rhs is zero at construction");

    ctx.check_eq(sys.variables[0].name, "init_A_marble", "variable 0");
    ctx.check_eq(sys.variables[1].name, "final_A_marble", "variable 1");
    ctx.check_eq(sys.variables[2].name, "init_B_marble", "variable 2");
    ctx.check_eq(sys.variables[3].name, "final_B_marble", "variable 3");
    ctx.check_eq(sys.variables[4].name, "transfer_1_A_B_marble", "variable 4");
    ctx.check(sys.variables[4].kind == VariableKind::Transfer, "transfer variable kind");
    ctx.check(sys.variables[4].transfer_id.value_or(0) == 1, "transfer variable carries its id");

    ctx.check(sys.known_values.size() == 5, "every variable known when nothing is masked");
    ctx.check(sys.masked_variables.empty(), "nothing masked");
    ctx.check(sys.known_values.at("final_A_marble") == 6, "final A known value");

    // A: -init_A + final_A + t = 0,  B: -init_B + final_B - t = 0
    ctx.check(sys.matrix(0, 0) == -1.0 && sys.matrix(0, 1) == 1.0 && sys.matrix(0, 4) == 1.0,
              "row A: giver's transfer enters with +1");
    ctx.check(sys.matrix(1, 2) == -1.0 && sys.matrix(1, 3) == 1.0 && sys.matrix(1, 4) == -1.0,
              "row B: receiver's transfer enters with -1");
    ctx.check(sys.matrix(0, 2) == 0.0 && sys.matrix(1, 0) == 0.0, "rows do not mix agents");

    ctx.check_eq(sys.to_string(),
                 "-init_A_marble + final_A_marble + transfer_1_A_B_marble = 0\n"
                 "-init_B_marble + final_B_marble - transfer_1_A_B_marble = 0\n",
                 "equation rendering");
}

static void test_build_masking(TestContext& ctx) {
    ConstraintSystem sys = build(marbles(), MaskingSpec::initial_count("A", "marble"));

    ctx.check(sys.masked_variables.size() == 1, "one masked variable");
    ctx.check(sys.is_masked("init_A_marble"), "init_A_marble is masked");
    ctx.check(sys.variables[0].is_masked, "variable flag follows the mask");
    ctx.check(sys.known_values.count("init_A_marble") == 0, "masked value is not known");
    ctx.check(sys.known_values.size() == 4, "known and masked partition the variables");
    ctx.check(sys.variable_index("final_B_marble").value_or(99) == 3, "variable_index");
    ctx.check(!sys.variable_index("nope").has_value(), "variable_index of unknown name");

    MaskingSpec twice = MaskingSpec::initial_count("A", "marble");
    twice.add(MaskTarget::initial_count("A", "marble"));
    ConstraintSystem idem = build(marbles(), twice);
    ctx.check(idem.masked_variables.size() == 1, "masking the same quantity twice is idempotent");

    MaskingSpec all;
    all.add(MaskTarget::final_count("B", "marble")).add(MaskTarget::transfer(1));
    ConstraintSystem mixed = build(marbles(), all);
    ctx.check(mixed.masked_variables.size() == 2, "final and transfer masks");
    ctx.check_eq(mixed.masked_variables[0], "final_B_marble", "mask order is kept");
    ctx.check_eq(mixed.masked_variables[1], "transfer_1_A_B_marble", "transfer mask name");

    ctx.check_eq(MaskTarget::initial_count("A", "marble").to_string(), "initial A/marble",
                 "mask target rendering");
    ctx.check_eq(MaskTarget::transfer(3).to_string(), "transfer #3", "transfer target rendering");
}

static void test_build_mask_errors(TestContext& ctx) {
    Scenario s = marbles();
    ctx.check(build_fails(s, MaskingSpec::initial_count("Z", "marble")), "unknown agent");
    ctx.check(build_fails(s, MaskingSpec::initial_count("A", "apple")), "unknown object");
    ctx.check(build_fails(s, MaskingSpec::transfers({2})), "unknown transfer id");

    MaskingSpec final_ghost;
    final_ghost.add(MaskTarget::final_count("Z", "marble"));
    ctx.check(build_fails(s, final_ghost), "unknown agent in final mask");

    // A repeated object type yields init_A_marble twice.
    Scenario clash = s;
    clash.object_types.push_back("marble");
    ctx.check(build_fails(clash, MaskingSpec::none()), "variable name collision");
}

static void test_build_underscore_names(TestContext& ctx) {
    // Agent A_b holding c and agent A holding b_c.
    Scenario s;
    s.scenario_id = 1;
    s.object_types = {"c", "b_c"};
    Agent ab;
    ab.name = "A_b";
    ab.initial_inventory["c"] = 2;
    Agent a;
    a.name = "A";
    a.initial_inventory["b_c"] = 3;
    s.agents = {ab, a};
    Transfer t;
    t.transfer_id = 1;
    t.from_agent = "A";
    t.to_agent = "A_b";
    t.object_type = "b_c";
    t.quantity = 1;
    s.transfers = {t};
    simulate(s);

    ctx.check_eq(initial_variable_name("A_b", "c"), "init_A._b_c", "underscore is escaped");
    ctx.check_eq(initial_variable_name("A", "b_c"), "init_A_b._c", "in either component");
    ctx.check(initial_variable_name("a.", "_b") != initial_variable_name("a", "._b"),
              "dots are escaped too");
    ctx.check_eq(transfer_variable_name(t), "transfer_1_A_A._b_b._c", "transfer name");
    ctx.check_eq(initial_variable_name("A", "marble"), "init_A_marble", "plain names unchanged");

    bool built = !build_fails(s, MaskingSpec::none());
    ctx.check(built, "underscored names do not collide");
    if (!built) return;

    ConstraintSystem sys = build(s, MaskingSpec::initial_count("A_b", "c"));
    std::set<std::string> names;
    for (const auto& var : sys.variables) names.insert(var.name);
    ctx.check(sys.num_vars() == 9 && names.size() == 9, "nine distinct variables");
    ctx.check(sys.is_masked("init_A._b_c"), "mask resolves the escaped name");

    UniquenessVerifier v;
    auto values = v.deduce(sys);
    ctx.check(values.has_value(), "deduced");
    if (values) {
        ctx.check_near(values->at("init_A._b_c"), 2.0, 1e-9, "A_b started with 2 c");
    }
}

static void test_extract_empty(TestContext& ctx) {
    ConstraintSystemBuilder builder;
    ConstraintSystem sys = builder.build(marbles(), MaskingSpec::none());
    MaskedSubsystem sub = builder.extract_masked_system(sys);

    ctx.check(sub.empty(), "no names");
    ctx.check(sub.matrix.rows() == 0 && sub.matrix.cols() == 0, "empty matrix");
    ctx.check(sub.rhs.size() == 0, "empty rhs");
}

static void test_extract_folds_known(TestContext& ctx) {
    ConstraintSystemBuilder builder;
    ConstraintSystem sys = builder.build(marbles(), MaskingSpec::initial_count("A", "marble"));
    MaskedSubsystem sub = builder.extract_masked_system(sys);

    ctx.check(sub.names.size() == 1, "one masked column");
    ctx.check(sub.matrix.rows() == 2 && sub.matrix.cols() == 1, "rows kept one-to-one");
    ctx.check(sub.matrix(0, 0) == -1.0 && sub.matrix(1, 0) == 0.0, "masked column copied");
    // Row A: -init_A = -(final_A + t) = -10
    ctx.check_near(sub.rhs(0), -10.0, 1e-12, "known terms moved to the rhs of row A");
    // Row B: 0 = -(final_B - init_B - t) = 0
    ctx.check_near(sub.rhs(1), 0.0, 1e-12, "row B balances on its own");
}

// ============================================================================
// Uniqueness Verifier Tests
// ============================================================================

static void test_verify_nothing_masked(TestContext& ctx) {
    UniquenessVerifier v;
    VerificationResult r = v.verify(build(marbles(), MaskingSpec::none()));
    ctx.check(r.solvable && r.is_unique, "nothing masked is trivially unique");
    ctx.check(r.rank_deficiency == 0, "no deficiency");
    ctx.check_eq(r.message, "unique", "message");

    auto values = v.deduce(build(marbles(), MaskingSpec::none()));
    ctx.check(values && values->empty(), "nothing to deduce");
}

static void test_verify_one_unknown_per_row(TestContext& ctx) {
    MaskingSpec m = MaskingSpec::initial_count("A", "marble");
    m.add(MaskTarget::final_count("B", "marble"));
    ConstraintSystem sys = build(marbles(), m);

    UniquenessVerifier v;
    VerificationResult r = v.verify(sys);
    ctx.check(r.solvable && r.is_unique, "one unknown per equation is unique");
    ctx.check(r.redundant_rows.empty(), "no redundant rows");
    ctx.check(r.condition_number.has_value(), "square full-rank system has a condition number");
    if (r.condition_number) {
        ctx.check_near(*r.condition_number, 1.0, 1e-9, "unit coefficients are well conditioned");
    }
    ctx.check(v.is_well_posed(sys), "well posed");

    auto values = v.deduce(sys);
    ctx.check(values.has_value(), "values are deduced");
    if (values) {
        ctx.check_near(values->at("init_A_marble"), 10.0, 1e-9, "init_A_marble = 10");
        ctx.check_near(values->at("final_B_marble"), 4.0, 1e-9, "final_B_marble = 4");
    }
}

static void test_verify_two_unknowns_one_row(TestContext& ctx) {
    MaskingSpec m = MaskingSpec::initial_count("A", "marble");
    m.add(MaskTarget::final_count("A", "marble"));
    ConstraintSystem sys = build(marbles(), m);

    UniquenessVerifier v;
    VerificationResult r = v.verify(sys);
    ctx.check(r.solvable, "still solvable");
    ctx.check(!r.is_unique, "two unknowns in one equation are not unique");
    ctx.check(r.rank_deficiency == 1, "one degree of freedom");
    ctx.check(!r.condition_number.has_value(), "no condition number when rank deficient");
    ctx.check_eq(r.message, "under-determined: 1 degrees of freedom", "message");
    ctx.check(!v.deduce(sys).has_value(), "no deduction when not unique");
    ctx.check(!v.is_well_posed(sys), "not well posed");

    std::vector<std::string> hints = v.suggest_fixes(r);
    ctx.check(!hints.empty() && hints[0].find("under-determined") != std::string::npos,
              "hint names the deficiency");
}

static void test_concrete_single_mask(TestContext& ctx) {
    ConstraintSystem sys = build(marbles(), MaskingSpec::initial_count("A", "marble"));
    UniquenessVerifier v;
    VerificationResult r = v.verify(sys);
    ctx.check(r.solvable && r.is_unique, "A's initial count is recoverable");
    ctx.check(r.rank_deficiency == 0, "full rank");

    auto values = v.deduce(sys);
    ctx.check(values.has_value(), "deduced");
    if (values) {
        ctx.check_near(values->at("init_A_marble"), 10.0, 1e-9, "A started with 10");
    }
}

static void test_concrete_three_masks(TestContext& ctx) {
    MaskingSpec m = MaskingSpec::initial_count("A", "marble");
    m.add(MaskTarget::transfer(1));
    m.add(MaskTarget::final_count("B", "marble"));
    ConstraintSystem sys = build(marbles(), m);

    UniquenessVerifier v;
    VerificationResult r = v.verify(sys);
    ctx.check(r.solvable, "solvable");
    ctx.check(!r.is_unique, "initial, transfer and final together are ambiguous");
    ctx.check(r.rank_deficiency == 1, "rank deficiency 1");
}

static void test_verify_redundant_rows(TestContext& ctx) {
    // Both rows pin the hidden transfer.
    ConstraintSystem sys = build(marbles(), MaskingSpec::transfers({1}));
    UniquenessVerifier v;
    VerificationResult r = v.verify(sys);

    ctx.check(r.solvable && r.is_unique, "transfer determined twice is still unique");
    ctx.check(r.redundant_rows.size() == 1, "one of the two rows is redundant");
    if (r.redundant_rows.size() == 1) {
        ctx.check(r.redundant_rows[0] == 0 || r.redundant_rows[0] == 1, "row index in range");
    }
    ctx.check_eq(r.message, "unique", "a unique system reads unique even with spare rows");
    ctx.check(!r.condition_number.has_value(), "non-square system has no condition number");
    std::vector<std::string> hints = v.suggest_fixes(r);
    ctx.check(!hints.empty() && hints[0].find("Redundant constraints") != std::string::npos,
              "spare rows are still reported as hints");

    auto values = v.deduce(sys);
    ctx.check(values.has_value(), "deduced");
    if (values) {
        ctx.check_near(values->at("transfer_1_A_B_marble"), 4.0, 1e-9, "A gave 4");
    }

    // The same constraint written twice.
    MaskedSubsystem dup;
    dup.matrix.resize(3, 2);
    dup.matrix << 1, 0,
                  0, 1,
                  1, 0;
    dup.rhs.resize(3);
    dup.rhs << 3, 4, 3;
    dup.names = {"x", "y"};
    VerificationResult rd = v.analyze(dup);
    ctx.check(rd.solvable && rd.is_unique, "duplicated row keeps the system unique");
    ctx.check(rd.redundant_rows.size() == 1 && rd.redundant_rows[0] == 2,
              "the repeated row is the redundant one");
}

static void test_verify_duplicate_subscenario(TestContext& ctx) {
    // A gives B 4 marbles, and C gives D 4 marbles in exactly the same way.
    Scenario s = marbles();
    Agent c;
    c.name = "C";
    c.initial_inventory["marble"] = 10;
    Agent d;
    d.name = "D";
    d.initial_inventory["marble"] = 0;
    s.agents.push_back(c);
    s.agents.push_back(d);
    Transfer t;
    t.transfer_id = 2;
    t.from_agent = "C";
    t.to_agent = "D";
    t.object_type = "marble";
    t.quantity = 4;
    s.transfers.push_back(t);
    simulate(s);

    ConstraintSystemBuilder builder;
    ConstraintSystem sys = builder.build(s, MaskingSpec::transfers({1, 2}));
    MaskedSubsystem sub = builder.extract_masked_system(sys);
    ctx.check(sub.matrix.rows() == 4 && sub.matrix.cols() == 2, "rows A, B, C, D over two transfers");

    UniquenessVerifier v;
    VerificationResult r = v.verify(sys);
    ctx.check(r.solvable && r.is_unique, "both hidden transfers are determined");
    ctx.check(r.rank_deficiency == 0, "full column rank");
    ctx.check_eq(r.message, "unique", "message");
    ctx.check(r.redundant_rows == std::vector<int>({1, 3}),
              "the receiver rows B and D repeat the giver rows A and C");

    auto values = v.deduce(sys);
    ctx.check(values.has_value(), "deduced");
    if (values) {
        ctx.check_near(values->at("transfer_1_A_B_marble"), 4.0, 1e-9, "A gave 4");
        ctx.check_near(values->at("transfer_2_C_D_marble"), 4.0, 1e-9, "C gave 4");
    }
}

static void test_verify_inconsistent(TestContext& ctx) {
    ConstraintSystem sys = contradictory_system();
    UniquenessVerifier v;
    VerificationResult r = v.verify(sys);

    ctx.check(!r.solvable, "contradictory rows are not solvable");
    ctx.check(!r.is_unique, "not unique either");
    ctx.check_eq(r.message, "inconsistent", "message");
    ctx.check(!v.deduce(sys).has_value(), "no deduction");
    ctx.check(!v.is_well_posed(sys), "not well posed");

    std::vector<std::string> hints = v.suggest_fixes(r);
    ctx.check(!hints.empty() && hints[0].find("inconsistent") != std::string::npos,
              "hint names the inconsistency");
}

static void test_analyze_degenerate(TestContext& ctx) {
    UniquenessVerifier v;

    MaskedSubsystem empty;
    VerificationResult r0 = v.analyze(empty);
    ctx.check(r0.solvable && r0.is_unique, "empty sub-system is trivially unique");

    MaskedSubsystem no_rows;
    no_rows.matrix.resize(0, 2);
    no_rows.rhs.resize(0);
    no_rows.names = {"x", "y"};
    VerificationResult r1 = v.analyze(no_rows);
    ctx.check(r1.solvable, "no rows: solvable");
    ctx.check(!r1.is_unique && r1.rank_deficiency == 2, "no rows: every unknown is free");

    MaskedSubsystem no_cols;
    no_cols.matrix.resize(3, 0);
    no_cols.rhs = Eigen::VectorXd::Zero(3);
    VerificationResult r2 = v.analyze(no_cols);
    ctx.check(r2.solvable && r2.is_unique, "no columns: trivially unique");

    // x + y = 1 and x + y = 2 contradict; the all-zero row still counts in m.
    MaskedSubsystem clash;
    clash.matrix.resize(3, 3);
    clash.matrix << 1, 1, 0,
                    1, 1, 0,
                    0, 0, 0;
    clash.rhs.resize(3);
    clash.rhs << 1, 2, 0;
    clash.names = {"x", "y", "z"};
    VerificationResult r3 = v.analyze(clash);
    ctx.check(!r3.solvable && !r3.is_unique, "contradiction with a zero row");
    ctx.check_eq(r3.message, "inconsistent", "message");
    ctx.check(r3.rank_deficiency == -2, "rank 1 minus min(3 rows, 3 columns)");
}

static void test_verify_conditioning(TestContext& ctx) {
    MaskingSpec m = MaskingSpec::initial_count("A", "marble");
    m.add(MaskTarget::final_count("B", "marble"));
    ConstraintSystem sys = build(marbles(), m);

    VerifierConfig strict;
    strict.max_condition = 0.5;
    UniquenessVerifier v(strict);
    ctx.check(v.verify(sys).is_unique, "uniqueness does not depend on max_condition");
    ctx.check(!v.is_well_posed(sys), "condition 1 exceeds a limit of 0.5");
}

// ============================================================================
// Z3 / SMT Tests
// ============================================================================

static void test_z3_session_scope(TestContext& ctx) {
    Z3Session session;
    session.declare_bounded_int("x", 0, 10);
    ctx.check(session.check() == Z3Result::SAT, "0 <= x <= 10 is SAT");

    {
        ScopedAssertions scope(session);
        session.add_equality("x", 11);
        ctx.check(session.check() == Z3Result::UNSAT, "x = 11 contradicts the bound");
    }
    ctx.check(session.check() == Z3Result::SAT, "scope popped the contradiction");

    {
        ScopedAssertions scope(session);
        session.add_any_differs({});
        ctx.check(session.check() == Z3Result::UNSAT, "empty disjunction is false");
    }

    session.declare_bounded_int("y", 0, 10);
    session.add_linear_equality({{"x", 1}, {"y", -1}}, 3);
    session.add_equality("y", 4);
    ctx.check(session.check() == Z3Result::SAT, "x - y = 3, y = 4 is SAT");
    auto values = session.model_values({"x", "y"});
    ctx.check(values.at("x") == 7, "x = 7");
    ctx.check(!session.to_smt2().empty(), "SMT-LIB rendering");
}

static void test_smt_unavailable(TestContext& ctx) {
    SmtConfig cfg;
    cfg.enabled = false;
    std::unique_ptr<SmtVerifier> smt = make_smt_verifier(cfg);

    ctx.check(!smt->available(), "disabled backend is unavailable");
    ctx.check_eq(smt->backend_info(), "unavailable", "backend info");

    SmtResult r = smt->verify(build(marbles(), MaskingSpec::initial_count("A", "marble")));
    ctx.check(!r.available, "result says unavailable");
    ctx.check(r.status == SmtStatus::Unavailable, "status Unavailable");
    ctx.check(!r.witness.has_value(), "no witness");
}

static void test_smt_unique(TestContext& ctx) {
    Z3SmtVerifier smt(z3_config());
    ctx.check(smt.backend_info().rfind("z3 ", 0) == 0, "backend info names z3");

    SmtResult r = smt.verify(build(marbles(), MaskingSpec::initial_count("A", "marble")));
    ctx.check(r.available, "available");
    ctx.check(r.status == SmtStatus::Sat && r.satisfiable, "SAT");
    ctx.check(r.uniqueness == UniquenessStatus::UniqueConfirmed && r.is_unique, "unique");
    ctx.check(r.last_phase == SmtPhase::Done, "ran to completion");
    ctx.check(r.witness && r.witness->at("init_A_marble") == 10, "witness recovers 10");
    ctx.check(r.witness && r.witness->size() == 5, "witness covers every variable");
    ctx.check(!r.smt_lib.empty(), "SMT-LIB text recorded");

    SmtResult none = smt.verify(build(marbles(), MaskingSpec::none()));
    ctx.check(none.satisfiable && none.is_unique, "nothing masked: unique");
}

static void test_smt_alternative(TestContext& ctx) {
    MaskingSpec m = MaskingSpec::initial_count("A", "marble");
    m.add(MaskTarget::transfer(1));
    m.add(MaskTarget::final_count("B", "marble"));

    Z3SmtVerifier smt(z3_config());
    SmtResult r = smt.verify(build(marbles(), m));
    ctx.check(r.status == SmtStatus::Sat, "SAT");
    ctx.check(r.uniqueness == UniquenessStatus::AlternativeFound, "second solution found");
    ctx.check(!r.is_unique, "not unique");
    ctx.check(r.alternative && r.alternative->size() == 3, "alternative covers masked values");
    if (r.alternative && r.witness) {
        bool differs = false;
        for (const auto& [name, value] : *r.alternative) {
            if (r.witness->at(name) != value) differs = true;
        }
        ctx.check(differs, "alternative differs from the witness");
    }
}

static void test_smt_unsat(TestContext& ctx) {
    Z3SmtVerifier smt(z3_config());
    SmtResult r = smt.verify(contradictory_system());
    ctx.check(r.available, "available");
    ctx.check(r.status == SmtStatus::Unsat, "contradiction is UNSAT, not UNKNOWN");
    ctx.check(!r.satisfiable && !r.is_unique, "neither satisfiable nor unique");
    ctx.check(r.uniqueness == UniquenessStatus::NotChecked, "negation check skipped");
    ctx.check(r.diagnostic.has_value(), "diagnostic set");

    // Known counts above the upper bound cannot be satisfied.
    SmtConfig tight = z3_config();
    tight.upper_bound = 3;
    Z3SmtVerifier bounded(tight);
    SmtResult rb = bounded.verify(build(marbles(), MaskingSpec::transfers({1})));
    ctx.check(rb.status == SmtStatus::Unsat, "known values above the bound are UNSAT");
}

static void test_smt_internal_error(TestContext& ctx) {
    // A masked name with no variable behind it cannot be read from the model.
    ConstraintSystem sys = build(marbles(), MaskingSpec::initial_count("A", "marble"));
    sys.masked_variables.push_back("ghost");

    Z3SmtVerifier smt(z3_config());
    bool threw = false;
    SmtResult r;
    try {
        r = smt.verify(sys);
    } catch (const std::exception&) {
        threw = true;
    }
    ctx.check(!threw, "verify reports failures as results");
    ctx.check(r.status == SmtStatus::Unknown, "status Unknown");
    ctx.check(!r.satisfiable && !r.is_unique, "no verdict");
    ctx.check(r.diagnostic && r.diagnostic->find("smt check failed") != std::string::npos,
              "diagnostic explains the failure");
}

static void test_smt_export(TestContext& ctx) {
    ConstraintSystem sys = build(marbles(), MaskingSpec::initial_count("A", "marble"));
    std::string path =
        (std::filesystem::temp_directory_path() / "awp_selftest_case.smt2").string();

    export_smt_lib(sys, path, z3_config());
    std::string text;
    for (const auto& line : read_lines(path)) text += line + "\n";
    std::filesystem::remove(path);

    ctx.check(text.find("declare-fun") != std::string::npos, "variables are declared");
    ctx.check(text.find("init_A_marble") != std::string::npos, "masked variable is declared");
    ctx.check(text.find("transfer_1_A_B_marble") != std::string::npos, "transfer is declared");

    Z3SmtVerifier smt(z3_config());
    SmtResult r = smt.verify(sys);
    ctx.check(r.smt_lib.find("transfer_1_A_B_marble") != std::string::npos,
              "verify records the same base problem");

    bool threw = false;
    try {
        export_smt_lib(sys, "/nonexistent/awp/case.smt2", z3_config());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ctx.check(threw, "unwritable path throws");
}

// ============================================================================
// Comparator / Acceptance Tests
// ============================================================================

static void test_comparator_agreement(TestContext& ctx) {
    UniquenessVerifier linear;
    Z3SmtVerifier smt(z3_config());
    Comparator cmp(linear, smt);

    MaskingSpec three = MaskingSpec::initial_count("A", "marble");
    three.add(MaskTarget::transfer(1));
    three.add(MaskTarget::final_count("B", "marble"));

    const std::vector<ConstraintSystem> systems = {
        build(marbles(), MaskingSpec::initial_count("A", "marble")),
        build(marbles(), three),
        build(marbles(), MaskingSpec::transfers({1})),
        contradictory_system(),
    };
    for (std::size_t i = 0; i < systems.size(); ++i) {
        Comparison c = cmp.compare(systems[i]);
        const std::string label = "system " + std::to_string(i);
        ctx.check(c.agreement.has_value(), label + ": conclusive");
        ctx.check(!c.diverges(), label + ": verifiers agree");
        ctx.check(c.smt.satisfiable == c.linear_algebra.solvable, label + ": solvability");
        if (c.smt.satisfiable) {
            ctx.check(c.smt.is_unique == c.linear_algebra.is_unique, label + ": uniqueness");
        }
    }

    Comparison unique = cmp.compare(systems[0]);
    ctx.check_eq(describe(unique), "la=unique smt=SAT/unique agree", "describe");

    UnavailableSmtVerifier off;
    Comparator la_only(linear, off);
    Comparison c = la_only.compare(systems[0]);
    ctx.check(!c.agreement.has_value(), "no agreement without a backend");
    ctx.check(!c.diverges(), "unavailable is never a divergence");
    ctx.check_eq(describe(c), "la=unique smt=UNAVAILABLE n/a", "describe without backend");
}

static void test_acceptance_gate(TestContext& ctx) {
    UniquenessVerifier linear;
    UnavailableSmtVerifier off;
    AcceptanceGate gate(AcceptancePolicy{}, linear, off);

    MaskingSpec three = MaskingSpec::initial_count("A", "marble");
    three.add(MaskTarget::transfer(1));
    three.add(MaskTarget::final_count("B", "marble"));

    AcceptanceDecision d1 = gate.evaluate(build(marbles(), MaskingSpec::initial_count("A", "marble")));
    ctx.check(d1.accepted && d1.verdict == Verdict::Accepted, "unique question accepted");
    ctx.check(!d1.smt.has_value(), "SMT not consulted by default");

    AcceptanceDecision d2 = gate.evaluate(build(marbles(), three));
    ctx.check(!d2.accepted && d2.verdict == Verdict::NotUnique, "ambiguous question rejected");

    AcceptanceDecision d3 = gate.evaluate(contradictory_system());
    ctx.check(d3.verdict == Verdict::Inconsistent, "inconsistent question rejected");

    AcceptancePolicy with_smt;
    with_smt.use_smt = true;
    AcceptanceGate degraded(with_smt, linear, off);
    AcceptanceDecision d4 = degraded.evaluate(build(marbles(), MaskingSpec::initial_count("A", "marble")));
    ctx.check(d4.accepted && !d4.smt.has_value(), "unavailable backend degrades to linear algebra");

    Z3SmtVerifier z3(z3_config());
    AcceptanceGate confirmed(with_smt, linear, z3);
    AcceptanceDecision d5 = confirmed.evaluate(build(marbles(), MaskingSpec::initial_count("A", "marble")));
    ctx.check(d5.accepted && d5.smt.has_value(), "SMT confirms the accepted question");

    VerifierConfig strict;
    strict.max_condition = 0.5;
    UniquenessVerifier strict_linear(strict);
    AcceptancePolicy well_posed;
    well_posed.require_well_posed = true;
    MaskingSpec two = MaskingSpec::initial_count("A", "marble");
    two.add(MaskTarget::final_count("B", "marble"));
    AcceptanceGate conditioned(well_posed, strict_linear, off);
    ctx.check(conditioned.evaluate(build(marbles(), two)).verdict == Verdict::IllConditioned,
              "condition number above the limit");
}

static void test_classify_smt_verdicts(TestContext& ctx) {
    AcceptancePolicy policy;
    VerificationResult unique;
    unique.solvable = true;
    unique.is_unique = true;
    unique.message = "unique";

    SmtResult sr;
    sr.available = true;
    sr.status = SmtStatus::Unknown;
    ctx.check(classify(policy, unique, &sr, 1e10) == Verdict::SmtUnknown, "timeout");

    sr.status = SmtStatus::Unsat;
    ctx.check(classify(policy, unique, &sr, 1e10) == Verdict::SmtUnsat, "unsat");

    sr.status = SmtStatus::Sat;
    sr.satisfiable = true;
    sr.uniqueness = UniquenessStatus::AlternativeFound;
    sr.is_unique = false;
    ctx.check(classify(policy, unique, &sr, 1e10) == Verdict::SmtDisagrees, "disagreement");

    sr.uniqueness = UniquenessStatus::UniqueConfirmed;
    sr.is_unique = true;
    ctx.check(classify(policy, unique, &sr, 1e10) == Verdict::Accepted, "confirmed");

    SmtResult off;
    off.status = SmtStatus::Unsat;
    ctx.check(classify(policy, unique, &off, 1e10) == Verdict::Accepted,
              "unavailable result is ignored");

    ctx.check_eq(verdict_name(Verdict::NotUnique), "not-unique", "verdict name");
}

// ============================================================================
// Reader / Batch / Fuzz Tests
// ============================================================================

static const std::vector<std::string> kTwoCases = {
    "# two cases",
    "scenario 7",
    "object marble",
    "agent A marble=10",
    "agent B marble=0",
    "transfer 1 A B marble 4   # A gives B four",
    "mask initial A marble",
    "---",
    "object apple",
    "agent X apple=3",
    "agent Y",
    "transfer 1 X Y apple 1",
    "mask transfer 1",
    "mask final Y apple",
};

static void test_reader_cases(TestContext& ctx) {
    ScenarioReader reader;
    std::vector<VerificationCase> cases = reader.read(kTwoCases);
    ctx.check(cases.size() == 2, "two cases");
    if (cases.size() != 2) return;

    const VerificationCase& c1 = cases[0];
    ctx.check(c1.scenario.scenario_id == 7, "explicit scenario id");
    ctx.check(c1.first_line == 2, "case 1 starts on line 2");
    ctx.check(c1.scenario.agents.size() == 2, "two agents");
    ctx.check(c1.scenario.find_agent("A")->final_count("marble") == 6, "final counts simulated");
    ctx.check(c1.masking.targets.size() == 1, "one mask");

    const VerificationCase& c2 = cases[1];
    ctx.check(c2.scenario.scenario_id == 2, "default scenario id is the case number");
    ctx.check(c2.first_line == 9, "case 2 starts on line 9");
    ctx.check(c2.scenario.find_agent("Y")->final_count("apple") == 1, "empty agent received 1");
    ctx.check(c2.masking.targets.size() == 2, "two masks");
    ctx.check(c2.masking.targets[1].kind == MaskKind::FinalCount, "final mask kind");
}

static void test_reader_errors(TestContext& ctx) {
    ctx.check(read_error({"object marble", "agent A marble=1", "frobnicate"})
                  .rfind("3: ERROR: unknown directive", 0) == 0,
              "unknown directive reports its line");
    ctx.check(read_error({"object m", "agent A m=x"}).rfind("2: ERROR:", 0) == 0,
              "bad count");
    ctx.check(read_error({"object m", "agent A m=1", "agent B", "transfer 1 A B m"})
                  .rfind("4: ERROR:", 0) == 0,
              "transfer with too few fields");
    ctx.check(read_error({"object m", "agent A m=1", "agent B", "transfer 1 A B m 1 2"})
                  .rfind("4: ERROR: too many fields", 0) == 0,
              "transfer with too many fields");
    ctx.check(read_error({"object m", "agent A m=1", "mask sideways A m"})
                  .rfind("3: ERROR: unknown mask kind", 0) == 0,
              "unknown mask kind");
    ctx.check(read_error({"", "object m", "agent A m=1", "agent B", "transfer 1 A B m 5"})
                  .rfind("2: ERROR: transfer 1", 0) == 0,
              "overdraft reported at the first line of the case");
    ctx.check(read_error({"scenario 4294967297", "object m", "agent A m=1"})
                  .rfind("1: ERROR: scenario id out of range", 0) == 0,
              "scenario id wider than int");
    ctx.check(read_error({"object m", "agent A m=1", "agent B", "transfer 4294967297 A B m 1"})
                  .rfind("4: ERROR: transfer id out of range", 0) == 0,
              "transfer id wider than int");
    ctx.check(read_error({"object m", "agent A m=1", "agent B", "transfer 1 A B m 1",
                          "mask transfer 4294967297"})
                  .rfind("5: ERROR: transfer id out of range", 0) == 0,
              "masked transfer id wider than int");
    ctx.check(read_error({"object m", "agent A m=1"}).empty(), "valid input reads");

    bool threw = false;
    try {
        read_cases("/nonexistent/awp/input.awp");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ctx.check(threw, "missing file throws");
}

static void test_batch_reports(TestContext& ctx) {
    std::vector<std::string> lines = kTwoCases;
    lines.push_back("---");
    lines.push_back("object marble");
    lines.push_back("agent A marble=1");
    lines.push_back("mask initial Z marble");

    ScenarioReader reader;
    std::vector<VerificationCase> cases = reader.read(lines);
    ctx.check(cases.size() == 3, "three cases");

    BatchOptions opts;
    opts.num_threads = 1;
    std::vector<CaseReport> reports = verify_batch(cases, opts);
    ctx.check(reports.size() == 3, "one report per case");
    if (reports.size() != 3) return;

    for (std::size_t i = 0; i < reports.size(); ++i) {
        ctx.check(reports[i].index == i, "report order equals input order");
    }

    ctx.check(reports[0].built && reports[0].verdict == Verdict::Accepted, "case 1 accepted");
    ctx.check_eq(format_report(reports[0]), "2: accepted unique init_A_marble=10",
                 "case 1 report line");

    ctx.check(reports[1].built, "case 2 built");
    ctx.check(reports[1].verification.solvable, "case 2 solvable");

    ctx.check(!reports[2].built, "bad mask does not abort the batch");
    ctx.check(format_report(reports[2]).find("ERROR: mask initial Z/marble") != std::string::npos,
              "build error is reported");

    BatchOptions cmp_opts;
    cmp_opts.compare = true;
    cmp_opts.smt = z3_config();
    std::vector<CaseReport> compared = verify_batch(cases, cmp_opts);
    ctx.check(compared[0].comparison.has_value(), "comparison attached");
    ctx.check(compared[0].comparison && !compared[0].comparison->diverges(), "case 1 agrees");
}

static void test_fuzz_cases(TestContext& ctx) {
    FuzzOptions opt;
    std::mt19937_64 rng_a(42);
    std::mt19937_64 rng_b(42);
    bool same = true;
    for (int i = 0; i < 20; ++i) {
        VerificationCase a = random_case(rng_a, opt);
        VerificationCase b = random_case(rng_b, opt);
        same = same && a.scenario.transfers.size() == b.scenario.transfers.size() &&
               a.masking.targets.size() == b.masking.targets.size();

        ctx.check(!a.masking.empty(), "random case masks something");
        bool valid = true;
        try {
            validate(a.scenario);
        } catch (const ScenarioError&) {
            valid = false;
        }
        ctx.check(valid, "random scenario conserves objects");
    }
    ctx.check(same, "same seed, same cases");
}

static void test_fuzz_runs(TestContext& ctx) {
    FuzzOptions la_only;
    la_only.iterations = 25;
    la_only.smt.enabled = false;
    la_only.write_files = false;
    FuzzSummary s = fuzz(la_only);
    ctx.check(s.runs == 25, "every iteration runs");
    ctx.check(s.build_errors == 0, "random masks always resolve");
    ctx.check(s.inconclusive == 25, "no backend, nothing conclusive");
    ctx.check(s.divergences == 0, "no divergence without a backend");

    FuzzOptions with_z3;
    with_z3.iterations = 15;
    with_z3.smt = z3_config();
    with_z3.write_files = false;
    FuzzSummary z = fuzz(with_z3);
    ctx.check(z.runs == 15, "every iteration runs with z3");
    ctx.check(z.agreements + z.divergences + z.inconclusive + z.build_errors == z.runs,
              "every run is classified once");
}

// ============================================================================
// Utility Tests
// ============================================================================

static void test_utils(TestContext& ctx) {
    ctx.check_eq(strip_comment("  agent A  # note"), "agent A", "strip_comment");
    ctx.check(split_ws(" a \t b  c ").size() == 3, "split_ws");
    ctx.check(parse_int("42").value_or(0) == 42, "parse_int");
    ctx.check(!parse_int("4x").has_value(), "parse_int rejects trailing characters");
    ctx.check(!parse_int("").has_value(), "parse_int rejects empty input");
    ctx.check(parse_double("1e-9").has_value(), "parse_double");
    ctx.check(!parse_double("abc").has_value(), "parse_double rejects junk");
    ctx.check_eq(csv_escape("a\"b"), "\"a\"\"b\"", "csv_escape");
}

// ============================================================================
// run_selftests
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Scenario tests
    runner.run("scenario_simulate",            test_scenario_simulate);
    runner.run("scenario_conservation",        test_scenario_conservation);
    runner.run("scenario_structural_errors",   test_scenario_structural_errors);

    // Constraint system tests
    runner.run("build_layout",                 test_build_layout);
    runner.run("build_masking",                test_build_masking);
    runner.run("build_mask_errors",            test_build_mask_errors);
    runner.run("build_underscore_names",       test_build_underscore_names);
    runner.run("extract_empty",                test_extract_empty);
    runner.run("extract_folds_known",          test_extract_folds_known);

    // Uniqueness verifier tests
    runner.run("verify_nothing_masked",        test_verify_nothing_masked);
    runner.run("verify_one_unknown_per_row",   test_verify_one_unknown_per_row);
    runner.run("verify_two_unknowns_one_row",  test_verify_two_unknowns_one_row);
    runner.run("concrete_single_mask",         test_concrete_single_mask);
    runner.run("concrete_three_masks",         test_concrete_three_masks);
    runner.run("verify_redundant_rows",        test_verify_redundant_rows);
    runner.run("verify_duplicate_subscenario", test_verify_duplicate_subscenario);
    runner.run("verify_inconsistent",          test_verify_inconsistent);
    runner.run("analyze_degenerate",           test_analyze_degenerate);
    runner.run("verify_conditioning",          test_verify_conditioning);

    // Z3 / SMT tests
    runner.run("z3_session_scope",             test_z3_session_scope);
    runner.run("smt_unavailable",              test_smt_unavailable);
    runner.run("smt_unique",                   test_smt_unique);
    runner.run("smt_alternative",              test_smt_alternative);
    runner.run("smt_unsat",                    test_smt_unsat);
    runner.run("smt_internal_error",           test_smt_internal_error);
    runner.run("smt_export",                   test_smt_export);

    // Comparator / acceptance tests
    runner.run("comparator_agreement",         test_comparator_agreement);
    runner.run("acceptance_gate",              test_acceptance_gate);
    runner.run("classify_smt_verdicts",        test_classify_smt_verdicts);

    // Reader / batch / fuzz tests
    runner.run("reader_cases",                 test_reader_cases);
    runner.run("reader_errors",                test_reader_errors);
    runner.run("batch_reports",                test_batch_reports);
    runner.run("fuzz_cases",                   test_fuzz_cases);
    runner.run("fuzz_runs",                    test_fuzz_runs);

    // Utilities
    runner.run("utils",                        test_utils);

    return runner.summarise();
}

}  // namespace awp
