// ============================================================================
// awp/constraint_system.hpp — Linear conservation system A·x = b
// ============================================================================
//
// Turns a Scenario plus a MaskingSpec into a linear system over every
// quantity of the scenario:
//
//   variables   init_<agent>_<object>     one per (agent, object) pair
//               final_<agent>_<object>    one per (agent, object) pair
//               transfer_<id>_<from>_<to>_<object>   one per transfer
//
//               '_' and '.' inside a name are written "._" and "..", so
//               agent A_b with object c is init_A._b_c.
//
//   rows        one per (agent, object) pair:
//               final - initial - Σ received + Σ given = 0
//
// Coefficients are always -1, 0 or +1.  Column i of the matrix is
// variables[i].  Known values are the ground truth of every unmasked
// variable; masked names are listed separately and the two sets partition
// the variables.
//
// A ConstraintSystem is built once per candidate question and never
// modified afterwards.
//
// ============================================================================

#ifndef AWP_CONSTRAINT_SYSTEM_HPP
#define AWP_CONSTRAINT_SYSTEM_HPP

#include "awp/masking.hpp"
#include "awp/scenario.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace awp {

// ── BuildError ──────────────────────────────────────────────────────────────
// Structural problem while building a system, e.g. a mask naming an agent,
// object or transfer that the scenario does not contain.

class BuildError : public std::runtime_error {
public:
    explicit BuildError(const std::string& msg) : std::runtime_error(msg) {}
};

// ── Variable ────────────────────────────────────────────────────────────────

enum class VariableKind : std::uint8_t {
    Initial,
    Final,
    Transfer
};

const char* variable_kind_name(VariableKind kind) noexcept;

struct Variable {
    std::string         name;
    VariableKind        kind = VariableKind::Initial;
    std::string         agent;        // sender, for transfer variables
    std::string         object_type;
    std::optional<int>  transfer_id;
    bool                is_masked = false;
};

std::string initial_variable_name(const std::string& agent, const std::string& object_type);
std::string final_variable_name(const std::string& agent, const std::string& object_type);
std::string transfer_variable_name(const Transfer& transfer);

// ── ConstraintSystem ────────────────────────────────────────────────────────

struct ConstraintSystem {
    Eigen::MatrixXd                      matrix;   // m x n
    Eigen::VectorXd                      rhs;      // m
    std::vector<Variable>                variables;
    std::map<std::string, std::int64_t>  known_values;
    std::vector<std::string>             masked_variables;

    std::size_t num_rows() const noexcept { return static_cast<std::size_t>(matrix.rows()); }
    std::size_t num_vars() const noexcept { return variables.size(); }

    /// Column index of a variable, or nullopt if no variable has that name.
    std::optional<std::size_t> variable_index(const std::string& name) const;

    bool is_masked(const std::string& name) const;

    /// Render every row as "-init_A_x + final_A_x + ... = 0", one per line,
    /// terms in column order.
    std::string to_string() const;
};

// ── MaskedSubsystem ─────────────────────────────────────────────────────────
// The system restricted to masked columns, with every known column folded
// into the right-hand side.  Rows are kept one-to-one with the full system.

struct MaskedSubsystem {
    Eigen::MatrixXd           matrix;   // m x k, k = number of masked variables
    Eigen::VectorXd           rhs;      // m
    std::vector<std::string>  names;    // k, column order

    bool empty() const noexcept { return names.empty(); }
};

// ── ConstraintSystemBuilder ─────────────────────────────────────────────────
// Stateless; both operations are pure functions of their arguments.

class ConstraintSystemBuilder {
public:
    /// Build the full system for `scenario` with the targets of `masking`
    /// hidden.  Throws BuildError if a target cannot be resolved or two
    /// variables end up with the same name.
    ConstraintSystem build(const Scenario& scenario, const MaskingSpec& masking) const;

    /// Extract the sub-system over the masked variables only.  Returns an
    /// empty matrix, vector and name list if nothing is masked.
    MaskedSubsystem extract_masked_system(const ConstraintSystem& system) const;
};

}  // namespace awp

#endif  // AWP_CONSTRAINT_SYSTEM_HPP
