// ============================================================================
// constraint_system.cpp — Building conservation systems and masked views
// ============================================================================

#include "awp/constraint_system.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <unordered_map>

namespace awp {

const char* variable_kind_name(VariableKind kind) noexcept {
    switch (kind) {
        case VariableKind::Initial:  return "initial";
        case VariableKind::Final:    return "final";
        case VariableKind::Transfer: return "transfer";
    }
    return "?";
}

// ── Variable naming ─────────────────────────────────────────────────────────
// Components are joined with '_'.  Inside a component '.' becomes ".." and
// '_' becomes "._", so a bare '_' is always a separator and distinct
// (agent, object) pairs never share a name.

static std::string escape_component(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '.' || c == '_') {
            out += '.';
        }
        out += c;
    }
    return out;
}

std::string initial_variable_name(const std::string& agent, const std::string& object_type) {
    return "init_" + escape_component(agent) + "_" + escape_component(object_type);
}

std::string final_variable_name(const std::string& agent, const std::string& object_type) {
    return "final_" + escape_component(agent) + "_" + escape_component(object_type);
}

std::string transfer_variable_name(const Transfer& transfer) {
    return "transfer_" + std::to_string(transfer.transfer_id) + "_" +
           escape_component(transfer.from_agent) + "_" + escape_component(transfer.to_agent) +
           "_" + escape_component(transfer.object_type);
}

// ── ConstraintSystem ────────────────────────────────────────────────────────

std::optional<std::size_t> ConstraintSystem::variable_index(const std::string& name) const {
    for (std::size_t i = 0; i < variables.size(); ++i) {
        if (variables[i].name == name) return i;
    }
    return std::nullopt;
}

bool ConstraintSystem::is_masked(const std::string& name) const {
    return std::find(masked_variables.begin(), masked_variables.end(), name) !=
           masked_variables.end();
}

std::string ConstraintSystem::to_string() const {
    std::ostringstream oss;
    for (Eigen::Index r = 0; r < matrix.rows(); ++r) {
        bool first = true;
        for (Eigen::Index c = 0; c < matrix.cols(); ++c) {
            double coeff = matrix(r, c);
            if (coeff == 0.0) continue;
            const std::string& name = variables[static_cast<std::size_t>(c)].name;
            if (first) {
                oss << (coeff < 0 ? "-" : "") << name;
                first = false;
            } else {
                oss << (coeff < 0 ? " - " : " + ") << name;
            }
        }
        if (first) oss << "0";
        oss << " = " << rhs(r) << "\n";
    }
    return oss.str();
}

// ── Mask resolution ─────────────────────────────────────────────────────────
// One resolver per MaskKind, indexed by the enum value.  Each returns the
// name of the variable the target hides or throws BuildError.

using MaskResolver = std::string (*)(const Scenario&, const MaskTarget&);

static void require_pair(const Scenario& scenario, const MaskTarget& target) {
    if (!scenario.find_agent(target.agent)) {
        throw BuildError("mask " + target.to_string() + ": unknown agent '" +
                         target.agent + "'");
    }
    if (!scenario.has_object(target.object_type)) {
        throw BuildError("mask " + target.to_string() + ": unknown object '" +
                         target.object_type + "'");
    }
}

static std::string resolve_initial(const Scenario& scenario, const MaskTarget& target) {
    require_pair(scenario, target);
    return initial_variable_name(target.agent, target.object_type);
}

static std::string resolve_final(const Scenario& scenario, const MaskTarget& target) {
    require_pair(scenario, target);
    return final_variable_name(target.agent, target.object_type);
}

static std::string resolve_transfer(const Scenario& scenario, const MaskTarget& target) {
    const Transfer* t = scenario.find_transfer(target.transfer_id);
    if (!t) {
        throw BuildError("mask " + target.to_string() + ": unknown transfer id " +
                         std::to_string(target.transfer_id));
    }
    return transfer_variable_name(*t);
}

static constexpr std::array<MaskResolver, kMaskKindCount> kMaskResolvers = {
    resolve_initial,    // MaskKind::InitialCount
    resolve_final,      // MaskKind::FinalCount
    resolve_transfer,   // MaskKind::TransferQuantity
};

// ── build ───────────────────────────────────────────────────────────────────

ConstraintSystem ConstraintSystemBuilder::build(const Scenario& scenario,
                                                const MaskingSpec& masking) const {
    ConstraintSystem sys;

    // ── Variables, seeded from ground truth ─────────────────────────────
    for (const auto& agent : scenario.agents) {
        for (const auto& obj : scenario.object_types) {
            Variable init;
            init.name = initial_variable_name(agent.name, obj);
            init.kind = VariableKind::Initial;
            init.agent = agent.name;
            init.object_type = obj;
            sys.known_values[init.name] = agent.initial_count(obj);
            sys.variables.push_back(std::move(init));

            Variable fin;
            fin.name = final_variable_name(agent.name, obj);
            fin.kind = VariableKind::Final;
            fin.agent = agent.name;
            fin.object_type = obj;
            sys.known_values[fin.name] = agent.final_count(obj);
            sys.variables.push_back(std::move(fin));
        }
    }

    for (const auto& t : scenario.transfers) {
        Variable var;
        var.name = transfer_variable_name(t);
        var.kind = VariableKind::Transfer;
        var.agent = t.from_agent;
        var.object_type = t.object_type;
        var.transfer_id = t.transfer_id;
        sys.known_values[var.name] = t.quantity;
        sys.variables.push_back(std::move(var));
    }

    std::unordered_map<std::string, Eigen::Index> column_of;
    for (std::size_t i = 0; i < sys.variables.size(); ++i) {
        if (!column_of.emplace(sys.variables[i].name, static_cast<Eigen::Index>(i)).second) {
            throw BuildError("variable name collision: " + sys.variables[i].name);
        }
    }

    // ── Masking ─────────────────────────────────────────────────────────
    for (const auto& target : masking.targets) {
        MaskResolver resolve = kMaskResolvers[static_cast<std::size_t>(target.kind)];
        std::string name = resolve(scenario, target);
        if (sys.is_masked(name)) continue;

        sys.known_values.erase(name);
        sys.variables[static_cast<std::size_t>(column_of.at(name))].is_masked = true;
        sys.masked_variables.push_back(std::move(name));
    }

    // ── Conservation rows ───────────────────────────────────────────────
    const Eigen::Index n = static_cast<Eigen::Index>(sys.variables.size());
    const Eigen::Index m =
        static_cast<Eigen::Index>(scenario.agents.size() * scenario.object_types.size());
    sys.matrix = Eigen::MatrixXd::Zero(m, n);
    sys.rhs = Eigen::VectorXd::Zero(m);

    Eigen::Index row = 0;
    for (const auto& agent : scenario.agents) {
        for (const auto& obj : scenario.object_types) {
            sys.matrix(row, column_of.at(final_variable_name(agent.name, obj))) = 1.0;
            sys.matrix(row, column_of.at(initial_variable_name(agent.name, obj))) = -1.0;

            for (const auto& t : scenario.transfers) {
                if (t.object_type != obj) continue;
                Eigen::Index col = column_of.at(transfer_variable_name(t));
                if (t.to_agent == agent.name) {
                    sys.matrix(row, col) = -1.0;
                } else if (t.from_agent == agent.name) {
                    sys.matrix(row, col) = 1.0;
                }
            }
            ++row;
        }
    }

    return sys;
}

// ── extract_masked_system ───────────────────────────────────────────────────

MaskedSubsystem ConstraintSystemBuilder::extract_masked_system(
        const ConstraintSystem& system) const {
    MaskedSubsystem sub;
    sub.matrix.resize(0, 0);
    sub.rhs.resize(0);

    std::vector<Eigen::Index> masked_cols;
    for (const auto& name : system.masked_variables) {
        if (auto idx = system.variable_index(name)) {
            masked_cols.push_back(static_cast<Eigen::Index>(*idx));
            sub.names.push_back(name);
        }
    }
    if (masked_cols.empty()) {
        return sub;
    }

    const Eigen::Index m = system.matrix.rows();
    const Eigen::Index k = static_cast<Eigen::Index>(masked_cols.size());

    sub.matrix.resize(m, k);
    for (Eigen::Index j = 0; j < k; ++j) {
        sub.matrix.col(j) = system.matrix.col(masked_cols[static_cast<std::size_t>(j)]);
    }

    sub.rhs = system.rhs;
    for (std::size_t c = 0; c < system.variables.size(); ++c) {
        const Variable& var = system.variables[c];
        if (system.is_masked(var.name)) continue;

        auto it = system.known_values.find(var.name);
        double value = it == system.known_values.end() ? 0.0 : static_cast<double>(it->second);
        if (value == 0.0) continue;
        sub.rhs -= system.matrix.col(static_cast<Eigen::Index>(c)) * value;
    }

    return sub;
}

}  // namespace awp
