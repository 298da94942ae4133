// ============================================================================
// scenario.cpp — Ground-truth simulation and validation of scenarios
// ============================================================================

#include "awp/scenario.hpp"

#include <set>
#include <string>

namespace awp {

// ── Agent ───────────────────────────────────────────────────────────────────

std::int64_t Agent::initial_count(const std::string& object_type) const {
    auto it = initial_inventory.find(object_type);
    return it == initial_inventory.end() ? 0 : it->second;
}

std::int64_t Agent::final_count(const std::string& object_type) const {
    auto it = final_inventory.find(object_type);
    return it == final_inventory.end() ? 0 : it->second;
}

// ── Scenario lookups ────────────────────────────────────────────────────────

const Agent* Scenario::find_agent(const std::string& name) const {
    for (const auto& agent : agents) {
        if (agent.name == name) return &agent;
    }
    return nullptr;
}

const Transfer* Scenario::find_transfer(int transfer_id) const {
    for (const auto& transfer : transfers) {
        if (transfer.transfer_id == transfer_id) return &transfer;
    }
    return nullptr;
}

bool Scenario::has_object(const std::string& object_type) const {
    for (const auto& obj : object_types) {
        if (obj == object_type) return true;
    }
    return false;
}

// ── Structural checks shared by simulate() and validate() ───────────────────

static void check_structure(const Scenario& scenario) {
    std::set<std::string> names;
    for (const auto& agent : scenario.agents) {
        if (agent.name.empty()) {
            throw ScenarioError("agent with empty name");
        }
        if (!names.insert(agent.name).second) {
            throw ScenarioError("duplicate agent: " + agent.name);
        }
        for (const auto& [obj, count] : agent.initial_inventory) {
            if (!scenario.has_object(obj)) {
                throw ScenarioError("agent " + agent.name +
                                    " holds undeclared object: " + obj);
            }
            if (count < 0) {
                throw ScenarioError("negative initial count for " + agent.name +
                                    "/" + obj);
            }
        }
    }

    std::set<std::string> objects;
    for (const auto& obj : scenario.object_types) {
        if (!objects.insert(obj).second) {
            throw ScenarioError("duplicate object type: " + obj);
        }
    }

    std::set<int> ids;
    for (const auto& t : scenario.transfers) {
        const std::string where = "transfer " + std::to_string(t.transfer_id);
        if (!ids.insert(t.transfer_id).second) {
            throw ScenarioError("duplicate transfer id: " + std::to_string(t.transfer_id));
        }
        if (!scenario.find_agent(t.from_agent)) {
            throw ScenarioError(where + ": unknown sender " + t.from_agent);
        }
        if (!scenario.find_agent(t.to_agent)) {
            throw ScenarioError(where + ": unknown receiver " + t.to_agent);
        }
        if (t.from_agent == t.to_agent) {
            throw ScenarioError(where + ": agent " + t.from_agent + " sends to itself");
        }
        if (!scenario.has_object(t.object_type)) {
            throw ScenarioError(where + ": unknown object " + t.object_type);
        }
        if (t.quantity < 0) {
            throw ScenarioError(where + ": negative quantity");
        }
    }
}

// ── simulate ────────────────────────────────────────────────────────────────

void simulate(Scenario& scenario) {
    check_structure(scenario);

    std::map<std::string, std::map<std::string, std::int64_t>> running;
    for (const auto& agent : scenario.agents) {
        auto& inv = running[agent.name];
        for (const auto& obj : scenario.object_types) {
            inv[obj] = agent.initial_count(obj);
        }
    }

    for (const auto& t : scenario.transfers) {
        std::int64_t& held = running[t.from_agent][t.object_type];
        if (held < t.quantity) {
            throw ScenarioError("transfer " + std::to_string(t.transfer_id) + ": " +
                                t.from_agent + " holds " + std::to_string(held) + " " +
                                t.object_type + " but gives " + std::to_string(t.quantity));
        }
        held -= t.quantity;
        running[t.to_agent][t.object_type] += t.quantity;
    }

    for (auto& agent : scenario.agents) {
        agent.final_inventory = running[agent.name];
    }
}

// ── validate ────────────────────────────────────────────────────────────────

void validate(const Scenario& scenario) {
    check_structure(scenario);

    for (const auto& agent : scenario.agents) {
        for (const auto& obj : scenario.object_types) {
            std::int64_t balance = agent.final_count(obj) - agent.initial_count(obj);
            for (const auto& t : scenario.transfers) {
                if (t.object_type != obj) continue;
                if (t.to_agent == agent.name)   balance -= t.quantity;
                if (t.from_agent == agent.name) balance += t.quantity;
            }
            if (balance != 0) {
                throw ScenarioError("conservation violated for " + agent.name + "/" + obj +
                                    " (off by " + std::to_string(balance) + ")");
            }
        }
    }
}

}  // namespace awp
