// ============================================================================
// awp/scenario.hpp — Transfer scenarios with ground-truth inventories
// ============================================================================
//
// A Scenario is the fully simulated world a word problem is rendered from:
// a set of agents holding countable objects and an ordered sequence of
// transfers between them.  Both initial and final inventories are always
// known here; masking happens later, on the constraint system.
//
// ============================================================================

#ifndef AWP_SCENARIO_HPP
#define AWP_SCENARIO_HPP

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace awp {

// ── ScenarioError ───────────────────────────────────────────────────────────
// Thrown when a scenario is structurally broken or violates conservation.

class ScenarioError : public std::runtime_error {
public:
    explicit ScenarioError(const std::string& msg) : std::runtime_error(msg) {}
};

// ── Transfer ────────────────────────────────────────────────────────────────

struct Transfer {
    std::string   from_agent;
    std::string   to_agent;
    std::string   object_type;
    std::int64_t  quantity    = 0;
    int           transfer_id = 0;
};

// ── Agent ───────────────────────────────────────────────────────────────────
// Inventories map object type → count.  Object types missing from a map
// count as zero.

struct Agent {
    std::string                          name;
    std::map<std::string, std::int64_t>  initial_inventory;
    std::map<std::string, std::int64_t>  final_inventory;

    std::int64_t initial_count(const std::string& object_type) const;
    std::int64_t final_count(const std::string& object_type) const;
};

// ── Scenario ────────────────────────────────────────────────────────────────

struct Scenario {
    int                       scenario_id = 0;
    std::vector<Agent>        agents;
    std::vector<Transfer>     transfers;     // in sequence order
    std::vector<std::string>  object_types;

    const Agent*    find_agent(const std::string& name) const;
    const Transfer* find_transfer(int transfer_id) const;
    bool            has_object(const std::string& object_type) const;
};

/// Recompute every agent's final inventory by replaying the transfers in
/// order on top of the initial inventories.  Throws ScenarioError if a
/// transfer references an unknown agent/object, moves a negative quantity,
/// sends to its own sender, or a sender does not hold what it gives.
void simulate(Scenario& scenario);

/// Check structural integrity and the conservation law
///   final - initial - received + given == 0
/// for every (agent, object) pair.  Throws ScenarioError on the first
/// violation found.
void validate(const Scenario& scenario);

}  // namespace awp

#endif  // AWP_SCENARIO_HPP
