// ============================================================================
// scenario_reader.cpp — Parsing .awp case files
// ============================================================================

#include "awp/scenario_reader.hpp"
#include "awp/utils.hpp"

#include <limits>
#include <utility>

namespace awp {

// ── Error helpers ───────────────────────────────────────────────────────────

void ScenarioReader::error(const std::string& msg) const {
    throw ReadError(std::to_string(line_) + ": ERROR: " + msg);
}

void ScenarioReader::expect_fields(const std::vector<std::string>& fields,
                                   std::size_t min_count, const std::string& usage) {
    if (fields.size() < min_count) {
        error("expected '" + usage + "'");
    }
}

std::int64_t ScenarioReader::integer(const std::string& text, const std::string& what) {
    auto value = parse_int(text);
    if (!value) {
        error("expected integer " + what + ", got '" + text + "'");
    }
    return *value;
}

// Scenario and transfer ids are ints.
int ScenarioReader::identifier(const std::string& text, const std::string& what) {
    std::int64_t value = integer(text, what);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        error(what + " out of range: " + text);
    }
    return static_cast<int>(value);
}

// ── read ────────────────────────────────────────────────────────────────────

std::vector<VerificationCase> ScenarioReader::read(const std::vector<std::string>& lines) {
    cases_.clear();
    current_ = VerificationCase{};
    open_ = false;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        line_ = static_cast<std::uint32_t>(i + 1);
        std::string content = strip_comment(lines[i]);
        if (content.empty()) continue;

        if (content == "---") {
            if (open_) close_case();
            continue;
        }

        if (!open_) {
            current_ = VerificationCase{};
            current_.first_line = line_;
            current_.scenario.scenario_id = static_cast<int>(cases_.size()) + 1;
            open_ = true;
        }
        directive(split_ws(content));
    }

    if (open_) close_case();
    return std::move(cases_);
}

void ScenarioReader::directive(const std::vector<std::string>& fields) {
    const std::string& kw = fields[0];

    if (kw == "scenario") {
        expect_fields(fields, 2, "scenario <id>");
        current_.scenario.scenario_id = identifier(fields[1], "scenario id");
    } else if (kw == "object") {
        expect_fields(fields, 2, "object <name> [<name> ...]");
        for (std::size_t i = 1; i < fields.size(); ++i) {
            current_.scenario.object_types.push_back(fields[i]);
        }
    } else if (kw == "agent") {
        read_agent(fields);
    } else if (kw == "transfer") {
        read_transfer(fields);
    } else if (kw == "mask") {
        read_mask(fields);
    } else {
        error("unknown directive '" + kw + "'");
    }
}

void ScenarioReader::read_agent(const std::vector<std::string>& fields) {
    expect_fields(fields, 2, "agent <name> <object>=<count> ...");
    Agent agent;
    agent.name = fields[1];
    for (std::size_t i = 2; i < fields.size(); ++i) {
        auto eq = fields[i].find('=');
        if (eq == std::string::npos || eq == 0) {
            error("expected <object>=<count>, got '" + fields[i] + "'");
        }
        std::string obj = fields[i].substr(0, eq);
        agent.initial_inventory[obj] = integer(fields[i].substr(eq + 1), "count for " + obj);
    }
    current_.scenario.agents.push_back(std::move(agent));
}

void ScenarioReader::read_transfer(const std::vector<std::string>& fields) {
    const std::string usage = "transfer <id> <from> <to> <object> <quantity>";
    expect_fields(fields, 6, usage);
    if (fields.size() > 6) {
        error("too many fields; expected '" + usage + "'");
    }
    Transfer t;
    t.transfer_id = identifier(fields[1], "transfer id");
    t.from_agent = fields[2];
    t.to_agent = fields[3];
    t.object_type = fields[4];
    t.quantity = integer(fields[5], "quantity");
    current_.scenario.transfers.push_back(std::move(t));
}

void ScenarioReader::read_mask(const std::vector<std::string>& fields) {
    expect_fields(fields, 3, "mask initial|final|transfer ...");
    const std::string& kind = fields[1];

    if (kind == "initial" || kind == "final") {
        expect_fields(fields, 4, "mask " + kind + " <agent> <object>");
        if (kind == "initial") {
            current_.masking.add(MaskTarget::initial_count(fields[2], fields[3]));
        } else {
            current_.masking.add(MaskTarget::final_count(fields[2], fields[3]));
        }
    } else if (kind == "transfer") {
        for (std::size_t i = 2; i < fields.size(); ++i) {
            current_.masking.add(MaskTarget::transfer(identifier(fields[i], "transfer id")));
        }
    } else {
        error("unknown mask kind '" + kind + "'");
    }
}

void ScenarioReader::close_case() {
    try {
        simulate(current_.scenario);
    } catch (const ScenarioError& e) {
        throw ReadError(std::to_string(current_.first_line) + ": ERROR: " + e.what());
    }
    cases_.push_back(std::move(current_));
    current_ = VerificationCase{};
    open_ = false;
}

// ── read_cases ──────────────────────────────────────────────────────────────

std::vector<VerificationCase> read_cases(const std::string& path) {
    ScenarioReader reader;
    return reader.read(read_lines(path));
}

}  // namespace awp
