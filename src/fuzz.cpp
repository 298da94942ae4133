// ============================================================================
// fuzz.cpp — Seeded random scenarios through the Comparator
// ============================================================================
//
// Scenarios stay small: at most six agents, four object types and the
// configured number of transfers.  Each CSV row carries enough of the
// scenario to replay a divergence by hand.
//
// ============================================================================

#include "awp/fuzz.hpp"
#include "awp/comparator.hpp"
#include "awp/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <vector>

namespace awp {

// ── Helpers ─────────────────────────────────────────────────────────────────

static int uniform(std::mt19937_64& rng, int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng);
}

static std::string mask_summary(const MaskingSpec& masking) {
    std::string out;
    for (const auto& t : masking.targets) {
        if (!out.empty()) out += "; ";
        out += t.to_string();
    }
    return out;
}

static std::string scenario_summary(const Scenario& s) {
    std::ostringstream oss;
    for (const auto& a : s.agents) {
        oss << a.name << "{";
        bool first = true;
        for (const auto& obj : s.object_types) {
            if (!first) oss << ",";
            first = false;
            oss << obj << "=" << a.initial_count(obj);
        }
        oss << "} ";
    }
    for (const auto& t : s.transfers) {
        oss << "#" << t.transfer_id << ":" << t.from_agent << "->" << t.to_agent
            << " " << t.quantity << " " << t.object_type << " ";
    }
    return trim(oss.str());
}

// ── random_case ─────────────────────────────────────────────────────────────

VerificationCase random_case(std::mt19937_64& rng, const FuzzOptions& opt) {
    static const char* const kAgentNames[] = {"Alice", "Bob", "Carol", "Dave", "Erin", "Frank"};
    static const char* const kObjectNames[] = {"marble", "apple", "card", "book"};

    VerificationCase vc;
    Scenario& s = vc.scenario;

    const int n_agents = uniform(rng, 2, std::clamp(opt.max_agents, 2, 6));
    const int n_objects = uniform(rng, 1, std::clamp(opt.max_objects, 1, 4));

    for (int o = 0; o < n_objects; ++o) {
        s.object_types.push_back(kObjectNames[o]);
    }
    for (int a = 0; a < n_agents; ++a) {
        Agent agent;
        agent.name = kAgentNames[a];
        for (const auto& obj : s.object_types) {
            agent.initial_inventory[obj] = uniform(rng, 0, static_cast<int>(opt.max_initial));
        }
        s.agents.push_back(std::move(agent));
    }

    // Replay on a running copy so every transfer is feasible when drawn.
    std::vector<std::vector<std::int64_t>> held(n_agents, std::vector<std::int64_t>(n_objects));
    for (int a = 0; a < n_agents; ++a) {
        for (int o = 0; o < n_objects; ++o) {
            held[a][o] = s.agents[a].initial_count(s.object_types[o]);
        }
    }

    const int n_transfers = uniform(rng, 1, std::max(opt.max_transfers, 1));
    for (int i = 0; i < n_transfers; ++i) {
        int from = uniform(rng, 0, n_agents - 1);
        int obj = uniform(rng, 0, n_objects - 1);
        if (held[from][obj] == 0) continue;

        int to = uniform(rng, 0, n_agents - 2);
        if (to >= from) ++to;

        Transfer t;
        t.transfer_id = static_cast<int>(s.transfers.size()) + 1;
        t.from_agent = s.agents[from].name;
        t.to_agent = s.agents[to].name;
        t.object_type = s.object_types[obj];
        t.quantity = uniform(rng, 1, static_cast<int>(held[from][obj]));
        held[from][obj] -= t.quantity;
        held[to][obj] += t.quantity;
        s.transfers.push_back(std::move(t));
    }

    simulate(s);

    const int n_masks = uniform(rng, 1, std::max(opt.max_masks, 1));
    for (int i = 0; i < n_masks; ++i) {
        int kind = uniform(rng, 0, s.transfers.empty() ? 1 : 2);
        if (kind == 2) {
            int pick = uniform(rng, 0, static_cast<int>(s.transfers.size()) - 1);
            vc.masking.add(MaskTarget::transfer(s.transfers[pick].transfer_id));
            continue;
        }
        const std::string& agent = s.agents[uniform(rng, 0, n_agents - 1)].name;
        const std::string& obj = s.object_types[uniform(rng, 0, n_objects - 1)];
        vc.masking.add(kind == 0 ? MaskTarget::initial_count(agent, obj)
                                 : MaskTarget::final_count(agent, obj));
    }

    return vc;
}

// ── fuzz ────────────────────────────────────────────────────────────────────

FuzzSummary fuzz(const FuzzOptions& opt) {
    FuzzSummary summary;
    std::mt19937_64 rng(opt.seed);

    UniquenessVerifier linear(opt.verifier);
    std::unique_ptr<SmtVerifier> smt = make_smt_verifier(opt.smt);
    Comparator comparator(linear, *smt);
    ConstraintSystemBuilder builder;

    std::string out_dir;
    std::ofstream csv;
    if (opt.write_files) {
        out_dir = opt.out_dir_override.empty() ? "fuzz_" + timestamp_string()
                                               : opt.out_dir_override;
        std::filesystem::create_directories(out_dir);
        csv.open(out_dir + "/results.csv");
        if (!csv) {
            std::cerr << "[fuzz] WARNING: could not write " << out_dir << "/results.csv\n";
        }
        csv << "iteration,scenario,masks,la_message,la_solvable,la_unique,"
               "smt_status,smt_uniqueness,smt_elapsed_s,agreement\n";
        std::cout << "[fuzz] Writing results to: " << out_dir << "/\n";
    }

    for (int it = 0; it < opt.iterations; ++it) {
        VerificationCase vc = random_case(rng, opt);
        vc.scenario.scenario_id = it + 1;
        ++summary.runs;

        ConstraintSystem system;
        try {
            system = builder.build(vc.scenario, vc.masking);
        } catch (const BuildError& e) {
            ++summary.build_errors;
            std::cerr << "[fuzz] iteration " << it << ": " << e.what() << "\n";
            continue;
        }

        Comparison cmp = comparator.compare(system);
        if (cmp.linear_algebra.is_unique) ++summary.unique;

        std::string agreement = "n/a";
        if (!cmp.agreement) {
            ++summary.inconclusive;
        } else if (cmp.agreement->agrees()) {
            ++summary.agreements;
            agreement = "agree";
        } else {
            ++summary.divergences;
            agreement = "DIVERGES";
            std::cerr << "[fuzz] iteration " << it << ": " << describe(cmp) << "\n"
                      << "       scenario: " << scenario_summary(vc.scenario) << "\n"
                      << "       masks:    " << mask_summary(vc.masking) << "\n";
            if (opt.write_files && !cmp.smt.smt_lib.empty()) {
                std::ofstream f(out_dir + "/divergence_" + std::to_string(it) + ".smt2");
                f << cmp.smt.smt_lib;
            }
        }

        if (csv) {
            csv << it << ","
                << csv_escape(scenario_summary(vc.scenario)) << ","
                << csv_escape(mask_summary(vc.masking)) << ","
                << csv_escape(cmp.linear_algebra.message) << ","
                << (cmp.linear_algebra.solvable ? 1 : 0) << ","
                << (cmp.linear_algebra.is_unique ? 1 : 0) << ","
                << smt_status_name(cmp.smt.status) << ","
                << uniqueness_status_name(cmp.smt.uniqueness) << ","
                << cmp.smt.elapsed_s << ","
                << agreement << "\n";
        }
    }

    if (opt.write_files) {
        std::ofstream f(out_dir + "/summary.txt");
        f << "seed: " << opt.seed << "\n"
          << "iterations: " << opt.iterations << "\n"
          << "tolerance: " << opt.verifier.tolerance << "\n"
          << "smt_backend: " << smt->backend_info() << "\n"
          << "smt_upper_bound: " << opt.smt.upper_bound << "\n"
          << "smt_timeout_ms: " << opt.smt.timeout_ms << "\n\n"
          << "runs: " << summary.runs << "\n"
          << "unique: " << summary.unique << "\n"
          << "agreements: " << summary.agreements << "\n"
          << "divergences: " << summary.divergences << "\n"
          << "inconclusive: " << summary.inconclusive << "\n"
          << "build_errors: " << summary.build_errors << "\n";
    }

    return summary;
}

// ── run_fuzz ────────────────────────────────────────────────────────────────

int run_fuzz(const FuzzOptions& opt) {
    FuzzSummary s = fuzz(opt);
    std::cout << "[fuzz] " << s.runs << " runs, " << s.unique << " unique, "
              << s.agreements << " agree, " << s.divergences << " diverge, "
              << s.inconclusive << " inconclusive, " << s.build_errors << " build errors\n";
    return s.divergences == 0 && s.build_errors == 0 ? 0 : 1;
}

}  // namespace awp
