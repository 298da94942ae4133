// ============================================================================
// batch.cpp — Per-case verification driver
// ============================================================================

#include "awp/batch.hpp"

#include <cmath>
#include <memory>
#include <optional>
#include <sstream>

#ifdef AWP_USE_OPENMP
#include <omp.h>
#endif

namespace awp {

static CaseReport verify_case(const VerificationCase& vc, std::size_t index,
                              const UniquenessVerifier& linear, SmtVerifier& smt,
                              const BatchOptions& opts) {
    CaseReport report;
    report.index = index;
    report.first_line = vc.first_line;
    report.scenario_id = vc.scenario.scenario_id;

    ConstraintSystem system;
    try {
        ConstraintSystemBuilder builder;
        system = builder.build(vc.scenario, vc.masking);
    } catch (const BuildError& e) {
        report.error = e.what();
        return report;
    }
    report.built = true;

    if (opts.compare) {
        Comparator comparator(linear, smt);
        report.comparison = comparator.compare(system);
        report.verification = report.comparison->linear_algebra;
    } else {
        report.verification = linear.verify(system);
    }

    const double max_condition = linear.config().max_condition;
    report.verdict = classify(opts.policy, report.verification, nullptr, max_condition);
    if (report.verdict == Verdict::Accepted && opts.policy.use_smt) {
        std::optional<SmtResult> own;
        const SmtResult* smt_result = report.comparison ? &report.comparison->smt : nullptr;
        if (!smt_result && smt.available()) {
            own = smt.verify(system);
            smt_result = &*own;
        }
        report.verdict = classify(opts.policy, report.verification, smt_result, max_condition);
    }

    if (report.verification.solvable && report.verification.is_unique) {
        report.deduced = linear.deduce(system);
    }
    return report;
}

// ── verify_batch ────────────────────────────────────────────────────────────

std::vector<CaseReport> verify_batch(const std::vector<VerificationCase>& cases,
                                     const BatchOptions& opts) {
    std::vector<CaseReport> reports(cases.size());
    const long n = static_cast<long>(cases.size());

    SmtConfig smt_config = opts.smt;
    smt_config.enabled = opts.smt.enabled && (opts.compare || opts.policy.use_smt);

#ifdef AWP_USE_OPENMP
    if (opts.num_threads > 0) omp_set_num_threads(opts.num_threads);
    #pragma omp parallel if(opts.num_threads != 1)
#endif
    {
        // One verifier pair per thread.
        UniquenessVerifier linear(opts.verifier);
        std::unique_ptr<SmtVerifier> smt = make_smt_verifier(smt_config);

#ifdef AWP_USE_OPENMP
        #pragma omp for schedule(dynamic)
#endif
        for (long i = 0; i < n; ++i) {
            const auto idx = static_cast<std::size_t>(i);
            reports[idx] = verify_case(cases[idx], idx, linear, *smt, opts);
        }
    }

    return reports;
}

// ── format_report ───────────────────────────────────────────────────────────

std::string format_report(const CaseReport& report) {
    std::ostringstream oss;
    oss << report.first_line << ": ";
    if (!report.built) {
        oss << "ERROR: " << report.error;
        return oss.str();
    }

    oss << verdict_name(report.verdict) << " " << report.verification.message;
    if (report.deduced) {
        for (const auto& [name, value] : *report.deduced) {
            oss << " " << name << "=" << std::llround(value);
        }
    }
    if (report.comparison) {
        oss << " [" << describe(*report.comparison) << "]";
    }
    return oss.str();
}

}  // namespace awp
