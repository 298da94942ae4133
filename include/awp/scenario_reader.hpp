// ============================================================================
// awp/scenario_reader.hpp — Reader for the line-oriented .awp case format
// ============================================================================
//
// One directive per line.  '#' starts a comment; blank lines are ignored;
// a line consisting of "---" closes the current case.
//
//   scenario <id>
//   object <name> [<name> ...]
//   agent <name> <object>=<count> [<object>=<count> ...]
//   transfer <id> <from> <to> <object> <quantity>
//   mask initial <agent> <object>
//   mask final <agent> <object>
//   mask transfer <id> [<id> ...]
//
// Final inventories are not written in the file; they are computed by
// simulate() when a case is closed.  Errors are thrown as ReadError with
// the format:  <line>: ERROR: <msg>
//
// ============================================================================

#ifndef AWP_SCENARIO_READER_HPP
#define AWP_SCENARIO_READER_HPP

#include "awp/masking.hpp"
#include "awp/scenario.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace awp {

// ── ReadError ───────────────────────────────────────────────────────────────

class ReadError : public std::runtime_error {
public:
    explicit ReadError(const std::string& msg) : std::runtime_error(msg) {}
};

// ── VerificationCase ────────────────────────────────────────────────────────
// A simulated scenario and the masking to verify on it.

struct VerificationCase {
    Scenario       scenario;
    MaskingSpec    masking;
    std::uint32_t  first_line = 0;   // source line where the case starts
};

// ── ScenarioReader ──────────────────────────────────────────────────────────

class ScenarioReader {
public:
    /// Parse every case in `lines`.  Throws ReadError on the first problem.
    std::vector<VerificationCase> read(const std::vector<std::string>& lines);

private:
    void directive(const std::vector<std::string>& fields);
    void read_agent(const std::vector<std::string>& fields);
    void read_transfer(const std::vector<std::string>& fields);
    void read_mask(const std::vector<std::string>& fields);
    void close_case();

    std::int64_t integer(const std::string& text, const std::string& what);
    int identifier(const std::string& text, const std::string& what);
    void expect_fields(const std::vector<std::string>& fields, std::size_t min_count,
                       const std::string& usage);
    [[noreturn]] void error(const std::string& msg) const;

    std::vector<VerificationCase>  cases_;
    VerificationCase               current_;
    bool                           open_ = false;
    std::uint32_t                  line_ = 0;
};

/// Read and parse a .awp file.
std::vector<VerificationCase> read_cases(const std::string& path);

}  // namespace awp

#endif  // AWP_SCENARIO_READER_HPP
