// ============================================================================
// awp/utils.hpp — Utility functions
// ============================================================================

#ifndef AWP_UTILS_HPP
#define AWP_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace awp {

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a text file and return its content as a vector of lines.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> read_lines(const std::string& path);

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// Strip an inline comment (everything from the first '#' onward).
/// Returns the portion before '#', trimmed.
std::string strip_comment(const std::string& line);

/// Split on runs of whitespace; no empty fields.
std::vector<std::string> split_ws(const std::string& s);

/// Parse a whole string as a base-10 integer.  nullopt on any trailing
/// characters or overflow.
std::optional<std::int64_t> parse_int(const std::string& s);

/// Parse a whole string as a floating-point number.
std::optional<double> parse_double(const std::string& s);

/// Wrap a string value for CSV: surround with double-quotes, escape inner ones.
std::string csv_escape(const std::string& s);

/// Current local time formatted as YYYYmmdd_HHMMSS.
std::string timestamp_string();

}  // namespace awp

#endif  // AWP_UTILS_HPP
