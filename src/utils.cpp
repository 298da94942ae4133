// ============================================================================
// utils.cpp — File I/O and string utilities
// ============================================================================

#include "awp/utils.hpp"

#include <charconv>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace awp {

// ── read_lines ──────────────────────────────────────────────────────────────

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

// ── trim ────────────────────────────────────────────────────────────────────

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ── strip_comment ───────────────────────────────────────────────────────────

std::string strip_comment(const std::string& line) {
    auto pos = line.find('#');
    if (pos == std::string::npos) {
        return trim(line);
    }
    return trim(line.substr(0, pos));
}

// ── split_ws ────────────────────────────────────────────────────────────────

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> fields;
    std::istringstream iss(s);
    std::string field;
    while (iss >> field) {
        fields.push_back(std::move(field));
    }
    return fields;
}

// ── Number parsing ──────────────────────────────────────────────────────────

std::optional<std::int64_t> parse_int(const std::string& s) {
    std::int64_t value = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (s.empty() || ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_double(const std::string& s) {
    try {
        std::size_t used = 0;
        double value = std::stod(s, &used);
        if (used != s.size()) return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// ── csv_escape ──────────────────────────────────────────────────────────────

std::string csv_escape(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else          out += c;
    }
    out += '"';
    return out;
}

// ── timestamp_string ────────────────────────────────────────────────────────

std::string timestamp_string() {
    std::time_t t  = std::time(nullptr);
    std::tm     tm = *std::localtime(&t);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

}  // namespace awp
