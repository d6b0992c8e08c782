#pragma once

#include "ctdgbf/timefmt.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ctdgbf {

// ------------------------------
// Parsed header model
// ------------------------------

struct ColumnDefinition {
    std::string raw_name{};
    std::string description{};  // text between ':' and '[' in "# name N = raw: description [unit]"
    std::string unit{};         // bracket content, empty when absent
    int sensor_index{0};
    std::optional<std::string> canonical_name{};
};

struct CastMetadata {
    std::optional<Timestamp> start_time{};
    std::optional<double> start_latitude{};
    std::optional<double> start_longitude{};
    std::optional<std::string> instrument_id{};
    // Unrecognised keys, plus earlier values of repeated keys as "<key>#<n>".
    std::map<std::string, std::string> extra{};
};

struct ParsedHeader {
    std::vector<ColumnDefinition> columns{};
    CastMetadata metadata{};

    std::optional<std::size_t> declared_columns{}; // "# nquan"
    std::optional<std::size_t> declared_rows{};    // "# nvalues"
    std::optional<double> bad_flag{};              // "# bad_flag"
    std::optional<double> sample_interval_s{};     // "# interval = seconds: x"

    // 0-based index of the first line after the data-start marker.
    std::size_t data_line{0};
};

// ------------------------------
// Line classification
// ------------------------------

struct ColumnDecl {
    ColumnDefinition column;
};

struct ScalarMeta {
    std::string key;    // as written, trimmed
    std::string value;  // trimmed
};

struct DataStart {};

struct Ignorable {};

using HeaderLine = std::variant<ColumnDecl, ScalarMeta, DataStart, Ignorable>;

/// Classifies one header line. Throws CastError(MalformedHeader) only for a
/// "# name" declaration that cannot be read (bad index, empty raw name).
HeaderLine classify_line(std::string_view line);

/// Single forward pass over the header up to the "*END*" marker.
/// `source` names the input in error messages.
ParsedHeader parse_header(const std::vector<std::string>& lines, const std::string& source = {});

/// "05 12.34 S", "-5.2057", "5.2057 S" -> signed decimal degrees.
std::optional<double> parse_coordinate(std::string_view text, bool latitude);

} // namespace ctdgbf
