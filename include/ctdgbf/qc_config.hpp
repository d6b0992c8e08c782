#pragma once

#include "ctdgbf/error.hpp"
#include "ctdgbf/qc.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ctdgbf {

/// Which checks run on which variables. Immutable once loaded.
struct QcConfig {
    bool emit_check_variables{false};
    std::map<std::string, std::vector<CheckSpec>> variables{};

    const std::vector<CheckSpec>* find(const std::string& variable) const;
};

/// Parses the JSON form:
///   {"emit_check_variables": false,
///    "variables": {"sea_water_temperature": [{"check": "gross_range", "fail_span": [-2, 35]}]}}
/// Malformed JSON or a wrong top-level shape throws CastError(Config). A check
/// field of the wrong type is dropped with a CheckConfiguration warning, so
/// the check later fails closed.
QcConfig parse_qc_config(std::string_view json_text, Diagnostics& diags);

QcConfig load_qc_config(const std::filesystem::path& file, Diagnostics& diags);

/// Thresholds for temperature, practical salinity and chlorophyll
/// fluorescence: gross_range, spike, flat_line and rate_of_change.
QcConfig default_qc_config();

} // namespace ctdgbf
