#pragma once

#include "ctdgbf/error.hpp"
#include "ctdgbf/header.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctdgbf {

// ------------------------------
// Static mapping configuration
// ------------------------------

enum class VariableRole {
    Data,
    Time,
    Latitude,
    Longitude,
    Vertical,
};

// How a raw time column turns into seconds since 1970-01-01.
enum class TimeBase {
    None,
    JulianDays,      // timeJ: day-of-year, Jan 1 00:00 = 1.0, year of the cast start
    ElapsedSeconds,  // timeS: seconds since cast start
    UnixSeconds,     // timeY
    Seconds2000,     // timeQ: seconds since 2000-01-01
};

// canonical = raw * scale + offset
struct UnitConversion {
    std::vector<std::string> tokens{}; // squashed lowercase substrings of the raw unit; "" matches an empty unit
    double scale{1.0};
    double offset{0.0};
};

struct MappingRule {
    std::vector<std::string> name_prefixes{}; // case-sensitive Sea-Bird name prefixes
    std::string canonical_name{};
    std::string standard_name{};
    std::string units{};
    std::string long_name{};
    VariableRole role{VariableRole::Data};
    TimeBase time_base{TimeBase::None};
    std::vector<UnitConversion> conversions{};
    std::map<std::string, std::string> attributes{};
    std::string serial_key{}; // normalized header key carrying the sensor serial, e.g. "temperature sn"
};

/// Immutable rule list; the first rule whose prefix matches wins.
class MappingTable {
public:
    explicit MappingTable(std::vector<MappingRule> rules);

    const MappingRule* find(const std::string& raw_name) const;
    const std::vector<MappingRule>& rules() const noexcept { return rules_; }

private:
    std::vector<MappingRule> rules_;
};

/// Sea-Bird SBE 9/19/25/911 names. Shared, never modified.
std::shared_ptr<const MappingTable> default_mapping_table();

// ------------------------------
// Mapper output
// ------------------------------

struct MappedColumn {
    std::size_t column{0};          // index into the ColumnDefinition list
    std::string raw_name{};
    std::string name{};             // dataset variable name
    VariableRole role{VariableRole::Data};
    TimeBase time_base{TimeBase::None};
    bool mapped{false};             // false: kept under its raw name
    bool converted{false};          // a known unit conversion applies
    double scale{1.0};
    double offset{0.0};
    std::map<std::string, std::string> attributes{};

    double convert(double raw) const noexcept { return raw * scale + offset; }
};

struct ColumnMapping {
    std::vector<MappedColumn> columns{}; // parallel to the ColumnDefinition list

    const MappedColumn* first_with_role(VariableRole role) const;
    const MappedColumn* find(const std::string& name) const;

    // raw_name -> dataset variable name
    std::map<std::string, std::string> names() const;
};

ColumnMapping map_to_canonical(const std::vector<ColumnDefinition>& columns,
                               const CastMetadata& metadata,
                               const MappingTable& table,
                               Diagnostics& diags);

} // namespace ctdgbf
