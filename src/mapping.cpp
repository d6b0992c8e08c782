#include "ctdgbf/mapping.hpp"

#include "text.hpp"

#include <set>

namespace ctdgbf {

// ------------------------------
// Table
// ------------------------------

MappingTable::MappingTable(std::vector<MappingRule> rules) : rules_(std::move(rules)) {}

const MappingRule* MappingTable::find(const std::string& raw_name) const {
    for (const auto& rule : rules_) {
        for (const auto& prefix : rule.name_prefixes) {
            if (internal::starts_with(raw_name, prefix)) return &rule;
        }
    }
    return nullptr;
}

static MappingRule data_rule(std::vector<std::string> prefixes,
                             std::string canonical,
                             std::string units,
                             std::string long_name,
                             std::vector<UnitConversion> conversions) {
    MappingRule r;
    r.name_prefixes = std::move(prefixes);
    r.standard_name = canonical;
    r.canonical_name = std::move(canonical);
    r.units = std::move(units);
    r.long_name = std::move(long_name);
    r.conversions = std::move(conversions);
    return r;
}

static MappingRule time_rule(std::string prefix, TimeBase base, std::vector<std::string> unit_tokens) {
    MappingRule r;
    r.name_prefixes = {std::move(prefix)};
    r.canonical_name = "time";
    r.standard_name = "time";
    r.units = "seconds since 1970-01-01T00:00:00Z";
    r.long_name = "Time";
    r.role = VariableRole::Time;
    r.time_base = base;
    r.conversions = {UnitConversion{std::move(unit_tokens), 1.0, 0.0}};
    r.attributes = {{"axis", "T"}, {"calendar", "gregorian"}};
    return r;
}

static std::vector<MappingRule> sea_bird_rules() {
    std::vector<MappingRule> rules;

    rules.push_back(time_rule("timeJ", TimeBase::JulianDays, {"", "julian"}));
    rules.push_back(time_rule("timeS", TimeBase::ElapsedSeconds, {"", "seconds", "sec"}));
    rules.push_back(time_rule("timeY", TimeBase::UnixSeconds, {"", "seconds", "sec"}));
    rules.push_back(time_rule("timeQ", TimeBase::Seconds2000, {"", "seconds", "sec"}));

    {
        MappingRule r = data_rule({"latitude"}, "latitude", "degrees_north", "Latitude",
                                  {{{"deg", ""}, 1.0, 0.0}});
        r.role = VariableRole::Latitude;
        r.attributes = {{"axis", "Y"}};
        rules.push_back(std::move(r));
    }
    {
        MappingRule r = data_rule({"longitude"}, "longitude", "degrees_east", "Longitude",
                                  {{{"deg", ""}, 1.0, 0.0}});
        r.role = VariableRole::Longitude;
        r.attributes = {{"axis", "X"}};
        rules.push_back(std::move(r));
    }
    {
        MappingRule r = data_rule({"depSM", "depFM", "dep"}, "depth", "m", "Depth",
                                  {{{"ft"}, 0.3048, 0.0}, {{"m"}, 1.0, 0.0}});
        r.role = VariableRole::Vertical;
        r.attributes = {{"axis", "Z"}, {"positive", "down"}};
        rules.push_back(std::move(r));
    }
    {
        MappingRule r = data_rule({"pr"}, "sea_water_pressure", "dbar", "Pressure",
                                  {{{"db"}, 1.0, 0.0}, {{"psi"}, 0.6894757, 0.0}});
        r.attributes = {{"positive", "down"}};
        r.serial_key = "pressure sn";
        rules.push_back(std::move(r));
    }
    {
        MappingRule r = data_rule({"t090", "t190", "tv290", "t068", "t168", "tv268", "t4990", "tnc90", "t3890", "t3868"},
                                  "sea_water_temperature", "degree_Celsius", "Temperature",
                                  {{{"degc", "°c", "celsius"}, 1.0, 0.0},
                                   {{"degf"}, 5.0 / 9.0, -160.0 / 9.0}});
        r.serial_key = "temperature sn";
        rules.push_back(std::move(r));
    }
    rules.push_back(data_rule({"potemp"}, "sea_water_potential_temperature", "degree_Celsius",
                              "Potential Temperature",
                              {{{"degc", "°c", "celsius"}, 1.0, 0.0},
                               {{"degf"}, 5.0 / 9.0, -160.0 / 9.0}}));
    rules.push_back(data_rule({"sal"}, "sea_water_practical_salinity", "1", "Practical Salinity",
                              {{{"psu", "pss"}, 1.0, 0.0}}));
    {
        MappingRule r = data_rule({"c0", "c1", "cond"}, "sea_water_electrical_conductivity", "S m-1",
                                  "Conductivity",
                                  {{{"ms/cm"}, 0.1, 0.0},
                                   {{"us/cm", "µs/cm"}, 1e-4, 0.0},
                                   {{"s/m"}, 1.0, 0.0}});
        r.serial_key = "conductivity sn";
        rules.push_back(std::move(r));
    }
    rules.push_back(data_rule({"sbeox0Mm/Kg", "sbeox1Mm/Kg"},
                              "moles_of_oxygen_per_unit_mass_in_sea_water", "umol kg-1", "Oxygen",
                              {{{"umol/kg", "µmol/kg"}, 1.0, 0.0}}));
    rules.push_back(data_rule({"sbeox0M", "sbeox1M", "sbox0M", "sbox1M"},
                              "mole_concentration_of_dissolved_molecular_oxygen_in_sea_water", "umol l-1",
                              "Oxygen",
                              {{{"umol/l", "µmol/l"}, 1.0, 0.0}, {{"ml/l"}, 44.661, 0.0}}));
    rules.push_back(data_rule({"flECO-AFL", "flSP", "flC", "flS", "wetStar", "flWETLabs", "flCUVA"},
                              "mass_concentration_of_chlorophyll_in_sea_water", "mg m-3",
                              "Chlorophyll Fluorescence",
                              {{{"mg/m^3", "mg/m3", "ug/l", "µg/l"}, 1.0, 0.0}}));
    rules.push_back(data_rule({"turbWETntu", "seaTurbMtr"}, "sea_water_turbidity", "1", "Turbidity",
                              {{{"ntu", "ftu"}, 1.0, 0.0}}));
    rules.push_back(data_rule({"par"}, "downwelling_photosynthetic_photon_spherical_irradiance_in_sea_water",
                              "umol m-2 s-1", "PAR/Irradiance",
                              {{{"umol", "µmol", "µeinsteins", "ueinsteins"}, 1.0, 0.0}}));
    rules.push_back(data_rule({"sigma-t"}, "sea_water_sigma_t", "kg m-3", "Density, sigma-t",
                              {{{"kg/m^3", "kg/m3"}, 1.0, 0.0}}));
    rules.push_back(data_rule({"sigma-"}, "sea_water_sigma_theta", "kg m-3", "Density, sigma-theta",
                              {{{"kg/m^3", "kg/m3"}, 1.0, 0.0}}));
    rules.push_back(data_rule({"density"}, "sea_water_density", "kg m-3", "Density",
                              {{{"kg/m^3", "kg/m3"}, 1.0, 0.0}}));
    rules.push_back(data_rule({"svCM", "svC", "svD", "svW"}, "speed_of_sound_in_sea_water", "m s-1",
                              "Sound Velocity",
                              {{{"m/s"}, 1.0, 0.0}}));
    return rules;
}

std::shared_ptr<const MappingTable> default_mapping_table() {
    static const std::shared_ptr<const MappingTable> table =
        std::make_shared<const MappingTable>(sea_bird_rules());
    return table;
}

// ------------------------------
// ColumnMapping
// ------------------------------

const MappedColumn* ColumnMapping::first_with_role(VariableRole role) const {
    for (const auto& c : columns) {
        if (c.role == role) return &c;
    }
    return nullptr;
}

const MappedColumn* ColumnMapping::find(const std::string& name) const {
    for (const auto& c : columns) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

std::map<std::string, std::string> ColumnMapping::names() const {
    std::map<std::string, std::string> out;
    for (const auto& c : columns) out[c.raw_name] = c.name;
    return out;
}

// ------------------------------
// Mapper
// ------------------------------

static const UnitConversion* match_unit(const MappingRule& rule, const std::string& raw_unit) {
    const std::string unit = internal::squash(raw_unit);
    for (const auto& conv : rule.conversions) {
        for (const auto& tok : conv.tokens) {
            if (tok.empty() ? unit.empty() : unit.find(tok) != std::string::npos) return &conv;
        }
    }
    return nullptr;
}

static std::string unique_name(const std::string& base, std::set<std::string>& used) {
    std::string name = base;
    for (int n = 2; used.count(name) != 0; ++n) name = base + "_" + std::to_string(n);
    used.insert(name);
    return name;
}

// Serial numbers sit in the header extras as e.g. "Temperature SN = 2355".
static std::optional<std::string> find_serial(const CastMetadata& metadata, const std::string& serial_key) {
    if (serial_key.empty()) return std::nullopt;
    for (const auto& kv : metadata.extra) {
        if (internal::normalize_key(kv.first) == serial_key && !kv.second.empty()) return kv.second;
    }
    return std::nullopt;
}

ColumnMapping map_to_canonical(const std::vector<ColumnDefinition>& columns,
                               const CastMetadata& metadata,
                               const MappingTable& table,
                               Diagnostics& diags) {
    ColumnMapping out;
    out.columns.reserve(columns.size());

    std::set<std::string> used{"trajectory"}; // label variable added by the assembler
    std::set<const MappingRule*> serial_done;

    for (std::size_t i = 0; i < columns.size(); ++i) {
        const ColumnDefinition& col = columns[i];
        MappedColumn m;
        m.column = i;
        m.raw_name = col.raw_name;
        m.attributes["source_name"] = col.raw_name;
        m.attributes["source_units"] = col.unit;
        m.attributes["sensor_index"] = std::to_string(col.sensor_index);

        const MappingRule* rule = table.find(col.raw_name);
        if (!rule) {
            m.name = unique_name(col.raw_name, used);
            m.attributes["long_name"] = col.description.empty() ? col.raw_name : col.description;
            m.attributes["units"] = col.unit;
            diags.warn(DiagnosticKind::UnmappedVariable, col.raw_name,
                       "no canonical mapping; kept under its raw name");
            out.columns.push_back(std::move(m));
            continue;
        }

        m.mapped = true;
        m.role = rule->role;
        m.time_base = rule->time_base;
        m.name = unique_name(rule->canonical_name, used);
        for (const auto& kv : rule->attributes) m.attributes[kv.first] = kv.second;
        m.attributes["standard_name"] = rule->standard_name;
        m.attributes["long_name"] = col.description.empty() ? rule->long_name : col.description;

        if (const UnitConversion* conv = match_unit(*rule, col.unit)) {
            m.converted = true;
            m.scale = conv->scale;
            m.offset = conv->offset;
            m.attributes["units"] = rule->units;
        } else {
            m.attributes["units"] = col.unit;
            diags.warn(DiagnosticKind::UnconvertedUnit, col.raw_name,
                       "unit '" + col.unit + "' has no known conversion to '" + rule->units +
                       "'; values kept as recorded");
        }

        if (serial_done.insert(rule).second) {
            if (auto serial = find_serial(metadata, rule->serial_key)) {
                m.attributes["sensor_serial_number"] = *serial;
            }
        }
        out.columns.push_back(std::move(m));
    }
    return out;
}

} // namespace ctdgbf
