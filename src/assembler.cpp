#include "ctdgbf/assembler.hpp"

#include "ctdgbf/timefmt.hpp"
#include "text.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ctdgbf {

using internal::format_number;

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
static constexpr double kSecondsPerDay = 86400.0;
static constexpr double kEpoch2000 = 946684800.0;

static const char* kTimeUnits = "seconds since 1970-01-01T00:00:00Z";
static const char* kCoordinates = "time latitude longitude";

double to_unix_seconds(double raw, TimeBase base, const std::optional<Timestamp>& start) {
    switch (base) {
        case TimeBase::JulianDays: {
            if (!start) return kNaN;
            const std::optional<CivilDate> date = civil_from_epoch(to_epoch_seconds(*start));
            if (!date) return kNaN;
            // Sea-Bird timeJ: day 1.0 is Jan 1 00:00, so one day earlier than adding
            // the raw value to Jan 1 as a timedelta.
            const double origin = static_cast<double>(days_from_civil(CivilDate{date->year, 1, 1})) * kSecondsPerDay;
            return origin + (raw - 1.0) * kSecondsPerDay;
        }
        case TimeBase::ElapsedSeconds:
            return start ? to_epoch_seconds(*start) + raw : kNaN;
        case TimeBase::Seconds2000:
            return kEpoch2000 + raw;
        case TimeBase::UnixSeconds:
        case TimeBase::None:
            return raw;
    }
    return kNaN;
}

// ------------------------------
// Column extraction
// ------------------------------

static std::vector<double> column_values(const std::vector<ObservationRecord>& records, const MappedColumn& col) {
    std::vector<double> out;
    out.reserve(records.size());
    for (const auto& r : records) {
        const auto& v = r.values.at(col.column);
        out.push_back(v ? col.convert(*v) : kNaN);
    }
    return out;
}

static std::vector<double> time_values(const std::vector<ObservationRecord>& records,
                                       const MappedColumn& col,
                                       const std::optional<Timestamp>& start) {
    std::vector<double> out;
    out.reserve(records.size());
    for (const auto& r : records) {
        const auto& v = r.values.at(col.column);
        out.push_back(v ? to_unix_seconds(*v, col.time_base, start) : kNaN);
    }
    return out;
}

static bool needs_start(TimeBase base) {
    return base == TimeBase::JulianDays || base == TimeBase::ElapsedSeconds;
}

static Attributes time_attributes() {
    return {
        {"standard_name", "time"},
        {"long_name", "Time"},
        {"units", kTimeUnits},
        {"calendar", "gregorian"},
        {"axis", "T"},
    };
}

// ------------------------------
// Time axis
// ------------------------------

static Variable build_time(const std::vector<ObservationRecord>& records,
                           const ColumnMapping& mapping,
                           const ParsedHeader& header,
                           Diagnostics& diags) {
    const std::size_t n = records.size();
    const auto& start = header.metadata.start_time;

    const MappedColumn* col = mapping.first_with_role(VariableRole::Time);
    if (col && (!needs_start(col->time_base) || start)) {
        Attributes attrs = col->attributes;
        attrs["units"] = kTimeUnits;
        attrs["standard_name"] = "time";
        return Variable::make_float("time", {"trajectory", "obs"}, time_values(records, *col, start), std::move(attrs));
    }
    if (col) {
        diags.warn(DiagnosticKind::MissingTime, col->raw_name,
                   "time column is relative to the cast start but the header has no start time");
    }

    Attributes attrs = time_attributes();
    std::vector<double> t(n, kNaN);
    if (start && header.sample_interval_s) {
        const double t0 = to_epoch_seconds(*start);
        for (std::size_t i = 0; i < n; ++i) t[i] = t0 + static_cast<double>(i) * *header.sample_interval_s;
        attrs["comment"] = "start_time plus sample index times the header interval";
    } else if (start) {
        std::fill(t.begin(), t.end(), to_epoch_seconds(*start));
        attrs["comment"] = "start_time broadcast to every observation";
    } else if (!col) {
        diags.warn(DiagnosticKind::MissingTime, "time",
                   "no time column and no start time in the header; time is NaN");
    }
    return Variable::make_float("time", {"trajectory", "obs"}, std::move(t), std::move(attrs));
}

static void check_monotonic(const std::vector<double>& t,
                            const std::vector<ObservationRecord>& records,
                            const AssembleOptions& options,
                            Diagnostics& diags) {
    double prev = kNaN;
    std::size_t prev_i = 0;
    for (std::size_t i = 0; i < t.size(); ++i) {
        if (!is_valid_epoch(t[i])) continue;
        if (!std::isnan(prev) && t[i] < prev) {
            std::string msg = "time decreases from " + format_iso8601(prev) + " (observation " +
                              std::to_string(prev_i) + ") to " + format_iso8601(t[i]) +
                              " (observation " + std::to_string(i) + ")";
            if (options.strict_monotonic_time) {
                throw CastError(ErrorKind::NonMonotonicTime, msg, {}, records[i].line);
            }
            diags.warn(DiagnosticKind::NonMonotonicTime, "time",
                       msg + " at line " + std::to_string(records[i].line));
        }
        prev = t[i];
        prev_i = i;
    }
}

// ------------------------------
// Position
// ------------------------------

static Attributes position_attributes(bool latitude) {
    if (latitude) {
        return {{"standard_name", "latitude"}, {"long_name", "Latitude"}, {"units", "degrees_north"}, {"axis", "Y"}};
    }
    return {{"standard_name", "longitude"}, {"long_name", "Longitude"}, {"units", "degrees_east"}, {"axis", "X"}};
}

static std::pair<double, double> finite_range(const std::vector<double>& v,
                                              double limit = std::numeric_limits<double>::infinity()) {
    double lo = kNaN;
    double hi = kNaN;
    for (double x : v) {
        if (std::isnan(x) || std::fabs(x) > limit) continue;
        if (std::isnan(lo) || x < lo) lo = x;
        if (std::isnan(hi) || x > hi) hi = x;
    }
    return {lo, hi};
}

static void set_range_attrs(Attributes& globals, const std::string& prefix, const std::vector<double>& v) {
    auto [lo, hi] = finite_range(v);
    if (std::isnan(lo)) return;
    globals[prefix + "_min"] = format_number(lo);
    globals[prefix + "_max"] = format_number(hi);
}

// ------------------------------
// Assembly
// ------------------------------

Dataset assemble(const std::vector<ObservationRecord>& records,
                 const ColumnMapping& mapping,
                 const ParsedHeader& header,
                 const AssembleOptions& options,
                 Diagnostics& diags) {
    if (records.empty()) {
        throw CastError(ErrorKind::EmptyCast, "cast has no data rows after the *END* marker");
    }
    const std::size_t n = records.size();
    const CastMetadata& meta = header.metadata;

    Dataset ds;
    ds.add_dimension("trajectory", 1);
    ds.add_dimension("obs", n);

    ds.add_variable(Variable::make_text("trajectory", {"trajectory"}, {options.trajectory_id},
                                        {{"cf_role", "trajectory_id"}, {"long_name", "Trajectory identifier"}}));

    // time
    Variable time = build_time(records, mapping, header, diags);
    check_monotonic(time.as_float(), records, options, diags);
    const std::vector<double> t = time.as_float();
    ds.add_variable(std::move(time));

    // position: per observation only when both columns exist
    const MappedColumn* lat_col = mapping.first_with_role(VariableRole::Latitude);
    const MappedColumn* lon_col = mapping.first_with_role(VariableRole::Longitude);
    std::vector<double> lat;
    std::vector<double> lon;
    if (lat_col && lon_col) {
        lat = column_values(records, *lat_col);
        lon = column_values(records, *lon_col);
        Attributes lat_attrs = lat_col->attributes;
        Attributes lon_attrs = lon_col->attributes;
        for (const auto& kv : position_attributes(true)) lat_attrs.insert(kv);
        for (const auto& kv : position_attributes(false)) lon_attrs.insert(kv);
        ds.add_variable(Variable::make_float("latitude", {"trajectory", "obs"}, lat, std::move(lat_attrs)));
        ds.add_variable(Variable::make_float("longitude", {"trajectory", "obs"}, lon, std::move(lon_attrs)));
    } else {
        lat = {meta.start_latitude.value_or(kNaN)};
        lon = {meta.start_longitude.value_or(kNaN)};
        Attributes lat_attrs = position_attributes(true);
        Attributes lon_attrs = position_attributes(false);
        lat_attrs["comment"] = "cast start position from the file header";
        lon_attrs["comment"] = "cast start position from the file header";
        ds.add_variable(Variable::make_float("latitude", {"trajectory"}, lat, std::move(lat_attrs)));
        ds.add_variable(Variable::make_float("longitude", {"trajectory"}, lon, std::move(lon_attrs)));
    }

    // data variables, in column order
    const MappedColumn* first_time = mapping.first_with_role(VariableRole::Time);
    for (const auto& col : mapping.columns) {
        if (&col == first_time) continue;
        if (lat_col && lon_col && (&col == lat_col || &col == lon_col)) continue;

        // A lone latitude or longitude column stays a data variable beside the header position.
        std::string name = col.name;
        for (int k = 2; ds.has_variable(name); ++k) name = col.name + "_" + std::to_string(k);

        Attributes attrs = col.attributes;
        std::vector<double> values;
        if (col.role == VariableRole::Time) {
            values = time_values(records, col, meta.start_time);
            attrs["units"] = kTimeUnits;
        } else {
            values = column_values(records, col);
        }
        attrs["_FillValue"] = "NaN";
        attrs["coordinates"] = kCoordinates;
        ds.add_variable(Variable::make_float(name, {"trajectory", "obs"}, std::move(values), std::move(attrs)));
    }

    // global attributes
    Attributes& g = ds.global_attributes();
    g["Conventions"] = "CF-1.12";
    g["featureType"] = "trajectory";
    g["title"] = options.title;
    g["summary"] = options.summary;
    g["institution"] = options.institution;
    g["source"] = options.source;
    g["references"] = options.references;

    for (const auto& kv : meta.extra) g["header_" + kv.first] = kv.second;
    if (meta.start_time) {
        g["start_time"] = format_iso8601(to_epoch_seconds(*meta.start_time));
    }
    if (meta.instrument_id) g["instrument_id"] = *meta.instrument_id;

    if (!options.history.empty()) {
        g["history"] = options.history;
    } else if (meta.start_time) {
        g["history"] = "Converted from CNV using start_time '" + g["start_time"] + "'";
    } else {
        g["history"] = "Converted from CNV";
    }

    auto [t0, t1] = finite_range(t, kMaxEpochSeconds);
    if (!std::isnan(t0)) {
        g["time_coverage_start"] = format_iso8601(t0);
        g["time_coverage_end"] = format_iso8601(t1);
        g["time_coverage_duration"] = format_iso8601_duration(t1 - t0);
    }
    set_range_attrs(g, "geospatial_lat", lat);
    set_range_attrs(g, "geospatial_lon", lon);

    ds.validate();
    return ds;
}

} // namespace ctdgbf
