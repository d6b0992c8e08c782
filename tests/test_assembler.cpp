#include "ctdgbf/assembler.hpp"
#include "ctdgbf/header.hpp"
#include "ctdgbf/mapping.hpp"
#include "ctdgbf/rows.hpp"
#include "ctdgbf/timefmt.hpp"

#include "test_util.hpp"

#include <limits>

using namespace ctdgbf;

static Dataset build(std::shared_ptr<const std::vector<std::string>> lines, Diagnostics& diags,
                     const AssembleOptions& options = AssembleOptions{}) {
    ParsedHeader h = parse_header(*lines);
    ColumnMapping m = map_to_canonical(h.columns, h.metadata, *default_mapping_table(), diags);
    std::vector<ObservationRecord> recs = decode_rows(lines, h.data_line, h.columns).collect();
    return assemble(recs, m, h, options, diags);
}

static void check_shapes(const Dataset& ds) {
    for (const auto& v : ds.variables()) CHECK(v.size() == ds.expected_size(v.dims));
}

static void test_normal_cast() {
    Diagnostics diags;
    Dataset ds = build(read_lines(testutil::data_file("normal_cast.cnv")), diags);
    check_shapes(ds);

    CHECK(ds.dimensions().size() == 2);
    CHECK(ds.dimension_length("trajectory") == 1);
    CHECK(ds.dimension_length("obs") == 6);

    const std::vector<std::string> expected = {
        "trajectory", "time", "latitude", "longitude",
        "sea_water_pressure", "sea_water_temperature", "sea_water_practical_salinity",
        "mass_concentration_of_chlorophyll_in_sea_water", "xmiss",
    };
    CHECK(ds.variables().size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) CHECK(ds.variables()[i].name == expected[i]);

    const Variable& traj = ds.variable("trajectory");
    CHECK(traj.as_text().at(0) == "trajectory_001");
    CHECK(traj.attribute("cf_role") == "trajectory_id");

    const Variable& time = ds.variable("time");
    CHECK((time.dims == std::vector<std::string>{"trajectory", "obs"}));
    CHECK(time.attribute("units") == "seconds since 1970-01-01T00:00:00Z");
    for (std::size_t i = 0; i < 6; ++i) CHECK(time.as_float()[i] == 1622628922.0 + static_cast<double>(i));

    const Variable& lat = ds.variable("latitude");
    CHECK((lat.dims == std::vector<std::string>{"trajectory"}));
    CHECK_NEAR(lat.as_float()[0], -5.205666666667, 1e-9);
    CHECK_NEAR(ds.variable("longitude").as_float()[0], 12.5, 1e-12);

    const Variable& temp = ds.variable("sea_water_temperature");
    CHECK((temp.dims == std::vector<std::string>{"trajectory", "obs"}));
    CHECK(temp.attribute("units") == "degree_Celsius");
    CHECK(temp.attribute("_FillValue") == "NaN");
    CHECK(temp.attribute("coordinates") == "time latitude longitude");
    CHECK(temp.attribute("sensor_serial_number") == "2355");
    CHECK(temp.as_float()[0] == 25.1);
    CHECK(temp.as_float()[3] == 41.0);

    const Variable& sal = ds.variable("sea_water_practical_salinity");
    CHECK(sal.attribute("units") == "1");
    CHECK(std::isnan(sal.as_float()[2]));
    CHECK(sal.as_float()[5] == 35.06);

    const Attributes& g = ds.global_attributes();
    CHECK(g.at("Conventions") == "CF-1.12");
    CHECK(g.at("featureType") == "trajectory");
    CHECK(g.at("institution") == "Institute of Marine Research (IMR)");
    CHECK(g.at("start_time") == "2021-06-02T10:15:22Z");
    CHECK(g.at("history") == "Converted from CNV using start_time '2021-06-02T10:15:22Z'");
    CHECK(g.at("time_coverage_start") == "2021-06-02T10:15:22Z");
    CHECK(g.at("time_coverage_end") == "2021-06-02T10:15:27Z");
    CHECK(g.at("time_coverage_duration") == "PT0H0M5S");
    CHECK(g.at("header_Station") == "42");
    CHECK(g.at("geospatial_lon_min") == "12.5");
    CHECK(g.at("geospatial_lon_max") == "12.5");
    CHECK(g.count("geospatial_lat_min") == 1);

    CHECK(diags.count(DiagnosticKind::UnmappedVariable) == 1);
    CHECK(diags.count(DiagnosticKind::NonMonotonicTime) == 0);
}

static void test_position_columns() {
    Diagnostics diags;
    Dataset ds = build(read_lines(testutil::data_file("latlon_cast.cnv")), diags);
    check_shapes(ds);

    const Variable& lat = ds.variable("latitude");
    CHECK((lat.dims == std::vector<std::string>{"trajectory", "obs"}));
    CHECK(lat.as_float()[2] == -10.502);
    CHECK(ds.variable("longitude").as_float()[1] == 13.201);
    CHECK(ds.has_variable("depth"));
    CHECK(!ds.has_variable("latitude_2"));

    // timeJ 32.5 in 2021 is Feb 1 12:00
    for (double t : ds.variable("time").as_float()) CHECK(t == 1612180800.0);

    const Attributes& g = ds.global_attributes();
    CHECK(g.at("geospatial_lat_min") == "-10.502");
    CHECK(g.at("geospatial_lat_max") == "-10.5");
    CHECK(g.at("instrument_id") == "0251234");
    CHECK(g.at("time_coverage_duration") == "PT0H0M0S");
}

static void test_lone_latitude_column() {
    Diagnostics diags;
    Dataset ds = build(testutil::lines_of({
        "* NMEA Latitude = 10 30.00 N",
        "# name 0 = latitude: Latitude [deg]",
        "# name 1 = t090C: Temperature [ITS-90, deg C]",
        "# start_time = Jan 10 2020 00:00:00",
        "*END*",
        "  10.5  20.0",
    }), diags);
    CHECK(ds.variable("latitude").as_float()[0] == 10.5);
    CHECK((ds.variable("latitude").dims == std::vector<std::string>{"trajectory"}));
    CHECK(ds.has_variable("latitude_2"));
    CHECK(std::isnan(ds.variable("longitude").as_float()[0]));
    CHECK(ds.global_attributes().count("geospatial_lon_min") == 0);
}

static void test_time_fallbacks() {
    {
        // start time plus header interval
        Diagnostics diags;
        Dataset ds = build(testutil::lines_of({
            "# name 0 = t090C: Temperature [ITS-90, deg C]",
            "# interval = seconds: 0.5",
            "# start_time = Jan 10 2020 00:00:00",
            "*END*",
            "1.0", "2.0", "3.0",
        }), diags);
        const auto& t = ds.variable("time").as_float();
        CHECK(t[0] == 1578614400.0);
        CHECK(t[2] == 1578614401.0);
        CHECK(diags.count(DiagnosticKind::MissingTime) == 0);
    }
    {
        // start time only
        Diagnostics diags;
        Dataset ds = build(testutil::lines_of({
            "# name 0 = t090C: Temperature [ITS-90, deg C]",
            "# start_time = Jan 10 2020 00:00:00",
            "*END*",
            "1.0", "2.0",
        }), diags);
        CHECK(ds.variable("time").as_float()[1] == 1578614400.0);
    }
    {
        // elapsed seconds without a start time
        Diagnostics diags;
        Dataset ds = build(testutil::lines_of({
            "# name 0 = timeS: Time, Elapsed [seconds]",
            "# name 1 = t090C: Temperature [ITS-90, deg C]",
            "*END*",
            "0.0 1.0", "1.0 2.0",
        }), diags);
        CHECK(std::isnan(ds.variable("time").as_float()[0]));
        CHECK(diags.count(DiagnosticKind::MissingTime) == 1);
        CHECK(ds.global_attributes().at("history") == "Converted from CNV");
        CHECK(ds.global_attributes().count("time_coverage_start") == 0);
    }
    {
        // nothing at all
        Diagnostics diags;
        Dataset ds = build(testutil::lines_of({
            "# name 0 = t090C: Temperature [ITS-90, deg C]",
            "*END*",
            "1.0",
        }), diags);
        CHECK(std::isnan(ds.variable("time").as_float()[0]));
        CHECK(diags.count(DiagnosticKind::MissingTime) == 1);
    }
}

static void test_out_of_range_time() {
    Diagnostics diags;
    AssembleOptions strict;
    strict.strict_monotonic_time = true;
    Dataset ds = build(testutil::lines_of({
        "# name 0 = timeS: Time, Elapsed [seconds]",
        "# name 1 = t090C: Temperature [ITS-90, deg C]",
        "# start_time = Jan 10 2020 00:00:00",
        "*END*",
        "0.0 10.0", "1e20 11.0", "2.0 12.0",
    }), diags, strict);
    const auto& t = ds.variable("time").as_float();
    CHECK(t[1] > kMaxEpochSeconds);
    CHECK(diags.count(DiagnosticKind::NonMonotonicTime) == 0);
    CHECK(ds.global_attributes().at("time_coverage_start") == "2020-01-10T00:00:00Z");
    CHECK(ds.global_attributes().at("time_coverage_end") == "2020-01-10T00:00:02Z");
    CHECK(ds.global_attributes().at("time_coverage_duration") == "PT0H0M2S");

    CHECK(format_iso8601(1e20).empty());
    CHECK(format_iso8601(-1e20).empty());
    CHECK(!civil_from_epoch(1e20));
    CHECK(!is_valid_epoch(std::numeric_limits<double>::infinity()));
    CHECK(civil_from_epoch(1622628922.0)->month == 6);
}

static void test_empty_cast() {
    Diagnostics diags;
    CHECK_THROWS_KIND(build(read_lines(testutil::data_file("empty_cast.cnv")), diags), ErrorKind::EmptyCast);
}

static void test_non_monotonic_time() {
    auto lines = read_lines(testutil::data_file("reversed_time.cnv"));

    Diagnostics diags;
    Dataset ds = build(lines, diags);
    CHECK(ds.dimension_length("obs") == 4);
    CHECK(diags.count(DiagnosticKind::NonMonotonicTime) == 1);
    CHECK(diags.entries().at(0).message.find("line 10") != std::string::npos);

    AssembleOptions strict;
    strict.strict_monotonic_time = true;
    Diagnostics strict_diags;
    try {
        (void)build(lines, strict_diags, strict);
        CHECK(false);
    } catch (const CastError& e) {
        CHECK(e.kind() == ErrorKind::NonMonotonicTime);
        CHECK(e.line() == 10);
    }
}

static void test_options() {
    AssembleOptions opts;
    opts.trajectory_id = "nansen_2021_042";
    opts.history = "converted at sea";
    Diagnostics diags;
    Dataset ds = build(read_lines(testutil::data_file("normal_cast.cnv")), diags, opts);
    CHECK(ds.variable("trajectory").as_text()[0] == "nansen_2021_042");
    CHECK(ds.global_attributes().at("history") == "converted at sea");
}

static void test_unix_seconds() {
    auto start = parse_timestamp("Feb 01 2021 12:00:00");
    CHECK(to_unix_seconds(1.0, TimeBase::JulianDays, start) == 1609459200.0);
    CHECK(to_unix_seconds(32.5, TimeBase::JulianDays, start) == 1612180800.0);
    CHECK(to_unix_seconds(10.0, TimeBase::ElapsedSeconds, start) == 1612180810.0);
    CHECK(to_unix_seconds(0.0, TimeBase::Seconds2000, std::nullopt) == 946684800.0);
    CHECK(to_unix_seconds(1.5e9, TimeBase::UnixSeconds, std::nullopt) == 1.5e9);
    CHECK(std::isnan(to_unix_seconds(10.0, TimeBase::ElapsedSeconds, std::nullopt)));
    CHECK(std::isnan(to_unix_seconds(1.0, TimeBase::JulianDays, std::nullopt)));
}

int main() {
    return testutil::run([] {
        test_normal_cast();
        test_position_columns();
        test_lone_latitude_column();
        test_time_fallbacks();
        test_out_of_range_time();
        test_empty_cast();
        test_non_monotonic_time();
        test_options();
        test_unix_seconds();
    });
}
