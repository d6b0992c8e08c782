#include "ctdgbf/container.hpp"
#include "ctdgbf/pipeline.hpp"
#include "ctdgbf/qc_config.hpp"

#include "test_util.hpp"

using namespace ctdgbf;

static void test_convert_file() {
    std::filesystem::path out = testutil::temp_file("ctdgbf_pipeline_normal.gbf");
    ConvertReport report = convert_file(testutil::data_file("normal_cast.cnv"), out);

    CHECK(std::filesystem::exists(out));
    CHECK(report.rows == 6);
    CHECK(report.columns == 6);
    CHECK(report.variables == 9);
    CHECK(report.diagnostics.count(DiagnosticKind::UnmappedVariable) == 1);
    CHECK(report.diagnostics.count(DiagnosticKind::RowCountMismatch) == 0);

    Dataset ds = read_dataset(out, ReadOptions{true});
    CHECK(ds.dimension_length("obs") == 6);
    for (const auto& v : ds.variables()) CHECK(v.size() == ds.expected_size(v.dims));
    CHECK(ds.variable("sea_water_temperature").attribute("units") == "degree_Celsius");
    CHECK(ds.variable("sea_water_practical_salinity").attribute("units") == "1");
    CHECK(std::isnan(ds.variable("sea_water_practical_salinity").as_float()[2]));
    CHECK(ds.global_attributes().at("featureType") == "trajectory");

    std::filesystem::remove(out);
}

static void test_failed_conversions_write_nothing() {
    std::filesystem::path out = testutil::temp_file("ctdgbf_pipeline_failed.gbf");

    try {
        convert_file(testutil::data_file("empty_cast.cnv"), out);
        CHECK(false);
    } catch (const CastError& e) {
        CHECK(e.kind() == ErrorKind::EmptyCast);
        CHECK(e.source() == testutil::data_file("empty_cast.cnv").string());
    }
    CHECK(!std::filesystem::exists(out));

    try {
        convert_file(testutil::data_file("bad_row.cnv"), out);
        CHECK(false);
    } catch (const CastError& e) {
        CHECK(e.kind() == ErrorKind::RowShape);
        CHECK(e.line() == 10);
    }
    CHECK(!std::filesystem::exists(out));

    ConvertOptions strict;
    strict.assemble.strict_monotonic_time = true;
    CHECK_THROWS_KIND(convert_file(testutil::data_file("reversed_time.cnv"), out, strict), ErrorKind::NonMonotonicTime);
    CHECK(!std::filesystem::exists(out));

    CHECK_THROWS_KIND(convert_file(testutil::data_file("no_such_cast.cnv"), out), ErrorKind::Io);

    // lenient mode converts and reports
    ConvertReport lenient = convert_file(testutil::data_file("reversed_time.cnv"), out);
    CHECK(lenient.diagnostics.count(DiagnosticKind::NonMonotonicTime) == 1);
    CHECK(std::filesystem::exists(out));
    std::filesystem::remove(out);
}

static void test_convert_lines_fill_and_counts() {
    auto lines = testutil::lines_of({
        "# nvalues = 5",
        "# bad_flag = -99",
        "# name 0 = t090C: Temperature [ITS-90, deg C]",
        "# start_time = Jan 10 2020 00:00:00",
        "*END*",
        "10.0",
        "-99",
    });

    Diagnostics diags;
    Dataset ds = convert_lines(lines, "inline.cnv", ConvertOptions{}, diags);
    CHECK(std::isnan(ds.variable("sea_water_temperature").as_float()[1]));
    CHECK(diags.count(DiagnosticKind::RowCountMismatch) == 1);

    ConvertOptions no_header_flag;
    no_header_flag.use_header_bad_flag = false;
    Diagnostics diags2;
    Dataset raw = convert_lines(lines, "inline.cnv", no_header_flag, diags2);
    CHECK(raw.variable("sea_water_temperature").as_float()[1] == -99.0);

    ConvertOptions no_table;
    no_table.table = nullptr;
    CHECK_THROWS_KIND(convert_lines(lines, "inline.cnv", no_table, diags2), ErrorKind::Config);

    try {
        convert_lines(testutil::lines_of({"# name 0 = t090C: Temperature", "*END*"}), "inline.cnv",
                      ConvertOptions{}, diags2);
        CHECK(false);
    } catch (const CastError& e) {
        CHECK(e.kind() == ErrorKind::EmptyCast);
        CHECK(std::string(e.what()).find("inline.cnv") == 0);
    }
}

static void test_qc_file_defaults() {
    std::filesystem::path converted = testutil::temp_file("ctdgbf_pipeline_qc_in.gbf");
    std::filesystem::path checked = testutil::temp_file("ctdgbf_pipeline_qc_out.gbf");
    convert_file(testutil::data_file("normal_cast.cnv"), converted);

    QcReport report = qc_file(converted, checked, default_qc_config());
    CHECK((report.variables == std::vector<std::string>{
        "mass_concentration_of_chlorophyll_in_sea_water",
        "sea_water_practical_salinity",
        "sea_water_temperature",
    }));

    Dataset ds = read_dataset(checked, ReadOptions{true});
    const auto& temp_qc = ds.variable("sea_water_temperature_qc").as_int8();
    CHECK(temp_qc.size() == 6);
    CHECK(temp_qc[3] == static_cast<std::int8_t>(FlagValue::Fail));
    CHECK(ds.variable("sea_water_practical_salinity_qc").as_int8()[2] == static_cast<std::int8_t>(FlagValue::Missing));
    CHECK(ds.variable("sea_water_temperature_qc").attribute("qc_checks") == "gross_range spike flat_line rate_of_change");
    CHECK(!ds.has_variable("sea_water_temperature_qc_gross_range"));

    // the input is left alone and a second run needs replace
    CHECK(!read_dataset(converted).has_variable("sea_water_temperature_qc"));
    CHECK_THROWS_KIND(qc_file(checked, checked, default_qc_config()), ErrorKind::InvalidData);
    QcOptions replace;
    replace.replace_existing = true;
    qc_file(checked, checked, default_qc_config(), replace);
    CHECK(read_dataset(checked, ReadOptions{true}).has_variable("sea_water_temperature_qc"));

    std::filesystem::remove(converted);
    std::filesystem::remove(checked);
}

static void test_qc_file_write_options() {
    std::filesystem::path converted = testutil::temp_file("ctdgbf_pipeline_plain_in.gbf");
    std::filesystem::path checked = testutil::temp_file("ctdgbf_pipeline_plain_out.gbf");
    ConvertOptions copts;
    copts.write.compression = CompressionMode::Never;
    convert_file(testutil::data_file("normal_cast.cnv"), converted, copts);

    WriteOptions plain;
    plain.compression = CompressionMode::Never;
    qc_file(converted, checked, default_qc_config(), QcOptions{}, {}, plain);

    Schema schema = read_schema(checked, ReadOptions{true});
    CHECK(schema.header.find("sea_water_temperature_qc") != nullptr);
    for (const auto& v : schema.header.variables) CHECK(v.compression == "none");

    std::filesystem::remove(converted);
    std::filesystem::remove(checked);
}

static void test_header_key_named_like_container_crc() {
    // "* crc32_hex" becomes the global attribute "header_crc32_hex"
    Diagnostics diags;
    Dataset ds = convert_lines(testutil::lines_of({
        "* crc32_hex = ABCDEF",
        "# name 0 = timeS: Time, Elapsed [seconds]",
        "# name 1 = t090C: Temperature [ITS-90, deg C]",
        "# start_time = Jun 02 2021 10:15:22",
        "*END*",
        "0.0 10.0", "1.0 10.5", "2.0 11.0",
    }), "crc.cnv", ConvertOptions{}, diags);
    CHECK(ds.global_attributes().at("header_crc32_hex") == "ABCDEF");

    std::filesystem::path converted = testutil::temp_file("ctdgbf_pipeline_crc_in.gbf");
    std::filesystem::path checked = testutil::temp_file("ctdgbf_pipeline_crc_out.gbf");
    write_dataset(converted, ds);
    Dataset back = read_dataset(converted, ReadOptions{true});
    CHECK(back.global_attributes().at("header_crc32_hex") == "ABCDEF");

    QcReport report = qc_file(converted, checked, default_qc_config());
    CHECK(report.variables.size() == 1);
    CHECK(read_dataset(checked, ReadOptions{true}).has_variable("sea_water_temperature_qc"));

    std::filesystem::remove(converted);
    std::filesystem::remove(checked);
}

static void test_qc_file_config() {
    std::filesystem::path converted = testutil::temp_file("ctdgbf_pipeline_cfg_in.gbf");
    std::filesystem::path checked = testutil::temp_file("ctdgbf_pipeline_cfg_out.gbf");
    convert_file(testutil::data_file("normal_cast.cnv"), converted);

    Diagnostics config_diags;
    QcConfig config = load_qc_config(testutil::data_file("qc_config.json"), config_diags);
    CHECK(config.emit_check_variables);
    CHECK(config.variables.size() == 2);
    CHECK(config_diags.count(DiagnosticKind::CheckConfiguration) == 1);

    QcReport report = qc_file(converted, checked, config);
    CHECK(report.diagnostics.count(DiagnosticKind::CheckConfiguration) == 2);

    Dataset ds = read_dataset(checked, ReadOptions{true});
    CHECK(ds.has_variable("sea_water_temperature_qc_gross_range"));
    CHECK(ds.has_variable("sea_water_temperature_qc_spike_upper"));
    CHECK(ds.variable("sea_water_temperature_qc").as_int8()[3] == static_cast<std::int8_t>(FlagValue::Fail));
    CHECK((ds.variable("sea_water_practical_salinity_qc").as_int8() ==
           std::vector<std::int8_t>{2, 2, 9, 2, 2, 2}));

    std::filesystem::remove(converted);
    std::filesystem::remove(checked);
}

static void test_qc_selected_variables() {
    Diagnostics diags;
    Dataset ds = convert_lines(read_lines(testutil::data_file("normal_cast.cnv")), "normal_cast.cnv",
                               ConvertOptions{}, diags);

    Diagnostics qc_diags;
    std::vector<std::string> done = qc_dataset(ds, default_qc_config(), QcOptions{}, qc_diags,
                                               {"sea_water_pressure", "oxygen", "trajectory"});
    CHECK((done == std::vector<std::string>{"sea_water_pressure"}));
    CHECK(qc_diags.count(DiagnosticKind::UnknownVariable) == 2);
    CHECK(qc_diags.count(DiagnosticKind::CheckConfiguration) == 1);
    CHECK(ds.variable("sea_water_pressure_qc").as_int8()[0] == static_cast<std::int8_t>(FlagValue::NotEvaluated));
    CHECK(!ds.has_variable("sea_water_temperature_qc"));
}

static void test_config_parsing() {
    Diagnostics diags;
    QcConfig cfg = parse_qc_config(R"({
        "variables": {
            "sea_water_temperature": [
                {"check": "climatology", "periods": [
                    {"months": [6, 8], "span": [20, 30], "vertical": [0, 50]},
                    {"months": [13, 2], "span": [0, 10]}
                ]},
                {"check": "rate_of_change", "threshold": 2, "use_index_time": "yes"},
                {"check": "flat_line", "suspect_threshold": 3, "fail_threshold": 5, "tolerance": 0.01},
                {"check": "missing_value"},
                42
            ]
        }
    })", diags);

    const std::vector<CheckSpec>* p = cfg.find("sea_water_temperature");
    CHECK(p && p->size() == 5);
    CHECK(!cfg.emit_check_variables);

    const auto& clim = std::get<ClimatologyConfig>((*p)[0]);
    CHECK(clim.periods.size() == 1);
    CHECK(clim.periods[0].month_start == 6 && clim.periods[0].month_end == 8);
    CHECK(clim.periods[0].vertical && clim.periods[0].vertical->upper == 50.0);

    const auto& roc = std::get<RateOfChangeConfig>((*p)[1]);
    CHECK(roc.threshold && *roc.threshold == 2.0);
    CHECK(!roc.use_index_time);

    const auto& flat = std::get<FlatLineConfig>((*p)[2]);
    CHECK(flat.tolerance && *flat.tolerance == 0.01);
    CHECK(std::holds_alternative<MissingValueConfig>((*p)[3]));
    CHECK(std::holds_alternative<UnknownCheckConfig>((*p)[4]));

    // bad months, bad flag, non-object entry
    CHECK(diags.count(DiagnosticKind::CheckConfiguration) == 3);
    CHECK(cfg.find("salinity") == nullptr);

    Diagnostics ignored;
    CHECK_THROWS_KIND(parse_qc_config("{not json", ignored), ErrorKind::Config);
    CHECK_THROWS_KIND(parse_qc_config("[1, 2]", ignored), ErrorKind::Config);
    CHECK_THROWS_KIND(parse_qc_config(R"({"variables": []})", ignored), ErrorKind::Config);
    CHECK_THROWS_KIND(parse_qc_config(R"({"variables": {"t": {}}})", ignored), ErrorKind::Config);
    CHECK_THROWS_KIND(parse_qc_config(R"({"emit_check_variables": 1})", ignored), ErrorKind::Config);
    CHECK_THROWS_KIND(load_qc_config(testutil::data_file("missing.json"), ignored), ErrorKind::Io);

    QcConfig defaults = default_qc_config();
    CHECK(defaults.variables.size() == 3);
    CHECK(defaults.find("sea_water_temperature")->size() == 4);
}

int main() {
    return testutil::run([] {
        test_convert_file();
        test_failed_conversions_write_nothing();
        test_convert_lines_fill_and_counts();
        test_qc_file_defaults();
        test_qc_file_write_options();
        test_header_key_named_like_container_crc();
        test_qc_file_config();
        test_qc_selected_variables();
        test_config_parsing();
    });
}
