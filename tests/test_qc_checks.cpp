#include "ctdgbf/dataset.hpp"
#include "ctdgbf/qc.hpp"

#include "test_util.hpp"

#include <algorithm>
#include <limits>

using namespace ctdgbf;

static const double kNaN = std::numeric_limits<double>::quiet_NaN();

using F = FlagValue;

// One-trajectory dataset with a 1 Hz time axis starting at `t0`.
static Dataset make_ds(const std::vector<double>& values, double t0 = 1622628922.0,
                       const std::string& fill = "NaN") {
    Dataset ds;
    ds.add_dimension("trajectory", 1);
    ds.add_dimension("obs", values.size());
    std::vector<double> t(values.size());
    for (std::size_t i = 0; i < t.size(); ++i) t[i] = t0 + static_cast<double>(i);
    ds.add_variable(Variable::make_float("time", {"trajectory", "obs"}, t,
                                         {{"units", "seconds since 1970-01-01T00:00:00Z"}}));
    ds.add_variable(Variable::make_float("temp", {"trajectory", "obs"}, values,
                                         {{"units", "degree_Celsius"}, {"_FillValue", fill}}));
    return ds;
}

static CheckOutcome run_one(const CheckSpec& spec, const Series& s) {
    return make_check(spec)->evaluate(s);
}

static void test_series() {
    Dataset ds = make_ds({1.0, -999.0, kNaN}, 0.0, "-999");
    Series s = series_of(ds, "temp");
    CHECK(s.fill_value && *s.fill_value == -999.0);
    CHECK(s.times.size() == 3);
    CHECK(s.depths.empty());
    CHECK((s.missing_mask() == std::vector<bool>{false, true, true}));

    ds.add_variable(Variable::make_int8("temp_qc", {"trajectory", "obs"}, {1, 1, 1}));
    CHECK_THROWS_KIND(series_of(ds, "temp_qc"), ErrorKind::InvalidData);
    CHECK_THROWS_KIND(series_of(ds, "salinity"), ErrorKind::NotFound);
}

static void test_gross_range() {
    Dataset ds = make_ds({41.0, 1.0, 20.0, -999.0, kNaN, 40.0, 0.0}, 0.0, "-999");
    Series s = series_of(ds, "temp");

    GrossRangeConfig cfg;
    cfg.fail_span = Span{0.0, 40.0};
    cfg.suspect_span = Span{2.0, 35.0};
    CheckOutcome out = run_one(cfg, s);
    CHECK((out.flags == std::vector<F>{F::Fail, F::Suspect, F::Good, F::Missing, F::Missing, F::Suspect, F::Suspect}));
    CHECK(out.problems.empty());
    CHECK(out.bounds && out.bounds->size() == 7);
    CHECK((*out.bounds)[0].lower == 0.0 && (*out.bounds)[0].upper == 40.0);

    // fail span only
    GrossRangeConfig fail_only;
    fail_only.fail_span = Span{0.0, 40.0};
    CHECK(run_one(fail_only, s).flags[1] == F::Good);

    // broken configurations fail closed
    CheckOutcome none = run_one(GrossRangeConfig{}, s);
    CHECK((none.flags == std::vector<F>{F::NotEvaluated, F::NotEvaluated, F::NotEvaluated, F::Missing,
                                        F::Missing, F::NotEvaluated, F::NotEvaluated}));
    CHECK(none.problems.size() == 1);
    CHECK(!none.bounds);

    GrossRangeConfig wide;
    wide.fail_span = Span{0.0, 40.0};
    wide.suspect_span = Span{-5.0, 35.0};
    CHECK(run_one(wide, s).flags[0] == F::NotEvaluated);
    CHECK(!run_one(wide, s).problems.empty());

    GrossRangeConfig inverted;
    inverted.fail_span = Span{40.0, 0.0};
    CHECK(run_one(inverted, s).flags[2] == F::NotEvaluated);
}

static void test_spike() {
    Series s = series_of(make_ds({1.0, 1.0, 5.0, 1.0, 1.0, kNaN, 1.0}), "temp");
    SpikeConfig cfg;
    cfg.suspect_threshold = 1.0;
    cfg.fail_threshold = 3.0;
    CheckOutcome out = run_one(cfg, s);
    CHECK((out.flags == std::vector<F>{F::NotEvaluated, F::Suspect, F::Fail, F::Suspect, F::NotEvaluated,
                                       F::Missing, F::NotEvaluated}));
    CHECK(out.bounds);
    CHECK((*out.bounds)[2].lower == -2.0 && (*out.bounds)[2].upper == 4.0);
    CHECK(std::isnan((*out.bounds)[0].lower));

    SpikeConfig suspect_only;
    suspect_only.suspect_threshold = 1.0;
    CheckOutcome s_out = run_one(suspect_only, s);
    CHECK(s_out.flags[2] == F::Suspect);
    CHECK((*s_out.bounds)[2].upper == 2.0);

    SpikeConfig bad;
    bad.suspect_threshold = 2.0;
    bad.fail_threshold = 1.0;
    CHECK(run_one(bad, s).problems.size() == 1);
    CHECK(run_one(SpikeConfig{}, s).flags[2] == F::NotEvaluated);
}

static void test_rate_of_change() {
    Dataset ds = make_ds({0.0, 1.0, 10.0, 10.5, 10.5});
    Series s = series_of(ds, "temp");
    RateOfChangeConfig cfg;
    cfg.threshold = 2.0;
    CheckOutcome out = run_one(cfg, s);
    CHECK((out.flags == std::vector<F>{F::NotEvaluated, F::Good, F::Suspect, F::Good, F::Good}));

    // without a time axis the check cannot run, unless it counts samples
    Series no_time = s;
    no_time.times.clear();
    CheckOutcome missing_axis = run_one(cfg, no_time);
    CHECK(missing_axis.flags[2] == F::NotEvaluated);
    CHECK(missing_axis.problems.at(0) == "no time axis aligned with the variable");

    cfg.use_index_time = true;
    CHECK(run_one(cfg, no_time).flags[2] == F::Suspect);

    Series frozen = s;
    std::fill(frozen.times.begin(), frozen.times.end(), 5.0);
    RateOfChangeConfig timed;
    timed.threshold = 2.0;
    CHECK(run_one(timed, frozen).problems.at(0) == "time axis has no variation");
}

static void test_flat_line() {
    Series flat = series_of(make_ds(std::vector<double>(8, 5.0)), "temp");
    FlatLineConfig cfg;
    cfg.suspect_threshold = 3.0;
    cfg.fail_threshold = 5.0;
    cfg.tolerance = 0.01;
    CheckOutcome out = run_one(cfg, flat);
    CHECK((out.flags == std::vector<F>{F::NotEvaluated, F::NotEvaluated, F::NotEvaluated, F::Suspect,
                                       F::Suspect, F::Fail, F::Fail, F::Fail}));

    Series varying = series_of(make_ds({1.0, 2.0, 3.0, 4.0, 5.0, 5.001, 5.002, 5.003}), "temp");
    CheckOutcome v = run_one(cfg, varying);
    CHECK(v.flags[3] == F::Good);
    CHECK(v.flags[4] == F::Good);
    CHECK(v.flags[7] == F::Suspect);

    FlatLineConfig no_tol = cfg;
    no_tol.tolerance.reset();
    CHECK(!run_one(no_tol, flat).problems.empty());

    FlatLineConfig reversed = cfg;
    reversed.fail_threshold = 1.0;
    CHECK(run_one(reversed, flat).flags[7] == F::NotEvaluated);
}

static void test_missing_value() {
    Series s = series_of(make_ds({1.0, kNaN, -999.0}, 0.0, "-999"), "temp");
    CheckOutcome out = run_one(MissingValueConfig{}, s);
    CHECK((out.flags == std::vector<F>{F::Good, F::Missing, F::Missing}));
    CHECK(out.problems.empty());
}

static void test_climatology() {
    ClimatologyConfig cfg;
    cfg.periods.push_back(ClimatologyPeriod{6, 8, std::nullopt, Span{20.0, 30.0}});
    cfg.periods.push_back(ClimatologyPeriod{11, 2, std::nullopt, Span{0.0, 10.0}});

    // June 2021
    Series june = series_of(make_ds({25.0, 35.0, kNaN}), "temp");
    CheckOutcome out = run_one(cfg, june);
    CHECK((out.flags == std::vector<F>{F::Good, F::Suspect, F::Missing}));
    CHECK((*out.bounds)[0].lower == 20.0);

    // January wraps into the Nov..Feb period
    Series january = series_of(make_ds({5.0, 12.0}, 1609459200.0), "temp");
    CHECK((run_one(cfg, january).flags == std::vector<F>{F::Good, F::Suspect}));

    // March matches nothing
    Series march = series_of(make_ds({5.0}, 1614556800.0), "temp");
    CheckOutcome m = run_one(cfg, march);
    CHECK(m.flags[0] == F::NotEvaluated);
    CHECK(m.problems.empty());

    // a time far outside the calendar has no month
    Series far = january;
    far.times[1] = 1e20;
    CHECK((run_one(cfg, far).flags == std::vector<F>{F::Good, F::NotEvaluated}));

    // depth-limited period
    ClimatologyConfig deep;
    deep.periods.push_back(ClimatologyPeriod{1, 12, Span{0.0, 50.0}, Span{20.0, 30.0}});
    Series with_depth = june;
    with_depth.depths = {10.0, 100.0, 10.0};
    CheckOutcome d = run_one(deep, with_depth);
    CHECK(d.flags[0] == F::Good);
    CHECK(d.flags[1] == F::NotEvaluated);
    CHECK(run_one(deep, june).flags[0] == F::NotEvaluated);

    ClimatologyConfig bad;
    bad.periods.push_back(ClimatologyPeriod{13, 2, std::nullopt, Span{0.0, 1.0}});
    CHECK(!run_one(bad, june).problems.empty());
    CHECK(!run_one(ClimatologyConfig{}, june).problems.empty());
}

static void test_unknown_and_names() {
    CHECK(check_name(GrossRangeConfig{}) == "gross_range");
    CHECK(check_name(SpikeConfig{}) == "spike");
    CHECK(check_name(RateOfChangeConfig{}) == "rate_of_change");
    CHECK(check_name(FlatLineConfig{}) == "flat_line");
    CHECK(check_name(MissingValueConfig{}) == "missing_value");
    CHECK(check_name(ClimatologyConfig{}) == "climatology");
    CHECK(check_name(UnknownCheckConfig{"wavelet"}) == "wavelet");
    CHECK(check_name(UnknownCheckConfig{}) == "unknown");

    Series s = series_of(make_ds({1.0, kNaN}), "temp");
    CheckOutcome out = run_one(UnknownCheckConfig{"wavelet"}, s);
    CHECK((out.flags == std::vector<F>{F::NotEvaluated, F::Missing}));
    CHECK(out.problems.at(0) == "unknown check kind 'wavelet'");
}

static void test_run_checks() {
    Dataset ds = make_ds({41.0, 1.0, 20.0});
    const std::vector<double> before = ds.variable("temp").as_float();

    GrossRangeConfig range;
    range.fail_span = Span{0.0, 40.0};
    range.suspect_span = Span{2.0, 35.0};
    std::vector<CheckSpec> pipeline = {range, GrossRangeConfig{}, UnknownCheckConfig{"wavelet"}};

    Diagnostics diags;
    std::vector<QCResult> results = run_checks(ds, "temp", pipeline, diags);
    CHECK(results.size() == 3);
    CHECK(results[0].variable_name == "temp");
    CHECK(results[0].check_name == "gross_range");
    CHECK((results[0].flags == std::vector<F>{F::Fail, F::Suspect, F::Good}));
    CHECK(results[2].check_name == "wavelet");

    CHECK(diags.count(DiagnosticKind::CheckConfiguration) == 2);
    CHECK(diags.entries()[0].subject == "temp/gross_range");
    CHECK(diags.entries()[1].subject == "temp/wavelet");

    // checks never touch the data
    CHECK(ds.variable("temp").as_float() == before);

    Diagnostics empty_diags;
    CHECK(run_checks(ds, "temp", {}, empty_diags).empty());
    CHECK(empty_diags.count(DiagnosticKind::CheckConfiguration) == 1);

    CHECK_THROWS_KIND(run_checks(ds, "salinity", pipeline, diags), ErrorKind::NotFound);
}

int main() {
    return testutil::run([] {
        test_series();
        test_gross_range();
        test_spike();
        test_rate_of_change();
        test_flat_line();
        test_missing_value();
        test_climatology();
        test_unknown_and_names();
        test_run_checks();
    });
}
