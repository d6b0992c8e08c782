#include "ctdgbf/qc_config.hpp"

#include "json.hpp"

#include <fstream>
#include <sstream>

namespace ctdgbf {

using internal::Json;

const std::vector<CheckSpec>* QcConfig::find(const std::string& variable) const {
    auto it = variables.find(variable);
    return it == variables.end() ? nullptr : &it->second;
}

// ------------------------------
// JSON -> CheckSpec
// ------------------------------

namespace {

class FieldReader {
public:
    FieldReader(const Json::Object& obj, std::string subject, Diagnostics& diags)
        : obj_(obj), subject_(std::move(subject)), diags_(diags) {}

    std::optional<double> number(const char* key) const {
        const Json* j = internal::obj_get(obj_, key);
        if (!j) return std::nullopt;
        auto v = internal::double_from_json(*j);
        if (!v) complain(key, "a number");
        return v;
    }

    std::optional<Span> span(const char* key) const {
        const Json* j = internal::obj_get(obj_, key);
        if (!j) return std::nullopt;
        if (j->is_array() && j->as_array().size() == 2) {
            auto lo = internal::double_from_json(j->as_array()[0]);
            auto hi = internal::double_from_json(j->as_array()[1]);
            if (lo && hi) return Span{*lo, *hi};
        }
        complain(key, "a [lower, upper] pair");
        return std::nullopt;
    }

    bool flag(const char* key) const {
        const Json* j = internal::obj_get(obj_, key);
        if (!j) return false;
        if (!j->is_bool()) complain(key, "true or false");
        return internal::bool_from_json(*j, false);
    }

    const Json* raw(const char* key) const { return internal::obj_get(obj_, key); }

    void complain(const std::string& key, const std::string& expected) const {
        diags_.warn(DiagnosticKind::CheckConfiguration, subject_, "field '" + key + "' must be " + expected + "; ignored");
    }

private:
    const Json::Object& obj_;
    std::string subject_;
    Diagnostics& diags_;
};

std::optional<unsigned> month_number(const Json& j) {
    auto v = internal::u64_from_json(j);
    if (!v || *v < 1 || *v > 12) return std::nullopt;
    return static_cast<unsigned>(*v);
}

ClimatologyConfig parse_climatology(const FieldReader& f, const std::string& subject, Diagnostics& diags) {
    ClimatologyConfig cfg;
    const Json* periods = f.raw("periods");
    if (!periods) return cfg;
    if (!periods->is_array()) {
        f.complain("periods", "an array");
        return cfg;
    }
    for (const auto& pj : periods->as_array()) {
        if (!pj.is_object()) {
            f.complain("periods", "an array of objects");
            continue;
        }
        FieldReader pf(pj.as_object(), subject, diags);
        ClimatologyPeriod p;
        if (const Json* months = pf.raw("months")) {
            bool ok = months->is_array() && months->as_array().size() == 2;
            std::optional<unsigned> a = ok ? month_number(months->as_array()[0]) : std::nullopt;
            std::optional<unsigned> b = ok ? month_number(months->as_array()[1]) : std::nullopt;
            if (!a || !b) {
                pf.complain("months", "a [first, last] pair of months 1..12");
                continue;
            }
            p.month_start = *a;
            p.month_end = *b;
        }
        auto span = pf.span("span");
        if (!span) {
            pf.complain("span", "present for every period");
            continue;
        }
        p.span = *span;
        p.vertical = pf.span("vertical");
        cfg.periods.push_back(p);
    }
    return cfg;
}

CheckSpec parse_check(const Json& j, const std::string& variable, std::size_t index, Diagnostics& diags) {
    const std::string where = variable + "[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        diags.warn(DiagnosticKind::CheckConfiguration, where, "check entry is not an object");
        return UnknownCheckConfig{};
    }
    const auto& obj = j.as_object();
    const Json* kind_j = internal::obj_get(obj, "check");
    const std::string kind = kind_j ? internal::str_from_json(*kind_j) : std::string();
    FieldReader f(obj, variable + "/" + (kind.empty() ? where : kind), diags);

    if (kind == "gross_range") {
        return GrossRangeConfig{f.span("fail_span"), f.span("suspect_span")};
    }
    if (kind == "spike") {
        return SpikeConfig{f.number("suspect_threshold"), f.number("fail_threshold")};
    }
    if (kind == "rate_of_change") {
        return RateOfChangeConfig{f.number("threshold"), f.flag("use_index_time")};
    }
    if (kind == "flat_line") {
        return FlatLineConfig{f.number("suspect_threshold"), f.number("fail_threshold"),
                              f.number("tolerance"), f.flag("use_index_time")};
    }
    if (kind == "missing_value") return MissingValueConfig{};
    if (kind == "climatology") return parse_climatology(f, variable + "/climatology", diags);
    return UnknownCheckConfig{kind};
}

} // namespace

QcConfig parse_qc_config(std::string_view json_text, Diagnostics& diags) {
    Json root = internal::parse_json(json_text, ErrorKind::Config);
    if (!root.is_object()) throw CastError(ErrorKind::Config, "QC configuration is not a JSON object");
    const auto& obj = root.as_object();

    QcConfig cfg;
    if (const Json* e = internal::obj_get(obj, "emit_check_variables")) {
        if (!e->is_bool()) throw CastError(ErrorKind::Config, "'emit_check_variables' must be true or false");
        cfg.emit_check_variables = e->as_bool();
    }
    const Json* vars = internal::obj_get(obj, "variables");
    if (!vars) return cfg;
    if (!vars->is_object()) throw CastError(ErrorKind::Config, "'variables' must be an object");

    for (const auto& kv : vars->as_object()) {
        if (!kv.second.is_array()) {
            throw CastError(ErrorKind::Config, "checks for '" + kv.first + "' must be an array");
        }
        std::vector<CheckSpec> pipeline;
        const auto& arr = kv.second.as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) pipeline.push_back(parse_check(arr[i], kv.first, i, diags));
        cfg.variables.emplace(kv.first, std::move(pipeline));
    }
    return cfg;
}

QcConfig load_qc_config(const std::filesystem::path& file, Diagnostics& diags) {
    std::ifstream is(file, std::ios::binary);
    if (!is) throw CastError(ErrorKind::Io, "failed to open QC configuration", file.string());
    std::ostringstream oss;
    oss << is.rdbuf();
    try {
        return parse_qc_config(oss.str(), diags);
    } catch (const CastError& e) {
        throw e.with_source(file.string());
    }
}

// ------------------------------
// Defaults
// ------------------------------

static std::vector<CheckSpec> standard_pipeline(Span fail, Span suspect,
                                                double spike_suspect, double spike_fail,
                                                double flat_suspect, double flat_fail, double flat_tolerance,
                                                double roc_threshold) {
    return {
        GrossRangeConfig{fail, suspect},
        SpikeConfig{spike_suspect, spike_fail},
        FlatLineConfig{flat_suspect, flat_fail, flat_tolerance, false},
        RateOfChangeConfig{roc_threshold, false},
    };
}

QcConfig default_qc_config() {
    QcConfig cfg;
    cfg.variables["sea_water_temperature"] =
        standard_pipeline({-2.0, 35.0}, {-1.5, 32.0}, 0.5, 1.0, 15.0, 30.0, 0.005, 2.0);
    cfg.variables["sea_water_practical_salinity"] =
        standard_pipeline({0.0, 42.0}, {1.0, 40.0}, 1.0, 2.0, 30.0, 60.0, 0.01, 5.0);
    cfg.variables["mass_concentration_of_chlorophyll_in_sea_water"] =
        standard_pipeline({0.0, 50.0}, {0.1, 45.0}, 1.5, 3.0, 20.0, 45.0, 0.01, 10.0);
    return cfg;
}

} // namespace ctdgbf
