#include "ctdgbf/flags.hpp"

#include "ctdgbf/error.hpp"

#include <map>

namespace ctdgbf {

// Missing ranks as NOT_EVALUATED here; the value mask decides MISSING.
static int severity(FlagValue f) noexcept {
    switch (f) {
        case FlagValue::Good: return 0;
        case FlagValue::NotEvaluated: return 1;
        case FlagValue::Missing: return 1;
        case FlagValue::Suspect: return 2;
        case FlagValue::Fail: return 3;
    }
    return 1;
}

std::vector<FlagValue> aggregate(const std::vector<QCResult>& results, const std::vector<bool>& missing) {
    const std::size_t n = missing.size();
    for (const auto& r : results) {
        if (r.flags.size() != n) {
            throw CastError(ErrorKind::InvalidData,
                            "check '" + r.check_name + "' produced " + std::to_string(r.flags.size()) +
                            " flags for " + std::to_string(n) + " values");
        }
    }

    std::vector<FlagValue> out(n, FlagValue::NotEvaluated);
    for (std::size_t i = 0; i < n; ++i) {
        if (missing[i]) {
            out[i] = FlagValue::Missing;
            continue;
        }
        if (results.empty()) continue;
        FlagValue worst = FlagValue::Good;
        for (const auto& r : results) {
            FlagValue f = r.flags[i] == FlagValue::Missing ? FlagValue::NotEvaluated : r.flags[i];
            if (severity(f) > severity(worst)) worst = f;
        }
        out[i] = worst;
    }
    return out;
}

static std::vector<std::int8_t> to_int8(const std::vector<FlagValue>& flags) {
    std::vector<std::int8_t> out;
    out.reserve(flags.size());
    for (FlagValue f : flags) out.push_back(static_cast<std::int8_t>(f));
    return out;
}

static Attributes flag_attributes(const std::string& long_name, const std::string& standard_name,
                                  const Variable& source) {
    Attributes a;
    a["long_name"] = long_name;
    a["standard_name"] = standard_name;
    a["flag_values"] = kFlagValues;
    a["flag_meanings"] = kFlagMeanings;
    a["qc_source_variable"] = source.name;
    std::string coords = source.attribute("coordinates");
    if (!coords.empty()) a["coordinates"] = coords;
    return a;
}

void attach_qc(Dataset& ds, const std::string& variable, const std::vector<QCResult>& results,
               const QcOptions& options) {
    const Variable& source = ds.variable(variable);
    const Series series = series_of(ds, variable);
    const std::vector<FlagValue> flags = aggregate(results, series.missing_mask());

    std::string checks;
    for (const auto& r : results) {
        if (!checks.empty()) checks += ' ';
        checks += r.check_name;
    }

    std::vector<Variable> batch;
    Attributes agg = flag_attributes(variable + " quality control flags", "aggregate_quality_flag", source);
    agg["qc_checks"] = checks;
    batch.push_back(Variable::make_int8(variable + "_qc", source.dims, to_int8(flags), std::move(agg)));

    if (options.emit_check_variables) {
        std::map<std::string, int> seen;
        for (const auto& r : results) {
            std::string suffix = r.check_name;
            if (int n = ++seen[r.check_name]; n > 1) suffix += "_" + std::to_string(n);
            const std::string base = variable + "_qc_" + suffix;

            Attributes a = flag_attributes(variable + " " + r.check_name + " flags", "quality_flag", source);
            a["qc_check"] = r.check_name;
            batch.push_back(Variable::make_int8(base, source.dims, to_int8(r.flags), std::move(a)));

            if (!r.bounds) continue;
            std::vector<double> lower;
            std::vector<double> upper;
            lower.reserve(r.bounds->size());
            upper.reserve(r.bounds->size());
            for (const auto& b : *r.bounds) {
                lower.push_back(b.lower);
                upper.push_back(b.upper);
            }
            const std::string units = source.attribute("units");
            batch.push_back(Variable::make_float(base + "_lower", source.dims, std::move(lower),
                {{"long_name", variable + " " + r.check_name + " lower bound"}, {"units", units},
                 {"_FillValue", "NaN"}, {"qc_source_variable", variable}}));
            batch.push_back(Variable::make_float(base + "_upper", source.dims, std::move(upper),
                {{"long_name", variable + " " + r.check_name + " upper bound"}, {"units", units},
                 {"_FillValue", "NaN"}, {"qc_source_variable", variable}}));
        }
    }

    ds.commit(std::move(batch), options.replace_existing);
}

} // namespace ctdgbf
