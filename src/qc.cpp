#include "ctdgbf/qc.hpp"

#include "ctdgbf/timefmt.hpp"
#include "text.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace ctdgbf {

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

std::string to_string(FlagValue f) {
    switch (f) {
        case FlagValue::Good: return "GOOD";
        case FlagValue::NotEvaluated: return "NOT_EVALUATED";
        case FlagValue::Suspect: return "SUSPECT";
        case FlagValue::Fail: return "FAIL";
        case FlagValue::Missing: return "MISSING";
    }
    return "UNKNOWN";
}

// ------------------------------
// Series
// ------------------------------

bool Series::is_missing(std::size_t i) const noexcept {
    const double v = values[i];
    if (std::isnan(v)) return true;
    return fill_value && v == *fill_value;
}

std::vector<bool> Series::missing_mask() const {
    std::vector<bool> out(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) out[i] = is_missing(i);
    return out;
}

static std::vector<double> aligned_axis(const Dataset& ds, const std::string& name, std::size_t n) {
    if (!ds.has_variable(name)) return {};
    const Variable& v = ds.variable(name);
    if (v.type() != DataType::Float64 || v.size() != n) return {};
    return v.as_float();
}

Series series_of(const Dataset& ds, const std::string& variable) {
    const Variable& v = ds.variable(variable);
    if (v.type() != DataType::Float64) {
        throw CastError(ErrorKind::InvalidData, "variable '" + variable + "' is not numeric and cannot be quality controlled");
    }
    Series s;
    s.variable = variable;
    s.values = v.as_float();
    s.fill_value = internal::parse_double(v.attribute("_FillValue"));
    s.times = aligned_axis(ds, "time", s.values.size());
    s.depths = aligned_axis(ds, "depth", s.values.size());
    return s;
}

// ------------------------------
// Shared pieces
// ------------------------------

namespace {

CheckOutcome not_evaluated(const Series& s, std::string problem) {
    CheckOutcome out;
    out.flags.resize(s.values.size());
    for (std::size_t i = 0; i < s.values.size(); ++i) {
        out.flags[i] = s.is_missing(i) ? FlagValue::Missing : FlagValue::NotEvaluated;
    }
    if (!problem.empty()) out.problems.push_back(std::move(problem));
    return out;
}

bool valid_span(const std::optional<Span>& s) {
    return s && std::isfinite(s->lower) && std::isfinite(s->upper) && s->lower <= s->upper;
}

bool positive(const std::optional<double>& v) {
    return v && std::isfinite(*v) && *v > 0.0;
}

// Time (or sample index) axis for time-based checks, or the reason it is unusable.
std::optional<std::vector<double>> time_axis(const Series& s, bool use_index, std::string& problem) {
    const std::size_t n = s.values.size();
    if (use_index) {
        std::vector<double> t(n);
        for (std::size_t i = 0; i < n; ++i) t[i] = static_cast<double>(i);
        return t;
    }
    if (s.times.size() != n) {
        problem = "no time axis aligned with the variable";
        return std::nullopt;
    }
    std::set<double> distinct;
    for (double t : s.times) {
        if (std::isfinite(t)) distinct.insert(t);
        if (distinct.size() >= 2) break;
    }
    if (distinct.size() < 2) {
        problem = "time axis has no variation";
        return std::nullopt;
    }
    return s.times;
}

std::optional<unsigned> month_of(double epoch_seconds) {
    const std::optional<CivilDate> date = civil_from_epoch(epoch_seconds);
    if (!date) return std::nullopt;
    return date->month;
}

// ------------------------------
// gross_range
// ------------------------------

class GrossRangeCheck : public Check {
public:
    explicit GrossRangeCheck(GrossRangeConfig cfg) : cfg_(std::move(cfg)) {}

    std::string name() const override { return "gross_range"; }

    CheckOutcome evaluate(const Series& s) const override {
        if (!valid_span(cfg_.fail_span)) return not_evaluated(s, "fail_span is absent or invalid");
        const Span fail = *cfg_.fail_span;
        if (cfg_.suspect_span) {
            if (!valid_span(cfg_.suspect_span)) return not_evaluated(s, "suspect_span is invalid");
            if (cfg_.suspect_span->lower < fail.lower || cfg_.suspect_span->upper > fail.upper) {
                return not_evaluated(s, "suspect_span must lie within fail_span");
            }
        }

        CheckOutcome out;
        out.flags.resize(s.values.size());
        out.bounds = std::vector<Bounds>(s.values.size(), Bounds{fail.lower, fail.upper});
        for (std::size_t i = 0; i < s.values.size(); ++i) {
            const double v = s.values[i];
            if (s.is_missing(i)) out.flags[i] = FlagValue::Missing;
            else if (v < fail.lower || v > fail.upper) out.flags[i] = FlagValue::Fail;
            else if (cfg_.suspect_span && (v < cfg_.suspect_span->lower || v > cfg_.suspect_span->upper)) out.flags[i] = FlagValue::Suspect;
            else out.flags[i] = FlagValue::Good;
        }
        return out;
    }

private:
    GrossRangeConfig cfg_;
};

// ------------------------------
// spike
// ------------------------------

class SpikeCheck : public Check {
public:
    explicit SpikeCheck(SpikeConfig cfg) : cfg_(std::move(cfg)) {}

    std::string name() const override { return "spike"; }

    CheckOutcome evaluate(const Series& s) const override {
        if (!positive(cfg_.suspect_threshold)) return not_evaluated(s, "suspect_threshold is absent or not positive");
        if (cfg_.fail_threshold && (!positive(cfg_.fail_threshold) || *cfg_.fail_threshold < *cfg_.suspect_threshold)) {
            return not_evaluated(s, "fail_threshold must be positive and not below suspect_threshold");
        }
        const double suspect = *cfg_.suspect_threshold;
        const double band = cfg_.fail_threshold.value_or(suspect);
        const std::size_t n = s.values.size();

        CheckOutcome out = not_evaluated(s, {});
        out.bounds = std::vector<Bounds>(n, Bounds{kNaN, kNaN});
        for (std::size_t i = 1; i + 1 < n; ++i) {
            if (s.is_missing(i) || s.is_missing(i - 1) || s.is_missing(i + 1)) continue;
            const double ref = (s.values[i - 1] + s.values[i + 1]) / 2.0;
            const double dev = std::fabs(s.values[i] - ref);
            (*out.bounds)[i] = Bounds{ref - band, ref + band};
            if (cfg_.fail_threshold && dev > *cfg_.fail_threshold) out.flags[i] = FlagValue::Fail;
            else if (dev > suspect) out.flags[i] = FlagValue::Suspect;
            else out.flags[i] = FlagValue::Good;
        }
        return out;
    }

private:
    SpikeConfig cfg_;
};

// ------------------------------
// rate_of_change
// ------------------------------

class RateOfChangeCheck : public Check {
public:
    explicit RateOfChangeCheck(RateOfChangeConfig cfg) : cfg_(std::move(cfg)) {}

    std::string name() const override { return "rate_of_change"; }

    CheckOutcome evaluate(const Series& s) const override {
        if (!positive(cfg_.threshold)) return not_evaluated(s, "threshold is absent or not positive");
        std::string problem;
        auto t = time_axis(s, cfg_.use_index_time, problem);
        if (!t) return not_evaluated(s, problem);

        CheckOutcome out = not_evaluated(s, {});
        for (std::size_t i = 1; i < s.values.size(); ++i) {
            if (s.is_missing(i) || s.is_missing(i - 1)) continue;
            const double dt = (*t)[i] - (*t)[i - 1];
            if (!std::isfinite(dt) || dt <= 0.0) continue;
            const double rate = std::fabs(s.values[i] - s.values[i - 1]) / dt;
            out.flags[i] = rate > *cfg_.threshold ? FlagValue::Suspect : FlagValue::Good;
        }
        return out;
    }

private:
    RateOfChangeConfig cfg_;
};

// ------------------------------
// flat_line
// ------------------------------

class FlatLineCheck : public Check {
public:
    explicit FlatLineCheck(FlatLineConfig cfg) : cfg_(std::move(cfg)) {}

    std::string name() const override { return "flat_line"; }

    CheckOutcome evaluate(const Series& s) const override {
        if (!positive(cfg_.suspect_threshold) || !positive(cfg_.fail_threshold) ||
            *cfg_.fail_threshold < *cfg_.suspect_threshold) {
            return not_evaluated(s, "suspect_threshold and fail_threshold must be positive with fail >= suspect");
        }
        if (!cfg_.tolerance || !std::isfinite(*cfg_.tolerance) || *cfg_.tolerance < 0.0) {
            return not_evaluated(s, "tolerance is absent or negative");
        }
        std::string problem;
        auto axis = time_axis(s, cfg_.use_index_time, problem);
        if (!axis) return not_evaluated(s, problem);
        const std::vector<double>& t = *axis;

        const double suspect = *cfg_.suspect_threshold;
        const double fail = *cfg_.fail_threshold;
        double t_first = kNaN;
        for (double x : t) {
            if (std::isfinite(x)) { t_first = x; break; }
        }

        CheckOutcome out = not_evaluated(s, {});
        for (std::size_t i = 0; i < s.values.size(); ++i) {
            if (s.is_missing(i) || !std::isfinite(t[i])) continue;
            if (t[i] - t_first < suspect) continue; // not enough history

            // Walk back while the window stays within tolerance.
            double lo = s.values[i];
            double hi = s.values[i];
            double duration = 0.0;
            for (std::size_t j = i; j-- > 0;) {
                if (s.is_missing(j) || !std::isfinite(t[j])) break;
                lo = std::min(lo, s.values[j]);
                hi = std::max(hi, s.values[j]);
                if (hi - lo > *cfg_.tolerance) break;
                duration = t[i] - t[j];
                if (duration >= fail) break;
            }
            if (duration >= fail) out.flags[i] = FlagValue::Fail;
            else if (duration >= suspect) out.flags[i] = FlagValue::Suspect;
            else out.flags[i] = FlagValue::Good;
        }
        return out;
    }

private:
    FlatLineConfig cfg_;
};

// ------------------------------
// missing_value
// ------------------------------

class MissingValueCheck : public Check {
public:
    std::string name() const override { return "missing_value"; }

    CheckOutcome evaluate(const Series& s) const override {
        CheckOutcome out;
        out.flags.resize(s.values.size());
        for (std::size_t i = 0; i < s.values.size(); ++i) {
            out.flags[i] = s.is_missing(i) ? FlagValue::Missing : FlagValue::Good;
        }
        return out;
    }
};

// ------------------------------
// climatology
// ------------------------------

class ClimatologyCheck : public Check {
public:
    explicit ClimatologyCheck(ClimatologyConfig cfg) : cfg_(std::move(cfg)) {}

    std::string name() const override { return "climatology"; }

    CheckOutcome evaluate(const Series& s) const override {
        if (cfg_.periods.empty()) return not_evaluated(s, "no climatology periods configured");
        for (const auto& p : cfg_.periods) {
            if (p.month_start < 1 || p.month_start > 12 || p.month_end < 1 || p.month_end > 12) {
                return not_evaluated(s, "period months must be within 1..12");
            }
            if (!valid_span(p.span) || (p.vertical && !valid_span(p.vertical))) {
                return not_evaluated(s, "period span or vertical range is invalid");
            }
        }
        if (s.times.size() != s.values.size()) return not_evaluated(s, "no time axis aligned with the variable");

        const std::size_t n = s.values.size();
        CheckOutcome out = not_evaluated(s, {});
        out.bounds = std::vector<Bounds>(n, Bounds{kNaN, kNaN});
        for (std::size_t i = 0; i < n; ++i) {
            if (s.is_missing(i)) continue;
            const std::optional<unsigned> month = month_of(s.times[i]);
            if (!month) continue;
            const ClimatologyPeriod* p = match(*month, depth_at(s, i));
            if (!p) continue;
            (*out.bounds)[i] = Bounds{p->span.lower, p->span.upper};
            const double v = s.values[i];
            out.flags[i] = (v < p->span.lower || v > p->span.upper) ? FlagValue::Suspect : FlagValue::Good;
        }
        return out;
    }

private:
    static double depth_at(const Series& s, std::size_t i) {
        return s.depths.size() == s.values.size() ? s.depths[i] : kNaN;
    }

    const ClimatologyPeriod* match(unsigned month, double depth) const {
        for (const auto& p : cfg_.periods) {
            bool in_months = p.month_start <= p.month_end
                ? (month >= p.month_start && month <= p.month_end)
                : (month >= p.month_start || month <= p.month_end);
            if (!in_months) continue;
            if (p.vertical) {
                if (std::isnan(depth) || depth < p.vertical->lower || depth > p.vertical->upper) continue;
            }
            return &p;
        }
        return nullptr;
    }

    ClimatologyConfig cfg_;
};

// ------------------------------
// unknown kinds
// ------------------------------

class UnknownCheck : public Check {
public:
    explicit UnknownCheck(std::string kind) : kind_(std::move(kind)) {}

    std::string name() const override { return kind_.empty() ? std::string("unknown") : kind_; }

    CheckOutcome evaluate(const Series& s) const override {
        return not_evaluated(s, kind_.empty() ? std::string("check kind is missing")
                                              : "unknown check kind '" + kind_ + "'");
    }

private:
    std::string kind_;
};

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::unique_ptr<Check> make_check(const CheckSpec& spec) {
    return std::visit(overloaded{
        [](const GrossRangeConfig& c) -> std::unique_ptr<Check> { return std::make_unique<GrossRangeCheck>(c); },
        [](const SpikeConfig& c) -> std::unique_ptr<Check> { return std::make_unique<SpikeCheck>(c); },
        [](const RateOfChangeConfig& c) -> std::unique_ptr<Check> { return std::make_unique<RateOfChangeCheck>(c); },
        [](const FlatLineConfig& c) -> std::unique_ptr<Check> { return std::make_unique<FlatLineCheck>(c); },
        [](const MissingValueConfig&) -> std::unique_ptr<Check> { return std::make_unique<MissingValueCheck>(); },
        [](const ClimatologyConfig& c) -> std::unique_ptr<Check> { return std::make_unique<ClimatologyCheck>(c); },
        [](const UnknownCheckConfig& c) -> std::unique_ptr<Check> { return std::make_unique<UnknownCheck>(c.kind); },
    }, spec);
}

std::string check_name(const CheckSpec& spec) {
    return make_check(spec)->name();
}

// ------------------------------
// Runner
// ------------------------------

std::vector<QCResult> run_checks(const Dataset& ds,
                                 const std::string& variable,
                                 const std::vector<CheckSpec>& pipeline,
                                 Diagnostics& diags) {
    const Series series = series_of(ds, variable);
    if (pipeline.empty()) {
        diags.warn(DiagnosticKind::CheckConfiguration, variable, "no checks configured; flags are NOT_EVALUATED");
    }

    std::vector<QCResult> results;
    results.reserve(pipeline.size());
    for (const auto& spec : pipeline) {
        std::unique_ptr<Check> check = make_check(spec);
        CheckOutcome outcome = check->evaluate(series);
        for (const auto& p : outcome.problems) {
            diags.warn(DiagnosticKind::CheckConfiguration, variable + "/" + check->name(),
                       p + "; flags are NOT_EVALUATED");
        }
        QCResult r;
        r.variable_name = variable;
        r.check_name = check->name();
        r.flags = std::move(outcome.flags);
        r.bounds = std::move(outcome.bounds);
        results.push_back(std::move(r));
    }
    return results;
}

} // namespace ctdgbf
