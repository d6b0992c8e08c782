#pragma once

#include "ctdgbf/dataset.hpp"
#include "ctdgbf/error.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ctdgbf {

// ------------------------------
// Flags
// ------------------------------

// QARTOD flag integers.
enum class FlagValue : std::int8_t {
    Good = 1,
    NotEvaluated = 2,
    Suspect = 3,
    Fail = 4,
    Missing = 9,
};

std::string to_string(FlagValue f);

struct Bounds {
    double lower{0.0};
    double upper{0.0};
};

struct QCResult {
    std::string variable_name{};
    std::string check_name{};
    std::vector<FlagValue> flags{};                   // parallel to the variable's values
    std::optional<std::vector<Bounds>> bounds{};      // threshold checks only
};

// ------------------------------
// Input series
// ------------------------------

struct Series {
    std::string variable{};
    std::vector<double> values{};
    std::vector<double> times{};   // seconds since 1970; empty when the dataset has none
    std::vector<double> depths{};  // metres; empty when the dataset has none
    std::optional<double> fill_value{};

    bool is_missing(std::size_t i) const noexcept;
    std::vector<bool> missing_mask() const;
};

/// Values of a float64 variable plus its time and depth axes when they line up.
Series series_of(const Dataset& ds, const std::string& variable);

// ------------------------------
// Checks
// ------------------------------

struct CheckOutcome {
    std::vector<FlagValue> flags{};
    std::optional<std::vector<Bounds>> bounds{};
    std::vector<std::string> problems{}; // configuration problems, one per line
};

class Check {
public:
    virtual ~Check() = default;
    virtual std::string name() const = 0;
    /// Reads only `s`; missing points come back as FlagValue::Missing.
    virtual CheckOutcome evaluate(const Series& s) const = 0;
};

struct Span {
    double lower{0.0};
    double upper{0.0};
};

struct GrossRangeConfig {
    std::optional<Span> fail_span{};
    std::optional<Span> suspect_span{};
};

struct SpikeConfig {
    std::optional<double> suspect_threshold{};
    std::optional<double> fail_threshold{};
};

struct RateOfChangeConfig {
    std::optional<double> threshold{}; // units per second (per sample with use_index_time)
    bool use_index_time{false};
};

struct FlatLineConfig {
    std::optional<double> suspect_threshold{}; // seconds (samples with use_index_time)
    std::optional<double> fail_threshold{};
    std::optional<double> tolerance{};
    bool use_index_time{false};
};

struct MissingValueConfig {};

struct ClimatologyPeriod {
    unsigned month_start{1}; // 1..12, inclusive; wraps when start > end
    unsigned month_end{12};
    std::optional<Span> vertical{};
    Span span{};
};

struct ClimatologyConfig {
    std::vector<ClimatologyPeriod> periods{};
};

struct UnknownCheckConfig {
    std::string kind{};
};

using CheckSpec = std::variant<
    GrossRangeConfig,
    SpikeConfig,
    RateOfChangeConfig,
    FlatLineConfig,
    MissingValueConfig,
    ClimatologyConfig,
    UnknownCheckConfig
>;

std::string check_name(const CheckSpec& spec);
std::unique_ptr<Check> make_check(const CheckSpec& spec);

/// Runs `pipeline` in order over `variable`. Each check sees the raw values
/// only. Configuration problems are reported to `diags` and turn that check's
/// flags into NOT_EVALUATED. Throws CastError(NotFound) for an unknown variable.
std::vector<QCResult> run_checks(const Dataset& ds,
                                 const std::string& variable,
                                 const std::vector<CheckSpec>& pipeline,
                                 Diagnostics& diags);

} // namespace ctdgbf
