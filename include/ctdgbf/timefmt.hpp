#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace ctdgbf {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

/// Proleptic Gregorian calendar date.
struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
};

/// Days since 1970-01-01 for a calendar date, and the reverse.
long long days_from_civil(const CivilDate& d);
CivilDate civil_from_days(long long days);

/// Largest |epoch seconds| treated as a real time (about 31 million years).
constexpr double kMaxEpochSeconds = 1e15;

/// Finite and within kMaxEpochSeconds.
bool is_valid_epoch(double epoch_seconds);

/// UTC calendar date of an epoch time in seconds; nullopt when !is_valid_epoch.
std::optional<CivilDate> civil_from_epoch(double epoch_seconds);

/// Parses "Jun 02 2021 10:15:22" (Sea-Bird headers) or "2021-06-02T10:15:22[Z]".
/// Times are taken as UTC.
std::optional<Timestamp> parse_timestamp(std::string_view text);

double to_epoch_seconds(Timestamp t);

/// "2021-06-02T10:15:22Z"; fractional seconds are truncated. Empty when !is_valid_epoch.
std::string format_iso8601(double epoch_seconds);

/// ISO 8601 duration, e.g. "PT1H2M3S" or "P1DT0H0M5S".
std::string format_iso8601_duration(double seconds);

} // namespace ctdgbf
