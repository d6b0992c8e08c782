#include "ctdgbf/timefmt.hpp"

#include "text.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace ctdgbf {

using std::chrono::seconds;

static const std::array<const char*, 12> kMonths = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec",
};

// ------------------------------
// Civil calendar
// ------------------------------

static bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static unsigned days_in_month(int y, unsigned m) {
    static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29u : kDays[m - 1];
}

long long days_from_civil(const CivilDate& d) {
    const long long y = static_cast<long long>(d.year) - (d.month <= 2 ? 1 : 0);
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp = (static_cast<long long>(d.month) + 9) % 12;
    const long long doy = (153 * mp + 2) / 5 + static_cast<long long>(d.day) - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(long long z) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    CivilDate out;
    out.day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    out.month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    out.year = static_cast<int>(yoe + era * 400 + (out.month <= 2 ? 1 : 0));
    return out;
}

static long long floor_div(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

bool is_valid_epoch(double epoch_seconds) {
    return std::isfinite(epoch_seconds) && std::fabs(epoch_seconds) <= kMaxEpochSeconds;
}

std::optional<CivilDate> civil_from_epoch(double epoch_seconds) {
    if (!is_valid_epoch(epoch_seconds)) return std::nullopt;
    const long long secs = static_cast<long long>(std::floor(epoch_seconds));
    return civil_from_days(floor_div(secs, 86400));
}

static std::optional<Timestamp> make_timestamp(int y, unsigned mo, unsigned d, int h, int mi, int s) {
    if (mo < 1 || mo > 12 || d < 1 || d > days_in_month(y, mo)) return std::nullopt;
    if (h < 0 || h > 23 || mi < 0 || mi > 59 || s < 0 || s > 60) return std::nullopt;
    const long long days = days_from_civil(CivilDate{y, mo, d});
    return Timestamp{seconds{days * 86400 + h * 3600LL + mi * 60LL + s}};
}

// ------------------------------
// Parsing and formatting
// ------------------------------

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    std::string t = internal::trim(text);
    if (t.empty()) return std::nullopt;

    int y = 0, h = 0, mi = 0, s = 0;
    unsigned mo = 0, d = 0;

    // ISO 8601
    if (std::isdigit(static_cast<unsigned char>(t[0]))) {
        char sep = 0;
        int n = std::sscanf(t.c_str(), "%d-%u-%u%c%d:%d:%d", &y, &mo, &d, &sep, &h, &mi, &s);
        if (n == 3) return make_timestamp(y, mo, d, 0, 0, 0);
        if (n == 7 && (sep == 'T' || sep == ' ')) return make_timestamp(y, mo, d, h, mi, s);
        return std::nullopt;
    }

    // "Mon DD YYYY HH:MM:SS"
    std::istringstream iss(t);
    std::string mon, clock;
    if (!(iss >> mon >> d >> y >> clock)) return std::nullopt;
    mon = internal::lower(mon.substr(0, 3));
    for (std::size_t i = 0; i < kMonths.size(); ++i) {
        if (mon == kMonths[i]) mo = static_cast<unsigned>(i + 1);
    }
    if (mo == 0) return std::nullopt;
    if (std::sscanf(clock.c_str(), "%d:%d:%d", &h, &mi, &s) != 3) return std::nullopt;
    return make_timestamp(y, mo, d, h, mi, s);
}

double to_epoch_seconds(Timestamp t) {
    return static_cast<double>(t.time_since_epoch().count());
}

std::string format_iso8601(double epoch_seconds) {
    if (!is_valid_epoch(epoch_seconds)) return {};
    const long long secs = static_cast<long long>(std::floor(epoch_seconds));
    const long long day_index = floor_div(secs, 86400);
    const long long in_day = secs - day_index * 86400;
    const CivilDate date = civil_from_days(day_index);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                  date.year, date.month, date.day,
                  static_cast<int>(in_day / 3600),
                  static_cast<int>((in_day % 3600) / 60),
                  static_cast<int>(in_day % 60));
    return buf;
}

std::string format_iso8601_duration(double seconds_total) {
    if (!std::isfinite(seconds_total) || seconds_total < 0.0) return {};
    long long rest = static_cast<long long>(std::llround(seconds_total));
    const long long d = rest / 86400; rest %= 86400;
    const long long h = rest / 3600;  rest %= 3600;
    const long long m = rest / 60;
    const long long s = rest % 60;

    std::ostringstream oss;
    oss << 'P';
    if (d > 0) oss << d << 'D';
    oss << 'T' << h << 'H' << m << 'M' << s << 'S';
    return oss.str();
}

} // namespace ctdgbf
