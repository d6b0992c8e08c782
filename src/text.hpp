#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace ctdgbf::internal {

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string trim(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return std::string(s.substr(b, e - b));
}

inline std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Lowercase, internal whitespace runs collapsed to one space, trailing ':' dropped.
inline std::string normalize_key(std::string_view s) {
    std::string t = trim(s);
    while (!t.empty() && t.back() == ':') t.pop_back();
    std::string out;
    out.reserve(t.size());
    bool in_space = false;
    for (char c : t) {
        if (is_space(c)) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out.push_back(' ');
        in_space = false;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

// Lowercase with every whitespace character removed ("ITS-90, deg C" -> "its-90,degc").
inline std::string squash(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (!is_space(c)) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

inline bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline std::vector<std::string> split_ws(std::string_view s) {
    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) ++i;
        std::size_t start = i;
        while (i < s.size() && !is_space(s[i])) ++i;
        if (i > start) out.emplace_back(s.substr(start, i - start));
    }
    return out;
}

// Every comma separates a token, so ",," yields an empty token.
inline std::vector<std::string> split_commas(std::string_view s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        auto comma = s.find(',', start);
        if (comma == std::string_view::npos) {
            out.push_back(trim(s.substr(start)));
            break;
        }
        out.push_back(trim(s.substr(start, comma - start)));
        start = comma + 1;
    }
    return out;
}

// Whole-token finite double, "C" locale.
inline std::optional<double> parse_double(std::string_view token) {
    std::string t = trim(token);
    if (t.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || (errno == ERANGE && std::fabs(v) > 1.0)) return std::nullopt;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

// Shortest-ish decimal text for attribute values; "NaN" for NaN.
inline std::string format_number(double v) {
    if (std::isnan(v)) return "NaN";
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(12) << v;
    return oss.str();
}

} // namespace ctdgbf::internal
