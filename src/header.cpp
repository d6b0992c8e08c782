#include "ctdgbf/header.hpp"

#include "ctdgbf/error.hpp"
#include "text.hpp"

#include <cmath>
#include <set>
#include <sstream>

namespace ctdgbf {

using internal::normalize_key;
using internal::trim;

// ------------------------------
// Line shapes
// ------------------------------

static std::string_view strip_markers(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size() && (s[i] == '*' || s[i] == '#' || internal::is_space(s[i]))) ++i;
    return s.substr(i);
}

static bool is_data_start(std::string_view line) {
    return internal::lower(trim(line)) == "*end*";
}

// "# name 3 = t090C: Temperature [ITS-90, deg C]"
static std::optional<ColumnDecl> match_column_decl(std::string_view line) {
    std::string t = trim(line);
    if (t.empty() || t[0] != '#') return std::nullopt;
    std::string body = trim(std::string_view(t).substr(1));
    if (internal::lower(body.substr(0, 5)) != "name ") return std::nullopt;

    auto eq = body.find('=');
    if (eq == std::string::npos) return std::nullopt;
    std::string index_text = trim(std::string_view(body).substr(5, eq - 5));
    std::string rhs = trim(std::string_view(body).substr(eq + 1));

    auto index = internal::parse_double(index_text);
    if (!index || *index < 0 || std::floor(*index) != *index) {
        throw CastError(ErrorKind::MalformedHeader, "invalid column index '" + index_text + "'");
    }

    ColumnDecl decl;
    decl.column.sensor_index = static_cast<int>(*index);

    auto colon = rhs.find(':');
    decl.column.raw_name = trim(std::string_view(rhs).substr(0, colon));
    if (decl.column.raw_name.empty()) {
        throw CastError(ErrorKind::MalformedHeader, "column " + index_text + " has an empty name");
    }
    if (colon != std::string::npos) {
        std::string rest = rhs.substr(colon + 1);
        auto open = rest.rfind('[');
        auto close = rest.rfind(']');
        if (open != std::string::npos && close != std::string::npos && close > open) {
            decl.column.unit = trim(std::string_view(rest).substr(open + 1, close - open - 1));
            decl.column.description = trim(std::string_view(rest).substr(0, open));
        } else {
            decl.column.description = trim(rest);
        }
    }
    return decl;
}

static std::optional<ScalarMeta> match_scalar_meta(std::string_view line) {
    std::string t = trim(line);
    if (t.empty()) return std::nullopt;

    const bool user_line = internal::starts_with(t, "**");
    std::string body = trim(strip_markers(t));
    if (body.empty() || body[0] == '<') return std::nullopt;

    auto eq = body.find('=');
    if (eq != std::string::npos) {
        std::string key = trim(std::string_view(body).substr(0, eq));
        if (key.empty()) return std::nullopt;
        return ScalarMeta{key, trim(std::string_view(body).substr(eq + 1))};
    }
    if (user_line) {
        auto colon = body.find(':');
        if (colon == std::string::npos) return std::nullopt;
        std::string key = trim(std::string_view(body).substr(0, colon));
        if (key.empty()) return std::nullopt;
        return ScalarMeta{key, trim(std::string_view(body).substr(colon + 1))};
    }
    return std::nullopt;
}

HeaderLine classify_line(std::string_view line) {
    if (is_data_start(line)) return DataStart{};
    if (auto decl = match_column_decl(line)) return std::move(*decl);
    if (auto meta = match_scalar_meta(line)) return std::move(*meta);
    return Ignorable{};
}

// ------------------------------
// Value helpers
// ------------------------------

std::optional<double> parse_coordinate(std::string_view text, bool latitude) {
    std::vector<std::string> parts = internal::split_ws(text);
    if (parts.empty()) return std::nullopt;

    double sign = 1.0;
    const char positive = latitude ? 'n' : 'e';
    const char negative = latitude ? 's' : 'w';
    std::string last = internal::lower(parts.back());
    if (last.size() == 1 && (last[0] == positive || last[0] == negative)) {
        if (last[0] == negative) sign = -1.0;
        parts.pop_back();
    }
    if (parts.empty() || parts.size() > 2) return std::nullopt;

    auto deg = internal::parse_double(parts[0]);
    if (!deg) return std::nullopt;
    double value = *deg;
    if (parts.size() == 2) {
        auto minutes = internal::parse_double(parts[1]);
        if (!minutes || *minutes < 0.0 || *minutes >= 60.0) return std::nullopt;
        value = std::fabs(value) + *minutes / 60.0;
        if (*deg < 0.0) value = -value;
    }
    value *= sign;

    const double limit = latitude ? 90.0 : 180.0;
    if (std::fabs(value) > limit) return std::nullopt;
    return value;
}

static std::optional<std::size_t> parse_count(const std::string& value) {
    auto v = internal::parse_double(value);
    if (!v || *v < 0.0 || std::floor(*v) != *v) return std::nullopt;
    return static_cast<std::size_t>(*v);
}

// "seconds: 0.0416667"
static std::optional<double> parse_interval(const std::string& value) {
    auto colon = value.find(':');
    std::string unit = colon == std::string::npos ? std::string("seconds") : normalize_key(value.substr(0, colon));
    std::string number = colon == std::string::npos ? value : value.substr(colon + 1);
    auto v = internal::parse_double(number);
    if (!v || *v <= 0.0) return std::nullopt;
    if (unit == "seconds") return *v;
    if (unit == "minutes") return *v * 60.0;
    if (unit == "hours") return *v * 3600.0;
    return std::nullopt;
}

// "Jun 02 2021 10:15:22 [Instrument's time stamp, header]" -> drop the annotation
static std::string drop_annotation(const std::string& value) {
    auto open = value.find('[');
    if (open == std::string::npos) return value;
    return trim(std::string_view(value).substr(0, open));
}

// ------------------------------
// Accumulation
// ------------------------------

namespace {

enum class MetaKey {
    StartTime,
    NmeaTime,
    UploadTime,
    Latitude,
    Longitude,
    Instrument,
    ColumnCount,
    RowCount,
    BadFlag,
    Interval,
    Other,
};

MetaKey recognise(const std::string& norm) {
    if (norm == "start_time" || norm == "start time") return MetaKey::StartTime;
    if (norm == "nmea utc (time)" || norm == "nmea utc") return MetaKey::NmeaTime;
    if (norm == "system upload time" || norm == "system uptime") return MetaKey::UploadTime;
    if (norm == "nmea latitude" || norm == "latitude" || norm == "lat") return MetaKey::Latitude;
    if (norm == "nmea longitude" || norm == "longitude" || norm == "lon") return MetaKey::Longitude;
    if (norm == "instrument" || norm == "instrument_id" || norm == "instrument id" ||
        norm == "serial number" || norm == "serial no" || norm == "serial no.") {
        return MetaKey::Instrument;
    }
    if (norm == "nquan") return MetaKey::ColumnCount;
    if (norm == "nvalues") return MetaKey::RowCount;
    if (norm == "bad_flag") return MetaKey::BadFlag;
    if (norm == "interval") return MetaKey::Interval;
    return MetaKey::Other;
}

class HeaderBuilder {
public:
    explicit HeaderBuilder(const std::string& source) : source_(source) {}

    void add_column(ColumnDefinition col, std::size_t line_no) {
        if (!indices_.insert(col.sensor_index).second) {
            throw CastError(ErrorKind::MalformedHeader,
                            "duplicate column index " + std::to_string(col.sensor_index), source_, line_no);
        }
        out_.columns.push_back(std::move(col));
    }

    void add_meta(const ScalarMeta& m) {
        const std::string norm = normalize_key(m.key);
        const MetaKey key = recognise(norm);

        // Typed keys share one slot whatever their spelling; the earlier value
        // of a repeated slot survives under "<key>#<n>".
        const Slot slot{key, key == MetaKey::Other ? norm : std::string()};
        auto prev = raw_.find(slot);
        if (prev != raw_.end()) {
            if (key == MetaKey::Other) out_.metadata.extra.erase(prev->second.first);
            std::size_t& n = repeats_[slot];
            ++n;
            out_.metadata.extra[prev->second.first + "#" + std::to_string(n)] = prev->second.second;
        }
        raw_[slot] = {m.key, m.value};

        switch (key) {
            case MetaKey::StartTime: start_time_ = m.value; break;
            case MetaKey::NmeaTime: nmea_time_ = m.value; break;
            case MetaKey::UploadTime: upload_time_ = m.value; break;
            case MetaKey::Latitude: out_.metadata.start_latitude = parse_coordinate(m.value, true); break;
            case MetaKey::Longitude: out_.metadata.start_longitude = parse_coordinate(m.value, false); break;
            case MetaKey::Instrument:
                if (m.value.empty()) out_.metadata.instrument_id.reset();
                else out_.metadata.instrument_id = m.value;
                break;
            case MetaKey::ColumnCount: out_.declared_columns = parse_count(m.value); break;
            case MetaKey::RowCount: out_.declared_rows = parse_count(m.value); break;
            case MetaKey::BadFlag: out_.bad_flag = internal::parse_double(m.value); break;
            case MetaKey::Interval: out_.sample_interval_s = parse_interval(m.value); break;
            case MetaKey::Other: out_.metadata.extra[m.key] = m.value; break;
        }
    }

    ParsedHeader finish(std::size_t data_line, std::size_t marker_line_no) {
        if (out_.columns.empty()) {
            throw CastError(ErrorKind::MalformedHeader, "no column declarations before *END*", source_, marker_line_no);
        }
        if (out_.declared_columns && *out_.declared_columns != out_.columns.size()) {
            std::ostringstream oss;
            oss << "header declares nquan = " << *out_.declared_columns << " but "
                << out_.columns.size() << " columns were declared";
            throw CastError(ErrorKind::MalformedHeader, oss.str(), source_, marker_line_no);
        }

        for (const std::string* text : {&start_time_, &nmea_time_, &upload_time_}) {
            if (text->empty()) continue;
            if (auto ts = parse_timestamp(drop_annotation(*text))) {
                out_.metadata.start_time = ts;
                break;
            }
        }
        // Typed keys that could not be read stay auditable.
        for (const auto& kv : raw_) {
            const MetaKey key = kv.first.first;
            bool unreadable =
                (key == MetaKey::Latitude && !out_.metadata.start_latitude) ||
                (key == MetaKey::Longitude && !out_.metadata.start_longitude) ||
                (key == MetaKey::BadFlag && !out_.bad_flag) ||
                (key == MetaKey::Interval && !out_.sample_interval_s);
            if (unreadable) out_.metadata.extra[kv.second.first] = kv.second.second;
        }
        if (!start_time_.empty() && !out_.metadata.start_time) {
            out_.metadata.extra["start_time"] = start_time_;
        }

        out_.data_line = data_line;
        return std::move(out_);
    }

private:
    const std::string& source_;
    ParsedHeader out_;
    std::set<int> indices_;
    using Slot = std::pair<MetaKey, std::string>; // normalized key only for MetaKey::Other
    std::map<Slot, std::pair<std::string, std::string>> raw_; // slot -> (key, value)
    std::map<Slot, std::size_t> repeats_;
    std::string start_time_;
    std::string nmea_time_;
    std::string upload_time_;
};

} // namespace

ParsedHeader parse_header(const std::vector<std::string>& lines, const std::string& source) {
    HeaderBuilder builder(source);

    for (std::size_t i = 0; i < lines.size(); ++i) {
        HeaderLine shape;
        try {
            shape = classify_line(lines[i]);
        } catch (const CastError& e) {
            throw CastError(e.kind(), e.detail(), source, i + 1);
        }

        if (std::holds_alternative<DataStart>(shape)) {
            return builder.finish(i + 1, i + 1);
        }
        if (auto* decl = std::get_if<ColumnDecl>(&shape)) {
            builder.add_column(std::move(decl->column), i + 1);
        } else if (auto* meta = std::get_if<ScalarMeta>(&shape)) {
            builder.add_meta(*meta);
        }
    }

    throw CastError(ErrorKind::MalformedHeader, "no *END* marker found", source, lines.size());
}

} // namespace ctdgbf
