#include "json.hpp"

#include <cmath>
#include <cstring>
#include <iomanip>
#include <locale>
#include <sstream>

namespace ctdgbf::internal {

namespace {

class JsonParser {
public:
    JsonParser(std::string_view s, ErrorKind kind) : s_(s), kind_(kind) {}

    Json parse() {
        skip_ws();
        Json out = parse_value();
        skip_ws();
        if (pos_ != s_.size()) fail("trailing data in JSON");
        return out;
    }

private:
    std::string_view s_;
    ErrorKind kind_;
    std::size_t pos_{0};
    int depth_{0};

    static constexpr int kMaxDepth = 64;

    [[noreturn]] void fail(const std::string& what) const {
        throw CastError(kind_, what + " at offset " + std::to_string(pos_));
    }

    void skip_ws() {
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
                ++pos_;
                continue;
            }
            break;
        }
    }

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    char get() {
        if (pos_ >= s_.size()) fail("unexpected end of JSON");
        return s_[pos_++];
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp <= 0x7F) {
            out.push_back(static_cast<char>(cp));
        } else if (cp <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    unsigned parse_hex4() {
        unsigned v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = get();
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(10 + (c - 'a'));
            else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(10 + (c - 'A'));
            else fail("invalid \\u escape");
        }
        return v;
    }

    // opening quote already consumed
    std::string parse_string() {
        std::string out;
        while (true) {
            char c = get();
            if (c == '"') break;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            char e = get();
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned u = parse_hex4();
                    if (u >= 0xD800 && u <= 0xDBFF) {
                        if (get() != '\\' || get() != 'u') fail("invalid surrogate pair");
                        unsigned u2 = parse_hex4();
                        if (u2 < 0xDC00 || u2 > 0xDFFF) fail("invalid surrogate pair");
                        append_utf8(out, 0x10000 + (((u - 0xD800) << 10) | (u2 - 0xDC00)));
                    } else {
                        append_utf8(out, u);
                    }
                    break;
                }
                default:
                    fail("invalid escape in JSON string");
            }
        }
        return out;
    }

    Json parse_number() {
        std::size_t start = pos_;
        if (peek() == '-') ++pos_;
        bool has_dot = false;
        bool has_exp = false;
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c >= '0' && c <= '9') { ++pos_; continue; }
            if (c == '.') { has_dot = true; ++pos_; continue; }
            if (c == 'e' || c == 'E') {
                has_exp = true; ++pos_;
                if (peek() == '+' || peek() == '-') ++pos_;
                continue;
            }
            break;
        }
        std::string raw(s_.substr(start, pos_ - start));
        if (raw.empty() || raw == "-") fail("invalid number in JSON");

        std::istringstream iss(raw);
        iss.imbue(std::locale::classic());
        double v = 0.0;
        iss >> v;
        if (iss.fail() || !iss.eof()) fail("invalid number in JSON");

        JsonNumber n;
        n.raw = std::move(raw);
        n.value = v;
        n.is_int = !(has_dot || has_exp);
        return Json{n};
    }

    Json parse_array() {
        Json::Array arr;
        skip_ws();
        if (peek() == ']') {
            get();
            return Json{arr};
        }
        while (true) {
            skip_ws();
            arr.push_back(parse_value());
            skip_ws();
            char c = get();
            if (c == ']') break;
            if (c != ',') fail("expected ',' in array");
        }
        return Json{arr};
    }

    Json parse_object() {
        Json::Object obj;
        skip_ws();
        if (peek() == '}') {
            get();
            return Json{obj};
        }
        while (true) {
            skip_ws();
            if (get() != '"') fail("expected string key");
            std::string key = parse_string();
            skip_ws();
            if (get() != ':') fail("expected ':' in object");
            skip_ws();
            obj.insert_or_assign(std::move(key), parse_value());
            skip_ws();
            char c = get();
            if (c == '}') break;
            if (c != ',') fail("expected ',' in object");
        }
        return Json{obj};
    }

    Json parse_value() {
        skip_ws();
        if (++depth_ > kMaxDepth) fail("JSON nested too deeply");
        Json out;
        char c = peek();
        if (c == '"') { get(); out = Json{parse_string()}; }
        else if (c == '{') { get(); out = parse_object(); }
        else if (c == '[') { get(); out = parse_array(); }
        else if (c == 't') { expect("true"); out = Json{true}; }
        else if (c == 'f') { expect("false"); out = Json{false}; }
        else if (c == 'n') { expect("null"); out = Json{nullptr}; }
        else out = parse_number();
        --depth_;
        return out;
    }

    void expect(const char* lit) {
        std::size_t n = std::strlen(lit);
        if (pos_ + n > s_.size() || s_.substr(pos_, n) != lit) {
            fail(std::string("expected '") + lit + "'");
        }
        pos_ += n;
    }
};

void escape_string(std::ostream& os, const std::string& s) {
    os << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) {
                    os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setw(0);
                } else {
                    os << static_cast<char>(c);
                }
        }
    }
    os << '"';
}

void serialize(std::ostream& os, const Json& j) {
    if (j.is_null()) {
        os << "null";
    } else if (j.is_bool()) {
        os << (j.as_bool() ? "true" : "false");
    } else if (j.is_number()) {
        os << j.as_number().raw;
    } else if (j.is_string()) {
        escape_string(os, j.as_string());
    } else if (j.is_array()) {
        os << '[';
        const auto& arr = j.as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (i) os << ',';
            serialize(os, arr[i]);
        }
        os << ']';
    } else {
        os << '{';
        bool first = true;
        for (const auto& kv : j.as_object()) {
            if (!first) os << ',';
            first = false;
            escape_string(os, kv.first);
            os << ':';
            serialize(os, kv.second);
        }
        os << '}';
    }
}

} // namespace

Json parse_json(std::string_view text, ErrorKind error_kind) {
    return JsonParser(text, error_kind).parse();
}

std::string dump_compact(const Json& j) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    serialize(oss, j);
    return oss.str();
}

Json json_u64(std::uint64_t v) {
    JsonNumber n;
    n.is_int = true;
    n.value = static_cast<double>(v);
    n.raw = std::to_string(v);
    return Json{n};
}

Json json_str(const std::string& s) { return Json{s}; }

const Json* obj_get(const Json::Object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return nullptr;
    return &it->second;
}

std::optional<std::uint64_t> u64_from_json(const Json& j) {
    if (!j.is_number()) return std::nullopt;
    const auto& n = j.as_number();
    if (n.is_int && !n.raw.empty() && n.raw[0] != '-') {
        std::uint64_t v = 0;
        for (char c : n.raw) {
            std::uint64_t d = static_cast<std::uint64_t>(c - '0');
            if (v > (UINT64_MAX - d) / 10) return std::nullopt;
            v = v * 10 + d;
        }
        return v;
    }
    if (!std::isfinite(n.value) || n.value < 0.0 || std::floor(n.value) != n.value) return std::nullopt;
    if (n.value >= 18446744073709551616.0) return std::nullopt;
    return static_cast<std::uint64_t>(n.value);
}

std::optional<double> double_from_json(const Json& j) {
    if (!j.is_number()) return std::nullopt;
    double v = j.as_number().value;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

std::string str_from_json(const Json& j) {
    if (j.is_string()) return j.as_string();
    return {};
}

bool bool_from_json(const Json& j, bool def) {
    if (j.is_bool()) return j.as_bool();
    return def;
}

} // namespace ctdgbf::internal
