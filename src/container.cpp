#include "ctdgbf/container.hpp"

#include "ctdgbf/error.hpp"
#include "ctdgbf/timefmt.hpp"
#include "json.hpp"

#include <array>
#include <chrono>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>

#include <zlib.h>

namespace ctdgbf {

using internal::Json;

// ------------------------------
// Small helpers
// ------------------------------

static constexpr char kMagic[8] = {'C', 'T', 'D', 'G', 'B', 'F', '\0', '\0'};
static constexpr std::uint32_t kMaxHeaderLen  = 64u * 1024u * 1024u; // 64MB
static constexpr std::uint64_t kMaxVarUsize   = 16ull * 1024ull * 1024ull * 1024ull; // 16 GiB
static constexpr std::uint64_t kMaxVarCsize   = 16ull * 1024ull * 1024ull * 1024ull; // 16 GiB

static bool checked_add_u64(std::uint64_t a, std::uint64_t b, std::uint64_t& out) {
    if (a > (std::numeric_limits<std::uint64_t>::max)() - b) return false;
    out = a + b;
    return true;
}

static std::uint32_t read_u32_le(std::istream& is) {
    std::array<unsigned char, 4> b{};
    is.read(reinterpret_cast<char*>(b.data()), 4);
    if (!is) throw CastError(ErrorKind::Truncated, "unexpected EOF while reading u32");
    return (static_cast<std::uint32_t>(b[0])      ) |
           (static_cast<std::uint32_t>(b[1]) <<  8) |
           (static_cast<std::uint32_t>(b[2]) << 16) |
           (static_cast<std::uint32_t>(b[3]) << 24);
}

static void write_u32_le(std::ostream& os, std::uint32_t v) {
    unsigned char b[4] = {
        static_cast<unsigned char>(v & 0xFFu),
        static_cast<unsigned char>((v >> 8) & 0xFFu),
        static_cast<unsigned char>((v >> 16) & 0xFFu),
        static_cast<unsigned char>((v >> 24) & 0xFFu),
    };
    os.write(reinterpret_cast<const char*>(b), 4);
}

static void append_u32_le(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
}

static std::uint32_t read_u32_le_from(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0])      ) |
           (static_cast<std::uint32_t>(p[1]) <<  8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

static std::string upper_hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static std::optional<std::uint32_t> parse_hex_u32(const std::string& s) {
    if (s.empty() || s.size() > 8) return std::nullopt;
    std::uint32_t v = 0;
    for (char c : s) {
        int d = 0;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = 10 + (c - 'a');
        else if (c >= 'A' && c <= 'F') d = 10 + (c - 'A');
        else return std::nullopt;
        v = (v << 4) | static_cast<std::uint32_t>(d);
    }
    return v;
}

// Replace the top-level "header_crc32_hex" value in-place with all '0's (keeping length).
// Attributes may carry the same key further down, so only depth 1 counts.
static void zero_out_header_crc_value(std::string& json) {
    const std::string key = "\"header_crc32_hex\"";
    int depth = 0;
    for (std::size_t i = 0; i < json.size(); ++i) {
        const char c = json[i];
        if (c == '{' || c == '[') { ++depth; continue; }
        if (c == '}' || c == ']') { --depth; continue; }
        if (c != '"') continue;

        if (depth == 1 && json.compare(i, key.size(), key) == 0) {
            std::size_t j = i + key.size();
            while (j < json.size() && std::isspace(static_cast<unsigned char>(json[j]))) ++j;
            if (j < json.size() && json[j] == ':') {
                auto q1 = json.find('"', j);
                if (q1 == std::string::npos) return;
                auto q2 = json.find('"', q1 + 1);
                if (q2 == std::string::npos) return;
                for (std::size_t k = q1 + 1; k < q2; ++k) json[k] = '0';
                return;
            }
        }
        // skip the rest of this string
        for (++i; i < json.size() && json[i] != '"'; ++i) {
            if (json[i] == '\\') ++i;
        }
    }
}

static std::uint32_t crc32_bytes(const std::uint8_t* data, std::size_t len) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(len));
    return static_cast<std::uint32_t>(crc);
}

static std::uint32_t crc32_zeroed_header(const std::string& header_json_raw) {
    std::string tmp = header_json_raw;
    zero_out_header_crc_value(tmp);
    return crc32_bytes(reinterpret_cast<const std::uint8_t*>(tmp.data()), tmp.size());
}

static std::vector<std::uint8_t> zlib_compress(const std::vector<std::uint8_t>& in, int level) {
    if (in.empty()) return {};
    uLongf bound = ::compressBound(static_cast<uLong>(in.size()));
    std::vector<std::uint8_t> out(bound);
    uLongf out_len = bound;
    int rc = ::compress2(reinterpret_cast<Bytef*>(out.data()), &out_len,
                         reinterpret_cast<const Bytef*>(in.data()),
                         static_cast<uLong>(in.size()),
                         level);
    if (rc != Z_OK) throw CastError(ErrorKind::ZlibError, "zlib compress2 failed");
    out.resize(static_cast<std::size_t>(out_len));
    return out;
}

static std::vector<std::uint8_t> zlib_decompress(const std::vector<std::uint8_t>& in, std::size_t usize) {
    if (usize == 0) return {};
    std::vector<std::uint8_t> out(usize);
    uLongf out_len = static_cast<uLongf>(usize);
    int rc = ::uncompress(reinterpret_cast<Bytef*>(out.data()), &out_len,
                          reinterpret_cast<const Bytef*>(in.data()),
                          static_cast<uLong>(in.size()));
    if (rc != Z_OK || static_cast<std::size_t>(out_len) != usize) {
        throw CastError(ErrorKind::ZlibError, "zlib uncompress failed");
    }
    return out;
}

static std::string now_utc() {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return format_iso8601(static_cast<double>(now.time_since_epoch().count()));
}

std::string to_string(CompressionMode m) {
    switch (m) {
        case CompressionMode::Never: return "never";
        case CompressionMode::Always: return "always";
        case CompressionMode::Auto: return "auto";
    }
    return "auto";
}

CompressionMode compression_mode_from_string(const std::string& s) {
    if (s == "never") return CompressionMode::Never;
    if (s == "always") return CompressionMode::Always;
    if (s == "auto") return CompressionMode::Auto;
    throw CastError(ErrorKind::Config, "unknown compression mode '" + s + "' (never|always|auto)");
}

const VariableMeta* ContainerHeader::find(const std::string& name) const {
    for (const auto& v : variables) {
        if (v.name == name) return &v;
    }
    return nullptr;
}

// ------------------------------
// Header parse/build
// ------------------------------

static std::uint64_t required_u64(const Json::Object& obj, const char* key, const std::string& where) {
    const Json* v = internal::obj_get(obj, key);
    auto n = v ? internal::u64_from_json(*v) : std::nullopt;
    if (!n) throw CastError(ErrorKind::HeaderJsonParse, where + ": missing or invalid '" + key + "'");
    return *n;
}

static Attributes attributes_from_json(const Json* j) {
    Attributes out;
    if (!j || !j->is_object()) return out;
    for (const auto& kv : j->as_object()) out[kv.first] = internal::str_from_json(kv.second);
    return out;
}

static ContainerHeader parse_container_header(const std::string& raw_json) {
    Json root = internal::parse_json(raw_json, ErrorKind::HeaderJsonParse);
    if (!root.is_object()) throw CastError(ErrorKind::HeaderJsonParse, "header JSON is not an object");

    const auto& obj = root.as_object();
    ContainerHeader h;
    using internal::obj_get;
    using internal::str_from_json;

    if (auto* v = obj_get(obj, "format")) h.format = str_from_json(*v);
    if (auto* v = obj_get(obj, "magic")) h.magic = str_from_json(*v);
    if (auto* v = obj_get(obj, "version")) h.version = static_cast<int>(internal::u64_from_json(*v).value_or(0));
    if (auto* v = obj_get(obj, "endianness")) h.endianness = str_from_json(*v);
    if (auto* v = obj_get(obj, "created_utc")) h.created_utc = str_from_json(*v);
    if (auto* v = obj_get(obj, "header_crc32_hex")) h.header_crc32_hex = str_from_json(*v);
    h.payload_start = required_u64(obj, "payload_start", "header");
    h.file_size = required_u64(obj, "file_size", "header");

    if (h.version != 1) {
        throw CastError(ErrorKind::Unsupported, "unsupported container version " + std::to_string(h.version));
    }
    if (h.endianness != "little") {
        throw CastError(ErrorKind::Unsupported, "unsupported endianness '" + h.endianness + "'");
    }

    if (auto* dv = obj_get(obj, "dimensions"); dv && dv->is_array()) {
        for (const auto& dj : dv->as_array()) {
            if (!dj.is_object()) throw CastError(ErrorKind::HeaderJsonParse, "dimension entry is not an object");
            Dimension d;
            if (auto* x = obj_get(dj.as_object(), "name")) d.name = str_from_json(*x);
            d.length = static_cast<std::size_t>(required_u64(dj.as_object(), "length", "dimension '" + d.name + "'"));
            h.dimensions.push_back(std::move(d));
        }
    }
    h.global_attributes = attributes_from_json(obj_get(obj, "global_attributes"));

    if (auto* vv = obj_get(obj, "variables"); vv && vv->is_array()) {
        for (const auto& vj : vv->as_array()) {
            if (!vj.is_object()) throw CastError(ErrorKind::HeaderJsonParse, "variable entry is not an object");
            const auto& vo = vj.as_object();
            VariableMeta m;
            if (auto* x = obj_get(vo, "name")) m.name = str_from_json(*x);
            const std::string where = "variable '" + m.name + "'";
            if (auto* x = obj_get(vo, "type")) m.type = data_type_from_string(str_from_json(*x));
            if (auto* x = obj_get(vo, "dims"); x && x->is_array()) {
                for (const auto& d : x->as_array()) m.dims.push_back(str_from_json(d));
            }
            m.attributes = attributes_from_json(obj_get(vo, "attributes"));
            if (auto* x = obj_get(vo, "compression")) m.compression = str_from_json(*x);
            m.offset = required_u64(vo, "offset", where);
            m.csize = required_u64(vo, "csize", where);
            m.usize = required_u64(vo, "usize", where);
            m.crc32 = static_cast<std::uint32_t>(required_u64(vo, "crc32", where) & 0xFFFFFFFFu);
            if (m.compression != "none" && m.compression != "zlib") {
                throw CastError(ErrorKind::Unsupported, where + ": unknown compression '" + m.compression + "'");
            }
            h.variables.push_back(std::move(m));
        }
    }
    return h;
}

static Json attributes_to_json(const Attributes& attrs) {
    Json::Object o;
    for (const auto& kv : attrs) o.emplace(kv.first, internal::json_str(kv.second));
    return Json{o};
}

static Json header_to_json(const ContainerHeader& h, bool crc_zeroed) {
    using internal::json_str;
    using internal::json_u64;

    Json::Object obj;
    obj.emplace("format", json_str(h.format));
    obj.emplace("magic", json_str(h.magic));
    obj.emplace("version", json_u64(static_cast<std::uint64_t>(h.version)));
    obj.emplace("endianness", json_str(h.endianness));
    if (!h.created_utc.empty()) obj.emplace("created_utc", json_str(h.created_utc));

    Json::Array dims;
    for (const auto& d : h.dimensions) {
        Json::Object dobj;
        dobj.emplace("name", json_str(d.name));
        dobj.emplace("length", json_u64(d.length));
        dims.push_back(Json{dobj});
    }
    obj.emplace("dimensions", Json{dims});
    obj.emplace("global_attributes", attributes_to_json(h.global_attributes));

    Json::Array vars;
    vars.reserve(h.variables.size());
    for (const auto& m : h.variables) {
        Json::Object vo;
        vo.emplace("name", json_str(m.name));
        vo.emplace("type", json_str(to_string(m.type)));
        Json::Array vdims;
        for (const auto& d : m.dims) vdims.push_back(json_str(d));
        vo.emplace("dims", Json{vdims});
        vo.emplace("attributes", attributes_to_json(m.attributes));
        vo.emplace("compression", json_str(m.compression));
        vo.emplace("offset", json_u64(m.offset));
        vo.emplace("csize", json_u64(m.csize));
        vo.emplace("usize", json_u64(m.usize));
        vo.emplace("crc32", json_u64(m.crc32));
        vars.push_back(Json{vo});
    }
    obj.emplace("variables", Json{vars});

    obj.emplace("payload_start", json_u64(h.payload_start));
    obj.emplace("file_size", json_u64(h.file_size));
    obj.emplace("header_crc32_hex", json_str(crc_zeroed ? "00000000" : h.header_crc32_hex));
    return Json{obj};
}

// ------------------------------
// Variable <-> bytes encoding
// ------------------------------

static std::vector<std::uint8_t> encode_variable(const Variable& v) {
    std::vector<std::uint8_t> out;
    switch (v.type()) {
        case DataType::Float64: {
            const auto& values = v.as_float();
            out.reserve(values.size() * 8);
            for (double d : values) {
                std::uint64_t u = 0;
                std::memcpy(&u, &d, sizeof(u));
                for (int i = 0; i < 8; ++i) out.push_back(static_cast<std::uint8_t>((u >> (8 * i)) & 0xFFu));
            }
            break;
        }
        case DataType::Int8: {
            const auto& values = v.as_int8();
            out.reserve(values.size());
            for (std::int8_t x : values) out.push_back(static_cast<std::uint8_t>(x));
            break;
        }
        case DataType::Text: {
            // Per element: [u32 len][utf-8 bytes]
            for (const auto& s : v.as_text()) {
                if (s.size() > (std::numeric_limits<std::uint32_t>::max)()) {
                    throw CastError(ErrorKind::InvalidData, "text element too long in '" + v.name + "'");
                }
                append_u32_le(out, static_cast<std::uint32_t>(s.size()));
                out.insert(out.end(), s.begin(), s.end());
            }
            break;
        }
    }
    return out;
}

static Variable decode_variable(const VariableMeta& meta, std::size_t n, const std::vector<std::uint8_t>& bytes) {
    Variable v;
    v.name = meta.name;
    v.dims = meta.dims;
    v.attributes = meta.attributes;

    switch (meta.type) {
        case DataType::Float64: {
            if (bytes.size() / 8 != n || bytes.size() % 8 != 0) {
                throw CastError(ErrorKind::InvalidData, "float64 payload size does not match dimensions for '" + meta.name + "'");
            }
            std::vector<double> values(n);
            for (std::size_t i = 0; i < n; ++i) {
                std::uint64_t u = 0;
                for (int b = 0; b < 8; ++b) u |= static_cast<std::uint64_t>(bytes[i * 8 + static_cast<std::size_t>(b)]) << (8 * b);
                std::memcpy(&values[i], &u, sizeof(u));
            }
            v.data = std::move(values);
            break;
        }
        case DataType::Int8: {
            if (bytes.size() != n) {
                throw CastError(ErrorKind::InvalidData, "int8 payload size does not match dimensions for '" + meta.name + "'");
            }
            std::vector<std::int8_t> values(n);
            for (std::size_t i = 0; i < n; ++i) values[i] = static_cast<std::int8_t>(bytes[i]);
            v.data = std::move(values);
            break;
        }
        case DataType::Text: {
            std::vector<std::string> values;
            values.reserve(n);
            std::size_t pos = 0;
            for (std::size_t i = 0; i < n; ++i) {
                if (pos + 4 > bytes.size()) throw CastError(ErrorKind::Truncated, "truncated text payload in '" + meta.name + "'");
                std::uint32_t len = read_u32_le_from(&bytes[pos]);
                pos += 4;
                if (len > bytes.size() - pos) throw CastError(ErrorKind::Truncated, "truncated text payload in '" + meta.name + "'");
                values.emplace_back(reinterpret_cast<const char*>(bytes.data() + pos), len);
                pos += len;
            }
            if (pos != bytes.size()) {
                throw CastError(ErrorKind::InvalidData, "trailing bytes in text payload of '" + meta.name + "'");
            }
            v.data = std::move(values);
            break;
        }
    }
    return v;
}

// ------------------------------
// Reading
// ------------------------------

static std::pair<Schema, std::string> read_header_only(std::ifstream& is, const std::filesystem::path& file,
                                                       const ReadOptions& opts) {
    std::array<char, 8> magic{};
    is.read(magic.data(), magic.size());
    if (!is) throw CastError(ErrorKind::Truncated, "unexpected EOF reading magic");
    if (std::memcmp(magic.data(), kMagic, sizeof(kMagic)) != 0) {
        std::string shown(magic.data(), magic.size());
        while (!shown.empty() && shown.back() == '\0') shown.pop_back();
        throw CastError(ErrorKind::BadMagic, "bad magic: '" + shown + "'");
    }

    Schema schema;
    schema.header_len = read_u32_le(is);
    if (schema.header_len == 0 || schema.header_len > kMaxHeaderLen) {
        throw CastError(ErrorKind::InvalidData, "unreasonable header length");
    }
    std::string raw_json(schema.header_len, '\0');
    is.read(&raw_json[0], schema.header_len);
    if (!is) throw CastError(ErrorKind::Truncated, "unexpected EOF reading header JSON");

    schema.header = parse_container_header(raw_json);
    ContainerHeader& hdr = schema.header;

    const std::uint64_t framed_start = 8ull + 4ull + static_cast<std::uint64_t>(schema.header_len);
    if (hdr.payload_start != framed_start) {
        throw CastError(ErrorKind::InvalidData, "payload_start does not match the header length");
    }
    std::error_code ec;
    const std::uint64_t actual_size = static_cast<std::uint64_t>(std::filesystem::file_size(file, ec));
    if (ec) throw CastError(ErrorKind::Io, "cannot stat file: " + ec.message());
    if (actual_size < hdr.file_size) {
        throw CastError(ErrorKind::Truncated, "file is shorter than its header declares");
    }

    if (opts.validate) {
        auto expected = parse_hex_u32(hdr.header_crc32_hex);
        std::uint32_t got = crc32_zeroed_header(raw_json);
        if (!expected || *expected != got) {
            std::ostringstream oss;
            oss << "header CRC mismatch: expected " << hdr.header_crc32_hex << ", got " << upper_hex8(got);
            throw CastError(ErrorKind::HeaderCrcMismatch, oss.str());
        }
    }
    return {std::move(schema), std::move(raw_json)};
}

static std::vector<std::uint8_t> read_variable_payload(std::ifstream& is, const ContainerHeader& hdr,
                                                       const VariableMeta& m, const ReadOptions& opts) {
    if (m.usize > kMaxVarUsize || m.csize > kMaxVarCsize) {
        throw CastError(ErrorKind::InvalidData, "variable '" + m.name + "' exceeds size limits");
    }
    if (m.csize == 0) {
        if (m.usize != 0) throw CastError(ErrorKind::InvalidData, "variable '" + m.name + "' has no stored bytes");
        return {};
    }

    std::uint64_t pos = 0;
    std::uint64_t end = 0;
    if (!checked_add_u64(hdr.payload_start, m.offset, pos) || !checked_add_u64(pos, m.csize, end)) {
        throw CastError(ErrorKind::InvalidData, "payload offset overflow");
    }
    if (end > hdr.file_size) {
        throw CastError(ErrorKind::Truncated, "variable '" + m.name + "' exceeds file bounds");
    }
    is.seekg(static_cast<std::streamoff>(pos), std::ios::beg);
    if (!is) throw CastError(ErrorKind::Io, "seek failed while reading payload");

    std::vector<std::uint8_t> chunk(static_cast<std::size_t>(m.csize));
    is.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    if (!is) throw CastError(ErrorKind::Truncated, "unexpected EOF reading variable '" + m.name + "'");

    std::vector<std::uint8_t> raw;
    if (m.compression == "zlib") {
        raw = zlib_decompress(chunk, static_cast<std::size_t>(m.usize));
    } else {
        raw = std::move(chunk);
        if (raw.size() != static_cast<std::size_t>(m.usize)) {
            throw CastError(ErrorKind::InvalidData, "variable '" + m.name + "' usize does not match csize");
        }
    }

    if (opts.validate && m.crc32 != 0) {
        std::uint32_t got = crc32_bytes(raw.data(), raw.size());
        if (got != m.crc32) {
            std::ostringstream oss;
            oss << "CRC mismatch for '" << m.name << "': expected " << upper_hex8(m.crc32) << ", got " << upper_hex8(got);
            throw CastError(ErrorKind::FieldCrcMismatch, oss.str());
        }
    }
    return raw;
}

static std::ifstream open_for_read(const std::filesystem::path& file) {
    std::ifstream is(file, std::ios::binary);
    if (!is) throw CastError(ErrorKind::Io, "failed to open file", file.string());
    return is;
}

// Empty dataset shell carrying the header's dimensions, for shape checks.
static Dataset shell_of(const ContainerHeader& hdr) {
    Dataset ds;
    for (const auto& d : hdr.dimensions) ds.add_dimension(d.name, d.length);
    ds.global_attributes() = hdr.global_attributes;
    return ds;
}

Schema read_schema(const std::filesystem::path& file, const ReadOptions& opts) {
    std::ifstream is = open_for_read(file);
    try {
        return read_header_only(is, file, opts).first;
    } catch (const CastError& e) {
        throw e.with_source(file.string());
    }
}

Dataset read_dataset(const std::filesystem::path& file, const ReadOptions& opts) {
    std::ifstream is = open_for_read(file);
    try {
        Schema schema = read_header_only(is, file, opts).first;
        Dataset ds = shell_of(schema.header);
        for (const auto& m : schema.header.variables) {
            std::vector<std::uint8_t> payload = read_variable_payload(is, schema.header, m, opts);
            ds.add_variable(decode_variable(m, ds.expected_size(m.dims), payload));
        }
        return ds;
    } catch (const CastError& e) {
        throw e.with_source(file.string());
    }
}

Variable read_variable(const std::filesystem::path& file, const std::string& name, const ReadOptions& opts) {
    std::ifstream is = open_for_read(file);
    try {
        Schema schema = read_header_only(is, file, opts).first;
        const VariableMeta* m = schema.header.find(name);
        if (!m) throw CastError(ErrorKind::NotFound, "variable not found: " + name);
        Dataset shell = shell_of(schema.header);
        std::vector<std::uint8_t> payload = read_variable_payload(is, schema.header, *m, opts);
        Variable v = decode_variable(*m, shell.expected_size(m->dims), payload);
        return v;
    } catch (const CastError& e) {
        throw e.with_source(file.string());
    }
}

// ------------------------------
// Writing
// ------------------------------

static void write_bytes(const std::filesystem::path& file, std::uint32_t header_len,
                        const std::string& header_json, const std::vector<std::uint8_t>& payload) {
    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) throw CastError(ErrorKind::Io, "failed to open for write", file.string());
    os.write(kMagic, sizeof(kMagic));
    write_u32_le(os, header_len);
    os.write(header_json.data(), static_cast<std::streamsize>(header_json.size()));
    if (!payload.empty()) {
        os.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    }
    os.flush();
    if (!os) throw CastError(ErrorKind::Io, "failed writing container", file.string());
}

void write_dataset(const std::filesystem::path& file, const Dataset& ds, const WriteOptions& opts) {
    ds.validate();

    ContainerHeader hdr;
    hdr.created_utc = now_utc();
    hdr.dimensions = ds.dimensions();
    hdr.global_attributes = ds.global_attributes();

    std::vector<std::uint8_t> payload;
    std::uint64_t payload_off = 0;
    hdr.variables.reserve(ds.variables().size());

    for (const auto& v : ds.variables()) {
        VariableMeta meta;
        meta.name = v.name;
        meta.type = v.type();
        meta.dims = v.dims;
        meta.attributes = v.attributes;

        std::vector<std::uint8_t> raw = encode_variable(v);
        meta.usize = static_cast<std::uint64_t>(raw.size());
        if (opts.include_crc32 && !raw.empty()) meta.crc32 = crc32_bytes(raw.data(), raw.size());

        std::vector<std::uint8_t> stored = std::move(raw);
        if (!stored.empty() && opts.compression != CompressionMode::Never) {
            std::vector<std::uint8_t> comp = zlib_compress(stored, opts.zlib_level);
            if (opts.compression == CompressionMode::Always || comp.size() < stored.size()) {
                stored = std::move(comp);
                meta.compression = "zlib";
            }
        }

        meta.csize = static_cast<std::uint64_t>(stored.size());
        meta.offset = meta.csize == 0 ? 0 : payload_off;
        payload_off += meta.csize;
        payload.insert(payload.end(), stored.begin(), stored.end());
        hdr.variables.push_back(std::move(meta));
    }

    // payload_start and file_size depend on the header length; the zeroed CRC
    // value is fixed width, so the fixpoint also holds for the final text.
    std::string header_json;
    std::uint32_t header_len = 0;
    for (int iter = 0; iter < 8; ++iter) {
        header_json = internal::dump_compact(header_to_json(hdr, /*crc_zeroed=*/true));
        if (header_json.size() > kMaxHeaderLen) throw CastError(ErrorKind::InvalidData, "header too large");
        header_len = static_cast<std::uint32_t>(header_json.size());

        std::uint64_t new_payload_start = 8ull + 4ull + static_cast<std::uint64_t>(header_len);
        std::uint64_t new_file_size = new_payload_start + static_cast<std::uint64_t>(payload.size());
        if (hdr.payload_start == new_payload_start && hdr.file_size == new_file_size) break;
        hdr.payload_start = new_payload_start;
        hdr.file_size = new_file_size;
    }
    hdr.header_crc32_hex = upper_hex8(crc32_zeroed_header(header_json));
    const std::string header_final = internal::dump_compact(header_to_json(hdr, /*crc_zeroed=*/false));

    std::filesystem::path tmp = file;
    tmp += ".tmp";
    try {
        write_bytes(tmp, header_len, header_final, payload);
        std::error_code ec;
        std::filesystem::rename(tmp, file, ec);
        if (ec) throw CastError(ErrorKind::Io, "cannot move temporary file into place: " + ec.message(), file.string());
    } catch (const CastError&) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw;
    }
}

} // namespace ctdgbf
