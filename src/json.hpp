#pragma once

#include "ctdgbf/error.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ctdgbf::internal {

// ------------------------------
// Small JSON
// ------------------------------

struct JsonNumber {
    std::string raw;
    double value = 0.0;
    bool is_int = false;
};

struct Json {
    using Array = std::vector<Json>;
    using Object = std::map<std::string, Json>;

    std::variant<std::nullptr_t, bool, JsonNumber, std::string, Array, Object> v;

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
    bool is_object() const { return std::holds_alternative<Object>(v); }
    bool is_array() const { return std::holds_alternative<Array>(v); }
    bool is_string() const { return std::holds_alternative<std::string>(v); }
    bool is_bool() const { return std::holds_alternative<bool>(v); }
    bool is_number() const { return std::holds_alternative<JsonNumber>(v); }
    const Object& as_object() const { return std::get<Object>(v); }
    const Array& as_array() const { return std::get<Array>(v); }
    const std::string& as_string() const { return std::get<std::string>(v); }
    bool as_bool() const { return std::get<bool>(v); }
    const JsonNumber& as_number() const { return std::get<JsonNumber>(v); }
};

/// Parse errors are raised as CastError of `error_kind`.
Json parse_json(std::string_view text, ErrorKind error_kind = ErrorKind::HeaderJsonParse);

std::string dump_compact(const Json& j);

Json json_u64(std::uint64_t v);
Json json_str(const std::string& s);

const Json* obj_get(const Json::Object& obj, const char* key);

std::optional<std::uint64_t> u64_from_json(const Json& j);
std::optional<double> double_from_json(const Json& j);
std::string str_from_json(const Json& j);
bool bool_from_json(const Json& j, bool def = false);

} // namespace ctdgbf::internal
