#include "ctdgbf/dataset.hpp"

#include "ctdgbf/error.hpp"

#include <limits>
#include <set>

namespace ctdgbf {

std::string to_string(DataType t) {
    switch (t) {
        case DataType::Float64: return "float64";
        case DataType::Int8: return "int8";
        case DataType::Text: return "text";
    }
    return "unknown";
}

DataType data_type_from_string(const std::string& s) {
    if (s == "float64") return DataType::Float64;
    if (s == "int8") return DataType::Int8;
    if (s == "text") return DataType::Text;
    throw CastError(ErrorKind::Unsupported, "unknown variable type '" + s + "'");
}

// ------------------------------
// Variable
// ------------------------------

DataType Variable::type() const noexcept {
    switch (data.index()) {
        case 1: return DataType::Int8;
        case 2: return DataType::Text;
        default: return DataType::Float64;
    }
}

std::size_t Variable::size() const noexcept {
    return std::visit([](const auto& values) { return values.size(); }, data);
}

const std::vector<double>& Variable::as_float() const {
    if (auto* p = std::get_if<std::vector<double>>(&data)) return *p;
    throw CastError(ErrorKind::InvalidData, "variable '" + name + "' is not float64");
}

const std::vector<std::int8_t>& Variable::as_int8() const {
    if (auto* p = std::get_if<std::vector<std::int8_t>>(&data)) return *p;
    throw CastError(ErrorKind::InvalidData, "variable '" + name + "' is not int8");
}

const std::vector<std::string>& Variable::as_text() const {
    if (auto* p = std::get_if<std::vector<std::string>>(&data)) return *p;
    throw CastError(ErrorKind::InvalidData, "variable '" + name + "' is not text");
}

std::string Variable::attribute(const std::string& key) const {
    auto it = attributes.find(key);
    return it == attributes.end() ? std::string() : it->second;
}

Variable Variable::make_float(std::string name, std::vector<std::string> dims, std::vector<double> values, Attributes attrs) {
    Variable v;
    v.name = std::move(name);
    v.dims = std::move(dims);
    v.data = std::move(values);
    v.attributes = std::move(attrs);
    return v;
}

Variable Variable::make_int8(std::string name, std::vector<std::string> dims, std::vector<std::int8_t> values, Attributes attrs) {
    Variable v;
    v.name = std::move(name);
    v.dims = std::move(dims);
    v.data = std::move(values);
    v.attributes = std::move(attrs);
    return v;
}

Variable Variable::make_text(std::string name, std::vector<std::string> dims, std::vector<std::string> values, Attributes attrs) {
    Variable v;
    v.name = std::move(name);
    v.dims = std::move(dims);
    v.data = std::move(values);
    v.attributes = std::move(attrs);
    return v;
}

// ------------------------------
// Dataset
// ------------------------------

void Dataset::add_dimension(const std::string& name, std::size_t length) {
    if (name.empty()) throw CastError(ErrorKind::InvalidData, "dimension name is empty");
    if (length == 0) throw CastError(ErrorKind::InvalidData, "dimension '" + name + "' has zero length");
    if (has_dimension(name)) throw CastError(ErrorKind::InvalidData, "duplicate dimension '" + name + "'");
    dims_.push_back(Dimension{name, length});
}

bool Dataset::has_dimension(const std::string& name) const noexcept {
    for (const auto& d : dims_) {
        if (d.name == name) return true;
    }
    return false;
}

std::size_t Dataset::dimension_length(const std::string& name) const {
    for (const auto& d : dims_) {
        if (d.name == name) return d.length;
    }
    throw CastError(ErrorKind::NotFound, "dimension not found: " + name);
}

std::size_t Dataset::expected_size(const std::vector<std::string>& dims) const {
    std::size_t n = 1;
    for (const auto& name : dims) {
        std::size_t len = dimension_length(name);
        if (n > std::numeric_limits<std::size_t>::max() / len) {
            throw CastError(ErrorKind::InvalidData, "dimension product overflow");
        }
        n *= len;
    }
    return n;
}

void Dataset::check_variable(const Variable& v) const {
    if (v.name.empty()) throw CastError(ErrorKind::InvalidData, "variable name is empty");
    std::set<std::string> seen;
    for (const auto& d : v.dims) {
        if (!seen.insert(d).second) {
            throw CastError(ErrorKind::InvalidData, "variable '" + v.name + "' repeats dimension '" + d + "'");
        }
    }
    const std::size_t expected = expected_size(v.dims);
    if (v.size() != expected) {
        throw CastError(ErrorKind::InvalidData,
                        "variable '" + v.name + "' has " + std::to_string(v.size()) +
                        " values, its dimensions require " + std::to_string(expected));
    }
}

std::ptrdiff_t Dataset::index_of(const std::string& name) const noexcept {
    for (std::size_t i = 0; i < vars_.size(); ++i) {
        if (vars_[i].name == name) return static_cast<std::ptrdiff_t>(i);
    }
    return -1;
}

void Dataset::add_variable(Variable v) {
    check_variable(v);
    if (index_of(v.name) >= 0) throw CastError(ErrorKind::InvalidData, "duplicate variable '" + v.name + "'");
    vars_.push_back(std::move(v));
}

void Dataset::commit(std::vector<Variable> batch, bool replace_existing) {
    std::set<std::string> names;
    for (const auto& v : batch) {
        check_variable(v);
        if (!names.insert(v.name).second) {
            throw CastError(ErrorKind::InvalidData, "variable '" + v.name + "' appears twice in one commit");
        }
        if (!replace_existing && index_of(v.name) >= 0) {
            throw CastError(ErrorKind::InvalidData, "variable '" + v.name + "' already exists");
        }
    }
    for (auto& v : batch) {
        std::ptrdiff_t idx = index_of(v.name);
        if (idx >= 0) vars_[static_cast<std::size_t>(idx)] = std::move(v);
        else vars_.push_back(std::move(v));
    }
}

bool Dataset::has_variable(const std::string& name) const noexcept {
    return index_of(name) >= 0;
}

const Variable& Dataset::variable(const std::string& name) const {
    std::ptrdiff_t idx = index_of(name);
    if (idx < 0) throw CastError(ErrorKind::NotFound, "variable not found: " + name);
    return vars_[static_cast<std::size_t>(idx)];
}

void Dataset::validate() const {
    std::set<std::string> names;
    for (const auto& v : vars_) {
        check_variable(v);
        if (!names.insert(v.name).second) {
            throw CastError(ErrorKind::InvalidData, "duplicate variable '" + v.name + "'");
        }
        if (v.type() == DataType::Float64 && v.attributes.count("units") == 0) {
            throw CastError(ErrorKind::InvalidData, "variable '" + v.name + "' has no units attribute");
        }
    }
}

} // namespace ctdgbf
