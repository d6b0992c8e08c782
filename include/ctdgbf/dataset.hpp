#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace ctdgbf {

// ------------------------------
// Canonical dataset
// ------------------------------

enum class DataType {
    Float64,
    Int8,
    Text,
};

std::string to_string(DataType t);
DataType data_type_from_string(const std::string& s);

struct Dimension {
    std::string name{};
    std::size_t length{0};
};

using Attributes = std::map<std::string, std::string>;

struct Variable {
    using Data = std::variant<
        std::vector<double>,       // measurements and coordinates; NaN = missing
        std::vector<std::int8_t>,  // QC flags
        std::vector<std::string>   // labels
    >;

    std::string name{};
    std::vector<std::string> dims{};
    Attributes attributes{};
    Data data{std::vector<double>{}};

    DataType type() const noexcept;
    std::size_t size() const noexcept;

    const std::vector<double>& as_float() const;
    const std::vector<std::int8_t>& as_int8() const;
    const std::vector<std::string>& as_text() const;

    // Attribute lookup returning "" when absent.
    std::string attribute(const std::string& key) const;

    static Variable make_float(std::string name, std::vector<std::string> dims, std::vector<double> values, Attributes attrs = {});
    static Variable make_int8(std::string name, std::vector<std::string> dims, std::vector<std::int8_t> values, Attributes attrs = {});
    static Variable make_text(std::string name, std::vector<std::string> dims, std::vector<std::string> values, Attributes attrs = {});
};

/// Dimensions, variables (insertion ordered) and global attributes.
/// A variable whose element count differs from the product of its dimension
/// lengths is rejected on insertion, so such a dataset cannot be built.
class Dataset {
public:
    void add_dimension(const std::string& name, std::size_t length);
    const std::vector<Dimension>& dimensions() const noexcept { return dims_; }
    bool has_dimension(const std::string& name) const noexcept;
    std::size_t dimension_length(const std::string& name) const;

    void add_variable(Variable v);

    /// Appends every variable of `batch` or none of them. With `replace_existing`
    /// a variable of the same name is swapped in place; otherwise it is an error.
    void commit(std::vector<Variable> batch, bool replace_existing = false);

    bool has_variable(const std::string& name) const noexcept;
    const Variable& variable(const std::string& name) const;
    const std::vector<Variable>& variables() const noexcept { return vars_; }

    Attributes& global_attributes() noexcept { return globals_; }
    const Attributes& global_attributes() const noexcept { return globals_; }

    /// Product of the lengths of `dims` (1 for a scalar).
    std::size_t expected_size(const std::vector<std::string>& dims) const;

    /// Throws CastError(InvalidData) naming the first broken invariant.
    void validate() const;

private:
    void check_variable(const Variable& v) const;
    std::ptrdiff_t index_of(const std::string& name) const noexcept;

    std::vector<Dimension> dims_;
    std::vector<Variable> vars_;
    Attributes globals_;
};

} // namespace ctdgbf
