#pragma once

#include <cstddef>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace ctdgbf {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    MalformedHeader,
    RowShape,
    EmptyCast,
    NonMonotonicTime,
    BadMagic,
    HeaderJsonParse,
    HeaderCrcMismatch,
    FieldCrcMismatch,
    ZlibError,
    Truncated,
    NotFound,
    InvalidData,
    Unsupported,
    Config,
};

std::string to_string(ErrorKind k);

class CastError : public std::runtime_error {
public:
    CastError(ErrorKind k, const std::string& msg);
    // `line` is 1-based; 0 means "no line".
    CastError(ErrorKind k, const std::string& msg, const std::string& source, std::size_t line = 0);

    ErrorKind kind() const noexcept;
    const std::string& source() const noexcept;
    std::size_t line() const noexcept;
    const std::string& detail() const noexcept;

    // Same error, attributed to `source` (keeps an existing attribution).
    CastError with_source(const std::string& source) const;

private:
    ErrorKind kind_;
    std::string detail_;
    std::string source_;
    std::size_t line_{0};
};

// ------------------------------
// Non-fatal diagnostics
// ------------------------------

enum class DiagnosticKind {
    UnmappedVariable,
    UnconvertedUnit,
    CheckConfiguration,
    NonMonotonicTime,
    RowCountMismatch,
    MissingTime,
    UnknownVariable,
};

std::string to_string(DiagnosticKind k);

struct Diagnostic {
    DiagnosticKind kind{DiagnosticKind::UnmappedVariable};
    std::string subject{}; // variable, check or file the warning is about
    std::string message{};
};

class Diagnostics {
public:
    void warn(DiagnosticKind kind, std::string subject, std::string message);

    const std::vector<Diagnostic>& entries() const noexcept { return entries_; }
    bool empty() const noexcept { return entries_.empty(); }
    std::size_t size() const noexcept { return entries_.size(); }
    std::size_t count(DiagnosticKind kind) const noexcept;

    /// Grouped, one line per diagnostic, with a count per kind first.
    void write_summary(std::ostream& os) const;

private:
    std::vector<Diagnostic> entries_;
};

} // namespace ctdgbf
