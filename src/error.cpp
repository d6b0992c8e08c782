#include "ctdgbf/error.hpp"

#include <map>
#include <ostream>
#include <sstream>

namespace ctdgbf {

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "io";
        case ErrorKind::MalformedHeader: return "malformed-header";
        case ErrorKind::RowShape: return "row-shape";
        case ErrorKind::EmptyCast: return "empty-cast";
        case ErrorKind::NonMonotonicTime: return "non-monotonic-time";
        case ErrorKind::BadMagic: return "bad-magic";
        case ErrorKind::HeaderJsonParse: return "header-json";
        case ErrorKind::HeaderCrcMismatch: return "header-crc";
        case ErrorKind::FieldCrcMismatch: return "field-crc";
        case ErrorKind::ZlibError: return "zlib";
        case ErrorKind::Truncated: return "truncated";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::InvalidData: return "invalid-data";
        case ErrorKind::Unsupported: return "unsupported";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

static std::string located(const std::string& msg, const std::string& source, std::size_t line) {
    if (source.empty() && line == 0) return msg;
    std::ostringstream oss;
    oss << (source.empty() ? std::string("<input>") : source);
    if (line != 0) oss << ':' << line;
    oss << ": " << msg;
    return oss.str();
}

CastError::CastError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k), detail_(msg) {}

CastError::CastError(ErrorKind k, const std::string& msg, const std::string& source, std::size_t line)
    : std::runtime_error(located(msg, source, line)), kind_(k), detail_(msg), source_(source), line_(line) {}

ErrorKind CastError::kind() const noexcept { return kind_; }
const std::string& CastError::source() const noexcept { return source_; }
std::size_t CastError::line() const noexcept { return line_; }
const std::string& CastError::detail() const noexcept { return detail_; }

CastError CastError::with_source(const std::string& source) const {
    if (!source_.empty()) return *this;
    return CastError(kind_, detail_, source, line_);
}

std::string to_string(DiagnosticKind k) {
    switch (k) {
        case DiagnosticKind::UnmappedVariable: return "unmapped-variable";
        case DiagnosticKind::UnconvertedUnit: return "unconverted-unit";
        case DiagnosticKind::CheckConfiguration: return "check-configuration";
        case DiagnosticKind::NonMonotonicTime: return "non-monotonic-time";
        case DiagnosticKind::RowCountMismatch: return "row-count-mismatch";
        case DiagnosticKind::MissingTime: return "missing-time";
        case DiagnosticKind::UnknownVariable: return "unknown-variable";
    }
    return "unknown";
}

void Diagnostics::warn(DiagnosticKind kind, std::string subject, std::string message) {
    entries_.push_back(Diagnostic{kind, std::move(subject), std::move(message)});
}

std::size_t Diagnostics::count(DiagnosticKind kind) const noexcept {
    std::size_t n = 0;
    for (const auto& d : entries_) {
        if (d.kind == kind) ++n;
    }
    return n;
}

void Diagnostics::write_summary(std::ostream& os) const {
    if (entries_.empty()) {
        os << "no warnings\n";
        return;
    }
    std::map<std::string, std::size_t> per_kind;
    for (const auto& d : entries_) ++per_kind[to_string(d.kind)];

    os << entries_.size() << " warning(s):";
    for (const auto& kv : per_kind) os << ' ' << kv.first << '=' << kv.second;
    os << '\n';
    for (const auto& d : entries_) {
        os << "  [" << to_string(d.kind) << "] ";
        if (!d.subject.empty()) os << d.subject << ": ";
        os << d.message << '\n';
    }
}

} // namespace ctdgbf
