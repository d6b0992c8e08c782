#include "ctdgbf/rows.hpp"

#include "ctdgbf/error.hpp"
#include "text.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace ctdgbf {

bool FillValuePolicy::is_fill(double v) const noexcept {
    for (double s : sentinels) {
        if (v == s) return true;
        if (std::fabs(v - s) <= relative_tolerance * std::fabs(s)) return true;
    }
    return false;
}

// ------------------------------
// RowSequence
// ------------------------------

RowSequence::RowSequence(std::shared_ptr<const std::vector<std::string>> lines,
                         std::size_t first_line,
                         std::vector<ColumnDefinition> columns,
                         FillValuePolicy fill,
                         std::string source)
    : lines_(std::move(lines)),
      first_line_(first_line),
      columns_(std::move(columns)),
      fill_(std::move(fill)),
      source_(std::move(source)) {
    if (!lines_) throw CastError(ErrorKind::InvalidData, "row sequence needs a line buffer");
}

RowSequence::iterator RowSequence::begin() const {
    return iterator(this, first_line_);
}

RowSequence::iterator RowSequence::end() const {
    return iterator(this, lines_->size());
}

ObservationRecord RowSequence::decode_line(std::size_t index) const {
    const std::string& text = (*lines_)[index];
    std::vector<std::string> tokens = text.find(',') != std::string::npos
        ? internal::split_commas(text)
        : internal::split_ws(text);

    if (tokens.size() != columns_.size()) {
        std::ostringstream oss;
        oss << "row has " << tokens.size() << " values, header declares " << columns_.size() << " columns";
        throw CastError(ErrorKind::RowShape, oss.str(), source_, index + 1);
    }

    ObservationRecord rec;
    rec.line = index + 1;
    rec.values.reserve(tokens.size());
    for (const auto& tok : tokens) {
        std::optional<double> v = internal::parse_double(tok);
        if (v && fill_.is_fill(*v)) v.reset();
        rec.values.push_back(v);
    }
    return rec;
}

std::vector<ObservationRecord> RowSequence::collect() const {
    std::vector<ObservationRecord> out;
    for (const auto& rec : *this) out.push_back(rec);
    return out;
}

RowSequence::iterator::iterator(const RowSequence* owner, std::size_t pos)
    : owner_(owner), pos_(pos) {
    settle();
}

void RowSequence::iterator::settle() {
    const auto& lines = *owner_->lines_;
    while (pos_ < lines.size() && internal::trim(lines[pos_]).empty()) ++pos_;
    if (pos_ < lines.size()) current_ = owner_->decode_line(pos_);
}

RowSequence::iterator& RowSequence::iterator::operator++() {
    ++pos_;
    settle();
    return *this;
}

RowSequence::iterator RowSequence::iterator::operator++(int) {
    iterator tmp = *this;
    ++*this;
    return tmp;
}

RowSequence decode_rows(std::shared_ptr<const std::vector<std::string>> lines,
                        std::size_t first_line,
                        std::vector<ColumnDefinition> columns,
                        FillValuePolicy fill,
                        std::string source) {
    return RowSequence(std::move(lines), first_line, std::move(columns), std::move(fill), std::move(source));
}

std::shared_ptr<const std::vector<std::string>> read_lines(const std::filesystem::path& file) {
    std::ifstream is(file, std::ios::binary);
    if (!is) throw CastError(ErrorKind::Io, "failed to open file", file.string());

    auto lines = std::make_shared<std::vector<std::string>>();
    std::string line;
    while (std::getline(is, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines->push_back(std::move(line));
    }
    if (is.bad()) throw CastError(ErrorKind::Io, "read failed", file.string());
    return lines;
}

} // namespace ctdgbf
