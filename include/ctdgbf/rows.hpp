#pragma once

#include "ctdgbf/header.hpp"

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctdgbf {

/// One decoded data row. An empty optional is the MISSING sentinel.
struct ObservationRecord {
    std::size_t line{0}; // 1-based line in the source file
    std::vector<std::optional<double>> values{};
};

/// Decides which numeric values are instrument fill values.
struct FillValuePolicy {
    std::vector<double> sentinels{-9.990e-29};
    double relative_tolerance{1e-6};

    bool is_fill(double v) const noexcept;
};

/// Lazy, forward-only view over the data section of a buffered file.
/// Each begin() decodes again from the first data line.
class RowSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ObservationRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const ObservationRecord*;
        using reference = const ObservationRecord&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        iterator& operator++();
        iterator operator++(int);

        friend bool operator==(const iterator& a, const iterator& b) noexcept {
            return a.owner_ == b.owner_ && a.pos_ == b.pos_;
        }
        friend bool operator!=(const iterator& a, const iterator& b) noexcept { return !(a == b); }

    private:
        friend class RowSequence;
        iterator(const RowSequence* owner, std::size_t pos);
        void settle(); // skip blank lines and decode, or become end()

        const RowSequence* owner_{nullptr};
        std::size_t pos_{0};
        ObservationRecord current_{};
    };

    RowSequence(std::shared_ptr<const std::vector<std::string>> lines,
                std::size_t first_line,
                std::vector<ColumnDefinition> columns,
                FillValuePolicy fill,
                std::string source = {});

    iterator begin() const;
    iterator end() const;

    const std::vector<ColumnDefinition>& columns() const noexcept { return columns_; }

    /// Materialises every record; throws CastError(RowShape) on the first bad row.
    std::vector<ObservationRecord> collect() const;

    /// Decodes one line (0-based index into the buffer). Exposed for tests.
    ObservationRecord decode_line(std::size_t index) const;

private:
    std::shared_ptr<const std::vector<std::string>> lines_;
    std::size_t first_line_{0};
    std::vector<ColumnDefinition> columns_;
    FillValuePolicy fill_;
    std::string source_;
};

RowSequence decode_rows(std::shared_ptr<const std::vector<std::string>> lines,
                        std::size_t first_line,
                        std::vector<ColumnDefinition> columns,
                        FillValuePolicy fill = FillValuePolicy{},
                        std::string source = {});

/// Reads a text file into memory, one entry per line (CR/LF stripped).
std::shared_ptr<const std::vector<std::string>> read_lines(const std::filesystem::path& file);

} // namespace ctdgbf
