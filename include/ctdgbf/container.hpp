#pragma once

#include "ctdgbf/dataset.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ctdgbf {

// ------------------------------
// Header model
// ------------------------------

struct VariableMeta {
    std::string name{};
    DataType type{DataType::Float64};
    std::vector<std::string> dims{};
    Attributes attributes{};
    std::string compression{"none"}; // "none" | "zlib"
    std::uint64_t offset{0}; // relative to payload_start
    std::uint64_t csize{0};
    std::uint64_t usize{0};
    std::uint32_t crc32{0};
};

struct ContainerHeader {
    std::string format{"CTDGBF"};
    std::string magic{"CTDGBF"};
    int version{1};
    std::string endianness{"little"};
    std::string created_utc{};
    std::vector<Dimension> dimensions{};
    Attributes global_attributes{};
    std::vector<VariableMeta> variables{};

    std::uint64_t payload_start{0};
    std::uint64_t file_size{0};
    std::string header_crc32_hex{};

    const VariableMeta* find(const std::string& name) const;
};

struct Schema {
    ContainerHeader header{};
    std::uint32_t header_len{0};
};

struct ReadOptions {
    bool validate{false}; // validate header CRC + per-variable CRC (when present)
};

enum class CompressionMode {
    Never,
    Always,
    Auto,
};

struct WriteOptions {
    CompressionMode compression{CompressionMode::Auto};
    bool include_crc32{true};
    int zlib_level{6}; // 0..9
};

std::string to_string(CompressionMode m);
CompressionMode compression_mode_from_string(const std::string& s);

// ------------------------------
// API
// ------------------------------

/// Read the header without touching the payload.
Schema read_schema(const std::filesystem::path& file, const ReadOptions& opts = ReadOptions{});

/// Read every variable and rebuild the dataset (shape invariants re-checked).
Dataset read_dataset(const std::filesystem::path& file, const ReadOptions& opts = ReadOptions{});

/// Random access to one variable. Throws CastError(NotFound) for an unknown name.
Variable read_variable(const std::filesystem::path& file, const std::string& name,
                       const ReadOptions& opts = ReadOptions{});

/// Validates the dataset, writes "<file>.tmp" and renames it over `file`.
/// On failure no file is left behind.
void write_dataset(const std::filesystem::path& file, const Dataset& ds,
                   const WriteOptions& opts = WriteOptions{});

} // namespace ctdgbf
