#pragma once

#include "ctdgbf/assembler.hpp"
#include "ctdgbf/container.hpp"
#include "ctdgbf/dataset.hpp"
#include "ctdgbf/error.hpp"
#include "ctdgbf/flags.hpp"
#include "ctdgbf/mapping.hpp"
#include "ctdgbf/qc_config.hpp"
#include "ctdgbf/rows.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ctdgbf {

struct ConvertOptions {
    std::shared_ptr<const MappingTable> table{default_mapping_table()};
    FillValuePolicy fill{};
    bool use_header_bad_flag{true}; // add "# bad_flag" to the fill sentinels
    AssembleOptions assemble{};
    WriteOptions write{};
};

struct ConvertReport {
    std::size_t rows{0};
    std::size_t columns{0};
    std::size_t variables{0};
    Diagnostics diagnostics{};
};

/// Header parse, row decode, mapping and assembly of one buffered cast.
/// `source` names the input in errors.
Dataset convert_lines(std::shared_ptr<const std::vector<std::string>> lines,
                      const std::string& source,
                      const ConvertOptions& options,
                      Diagnostics& diags);

/// .cnv file -> container file. Nothing is written when conversion fails.
ConvertReport convert_file(const std::filesystem::path& input,
                           const std::filesystem::path& output,
                           const ConvertOptions& options = ConvertOptions{});

struct QcReport {
    std::vector<std::string> variables{}; // variables that received <name>_qc
    Diagnostics diagnostics{};
};

/// Runs the configured pipelines and attaches flags. With `only` non-empty,
/// just those variables are processed; a listed variable without configured
/// checks gets NOT_EVALUATED flags. Variables absent from the dataset are
/// reported as UnknownVariable warnings.
std::vector<std::string> qc_dataset(Dataset& ds,
                                    const QcConfig& config,
                                    const QcOptions& options,
                                    Diagnostics& diags,
                                    const std::vector<std::string>& only = {});

/// Container file -> container file with QC variables, written with `write`.
QcReport qc_file(const std::filesystem::path& input,
                 const std::filesystem::path& output,
                 const QcConfig& config,
                 const QcOptions& options = QcOptions{},
                 const std::vector<std::string>& only = {},
                 const WriteOptions& write = WriteOptions{});

} // namespace ctdgbf
