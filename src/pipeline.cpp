#include "ctdgbf/pipeline.hpp"

#include "ctdgbf/header.hpp"
#include "ctdgbf/qc.hpp"

#include <algorithm>

namespace ctdgbf {

Dataset convert_lines(std::shared_ptr<const std::vector<std::string>> lines,
                      const std::string& source,
                      const ConvertOptions& options,
                      Diagnostics& diags) {
    if (!options.table) throw CastError(ErrorKind::Config, "no mapping table configured");
    try {
        ParsedHeader header = parse_header(*lines, source);

        FillValuePolicy fill = options.fill;
        if (options.use_header_bad_flag && header.bad_flag) fill.sentinels.push_back(*header.bad_flag);

        ColumnMapping mapping = map_to_canonical(header.columns, header.metadata, *options.table, diags);
        for (const auto& m : mapping.columns) {
            if (m.mapped) header.columns[m.column].canonical_name = m.name;
        }

        RowSequence rows = decode_rows(lines, header.data_line, header.columns, fill, source);
        std::vector<ObservationRecord> records = rows.collect();

        if (header.declared_rows && *header.declared_rows != records.size()) {
            diags.warn(DiagnosticKind::RowCountMismatch, source.empty() ? std::string("<input>") : source,
                       "header declares nvalues = " + std::to_string(*header.declared_rows) + " but " +
                       std::to_string(records.size()) + " data rows were read");
        }
        return assemble(records, mapping, header, options.assemble, diags);
    } catch (const CastError& e) {
        throw e.with_source(source);
    }
}

ConvertReport convert_file(const std::filesystem::path& input,
                           const std::filesystem::path& output,
                           const ConvertOptions& options) {
    ConvertReport report;
    Dataset ds = convert_lines(read_lines(input), input.string(), options, report.diagnostics);

    report.rows = ds.dimension_length("obs");
    report.variables = ds.variables().size();
    for (const auto& v : ds.variables()) {
        if (!v.attribute("source_name").empty()) ++report.columns;
    }
    write_dataset(output, ds, options.write);
    return report;
}

std::vector<std::string> qc_dataset(Dataset& ds,
                                    const QcConfig& config,
                                    const QcOptions& options,
                                    Diagnostics& diags,
                                    const std::vector<std::string>& only) {
    std::vector<std::string> targets = only;
    if (targets.empty()) {
        for (const auto& kv : config.variables) targets.push_back(kv.first);
    }

    static const std::vector<CheckSpec> kNoChecks;
    std::vector<std::string> done;
    for (const auto& name : targets) {
        if (!ds.has_variable(name)) {
            diags.warn(DiagnosticKind::UnknownVariable, name, "not present in the dataset; skipped");
            continue;
        }
        if (ds.variable(name).type() != DataType::Float64) {
            diags.warn(DiagnosticKind::UnknownVariable, name, "not a numeric variable; skipped");
            continue;
        }
        const std::vector<CheckSpec>* pipeline = config.find(name);
        std::vector<QCResult> results = run_checks(ds, name, pipeline ? *pipeline : kNoChecks, diags);
        attach_qc(ds, name, results, options);
        done.push_back(name);
    }
    return done;
}

QcReport qc_file(const std::filesystem::path& input,
                 const std::filesystem::path& output,
                 const QcConfig& config,
                 const QcOptions& options,
                 const std::vector<std::string>& only,
                 const WriteOptions& write) {
    QcReport report;
    ReadOptions ropts;
    ropts.validate = true;
    Dataset ds = read_dataset(input, ropts);

    QcOptions effective = options;
    effective.emit_check_variables = options.emit_check_variables || config.emit_check_variables;

    try {
        report.variables = qc_dataset(ds, config, effective, report.diagnostics, only);
    } catch (const CastError& e) {
        throw e.with_source(input.string());
    }
    write_dataset(output, ds, write);
    return report;
}

} // namespace ctdgbf
