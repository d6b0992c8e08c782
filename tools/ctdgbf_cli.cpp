#include "ctdgbf/container.hpp"
#include "ctdgbf/pipeline.hpp"
#include "ctdgbf/qc_config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <locale>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static std::string fmt_dims(const std::vector<std::string>& dims, const std::vector<ctdgbf::Dimension>& all) {
    std::ostringstream oss;
    oss << '(';
    for (std::size_t i = 0; i < dims.size(); ++i) {
        if (i) oss << ", ";
        oss << dims[i];
        for (const auto& d : all) {
            if (d.name == dims[i]) oss << '=' << d.length;
        }
    }
    oss << ')';
    return oss.str();
}

static void usage() {
    std::cerr <<
        "ctdgbf - CTD cast converter and QC\n"
        "\n"
        "Usage:\n"
        "  ctdgbf convert <IN.cnv> <OUT.gbf> [--strict-time] [--fill V] [--compress never|always|auto]\n"
        "                 [--trajectory-id ID] [--no-color]\n"
        "  ctdgbf qc      <IN.gbf> <OUT.gbf> [--config FILE.json] [--var NAME]... [--emit-checks] [--replace]\n"
        "                 [--compress never|always|auto] [--no-color]\n"
        "  ctdgbf info    <FILE> [--validate] [--details] [--no-color]\n"
        "  ctdgbf show    <FILE> <VAR> [--max-elems N] [--stats] [--validate] [--no-color]\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string second; // output file or variable name
    bool validate{false};
    bool details{false};
    bool stats{false};
    bool no_color{false};
    bool strict_time{false};
    bool emit_checks{false};
    bool replace{false};
    std::vector<double> fill;
    ctdgbf::CompressionMode compression{ctdgbf::CompressionMode::Auto};
    std::string trajectory_id;
    std::string config;
    std::vector<std::string> vars;
    std::size_t max_elems{20};
};

static bool parse_number(const std::string& s, double& out) {
    std::istringstream iss(s);
    iss.imbue(std::locale::classic());
    iss >> out;
    return !iss.fail() && iss.eof();
}

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    const bool two_positionals = a.cmd == "convert" || a.cmd == "qc" || a.cmd == "show";
    if (a.cmd != "convert" && a.cmd != "qc" && a.cmd != "info" && a.cmd != "show") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }

    int i = 3;
    if (two_positionals) {
        if (i >= argc || std::string(argv[i]).rfind("--", 0) == 0) {
            std::cerr << "Missing " << (a.cmd == "show" ? "variable name" : "output file") << "\n";
            return false;
        }
        a.second = argv[i++];
    }

    while (i < argc) {
        std::string opt = argv[i++];
        const bool has_value = i < argc;
        if (opt == "--validate") a.validate = true;
        else if (opt == "--details") a.details = true;
        else if (opt == "--stats") a.stats = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--strict-time" && a.cmd == "convert") a.strict_time = true;
        else if (opt == "--emit-checks" && a.cmd == "qc") a.emit_checks = true;
        else if (opt == "--replace" && a.cmd == "qc") a.replace = true;
        else if (opt == "--trajectory-id" && has_value) a.trajectory_id = argv[i++];
        else if (opt == "--config" && has_value) a.config = argv[i++];
        else if (opt == "--var" && has_value) a.vars.push_back(argv[i++]);
        else if (opt == "--fill" && has_value) {
            double v = 0.0;
            if (!parse_number(argv[i], v)) {
                std::cerr << "Invalid fill value: " << argv[i] << "\n";
                return false;
            }
            a.fill.push_back(v);
            ++i;
        } else if (opt == "--compress" && has_value) {
            try {
                a.compression = ctdgbf::compression_mode_from_string(argv[i++]);
            } catch (const ctdgbf::CastError& e) {
                std::cerr << e.detail() << "\n";
                return false;
            }
        } else if (opt == "--max-elems" && has_value) {
            double v = 0.0;
            if (!parse_number(argv[i], v) || v < 0) {
                std::cerr << "Invalid --max-elems: " << argv[i] << "\n";
                return false;
            }
            a.max_elems = static_cast<std::size_t>(v);
            ++i;
        } else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }
    return true;
}

static void print_diagnostics(const ctdgbf::Diagnostics& diags, const Ansi& ansi) {
    if (diags.empty()) return;
    std::cerr << ansi.yellow() << "Warnings" << ansi.reset() << ": ";
    diags.write_summary(std::cerr);
}

// ----------------- info -----------------

static void print_attributes(const ctdgbf::Attributes& attrs, const Ansi& ansi, const std::string& pad) {
    for (const auto& kv : attrs) {
        std::cout << pad << ansi.gray() << kv.first << ansi.reset() << " = " << kv.second << "\n";
    }
}

static int cmd_info(const Args& a, const Ansi& ansi) {
    ctdgbf::Schema schema = ctdgbf::read_schema(a.file, ctdgbf::ReadOptions{a.validate});
    const auto& hdr = schema.header;

    std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
    std::cout << ansi.bold() << "Magic" << ansi.reset() << ": " << hdr.magic << " v" << hdr.version << "\n";
    std::cout << ansi.bold() << "Created" << ansi.reset() << ": " << hdr.created_utc << "\n";
    std::cout << ansi.bold() << "Header len" << ansi.reset() << ": " << schema.header_len << " bytes\n";
    std::cout << ansi.bold() << "Payload start" << ansi.reset() << ": " << hdr.payload_start << "\n";
    std::cout << ansi.bold() << "File size" << ansi.reset() << ": " << hdr.file_size << "\n";
    std::cout << ansi.bold() << "Header CRC" << ansi.reset() << ": " << hdr.header_crc32_hex
              << (a.validate ? ansi.green() + " (verified)" + ansi.reset() : std::string()) << "\n";

    std::cout << ansi.bold() << "Dimensions" << ansi.reset() << ":\n";
    for (const auto& d : hdr.dimensions) {
        std::cout << "  " << ansi.cyan() << d.name << ansi.reset() << " = " << d.length << "\n";
    }

    std::cout << ansi.bold() << "Variables" << ansi.reset() << ":\n";
    for (const auto& v : hdr.variables) {
        std::cout << "  " << ansi.cyan() << v.name << ansi.reset()
                  << " " << ansi.gray() << fmt_dims(v.dims, hdr.dimensions) << ansi.reset()
                  << " " << ansi.yellow() << ctdgbf::to_string(v.type) << ansi.reset();
        auto units = v.attributes.find("units");
        if (units != v.attributes.end() && !units->second.empty()) {
            std::cout << " [" << units->second << "]";
        }
        if (a.details) {
            std::cout << " " << ansi.dim()
                      << "comp=" << v.compression
                      << " off=" << v.offset
                      << " csize=" << v.csize
                      << " usize=" << v.usize
                      << " crc32=" << hex8(v.crc32)
                      << ansi.reset();
        }
        std::cout << "\n";
        if (a.details) print_attributes(v.attributes, ansi, "      ");
    }

    std::cout << ansi.bold() << "Global attributes" << ansi.reset() << ":\n";
    print_attributes(hdr.global_attributes, ansi, "  ");
    return 0;
}

// ----------------- show -----------------

static std::string fmt_double(double v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(10) << v;
    return oss.str();
}

static void print_float_stats(const std::vector<double>& values, const Ansi& ansi) {
    std::size_t count = 0;
    double lo = 0.0, hi = 0.0, sum = 0.0;
    for (double v : values) {
        if (std::isnan(v)) continue;
        if (count == 0) lo = hi = v;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
        sum += v;
        ++count;
    }
    std::cout << ansi.magenta() << "stats" << ansi.reset() << ":\n";
    std::cout << "  count=" << count << " missing=" << (values.size() - count) << "\n";
    if (count > 0) {
        std::cout << "  min=" << fmt_double(lo) << " max=" << fmt_double(hi)
                  << " mean=" << fmt_double(sum / static_cast<double>(count)) << "\n";
    }
}

static void print_flag_stats(const std::vector<std::int8_t>& values, const Ansi& ansi) {
    std::map<int, std::size_t> counts;
    for (auto v : values) ++counts[v];
    std::cout << ansi.magenta() << "stats" << ansi.reset() << ":\n";
    for (const auto& kv : counts) {
        std::cout << "  " << kv.first << " ("
                  << ctdgbf::to_string(static_cast<ctdgbf::FlagValue>(kv.first)) << "): " << kv.second << "\n";
    }
}

static int cmd_show(const Args& a, const Ansi& ansi) {
    ctdgbf::Variable v = ctdgbf::read_variable(a.file, a.second, ctdgbf::ReadOptions{a.validate});
    const std::size_t n = v.size();
    const std::size_t shown = std::min(a.max_elems, n);

    std::cout << ansi.bold() << v.name << ansi.reset() << " " << ansi.yellow() << ctdgbf::to_string(v.type())
              << ansi.reset() << " numel=" << n << "\n";
    for (const auto& kv : v.attributes) {
        std::cout << "  " << ansi.gray() << kv.first << ansi.reset() << " = " << kv.second << "\n";
    }

    std::cout << ansi.magenta() << "preview" << ansi.reset() << " (first " << shown << "):\n  ";
    switch (v.type()) {
        case ctdgbf::DataType::Float64:
            for (std::size_t i = 0; i < shown; ++i) std::cout << fmt_double(v.as_float()[i]) << " ";
            break;
        case ctdgbf::DataType::Int8:
            for (std::size_t i = 0; i < shown; ++i) std::cout << static_cast<int>(v.as_int8()[i]) << " ";
            break;
        case ctdgbf::DataType::Text:
            for (std::size_t i = 0; i < shown; ++i) std::cout << '"' << v.as_text()[i] << "\" ";
            break;
    }
    std::cout << "\n";

    if (a.stats) {
        if (v.type() == ctdgbf::DataType::Float64) print_float_stats(v.as_float(), ansi);
        else if (v.type() == ctdgbf::DataType::Int8) print_flag_stats(v.as_int8(), ansi);
    }
    return 0;
}

// ----------------- convert / qc -----------------

static int cmd_convert(const Args& a, const Ansi& ansi) {
    ctdgbf::ConvertOptions opts;
    opts.assemble.strict_monotonic_time = a.strict_time;
    if (!a.trajectory_id.empty()) opts.assemble.trajectory_id = a.trajectory_id;
    for (double f : a.fill) opts.fill.sentinels.push_back(f);
    opts.write.compression = a.compression;

    ctdgbf::ConvertReport report = ctdgbf::convert_file(a.file, a.second, opts);
    std::cout << ansi.green() << "Wrote" << ansi.reset() << " " << a.second << ": "
              << report.rows << " observations, " << report.columns << " columns, "
              << report.variables << " variables\n";
    print_diagnostics(report.diagnostics, ansi);
    return 0;
}

static int cmd_qc(const Args& a, const Ansi& ansi) {
    ctdgbf::Diagnostics config_diags;
    ctdgbf::QcConfig config = a.config.empty() ? ctdgbf::default_qc_config()
                                               : ctdgbf::load_qc_config(a.config, config_diags);
    ctdgbf::QcOptions opts;
    opts.emit_check_variables = a.emit_checks;
    opts.replace_existing = a.replace;

    ctdgbf::WriteOptions wopts;
    wopts.compression = a.compression;

    ctdgbf::QcReport report = ctdgbf::qc_file(a.file, a.second, config, opts, a.vars, wopts);
    std::cout << ansi.green() << "Wrote" << ansi.reset() << " " << a.second << ": ";
    if (report.variables.empty()) {
        std::cout << "no variables quality controlled\n";
    } else {
        for (std::size_t i = 0; i < report.variables.size(); ++i) {
            if (i) std::cout << ", ";
            std::cout << report.variables[i] << "_qc";
        }
        std::cout << "\n";
    }
    print_diagnostics(config_diags, ansi);
    print_diagnostics(report.diagnostics, ansi);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        if (a.cmd == "convert") return cmd_convert(a, ansi);
        if (a.cmd == "qc") return cmd_qc(a, ansi);
        if (a.cmd == "info") return cmd_info(a, ansi);
        if (a.cmd == "show") return cmd_show(a, ansi);
    } catch (const ctdgbf::CastError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " [" << ctdgbf::to_string(e.kind()) << "]: "
                  << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
