// arinc-delta: compare two ARINC 424 snapshots and write per-type deltas
// Outputs current/added/removed/modified CSV tables for PG, PI, PV and DV
// records, a discarded-airport list and a summary table

#include <arincdelta/config.hpp>
#include <arincdelta/pipeline.hpp>
#include <arincdelta/registry.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iostream>
#include <string>
#include <vector>

// ============================================================================
// Command-line interface
// ============================================================================

struct Options {
    arincdelta::RunOptions run;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [OPTIONS] <old_file> <new_file>\n"
              << "\n"
              << "ARINC 424 delta for PG/PI/PV/DV records.\n"
              << "Combines primary and continuation records and writes CSV deltas.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -o, --out <dir>         Output directory (default: " << arincdelta::DEFAULT_OUTPUT_DIR << ")\n"
              << "  --airport <list>        ICAO filter, e.g. LTAC or LTAC,LTFM\n"
              << "  --area <list>           Area code filter (cols 2-4), e.g. EUR,MES\n"
              << "  --region <list>         Region presets or area codes (default: " << arincdelta::DEFAULT_REGIONS << ")\n"
              << "                          Aliases: EU=EUR+EEU, ME=MES. Empty string for all.\n"
              << "  --types <list>          Subset of PG,PI,PV,DV (default: " << arincdelta::DEFAULT_TYPES << ")\n"
              << "  -v, --verbose           Report line counts\n"
              << "\n"
              << "Examples:\n"
              << "  " << prog << " old.pc new.pc\n"
              << "  " << prog << " --airport LTAC,LTFM --types PG,PI -o out old.pc new.pc\n"
              << "  " << prog << " --region \"\" --area USA old.pc new.pc\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    std::vector<std::string> positional;

    auto take_value = [&](int& i, const std::string& arg, std::string& dest) {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            opts.help = true;
            return false;
        }
        dest = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        }
        else if (arg == "-o" || arg == "--out") {
            if (!take_value(i, arg, opts.run.output_dir)) return opts;
        }
        else if (arg == "--airport") {
            if (!take_value(i, arg, opts.run.airports)) return opts;
        }
        else if (arg == "--area") {
            if (!take_value(i, arg, opts.run.areas)) return opts;
        }
        else if (arg == "--region") {
            if (!take_value(i, arg, opts.run.regions)) return opts;
        }
        else if (arg == "--types") {
            if (!take_value(i, arg, opts.run.types)) return opts;
        }
        else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            opts.help = true;
            return opts;
        }
        else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        std::cerr << "Error: expected <old_file> and <new_file>\n\n";
        opts.help = true;
        return opts;
    }
    opts.run.old_path = positional[0];
    opts.run.new_path = positional[1];

    return opts;
}

int run(const Options& opts) {
    arincdelta::SchemaRegistry registry = arincdelta::make_default_registry();

    std::string error;
    auto context = arincdelta::build_context(opts.run, registry, error);
    if (!context) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    arincdelta::RunResult result;
    if (!arincdelta::run_delta(*context, registry, result, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    if (opts.verbose) {
        std::cerr << fmt::format("Lines kept: old={} new={}\n", result.old_line_count, result.new_line_count);
    }

    if (!result.discarded_icaos.empty()) {
        std::cout << fmt::format("Discarded ICAOs: {}\n", fmt::join(result.discarded_icaos, ", "));
    } else {
        std::cout << "No airports discarded (primary present for all with continuations).\n";
    }

    if (!arincdelta::write_outputs(*context, result, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    for (const auto& report : result.reports) {
        std::cout << fmt::format("{}: current={} added={} removed={} modified={}\n",
                                 report.type_code, report.counts.current, report.counts.added,
                                 report.counts.removed, report.counts.modified);
    }

    std::cout << "Done. Outputs in: " << context->output_dir << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);

    if (opts.help) {
        print_usage(argv[0]);
        return 1;
    }

    return run(opts);
}
