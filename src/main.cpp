/// @file src/main.cpp
/// @brief QMJ CLI entry point.
///
/// Usage:
///   qmj --panel <csv> [--output <csv>] [options]   Build the QMJ factor series
///   qmj --help                                     Print usage

#include "qmj/data_loader.hpp"
#include "qmj/pipeline.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdio>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  qmj --panel <csv> [--output <csv>] [options]\n"
        "  qmj --help\n"
        "\n"
        "Options:\n"
        "  --strict             Require all four dimensions for a Quality score\n"
        "  --zero-fill          Standardize missing metrics to 0 instead of excluding\n"
        "  --top <f>            Quality bucket fraction (default 0.1)\n"
        "  --bottom <f>         Junk bucket fraction (default 0.1)\n"
        "  --tie-break asc|desc Entity-id order for equal scores (default asc)\n"
        "  --workers <n>        Period-partition worker threads (default 1)\n"
        "  --quiet              Do not log warnings to stderr\n"
        "  --verbose            Also log a summary line per period\n"
        "\n"
        "Panel columns (header required):\n"
        "  entity_id,period,price,prev_price,gpoa,roe,roa,cfoa,gmar,acc,\n"
        "  bab,lev,o,z,evol,eiss,diss,npop\n"
        "\n"
        "Returns are absolute price changes (price - prev_price).\n"
    );
}

struct Args {
    std::string         panel_path;
    std::string         output_path;  ///< empty: write to stdout
    qmj::PipelineConfig config;
    bool                help = false;
};

std::optional<double> parse_fraction(std::string_view s) {
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

std::optional<std::size_t> parse_count(std::string_view s) {
    std::size_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

/// Returns nullopt (after printing the reason) on a malformed command line.
std::optional<Args> parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string_view key(argv[i]);
        auto value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", key);
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        if (key == "--help" || key == "-h") {
            args.help = true;
        } else if (key == "--strict") {
            args.config.composite_policy = qmj::CompositePolicy::Strict;
        } else if (key == "--zero-fill") {
            args.config.missing_value_policy = qmj::MissingValuePolicy::ZeroFill;
        } else if (key == "--verbose") {
            args.config.verbose = true;
        } else if (key == "--quiet") {
            args.config.quiet = true;
        } else if (key == "--panel" || key == "--output") {
            const auto v = value();
            if (!v) return std::nullopt;
            (key == "--panel" ? args.panel_path : args.output_path) = std::string(*v);
        } else if (key == "--top" || key == "--bottom") {
            const auto v = value();
            if (!v) return std::nullopt;
            const auto f = parse_fraction(*v);
            if (!f) {
                fmt::print(stderr, "Error: {} expects a number, got '{}'\n", key, *v);
                return std::nullopt;
            }
            (key == "--top" ? args.config.top_decile_fraction
                            : args.config.bottom_decile_fraction) = *f;
        } else if (key == "--tie-break") {
            const auto v = value();
            if (!v) return std::nullopt;
            if (*v == "asc") {
                args.config.tie_break_key = qmj::TieBreak::EntityAscending;
            } else if (*v == "desc") {
                args.config.tie_break_key = qmj::TieBreak::EntityDescending;
            } else {
                fmt::print(stderr, "Error: --tie-break expects asc or desc\n");
                return std::nullopt;
            }
        } else if (key == "--workers") {
            const auto v = value();
            if (!v) return std::nullopt;
            const auto n = parse_count(*v);
            if (!n) {
                fmt::print(stderr, "Error: --workers expects a count, got '{}'\n", *v);
                return std::nullopt;
            }
            args.config.workers = *n;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", key);
            return std::nullopt;
        }
    }
    return args;
}

/// Load, compute, write. Returns 0 on success, 1 on error.
int run(const Args& args) {
    const qmj::engine::Pipeline pipeline(args.config);

    const auto required = pipeline.config().required_input_metrics();
    const auto panel    = qmj::core::PanelLoader::load_csv(args.panel_path, required);
    fmt::print(stderr, "Loaded {} records over {} periods from '{}'\n",
               panel.size(), panel.periods().size(), args.panel_path);

    const auto result = pipeline.run(panel);
    fmt::print(stderr, "Computed {} factor periods ({} warnings)\n",
               result.factor_returns.size(), result.diagnostics.size());

    if (args.output_path.empty()) {
        fmt::print("{}", qmj::core::FactorReturnWriter::to_csv(result.factor_returns));
    } else {
        qmj::core::FactorReturnWriter::write_csv(args.output_path, result.factor_returns);
        fmt::print(stderr, "Output written to '{}'\n", args.output_path);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }
    if (args->help) {
        print_usage();
        return 0;
    }
    if (args->panel_path.empty()) {
        fmt::print(stderr, "Error: --panel is required\n");
        print_usage();
        return 1;
    }

    try {
        return run(*args);
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[FATAL] {}\n", ex.what());
        return 1;
    }
}
