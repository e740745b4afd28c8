/// @file src/main.cpp
/// @brief wxscore CLI entry point.
///
/// Usage:
///   wxscore --samples <csv> --profile <yaml> [options]   Score a forecast
///   wxscore --help                                       Print usage

#include "wxs/config_loader.hpp"
#include "wxs/data_loader.hpp"
#include "wxs/engine.hpp"
#include "wxs/logging.hpp"

#include <fmt/core.h>

#include <charconv>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace wxs;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  wxscore --samples <csv> --profile <yaml> [options]\n"
        "\n"
        "Options:\n"
        "  --params <yaml>            Catalog parameter overrides\n"
        "  --indices a,b              Indices to score (default: all)\n"
        "                             day_quality, clothing, cold_shock, visibility\n"
        "  --offset-hours N           Window start relative to now (default 0)\n"
        "  --hours N                  Window length (default 24)\n"
        "  --granularity-hours N      Output step (default 1)\n"
        "  --mode nearest|average     Downsampling mode (default nearest)\n"
        "  --now <epoch>              Reference time (default: current time)\n"
        "  --verbose                  Debug logging\n"
        "  --help                     Show this help\n"
        "\n"
        "CSV format (header required):\n"
        "  timestamp,temperature,wind_module,precipitation_amount,cloud_area_fraction,...\n"
    );
}

struct Options {
    std::string                 samples;
    std::string                 profile;
    std::string                 params;
    std::vector<catalog::IndexId> indices;
    window::Horizon             horizon;
    std::optional<EpochSeconds> now;
    bool                        verbose = false;
};

std::optional<std::int64_t> parse_int(std::string_view s) {
    std::int64_t v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

/// Parse argv into `opts`. Returns false (after printing why) on bad input.
bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", arg);
            return false;
        }
        const std::string_view value(argv[++i]);

        if (arg == "--samples") {
            opts.samples = value;
        } else if (arg == "--profile") {
            opts.profile = value;
        } else if (arg == "--params") {
            opts.params = value;
        } else if (arg == "--indices") {
            std::size_t start = 0;
            while (start <= value.size()) {
                const auto comma = value.find(',', start);
                const auto name  = value.substr(start, comma - start);
                const auto id    = catalog::index_from_string(name);
                if (!id) {
                    fmt::print(stderr, "Error: unknown index '{}'\n", name);
                    return false;
                }
                opts.indices.push_back(*id);
                if (comma == std::string_view::npos) break;
                start = comma + 1;
            }
        } else if (arg == "--mode") {
            if (value == "nearest") {
                opts.horizon.mode = window::DownsampleMode::Nearest;
            } else if (value == "average") {
                opts.horizon.mode = window::DownsampleMode::Average;
            } else {
                fmt::print(stderr, "Error: unknown mode '{}'\n", value);
                return false;
            }
        } else {
            const auto n = parse_int(value);
            if (!n) {
                fmt::print(stderr, "Error: {} expects an integer, got '{}'\n", arg, value);
                return false;
            }
            if (arg == "--offset-hours") {
                opts.horizon.start_offset_seconds = *n * 3600;
            } else if (arg == "--hours") {
                opts.horizon.duration_seconds = *n * 3600;
            } else if (arg == "--granularity-hours") {
                opts.horizon.granularity_seconds = *n * 3600;
            } else if (arg == "--now") {
                opts.now = *n;
            } else {
                fmt::print(stderr, "Unknown option: {}\n", arg);
                return false;
            }
        }
    }
    if (opts.samples.empty() || opts.profile.empty()) {
        fmt::print(stderr, "Error: --samples and --profile are required\n");
        return false;
    }
    return true;
}

void print_evaluation(const core::Evaluation& ev) {
    if (ev.coverage) {
        fmt::print("warning: {}\n", ev.coverage->to_string());
    }

    for (std::size_t i = 0; i < ev.scores.size(); ++i) {
        const auto& r   = ev.scores[i];
        const auto& rec = ev.recommendations[i];
        if (!r.value) {
            fmt::print("{:>11}  {:<12} {:>6}  conf={:.2f}  {}\n",
                       r.timestamp, catalog::to_string(r.index), "-", r.confidence,
                       r.warning ? to_string(*r.warning) : "");
            continue;
        }
        std::string extra;
        if (r.minutes_to_discomfort) {
            extra = fmt::format("  ~{:.0f} min", *r.minutes_to_discomfort);
        }
        if (r.warning) {
            extra += fmt::format("  {}", to_string(*r.warning));
        }
        fmt::print("{:>11}  {:<12} {:6.1f}  conf={:.2f}  {}{}\n",
                   r.timestamp, catalog::to_string(r.index), *r.value, r.confidence,
                   rec ? rec->label : std::string("-"), extra);
    }

    fmt::print("\nSummary:\n");
    for (const auto& rec : ev.summary) {
        fmt::print("  {:<12} {} ({}, conf={:.2f})\n",
                   catalog::to_string(rec.index), rec.label,
                   catalog::to_string(rec.polarity), rec.confidence);
    }
}

int run(const Options& opts) {
    auto raw = core::CsvSampleLoader::load_csv(opts.samples);
    if (!raw) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.samples);
        return 1;
    }
    if (raw->empty()) {
        fmt::print(stderr, "Error: no valid samples loaded from '{}'\n", opts.samples);
        return 1;
    }

    const catalog::CatalogParameters params =
        opts.params.empty() ? catalog::CatalogParameters{}
                            : core::ConfigLoader::load_parameters(opts.params);
    const catalog::IndexCatalog catalog(params);
    const profile::UserProfile profile = core::ConfigLoader::load_profile(opts.profile);

    core::InMemoryStore store;
    core::Evaluator evaluator(catalog, store);
    evaluator.ingest("cli", *raw);

    const EpochSeconds now = opts.now.value_or(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());

    auto result = evaluator.evaluate("cli", opts.horizon, profile, opts.indices, now);
    if (!result) {
        fmt::print(stderr, "Error: evaluation was superseded\n");
        return 1;
    }
    print_evaluation(*result);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }
    const std::string_view first(argv[1]);
    if (first == "--help" || first == "-h") {
        print_usage();
        return 0;
    }

    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 1;
    }
    if (opts.verbose) {
        util::Logging::init(spdlog::level::debug);
    }

    try {
        return run(opts);
    } catch (const Error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
