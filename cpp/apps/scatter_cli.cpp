// Headless driver: load the catalogue, ask for (or take) the run parameters,
// scatter shapes for the requested time and print the summary lines.
#include "poly_scatter/poly_scatter.hpp"
#include "poly_scatter/io/cli_parse.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace poly_scatter;

namespace {

struct CliOptions {
    std::string shapes_path{"shapes.txt"};
    std::string svg_path;
    std::string tag;
    double width{1000.0};
    double height{1000.0};
    double span{0.8};
    double buffer{DEFAULT_BUFFER};
    bool verify{false};
    bool quiet{false};

    // Any of these skips the interactive prompt
    bool params_given{false};
    RunParams params;
};

void print_usage(const char* argv0) {
    std::cerr
        << "Usage: " << argv0 << " [options]\n"
        << "  --shapes PATH      shape catalogue (default shapes.txt)\n"
        << "  --svg PATH         write the final scene as SVG\n"
        << "  --tag TEXT         prefix for the summary lines\n"
        << "  --width W          display width (default 1000)\n"
        << "  --height H         display height (default 1000)\n"
        << "  --span S           fraction of the display used (default 0.8)\n"
        << "  --buffer B         clearance between shapes (default 3.5)\n"
        << "  --scale S          scale factor, 1..10\n"
        << "  --seed N           random seed, 1..99\n"
        << "  --duration SEC     run time, 5..30\n"
        << "  --terminate        close the display when the run ends\n"
        << "  --verify           re-check every committed pair after the run\n"
        << "  --quiet            do not log rejected shapes\n";
}

CliOptions parse_args(int argc, char** argv) {
    CliOptions opts;
    const ParamLimits limits;
    opts.params = default_run_params(limits);

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--shapes") {
            opts.shapes_path = require_arg(i, argc, argv, arg);
        } else if (arg == "--svg") {
            opts.svg_path = require_arg(i, argc, argv, arg);
        } else if (arg == "--tag") {
            opts.tag = require_arg(i, argc, argv, arg);
        } else if (arg == "--width") {
            opts.width = parse_double(require_arg(i, argc, argv, arg));
        } else if (arg == "--height") {
            opts.height = parse_double(require_arg(i, argc, argv, arg));
        } else if (arg == "--span") {
            opts.span = parse_double(require_arg(i, argc, argv, arg));
        } else if (arg == "--buffer") {
            opts.buffer = parse_double(require_arg(i, argc, argv, arg));
        } else if (arg == "--scale") {
            opts.params.scale = clamp_scale(parse_double(require_arg(i, argc, argv, arg)), limits);
            opts.params_given = true;
        } else if (arg == "--seed") {
            opts.params.seed = clamp_seed(parse_int64(require_arg(i, argc, argv, arg)), limits);
            opts.params_given = true;
        } else if (arg == "--duration") {
            opts.params.duration_seconds = clamp_duration(parse_double(require_arg(i, argc, argv, arg)), limits);
            opts.params_given = true;
        } else if (arg == "--terminate") {
            opts.params.terminate = true;
            opts.params_given = true;
        } else if (arg == "--verify") {
            opts.verify = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            throw std::runtime_error("Unknown argument: " + arg);
        }
    }
    return opts;
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    CatalogueLoadReport report;
    Catalogue catalogue;
    try {
        catalogue = load_catalogue(opts.shapes_path, &report);
    } catch (const CatalogueError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    for (const auto& warning : report.warnings) {
        std::cerr << "[Catalogue] " << warning << "\n";
    }
    std::cerr << "[Catalogue] " << catalogue.size() << " shapes loaded from " << opts.shapes_path << "\n";

    try {
        RunParams params = opts.params;
        if (!opts.params_given) {
            params = prompt_run_params(std::cin, std::cout);
        }

        const CanvasBounds canvas = CanvasBounds::from_display(opts.width, opts.height, opts.span);

        SessionConfig config;
        config.duration_seconds = params.duration_seconds;
        config.scale = params.scale;
        config.seed = params.seed;
        config.overlap.buffer = opts.buffer;
        config.verbose = !opts.quiet;

        RendererPtr renderer;
        if (opts.svg_path.empty()) {
            renderer = std::make_unique<NullRenderer>();
        } else {
            renderer = std::make_unique<SvgRenderer>(opts.svg_path, canvas, opts.tag);
        }

        SteadyClock clock;
        Session session(catalogue, canvas, config, *renderer, clock);

        const WallTime started = std::chrono::system_clock::now();
        const SessionSummary summary = session.run();
        const WallTime ended = std::chrono::system_clock::now();

        std::cout << format_summary(opts.tag, started, ended, summary.placed) << "\n";
        std::cout << format_count_line(opts.tag, summary.placed) << "\n";

        if (!opts.quiet) {
            std::cerr << "[Session] attempts=" << summary.attempts
                      << " rejected(deadline)=" << summary.rejected_deadline
                      << " rejected(exhausted)=" << summary.rejected_exhausted
                      << " pairs=" << summary.overlap.pairs_tested
                      << " broad-phase skips=" << summary.overlap.broad_phase_skips << "\n";
        }

        if (opts.verify) {
            const auto violation = session.oracle().find_violation(session.registry());
            if (violation) {
                std::cerr << "[Verify] placements " << violation->first << " and "
                          << violation->second << " are closer than the buffer\n";
                return 3;
            }
            std::cerr << "[Verify] " << session.registry().size() << " placements, no violations\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
