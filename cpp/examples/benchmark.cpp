#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include "poly_scatter/poly_scatter.hpp"
#include "poly_scatter/io/cli_parse.hpp"

using namespace poly_scatter;

int main(int argc, char** argv) {
    int num_pairs = 2000000;
    double duration = 5.0;
    try {
        if (argc > 1) {
            num_pairs = static_cast<int>(parse_int64(argv[1]));
        }
        if (argc > 2) {
            duration = parse_double(argv[2]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    auto star = Outline::create("star", {
        {0, 10}, {2.4, 3.1}, {9.5, 3.1}, {3.8, -1.2}, {5.9, -8.1},
        {0, -3.8}, {-5.9, -8.1}, {-3.8, -1.2}, {-9.5, 3.1}, {-2.4, 3.1}
    });

    OverlapOracle oracle;
    RNG rng(42);

    // Pairwise oracle throughput on random nearby pairs
    std::vector<Placement> candidates;
    candidates.reserve(1024);
    for (int i = 0; i < 1024; ++i) {
        candidates.emplace_back(Vec2{rng.uniform(-40.0, 40.0), rng.uniform(-40.0, 40.0)}, star, 1.0, Color::White);
    }

    uint64_t overlapping = 0;
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < num_pairs; ++i) {
        const Placement& a = candidates[static_cast<size_t>(i) % candidates.size()];
        const Placement& b = candidates[static_cast<size_t>(i * 7 + 3) % candidates.size()];
        overlapping += oracle.overlaps_pair(a, b) ? 1 : 0;
    }
    auto end = std::chrono::high_resolution_clock::now();

    double seconds = std::chrono::duration<double>(end - start).count();
    std::cout << "[Pairs]\n";
    std::cout << "Pairs:           " << num_pairs << "\n";
    std::cout << "Overlapping:     " << overlapping << "\n";
    std::cout << "Time:            " << seconds << " s\n";
    std::cout << "Pairs/sec:       " << (num_pairs / seconds) << "\n";

    // Full session throughput
    Catalogue catalogue;
    catalogue.insert(star);
    catalogue.insert(Outline::create("square", {{-10, -10}, {10, -10}, {10, 10}, {-10, 10}}));

    const CanvasBounds canvas = CanvasBounds::from_display(1000, 1000);
    SessionConfig config;
    config.duration_seconds = duration;
    config.verbose = false;

    NullRenderer renderer;
    SteadyClock clock;
    Session session(catalogue, canvas, config, renderer, clock);
    const SessionSummary summary = session.run();

    std::cout << "\n[Session]\n";
    std::cout << "Placed:          " << summary.placed << "\n";
    std::cout << "Attempts:        " << summary.attempts << "\n";
    std::cout << "Pairs tested:    " << summary.overlap.pairs_tested << "\n";
    std::cout << "Broad skips:     " << summary.overlap.broad_phase_skips << "\n";
    std::cout << "Attempts/sec:    " << (static_cast<double>(summary.attempts) / summary.elapsed_seconds) << "\n";
    return 0;
}
