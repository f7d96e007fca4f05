#include <iomanip>
#include <iostream>
#include "poly_scatter/poly_scatter.hpp"

using namespace poly_scatter;

int main() {
    std::cout << "Poly Scatter Example\n";
    std::cout << "====================\n\n";

    // Build a small catalogue in code
    Catalogue catalogue;
    catalogue.insert(Outline::create("square", {{-10, -10}, {10, -10}, {10, 10}, {-10, 10}}));
    catalogue.insert(Outline::create("triangle", {{-10, -8}, {10, -8}, {0, 12}}));
    catalogue.insert(Outline::create("arrow", {{-10, -3}, {2, -3}, {2, -8}, {10, 0}, {2, 8}, {2, 3}, {-10, 3}}));

    const CanvasBounds canvas = CanvasBounds::from_display(800, 800);
    std::cout << "Canvas x [" << canvas.min_x() << ", " << canvas.max_x()
              << "], y [" << canvas.min_y() << ", " << canvas.max_y() << "]\n\n";

    SessionConfig config;
    config.duration_seconds = 5.0;
    config.scale = 2.0;
    config.seed = 42;
    config.verbose = false;

    SvgRenderer renderer("basic_scene.svg", canvas, "basic example");
    SteadyClock clock;
    Session session(catalogue, canvas, config, renderer, clock);

    const SessionSummary summary = session.run();

    std::cout << "Placed:              " << summary.placed << "\n";
    std::cout << "Rejected (deadline): " << summary.rejected_deadline << "\n";
    std::cout << "Rejected (attempts): " << summary.rejected_exhausted << "\n";
    std::cout << "Candidate attempts:  " << summary.attempts << "\n";
    std::cout << "Elapsed:             " << std::fixed << std::setprecision(2)
              << summary.elapsed_seconds << " s\n";

    const auto violation = session.oracle().find_violation(session.registry());
    std::cout << "Clearance check:     " << (violation ? "FAILED" : "ok") << "\n";
    std::cout << "\nScene written to " << renderer.path() << "\n";
    return violation ? 1 : 0;
}
