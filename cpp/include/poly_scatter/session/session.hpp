#pragma once

#include "../core/clock.hpp"
#include "../core/scene_registry.hpp"
#include "../constraints/canvas_bounds.hpp"
#include "../constraints/overlap.hpp"
#include "../io/catalogue.hpp"
#include "../random/rng.hpp"
#include "../render/renderer.hpp"
#include "../search/placement_search.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace poly_scatter {

struct SessionConfig {
    double duration_seconds{5.0};
    double scale{1.0};
    uint64_t seed{1};
    std::vector<Color> colors{ALL_COLORS.begin(), ALL_COLORS.end()};
    OverlapOracle::Config overlap;
    PlacementSearch::Config search;
    bool verbose{true};  // log rejected shapes to stderr
};

struct SessionSummary {
    double elapsed_seconds{0.0};
    size_t placed{0};
    size_t rejected_deadline{0};
    size_t rejected_exhausted{0};
    uint64_t attempts{0};
    OverlapStats overlap;

    [[nodiscard]] size_t rejected() const { return rejected_deadline + rejected_exhausted; }
};

// Result of one shape choice
struct StepOutcome {
    std::string shape;
    Color color{Color::White};
    SearchResult result;
};

/**
 * One placement run: the explicit context that owns the scene.
 *
 * Each step picks a random template and color, searches for a free spot and,
 * on success, commits the placement to the registry and only then hands it to
 * the renderer. A rejected shape is logged and the run moves on. run() keeps
 * stepping until duration_seconds have elapsed on the injected clock.
 *
 * The catalogue, renderer and clock are borrowed and must outlive the session.
 */
class Session {
public:
    // Throws std::invalid_argument for an empty catalogue or color list,
    // a non-positive scale, a non-positive or overlong duration, or an
    // invalid oracle/search config
    Session(
        const Catalogue& catalogue,
        const CanvasBounds& canvas,
        const SessionConfig& config,
        Renderer& renderer,
        const Clock& clock
    );

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Starts the session clock. run() calls this; step-by-step drivers call it once first.
    void start();

    // One shape choice; starts the clock if needed.
    // Throws std::logic_error once the session is finished.
    StepOutcome step();

    // start(), step until the duration is used up, then finish()
    SessionSummary run();

    // Stamps the elapsed time and notifies the renderer. Idempotent.
    const SessionSummary& finish();

    [[nodiscard]] bool started() const { return started_; }
    [[nodiscard]] bool finished() const { return finished_; }
    [[nodiscard]] bool time_remaining() const;
    [[nodiscard]] Clock::TimePoint deadline() const { return deadline_; }
    [[nodiscard]] double elapsed_seconds() const;

    [[nodiscard]] const SceneRegistry& registry() const { return registry_; }
    [[nodiscard]] const OverlapOracle& oracle() const { return oracle_; }
    [[nodiscard]] const CanvasBounds& canvas() const { return canvas_; }
    [[nodiscard]] const SessionConfig& config() const { return config_; }
    [[nodiscard]] const SessionSummary& summary() const { return summary_; }

private:
    std::vector<OutlinePtr> templates_;
    CanvasBounds canvas_;
    SessionConfig config_;
    Renderer& renderer_;
    const Clock& clock_;
    RNG rng_;
    OverlapOracle oracle_;
    PlacementSearch search_;
    SceneRegistry registry_;

    Clock::TimePoint started_at_{};
    Clock::TimePoint deadline_{};
    bool started_{false};
    bool finished_{false};
    SessionSummary summary_;
};

}  // namespace poly_scatter
