#pragma once

#include "../core/clock.hpp"
#include "../core/placement.hpp"
#include "../core/scene_registry.hpp"
#include "../constraints/canvas_bounds.hpp"
#include "../constraints/overlap.hpp"
#include "../random/rng.hpp"
#include <optional>

namespace poly_scatter {

enum class RejectReason {
    None,
    Deadline,   // the clock passed the deadline mid-search
    Exhausted   // attempt ceiling reached, or no anchor can keep the shape on the canvas
};

[[nodiscard]] const char* to_string(RejectReason reason);

struct SearchResult {
    std::optional<Placement> placement;
    RejectReason reason{RejectReason::None};
    int attempts{0};

    [[nodiscard]] bool accepted() const { return placement.has_value(); }
};

/**
 * First-fit random placement of a single shape.
 *
 * Samples anchors uniformly over the sampling domain and returns the first
 * candidate the overlap oracle accepts. Every search ends: on acceptance,
 * after Config::max_attempts rejected candidates, or once the injected clock
 * reads past the deadline (checked before each attempt).
 *
 * The search never mutates the registry; committing is the caller's job.
 */
class PlacementSearch {
public:
    struct Config {
        int max_attempts{10000};
        double margin{50.0};           // inset of the sampling domain from the canvas edge
        bool fit_inside_canvas{true};  // also keep the scaled outline inside the inset canvas
    };

    PlacementSearch(const OverlapOracle& oracle, const Clock& clock);
    // Throws std::invalid_argument for a non-positive attempt ceiling or negative margin
    PlacementSearch(const OverlapOracle& oracle, const Clock& clock, const Config& config);

    // Throws std::invalid_argument for a null outline or non-positive scale
    [[nodiscard]] SearchResult try_place(
        const OutlinePtr& outline,
        Color color,
        double scale,
        const CanvasBounds& bounds,
        const SceneRegistry& registry,
        Clock::TimePoint deadline,
        RNG& rng
    ) const;

    // Region anchors are drawn from for this outline and scale
    [[nodiscard]] std::optional<AABB> sampling_domain(
        const Outline& outline,
        double scale,
        const CanvasBounds& bounds
    ) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    const OverlapOracle& oracle_;
    const Clock& clock_;
    Config config_;
};

}  // namespace poly_scatter
