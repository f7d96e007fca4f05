#include "poly_scatter/search/placement_search.hpp"

#include <span>
#include <stdexcept>

namespace poly_scatter {

const char* to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::None: return "accepted";
        case RejectReason::Deadline: return "deadline";
        case RejectReason::Exhausted: return "exhausted";
    }
    return "accepted";
}

PlacementSearch::PlacementSearch(const OverlapOracle& oracle, const Clock& clock)
    : PlacementSearch(oracle, clock, Config{}) {}

PlacementSearch::PlacementSearch(const OverlapOracle& oracle, const Clock& clock, const Config& config)
    : oracle_(oracle), clock_(clock), config_(config) {
    if (config_.max_attempts <= 0) {
        throw std::invalid_argument("PlacementSearch: max_attempts must be positive");
    }
    if (config_.margin < 0.0) {
        throw std::invalid_argument("PlacementSearch: margin must be non-negative");
    }
}

std::optional<AABB> PlacementSearch::sampling_domain(
    const Outline& outline,
    double scale,
    const CanvasBounds& bounds
) const {
    AABB shape{Vec2{0.0, 0.0}, Vec2{0.0, 0.0}};
    if (config_.fit_inside_canvas) {
        const AABB& local = outline.local_aabb();
        shape = AABB{local.min * scale, local.max * scale};
    }
    return bounds.anchor_domain(shape, config_.margin);
}

SearchResult PlacementSearch::try_place(
    const OutlinePtr& outline,
    Color color,
    double scale,
    const CanvasBounds& bounds,
    const SceneRegistry& registry,
    Clock::TimePoint deadline,
    RNG& rng
) const {
    Placement candidate(Vec2{0.0, 0.0}, outline, scale, color);

    SearchResult result;
    const std::optional<AABB> domain = sampling_domain(*outline, scale, bounds);
    if (!domain) {
        result.reason = RejectReason::Exhausted;
        return result;
    }

    const std::span<const PlacedFigure> placed(registry.figures());
    for (int attempt = 0; attempt < config_.max_attempts; ++attempt) {
        if (clock_.now() > deadline) {
            result.reason = RejectReason::Deadline;
            result.attempts = attempt;
            return result;
        }

        candidate.anchor = Vec2{
            rng.uniform(domain->min.x, domain->max.x),
            rng.uniform(domain->min.y, domain->max.y)
        };
        if (!oracle_.overlaps(placement_to_figure(candidate), placed)) {
            result.placement = candidate;
            result.attempts = attempt + 1;
            return result;
        }
    }

    result.reason = RejectReason::Exhausted;
    result.attempts = config_.max_attempts;
    return result;
}

}  // namespace poly_scatter
