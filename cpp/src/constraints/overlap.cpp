#include "poly_scatter/constraints/overlap.hpp"
#include "poly_scatter/geometry/kernel.hpp"
#include <cmath>
#include <cstdint>
#include <stdexcept>

#ifdef ENABLE_OPENMP
#include <omp.h>
#endif

namespace poly_scatter {

const char* to_string(OverlapKind kind) {
    switch (kind) {
        case OverlapKind::None: return "none";
        case OverlapKind::Proximity: return "proximity";
        case OverlapKind::EdgeIntersection: return "edge-intersection";
        case OverlapKind::Containment: return "containment";
    }
    return "none";
}

OverlapOracle::OverlapOracle(const Config& config) : config_(config) {
    if (!std::isfinite(config_.buffer) || config_.buffer < 0.0) {
        throw std::invalid_argument("OverlapOracle: buffer must be a non-negative number");
    }
}

bool OverlapOracle::vertices_too_close(const PlacedFigure& from, const PlacedFigure& to) const {
    const double limit = config_.buffer + config_.distance_tolerance;
    const double limit2 = limit * limit;
    const size_t n = to.size();
    for (const Vec2& v : from.vertices) {
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            if ((v - to.vertices[i]).length_squared() <= limit2) {
                return true;
            }
            if (point_to_segment_distance(v, to.vertices[j], to.vertices[i]) <= limit) {
                return true;
            }
        }
    }
    return false;
}

bool OverlapOracle::edges_intersect(const PlacedFigure& a, const PlacedFigure& b) const {
    const size_t na = a.size();
    const size_t nb = b.size();
    for (size_t i = 0, pi = na - 1; i < na; pi = i++) {
        for (size_t j = 0, pj = nb - 1; j < nb; pj = j++) {
            if (segments_intersect(a.vertices[pi], a.vertices[i], b.vertices[pj], b.vertices[j], config_.buffer)) {
                return true;
            }
        }
    }
    return false;
}

bool OverlapOracle::centroid_inside(const PlacedFigure& inner, const PlacedFigure& outer) {
    return point_in_polygon(inner.centroid, outer.vertices);
}

OverlapKind OverlapOracle::classify(const PlacedFigure& a, const PlacedFigure& b, OverlapStats* stats) const {
    if (stats) ++stats->pairs_tested;

    // Pass 1: proximity and edge tests, skipped when the buffered boxes are apart
    const bool boxes_touch = a.aabb.inflated(config_.buffer).intersects(b.aabb.inflated(config_.buffer));
    if (boxes_touch) {
        if (vertices_too_close(a, b) || vertices_too_close(b, a)) {
            if (stats) ++stats->proximity_rejections;
            return OverlapKind::Proximity;
        }
        if (edges_intersect(a, b)) {
            if (stats) ++stats->edge_rejections;
            return OverlapKind::EdgeIntersection;
        }
    } else if (stats) {
        ++stats->broad_phase_skips;
    }

    // Pass 2: containment, run for every pair regardless of pass 1
    if (centroid_inside(a, b) || centroid_inside(b, a)) {
        if (stats) ++stats->containment_rejections;
        return OverlapKind::Containment;
    }
    return OverlapKind::None;
}

bool OverlapOracle::overlaps(const PlacedFigure& candidate, std::span<const PlacedFigure> others) const {
    for (const auto& other : others) {
        if (classify(candidate, other, &stats_) != OverlapKind::None) {
            return true;
        }
    }
    return false;
}

bool OverlapOracle::overlaps(const Placement& candidate, const SceneRegistry& registry) const {
    const PlacedFigure fig = placement_to_figure(candidate);
    return overlaps(fig, std::span<const PlacedFigure>(registry.figures()));
}

bool OverlapOracle::overlaps_pair(const Placement& a, const Placement& b) const {
    return classify(placement_to_figure(a), placement_to_figure(b), &stats_) != OverlapKind::None;
}

std::optional<std::pair<size_t, size_t>> OverlapOracle::find_violation(const SceneRegistry& registry) const {
    const auto& figs = registry.figures();
    const int64_t n = static_cast<int64_t>(figs.size());
    int64_t best_i = n;
    int64_t best_j = n;

#ifdef ENABLE_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int64_t i = 0; i < n; ++i) {
        for (int64_t j = i + 1; j < n; ++j) {
            if (classify(figs[static_cast<size_t>(i)], figs[static_cast<size_t>(j)]) == OverlapKind::None) {
                continue;
            }
#ifdef ENABLE_OPENMP
            #pragma omp critical
#endif
            {
                if (i < best_i || (i == best_i && j < best_j)) {
                    best_i = i;
                    best_j = j;
                }
            }
            break;
        }
    }

    if (best_i == n) {
        return std::nullopt;
    }
    return std::make_pair(static_cast<size_t>(best_i), static_cast<size_t>(best_j));
}

}  // namespace poly_scatter
