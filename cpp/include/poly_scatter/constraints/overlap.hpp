#pragma once

#include "../core/placement.hpp"
#include "../core/scene_registry.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <utility>

namespace poly_scatter {

// Why a pair was rejected, in the order the checks run
enum class OverlapKind {
    None,
    Proximity,         // a vertex within buffer of the other outline
    EdgeIntersection,  // buffered edges cross
    Containment        // one centroid inside the other polygon
};

[[nodiscard]] const char* to_string(OverlapKind kind);

struct OverlapStats {
    uint64_t pairs_tested{0};
    uint64_t broad_phase_skips{0};
    uint64_t proximity_rejections{0};
    uint64_t edge_rejections{0};
    uint64_t containment_rejections{0};

    [[nodiscard]] uint64_t rejections() const {
        return proximity_rejections + edge_rejections + containment_rejections;
    }
};

// Decides whether a candidate overlaps, touches (within buffer) or nests with
// committed placements.
//
// Per pair the decision runs in two independent passes:
//   1. gated by the buffered bounding boxes: vertex/edge proximity, then
//      buffered edge intersection;
//   2. never gated: centroid containment in both directions.
class OverlapOracle {
public:
    struct Config {
        double buffer{DEFAULT_BUFFER};        // minimum clearance between shapes
        double distance_tolerance{1e-9};      // distances this close to buffer count as touching
    };

    OverlapOracle() = default;
    // Throws std::invalid_argument for a negative or non-finite buffer
    explicit OverlapOracle(const Config& config);

    [[nodiscard]] bool overlaps(const Placement& candidate, const SceneRegistry& registry) const;
    [[nodiscard]] bool overlaps(const PlacedFigure& candidate, std::span<const PlacedFigure> others) const;

    // Symmetric: overlaps_pair(a, b) == overlaps_pair(b, a)
    [[nodiscard]] bool overlaps_pair(const Placement& a, const Placement& b) const;

    // Full decision for one pair; stats are only recorded when `stats` is given
    [[nodiscard]] OverlapKind classify(
        const PlacedFigure& a,
        const PlacedFigure& b,
        OverlapStats* stats = nullptr
    ) const;

    // Lowest (i, j) pair of committed entries that violates the clearance
    [[nodiscard]] std::optional<std::pair<size_t, size_t>> find_violation(const SceneRegistry& registry) const;

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] double buffer() const { return config_.buffer; }

    [[nodiscard]] const OverlapStats& stats() const { return stats_; }
    void reset_stats() { stats_ = OverlapStats{}; }

private:
    Config config_;
    mutable OverlapStats stats_;

    // Some vertex of `from` lies within buffer of a vertex or edge of `to`
    [[nodiscard]] bool vertices_too_close(const PlacedFigure& from, const PlacedFigure& to) const;
    [[nodiscard]] bool edges_intersect(const PlacedFigure& a, const PlacedFigure& b) const;
    [[nodiscard]] static bool centroid_inside(const PlacedFigure& inner, const PlacedFigure& outer);
};

}  // namespace poly_scatter
