#pragma once

#include "types.hpp"
#include "outline.hpp"

namespace poly_scatter {

// One committed (or candidate) instance of an outline
struct Placement {
    Vec2 anchor{0.0, 0.0};
    OutlinePtr outline;
    double scale{1.0};
    Color color{Color::White};

    Placement() = default;
    // Throws std::invalid_argument for a null outline or a non-positive scale
    Placement(const Vec2& anchor_, OutlinePtr outline_, double scale_, Color color_);

    [[nodiscard]] Vec2 world_vertex(size_t i) const {
        return anchor + (*outline)[i] * scale;
    }

    [[nodiscard]] Vec2 world_centroid() const {
        return anchor + outline->centroid() * scale;
    }

    [[nodiscard]] const std::string& name() const { return outline->name(); }
};

// World-space geometry of a placement, computed once and cached
struct PlacedFigure {
    Polygon vertices;
    Vec2 centroid;
    AABB aabb;  // unbuffered

    [[nodiscard]] size_t size() const { return vertices.size(); }
};

[[nodiscard]] PlacedFigure placement_to_figure(const Placement& placement);

}  // namespace poly_scatter
