#include "poly_scatter/core/placement.hpp"
#include "poly_scatter/geometry/kernel.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace poly_scatter {

Placement::Placement(const Vec2& anchor_, OutlinePtr outline_, double scale_, Color color_)
    : anchor(anchor_), outline(std::move(outline_)), scale(scale_), color(color_) {
    if (!outline) {
        throw std::invalid_argument("Placement requires an outline");
    }
    if (!(scale > 0.0) || !std::isfinite(scale)) {
        throw std::invalid_argument("Placement scale must be positive, got " + std::to_string(scale));
    }
}

PlacedFigure placement_to_figure(const Placement& placement) {
    PlacedFigure fig;
    fig.vertices = transform_polygon(placement.outline->vertices(), placement.anchor, placement.scale);
    fig.centroid = placement.world_centroid();
    fig.aabb.expand(fig.vertices);
    return fig;
}

}  // namespace poly_scatter
