#include "poly_scatter/core/scene_registry.hpp"

#include <utility>

namespace poly_scatter {

size_t SceneRegistry::add(const Placement& placement) {
    PlacedFigure fig = placement_to_figure(placement);
    extent_.expand(fig.aabb.min);
    extent_.expand(fig.aabb.max);
    placements_.push_back(placement);
    figures_.push_back(std::move(fig));
    return placements_.size() - 1;
}

}  // namespace poly_scatter
