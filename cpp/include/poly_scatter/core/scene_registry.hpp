#pragma once

#include "placement.hpp"
#include <vector>

namespace poly_scatter {

// Append-only, ordered collection of committed placements.
// World-space figures are cached alongside so the overlap checks never
// re-transform an outline that is already on the canvas.
class SceneRegistry {
public:
    SceneRegistry() = default;

    // Only mutator. Returns the index of the new entry.
    size_t add(const Placement& placement);

    [[nodiscard]] const std::vector<Placement>& all() const { return placements_; }
    [[nodiscard]] const std::vector<PlacedFigure>& figures() const { return figures_; }

    [[nodiscard]] const Placement& operator[](size_t i) const { return placements_[i]; }
    [[nodiscard]] const PlacedFigure& figure(size_t i) const { return figures_[i]; }
    [[nodiscard]] const Placement& back() const { return placements_.back(); }

    [[nodiscard]] size_t size() const { return placements_.size(); }
    [[nodiscard]] bool empty() const { return placements_.empty(); }

    // Box around every committed figure (empty box when nothing is placed)
    [[nodiscard]] const AABB& extent() const { return extent_; }

private:
    std::vector<Placement> placements_;
    std::vector<PlacedFigure> figures_;
    AABB extent_;
};

}  // namespace poly_scatter
