#include "poly_scatter/core/outline.hpp"
#include "poly_scatter/geometry/kernel.hpp"

#include <stdexcept>
#include <utility>

namespace poly_scatter {

Outline::Outline(std::string name, Polygon vertices)
    : name_(std::move(name)), vertices_(std::move(vertices)) {
    if (vertices_.size() < 3) {
        throw std::invalid_argument(
            "Outline '" + name_ + "' needs at least 3 vertices, got " +
            std::to_string(vertices_.size()));
    }
    for (const auto& v : vertices_) {
        if (!v.is_finite()) {
            throw std::invalid_argument("Outline '" + name_ + "' has a non-finite vertex");
        }
    }
    centroid_ = poly_scatter::centroid(vertices_);
    local_aabb_.expand(vertices_);
}

OutlinePtr Outline::create(std::string name, Polygon vertices) {
    return std::make_shared<const Outline>(std::move(name), std::move(vertices));
}

}  // namespace poly_scatter
