#pragma once

#include "types.hpp"
#include <memory>
#include <string>

namespace poly_scatter {

class Outline;

// Outlines are shared by every placement that uses the template
using OutlinePtr = std::shared_ptr<const Outline>;

// Immutable polygon template in local (unscaled, untranslated) coordinates.
// The polygon is closed implicitly: the last vertex connects back to the first.
class Outline {
public:
    // Throws std::invalid_argument for fewer than 3 vertices or non-finite coordinates
    Outline(std::string name, Polygon vertices);

    [[nodiscard]] static OutlinePtr create(std::string name, Polygon vertices);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const Polygon& vertices() const { return vertices_; }
    [[nodiscard]] size_t size() const { return vertices_.size(); }
    [[nodiscard]] const Vec2& operator[](size_t i) const { return vertices_[i]; }

    // Arithmetic mean of the vertices
    [[nodiscard]] const Vec2& centroid() const { return centroid_; }
    [[nodiscard]] const AABB& local_aabb() const { return local_aabb_; }

private:
    std::string name_;
    Polygon vertices_;
    Vec2 centroid_;
    AABB local_aabb_;
};

}  // namespace poly_scatter
