#pragma once

#include "../core/types.hpp"
#include <optional>

namespace poly_scatter {

// Axis-aligned drawing area that candidate anchors are sampled from
class CanvasBounds {
public:
    // Throws std::invalid_argument when a range is empty or non-finite
    CanvasBounds(double min_x, double max_x, double min_y, double max_y);

    // Symmetric ranges around the origin: x in [-w/2*span, w/2*span], same for y
    [[nodiscard]] static CanvasBounds from_display(double width, double height, double span = 0.8);

    // Shrink by margin on all sides. Throws std::invalid_argument when nothing is left.
    [[nodiscard]] CanvasBounds inset(double margin) const;

    // Anchors for which anchor + shape stays inside the canvas shrunk by margin.
    // `shape` is the scaled local box of the outline. Empty when the shape cannot fit.
    [[nodiscard]] std::optional<AABB> anchor_domain(const AABB& shape, double margin) const;

    // How far the box sticks out of the canvas (0 when fully inside)
    [[nodiscard]] double violation(const AABB& box) const;

    [[nodiscard]] double min_x() const { return min_x_; }
    [[nodiscard]] double max_x() const { return max_x_; }
    [[nodiscard]] double min_y() const { return min_y_; }
    [[nodiscard]] double max_y() const { return max_y_; }
    [[nodiscard]] double width() const { return max_x_ - min_x_; }
    [[nodiscard]] double height() const { return max_y_ - min_y_; }

    [[nodiscard]] AABB as_aabb() const {
        return AABB{Vec2{min_x_, min_y_}, Vec2{max_x_, max_y_}};
    }

    [[nodiscard]] bool contains(const Vec2& p) const { return as_aabb().contains(p); }

private:
    double min_x_;
    double max_x_;
    double min_y_;
    double max_y_;
};

}  // namespace poly_scatter
