#include "poly_scatter/constraints/canvas_bounds.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace poly_scatter {

CanvasBounds::CanvasBounds(double min_x, double max_x, double min_y, double max_y)
    : min_x_(min_x), max_x_(max_x), min_y_(min_y), max_y_(max_y) {
    if (!std::isfinite(min_x) || !std::isfinite(max_x) ||
        !std::isfinite(min_y) || !std::isfinite(max_y)) {
        throw std::invalid_argument("CanvasBounds: non-finite range");
    }
    if (min_x > max_x || min_y > max_y) {
        throw std::invalid_argument(
            "CanvasBounds: empty range x=[" + std::to_string(min_x) + ", " + std::to_string(max_x) +
            "] y=[" + std::to_string(min_y) + ", " + std::to_string(max_y) + "]");
    }
}

CanvasBounds CanvasBounds::from_display(double width, double height, double span) {
    if (!(width > 0.0) || !(height > 0.0) || !(span > 0.0)) {
        throw std::invalid_argument("CanvasBounds: display size and span must be positive");
    }
    const double half_w = width / 2.0 * span;
    const double half_h = height / 2.0 * span;
    return CanvasBounds(-half_w, half_w, -half_h, half_h);
}

CanvasBounds CanvasBounds::inset(double margin) const {
    return CanvasBounds(min_x_ + margin, max_x_ - margin, min_y_ + margin, max_y_ - margin);
}

std::optional<AABB> CanvasBounds::anchor_domain(const AABB& shape, double margin) const {
    AABB domain{
        Vec2{min_x_ + margin - shape.min.x, min_y_ + margin - shape.min.y},
        Vec2{max_x_ - margin - shape.max.x, max_y_ - margin - shape.max.y}
    };
    if (domain.is_empty()) {
        return std::nullopt;
    }
    return domain;
}

double CanvasBounds::violation(const AABB& box) const {
    double v = 0.0;
    v = std::max(v, box.max.x - max_x_);
    v = std::max(v, min_x_ - box.min.x);
    v = std::max(v, box.max.y - max_y_);
    v = std::max(v, min_y_ - box.min.y);
    return v;
}

}  // namespace poly_scatter
