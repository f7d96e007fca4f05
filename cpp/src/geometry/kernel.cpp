#include "poly_scatter/geometry/kernel.hpp"

#include <algorithm>
#include <cmath>

namespace poly_scatter {
namespace {

constexpr double kDegenerateLength = 1e-9;

[[nodiscard]] inline int orientation_sign(double o) {
    if (o > EPSILON) return 1;
    if (o < -EPSILON) return -1;
    return 0;
}

[[nodiscard]] inline bool is_degenerate(const Vec2& p, const Vec2& q) {
    return (q - p).length_squared() < kDegenerateLength * kDegenerateLength;
}

// Grow segment p-q by amount past both endpoints
inline void extend_segment(Vec2& p, Vec2& q, double amount) {
    if (amount <= 0.0) return;
    const Vec2 d = q - p;
    const Vec2 u = d / d.length();
    p -= u * amount;
    q += u * amount;
}

[[nodiscard]] inline bool intervals_overlap(double a0, double a1, double b0, double b1) {
    return std::min(a0, a1) <= std::max(b0, b1) + EPSILON &&
           std::min(b0, b1) <= std::max(a0, a1) + EPSILON;
}

[[nodiscard]] inline AABB point_square(const Vec2& p, double half) {
    const double h = std::max(half, kDegenerateLength);
    return AABB{Vec2{p.x - h, p.y - h}, Vec2{p.x + h, p.y + h}};
}

// Liang-Barsky clipping of p-q against the box
[[nodiscard]] bool segment_intersects_box(const Vec2& p, const Vec2& q, const AABB& box) {
    const Vec2 d = q - p;
    double t0 = 0.0;
    double t1 = 1.0;
    auto clip = [&](double pk, double qk) {
        if (std::abs(pk) < EPSILON) {
            return qk >= -EPSILON;
        }
        const double t = qk / pk;
        if (pk < 0.0) {
            t0 = std::max(t0, t);
        } else {
            t1 = std::min(t1, t);
        }
        return t0 <= t1;
    };
    return clip(-d.x, p.x - box.min.x) &&
           clip(d.x, box.max.x - p.x) &&
           clip(-d.y, p.y - box.min.y) &&
           clip(d.y, box.max.y - p.y);
}

}  // namespace

double orient(const Vec2& a, const Vec2& b, const Vec2& c) {
    return (b - a).cross(c - a);
}

double polygon_signed_area(const Polygon& poly) {
    const size_t n = poly.size();
    if (n < 3) return 0.0;
    double acc = 0.0;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        acc += poly[j].cross(poly[i]);
    }
    return 0.5 * acc;
}

Vec2 centroid(const Polygon& poly) {
    if (poly.empty()) return Vec2{};
    Vec2 sum;
    for (const auto& v : poly) {
        sum += v;
    }
    return sum / static_cast<double>(poly.size());
}

Polygon transform_polygon(const Polygon& local, const Vec2& anchor, double scale) {
    Polygon world;
    world.reserve(local.size());
    for (const auto& v : local) {
        world.push_back(anchor + v * scale);
    }
    return world;
}

AABB bounding_box(const Polygon& local, const Vec2& anchor, double scale, double buffer) {
    AABB box;
    for (const auto& v : local) {
        box.expand(anchor + v * scale);
    }
    return box.inflated(buffer);
}

AABB bounding_box(const Outline& outline, const Vec2& anchor, double scale, double buffer) {
    return bounding_box(outline.vertices(), anchor, scale, buffer);
}

bool segments_intersect(
    const Vec2& a,
    const Vec2& b,
    const Vec2& c,
    const Vec2& d,
    double buffer
) {
    const double half = std::max(buffer, 0.0) * 0.5;
    const bool ab_point = is_degenerate(a, b);
    const bool cd_point = is_degenerate(c, d);

    if (ab_point && cd_point) {
        return point_square(a, half).intersects(point_square(c, half));
    }
    if (ab_point || cd_point) {
        Vec2 p = ab_point ? c : a;
        Vec2 q = ab_point ? d : b;
        extend_segment(p, q, half);
        return segment_intersects_box(p, q, point_square(ab_point ? a : c, half));
    }

    Vec2 a2 = a, b2 = b, c2 = c, d2 = d;
    extend_segment(a2, b2, half);
    extend_segment(c2, d2, half);

    const int o1 = orientation_sign(orient(a2, b2, c2));
    const int o2 = orientation_sign(orient(a2, b2, d2));
    const int o3 = orientation_sign(orient(c2, d2, a2));
    const int o4 = orientation_sign(orient(c2, d2, b2));

    if (o1 == 0 && o2 == 0) {
        // Colinear: overlapping projections on both axes
        return intervals_overlap(a2.x, b2.x, c2.x, d2.x) &&
               intervals_overlap(a2.y, b2.y, c2.y, d2.y);
    }

    return o1 != o2 && o3 != o4;
}

bool point_in_polygon(const Vec2& point, const Polygon& poly) {
    const size_t n = poly.size();
    if (n < 3) return false;

    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Vec2& pi = poly[i];
        const Vec2& pj = poly[j];
        if ((pi.y > point.y) == (pj.y > point.y)) {
            continue;
        }
        double denom = pj.y - pi.y;
        if (std::abs(denom) < EPSILON) {
            denom = denom < 0.0 ? -EPSILON : EPSILON;
        }
        const double x_cross = pi.x + (point.y - pi.y) * (pj.x - pi.x) / denom;
        if (point.x < x_cross) {
            inside = !inside;
        }
    }
    return inside;
}

double point_to_segment_distance(const Vec2& point, const Vec2& seg_start, const Vec2& seg_end) {
    const Vec2 d = seg_end - seg_start;
    const double len2 = d.length_squared();
    if (len2 < kDegenerateLength * kDegenerateLength) {
        return (point - seg_start).length();
    }
    const double t = std::clamp((point - seg_start).dot(d) / len2, 0.0, 1.0);
    return (point - (seg_start + d * t)).length();
}

}  // namespace poly_scatter
