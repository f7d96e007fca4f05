#pragma once

#include "../core/types.hpp"
#include "../core/outline.hpp"

namespace poly_scatter {

// Signed area of the parallelogram (b - a) x (c - a).
// Positive when a, b, c turn counter-clockwise.
[[nodiscard]] double orient(const Vec2& a, const Vec2& b, const Vec2& c);

// Signed polygon area (shoelace). Positive for counter-clockwise winding.
[[nodiscard]] double polygon_signed_area(const Polygon& poly);

// Arithmetic mean of the vertices. Returns (0, 0) for an empty polygon.
// For strongly concave shapes the result can fall outside the polygon.
[[nodiscard]] Vec2 centroid(const Polygon& poly);

// World-space vertices: anchor + scale * local[i]
[[nodiscard]] Polygon transform_polygon(const Polygon& local, const Vec2& anchor, double scale);

// World-space box of the scaled/translated polygon, grown by buffer on all sides
[[nodiscard]] AABB bounding_box(const Polygon& local, const Vec2& anchor, double scale, double buffer = 0.0);
[[nodiscard]] AABB bounding_box(const Outline& outline, const Vec2& anchor, double scale, double buffer = 0.0);

// Segment a-b against segment c-d, with both segments grown along their own
// direction by buffer / 2 past each endpoint, so segments whose ends come
// within buffer of each other register as intersecting. Near-zero-length
// segments are handled as a square of half-size buffer / 2 around the point.
[[nodiscard]] bool segments_intersect(
    const Vec2& a,
    const Vec2& b,
    const Vec2& c,
    const Vec2& d,
    double buffer = 0.0
);

// Even-odd ray casting (horizontal ray towards +x)
[[nodiscard]] bool point_in_polygon(const Vec2& point, const Polygon& poly);

// Euclidean distance from point to the closest point of the finite segment
[[nodiscard]] double point_to_segment_distance(const Vec2& point, const Vec2& seg_start, const Vec2& seg_end);

}  // namespace poly_scatter
