#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace poly_scatter {

// 2D point / vector in world or template space
struct Vec2 {
    double x{0.0};
    double y{0.0};

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    [[nodiscard]] constexpr Vec2 operator+(const Vec2& other) const {
        return Vec2{x + other.x, y + other.y};
    }

    [[nodiscard]] constexpr Vec2 operator-(const Vec2& other) const {
        return Vec2{x - other.x, y - other.y};
    }

    [[nodiscard]] constexpr Vec2 operator*(double scalar) const {
        return Vec2{x * scalar, y * scalar};
    }

    [[nodiscard]] constexpr Vec2 operator/(double scalar) const {
        return Vec2{x / scalar, y / scalar};
    }

    constexpr Vec2& operator+=(const Vec2& other) {
        x += other.x;
        y += other.y;
        return *this;
    }

    constexpr Vec2& operator-=(const Vec2& other) {
        x -= other.x;
        y -= other.y;
        return *this;
    }

    [[nodiscard]] constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    [[nodiscard]] constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    [[nodiscard]] constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    [[nodiscard]] double length() const {
        return std::sqrt(x * x + y * y);
    }

    [[nodiscard]] constexpr double length_squared() const {
        return x * x + y * y;
    }

    [[nodiscard]] bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y);
    }
};

[[nodiscard]] inline constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

using Polygon = std::vector<Vec2>;

// Axis-aligned bounding box
struct AABB {
    Vec2 min{std::numeric_limits<double>::max(), std::numeric_limits<double>::max()};
    Vec2 max{std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};

    constexpr AABB() = default;
    constexpr AABB(const Vec2& min_, const Vec2& max_) : min(min_), max(max_) {}

    void expand(const Vec2& point) {
        min.x = std::min(min.x, point.x);
        min.y = std::min(min.y, point.y);
        max.x = std::max(max.x, point.x);
        max.y = std::max(max.y, point.y);
    }

    void expand(const Polygon& poly) {
        for (const auto& p : poly) {
            expand(p);
        }
    }

    // Grow by margin on all four sides
    [[nodiscard]] AABB inflated(double margin) const {
        return AABB{Vec2{min.x - margin, min.y - margin}, Vec2{max.x + margin, max.y + margin}};
    }

    [[nodiscard]] bool is_empty() const {
        return min.x > max.x || min.y > max.y;
    }

    [[nodiscard]] Vec2 size() const {
        return Vec2{max.x - min.x, max.y - min.y};
    }

    [[nodiscard]] bool contains(const Vec2& point) const {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y;
    }

    [[nodiscard]] bool contains(const AABB& other) const {
        return other.min.x >= min.x && other.max.x <= max.x &&
               other.min.y >= min.y && other.max.y <= max.y;
    }

    // Touching boxes count as intersecting
    [[nodiscard]] bool intersects(const AABB& other) const {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y;
    }
};

// Fill colors the driver picks from
enum class Color : uint8_t {
    Red,
    Blue,
    Green,
    Yellow,
    Purple,
    Orange,
    White
};

constexpr std::array<Color, 7> ALL_COLORS = {
    Color::Red, Color::Blue, Color::Green, Color::Yellow,
    Color::Purple, Color::Orange, Color::White
};

struct Rgb {
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};
};

[[nodiscard]] std::string_view to_string(Color color);
[[nodiscard]] Rgb to_rgb(Color color);

// Parse a color name (case-insensitive). Throws std::invalid_argument on unknown names.
[[nodiscard]] Color color_from_string(std::string_view name);

// Common constants
constexpr double EPSILON = 1e-9;
constexpr double DEFAULT_BUFFER = 3.5;

}  // namespace poly_scatter
