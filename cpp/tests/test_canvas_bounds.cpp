#include <catch2/catch.hpp>
#include "poly_scatter/constraints/canvas_bounds.hpp"

#include <limits>
#include <stdexcept>

using namespace poly_scatter;

TEST_CASE("Canvas from display size", "[bounds]") {
    CanvasBounds canvas = CanvasBounds::from_display(1000.0, 800.0);
    REQUIRE(canvas.min_x() == Approx(-400.0));
    REQUIRE(canvas.max_x() == Approx(400.0));
    REQUIRE(canvas.min_y() == Approx(-320.0));
    REQUIRE(canvas.max_y() == Approx(320.0));
    REQUIRE(canvas.width() == Approx(800.0));
    REQUIRE(canvas.height() == Approx(640.0));

    CanvasBounds full = CanvasBounds::from_display(1000.0, 800.0, 1.0);
    REQUIRE(full.max_x() == Approx(500.0));

    REQUIRE_THROWS_AS(CanvasBounds::from_display(0.0, 800.0), std::invalid_argument);
    REQUIRE_THROWS_AS(CanvasBounds::from_display(1000.0, 800.0, -0.5), std::invalid_argument);
}

TEST_CASE("Canvas validation", "[bounds]") {
    REQUIRE_THROWS_AS(CanvasBounds(1.0, -1.0, 0.0, 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(CanvasBounds(0.0, std::numeric_limits<double>::quiet_NaN(), 0.0, 1.0),
                      std::invalid_argument);
    REQUIRE_NOTHROW(CanvasBounds(0.0, 0.0, 0.0, 0.0));
}

TEST_CASE("Canvas inset", "[bounds]") {
    CanvasBounds canvas(-100.0, 100.0, -50.0, 50.0);
    CanvasBounds inner = canvas.inset(20.0);
    REQUIRE(inner.min_x() == Approx(-80.0));
    REQUIRE(inner.max_y() == Approx(30.0));
    REQUIRE(inner.contains(Vec2(79.0, 29.0)));
    REQUIRE_FALSE(inner.contains(Vec2(81.0, 0.0)));

    REQUIRE_THROWS_AS(canvas.inset(60.0), std::invalid_argument);
}

TEST_CASE("Anchor domain", "[bounds]") {
    CanvasBounds canvas(-100.0, 100.0, -100.0, 100.0);

    SECTION("Point shape") {
        auto domain = canvas.anchor_domain(AABB(Vec2(0.0, 0.0), Vec2(0.0, 0.0)), 50.0);
        REQUIRE(domain.has_value());
        REQUIRE(domain->min == Vec2(-50.0, -50.0));
        REQUIRE(domain->max == Vec2(50.0, 50.0));
    }

    SECTION("Shape extent shrinks the domain") {
        auto domain = canvas.anchor_domain(AABB(Vec2(-10.0, -5.0), Vec2(20.0, 5.0)), 50.0);
        REQUIRE(domain.has_value());
        REQUIRE(domain->min.x == Approx(-40.0));
        REQUIRE(domain->max.x == Approx(30.0));
        REQUIRE(domain->min.y == Approx(-45.0));
        REQUIRE(domain->max.y == Approx(45.0));
    }

    SECTION("Shape larger than the inset canvas") {
        auto domain = canvas.anchor_domain(AABB(Vec2(-60.0, -1.0), Vec2(60.0, 1.0)), 50.0);
        REQUIRE_FALSE(domain.has_value());
    }
}

TEST_CASE("Canvas violation", "[bounds]") {
    CanvasBounds canvas(0.0, 10.0, 0.0, 10.0);
    REQUIRE(canvas.violation(AABB(Vec2(1.0, 1.0), Vec2(9.0, 9.0))) == 0.0);
    REQUIRE(canvas.violation(AABB(Vec2(1.0, 1.0), Vec2(12.0, 9.0))) == Approx(2.0));
    REQUIRE(canvas.violation(AABB(Vec2(-3.0, 1.0), Vec2(12.0, 9.0))) == Approx(3.0));
}
