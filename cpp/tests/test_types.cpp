#include <catch2/catch.hpp>
#include "poly_scatter/core/types.hpp"
#include "poly_scatter/core/outline.hpp"
#include "poly_scatter/core/placement.hpp"

#include <limits>
#include <stdexcept>

using namespace poly_scatter;

TEST_CASE("Vec2 operations", "[types]") {
    SECTION("Construction") {
        Vec2 v1;
        REQUIRE(v1.x == 0.0);
        REQUIRE(v1.y == 0.0);

        Vec2 v2(1.0, 2.0);
        REQUIRE(v2.x == 1.0);
        REQUIRE(v2.y == 2.0);
    }

    SECTION("Arithmetic") {
        Vec2 a(1.0, 2.0);
        Vec2 b(3.0, 4.0);

        Vec2 sum = a + b;
        REQUIRE(sum.x == 4.0);
        REQUIRE(sum.y == 6.0);

        Vec2 diff = b - a;
        REQUIRE(diff.x == 2.0);
        REQUIRE(diff.y == 2.0);

        Vec2 scaled = 2.0 * a;
        REQUIRE(scaled == Vec2(2.0, 4.0));
        REQUIRE(b / 2.0 == Vec2(1.5, 2.0));
    }

    SECTION("Dot and cross") {
        Vec2 a(1.0, 0.0);
        Vec2 b(0.0, 1.0);
        REQUIRE(a.dot(b) == 0.0);
        REQUIRE(a.cross(b) == 1.0);
        REQUIRE(b.cross(a) == -1.0);
    }

    SECTION("Length") {
        Vec2 v(3.0, 4.0);
        REQUIRE(v.length() == Approx(5.0));
        REQUIRE(v.length_squared() == 25.0);
    }
}

TEST_CASE("AABB operations", "[types]") {
    SECTION("Default box is empty") {
        AABB box;
        REQUIRE(box.is_empty());
        box.expand(Vec2(1.0, 2.0));
        REQUIRE_FALSE(box.is_empty());
        REQUIRE(box.min == Vec2(1.0, 2.0));
        REQUIRE(box.max == Vec2(1.0, 2.0));
    }

    SECTION("Expand and inflate") {
        AABB box;
        box.expand(Polygon{{0.0, 0.0}, {4.0, 2.0}, {-1.0, 3.0}});
        REQUIRE(box.min == Vec2(-1.0, 0.0));
        REQUIRE(box.max == Vec2(4.0, 3.0));

        AABB grown = box.inflated(1.0);
        REQUIRE(grown.min == Vec2(-2.0, -1.0));
        REQUIRE(grown.max == Vec2(5.0, 4.0));
        REQUIRE(grown.contains(box));
        REQUIRE_FALSE(box.contains(grown));
    }

    SECTION("Touching boxes intersect") {
        AABB a(Vec2(0.0, 0.0), Vec2(1.0, 1.0));
        AABB b(Vec2(1.0, 0.0), Vec2(2.0, 1.0));
        AABB c(Vec2(1.5, 0.0), Vec2(2.0, 1.0));
        REQUIRE(a.intersects(b));
        REQUIRE(b.intersects(a));
        REQUIRE_FALSE(a.intersects(c));
    }
}

TEST_CASE("Colors", "[types]") {
    REQUIRE(ALL_COLORS.size() == 7);
    REQUIRE(to_string(Color::Purple) == "purple");
    REQUIRE(color_from_string("ORANGE") == Color::Orange);
    REQUIRE(color_from_string("white") == Color::White);
    REQUIRE_THROWS_AS(color_from_string("magenta"), std::invalid_argument);

    for (Color c : ALL_COLORS) {
        REQUIRE(color_from_string(to_string(c)) == c);
    }

    Rgb red = to_rgb(Color::Red);
    REQUIRE(red.r == 255);
    REQUIRE(red.g == 0);
    REQUIRE(red.b == 0);
}

TEST_CASE("Outline validation", "[types]") {
    SECTION("Needs three vertices") {
        REQUIRE_THROWS_AS((Outline("line", {{0.0, 0.0}, {1.0, 0.0}})), std::invalid_argument);
    }

    SECTION("Rejects non-finite vertices") {
        const double inf = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS((Outline("bad", {{0.0, 0.0}, {inf, 0.0}, {0.0, 1.0}})), std::invalid_argument);
    }

    SECTION("Centroid and local box") {
        auto square = Outline::create("square", {{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}, {0.0, 10.0}});
        REQUIRE(square->name() == "square");
        REQUIRE(square->size() == 4);
        REQUIRE(square->centroid().x == Approx(5.0));
        REQUIRE(square->centroid().y == Approx(5.0));

        auto tri = Outline::create("tri", {{0.0, 0.0}, {6.0, 0.0}, {0.0, 3.0}});
        REQUIRE(tri->centroid().x == Approx(2.0));
        REQUIRE(tri->centroid().y == Approx(1.0));
        REQUIRE(square->local_aabb().min == Vec2(0.0, 0.0));
        REQUIRE(square->local_aabb().max == Vec2(10.0, 10.0));
    }
}

TEST_CASE("Placement", "[types]") {
    auto tri = Outline::create("tri", {{0.0, 0.0}, {2.0, 0.0}, {0.0, 2.0}});

    SECTION("World coordinates") {
        Placement p(Vec2(10.0, -5.0), tri, 3.0, Color::Blue);
        REQUIRE(p.world_vertex(1) == Vec2(16.0, -5.0));
        REQUIRE(p.world_centroid().x == Approx(12.0));
        REQUIRE(p.world_centroid().y == Approx(-3.0));
        REQUIRE(p.name() == "tri");

        PlacedFigure fig = placement_to_figure(p);
        REQUIRE(fig.size() == 3);
        REQUIRE(fig.vertices[2] == Vec2(10.0, 1.0));
        REQUIRE(fig.aabb.min == Vec2(10.0, -5.0));
        REQUIRE(fig.aabb.max == Vec2(16.0, 1.0));
    }

    SECTION("Invalid arguments") {
        REQUIRE_THROWS_AS(Placement(Vec2(), nullptr, 1.0, Color::Red), std::invalid_argument);
        REQUIRE_THROWS_AS(Placement(Vec2(), tri, 0.0, Color::Red), std::invalid_argument);
        REQUIRE_THROWS_AS(Placement(Vec2(), tri, -2.0, Color::Red), std::invalid_argument);
    }
}
