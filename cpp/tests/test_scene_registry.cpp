#include <catch2/catch.hpp>
#include "poly_scatter/core/scene_registry.hpp"

using namespace poly_scatter;

TEST_CASE("SceneRegistry append", "[registry]") {
    auto square = Outline::create("square", {{-1.0, -1.0}, {1.0, -1.0}, {1.0, 1.0}, {-1.0, 1.0}});
    SceneRegistry registry;

    REQUIRE(registry.empty());
    REQUIRE(registry.extent().is_empty());

    SECTION("Indices follow insertion order") {
        REQUIRE(registry.add(Placement(Vec2(0.0, 0.0), square, 1.0, Color::Red)) == 0);
        REQUIRE(registry.add(Placement(Vec2(10.0, 0.0), square, 2.0, Color::Blue)) == 1);
        REQUIRE(registry.size() == 2);
        REQUIRE(registry[0].color == Color::Red);
        REQUIRE(registry.back().color == Color::Blue);
        REQUIRE(registry.all().size() == 2);
    }

    SECTION("World figures are cached") {
        registry.add(Placement(Vec2(10.0, 5.0), square, 2.0, Color::Green));
        const PlacedFigure& fig = registry.figure(0);
        REQUIRE(fig.size() == 4);
        REQUIRE(fig.vertices[0] == Vec2(8.0, 3.0));
        REQUIRE(fig.vertices[2] == Vec2(12.0, 7.0));
        REQUIRE(fig.centroid.x == Approx(10.0));
        REQUIRE(fig.centroid.y == Approx(5.0));
        REQUIRE(fig.aabb.min == Vec2(8.0, 3.0));
        REQUIRE(fig.aabb.max == Vec2(12.0, 7.0));
    }

    SECTION("Extent covers every figure") {
        registry.add(Placement(Vec2(-10.0, 0.0), square, 1.0, Color::White));
        registry.add(Placement(Vec2(20.0, 30.0), square, 1.0, Color::White));
        REQUIRE(registry.extent().min == Vec2(-11.0, -1.0));
        REQUIRE(registry.extent().max == Vec2(21.0, 31.0));
    }

    SECTION("Outline is shared, not copied") {
        registry.add(Placement(Vec2(0.0, 0.0), square, 1.0, Color::White));
        registry.add(Placement(Vec2(5.0, 0.0), square, 1.0, Color::White));
        REQUIRE(registry[0].outline.get() == registry[1].outline.get());
    }
}
