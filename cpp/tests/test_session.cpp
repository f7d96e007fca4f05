#include <catch2/catch.hpp>
#include "poly_scatter/session/session.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

using namespace poly_scatter;
using namespace std::chrono_literals;

namespace {

Catalogue small_catalogue() {
    Catalogue catalogue;
    catalogue.insert(Outline::create("square", {{-10, -10}, {10, -10}, {10, 10}, {-10, 10}}));
    catalogue.insert(Outline::create("triangle", {{-10, -8}, {10, -8}, {0, 12}}));
    catalogue.insert(Outline::create("l_shape", {{-10, -10}, {10, -10}, {10, -3}, {-3, -3}, {-3, 10}, {-10, 10}}));
    return catalogue;
}

// Records what the session hands over and checks it was committed first
class RecordingRenderer final : public Renderer {
public:
    void draw(const Placement& placement, size_t scene_size) override {
        sizes.push_back(scene_size);
        if (session) {
            committed_before_draw = committed_before_draw &&
                session->registry().size() == scene_size &&
                session->registry().back().anchor == placement.anchor;
        }
    }

    void finish(const SessionSummary& summary) override {
        ++finish_calls;
        finished_with = summary.placed;
    }

    const Session* session{nullptr};
    std::vector<size_t> sizes;
    bool committed_before_draw{true};
    int finish_calls{0};
    size_t finished_with{0};
};

SessionConfig quiet_config(uint64_t seed) {
    SessionConfig config;
    config.duration_seconds = 5.0;
    config.seed = seed;
    config.verbose = false;
    return config;
}

}  // namespace

TEST_CASE("Session run", "[session]") {
    Catalogue catalogue = small_catalogue();
    CanvasBounds canvas = CanvasBounds::from_display(600.0, 600.0);
    RecordingRenderer renderer;
    ManualClock clock(1ms);

    Session session(catalogue, canvas, quiet_config(5), renderer, clock);
    renderer.session = &session;

    SessionSummary summary = session.run();

    SECTION("Ends at the deadline") {
        REQUIRE(session.finished());
        REQUIRE_FALSE(session.time_remaining());
        REQUIRE(summary.elapsed_seconds >= 5.0);
    }

    SECTION("Committed scene keeps its clearance") {
        REQUIRE(summary.placed > 0);
        REQUIRE(summary.placed == session.registry().size());
        REQUIRE_FALSE(session.oracle().find_violation(session.registry()).has_value());
    }

    SECTION("Figures stay inside the sampling margin") {
        const CanvasBounds inner = canvas.inset(50.0);
        for (const auto& fig : session.registry().figures()) {
            REQUIRE(inner.violation(fig.aabb) <= 1e-9);
        }
    }

    SECTION("Renderer sees every placement after it is committed") {
        REQUIRE(renderer.sizes.size() == summary.placed);
        for (size_t i = 0; i < renderer.sizes.size(); ++i) {
            REQUIRE(renderer.sizes[i] == i + 1);
        }
        REQUIRE(renderer.committed_before_draw);
    }

    SECTION("Finish happens once") {
        REQUIRE(renderer.finish_calls == 1);
        REQUIRE(renderer.finished_with == summary.placed);
        (void)session.finish();
        REQUIRE(renderer.finish_calls == 1);
    }

    SECTION("No steps after finish") {
        const size_t placed = session.registry().size();
        REQUIRE_THROWS_AS(session.step(), std::logic_error);
        REQUIRE(session.registry().size() == placed);
        REQUIRE(renderer.sizes.size() == placed);
    }

    SECTION("Attempts are accounted for") {
        REQUIRE(summary.attempts >= summary.placed);
        REQUIRE(summary.overlap.pairs_tested > 0);
    }
}

TEST_CASE("Session stepping", "[session]") {
    Catalogue catalogue = small_catalogue();
    CanvasBounds canvas = CanvasBounds::from_display(600.0, 600.0);
    NullRenderer renderer;
    ManualClock clock;

    Session session(catalogue, canvas, quiet_config(9), renderer, clock);
    REQUIRE_FALSE(session.started());
    REQUIRE_FALSE(session.time_remaining());

    StepOutcome first = session.step();
    REQUIRE(session.started());
    REQUIRE(first.result.accepted());
    REQUIRE(catalogue.find(first.shape) != nullptr);
    REQUIRE(session.registry().size() == 1);
    REQUIRE(session.registry()[0].color == first.color);

    // Clock is frozen, so time never runs out while stepping
    for (int i = 0; i < 10; ++i) {
        (void)session.step();
    }
    REQUIRE(session.time_remaining());
    REQUIRE(session.summary().placed + session.summary().rejected() == 11);

    clock.advance(6s);
    REQUIRE_FALSE(session.time_remaining());
    StepOutcome late = session.step();
    REQUIRE(late.result.reason == RejectReason::Deadline);
    REQUIRE(session.summary().rejected_deadline >= 1);
}

TEST_CASE("Same seed, same scene", "[session]") {
    Catalogue catalogue = small_catalogue();
    CanvasBounds canvas = CanvasBounds::from_display(600.0, 600.0);

    auto run = [&](uint64_t seed) {
        NullRenderer renderer;
        ManualClock clock(1ms);
        Session session(catalogue, canvas, quiet_config(seed), renderer, clock);
        (void)session.run();
        std::vector<Placement> placements = session.registry().all();
        return placements;
    };

    std::vector<Placement> a = run(17);
    std::vector<Placement> b = run(17);
    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].anchor == b[i].anchor);
        REQUIRE(a[i].name() == b[i].name());
        REQUIRE(a[i].color == b[i].color);
    }
}

TEST_CASE("Session configuration errors", "[session]") {
    CanvasBounds canvas = CanvasBounds::from_display(600.0, 600.0);
    NullRenderer renderer;
    ManualClock clock;

    SECTION("Empty catalogue") {
        Catalogue empty;
        REQUIRE_THROWS_AS(Session(empty, canvas, quiet_config(1), renderer, clock), std::invalid_argument);
    }

    SECTION("No colors") {
        Catalogue catalogue = small_catalogue();
        SessionConfig config = quiet_config(1);
        config.colors.clear();
        REQUIRE_THROWS_AS(Session(catalogue, canvas, config, renderer, clock), std::invalid_argument);
    }

    SECTION("Bad scale or duration") {
        Catalogue catalogue = small_catalogue();
        SessionConfig config = quiet_config(1);
        config.scale = 0.0;
        REQUIRE_THROWS_AS(Session(catalogue, canvas, config, renderer, clock), std::invalid_argument);

        config = quiet_config(1);
        config.duration_seconds = -1.0;
        REQUIRE_THROWS_AS(Session(catalogue, canvas, config, renderer, clock), std::invalid_argument);
    }

    SECTION("Duration beyond the clock range") {
        Catalogue catalogue = small_catalogue();
        SessionConfig config = quiet_config(1);
        config.duration_seconds = 1e12;
        REQUIRE_THROWS_AS(Session(catalogue, canvas, config, renderer, clock), std::invalid_argument);

        config.duration_seconds = 3600.0 * 24.0 * 365.0;
        Session session(catalogue, canvas, config, renderer, clock);
        session.start();
        REQUIRE(session.time_remaining());
        REQUIRE(session.deadline() > clock.now());
    }

    SECTION("Negative buffer") {
        Catalogue catalogue = small_catalogue();
        SessionConfig config = quiet_config(1);
        config.overlap.buffer = -2.0;
        REQUIRE_THROWS_AS(Session(catalogue, canvas, config, renderer, clock), std::invalid_argument);
    }
}
