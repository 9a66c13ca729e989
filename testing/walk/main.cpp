// walk/main.cpp
// Boundary normalization, walks, random walks and rotations using doctest.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <array>
#include <cmath>
#include <numbers>
#include <set>
#include <vector>

#include "abm/core/errors.hpp"
#include "abm/core/model.hpp"
#include "abm/sim/rotation.hpp"
#include "abm/sim/walk.hpp"
#include "abm/spaces/continuous_space.hpp"
#include "abm/spaces/grid_space.hpp"
#include "../test_agents.hpp"

using namespace abm;
using namespace abm::sim;
using core::InvalidArgumentError;
using core::UnsupportedMetricError;
using spaces::ContinuousSpace;
using spaces::GridSpace;
using spaces::GridSpaceSingle;
using spaces::Metric;
using testutil::Particle2;
using testutil::Particle3;
using testutil::Walker2;

namespace testutil {

inline double cos_between(const Vec3& a, const Vec3& b) {
    return dot(a, b) / (norm(a) * norm(b));
}

} // namespace testutil

// -------------------- normalize_position --------------------

TEST_CASE("normalize_position in continuous space") {
    ContinuousSpace<2> periodic({1.0, 1.0}, true);
    ContinuousSpace<2> bounded({1.0, 1.0}, false);

    const auto w = normalize_position(spaces::RealPos<2>{1.2, -0.3}, periodic);
    CHECK(w[0] == doctest::Approx(0.2));
    CHECK(w[1] == doctest::Approx(0.7));

    const auto c = normalize_position(spaces::RealPos<2>{1.2, -0.3}, bounded);
    CHECK(c[0] == std::nextafter(1.0, 0.0));
    CHECK(c[0] < 1.0);
    CHECK(c[1] == 0.0);

    // a tiny negative coordinate must not wrap onto the extent itself
    const auto t = normalize_position(spaces::RealPos<2>{-1e-18, 0.5}, periodic);
    CHECK(t[0] >= 0.0);
    CHECK(t[0] < 1.0);
}

TEST_CASE("normalize_position on grids") {
    GridSpace<2> periodic({5, 4}, true);
    GridSpace<2> bounded({5, 4}, false);

    CHECK(normalize_position(spaces::GridPos<2>{0, 5}, periodic) == spaces::GridPos<2>{5, 1});
    CHECK(normalize_position(spaces::GridPos<2>{7, -4}, periodic) == spaces::GridPos<2>{2, 4});
    CHECK(normalize_position(spaces::GridPos<2>{3, 2}, periodic) == spaces::GridPos<2>{3, 2});
    CHECK(normalize_position(spaces::GridPos<2>{0, 5}, bounded) == spaces::GridPos<2>{1, 4});
    CHECK(normalize_position(spaces::GridPos<2>{9, -2}, bounded) == spaces::GridPos<2>{5, 1});

    StandardModel<Walker2, GridSpace<2>> m(GridSpace<2>({5, 4}, true));
    CHECK(normalize_position(spaces::GridPos<2>{6, 0}, m) == spaces::GridPos<2>{1, 4});
}

// -------------------- walk --------------------

TEST_CASE("walk on a periodic grid wraps and respects ifempty") {
    StandardModel<Walker2, GridSpace<2>> m(GridSpace<2>({5, 5}, true));
    auto& a = m.add_agent(Walker2{1, {5, 5}});
    auto& b = m.add_agent(Walker2{2, {2, 2}});

    CHECK(walk(a, {1, 1}, m));
    CHECK(a.pos == spaces::GridPos<2>{1, 1});
    CHECK(m.ids_in_position({1, 1}) == std::vector<agent_id_t>{1});

    // occupied target: no move with ifempty, move without
    CHECK_FALSE(walk(a, {1, 1}, m));
    CHECK(a.pos == spaces::GridPos<2>{1, 1});
    CHECK(walk(a, {1, 1}, m, WalkOptions{false}));
    CHECK(a.pos == b.pos);
    CHECK(m.ids_in_position({2, 2}).size() == 2);
}

TEST_CASE("walk on a bounded grid stops at the boundary") {
    StandardModel<Walker2, GridSpace<2>> m(GridSpace<2>({5, 5}, false));
    auto& a = m.add_agent(Walker2{1, {4, 2}});
    CHECK(walk(a, {3, -4}, m));
    CHECK(a.pos == spaces::GridPos<2>{5, 1});
}

TEST_CASE("walk in continuous space ignores velocity") {
    StandardModel<Particle2, ContinuousSpace<2>> m(ContinuousSpace<2>({1.0, 1.0}, true));
    auto& p = m.add_agent(Particle2{1, {0.9, 0.1}, {5.0, 5.0}});
    CHECK(walk(p, {0.3, -0.2}, m));
    CHECK(p.pos[0] == doctest::Approx(0.2));
    CHECK(p.pos[1] == doctest::Approx(0.9));
    CHECK(p.vel == spaces::RealPos<2>{5.0, 5.0});
    CHECK(m.space().nearby_ids(p.pos, 1e-9) == std::vector<agent_id_t>{1});
}

// -------------------- grid random walks --------------------

TEST_CASE("grid randomwalk with Euclidean metric always throws") {
    StandardModel<Walker2, GridSpace<2>> m(GridSpace<2>({5, 5}, true, Metric::euclidean));
    auto& a = m.add_agent(Walker2{1, {3, 3}});
    for (int i = 0; i < 10; ++i) CHECK_THROWS_AS(randomwalk(a, m), UnsupportedMetricError);
    CHECK(a.pos == spaces::GridPos<2>{3, 3});

    StandardModel<Walker2, GridSpaceSingle<2>> s(GridSpaceSingle<2>({5, 5}, true, Metric::euclidean));
    auto& b = s.add_agent(Walker2{1, {3, 3}});
    for (int i = 0; i < 10; ++i) CHECK_THROWS_AS(randomwalk(b, s, 2.0), UnsupportedMetricError);
}

TEST_CASE("grid randomwalk visits the metric neighbourhood") {
    SUBCASE("chebyshev") {
        StandardModel<Walker2, GridSpace<2>> m(GridSpace<2>({9, 9}, true, Metric::chebyshev), schedulers::Fastest{},
                                               NoProperties{}, core::Rng(5));
        auto& a = m.add_agent(Walker2{1, {5, 5}});
        std::set<spaces::GridPos<2>> seen;
        for (int i = 0; i < 400; ++i) {
            m.move_agent(a, {5, 5});
            CHECK(randomwalk(a, m));
            CHECK(std::max(std::abs(a.pos[0] - 5), std::abs(a.pos[1] - 5)) == 1);
            seen.insert(a.pos);
        }
        CHECK(seen.size() == 8);
    }
    SUBCASE("manhattan, floored radius") {
        StandardModel<Walker2, GridSpace<2>> m(GridSpace<2>({9, 9}, true, Metric::manhattan), schedulers::Fastest{},
                                               NoProperties{}, core::Rng(6));
        auto& a = m.add_agent(Walker2{1, {5, 5}});
        std::set<spaces::GridPos<2>> seen;
        for (int i = 0; i < 200; ++i) {
            m.move_agent(a, {5, 5});
            CHECK(randomwalk(a, m, 1.7));
            CHECK(std::abs(a.pos[0] - 5) + std::abs(a.pos[1] - 5) == 1);
            seen.insert(a.pos);
        }
        CHECK(seen.size() == 4);
    }
}

TEST_CASE("single-occupancy randomwalk only targets empty cells") {
    StandardModel<Walker2, GridSpaceSingle<2>> m(GridSpaceSingle<2>({3, 3}, false), schedulers::Fastest{},
                                                 NoProperties{}, core::Rng(9));
    auto& centre = m.add_agent(Walker2{1, {2, 2}});

    SUBCASE("surrounded: no move") {
        for (int x = 1; x <= 3; ++x)
            for (int y = 1; y <= 3; ++y)
                if (x != 2 || y != 2) m.emplace_agent(spaces::GridPos<2>{x, y});
        for (int i = 0; i < 20; ++i) CHECK_FALSE(randomwalk(centre, m));
        CHECK(centre.pos == spaces::GridPos<2>{2, 2});
    }
    SUBCASE("one free neighbour") {
        for (int x = 1; x <= 3; ++x)
            for (int y = 1; y <= 3; ++y)
                if ((x != 2 || y != 2) && (x != 3 || y != 1)) m.emplace_agent(spaces::GridPos<2>{x, y});
        CHECK(randomwalk(centre, m));
        CHECK(centre.pos == spaces::GridPos<2>{3, 1});
        CHECK(m.space().id_in_position({3, 1}) == 1);
        CHECK(m.space().is_empty({2, 2}));
    }
}

// -------------------- continuous random walks --------------------

TEST_CASE("continuous randomwalk argument checks") {
    StandardModel<Particle2, ContinuousSpace<2>> m(ContinuousSpace<2>({1.0, 1.0}));
    auto& p = m.add_agent(Particle2{1, {0.5, 0.5}, {0.1, 0.0}});
    CHECK_THROWS_AS(randomwalk(p, m, 0.0), InvalidArgumentError);
    CHECK_THROWS_AS(randomwalk(p, m, -1.0), InvalidArgumentError);
    CHECK(p.pos == spaces::RealPos<2>{0.5, 0.5});

    auto& still = m.add_agent(Particle2{2, {0.2, 0.2}, {0.0, 0.0}});
    CHECK_THROWS_AS(randomwalk(still, m), InvalidArgumentError);
    CHECK_THROWS_AS(randomwalk(still, m, 0.1), InvalidArgumentError);
    CHECK(still.pos == spaces::RealPos<2>{0.2, 0.2});

    StandardModel<Particle3, ContinuousSpace<3>> m3(ContinuousSpace<3>({1.0, 1.0, 1.0}));
    auto& q = m3.add_agent(Particle3{1, {0.5, 0.5, 0.5}, {0.0, 0.0, 0.0}});
    CHECK_THROWS_AS(randomwalk(q, m3), InvalidArgumentError);
}

TEST_CASE("2D randomwalk keeps the speed or rescales to r") {
    StandardModel<Particle2, ContinuousSpace<2>> m(ContinuousSpace<2>({10.0, 10.0}), schedulers::Fastest{},
                                                   NoProperties{}, core::Rng(21));
    auto& p = m.add_agent(Particle2{1, {5.0, 5.0}, {0.3, 0.4}});

    for (int i = 0; i < 50; ++i) {
        m.move_agent(p, {5.0, 5.0});
        const auto before = p.pos;
        CHECK(randomwalk(p, m));
        CHECK(norm(Vec2{p.vel[0], p.vel[1]}) == doctest::Approx(0.5));
        const double dx = p.pos[0] - before[0], dy = p.pos[1] - before[1];
        CHECK(std::hypot(dx, dy) == doctest::Approx(0.5));
    }

    CHECK(randomwalk(p, m, 2.0));
    CHECK(norm(Vec2{p.vel[0], p.vel[1]}) == doctest::Approx(2.0));

    // a fixed polar angle is a plain rotation
    p.vel = {1.0, 0.0};
    CHECK(randomwalk(p, m, std::nullopt, [](core::Rng&) { return std::numbers::pi / 2; }));
    CHECK(p.vel[0] == doctest::Approx(0.0));
    CHECK(p.vel[1] == doctest::Approx(1.0));
}

TEST_CASE("3D randomwalk: the polar angle fixes the angle to the old velocity") {
    StandardModel<Particle3, ContinuousSpace<3>> m(ContinuousSpace<3>({10.0, 10.0, 10.0}), schedulers::Fastest{},
                                                   NoProperties{}, core::Rng(33));
    auto& p = m.add_agent(Particle3{1, {5.0, 5.0, 5.0}, {0.3, -0.2, 0.6}});
    const double theta = 0.7;
    const auto fixed = [theta](core::Rng&) { return theta; };

    for (int i = 0; i < 1000; ++i) {
        const Vec3 old{p.vel[0], p.vel[1], p.vel[2]};
        m.move_agent(p, {5.0, 5.0, 5.0});
        CHECK(randomwalk(p, m, std::nullopt, fixed));
        const Vec3 now{p.vel[0], p.vel[1], p.vel[2]};
        CHECK(testutil::cos_between(old, now) == doctest::Approx(std::cos(theta)).epsilon(1e-9));
        CHECK(norm(now) == doctest::Approx(norm(old)));
    }
}

TEST_CASE("3D rotation holds for axis-aligned and arbitrary vectors") {
    auto rng = testutil::make_rng();
    const Uniform polar(-std::numbers::pi, std::numbers::pi);
    const Arccos azimuthal;
    for (const Vec3& w : {Vec3{0.0, 0.0, 1.0}, Vec3{0.0, 2.0, 0.0}, Vec3{1.0, 0.0, 0.0}, Vec3{-0.4, 0.1, 3.0}}) {
        for (int i = 0; i < 100; ++i) {
            const double theta = polar(rng);
            const Vec3 v = rotate(w, theta, azimuthal(rng));
            CHECK(testutil::cos_between(w, v) == doctest::Approx(std::cos(theta)).epsilon(1e-9));
            CHECK(norm(v) == doctest::Approx(norm(w)));
        }
    }
    CHECK_THROWS_AS(rotate(Vec3{0.0, 0.0, 0.0}, 0.1, 0.2), InvalidArgumentError);
}

TEST_CASE("angle distributions") {
    CHECK_THROWS_AS(Uniform(1.0, 1.0), InvalidArgumentError);
    CHECK_THROWS_AS(Uniform(2.0, 1.0), InvalidArgumentError);
    CHECK_THROWS_AS(Arccos(-2.0, 1.0), InvalidArgumentError);
    CHECK_THROWS_AS(Arccos(0.5, 0.2), InvalidArgumentError);
    CHECK_THROWS_AS(Arccos(-1.0, 1.5), InvalidArgumentError);

    auto rng = testutil::make_rng();
    const Uniform u(-1.0, 3.0);
    const Arccos a(0.0, 1.0);
    for (int i = 0; i < 1000; ++i) {
        const double x = u(rng);
        CHECK(x >= -1.0);
        CHECK(x < 3.0);
        const double y = a(rng);
        CHECK(y >= 0.0);
        CHECK(y <= std::numbers::pi / 2);
    }
}
