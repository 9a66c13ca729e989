// walk.hpp — displacement and random walks on grid and continuous spaces
//
// walk() moves an agent by a direction vector with the space's boundary rule
// (wrap when periodic, clamp otherwise). randomwalk() picks the direction:
// on grids a uniform offset at the given metric radius, in continuous space
// a random rotation of the agent's velocity.
//
// Agents are passed as references to stored concrete agents; for union
// models fetch them with model.agent_as<T>(id).

#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <optional>
#include <vector>

#include "abm/core/errors.hpp"
#include "abm/core/rng.hpp"
#include "abm/sim/rotation.hpp"
#include "abm/spaces/continuous_space.hpp"
#include "abm/spaces/grid_space.hpp"
#include "abm/spaces/space_concepts.hpp"

namespace abm {
namespace sim {

struct WalkOptions {
    // Grids only: move only when the target cell has no occupant.
    bool ifempty = true;
};

// ---- normalize_position ----

// 1-based floored modulo: mod1(0, 5) == 5, mod1(6, 5) == 1.
inline int mod1(int x, int m) noexcept {
    int r = (x - 1) % m;
    if (r < 0) r += m;
    return r + 1;
}

template <std::size_t D>
spaces::RealPos<D> normalize_position(spaces::RealPos<D> p, const spaces::ContinuousSpace<D>& space) {
    const auto& ext = space.extent();
    for (std::size_t i = 0; i < D; ++i) {
        if (space.periodic()) {
            double m = std::fmod(p[i], ext[i]);
            if (m < 0.0) m += ext[i];
            if (m >= ext[i]) m = 0.0;  // -tiny + ext rounds up to ext
            p[i] = m;
        } else {
            p[i] = std::clamp(p[i], 0.0, std::nextafter(ext[i], 0.0));
        }
    }
    return p;
}

template <class Derived, std::size_t D>
spaces::GridPos<D> normalize_position(spaces::GridPos<D> p, const spaces::GridSpaceBase<Derived, D>& space) {
    const auto& ext = space.extent();
    for (std::size_t i = 0; i < D; ++i)
        p[i] = space.periodic() ? mod1(p[i], ext[i]) : std::clamp(p[i], 1, ext[i]);
    return p;
}

template <class P, class M>
    requires requires(const M& m) { m.space(); typename M::space_type; }
auto normalize_position(const P& p, const M& model) {
    return normalize_position(p, model.space());
}

// ---- walk ----

/**
 * @brief Move `agent` by `direction`, respecting the space boundaries.
 *
 * Grids: the target is wrapped or clamped; with opts.ifempty the agent only
 * moves when the target cell is empty. Continuous space: the agent always
 * moves and its velocity is ignored.
 *
 * @return true when the agent was moved.
 */
template <class A, class M>
bool walk(A& agent, const typename M::space_type::position_type& direction, M& model,
          WalkOptions opts = {}) {
    using S = typename M::space_type;
    static_assert(spaces::GridLike<S> || spaces::ContinuousLike<S>,
                  "walk needs a grid or continuous space");

    auto target = agent.pos;
    for (std::size_t i = 0; i < S::dims; ++i) target[i] += direction[i];
    target = normalize_position(target, model.space());

    if constexpr (spaces::GridLike<S>) {
        if (opts.ifempty && !model.space().is_empty(target)) return false;
    }
    model.move_agent(agent, target);
    return true;
}

// ---- random walks ----

/**
 * @brief Walk to a uniformly chosen offset at metric distance floor(r).
 *
 * Chebyshev r=1 picks among the 8 (2D) surrounding cells, Manhattan r=1 among
 * 4. On single-occupancy grids only offsets leading to empty cells are
 * candidates; with none available the agent stays put.
 *
 * @throws UnsupportedMetricError for Euclidean grids.
 * @return true when the agent was moved.
 */
template <class A, class M>
    requires spaces::GridLike<typename M::space_type>
bool randomwalk(A& agent, M& model, double r = 1.0, WalkOptions opts = {}) {
    using S = typename M::space_type;
    const S& space = model.space();
    if (space.metric() == spaces::Metric::euclidean)
        throw core::UnsupportedMetricError(
            "random walks on a grid with Euclidean metric are not defined; "
            "use a continuous space or a different metric");

    const auto& offsets = space.offsets_at_radius(static_cast<int>(std::floor(r)));

    if constexpr (requires(const S& s, const typename S::position_type& p) { s.id_in_position(p); }) {
        std::vector<typename S::offset_type> available;
        for (const auto& beta : offsets) {
            auto target = agent.pos;
            for (std::size_t i = 0; i < S::dims; ++i) target[i] += beta[i];
            if (space.is_empty(normalize_position(target, space))) available.push_back(beta);
        }
        if (available.empty()) return false;
        return walk(agent, core::pick(available, model.rng()), model, WalkOptions{false});
    } else {
        if (offsets.empty()) return false;
        return walk(agent, core::pick(offsets, model.rng()), model, opts);
    }
}

namespace detail {

template <class V>
inline double speed_of(const V& vel) {
    double acc = 0.0;
    for (double c : vel) acc += c * c;
    return std::sqrt(acc);
}

inline void check_walk_args(std::optional<double> r, double speed) {
    if (r && !(*r > 0.0)) throw core::InvalidArgumentError("the displacement must be larger than 0");
    if (speed == 0.0)
        throw core::InvalidArgumentError("cannot re-orient an agent with zero velocity: direction is undefined");
}

template <class V>
inline V scaled(V v, std::optional<double> r, double speed) {
    if (r) {
        const double k = *r / speed;
        for (double& c : v) c *= k;
    }
    return v;
}

} // namespace detail

/**
 * @brief Rotate the agent's velocity by a random polar angle and move along it.
 * @param r Displacement length; defaults to the current speed.
 * @param polar Angle distribution, default Uniform(-pi, pi).
 * @throws InvalidArgumentError for r <= 0 or a zero velocity.
 */
template <class A, class M, class Polar = Uniform>
    requires spaces::ContinuousLike<typename M::space_type> && (M::space_type::dims == 2)
bool randomwalk(A& agent, M& model, std::optional<double> r = std::nullopt,
                Polar polar = Uniform(-std::numbers::pi, std::numbers::pi)) {
    const double speed = detail::speed_of(agent.vel);
    detail::check_walk_args(r, speed);
    const double theta = polar(model.rng());
    const Vec2 dir = detail::scaled(sim::rotate(Vec2{agent.vel[0], agent.vel[1]}, theta), r, speed);
    agent.vel = {dir[0], dir[1]};
    return walk(agent, dir, model);
}

// 3D: the new direction makes angle `polar` with the old velocity, and
// `azimuthal` sets where on that cone it lies.
template <class A, class M, class Polar = Uniform, class Azimuthal = Arccos>
    requires spaces::ContinuousLike<typename M::space_type> && (M::space_type::dims == 3)
bool randomwalk(A& agent, M& model, std::optional<double> r = std::nullopt,
                Polar polar = Uniform(-std::numbers::pi, std::numbers::pi),
                Azimuthal azimuthal = Arccos(-1.0, 1.0)) {
    const double speed = detail::speed_of(agent.vel);
    detail::check_walk_args(r, speed);
    const double theta = polar(model.rng());
    const double phi = azimuthal(model.rng());
    const Vec3 dir = detail::scaled(sim::rotate(Vec3{agent.vel[0], agent.vel[1], agent.vel[2]}, theta, phi), r, speed);
    agent.vel = {dir[0], dir[1], dir[2]};
    return walk(agent, dir, model);
}

} // namespace sim
} // namespace abm
