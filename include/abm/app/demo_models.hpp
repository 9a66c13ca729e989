#pragma once
/*
Example models driven by abm_demo

- social: agents drift through a 2D continuous box with constant speed and
  swap the y component of their velocities on contact. Each run reports the
  number of contacts.
- walkers: agents random-walk on a single-occupancy 2D grid. Each run
  reports the number of successful moves.

Both build a fresh model from a seed so they can run as independent
replicates.
*/

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <utility>

#include "abm/core/errors.hpp"
#include "abm/core/model.hpp"
#include "abm/core/rng.hpp"
#include "abm/core/schedulers.hpp"
#include "abm/sim/step.hpp"
#include "abm/sim/walk.hpp"
#include "abm/spaces/continuous_space.hpp"
#include "abm/spaces/grid_space.hpp"

namespace abm {
namespace app {

// -------------------- social distancing --------------------

struct SocialAgent {
    agent_id_t         id;
    spaces::RealPos<2> pos;
    spaces::RealPos<2> vel;
    double             diameter;
    bool               moved;
};

struct SocialConfig {
    std::size_t agents{100};
    double      extent{1.0};
    double      speed{0.005};     // per step, in units of extent
    double      diameter{0.01};   // contact distance, in units of extent
    bool        periodic{true};
};

struct SocialProperties {
    std::uint64_t contacts{0};
};

using SocialModel = StandardModel<SocialAgent, spaces::ContinuousSpace<2>, SocialProperties>;

inline SocialModel make_social_model(const SocialConfig& cfg, std::uint64_t seed) {
    if (cfg.extent <= 0.0) throw core::InvalidArgumentError("social model: extent must be positive");
    SocialModel model(spaces::ContinuousSpace<2>({cfg.extent, cfg.extent}, cfg.periodic),
                      schedulers::Fastest{}, SocialProperties{}, core::Rng(seed));
    const double speed = cfg.speed * cfg.extent;
    const double diameter = cfg.diameter * cfg.extent;
    for (std::size_t i = 0; i < cfg.agents; ++i) {
        const double angle = 2.0 * std::numbers::pi * core::uniform01(model.rng());
        const spaces::RealPos<2> vel{std::sin(angle) * speed, std::cos(angle) * speed};
        model.emplace_agent_random_pos(vel, diameter, false);
    }
    return model;
}

inline void social_agent_step(SocialAgent& agent, SocialModel& model) {
    sim::walk(agent, agent.vel, model);
    if (agent.moved) return;

    bool touched = false;
    for (agent_id_t other : model.space().nearby_ids(agent.pos, agent.diameter)) {
        if (other == agent.id) continue;
        touched = true;
        SocialAgent& contact = model.agent(other);
        if (contact.moved) continue;
        std::swap(agent.vel[1], contact.vel[1]);
        contact.moved = true;
        ++model.properties().contacts;
    }
    if (touched) agent.moved = true;
}

inline void social_model_step(SocialModel& model) {
    model.for_each_agent([](SocialAgent& a) { a.moved = false; });
}

inline std::uint64_t run_social(const SocialConfig& cfg, std::size_t steps, std::uint64_t seed) {
    SocialModel model = make_social_model(cfg, seed);
    sim::step(model, social_agent_step, social_model_step, steps);
    return model.properties().contacts;
}

// -------------------- grid walkers --------------------

struct GridWalker {
    agent_id_t         id;
    spaces::GridPos<2> pos;
    std::uint64_t      moves;
};

struct WalkerConfig {
    std::size_t    agents{100};
    int            side{20};
    bool           periodic{true};
    spaces::Metric metric{spaces::Metric::chebyshev};
};

using WalkerModel = StandardModel<GridWalker, spaces::GridSpaceSingle<2>>;

inline WalkerModel make_walker_model(const WalkerConfig& cfg, std::uint64_t seed) {
    WalkerModel model(spaces::GridSpaceSingle<2>({cfg.side, cfg.side}, cfg.periodic, cfg.metric),
                      schedulers::Randomly{}, NoProperties{}, core::Rng(seed));
    for (std::size_t i = 0; i < cfg.agents; ++i) model.emplace_agent_random_pos(std::uint64_t{0});
    return model;
}

inline void walker_step(GridWalker& walker, WalkerModel& model) {
    if (sim::randomwalk(walker, model)) ++walker.moves;
}

inline std::uint64_t run_walkers(const WalkerConfig& cfg, std::size_t steps, std::uint64_t seed) {
    WalkerModel model = make_walker_model(cfg, seed);
    sim::step(model, walker_step, steps);
    std::uint64_t total = 0;
    model.for_each_agent([&](const GridWalker& w) { total += w.moves; });
    return total;
}

} // namespace app
} // namespace abm
