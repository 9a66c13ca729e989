// step.hpp — advance a model by whole steps
#pragma once

#include <concepts>
#include <cstddef>

#include "abm/core/config.hpp"

namespace abm {
namespace sim {

/**
 * @brief Run n steps of a model.
 *
 * Each step asks the model's scheduler for the activation order and calls
 * `agent_step(agent, model)` for every scheduled id that still exists (ids
 * removed earlier in the same step are skipped), then `model_step(model)`.
 * With `agents_first == false` the model step runs before the agents.
 */
template <class M, class AgentStep, class ModelStep>
    requires std::invocable<ModelStep&, M&>
void step(M& model, AgentStep&& agent_step, ModelStep&& model_step, std::size_t n = 1,
          bool agents_first = true) {
    for (std::size_t s = 0; s < n; ++s) {
        if (!agents_first) model_step(model);
        for (agent_id_t id : model.schedule()) {
            auto* agent = model.find_agent(id);
            if (agent == nullptr) continue;
            agent_step(*agent, model);
        }
        if (agents_first) model_step(model);
    }
}

// Agent steps only.
template <class M, class AgentStep>
void step(M& model, AgentStep&& agent_step, std::size_t n = 1) {
    step(model, agent_step, [](M&) {}, n);
}

} // namespace sim
} // namespace abm
