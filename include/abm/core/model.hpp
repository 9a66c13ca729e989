// model.hpp — the agent-based model: container + space + scheduler + rng
//
// Implementation notes:
// - The container strategy is a template parameter (mapping or sequence) and
//   is fixed for the lifetime of a model.
// - Every mutating operation checks all of its preconditions before it
//   touches the container or the space, so a throwing call leaves the model
//   unchanged.
// - Agent shapes are checked once, in the constructor, against the space.
//   Operations that need `pos` are only instantiated when used, so a model
//   whose agent type does not fit its space still compiles and reports a
//   SchemaError at construction.

#pragma once
#include <cstddef>
#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "abm/core/agent.hpp"
#include "abm/core/config.hpp"
#include "abm/core/containers.hpp"
#include "abm/core/errors.hpp"
#include "abm/core/rng.hpp"
#include "abm/core/schedulers.hpp"
#include "abm/core/schema.hpp"
#include "abm/core/type_name.hpp"
#include "abm/spaces/space_concepts.hpp"

namespace abm {
namespace core {

// Property bag for models that carry no user properties.
struct NoProperties {};

template <AgentType AgentT,
          class SpaceT       = spaces::NoSpace,
          class PropertiesT  = NoProperties,
          ContainerKind Kind = ContainerKind::mapping>
class Model {
public:
    using agent_type      = AgentT;
    using space_type      = SpaceT;
    using properties_type = PropertiesT;
    using container_type  = container_for<AgentT, Kind>;
    using scheduler_type  = std::function<std::vector<agent_id_t>(Model&)>;

    static constexpr ContainerKind container_kind = Kind;
    static constexpr bool removable = container_type::removable;
    static constexpr bool spatial   = spaces::has_space_v<SpaceT>;

    /**
     * @brief Build an empty model and validate the agent type against the space.
     * @param space     Spatial structure (spaces::NoSpace for none).
     * @param scheduler Any callable `std::vector<agent_id_t>(Model&)`.
     * @param properties User model-level state.
     * @param rng       Random source owned by the model.
     * @param warn      Emit advisory schema warnings.
     * @throws SchemaError if any concrete agent type does not fit the space.
     */
    template <class Sched = schedulers::Fastest>
    explicit Model(SpaceT space = SpaceT{}, Sched scheduler = Sched{},
                   PropertiesT properties = PropertiesT{}, Rng rng = Rng{}, bool warn = true)
        : space_(std::move(space)),
          scheduler_(std::move(scheduler)),
          scheduler_name_(short_name(type_name<Sched>())),
          properties_(std::move(properties)),
          rng_(rng) {
        validate_schemas(agent_schemas<AgentT>(), spaces::describe_space<SpaceT>(), warn, is_variant_v<AgentT>);
    }

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;
    Model(Model&&) = default;
    Model& operator=(Model&&) = default;

    // ---- accessors ----

    SpaceT& space() noexcept { return space_; }
    const SpaceT& space() const noexcept { return space_; }
    PropertiesT& properties() noexcept { return properties_; }
    const PropertiesT& properties() const noexcept { return properties_; }
    Rng& rng() noexcept { return rng_; }
    const std::string& scheduler_name() const noexcept { return scheduler_name_; }

    std::size_t nagents() const noexcept { return agents_.size(); }
    agent_id_t nextid() const noexcept { return agents_.nextid(); }
    bool has_agent(agent_id_t id) const { return agents_.contains(id); }
    std::vector<agent_id_t> agent_ids() const { return agents_.ids(); }

    AgentT& agent(agent_id_t id) { return agents_.get(id); }
    const AgentT& agent(agent_id_t id) const { return agents_.get(id); }
    AgentT& operator[](agent_id_t id) { return agents_.get(id); }
    const AgentT& operator[](agent_id_t id) const { return agents_.get(id); }
    AgentT* find_agent(agent_id_t id) noexcept { return agents_.find(id); }
    const AgentT* find_agent(agent_id_t id) const noexcept { return agents_.find(id); }

    // Concrete alternative of a union agent; std::bad_variant_access on mismatch.
    template <class A>
    A& agent_as(agent_id_t id) {
        if constexpr (is_variant_v<AgentT>) return std::get<A>(agents_.get(id));
        else return agents_.get(id);
    }

    template <class F>
    void for_each_agent(F&& f) { agents_.for_each(std::forward<F>(f)); }
    template <class F>
    void for_each_agent(F&& f) const { agents_.for_each(std::forward<F>(f)); }

    // ---- lifecycle ----

    /**
     * @brief Insert an agent (a concrete alternative for union models).
     * @return Reference to the stored agent, typed as the argument.
     * @throws InvalidArgumentError if the position is not placeable,
     *         DuplicateIdError / IdSequenceError from the container.
     */
    template <class A>
        requires std::constructible_from<AgentT, A&&>
    auto& add_agent(A agent) {
        if constexpr (spatial) space_.check_placement(position_of(agent));
        AgentT& stored = agents_.add(AgentT(std::move(agent)));
        if constexpr (spatial) space_.add_to_space(agent_id(stored), position_of(stored));
        if constexpr (is_variant_v<AgentT> && !std::is_same_v<A, AgentT>) return std::get<A>(stored);
        else return stored;
    }

    // Construct A{nextid(), args...} in place.
    template <class A = AgentT, class... Args>
    auto& emplace_agent(Args&&... args) {
        return add_agent(A{nextid(), std::forward<Args>(args)...});
    }

    // Construct A{nextid(), random position, args...}. Single-occupancy grids
    // draw among empty cells only.
    template <class A = AgentT, class... Args>
    auto& emplace_agent_random_pos(Args&&... args) {
        static_assert(spatial, "emplace_agent_random_pos needs a space");
        if constexpr (requires { space_.random_empty(rng_); }) {
            auto p = space_.random_empty(rng_);
            if (!p) throw InvalidArgumentError("cannot place agent: every cell of the grid is occupied");
            return add_agent(A{nextid(), *p, std::forward<Args>(args)...});
        } else {
            auto p = space_.random_position(rng_);
            return add_agent(A{nextid(), p, std::forward<Args>(args)...});
        }
    }

    // Remove from space and container. Sequence models always throw.
    void remove_agent(agent_id_t id) {
        if constexpr (!removable) {
            agents_.remove(id);
        } else {
            AgentT& a = agents_.get(id);
            if constexpr (spatial) space_.remove_from_space(id, position_of(a));
            agents_.remove(id);
        }
    }

    template <class A>
        requires AgentType<A>
    void remove_agent(const A& agent) { remove_agent(agent_id(agent)); }

    // ---- space ----

    /**
     * @brief Move a stored agent to `pos`, keeping the space in sync.
     * @throws InvalidArgumentError if `pos` is not placeable (out of range,
     *         occupied single-occupancy cell). Moving to the current position
     *         is a no-op.
     */
    template <class A>
    void move_agent(A& agent, const typename SpaceT::position_type& pos) {
        static_assert(spatial, "move_agent needs a space");
        visit_agent(agent, [&](auto& a) {
            if (a.pos == pos) return;
            space_.check_placement(pos);
            space_.move(static_cast<agent_id_t>(a.id), a.pos, pos);
            a.pos = pos;
        });
    }

    decltype(auto) ids_in_position(const typename SpaceT::position_type& pos) const {
        return space_.ids_in_position(pos);
    }

    // ---- scheduling ----

    std::vector<agent_id_t> schedule() { return scheduler_(*this); }

    template <class Sched>
    void set_scheduler(Sched scheduler) {
        scheduler_name_ = short_name(type_name<Sched>());
        scheduler_ = std::move(scheduler);
    }

    // ---- description ----

    static const char* model_name() noexcept {
        return Kind == ContainerKind::mapping ? "StandardModel" : "UnremovableModel";
    }

    static std::string agent_type_description() {
        if constexpr (is_variant_v<AgentT>) {
            std::string out = "std::variant<";
            bool first = true;
            for (const auto& t : union_types<AgentT>()) {
                out += (first ? "" : ", ") + short_name(t.name);
                first = false;
            }
            return out + ">";
        } else {
            return short_name(type_name<AgentT>());
        }
    }

    std::string describe() const {
        std::ostringstream os;
        os << model_name() << " with " << nagents() << " agents of type " << agent_type_description() << "\n";
        os << " space: " << space_.summary() << "\n";
        os << " scheduler: " << scheduler_name_;
        if constexpr (!std::is_same_v<PropertiesT, NoProperties>)
            os << "\n properties: " << short_name(type_name<PropertiesT>());
        return os.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Model& m) { return os << m.describe(); }

private:
    template <class A>
    static auto position_of(const A& a) {
        return visit_agent(a, [](const auto& x) -> typename SpaceT::position_type { return x.pos; });
    }

    container_type  agents_;
    SpaceT          space_;
    scheduler_type  scheduler_;
    std::string     scheduler_name_;
    PropertiesT     properties_;
    Rng             rng_;
};

template <AgentType AgentT, class SpaceT = spaces::NoSpace, class PropertiesT = NoProperties>
using StandardModel = Model<AgentT, SpaceT, PropertiesT, ContainerKind::mapping>;

template <AgentType AgentT, class SpaceT = spaces::NoSpace, class PropertiesT = NoProperties>
using UnremovableModel = Model<AgentT, SpaceT, PropertiesT, ContainerKind::sequence>;

// Deduce the agent type from an instance. The prototype is not added.
template <AgentType A, class SpaceT = spaces::NoSpace, class Sched = schedulers::Fastest,
          class PropertiesT = NoProperties>
inline StandardModel<A, SpaceT, PropertiesT> make_model(const A& /*prototype*/, SpaceT space = SpaceT{},
                                                        Sched scheduler = Sched{},
                                                        PropertiesT properties = PropertiesT{},
                                                        Rng rng = Rng{}, bool warn = true) {
    return StandardModel<A, SpaceT, PropertiesT>(std::move(space), std::move(scheduler),
                                                 std::move(properties), rng, warn);
}

} // namespace core

using core::Model;
using core::StandardModel;
using core::UnremovableModel;
using core::make_model;
using core::NoProperties;

} // namespace abm
