#pragma once
/*
containers.hpp — agent storage backends

Two interchangeable strategies with the same interface:

  MappingContainer<A>   id -> agent, arbitrary insert/remove.
                        Dense vector of owning pointers plus an id -> slot map.
                        Removal swaps the last slot into the hole (O(1)), so
                        iteration is insertion order until the first removal
                        and unspecified afterwards.

  SequenceContainer<A>  append-only deque; the agent at 1-based position k
                        has id k. Lookups are index arithmetic, removal is
                        not supported.

Both keep stored agents at stable addresses: a reference returned by add/get
stays valid until that agent is removed.

Neither container touches its storage before every precondition of an
operation has been checked, so a throwing call leaves it unchanged.
*/

#include <cstddef>
#include <deque>
#include <type_traits>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "abm/core/agent.hpp"
#include "abm/core/config.hpp"
#include "abm/core/errors.hpp"

namespace abm {
namespace core {

enum class ContainerKind { mapping, sequence };

template <AgentType A>
class MappingContainer {
public:
    using agent_type = A;
    static constexpr ContainerKind kind = ContainerKind::mapping;
    static constexpr bool removable = true;

    std::size_t size() const noexcept { return agents_.size(); }
    bool empty() const noexcept { return agents_.empty(); }
    bool contains(agent_id_t id) const { return slot_.find(id) != slot_.end(); }

    // Largest id ever inserted (0 before the first insertion).
    agent_id_t max_id() const noexcept { return max_id_; }
    agent_id_t nextid() const noexcept { return max_id_ + 1; }

    A& add(A agent) {
        const agent_id_t id = agent_id(agent);
        if (id < 1)
            throw InvalidArgumentError("cannot add agent: ids must be positive, got id=" + std::to_string(id));
        if (contains(id))
            throw DuplicateIdError("cannot add agent: there is already an agent with id=" + std::to_string(id));
        slot_.reserve(slot_.size() + 1);
        agents_.push_back(std::make_unique<A>(std::move(agent)));
        slot_.emplace(id, agents_.size() - 1);
        if (id > max_id_) max_id_ = id;
        return *agents_.back();
    }

    void remove(agent_id_t id) {
        auto it = slot_.find(id);
        if (it == slot_.end())
            throw MissingAgentError("cannot remove agent: no agent with id=" + std::to_string(id));
        const std::size_t pos = it->second;
        const std::size_t last = agents_.size() - 1;
        if (pos != last) {
            std::swap(agents_[pos], agents_[last]);
            slot_[agent_id(*agents_[pos])] = pos;
        }
        agents_.pop_back();
        slot_.erase(it);
    }

    A* find(agent_id_t id) noexcept {
        auto it = slot_.find(id);
        return it == slot_.end() ? nullptr : agents_[it->second].get();
    }
    const A* find(agent_id_t id) const noexcept {
        auto it = slot_.find(id);
        return it == slot_.end() ? nullptr : agents_[it->second].get();
    }

    A& get(agent_id_t id) {
        if (A* a = find(id)) return *a;
        throw MissingAgentError("no agent with id=" + std::to_string(id));
    }
    const A& get(agent_id_t id) const {
        if (const A* a = find(id)) return *a;
        throw MissingAgentError("no agent with id=" + std::to_string(id));
    }

    // Native iteration order.
    std::vector<agent_id_t> ids() const {
        std::vector<agent_id_t> out;
        out.reserve(agents_.size());
        for (const auto& p : agents_) out.push_back(agent_id(*p));
        return out;
    }

    template <class F>
    void for_each(F&& f) {
        for (auto& p : agents_) f(*p);
    }
    template <class F>
    void for_each(F&& f) const {
        for (const auto& p : agents_) f(static_cast<const A&>(*p));
    }

private:
    std::vector<std::unique_ptr<A>>            agents_;
    std::unordered_map<agent_id_t, std::size_t> slot_;
    agent_id_t                                  max_id_{0};
};

template <AgentType A>
class SequenceContainer {
public:
    using agent_type = A;
    static constexpr ContainerKind kind = ContainerKind::sequence;
    static constexpr bool removable = false;

    std::size_t size() const noexcept { return agents_.size(); }
    bool empty() const noexcept { return agents_.empty(); }
    bool contains(agent_id_t id) const noexcept {
        return id >= 1 && static_cast<std::size_t>(id) <= agents_.size();
    }

    agent_id_t max_id() const noexcept { return static_cast<agent_id_t>(agents_.size()); }
    agent_id_t nextid() const noexcept { return static_cast<agent_id_t>(agents_.size()) + 1; }

    A& add(A agent) {
        const agent_id_t id = agent_id(agent);
        const agent_id_t expected = nextid();
        if (id != expected)
            throw IdSequenceError("cannot add agent of id " + std::to_string(id) +
                                  " to a sequence container of " + std::to_string(agents_.size()) +
                                  " agents; expected id == " + std::to_string(expected));
        agents_.push_back(std::move(agent));
        return agents_.back();
    }

    [[noreturn]] void remove(agent_id_t) {
        throw UnsupportedOperationError("cannot remove agents from a sequence container");
    }

    A* find(agent_id_t id) noexcept {
        return contains(id) ? &agents_[static_cast<std::size_t>(id - 1)] : nullptr;
    }
    const A* find(agent_id_t id) const noexcept {
        return contains(id) ? &agents_[static_cast<std::size_t>(id - 1)] : nullptr;
    }

    A& get(agent_id_t id) {
        if (A* a = find(id)) return *a;
        throw MissingAgentError("no agent with id=" + std::to_string(id));
    }
    const A& get(agent_id_t id) const {
        if (const A* a = find(id)) return *a;
        throw MissingAgentError("no agent with id=" + std::to_string(id));
    }

    std::vector<agent_id_t> ids() const {
        std::vector<agent_id_t> out(agents_.size());
        for (std::size_t i = 0; i < out.size(); ++i) out[i] = static_cast<agent_id_t>(i + 1);
        return out;
    }

    template <class F>
    void for_each(F&& f) {
        for (auto& a : agents_) f(a);
    }
    template <class F>
    void for_each(F&& f) const {
        for (const auto& a : agents_) f(a);
    }

private:
    std::deque<A> agents_;
};

template <AgentType A, ContainerKind K>
using container_for = std::conditional_t<K == ContainerKind::mapping,
                                         MappingContainer<A>, SequenceContainer<A>>;

} // namespace core
} // namespace abm
