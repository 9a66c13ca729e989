// schedulers.hpp — per-step activation order policies
//
// A scheduler is any callable `std::vector<agent_id_t>(Model&)`. The ones
// here are generic over the model type so the model can default to one of
// them without a circular include; custom schedulers may be lambdas or
// structs with private state.

#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <numeric>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

#include "abm/core/agent.hpp"
#include "abm/core/config.hpp"
#include "abm/core/errors.hpp"
#include "abm/core/rng.hpp"
#include "abm/core/type_name.hpp"

namespace abm {
namespace schedulers {

// Ascending id order.
struct ById {
    template <class M>
    std::vector<agent_id_t> operator()(M& model) const {
        auto ids = model.agent_ids();
        std::sort(ids.begin(), ids.end());
        return ids;
    }
};

// Whatever order the container iterates in; the cheapest policy.
struct Fastest {
    template <class M>
    std::vector<agent_id_t> operator()(M& model) const {
        return model.agent_ids();
    }
};

// Fresh uniform permutation on every call.
struct Randomly {
    template <class M>
    std::vector<agent_id_t> operator()(M& model) const {
        auto ids = model.agent_ids();
        core::shuffle(ids, model.rng());
        return ids;
    }
};

// Uniform sample without replacement of round(fraction * N) agents.
class Partially {
public:
    explicit Partially(double fraction) : fraction_(fraction) {
        if (!(fraction >= 0.0 && fraction <= 1.0))
            throw core::InvalidArgumentError("Partially: fraction must lie in [0, 1], got " +
                                             std::to_string(fraction));
    }

    double fraction() const noexcept { return fraction_; }

    template <class M>
    std::vector<agent_id_t> operator()(M& model) const {
        auto ids = model.agent_ids();
        // nearbyint under the default rounding mode: ties go to even
        const auto k = static_cast<std::size_t>(std::nearbyint(fraction_ * static_cast<double>(ids.size())));
        return core::sample_without_replacement(std::move(ids), k, model.rng());
    }

private:
    double fraction_;
};

/**
 * @brief Ascending order of a per-agent value read at call time.
 * @tparam Accessor Pointer-to-member or callable taking the model's agent type.
 * @note Ties keep container order (stable sort).
 */
template <class Accessor>
class ByProperty {
public:
    explicit ByProperty(Accessor accessor) : accessor_(std::move(accessor)) {}

    template <class M>
    std::vector<agent_id_t> operator()(M& model) const {
        using agent_t = typename M::agent_type;
        using key_t = std::remove_cvref_t<std::invoke_result_t<const Accessor&, const agent_t&>>;

        const auto ids = model.agent_ids();
        std::vector<key_t> keys;
        keys.reserve(ids.size());
        for (agent_id_t id : ids) keys.push_back(std::invoke(accessor_, std::as_const(model.agent(id))));

        std::vector<std::size_t> perm(ids.size());
        std::iota(perm.begin(), perm.end(), std::size_t{0});
        std::stable_sort(perm.begin(), perm.end(),
                         [&](std::size_t a, std::size_t b) { return keys[a] < keys[b]; });

        std::vector<agent_id_t> out;
        out.reserve(ids.size());
        for (std::size_t i : perm) out.push_back(ids[i]);
        return out;
    }

private:
    Accessor accessor_;
};

/*
ByType: groups agents of a union model by concrete type.

Groups come in canonical type order (sorted by type name), in an explicit
order given through ordered<T...>(), or reshuffled on every call. Inside a
group agents keep container order unless shuffle_agents is set. With an
explicit order only the listed types are scheduled, each listed once.
*/
class ByType {
public:
    ByType(bool shuffle_types, bool shuffle_agents)
        : shuffle_types_(shuffle_types), shuffle_agents_(shuffle_agents) {}

    template <class... Ts>
    static ByType ordered(bool shuffle_agents) {
        static_assert(sizeof...(Ts) > 0, "ByType::ordered needs at least one type");
        ByType b(false, shuffle_agents);
        b.order_ = {std::type_index(typeid(Ts))...};
        b.order_names_ = {core::type_name<Ts>()...};
        for (std::size_t i = 0; i < b.order_.size(); ++i)
            for (std::size_t j = 0; j < i; ++j)
                if (b.order_[i] == b.order_[j])
                    throw core::InvalidArgumentError("ByType: type `" + b.order_names_[i] +
                                                     "` is listed more than once");
        b.explicit_order_ = true;
        return b;
    }

    bool shuffle_types() const noexcept { return shuffle_types_; }
    bool shuffle_agents() const noexcept { return shuffle_agents_; }

    template <class M>
    std::vector<agent_id_t> operator()(M& model) const {
        using agent_t = typename M::agent_type;
        const auto canonical = core::union_types<agent_t>();
        const auto declared = core::declared_types<agent_t>();

        // group slot of every variant alternative
        std::vector<std::size_t> slot_of_kind(declared.size());
        for (const auto& d : declared) {
            for (std::size_t s = 0; s < canonical.size(); ++s)
                if (canonical[s].type == d.type) slot_of_kind[d.kind] = s;
        }

        std::vector<std::size_t> group_order;
        if (explicit_order_) {
            for (std::size_t i = 0; i < order_.size(); ++i) {
                std::size_t found = canonical.size();
                for (std::size_t s = 0; s < canonical.size(); ++s)
                    if (canonical[s].type == order_[i]) found = s;
                if (found == canonical.size())
                    throw core::InvalidArgumentError("ByType: type `" + order_names_[i] +
                                                     "` is not an agent type of this model");
                group_order.push_back(found);
            }
        } else {
            group_order.resize(canonical.size());
            std::iota(group_order.begin(), group_order.end(), std::size_t{0});
            if (shuffle_types_) core::shuffle(group_order, model.rng());
        }

        std::vector<std::vector<agent_id_t>> groups(canonical.size());
        model.for_each_agent([&](const agent_t& a) {
            groups[slot_of_kind[core::agent_kind(a)]].push_back(core::agent_id(a));
        });

        std::vector<agent_id_t> out;
        out.reserve(model.nagents());
        for (std::size_t g : group_order) {
            auto& ids = groups[g];
            if (shuffle_agents_) core::shuffle(ids, model.rng());
            out.insert(out.end(), ids.begin(), ids.end());
        }
        return out;
    }

private:
    bool shuffle_types_;
    bool shuffle_agents_;
    bool explicit_order_{false};
    std::vector<std::type_index> order_;
    std::vector<std::string> order_names_;
};

} // namespace schedulers
} // namespace abm
