// agent.hpp — agent record requirements and heterogeneous-population helpers
#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <variant>
#include <vector>

#include "abm/core/config.hpp"
#include "abm/core/type_name.hpp"

namespace abm {
namespace core {

// A single agent record: any struct with an `id` member readable as an id.
// Shape checks beyond this (integer id, pos/vel layout) are runtime schema
// checks so that mismatches surface as SchemaError at model construction.
template <class A>
concept AgentRecord = requires(const A& a) {
    { a.id } -> std::convertible_to<agent_id_t>;
};

template <class T> struct is_variant : std::false_type {};
template <class... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};
template <class T> inline constexpr bool is_variant_v = is_variant<T>::value;

template <class V> struct all_alternatives_are_agents : std::false_type {};
template <class... Ts>
struct all_alternatives_are_agents<std::variant<Ts...>>
    : std::bool_constant<(AgentRecord<Ts> && ...)> {};

// What a model may store: one agent struct, or a closed union of them.
template <class A>
concept AgentType = AgentRecord<A> || (is_variant_v<A> && all_alternatives_are_agents<A>::value);

// -------------------- Uniform access over single/union agents --------------------

template <AgentType A>
inline agent_id_t agent_id(const A& a) {
    if constexpr (is_variant_v<A>) {
        return std::visit([](const auto& x) { return static_cast<agent_id_t>(x.id); }, a);
    } else {
        return static_cast<agent_id_t>(a.id);
    }
}

// Apply f to the concrete agent behind a single-type or union reference.
template <class A, class F>
inline decltype(auto) visit_agent(A& a, F&& f) {
    if constexpr (is_variant_v<std::remove_const_t<A>>) return std::visit(std::forward<F>(f), a);
    else return std::forward<F>(f)(a);
}

// Runtime type tag: the variant alternative index, 0 for single-type models.
template <AgentType A>
inline std::size_t agent_kind(const A& a) noexcept {
    if constexpr (is_variant_v<A>) return a.index();
    else return 0;
}

// -------------------- Union decomposition --------------------

struct AgentTypeInfo {
    std::type_index type;
    std::string     name;
    std::size_t     kind;   // variant alternative index (first occurrence)
};

namespace detail {
template <class... Ts, std::size_t... Is>
inline std::vector<AgentTypeInfo> alternatives_(std::index_sequence<Is...>) {
    return { AgentTypeInfo{ std::type_index(typeid(Ts)), type_name<Ts>(), Is }... };
}
template <class A> struct alternatives {
    static std::vector<AgentTypeInfo> get() {
        return { AgentTypeInfo{ std::type_index(typeid(A)), type_name<A>(), 0 } };
    }
};
template <class... Ts> struct alternatives<std::variant<Ts...>> {
    static std::vector<AgentTypeInfo> get() {
        return alternatives_<Ts...>(std::index_sequence_for<Ts...>{});
    }
};
} // namespace detail

// Concrete member types in declaration order, one entry per alternative.
template <AgentType A>
inline std::vector<AgentTypeInfo> declared_types() {
    return detail::alternatives<A>::get();
}

// Concrete member types of an agent union in canonical order: sorted by
// demangled name, duplicates collapsed. std::variant<B, A> and
// std::variant<A, B> decompose to the same names in the same order.
// A single (non-variant) agent type decomposes to itself.
template <AgentType A>
inline std::vector<AgentTypeInfo> union_types() {
    std::vector<AgentTypeInfo> out = declared_types<A>();
    std::stable_sort(out.begin(), out.end(),
                     [](const AgentTypeInfo& a, const AgentTypeInfo& b) { return a.name < b.name; });
    out.erase(std::unique(out.begin(), out.end(),
                          [](const AgentTypeInfo& a, const AgentTypeInfo& b) { return a.type == b.type; }),
              out.end());
    return out;
}

} // namespace core
} // namespace abm
