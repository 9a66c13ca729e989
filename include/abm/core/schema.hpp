// schema.hpp — structural description and validation of agent records
#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "abm/core/agent.hpp"
#include "abm/core/type_name.hpp"
#include "abm/spaces/space_concepts.hpp"

namespace abm {
namespace core {

enum class FieldType { integer, floating, int_tuple, float_tuple, other };

const char* to_string(FieldType t) noexcept;

struct FieldInfo {
    std::string name;
    FieldType   type{FieldType::other};
    std::size_t dims{0}; // tuple length; 0 for scalars
};

/**
 * @brief Declared layout of one concrete agent type.
 * @note Fields are listed in declaration order. `assignable` is false when
 *       the record cannot be mutated in place (const members).
 */
struct AgentSchema {
    std::string            type_name;
    std::vector<FieldInfo> fields;
    bool                   assignable{true};
};

template <class T> struct is_std_array : std::false_type {};
template <class T, std::size_t N> struct is_std_array<std::array<T, N>> : std::true_type {};

template <class T>
inline FieldInfo describe_field(std::string name) {
    using U = std::remove_cvref_t<T>;
    FieldInfo f{std::move(name), FieldType::other, 0};
    if constexpr (std::is_same_v<U, bool>) {
        f.type = FieldType::other;
    } else if constexpr (std::is_integral_v<U>) {
        f.type = FieldType::integer;
    } else if constexpr (std::is_floating_point_v<U>) {
        f.type = FieldType::floating;
    } else if constexpr (is_std_array<U>::value) {
        using E = typename U::value_type;
        f.dims = std::tuple_size_v<U>;
        if constexpr (std::is_integral_v<E> && !std::is_same_v<E, bool>) f.type = FieldType::int_tuple;
        else if constexpr (std::is_floating_point_v<E>) f.type = FieldType::float_tuple;
    }
    return f;
}

// Schema of a single agent struct. A struct may publish its own layout via
// `static AgentSchema schema()`; otherwise the conventional fields id, pos
// and vel are described in that order from the members actually present.
template <class A>
inline AgentSchema schema_of() {
    AgentSchema s;
    if constexpr (requires { { A::schema() } -> std::convertible_to<AgentSchema>; }) {
        s = A::schema();
    } else {
        if constexpr (requires { &A::id; })  s.fields.push_back(describe_field<decltype(A::id)>("id"));
        if constexpr (requires { &A::pos; }) s.fields.push_back(describe_field<decltype(A::pos)>("pos"));
        if constexpr (requires { &A::vel; }) s.fields.push_back(describe_field<decltype(A::vel)>("vel"));
    }
    if (s.type_name.empty()) s.type_name = type_name<A>();
    s.assignable = std::is_copy_assignable_v<A> || std::is_move_assignable_v<A>;
    return s;
}

namespace detail {
template <class A> struct schemas_of {
    static std::vector<AgentSchema> get() { return { schema_of<A>() }; }
};
template <class... Ts> struct schemas_of<std::variant<Ts...>> {
    static std::vector<AgentSchema> get() { return { schema_of<Ts>()... }; }
};
} // namespace detail

// One schema per concrete type; a union yields one per alternative.
template <AgentType A>
inline std::vector<AgentSchema> agent_schemas() {
    return detail::schemas_of<A>::get();
}

/**
 * @brief Validate one agent schema against a space.
 * @throws SchemaError when `id` is not the first, integer-typed field, or when
 *         a space is configured and `pos` is not the second field with the
 *         space's coordinate type and dimensionality.
 * @note With `warn`, non-assignable records and a continuous-space `vel` that
 *       is not a float tuple of matching size produce advisory log warnings.
 */
void validate_schema(const AgentSchema& schema, const spaces::SpaceDescriptor& space, bool warn);

// Validate every concrete type of an agent (union) against a space. With
// `warn`, a union agent type also gets an advisory warning.
void validate_schemas(const std::vector<AgentSchema>& schemas,
                      const spaces::SpaceDescriptor& space, bool warn, bool is_union = false);

} // namespace core
} // namespace abm
