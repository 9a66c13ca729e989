// space_concepts.hpp — minimal space requirements consumed by the abm core
#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <vector>

#include "abm/core/config.hpp"

namespace abm {
namespace spaces {

enum class SpaceKind { none, grid, graph, continuous };

// Distance metric of a discrete grid. Only chebyshev and manhattan admit a
// well-defined set of integer offsets at a fixed radius.
enum class Metric { chebyshev, manhattan, euclidean };

inline const char* to_string(Metric m) noexcept {
    switch (m) {
        case Metric::chebyshev: return "chebyshev";
        case Metric::manhattan: return "manhattan";
        case Metric::euclidean: return "euclidean";
    }
    return "?";
}

inline const char* to_string(SpaceKind k) noexcept {
    switch (k) {
        case SpaceKind::none:       return "none";
        case SpaceKind::grid:       return "grid";
        case SpaceKind::graph:      return "graph";
        case SpaceKind::continuous: return "continuous";
    }
    return "?";
}

// What schema validation needs to know about a space.
struct SpaceDescriptor {
    SpaceKind   kind{SpaceKind::none};
    std::size_t dims{0};
};

// Placeholder for models without spatial structure.
struct NoPosition {};

struct NoSpace {
    static constexpr SpaceKind kind = SpaceKind::none;
    static constexpr std::size_t dims = 0;
    using position_type = NoPosition;
    std::string summary() const { return "nothing (no spatial structure)"; }
};

// A space type S models Space if it exposes the capability surface the
// model uses to keep occupancy in sync with agent positions.
template <class S>
concept Space = requires(S& s, const S& cs, agent_id_t id, const typename S::position_type& p) {
    { S::kind } -> std::convertible_to<SpaceKind>;
    { S::dims } -> std::convertible_to<std::size_t>;
    { cs.check_placement(p) } -> std::same_as<void>;
    { s.add_to_space(id, p) } -> std::same_as<void>;
    { s.remove_from_space(id, p) } -> std::same_as<void>;
    { s.move(id, p, p) } -> std::same_as<void>;
    { cs.is_empty(p) } -> std::convertible_to<bool>;
    { cs.summary() } -> std::convertible_to<std::string>;
};

template <class S>
concept GridLike = Space<S> && S::kind == SpaceKind::grid && requires(const S& cs, int r) {
    { cs.metric() } -> std::convertible_to<Metric>;
    { cs.periodic() } -> std::convertible_to<bool>;
    cs.offsets_at_radius(r);
};

template <class S>
concept ContinuousLike = Space<S> && S::kind == SpaceKind::continuous && requires(const S& cs) {
    { cs.periodic() } -> std::convertible_to<bool>;
    cs.extent();
};

template <class S>
inline constexpr bool has_space_v = !std::same_as<S, NoSpace>;

template <class S>
constexpr SpaceDescriptor describe_space() noexcept {
    return SpaceDescriptor{S::kind, S::dims};
}

} // namespace spaces
} // namespace abm
