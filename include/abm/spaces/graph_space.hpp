// graph_space.hpp — agents on the vertices of an undirected graph
#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include "abm/core/config.hpp"
#include "abm/core/errors.hpp"
#include "abm/core/rng.hpp"
#include "abm/spaces/space_concepts.hpp"

namespace abm {
namespace spaces {

// Vertices are 1-based ints; any number of agents may share a vertex.
class GraphSpace {
public:
    static constexpr SpaceKind kind = SpaceKind::graph;
    static constexpr std::size_t dims = 1;
    using position_type = int;

    explicit GraphSpace(std::size_t num_vertices)
        : adjacency_(num_vertices), occupants_(num_vertices) {
        if (num_vertices == 0) throw core::InvalidArgumentError("graph space needs at least one vertex");
    }

    std::size_t num_vertices() const noexcept { return adjacency_.size(); }

    // Undirected edge; duplicates and self-loops are ignored.
    void add_edge(int a, int b) {
        require_vertex(a);
        require_vertex(b);
        if (a == b) return;
        auto& na = adjacency_[slot(a)];
        if (std::find(na.begin(), na.end(), b) != na.end()) return;
        na.push_back(b);
        adjacency_[slot(b)].push_back(a);
    }

    const std::vector<int>& neighbors(int v) const {
        require_vertex(v);
        return adjacency_[slot(v)];
    }

    template <class URBG>
    position_type random_position(URBG& rng) const {
        return static_cast<int>(core::uniform_bounded(rng, adjacency_.size())) + 1;
    }

    void check_placement(const position_type& v) const { require_vertex(v); }

    void add_to_space(agent_id_t id, const position_type& v) { occupants_[slot(v)].push_back(id); }

    void remove_from_space(agent_id_t id, const position_type& v) {
        auto& cell = occupants_[slot(v)];
        auto it = std::find(cell.begin(), cell.end(), id);
        ABM_ASSERT_H(it != cell.end(), "GraphSpace::remove_from_space: id not on vertex");
        if (it != cell.end()) {
            *it = cell.back();
            cell.pop_back();
        }
    }

    void move(agent_id_t id, const position_type& from, const position_type& to) {
        remove_from_space(id, from);
        add_to_space(id, to);
    }

    const std::vector<agent_id_t>& ids_in_position(const position_type& v) const {
        return occupants_[slot(v)];
    }

    bool is_empty(const position_type& v) const { return occupants_[slot(v)].empty(); }

    std::string summary() const {
        std::size_t edges = 0;
        for (const auto& n : adjacency_) edges += n.size();
        return "GraphSpace with " + std::to_string(adjacency_.size()) + " vertices and " +
               std::to_string(edges / 2) + " edges";
    }

private:
    static std::size_t slot(int v) noexcept { return static_cast<std::size_t>(v - 1); }

    void require_vertex(int v) const {
        if (v < 1 || static_cast<std::size_t>(v) > adjacency_.size())
            throw core::InvalidArgumentError("vertex " + std::to_string(v) + " is not in the graph");
    }

    std::vector<std::vector<int>>        adjacency_;
    std::vector<std::vector<agent_id_t>> occupants_;
};

} // namespace spaces
} // namespace abm
