// grid_space.hpp — discrete D-dimensional grids (multi- and single-occupancy)
//
// Implementation notes:
// - Positions are 1-based std::array<int, D>; cell storage is linear with the
//   first coordinate fastest (x + W*y + W*H*z ...).
// - GridSpaceBase holds the geometry shared by both occupancy models
//   (extent, periodicity, metric, offsets-at-radius cache) and dispatches
//   occupancy queries to the derived class via CRTP.
// - offsets_at_radius(r) is computed once per radius and cached.

#pragma once
#include <array>
#include <cstddef>
#include <cstdlib>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "abm/core/config.hpp"
#include "abm/core/errors.hpp"
#include "abm/core/rng.hpp"
#include "abm/spaces/space_concepts.hpp"

namespace abm {
namespace spaces {

template <std::size_t D>
using GridPos = std::array<int, D>;

template <class Derived, std::size_t D>
class GridSpaceBase {
public:
    static_assert(D >= 1, "grid spaces need at least one dimension");
    static constexpr SpaceKind kind = SpaceKind::grid;
    static constexpr std::size_t dims = D;
    using position_type = GridPos<D>;
    using offset_type   = GridPos<D>;

    GridSpaceBase(const GridPos<D>& extent, bool periodic, Metric metric)
        : extent_(extent), periodic_(periodic), metric_(metric) {
        num_cells_ = 1;
        for (std::size_t i = 0; i < D; ++i) {
            if (extent_[i] <= 0)
                throw core::InvalidArgumentError("grid extent must be positive in every dimension");
            num_cells_ *= static_cast<std::size_t>(extent_[i]);
        }
    }

    const GridPos<D>& extent() const noexcept { return extent_; }
    bool periodic() const noexcept { return periodic_; }
    Metric metric() const noexcept { return metric_; }
    std::size_t num_cells() const noexcept { return num_cells_; }

    bool in_bounds(const position_type& p) const noexcept {
        for (std::size_t i = 0; i < D; ++i)
            if (p[i] < 1 || p[i] > extent_[i]) return false;
        return true;
    }

    // Linear cell index of a 1-based position. Precondition: in_bounds(p).
    std::size_t index(const position_type& p) const noexcept {
        std::size_t idx = 0, stride = 1;
        for (std::size_t i = 0; i < D; ++i) {
            idx += static_cast<std::size_t>(p[i] - 1) * stride;
            stride *= static_cast<std::size_t>(extent_[i]);
        }
        return idx;
    }

    position_type position_of(std::size_t idx) const noexcept {
        position_type p{};
        for (std::size_t i = 0; i < D; ++i) {
            const auto w = static_cast<std::size_t>(extent_[i]);
            p[i] = static_cast<int>(idx % w) + 1;
            idx /= w;
        }
        return p;
    }

    template <class URBG>
    position_type random_position(URBG& rng) const {
        return position_of(static_cast<std::size_t>(core::uniform_bounded(rng, num_cells_)));
    }

    /**
     * @brief All integer offsets whose metric distance from the origin is exactly r.
     * @param r Radius, r >= 0. r = 0 yields only the zero offset.
     * @throws UnsupportedMetricError for the Euclidean metric.
     * @note Enumeration order is lexicographic with the last coordinate fastest.
     */
    const std::vector<offset_type>& offsets_at_radius(int r) const {
        if (metric_ == Metric::euclidean)
            throw core::UnsupportedMetricError(
                "offsets at a fixed radius are not defined for the Euclidean metric on a grid");
        if (r < 0) throw core::InvalidArgumentError("offset radius must be non-negative");

        auto it = offsets_cache_.find(r);
        if (it != offsets_cache_.end()) return it->second;

        std::vector<offset_type> out;
        offset_type beta;
        beta.fill(-r);
        for (;;) {
            int cheb = 0, manh = 0;
            for (int b : beta) {
                const int a = std::abs(b);
                manh += a;
                if (a > cheb) cheb = a;
            }
            if ((metric_ == Metric::chebyshev ? cheb : manh) == r) out.push_back(beta);

            // odometer step
            std::size_t k = D;
            while (k > 0) {
                --k;
                if (beta[k] < r) { ++beta[k]; break; }
                beta[k] = -r;
                if (k == 0) { k = D + 1; break; }
            }
            if (k == D + 1) break;
        }
        return offsets_cache_.emplace(r, std::move(out)).first->second;
    }

    std::string summary() const {
        std::ostringstream os;
        os << Derived::name() << " with size (";
        for (std::size_t i = 0; i < D; ++i) os << (i ? ", " : "") << extent_[i];
        os << "), metric=" << to_string(metric_) << ", periodic=" << (periodic_ ? "true" : "false");
        return os.str();
    }

protected:
    void require_in_bounds(const position_type& p) const {
        if (!in_bounds(p)) throw core::InvalidArgumentError("position is outside the grid");
    }

    GridPos<D>  extent_;
    bool        periodic_;
    Metric      metric_;
    std::size_t num_cells_{0};
    mutable std::map<int, std::vector<offset_type>> offsets_cache_;
};

// Grid where any number of agents may share a cell.
template <std::size_t D>
class GridSpace : public GridSpaceBase<GridSpace<D>, D> {
    using Base = GridSpaceBase<GridSpace<D>, D>;

public:
    using typename Base::position_type;

    explicit GridSpace(const GridPos<D>& extent, bool periodic = true, Metric metric = Metric::chebyshev)
        : Base(extent, periodic, metric), cells_(this->num_cells()) {}

    static const char* name() noexcept { return "GridSpace"; }

    void check_placement(const position_type& p) const { this->require_in_bounds(p); }

    void add_to_space(agent_id_t id, const position_type& p) {
        cells_[this->index(p)].push_back(id);
    }

    void remove_from_space(agent_id_t id, const position_type& p) {
        auto& cell = cells_[this->index(p)];
        for (std::size_t i = 0; i < cell.size(); ++i) {
            if (cell[i] == id) {
                cell[i] = cell.back();
                cell.pop_back();
                return;
            }
        }
        ABM_ASSERT_H(false, "GridSpace::remove_from_space: id not found in cell");
    }

    void move(agent_id_t id, const position_type& from, const position_type& to) {
        remove_from_space(id, from);
        add_to_space(id, to);
    }

    const std::vector<agent_id_t>& ids_in_position(const position_type& p) const {
        return cells_[this->index(p)];
    }

    bool is_empty(const position_type& p) const { return cells_[this->index(p)].empty(); }

private:
    std::vector<std::vector<agent_id_t>> cells_;
};

// Grid where each cell holds at most one agent; 0 marks an empty cell.
template <std::size_t D>
class GridSpaceSingle : public GridSpaceBase<GridSpaceSingle<D>, D> {
    using Base = GridSpaceBase<GridSpaceSingle<D>, D>;

public:
    using typename Base::position_type;
    static constexpr agent_id_t empty_cell = 0;

    explicit GridSpaceSingle(const GridPos<D>& extent, bool periodic = true, Metric metric = Metric::chebyshev)
        : Base(extent, periodic, metric), cells_(this->num_cells(), empty_cell) {}

    static const char* name() noexcept { return "GridSpaceSingle"; }

    void check_placement(const position_type& p) const {
        this->require_in_bounds(p);
        if (cells_[this->index(p)] != empty_cell)
            throw core::InvalidArgumentError("cell is already occupied in a single-occupancy grid");
    }

    void add_to_space(agent_id_t id, const position_type& p) {
        ABM_ASSERT_H(cells_[this->index(p)] == empty_cell, "GridSpaceSingle::add_to_space: cell occupied");
        cells_[this->index(p)] = id;
    }

    void remove_from_space(agent_id_t id, const position_type& p) {
        ABM_ASSERT_H(cells_[this->index(p)] == id, "GridSpaceSingle::remove_from_space: id not in cell");
        (void)id;
        cells_[this->index(p)] = empty_cell;
    }

    void move(agent_id_t id, const position_type& from, const position_type& to) {
        remove_from_space(id, from);
        add_to_space(id, to);
    }

    agent_id_t id_in_position(const position_type& p) const { return cells_[this->index(p)]; }

    std::size_t count_empty() const noexcept {
        std::size_t n = 0;
        for (agent_id_t id : cells_) n += (id == empty_cell);
        return n;
    }

    // Uniform pick among empty cells; nullopt when the grid is full.
    template <class URBG>
    std::optional<position_type> random_empty(URBG& rng) const {
        const std::size_t empties = count_empty();
        if (empties == 0) return std::nullopt;
        std::size_t k = static_cast<std::size_t>(core::uniform_bounded(rng, empties));
        for (std::size_t i = 0; i < cells_.size(); ++i) {
            if (cells_[i] != empty_cell) continue;
            if (k == 0) return this->position_of(i);
            --k;
        }
        return std::nullopt;
    }

    std::vector<agent_id_t> ids_in_position(const position_type& p) const {
        const agent_id_t id = cells_[this->index(p)];
        if (id == empty_cell) return {};
        return {id};
    }

    bool is_empty(const position_type& p) const { return cells_[this->index(p)] == empty_cell; }

private:
    std::vector<agent_id_t> cells_;
};

} // namespace spaces
} // namespace abm
