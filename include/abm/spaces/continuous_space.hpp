// continuous_space.hpp — D-dimensional box of reals, periodic or bounded
//
// Occupancy is tracked in a uniform cell grid (cell edge = spacing) so that
// radius queries only visit the cells overlapping the query box, the same
// idea as a spatial hash but with dense storage since the box is bounded.

#pragma once
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "abm/core/config.hpp"
#include "abm/core/errors.hpp"
#include "abm/core/rng.hpp"
#include "abm/spaces/space_concepts.hpp"

namespace abm {
namespace spaces {

template <std::size_t D>
using RealPos = std::array<double, D>;

template <std::size_t D>
class ContinuousSpace {
public:
    static_assert(D >= 1, "continuous spaces need at least one dimension");
    static constexpr SpaceKind kind = SpaceKind::continuous;
    static constexpr std::size_t dims = D;
    using position_type = RealPos<D>;

    /**
     * @param extent  Size of the box along each dimension; positions live in [0, extent).
     * @param periodic Wrap around at the boundaries when true.
     * @param spacing Largest cell edge of the occupancy index; 0 selects min(extent)/20.
     *                Each dimension is cut into ceil(extent / spacing) equal cells.
     */
    explicit ContinuousSpace(const RealPos<D>& extent, bool periodic = true, double spacing = 0.0)
        : extent_(extent), periodic_(periodic) {
        double min_ext = extent_[0];
        for (std::size_t i = 0; i < D; ++i) {
            if (!(extent_[i] > 0.0) || !std::isfinite(extent_[i]))
                throw core::InvalidArgumentError("continuous space extent must be positive and finite");
            min_ext = std::min(min_ext, extent_[i]);
        }
        if (spacing < 0.0 || !std::isfinite(spacing))
            throw core::InvalidArgumentError("continuous space spacing must be non-negative");
        spacing_ = spacing > 0.0 ? spacing : min_ext / 20.0;

        // cells tile each dimension exactly, so a wrapped cell index covers
        // the same real interval as the one it stands for
        std::size_t total = 1;
        for (std::size_t i = 0; i < D; ++i) {
            ncells_[i] = std::max<std::size_t>(1, static_cast<std::size_t>(std::ceil(extent_[i] / spacing_)));
            cell_edge_[i] = extent_[i] / static_cast<double>(ncells_[i]);
            total *= ncells_[i];
        }
        cells_.resize(total);
    }

    const RealPos<D>& extent() const noexcept { return extent_; }
    bool periodic() const noexcept { return periodic_; }
    double spacing() const noexcept { return spacing_; }

    template <class URBG>
    position_type random_position(URBG& rng) const {
        position_type p{};
        for (std::size_t i = 0; i < D; ++i) p[i] = core::uniform01(rng) * extent_[i];
        return p;
    }

    void check_placement(const position_type& p) const {
        for (std::size_t i = 0; i < D; ++i)
            if (!(p[i] >= 0.0 && p[i] < extent_[i]))
                throw core::InvalidArgumentError("position is outside the continuous space extent");
    }

    void add_to_space(agent_id_t id, const position_type& p) {
        cells_[cell_of(p)].push_back(id);
        positions_[id] = p;
    }

    void remove_from_space(agent_id_t id, const position_type& p) {
        auto& cell = cells_[cell_of(p)];
        for (std::size_t i = 0; i < cell.size(); ++i) {
            if (cell[i] == id) {
                cell[i] = cell.back();
                cell.pop_back();
                break;
            }
        }
        positions_.erase(id);
    }

    void move(agent_id_t id, const position_type& from, const position_type& to) {
        const std::size_t a = cell_of(from), b = cell_of(to);
        if (a != b) {
            auto& cell = cells_[a];
            for (std::size_t i = 0; i < cell.size(); ++i) {
                if (cell[i] == id) { cell[i] = cell.back(); cell.pop_back(); break; }
            }
            cells_[b].push_back(id);
        }
        positions_[id] = to;
    }

    // True when no agent sits at exactly this position.
    bool is_empty(const position_type& p) const {
        for (agent_id_t id : cells_[cell_of(p)]) {
            if (positions_.at(id) == p) return false;
        }
        return true;
    }

    // Minimum-image distance for periodic spaces, plain Euclidean otherwise.
    double distance(const position_type& a, const position_type& b) const noexcept {
        double acc = 0.0;
        for (std::size_t i = 0; i < D; ++i) {
            double d = std::abs(a[i] - b[i]);
            if (periodic_ && d > 0.5 * extent_[i]) d = extent_[i] - d;
            acc += d * d;
        }
        return std::sqrt(acc);
    }

    /**
     * @brief Ids of all agents within distance r of p (inclusive), self included.
     * @note Visits only cells overlapping the query box; order is unspecified.
     */
    std::vector<agent_id_t> nearby_ids(const position_type& p, double r) const {
        if (r < 0.0) throw core::InvalidArgumentError("search radius must be non-negative");
        std::array<long, D> lo{}, hi{};
        for (std::size_t i = 0; i < D; ++i) {
            lo[i] = static_cast<long>(std::floor((p[i] - r) / cell_edge_[i]));
            hi[i] = static_cast<long>(std::floor((p[i] + r) / cell_edge_[i]));
            const long n = static_cast<long>(ncells_[i]);
            if (periodic_) {
                if (hi[i] - lo[i] + 1 >= n) { lo[i] = 0; hi[i] = n - 1; }
            } else {
                lo[i] = std::max(lo[i], 0L);
                hi[i] = std::min(hi[i], n - 1);
                if (lo[i] > hi[i]) return {};
            }
        }

        std::vector<agent_id_t> out;
        std::array<long, D> c = lo;
        for (;;) {
            std::size_t idx = 0, stride = 1;
            for (std::size_t i = 0; i < D; ++i) {
                const long n = static_cast<long>(ncells_[i]);
                const long w = ((c[i] % n) + n) % n;
                idx += static_cast<std::size_t>(w) * stride;
                stride *= ncells_[i];
            }
            for (agent_id_t id : cells_[idx]) {
                if (distance(positions_.at(id), p) <= r) out.push_back(id);
            }

            std::size_t k = 0;
            while (k < D && c[k] == hi[k]) { c[k] = lo[k]; ++k; }
            if (k == D) break;
            ++c[k];
        }
        return out;
    }

    std::string summary() const {
        std::ostringstream os;
        os << "ContinuousSpace with extent (";
        for (std::size_t i = 0; i < D; ++i) os << (i ? ", " : "") << extent_[i];
        os << "), spacing=" << spacing_ << ", periodic=" << (periodic_ ? "true" : "false");
        return os.str();
    }

private:
    std::size_t cell_of(const position_type& p) const noexcept {
        std::size_t idx = 0, stride = 1;
        for (std::size_t i = 0; i < D; ++i) {
            long c = static_cast<long>(std::floor(p[i] / cell_edge_[i]));
            c = std::clamp(c, 0L, static_cast<long>(ncells_[i]) - 1);
            idx += static_cast<std::size_t>(c) * stride;
            stride *= ncells_[i];
        }
        return idx;
    }

    RealPos<D>                                   extent_;
    bool                                         periodic_;
    double                                       spacing_{0.0};
    std::array<std::size_t, D>                   ncells_{};
    RealPos<D>                                   cell_edge_{};
    std::vector<std::vector<agent_id_t>>         cells_;
    std::unordered_map<agent_id_t, position_type> positions_;
};

} // namespace spaces
} // namespace abm
