// job_handler.hpp — independent model replicates on a TBB pool
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_reduce.h>
#include <tbb/task_arena.h>

#include "abm/core/log.hpp"
#include "abm/core/rng.hpp"

namespace abm {
namespace sim {

// ---------- Config ----------
struct JobConfig {
    std::size_t replicates{1};  // 0 -> 1
    int         threads{0};     // 0 -> tbb default
};

/**
 * @brief Run `run_one(seed)` once per replicate and return the sum of results.
 *
 * Seeds are drawn from `master_rng` up front and mixed with splitmix_hash, so
 * replicate j sees the same seed whatever the thread count. `run_one` must
 * build its own model from the seed; models are never shared across threads.
 */
template <class SeedRng, class RunOne>
inline double run_replicates(const JobConfig& cfg_in, SeedRng& master_rng, RunOne&& run_one) {
    const std::size_t J = (cfg_in.replicates == 0) ? 1 : cfg_in.replicates;
    const int NT = (cfg_in.threads > 0) ? cfg_in.threads : tbb::this_task_arena::max_concurrency();
    tbb::global_control limit(tbb::global_control::max_allowed_parallelism, static_cast<std::size_t>(NT));

    // Deterministic per-replicate seeds (no RNG races)
    std::vector<std::uint64_t> seeds(J);
    for (std::size_t i = 0; i < J; ++i) seeds[i] = core::splitmix_hash(master_rng());

    if (core::log_enabled(core::LogLevel::info))
        core::log_info("running " + std::to_string(J) + " replicates on up to " + std::to_string(NT) + " threads");

    return tbb::parallel_reduce(
        tbb::blocked_range<std::size_t>(0, J),
        0.0,
        [&](const tbb::blocked_range<std::size_t>& r, double init) {
            for (std::size_t j = r.begin(); j != r.end(); ++j)
                init += static_cast<double>(run_one(seeds[j]));
            return init;
        },
        std::plus<double>{});
}

} // namespace sim
} // namespace abm
