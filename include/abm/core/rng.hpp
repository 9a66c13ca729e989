#pragma once
// rng.hpp — model-owned random source and sampling helpers
//
// Every model owns one SplitMix64 and passes it by reference; there is no
// process-global random state. Helpers take any URBG so tests can also
// drive them with std::mt19937_64.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace abm {
namespace core {

struct SplitMix64 {
    using result_type = std::uint64_t;
    std::uint64_t state;

    explicit SplitMix64(std::uint64_t seed = 0x9E3779B97F4A7C15ULL) : state(seed) {}

    static constexpr result_type min() noexcept { return std::numeric_limits<result_type>::min(); }
    static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

    void seed(std::uint64_t s) noexcept { state = s; }

    inline std::uint64_t next_u64() noexcept {
        std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }
    inline result_type operator()() noexcept { return next_u64(); }

    inline double next_unit_double() noexcept {
        // 53-bit mantissa
        return (next_u64() >> 11) * (1.0 / (1ull << 53));
    }
};

using Rng = SplitMix64;

// Stateless 64-bit mix, used to derive independent per-replicate seeds.
inline std::uint64_t splitmix_hash(std::uint64_t x) noexcept {
    SplitMix64 sm(x);
    return sm.next_u64();
}

// Unbiased mapping of a 64-bit URBG output to [0, n) using Lemire's
// multiply-high method with a tiny rejection loop.
// Precondition: n > 0.
template <class URBG>
inline std::uint64_t uniform_bounded(URBG& rng, std::uint64_t n) noexcept {
    using u128 = unsigned __int128;
    std::uint64_t x = static_cast<std::uint64_t>(rng());
    u128 m = (u128)x * (u128)n;
    std::uint64_t l = (std::uint64_t)m;
    if (l < n) {
        const std::uint64_t t = (-n) % n;
        while (l < t) { x = static_cast<std::uint64_t>(rng()); m = (u128)x * (u128)n; l = (std::uint64_t)m; }
    }
    return (std::uint64_t)(m >> 64);
}

// Uniform double in [0, 1) from the top 53 bits.
template <class URBG>
inline double uniform01(URBG& rng) noexcept {
    return (static_cast<std::uint64_t>(rng()) >> 11) * (1.0 / (1ull << 53));
}

// Fisher–Yates, back to front. Same sequence on every standard library,
// unlike std::shuffle.
template <class T, class URBG>
inline void shuffle(std::vector<T>& v, URBG& rng) noexcept {
    for (std::size_t i = v.size(); i > 1; --i) {
        const std::size_t j = static_cast<std::size_t>(uniform_bounded(rng, i));
        std::swap(v[i - 1], v[j]);
    }
}

// Uniform sample of k elements without replacement (partial Fisher–Yates).
// Result order is itself uniformly random. k is clamped to v.size().
template <class T, class URBG>
inline std::vector<T> sample_without_replacement(std::vector<T> v, std::size_t k, URBG& rng) {
    if (k > v.size()) k = v.size();
    for (std::size_t i = 0; i < k; ++i) {
        const std::size_t j = i + static_cast<std::size_t>(uniform_bounded(rng, v.size() - i));
        std::swap(v[i], v[j]);
    }
    v.resize(k);
    return v;
}

// Uniform pick from a non-empty vector.
template <class T, class URBG>
inline const T& pick(const std::vector<T>& v, URBG& rng) noexcept {
    return v[static_cast<std::size_t>(uniform_bounded(rng, v.size()))];
}

} // namespace core
} // namespace abm
