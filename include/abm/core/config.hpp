// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>

// Compile-time configuration for the abm core.
//
// Agent ids are signed 64-bit integers by default so user code can do
// arithmetic on them without sign surprises. Override with -DABM_ID_T=...

#ifndef ABM_ID_T
#define ABM_ID_T std::int64_t
#endif

// Global hardening switch for optional runtime assertions in hot paths
// (space index lookups, container slot maps). Set via -DABM_HARDENED=1
#ifndef ABM_HARDENED
#define ABM_HARDENED 0
#endif

#if ABM_HARDENED
#include <stdexcept>
#define ABM_ASSERT_H(cond, msg) do { if(!(cond)) throw std::logic_error(msg); } while(0)
#else
#define ABM_ASSERT_H(cond, msg) do { } while(0)
#endif

// Default log threshold when ABM_LOG_LEVEL is not set in the environment.
// 0=debug 1=info 2=warn 3=error 4=off
#ifndef ABM_DEFAULT_LOG_LEVEL
#define ABM_DEFAULT_LOG_LEVEL 2
#endif

namespace abm {

using agent_id_t = ABM_ID_T;
using size_t     = std::size_t;
using count_t    = std::uint64_t;

namespace core {
using ::abm::agent_id_t;
using ::abm::size_t;
using ::abm::count_t;
} // namespace core

} // namespace abm
