// cli.hpp — Command-line parsing interface (cxxopts)
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

#include "abm/core/log.hpp"
#include "abm/spaces/space_concepts.hpp"

namespace abm {
namespace cli {

enum class DemoModel { social, walkers };

const char* to_string(DemoModel m) noexcept;

struct Options {
    DemoModel model = DemoModel::social;

    std::size_t agents = 100;
    std::size_t steps  = 200;

    // Side of the box (social) or grid (walkers); nullopt => per-model default
    std::optional<double> extent;
    bool           periodic = true;
    spaces::Metric metric   = spaces::Metric::chebyshev;

    // Number of independent replicates and threads (keep one open by default)
    std::size_t replicates = 1;
    int threads = std::thread::hardware_concurrency() > 1 ? static_cast<int>(std::thread::hardware_concurrency()) - 1 : 1;

    // Master seed; nullopt => SEED env var or the built-in default
    std::optional<std::uint64_t> seed;

    bool quiet = false;
    core::LogLevel log_level = core::LogLevel::warn;
};

// Parse CLI arguments with cxxopts.
// On success, returns filled Options and sets want_help/help_text for --help or errors.
Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text);

} // namespace cli
} // namespace abm
