// Main entry: run replicates of a demo model and print the mean outcome
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>

#include "abm/app/demo_models.hpp"
#include "abm/cli/cli.hpp"
#include "abm/core/log.hpp"
#include "abm/core/rng.hpp"
#include "abm/sim/job_handler.hpp"

using namespace abm;

int main(int argc, char** argv) {
    // Parse CLI
    bool want_help = false; std::string help_text;
    cli::Options opt;
    try {
        opt = cli::parse_args(argc, argv, want_help, help_text);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
    if (want_help) { std::cout << help_text; return 0; }

    core::set_log_level(opt.quiet ? core::LogLevel::error : opt.log_level);

    // Job handler configuration:
    sim::JobConfig cfg{ .replicates = opt.replicates, .threads = opt.threads };

    // Deterministic master RNG (constant seed by default; --seed or SEED env to override)
    std::uint64_t seed = 123456789ULL;
    if (opt.seed) {
        seed = *opt.seed;
    } else if (const char* es = std::getenv("SEED")) {
        unsigned long long v = std::strtoull(es, nullptr, 10);
        if (v != 0ULL) seed = static_cast<std::uint64_t>(v);
    }
    core::Rng master_rng(seed);

    const auto t0 = std::chrono::steady_clock::now();
    double total = 0.0;
    const char* unit = "";
    try {
        if (opt.model == cli::DemoModel::social) {
            app::SocialConfig sc;
            sc.agents = opt.agents;
            sc.extent = opt.extent.value_or(1.0);
            sc.periodic = opt.periodic;
            if (!opt.quiet) std::cout << app::make_social_model(sc, seed) << "\n";
            total = sim::run_replicates(cfg, master_rng,
                                        [&](std::uint64_t s) { return app::run_social(sc, opt.steps, s); });
            unit = "contacts";
        } else {
            app::WalkerConfig wc;
            wc.agents = opt.agents;
            wc.side = static_cast<int>(std::lround(opt.extent.value_or(20.0)));
            wc.periodic = opt.periodic;
            wc.metric = opt.metric;
            if (!opt.quiet) std::cout << app::make_walker_model(wc, seed) << "\n";
            total = sim::run_replicates(cfg, master_rng,
                                        [&](std::uint64_t s) { return app::run_walkers(wc, opt.steps, s); });
            unit = "moves";
        }
    } catch (const core::AbmError& e) {
        core::log_error(e.what());
        return 1;
    }
    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    const std::size_t runs = opt.replicates == 0 ? 1 : opt.replicates;
    if (!opt.quiet)
        std::cout << "model=" << cli::to_string(opt.model) << " replicates=" << runs
                  << " steps=" << opt.steps << " elapsed=" << secs << "s\n";
    std::cout << "Average " << unit << ": " << total / static_cast<double>(runs) << "\n";
    return 0;
}
