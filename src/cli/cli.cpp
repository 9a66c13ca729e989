// cli.cpp — Command-line parsing implementation using cxxopts

#include "abm/cli/cli.hpp"

#include <cxxopts.hpp>
#include <charconv>
#include <iostream>
#include <string>
#include <string_view>

namespace abm {
namespace cli {

const char* to_string(DemoModel m) noexcept {
    return m == DemoModel::social ? "social" : "walkers";
}

static inline bool parse_u64(std::string_view s, std::uint64_t& out) {
    const char* b = s.data();
    const char* e = b + s.size();
    auto res = std::from_chars(b, e, out);
    return res.ec == std::errc{} && res.ptr == e;
}

static inline bool parse_metric(std::string_view s, spaces::Metric& out) {
    if (s == "chebyshev") { out = spaces::Metric::chebyshev; return true; }
    if (s == "manhattan") { out = spaces::Metric::manhattan; return true; }
    if (s == "euclidean") { out = spaces::Metric::euclidean; return true; }
    return false;
}

Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text) {
    Options opt;
    want_help = false;

    std::string model_s;
    std::string metric_s;
    std::string seed_s;
    std::string level_s;
    double extent_val = 0.0;

    cxxopts::Options desc("abm_demo", "Agent-based model demos");
    desc.add_options()
        ("h,help", "Show this help")
        ("model", "Model to run: social | walkers", cxxopts::value<std::string>(model_s)->default_value("social"))
        ("n,agents", "Number of agents", cxxopts::value<std::size_t>(opt.agents)->default_value("100"))
        ("s,steps", "Steps per replicate", cxxopts::value<std::size_t>(opt.steps)->default_value("200"))
        ("extent", "Box side (social, default 1) or grid side (walkers, default 20)", cxxopts::value<double>(extent_val))
        ("periodic", "Periodic boundaries", cxxopts::value<bool>(opt.periodic)->default_value("true"))
        ("metric", "Grid metric: chebyshev | manhattan | euclidean", cxxopts::value<std::string>(metric_s)->default_value("chebyshev"))
        ("r,replicates", "Independent replicates", cxxopts::value<std::size_t>(opt.replicates)->default_value("1"))
        ("threads", "Number of threads (default: TBB max)", cxxopts::value<int>(opt.threads)->default_value("0"))
        ("seed", "Master seed (default: SEED env var or built-in)", cxxopts::value<std::string>(seed_s))
        ("q,quiet", "Only print the result line", cxxopts::value<bool>(opt.quiet))
        ("log-level", "debug | info | warn | error | off", cxxopts::value<std::string>(level_s)->default_value("warn"))
    ;
    help_text = desc.help();
    auto result = desc.parse(argc, argv);
    if (result.count("help")) { want_help = true; return opt; }

    if (model_s == "social") opt.model = DemoModel::social;
    else if (model_s == "walkers") opt.model = DemoModel::walkers;
    else {
        std::cerr << "Invalid --model; expected social or walkers.\n";
        want_help = true;
        return opt;
    }

    if (!parse_metric(metric_s, opt.metric)) {
        std::cerr << "Invalid --metric; expected chebyshev, manhattan or euclidean.\n";
        want_help = true;
        return opt;
    }

    if (!core::parse_log_level(level_s, opt.log_level)) {
        std::cerr << "Invalid --log-level; expected debug, info, warn, error or off.\n";
        want_help = true;
        return opt;
    }

    if (result.count("extent")) {
        if (!(extent_val > 0.0)) {
            std::cerr << "Invalid --extent; expected a positive number.\n";
            want_help = true;
            return opt;
        }
        opt.extent = extent_val;
    }

    if (!seed_s.empty()) {
        std::uint64_t v = 0;
        if (!parse_u64(seed_s, v)) {
            std::cerr << "Invalid --seed; expected an unsigned integer.\n";
            want_help = true;
            return opt;
        }
        opt.seed = v;
    }

    return opt;
}

} // namespace cli
} // namespace abm
