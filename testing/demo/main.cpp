// demo/main.cpp
// Demo models, the replicate runner and CLI parsing using doctest.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include "abm/app/demo_models.hpp"
#include "abm/cli/cli.hpp"
#include "abm/core/errors.hpp"
#include "abm/core/rng.hpp"
#include "abm/sim/job_handler.hpp"

using namespace abm;

namespace {

// Owns a mutable argv for parse_args.
struct Argv {
    std::vector<std::string> store;
    std::vector<char*> ptrs;

    explicit Argv(std::initializer_list<const char*> args = {}) {
        store.emplace_back("abm_demo");
        for (const char* a : args) store.emplace_back(a);
        for (auto& s : store) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(store.size()); }
    char** argv() { return ptrs.data(); }
};

} // namespace

// -------------------- social model --------------------

TEST_CASE("social model: construction follows the config") {
    app::SocialConfig cfg;
    cfg.agents = 40;
    cfg.extent = 2.0;
    auto m = app::make_social_model(cfg, 11);
    CHECK(m.nagents() == 40);
    CHECK(m.nextid() == 41);
    m.for_each_agent([&](const app::SocialAgent& a) {
        CHECK(std::hypot(a.vel[0], a.vel[1]) == doctest::Approx(cfg.speed * cfg.extent));
        CHECK(a.diameter == doctest::Approx(cfg.diameter * cfg.extent));
        CHECK(a.pos[0] >= 0.0);
        CHECK(a.pos[0] < 2.0);
        CHECK_FALSE(a.moved);
    });

    std::ostringstream os;
    os << m;
    CHECK(os.str().find("ContinuousSpace") != std::string::npos);
    CHECK(os.str().find("Fastest") != std::string::npos);

    cfg.extent = 0.0;
    CHECK_THROWS_AS(app::make_social_model(cfg, 11), core::InvalidArgumentError);
}

TEST_CASE("social model: runs are reproducible per seed") {
    app::SocialConfig cfg;
    cfg.agents = 50;
    cfg.diameter = 0.2;
    const auto a = app::run_social(cfg, 20, 7);
    const auto b = app::run_social(cfg, 20, 7);
    CHECK(a == b);
    CHECK(a > 0);
    CHECK(app::run_social(cfg, 0, 7) == 0);
}

TEST_CASE("social model: a contact swaps the y velocities once") {
    app::SocialConfig cfg;
    cfg.agents = 0;
    auto m = app::make_social_model(cfg, 1);
    auto& a = m.add_agent(app::SocialAgent{1, {0.5, 0.5}, {0.0, 0.01}, 0.1, false});
    auto& b = m.add_agent(app::SocialAgent{2, {0.52, 0.5}, {0.0, -0.02}, 0.1, false});

    app::social_agent_step(a, m);
    CHECK(a.vel[1] == doctest::Approx(-0.02));
    CHECK(b.vel[1] == doctest::Approx(0.01));
    CHECK(a.moved);
    CHECK(b.moved);
    CHECK(m.properties().contacts == 1);

    // both already moved: no further exchange this step
    app::social_agent_step(b, m);
    CHECK(m.properties().contacts == 1);

    app::social_model_step(m);
    CHECK_FALSE(a.moved);
    CHECK_FALSE(b.moved);
}

// -------------------- walkers --------------------

TEST_CASE("walkers: reproducible and bounded by agents x steps") {
    app::WalkerConfig cfg;
    cfg.agents = 20;
    cfg.side = 10;
    const auto a = app::run_walkers(cfg, 30, 3);
    CHECK(a == app::run_walkers(cfg, 30, 3));
    CHECK(a > 0);
    CHECK(a <= 20u * 30u);
}

TEST_CASE("walkers: a full grid never moves, an overfull one is rejected") {
    app::WalkerConfig cfg;
    cfg.side = 5;
    cfg.agents = 25;
    auto m = app::make_walker_model(cfg, 2);
    CHECK(m.space().count_empty() == 0);
    CHECK(app::run_walkers(cfg, 10, 2) == 0);

    cfg.agents = 26;
    CHECK_THROWS_AS(app::make_walker_model(cfg, 2), core::InvalidArgumentError);
}

TEST_CASE("walkers: Euclidean grids are rejected on the first step") {
    app::WalkerConfig cfg;
    cfg.agents = 4;
    cfg.side = 6;
    cfg.metric = spaces::Metric::euclidean;
    CHECK_THROWS_AS(app::run_walkers(cfg, 1, 5), core::UnsupportedMetricError);
}

// -------------------- replicates --------------------

TEST_CASE("run_replicates: result independent of the thread count") {
    app::WalkerConfig cfg;
    cfg.agents = 15;
    cfg.side = 8;
    auto run = [&](std::uint64_t s) { return app::run_walkers(cfg, 10, s); };

    core::Rng r1(99), r4(99);
    const double one = sim::run_replicates(sim::JobConfig{6, 1}, r1, run);
    const double four = sim::run_replicates(sim::JobConfig{6, 4}, r4, run);
    CHECK(one == four);
    CHECK(one > 0.0);
}

TEST_CASE("run_replicates: zero replicates runs once") {
    core::Rng rng(5);
    int calls = 0;
    const double total = sim::run_replicates(sim::JobConfig{0, 1}, rng, [&](std::uint64_t) {
        ++calls;
        return 2;
    });
    CHECK(calls == 1);
    CHECK(total == 2.0);
}

// -------------------- CLI --------------------

TEST_CASE("parse_args: defaults") {
    Argv args;
    bool help = true;
    std::string text;
    const auto opt = cli::parse_args(args.argc(), args.argv(), help, text);
    CHECK_FALSE(help);
    CHECK(opt.model == cli::DemoModel::social);
    CHECK(opt.agents == 100);
    CHECK(opt.steps == 200);
    CHECK_FALSE(opt.extent.has_value());
    CHECK(opt.periodic);
    CHECK(opt.metric == spaces::Metric::chebyshev);
    CHECK(opt.replicates == 1);
    CHECK(opt.threads == 0);
    CHECK_FALSE(opt.seed.has_value());
    CHECK_FALSE(opt.quiet);
    CHECK(opt.log_level == core::LogLevel::warn);
    CHECK(text.find("--model") != std::string::npos);
}

TEST_CASE("parse_args: explicit values") {
    Argv args({"--model", "walkers", "-n", "30", "--steps", "5", "--extent", "12", "--metric", "manhattan",
               "--seed", "42", "--threads", "2", "-r", "3", "--periodic=false", "--log-level", "info", "-q"});
    bool help = true;
    std::string text;
    const auto opt = cli::parse_args(args.argc(), args.argv(), help, text);
    CHECK_FALSE(help);
    CHECK(opt.model == cli::DemoModel::walkers);
    CHECK(std::string(cli::to_string(opt.model)) == "walkers");
    CHECK(opt.agents == 30);
    CHECK(opt.steps == 5);
    REQUIRE(opt.extent.has_value());
    CHECK(*opt.extent == doctest::Approx(12.0));
    CHECK_FALSE(opt.periodic);
    CHECK(opt.metric == spaces::Metric::manhattan);
    CHECK(opt.replicates == 3);
    CHECK(opt.threads == 2);
    REQUIRE(opt.seed.has_value());
    CHECK(*opt.seed == 42u);
    CHECK(opt.quiet);
    CHECK(opt.log_level == core::LogLevel::info);
}

TEST_CASE("parse_args: bad values ask for help") {
    bool help = false;
    std::string text;

    SUBCASE("help") {
        Argv args({"--help"});
        cli::parse_args(args.argc(), args.argv(), help, text);
    }
    SUBCASE("model") {
        Argv args({"--model", "boids"});
        cli::parse_args(args.argc(), args.argv(), help, text);
    }
    SUBCASE("metric") {
        Argv args({"--metric", "hamming"});
        cli::parse_args(args.argc(), args.argv(), help, text);
    }
    SUBCASE("seed") {
        Argv args({"--seed=12x"});
        cli::parse_args(args.argc(), args.argv(), help, text);
    }
    SUBCASE("extent") {
        Argv args({"--extent", "0"});
        cli::parse_args(args.argc(), args.argv(), help, text);
    }
    SUBCASE("log level") {
        Argv args({"--log-level", "loud"});
        cli::parse_args(args.argc(), args.argv(), help, text);
    }
    CHECK(help);
}
