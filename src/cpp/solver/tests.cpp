#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include <algorithm>
#include <iterator>
#include <numeric>
#include <vector>

#include "decoder/errors.hpp"
#include "solver/cli.hpp"
#include "solver/solver.hpp"

using amroute::ConfigError;
using amroute::solver::SolveOptions;

namespace
{

SolveOptions small_options(const std::string& env_name)
{
    SolveOptions options;
    options.config.env_name = env_name;
    options.config.embedding_dim = 16;
    options.config.num_heads = 4;
    options.decode.decode_type = "greedy";
    options.num_loc = 6;
    options.batch_size = 3;
    return options;
}

bool is_permutation_of_nodes(std::vector<int64_t> tour, int64_t num_nodes)
{
    std::vector<int64_t> expected(static_cast<size_t>(num_nodes));
    std::iota(expected.begin(), expected.end(), 0);
    std::sort(tour.begin(), tour.end());
    return tour == expected;
}

} // namespace

TEST_CASE("parse_cli populates options")
{
    const char* argv[] = {
        "amroute_decode",
        "--env", "cvrp",
        "--num-loc", "50",
        "--batch-size", "8",
        "--decode-type", "multistart_greedy",
        "--num-starts", "50",
        "--temperature", "0.7",
        "--embedding-dim", "64",
        "--num-heads", "4",
        "--seed", "7",
        "--verbose",
    };
    const int argc = static_cast<int>(std::size(argv));
    auto options = amroute::solver::parse_cli(argc, const_cast<char**>(argv));

    CHECK(options.config.env_name == "cvrp");
    CHECK(options.num_loc == 50);
    CHECK(options.batch_size == 8);
    CHECK(options.decode.decode_type == "multistart_greedy");
    CHECK(options.decode.num_starts == 50);
    REQUIRE(options.decode.softmax_temp.has_value());
    CHECK(*options.decode.softmax_temp == doctest::Approx(0.7F));
    CHECK(options.config.embedding_dim == 64);
    CHECK(options.config.num_heads == 4);
    CHECK(options.seed == 7);
    CHECK(options.decode.verbose);
}

TEST_CASE("parse_cli keeps defaults")
{
    const char* argv[] = {"amroute_decode"};
    auto options = amroute::solver::parse_cli(1, const_cast<char**>(argv));
    CHECK(options.config.env_name == "tsp");
    CHECK(options.config.embedding_dim == 128);
    CHECK(options.decode.decode_type == "sampling");
    CHECK_FALSE(options.decode.softmax_temp.has_value());
    CHECK_FALSE(options.decode.verbose);
}

TEST_CASE("parse_cli reads switch words and the last repeated flag")
{
    auto parse = [](std::vector<const char*> args) {
        args.insert(args.begin(), "amroute_decode");
        return amroute::solver::parse_cli(static_cast<int>(args.size()), const_cast<char**>(args.data()));
    };

    CHECK(parse({"--verbose", "YES"}).decode.verbose);
    CHECK_FALSE(parse({"--verbose", "off"}).decode.verbose);
    CHECK_FALSE(parse({"--verbose", "0", "--seed", "3"}).decode.verbose);
    CHECK(parse({"--verbose", "--seed", "3"}).decode.verbose);
    CHECK(parse({"--num-loc", "10", "--num-loc", "12"}).num_loc == 12);
    CHECK_THROWS_AS(parse({"--"}), ConfigError);
    CHECK_THROWS_AS(parse({"--temperature", ""}), ConfigError);
}

TEST_CASE("parse_cli rejects bad arguments")
{
    auto parse = [](std::vector<const char*> args) {
        args.insert(args.begin(), "amroute_decode");
        return amroute::solver::parse_cli(static_cast<int>(args.size()), const_cast<char**>(args.data()));
    };

    CHECK_THROWS_AS(parse({"--beam-width", "4"}), ConfigError);
    CHECK_THROWS_AS(parse({"tsp"}), ConfigError);
    CHECK_THROWS_AS(parse({"--num-loc", "twenty"}), ConfigError);
    CHECK_THROWS_AS(parse({"--num-loc", "20x"}), ConfigError);
    CHECK_THROWS_AS(parse({"--num-loc", "1"}), ConfigError);
    CHECK_THROWS_AS(parse({"--batch-size", "0"}), ConfigError);
    CHECK_THROWS_AS(parse({"--verbose", "maybe"}), ConfigError);
    CHECK_THROWS_AS(parse({"--config", "/nonexistent/decoder.json"}), ConfigError);
}

TEST_CASE("prepare_instances resets tsp and cvrp batches")
{
    amroute::TensorState tsp_instances(2);
    tsp_instances.set("locs", torch::rand({2, 5, 2}));
    auto tsp = amroute::solver::prepare_instances("tsp", 5, tsp_instances);
    CHECK(tsp.env->name() == "tsp");
    CHECK_FALSE(tsp.env->hasDepot());
    CHECK(tsp.state.get("action_mask").sizes() == torch::IntArrayRef({2, 5}));

    amroute::TensorState cvrp_instances(2);
    cvrp_instances.set("locs", torch::rand({2, 6, 2}));
    cvrp_instances.set("demand", torch::full({2, 5}, 0.2f));
    auto cvrp = amroute::solver::prepare_instances("cvrp", 5, cvrp_instances);
    CHECK(cvrp.env->name() == "cvrp");
    CHECK(cvrp.env->hasDepot());
    CHECK(cvrp.state.contains("used_capacity"));

    CHECK_THROWS_AS(amroute::solver::prepare_instances("op", 5, tsp_instances), ConfigError);
}

TEST_CASE("solve_random decodes full TSP tours")
{
    auto options = small_options("tsp");
    auto summary = amroute::solver::solve_random(options);

    CHECK(summary.env_name == "tsp");
    CHECK(summary.steps == 6);
    REQUIRE(summary.solutions.size() == 3);
    for (const auto& solution : summary.solutions)
    {
        CHECK(is_permutation_of_nodes(solution.actions, 6));
        CHECK(solution.reward < 0.0F);
        CHECK(solution.best_start == 0);
    }
}

TEST_CASE("solve_random with multi-start keeps the best rollout")
{
    auto options = small_options("tsp");
    options.decode.decode_type = "multistart_greedy";
    options.decode.num_starts = 6;
    auto multi = amroute::solver::solve_random(options);

    options.decode.decode_type = "greedy";
    options.decode.num_starts = 0;
    auto single = amroute::solver::solve_random(options);

    REQUIRE(multi.solutions.size() == single.solutions.size());
    for (size_t i = 0; i < multi.solutions.size(); ++i)
    {
        const auto& solution = multi.solutions[i];
        CHECK(is_permutation_of_nodes(solution.actions, 6));
        CHECK(solution.best_start >= 0);
        CHECK(solution.best_start < 6);
        // Rollout s starts at node s
        CHECK(solution.actions.front() == solution.best_start);
    }
}

TEST_CASE("solve_random decodes CVRP routes")
{
    auto options = small_options("cvrp");
    options.decode.decode_type = "sampling";
    auto summary = amroute::solver::solve_random(options);

    CHECK(summary.env_name == "cvrp");
    REQUIRE(summary.solutions.size() == 3);
    for (const auto& solution : summary.solutions)
    {
        for (int64_t customer = 1; customer <= 6; ++customer)
        {
            CHECK(std::count(solution.actions.begin(), solution.actions.end(), customer) == 1);
        }
        CHECK(solution.reward < 0.0F);
    }
}

TEST_CASE("solve_random with multi-start on CVRP skips the depot")
{
    auto options = small_options("cvrp");
    options.decode.decode_type = "multistart_greedy";
    options.decode.num_starts = 6;
    auto summary = amroute::solver::solve_random(options);

    REQUIRE(summary.solutions.size() == 3);
    for (const auto& solution : summary.solutions)
    {
        CHECK(solution.best_start >= 0);
        CHECK(solution.best_start < 6);
        // Rollout s starts at customer s + 1
        REQUIRE_FALSE(solution.actions.empty());
        CHECK(solution.actions.front() == solution.best_start + 1);
        for (int64_t customer = 1; customer <= 6; ++customer)
        {
            CHECK(std::count(solution.actions.begin(), solution.actions.end(), customer) == 1);
        }
        CHECK(solution.reward < 0.0F);
    }
}

TEST_CASE("solve_instances rejects mismatched environments")
{
    auto options = small_options("cvrp");
    amroute::TensorState instances(1);
    instances.set("locs", torch::rand({1, 7, 2}));
    CHECK_THROWS_AS(amroute::solver::solve_instances(options, instances), amroute::ShapeError);
}
