#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include <cmath>
#include <vector>

#include "decoder/errors.hpp"
#include "envs/cvrp_env.hpp"
#include "envs/tsp_env.hpp"

using amroute::InfeasibleStepError;
using amroute::PendingAction;
using amroute::TensorState;
using amroute::envs::CvrpEnv;
using amroute::envs::TspEnv;

namespace
{

TensorState apply(const amroute::Environment& env, TensorState state, int64_t action)
{
    PendingAction(state).assign(torch::full({state.batchSize()}, action, torch::kLong));
    return env.step(state);
}

torch::Tensor unit_square()
{
    return torch::tensor({{{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}}});
}

std::vector<bool> mask_of(const TensorState& state)
{
    auto mask = state.get("action_mask")[0];
    std::vector<bool> result;
    for (int64_t i = 0; i < mask.size(0); ++i)
    {
        result.push_back(mask[i].item<bool>());
    }
    return result;
}

} // namespace

// ============================================================================
// TSP
// ============================================================================

TEST_CASE("TspEnv visits every node once")
{
    TspEnv env(4);
    auto state = env.reset(unit_square());
    CHECK(mask_of(state) == std::vector<bool>{true, true, true, true});

    state = apply(env, state, 2);
    CHECK(state.get("first_node")[0].item<int64_t>() == 2);
    CHECK(state.get("current_node")[0].item<int64_t>() == 2);
    CHECK(mask_of(state) == std::vector<bool>{true, true, false, true});

    for (int64_t node : {3, 0, 1})
    {
        CHECK_FALSE(state.get("done").all().item<bool>());
        state = apply(env, state, node);
    }
    CHECK(state.get("done").all().item<bool>());
    CHECK(state.get("first_node")[0].item<int64_t>() == 2);
    CHECK(state.get("i")[0].item<int64_t>() == 4);
}

TEST_CASE("TspEnv step leaves the previous state untouched")
{
    TspEnv env(4);
    auto state = env.reset(unit_square());
    auto before = state.get("action_mask").clone();
    PendingAction(state).assign(torch::tensor({1}, torch::kLong));
    env.step(state);
    CHECK(torch::equal(state.get("action_mask"), before));
}

TEST_CASE("TspEnv reward is the negative closed tour length")
{
    TspEnv env(4);
    auto state = env.reset(unit_square());

    auto around = env.getReward(state, torch::tensor({{0, 1, 2, 3}}, torch::kLong));
    CHECK(around[0].item<float>() == doctest::Approx(-4.0));

    auto crossing = env.getReward(state, torch::tensor({{0, 2, 1, 3}}, torch::kLong));
    CHECK(crossing[0].item<float>() == doctest::Approx(-(2.0 + 2.0 * std::sqrt(2.0))));

    CHECK_THROWS_AS(env.getReward(state, torch::tensor({{0, 1, 1, 3}}, torch::kLong)), InfeasibleStepError);
    CHECK_THROWS_AS(env.getReward(state, torch::tensor({{0, 1, 2}}, torch::kLong)), InfeasibleStepError);
}

TEST_CASE("TspEnv validates its inputs")
{
    CHECK_THROWS_AS(TspEnv(1), amroute::ConfigError);
    TspEnv env(5);
    CHECK(env.generateLocs(3).sizes() == torch::IntArrayRef({3, 5, 2}));
    CHECK_THROWS_AS(env.reset(torch::zeros({2, 5})), amroute::ShapeError);
}

// ============================================================================
// CVRP
// ============================================================================

TEST_CASE("CvrpEnv capacity grows with the instance size")
{
    CHECK(CvrpEnv::capacityFor(10) == doctest::Approx(20.0F));
    CHECK(CvrpEnv::capacityFor(20) == doctest::Approx(30.0F));
    CHECK(CvrpEnv::capacityFor(50) == doctest::Approx(40.0F));
    CHECK(CvrpEnv::capacityFor(100) == doctest::Approx(50.0F));

    CvrpEnv env(7);
    auto instances = env.generate(2);
    CHECK(instances.get("locs").sizes() == torch::IntArrayRef({2, 8, 2}));
    CHECK(instances.get("demand").sizes() == torch::IntArrayRef({2, 7}));
    CHECK((instances.get("demand") <= 9.0 / 20.0 + 1e-6).all().item<bool>());
}

TEST_CASE("CvrpEnv masks served and oversized customers")
{
    CvrpEnv env(3);
    auto locs = unit_square();
    auto demand = torch::tensor({{0.5f, 0.5f, 0.5f}});
    auto state = env.reset(locs, demand);

    // At the depot with customers left: the depot is not a legal move
    CHECK(mask_of(state) == std::vector<bool>{false, true, true, true});

    state = apply(env, state, 1);
    CHECK(state.get("used_capacity")[0].item<float>() == doctest::Approx(0.5));
    CHECK(mask_of(state) == std::vector<bool>{true, false, true, true});

    state = apply(env, state, 2);
    CHECK(mask_of(state) == std::vector<bool>{true, false, false, false});

    state = apply(env, state, 0);
    CHECK(state.get("used_capacity")[0].item<float>() == doctest::Approx(0.0));
    CHECK(mask_of(state) == std::vector<bool>{false, false, false, true});

    state = apply(env, state, 3);
    CHECK(state.get("done").all().item<bool>());
    // A finished route can still return to the depot
    CHECK(mask_of(state) == std::vector<bool>{true, false, false, false});
}

TEST_CASE("CvrpEnv reward counts the depot legs")
{
    CvrpEnv env(3);
    auto state = env.reset(unit_square(), torch::tensor({{0.5f, 0.5f, 0.5f}}));

    auto reward = env.getReward(state, torch::tensor({{1, 2, 0, 3, 0}}, torch::kLong));
    CHECK(reward[0].item<float>() == doctest::Approx(-(4.0 + std::sqrt(2.0))));

    CHECK_THROWS_AS(env.getReward(state, torch::tensor({{1, 2, 0, 2}}, torch::kLong)), InfeasibleStepError);
}

TEST_CASE("CvrpEnv rejects inconsistent instances")
{
    CvrpEnv env(3);
    CHECK_THROWS_AS(env.reset(unit_square(), torch::full({1, 2}, 0.1f)), amroute::ShapeError);
    CHECK_THROWS_AS(env.reset(unit_square(), torch::full({1, 3}, 1.5f)), InfeasibleStepError);
}
