#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "decoder/batch_ops.hpp"
#include "decoder/decode_policy.hpp"
#include "decoder/decoder_config.hpp"
#include "decoder/decoder_engine.hpp"
#include "decoder/env_embeddings.hpp"
#include "decoder/errors.hpp"
#include "decoder/logit_attention.hpp"
#include "decoder/tensor_state.hpp"

using namespace amroute;

namespace
{

constexpr int64_t kDim = 16;
constexpr int64_t kHeads = 4;

// Three nodes: node 0 must come first, nodes 1 and 2 open up once node 0 has
// been visited. Done when every node is visited.
class ToyEnv : public Environment
{
public:
    explicit ToyEnv(std::string name = "toy", bool depot = false)
        : name_(std::move(name)), depot_(depot)
    {
    }

    const std::string& name() const override { return name_; }

    bool hasDepot() const override { return depot_; }

    TensorState reset(int64_t batch) const
    {
        auto long_opts = torch::TensorOptions().dtype(torch::kLong);
        auto visited = torch::zeros({batch, 3}, torch::kBool);

        TensorState state(batch);
        state.set("first_node", torch::zeros({batch}, long_opts));
        state.set("current_node", torch::zeros({batch}, long_opts));
        state.set("i", torch::zeros({batch}, long_opts));
        state.set("visited", visited);
        state.set("action_mask", mask(visited));
        state.set("done", torch::zeros({batch}, torch::kBool));
        return state;
    }

    TensorState step(const TensorState& state) const override
    {
        auto current = state.get("action");
        const auto& i = state.get("i");
        auto visited = state.get("visited").scatter(-1, current.unsqueeze(-1), true);

        TensorState next = state;
        next.set("first_node", torch::where(i == 0, current, state.get("first_node")));
        next.set("current_node", current);
        next.set("i", i + 1);
        next.set("visited", visited);
        next.set("action_mask", mask(visited));
        next.set("done", visited.all(-1));
        return next;
    }

    torch::Tensor getReward(const TensorState& state, const torch::Tensor& /*actions*/) const override
    {
        return state.get("visited").sum(-1).to(torch::kFloat);
    }

private:
    static torch::Tensor mask(const torch::Tensor& visited)
    {
        const int64_t batch = visited.size(0);
        auto gate = torch::cat({torch::ones({batch, 1}, torch::kBool),
                                visited.narrow(1, 0, 1).expand({batch, 2})}, 1);
        return visited.logical_not().logical_and(gate);
    }

    std::string name_;
    bool depot_;
};

// Leaves every trajectory without a legal node after the first step.
class StuckEnv : public ToyEnv
{
public:
    TensorState step(const TensorState& state) const override
    {
        TensorState next = ToyEnv::step(state);
        next.set("action_mask", torch::zeros_like(next.get("action_mask")));
        next.set("done", torch::zeros_like(next.get("done")));
        return next;
    }
};

EnvEmbeddingRegistry toyRegistry()
{
    EnvEmbeddingRegistry registry = EnvEmbeddingRegistry::defaults();
    registry.add(
        "toy",
        [](int64_t d) -> std::shared_ptr<StepContext> { return std::make_shared<TspContext>(d); },
        [](int64_t) -> std::shared_ptr<DynamicEmbedding> { return std::make_shared<StaticEmbedding>(); });
    return registry;
}

DecoderConfig toyConfig()
{
    DecoderConfig config;
    config.env_name = "toy";
    config.embedding_dim = kDim;
    config.num_heads = kHeads;
    return config;
}

DecodeOptions greedy(int64_t num_starts = 0)
{
    DecodeOptions options;
    options.decode_type = num_starts > 1 ? "multistart_greedy" : "greedy";
    options.num_starts = num_starts;
    return options;
}

} // namespace

// ============================================================================
// Batch layout
// ============================================================================

TEST_CASE("batchify lays rollouts out starts-major")
{
    auto x = torch::arange(6, torch::kLong).view({2, 3});
    auto expanded = batchify(x, 3);

    REQUIRE(expanded.sizes() == torch::IntArrayRef({6, 3}));
    for (int64_t s = 0; s < 3; ++s)
    {
        for (int64_t b = 0; b < 2; ++b)
        {
            CHECK(torch::equal(expanded[s * 2 + b], x[b]));
        }
    }
}

TEST_CASE("unbatchify and foldStarts invert the starts-major layout")
{
    auto rows = torch::arange(12, torch::kFloat).view({6, 2});
    auto view = unbatchify(rows, 3);

    REQUIRE(view.sizes() == torch::IntArrayRef({2, 3, 2}));
    // row s * B + b -> [b, s]
    CHECK(torch::equal(view[1][2], rows[2 * 2 + 1]));
    CHECK(torch::equal(view[0][1], rows[1 * 2 + 0]));
    CHECK(torch::equal(foldStarts(view), rows));

    auto x = torch::randn({2, 4});
    CHECK(torch::equal(unbatchify(batchify(x, 3), 3)[1][2], x[1]));
}

TEST_CASE("batch layout helpers are identity without expansion")
{
    auto x = torch::randn({2, 4});
    CHECK(batchify(x, 0).is_same(x));
    CHECK(batchify(x, 1).is_same(x));
    CHECK(unbatchify(x, 1).is_same(x));
}

TEST_CASE("unbatchify rejects a batch that is not a multiple of num_starts")
{
    CHECK_THROWS_AS(unbatchify(torch::zeros({5, 2}), 3), ShapeError);
    CHECK_THROWS_AS(foldStarts(torch::zeros({5})), ShapeError);
}

TEST_CASE("gatherByIndex picks node rows")
{
    auto src = torch::arange(2 * 3 * 2, torch::kFloat).view({2, 3, 2});

    auto single = gatherByIndex(src, torch::tensor({2, 0}, torch::kLong));
    REQUIRE(single.sizes() == torch::IntArrayRef({2, 2}));
    CHECK(torch::equal(single[0], src[0][2]));
    CHECK(torch::equal(single[1], src[1][0]));

    auto pairs = gatherByIndex(src, torch::tensor({{0, 1}, {2, 2}}, torch::kLong));
    REQUIRE(pairs.sizes() == torch::IntArrayRef({2, 2, 2}));
    CHECK(torch::equal(pairs[1][0], src[1][2]));

    CHECK_THROWS_AS(gatherByIndex(src, torch::zeros({3}, torch::kLong)), ShapeError);
}

// ============================================================================
// State
// ============================================================================

TEST_CASE("TensorState enforces the batch dimension")
{
    TensorState state(2);
    state.set("done", torch::zeros({2}, torch::kBool));
    CHECK(state.contains("done"));
    CHECK_FALSE(state.contains("reward"));
    CHECK_THROWS_AS(state.set("locs", torch::zeros({3, 2})), ShapeError);
    CHECK_THROWS_AS(state.set("scalar", torch::zeros({})), ShapeError);
    CHECK_THROWS_AS(state.get("reward"), ShapeError);

    state.erase("done");
    CHECK(state.keys().empty());
}

TEST_CASE("StateView exposes expanded fields per instance")
{
    ToyEnv env;
    auto state = batchify(env.reset(2), 3);
    REQUIRE(state.batchSize() == 6);

    StateView view(state, 3);
    CHECK(view.expanded());
    CHECK(view.batchSize() == 2);
    CHECK(view.get("action_mask").sizes() == torch::IntArrayRef({2, 3, 3}));

    auto single = env.reset(2);
    StateView flat(single, 0);
    CHECK_FALSE(flat.expanded());
    CHECK(flat.get("action_mask").sizes() == torch::IntArrayRef({2, 3}));
}

TEST_CASE("PendingAction writes the action once")
{
    TensorState state(2);
    PendingAction pending(state);
    CHECK_THROWS_AS(pending.assign(torch::zeros({3}, torch::kLong)), ShapeError);
    CHECK_THROWS_AS(pending.assign(torch::zeros({2}, torch::kFloat)), ShapeError);

    pending.assign(torch::tensor({1, 2}, torch::kInt));
    CHECK(state.get("action").scalar_type() == torch::kLong);
    CHECK_THROWS_AS(pending.assign(torch::zeros({2}, torch::kLong)), std::logic_error);
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE("parseDecoderConfig reads overrides and keeps defaults")
{
    auto config = parseDecoderConfig(R"({"env_name": "cvrp", "embedding_dim": 64, "num_heads": 4,
                                         "tanh_clipping": 5.5, "mask_inner": false})");
    CHECK(config.env_name == "cvrp");
    CHECK(config.embedding_dim == 64);
    CHECK(config.num_heads == 4);
    CHECK(config.tanh_clipping == doctest::Approx(5.5F));
    CHECK_FALSE(config.mask_inner);
    CHECK(config.mask_logits);
    CHECK(config.softmax_temp == doctest::Approx(1.0F));
}

TEST_CASE("parseDecoderConfig rejects malformed values")
{
    CHECK_THROWS_AS(parseDecoderConfig(R"({"embedding_dim": "wide"})"), ConfigError);
    CHECK_THROWS_AS(parseDecoderConfig(R"({"num_heads": 2.5})"), ConfigError);
    CHECK_THROWS_AS(parseDecoderConfig(R"({"normalize": 1})"), ConfigError);
    CHECK_THROWS_AS(parseDecoderConfig(R"({"num_heads": 0})"), ConfigError);
    CHECK_THROWS_AS(parseDecoderConfig(R"({"softmax_temp": -1.0})"), ConfigError);
    CHECK_THROWS_AS(loadDecoderConfig("/nonexistent/decoder.json"), ConfigError);
}

TEST_CASE("loadDecoderConfig reads a file")
{
    const std::string path = "amroute_decoder_test_config.json";
    {
        std::ofstream out(path);
        out << "{\n  \"embedding_dim\": 32,\n  \"softmax_temp\": 0.5\n}\n";
    }
    auto config = loadDecoderConfig(path);
    CHECK(config.embedding_dim == 32);
    CHECK(config.softmax_temp == doctest::Approx(0.5F));
    std::remove(path.c_str());
}

// ============================================================================
// LogitAttention
// ============================================================================

TEST_CASE("LogitAttention returns normalised masked log-probabilities")
{
    torch::manual_seed(0);
    LogitAttention attention(kDim, kHeads);
    auto query = torch::randn({2, 1, kDim});
    auto keys = torch::randn({2, 5, kDim});
    auto mask = torch::zeros({2, 5}, torch::kBool);
    mask[0][1] = true;
    mask[1][4] = true;

    auto log_p = attention->forward(query, keys, keys, keys, mask);
    REQUIRE(log_p.sizes() == torch::IntArrayRef({2, 5}));
    CHECK(std::isinf(log_p[0][1].item<float>()));
    CHECK(std::isinf(log_p[1][4].item<float>()));
    CHECK(log_p.exp().sum(-1).allclose(torch::ones({2})));
}

TEST_CASE("LogitAttention scores one query per start")
{
    LogitAttention attention(kDim, kHeads);
    auto query = torch::randn({2, 3, kDim});
    auto keys = torch::randn({2, 4, kDim});
    auto mask = torch::zeros({2, 3, 4}, torch::kBool);

    auto log_p = attention->forward(query, keys, keys, keys, mask);
    CHECK(log_p.sizes() == torch::IntArrayRef({2, 3, 4}));

    CHECK_THROWS_AS(attention->forward(query, keys, keys, keys, torch::zeros({2, 4}, torch::kBool)), ShapeError);
}

TEST_CASE("LogitAttention clips logits and applies the temperature")
{
    torch::manual_seed(7);
    LogitAttention raw(kDim, kHeads, 10.0f, true, false, false);
    torch::manual_seed(7);
    LogitAttention normalised(kDim, kHeads, 10.0f, true, false, true, 2.0f);

    auto query = torch::randn({1, 1, kDim}) * 50;
    auto keys = torch::randn({1, 6, kDim}) * 50;
    auto mask = torch::zeros({1, 6}, torch::kBool);

    auto logits = raw->forward(query, keys, keys, keys, mask);
    CHECK(logits.abs().max().item<float>() <= 10.0F + 1e-4F);

    auto log_p = normalised->forward(query, keys, keys, keys, mask);
    CHECK(log_p.allclose(torch::log_softmax(logits / 2.0, -1), 1e-5, 1e-5));

    auto sharper = normalised->forward(query, keys, keys, keys, mask, 0.5f);
    CHECK(sharper.allclose(torch::log_softmax(logits / 0.5, -1), 1e-5, 1e-5));
    CHECK_THROWS_AS(normalised->forward(query, keys, keys, keys, mask, 0.0f), ConfigError);
}

TEST_CASE("LogitAttention rejects bad masks and fully masked rows")
{
    LogitAttention attention(kDim, kHeads);
    auto query = torch::randn({1, 1, kDim});
    auto keys = torch::randn({1, 3, kDim});

    CHECK_THROWS_AS(attention->forward(query, keys, keys, keys, torch::zeros({1, 3})), ShapeError);
    CHECK_THROWS_AS(attention->forward(query, keys, keys, keys, torch::ones({1, 3}, torch::kBool)),
                    InfeasibleStepError);
    CHECK_THROWS_AS(LogitAttention(kDim, 5), ConfigError);
}

// ============================================================================
// Action selection
// ============================================================================

TEST_CASE("decodeProbs greedy picks the most likely legal node")
{
    auto probs = torch::tensor({{0.1f, 0.7f, 0.2f}, {0.5f, 0.0f, 0.5f}});
    auto mask = torch::tensor({{false, false, false}, {false, true, false}});

    auto actions = decodeProbs(probs, mask, "greedy");
    CHECK(actions[0].item<int64_t>() == 1);
    CHECK(actions[1].item<int64_t>() != 1);

    auto forbidden = torch::tensor({{false, true, false}, {false, true, false}});
    CHECK_THROWS_AS(decodeProbs(probs, forbidden, "greedy"), InfeasibleStepError);
}

TEST_CASE("decodeProbs sampling never returns a masked node")
{
    torch::manual_seed(3);
    auto mask = torch::tensor({{true, false, true, false}});
    auto probs = torch::tensor({{0.0f, 0.5f, 0.0f, 0.5f}});
    for (int i = 0; i < 20; ++i)
    {
        auto action = decodeProbs(probs, mask, "sampling").item<int64_t>();
        CHECK((action == 1 || action == 3));
    }
}

TEST_CASE("decodeProbs rejects NaN and unknown decode types")
{
    auto mask = torch::zeros({1, 2}, torch::kBool);
    CHECK_THROWS_AS(decodeProbs(torch::tensor({{NAN, 0.5f}}), mask, "greedy"), InfeasibleStepError);
    CHECK_THROWS_AS(decodeProbs(torch::tensor({{0.5f, 0.5f}}), mask, "beam_search"), ConfigError);
    CHECK_THROWS_AS(validateDecodeType("beam_search"), ConfigError);
    CHECK(isMultistart("multistart_sampling"));
    CHECK_FALSE(isMultistart("greedy"));
}

TEST_CASE("selectStartNodes seeds distinct nodes starts-major")
{
    ToyEnv env;
    auto starts = selectStartNodes(env.reset(2), 3, env);
    CHECK(torch::equal(starts, torch::tensor({0, 0, 1, 1, 2, 2}, torch::kLong)));

    ToyEnv depot_env("toy", true);
    auto depot_starts = selectStartNodes(depot_env.reset(1), 2, depot_env);
    CHECK(torch::equal(depot_starts, torch::tensor({1, 2}, torch::kLong)));
    CHECK_THROWS_AS(selectStartNodes(depot_env.reset(1), 3, depot_env), ConfigError);
}

// ============================================================================
// Environment embeddings
// ============================================================================

TEST_CASE("default registry resolves the routing environments")
{
    const auto& registry = EnvEmbeddingRegistry::defaults();
    for (const auto* name : {"tsp", "atsp", "cvrp", "sdvrp"})
    {
        CHECK(registry.contains(name));
    }
    CHECK_FALSE(registry.contains("toy"));
    CHECK_THROWS_AS(registry.create("pdp", kDim), ConfigError);

    auto sdvrp = registry.create("sdvrp", kDim);
    CHECK_FALSE(sdvrp.dynamic->supportsMultistart());
    CHECK(registry.create("cvrp", kDim).dynamic->supportsMultistart());
}

TEST_CASE("TspContext uses the placeholder before the first move")
{
    ToyEnv env;
    TspContext context(kDim);
    auto embeddings = torch::randn({2, 3, kDim});
    auto state = env.reset(2);

    auto before = context.forward(embeddings, StateView(state, 0));
    CHECK(before.sizes() == torch::IntArrayRef({2, kDim}));
    CHECK(torch::equal(before[0], before[1]));

    PendingAction(state).assign(torch::tensor({0, 0}, torch::kLong));
    state = env.step(state);
    auto after = context.forward(embeddings, StateView(state, 0));
    CHECK(after.sizes() == torch::IntArrayRef({2, kDim}));
    CHECK_FALSE(torch::equal(after[0], after[1]));
}

TEST_CASE("CvrpContext appends the remaining capacity")
{
    CvrpContext context(kDim);
    TensorState state(2);
    state.set("current_node", torch::tensor({0, 2}, torch::kLong));
    state.set("used_capacity", torch::tensor({0.0f, 0.4f}));
    state.set("vehicle_capacity", torch::ones({2}));

    auto query = context.forward(torch::randn({2, 4, kDim}), StateView(state, 0));
    CHECK(query.sizes() == torch::IntArrayRef({2, kDim}));

    auto expanded = batchify(state, 2);
    auto multi = context.forward(torch::randn({2, 4, kDim}), StateView(expanded, 2));
    CHECK(multi.sizes() == torch::IntArrayRef({2, 2, kDim}));
}

TEST_CASE("dynamic embeddings")
{
    TensorState state(2);
    state.set("demand_with_depot", torch::rand({2, 4}));

    StaticEmbedding fixed;
    auto zero = fixed.forward(StateView(state, 0));
    CHECK(zero.logit_key.sum().item<float>() == 0.0F);

    SdvrpDynamicEmbedding sdvrp(kDim);
    auto keys = sdvrp.forward(StateView(state, 0));
    CHECK(keys.glimpse_key.sizes() == torch::IntArrayRef({2, 4, kDim}));
    CHECK(keys.logit_key.sizes() == torch::IntArrayRef({2, 4, kDim}));
    // depot demand is ignored
    CHECK(keys.glimpse_val.select(1, 0).abs().sum().item<float>() == 0.0F);

    CHECK_THROWS_AS(sdvrp.forward(StateView(batchify(state, 2), 2)), ConfigError);
}

// ============================================================================
// Decoder
// ============================================================================

TEST_CASE("Decoder rejects unknown environments and bad head counts")
{
    auto registry = toyRegistry();
    CHECK_THROWS_AS(Decoder(std::make_shared<ToyEnv>("bogus"), toyConfig(), registry), ConfigError);

    auto config = toyConfig();
    config.num_heads = 3;
    CHECK_THROWS_AS(Decoder(std::make_shared<ToyEnv>(), config, registry), ConfigError);
}

TEST_CASE("greedy decoding of the toy environment visits node 0 first")
{
    auto env = std::make_shared<ToyEnv>();
    Decoder decoder(env, toyConfig(), toyRegistry());

    auto result = decoder->forward(env->reset(2), torch::randn({2, 3, kDim}), greedy());

    CHECK(result.steps == 3);
    REQUIRE(result.actions.sizes() == torch::IntArrayRef({2, 3}));
    CHECK(result.log_p.sizes() == torch::IntArrayRef({2, 3, 3}));
    for (int64_t b = 0; b < 2; ++b)
    {
        CHECK(result.actions[b][0].item<int64_t>() == 0);
        auto sorted = std::get<0>(result.actions[b].sort());
        CHECK(torch::equal(sorted, torch::arange(3, torch::kLong)));
    }
    CHECK(result.state.contains("reward"));
    CHECK(torch::equal(result.state.get("reward"), torch::full({2}, 3.0f)));
}

TEST_CASE("decoded trace matches the selections")
{
    auto env = std::make_shared<ToyEnv>();
    Decoder decoder(env, toyConfig(), toyRegistry());

    std::vector<torch::Tensor> recorded;
    decoder->setActionSelector(
        [&recorded](const torch::Tensor& probs, const torch::Tensor& mask, const std::string& decode_type) {
            auto action = decodeProbs(probs, mask, decode_type);
            recorded.push_back(action.clone());
            return action;
        });

    DecodeOptions options;
    options.decode_type = "sampling";
    options.calc_reward = false;
    auto result = decoder->forward(env->reset(4), torch::randn({4, 3, kDim}), options);

    CHECK_FALSE(result.state.contains("reward"));
    CHECK(result.log_p.size(1) == result.steps);
    REQUIRE(static_cast<int64_t>(recorded.size()) == result.steps);
    CHECK(torch::equal(torch::stack(recorded, 1), result.actions));

    // Every selected node had positive probability
    auto chosen = result.log_p.gather(2, result.actions.unsqueeze(-1)).squeeze(-1);
    CHECK(torch::isfinite(chosen).all().item<bool>());
    CHECK(torch::equal(torch::one_hot(result.actions, 3).sum(1), torch::ones({4, 3}, torch::kLong)));
}

TEST_CASE("step scoring keeps the batch size and negates the action mask")
{
    auto env = std::make_shared<ToyEnv>();
    Decoder decoder(env, toyConfig(), toyRegistry());

    torch::NoGradGuard no_grad;
    auto state = env->reset(3);
    const auto cached = decoder->precompute(torch::randn({3, 3, kDim}));
    auto glimpse_key = cached.glimpse_key.clone();
    auto glimpse_val = cached.glimpse_val.clone();
    auto logit_key = cached.logit_key.clone();
    auto graph_context = cached.graph_context.clone();

    int steps = 0;
    while (!state.get("done").all().item<bool>())
    {
        auto [log_p, mask] = decoder->computeStepLogP(cached, state);
        CHECK(log_p.sizes() == torch::IntArrayRef({3, 3}));
        CHECK(torch::equal(mask, state.get("action_mask").logical_not()));

        PendingAction(state).assign(decodeProbs(log_p.exp(), mask, "greedy"));
        state = env->step(state);
        ++steps;
    }

    CHECK(steps == 3);
    CHECK(torch::equal(cached.glimpse_key, glimpse_key));
    CHECK(torch::equal(cached.glimpse_val, glimpse_val));
    CHECK(torch::equal(cached.logit_key, logit_key));
    CHECK(torch::equal(cached.graph_context, graph_context));
}

TEST_CASE("multi-start step scoring reuses the cache and folds the mask starts-major")
{
    auto env = std::make_shared<ToyEnv>();
    Decoder decoder(env, toyConfig(), toyRegistry());

    torch::NoGradGuard no_grad;
    const auto cached = decoder->precompute(torch::randn({2, 3, kDim}), 3);
    auto glimpse_key = cached.glimpse_key.clone();
    auto glimpse_val = cached.glimpse_val.clone();
    auto logit_key = cached.logit_key.clone();
    auto graph_context = cached.graph_context.clone();

    auto state = batchify(env->reset(2), 3);
    PendingAction(state).assign(selectStartNodes(env->reset(2), 3, *env));
    state = env->step(state);

    int steps = 0;
    while (!state.get("done").all().item<bool>())
    {
        auto [log_p, mask] = decoder->computeStepLogP(cached, state, std::nullopt, 3);
        CHECK(log_p.sizes() == torch::IntArrayRef({6, 3}));
        const auto& action_mask = state.get("action_mask");
        CHECK(torch::equal(mask, foldStarts(unbatchify(action_mask, 3)).logical_not()));
        CHECK(torch::equal(mask, action_mask.logical_not()));

        PendingAction(state).assign(decodeProbs(log_p.exp(), mask, "greedy"));
        state = env->step(state);
        ++steps;
    }

    CHECK(steps == 2);
    CHECK(torch::equal(cached.glimpse_key, glimpse_key));
    CHECK(torch::equal(cached.glimpse_val, glimpse_val));
    CHECK(torch::equal(cached.logit_key, logit_key));
    CHECK(torch::equal(cached.graph_context, graph_context));
}

TEST_CASE("multi-start decoding runs one rollout per start node")
{
    auto env = std::make_shared<ToyEnv>();
    Decoder decoder(env, toyConfig(), toyRegistry());

    auto cached = decoder->precompute(torch::randn({2, 3, kDim}), 3);
    CHECK(cached.graph_context.sizes() == torch::IntArrayRef({2, 3, kDim}));

    auto result = decoder->forward(env->reset(2), torch::randn({2, 3, kDim}), greedy(3));

    CHECK(result.state.batchSize() == 6);
    CHECK(result.steps == 3);
    REQUIRE(result.actions.sizes() == torch::IntArrayRef({6, 3}));

    // The seeding step has log_p = 0
    CHECK(result.log_p.select(1, 0).abs().sum().item<float>() == 0.0F);

    auto per_instance = unbatchify(result.actions, 3);  // [B, S, steps]
    for (int64_t b = 0; b < 2; ++b)
    {
        std::set<int64_t> starts;
        for (int64_t s = 0; s < 3; ++s)
        {
            starts.insert(per_instance[b][s][0].item<int64_t>());
            auto sorted = std::get<0>(per_instance[b][s].sort());
            CHECK(torch::equal(sorted, torch::arange(3, torch::kLong)));
        }
        CHECK(starts == std::set<int64_t>{0, 1, 2});
    }
    CHECK(result.state.get("done").all().item<bool>());
}

TEST_CASE("multi-start with a single start fails before any tensor work")
{
    auto env = std::make_shared<ToyEnv>();
    Decoder decoder(env, toyConfig(), toyRegistry());

    DecodeOptions options;
    options.decode_type = "multistart_greedy";
    options.num_starts = 1;
    // The embeddings are undefined: touching them would raise a different error
    CHECK_THROWS_AS(decoder->forward(env->reset(2), torch::Tensor(), options), ConfigError);

    options.num_starts = 0;
    CHECK_THROWS_AS(decoder->forward(env->reset(2), torch::Tensor(), options), ConfigError);
}

TEST_CASE("multi-start is refused for environments with per-step embeddings")
{
    auto env = std::make_shared<ToyEnv>("sdvrp");
    Decoder decoder(env, toyConfig());
    CHECK_THROWS_AS(decoder->forward(env->reset(2), torch::Tensor(), greedy(2)), ConfigError);
}

TEST_CASE("a trajectory without a legal node is infeasible")
{
    auto registry = toyRegistry();
    auto env = std::make_shared<StuckEnv>();
    Decoder decoder(env, toyConfig(), registry);
    CHECK_THROWS_AS(decoder->forward(env->reset(1), torch::randn({1, 3, kDim}), greedy()),
                    InfeasibleStepError);
}

TEST_CASE("custom selectors replace the default policy")
{
    auto env = std::make_shared<ToyEnv>();
    Decoder decoder(env, toyConfig(), toyRegistry());

    decoder->setActionSelector(
        [](const torch::Tensor& probs, const torch::Tensor&, const std::string&) {
            return torch::full({probs.size(0)}, 2, torch::kLong);
        });
    CHECK_THROWS_AS(decoder->forward(env->reset(1), torch::randn({1, 3, kDim}), greedy()),
                    InfeasibleStepError);

    decoder->setActionSelector(decodeProbs);
    decoder->setStartNodeSelector(
        [](const TensorState& state, int64_t num_starts, const Environment&) {
            // Reversed order: rollout s starts at node S - 1 - s
            return torch::arange(num_starts - 1, -1, -1, torch::kLong).repeat_interleave(state.batchSize());
        });
    auto result = decoder->forward(env->reset(1), torch::randn({1, 3, kDim}), greedy(2));
    CHECK(torch::equal(result.actions.select(1, 0), torch::tensor({1, 0}, torch::kLong)));

    CHECK_THROWS_AS(decoder->setActionSelector(ActionSelector()), ConfigError);
}

TEST_CASE("start nodes must be distinct and in range")
{
    auto env = std::make_shared<ToyEnv>();
    Decoder decoder(env, toyConfig(), toyRegistry());
    auto embeddings = torch::randn({2, 3, kDim});

    auto use_starts = [&](torch::Tensor starts) {
        decoder->setStartNodeSelector(
            [starts](const TensorState&, int64_t, const Environment&) { return starts; });
    };

    // Instance 1 gets node 0 twice
    use_starts(torch::tensor({0, 0, 1, 0}, torch::kLong));
    CHECK_THROWS_AS(decoder->forward(env->reset(2), embeddings, greedy(2)), ConfigError);

    use_starts(torch::tensor({0, 1, 3, 2}, torch::kLong));
    CHECK_THROWS_AS(decoder->forward(env->reset(2), embeddings, greedy(2)), ConfigError);

    use_starts(torch::tensor({0, 1, -1, 2}, torch::kLong));
    CHECK_THROWS_AS(decoder->forward(env->reset(2), embeddings, greedy(2)), ConfigError);

    use_starts(torch::tensor({0, 1, 2}, torch::kLong));
    CHECK_THROWS_AS(decoder->forward(env->reset(2), embeddings, greedy(2)), ConfigError);

    use_starts(torch::tensor({0.0f, 1.0f, 1.0f, 0.0f}));
    CHECK_THROWS_AS(decoder->forward(env->reset(2), embeddings, greedy(2)), ConfigError);

    // Same nodes across instances are fine
    use_starts(torch::tensor({1, 1, 2, 2}, torch::kLong));
    auto result = decoder->forward(env->reset(2), embeddings, greedy(2));
    CHECK(torch::equal(result.actions.select(1, 0), torch::tensor({1, 1, 2, 2}, torch::kLong)));
}

TEST_CASE("decoding keeps the caller's grad mode")
{
    auto env = std::make_shared<ToyEnv>();
    Decoder decoder(env, toyConfig(), toyRegistry());
    auto embeddings = torch::randn({2, 3, kDim});

    auto trained = decoder->forward(env->reset(2), embeddings, greedy());
    CHECK(trained.log_p.requires_grad());

    torch::NoGradGuard no_grad;
    auto inference = decoder->forward(env->reset(2), embeddings, greedy());
    CHECK_FALSE(inference.log_p.requires_grad());
}

TEST_CASE("a state that is already done decodes to an empty trace")
{
    auto env = std::make_shared<ToyEnv>();
    Decoder decoder(env, toyConfig(), toyRegistry());

    auto state = env->reset(2);
    state.set("done", torch::ones({2}, torch::kBool));
    auto result = decoder->forward(state, torch::randn({2, 3, kDim}), greedy());

    CHECK(result.steps == 0);
    CHECK(result.log_p.sizes() == torch::IntArrayRef({2, 0, 3}));
    CHECK(result.actions.sizes() == torch::IntArrayRef({2, 0}));
    CHECK_FALSE(result.state.contains("reward"));
}
