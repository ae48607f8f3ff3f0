#include "decoder_engine.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <vector>

#include "batch_ops.hpp"
#include "errors.hpp"

namespace amroute
{

namespace
{

// Start actions [S*B], starts-major, in range and pairwise distinct per instance
void checkStartNodes(const torch::Tensor& action, int64_t batch, int64_t num_starts, int64_t num_nodes)
{
    if (!action.defined() || action.dim() != 1 || action.size(0) != batch * num_starts)
    {
        throw ConfigError("Start node selector must return [" + std::to_string(batch * num_starts)
                          + "] actions, got " + shapeString(action));
    }
    if (action.is_floating_point() || action.scalar_type() == torch::kBool)
        throw ConfigError("Start node selector must return integer actions");
    if ((action < 0).any().item<bool>() || (action >= num_nodes).any().item<bool>())
    {
        throw ConfigError("Start node selector returned a node outside [0, "
                          + std::to_string(num_nodes) + ")");
    }

    auto sorted = std::get<0>(unbatchify(action, num_starts).sort(1));  // [B, S]
    auto repeated = sorted.narrow(1, 1, num_starts - 1) == sorted.narrow(1, 0, num_starts - 1);
    if (repeated.any().item<bool>())
        throw ConfigError("Start node selector returned the same start node twice for one instance");
}

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

DecoderImpl::DecoderImpl(std::shared_ptr<const Environment> env, const DecoderConfig& config,
                         const EnvEmbeddingRegistry& registry)
    : env_(std::move(env))
    , config_(config)
    , action_selector_(decodeProbs)
    , start_node_selector_(selectStartNodes)
{
    if (!env_)
        throw ConfigError("Decoder requires an environment");
    if (config.num_heads <= 0 || config.embedding_dim % config.num_heads != 0)
    {
        throw ConfigError("embedding_dim (" + std::to_string(config.embedding_dim)
                          + ") must be divisible by num_heads (" + std::to_string(config.num_heads) + ")");
    }

    const int64_t dim = config.embedding_dim;
    auto env_embeddings = registry.create(env_->name(), dim);
    context_ = register_module("context", env_embeddings.context);
    dynamic_embedding_ = register_module("dynamic_embedding", env_embeddings.dynamic);

    project_node_embeddings_ = register_module(
        "project_node_embeddings",
        torch::nn::Linear(torch::nn::LinearOptions(dim, 3 * dim).bias(false)));
    project_fixed_context_ = register_module(
        "project_fixed_context",
        torch::nn::Linear(torch::nn::LinearOptions(dim, dim).bias(false)));
    logit_attention_ = register_module("logit_attention", LogitAttention(config));

    std::cout << "[Decoder] Loaded: env=" << env_->name() << ", " << dim << "d, "
              << config.num_heads << " heads" << std::endl;
}

void DecoderImpl::setActionSelector(ActionSelector selector)
{
    if (!selector)
        throw ConfigError("Decoder: empty action selector");
    action_selector_ = std::move(selector);
}

void DecoderImpl::setStartNodeSelector(StartNodeSelector selector)
{
    if (!selector)
        throw ConfigError("Decoder: empty start node selector");
    start_node_selector_ = std::move(selector);
}

// ============================================================================
// Precompute & step scoring
// ============================================================================

PrecomputedCache DecoderImpl::precompute(const torch::Tensor& embeddings, int64_t num_starts)
{
    if (embeddings.dim() != 3 || embeddings.size(2) != config_.embedding_dim)
    {
        throw ShapeError("Decoder: expected node embeddings [B, N, " + std::to_string(config_.embedding_dim)
                         + "], got " + shapeString(embeddings));
    }

    // Computed once and reused by every step.
    auto chunks = project_node_embeddings_(embeddings).chunk(3, -1);

    // batchify/unbatchify are identity for num_starts <= 1. Otherwise every
    // rollout gets its own view of the graph context: [B, S, D].
    auto graph_context = unbatchify(
        batchify(project_fixed_context_(embeddings.mean(1)), num_starts), num_starts);

    return PrecomputedCache{embeddings, graph_context, chunks[0], chunks[1], chunks[2]};
}

std::pair<torch::Tensor, torch::Tensor> DecoderImpl::computeStepLogP(
    const PrecomputedCache& cached, const TensorState& state,
    std::optional<float> softmax_temp, int64_t num_starts)
{
    StateView view(state, num_starts);
    if (view.batchSize() != cached.node_embeddings.size(0))
    {
        throw ShapeError("Decoder: state holds " + std::to_string(view.batchSize())
                         + " instances but the cache holds " + std::to_string(cached.node_embeddings.size(0)));
    }

    auto step_context = context_->forward(cached.node_embeddings, view);
    if (step_context.sizes() != cached.graph_context.sizes())
    {
        throw ShapeError("Decoder: step context " + shapeString(step_context)
                         + " does not match graph context " + shapeString(cached.graph_context));
    }
    auto glimpse_q = step_context + cached.graph_context;
    if (glimpse_q.dim() == 2)
        glimpse_q = glimpse_q.unsqueeze(1);

    auto dynamic = dynamic_embedding_->forward(view);
    auto glimpse_k = cached.glimpse_key + dynamic.glimpse_key;
    auto glimpse_v = cached.glimpse_val + dynamic.glimpse_val;
    auto logit_k = cached.logit_key + dynamic.logit_key;
    if (glimpse_k.sizes() != cached.glimpse_key.sizes() || glimpse_v.sizes() != cached.glimpse_val.sizes()
        || logit_k.sizes() != cached.logit_key.sizes())
    {
        throw ShapeError("Decoder: dynamic embedding changed the key shape " + shapeString(cached.glimpse_key)
                         + " to " + shapeString(glimpse_k));
    }

    auto action_mask = view.get("action_mask");
    if (action_mask.scalar_type() != torch::kBool)
        throw ShapeError("Decoder: action_mask must be a bool tensor");
    auto mask = action_mask.logical_not();

    auto log_p = logit_attention_->forward(glimpse_q, glimpse_k, glimpse_v, logit_k, mask, softmax_temp);

    // [B, S, N] -> [S*B, N]; must match the starts-major layout of the state
    if (num_starts > 1)
    {
        log_p = foldStarts(log_p);
        mask = foldStarts(mask);
    }
    return {log_p, mask};
}

// ============================================================================
// Decode loop
// ============================================================================

bool DecoderImpl::allDone(const TensorState& state)
{
    return state.get("done").all().item<bool>();
}

void DecoderImpl::checkFeasible(const TensorState& state) const
{
    const auto& action_mask = state.get("action_mask");
    if (action_mask.dim() != 2)
        throw ShapeError("Decoder: expected action_mask [B, N], got " + shapeString(action_mask));

    auto active = state.get("done").to(torch::kBool).reshape({state.batchSize()}).logical_not();
    auto stuck = action_mask.logical_not().all(-1).logical_and(active);
    if (stuck.any().item<bool>())
    {
        int64_t row = stuck.nonzero()[0][0].item<int64_t>();
        throw InfeasibleStepError("Environment " + env_->name() + " left trajectory " + std::to_string(row)
                                  + " without a legal node before it is done");
    }
}

DecodeResult DecoderImpl::forward(TensorState state, const torch::Tensor& embeddings,
                                  const DecodeOptions& options)
{
    auto t0 = std::chrono::high_resolution_clock::now();

    // INIT: reject bad calls before any tensor work
    const int64_t num_starts = std::max<int64_t>(options.num_starts, 0);
    if (isMultistart(options.decode_type) && num_starts <= 1)
    {
        throw ConfigError("Multi-start decoding requires num_starts > 1, got "
                          + std::to_string(options.num_starts));
    }
    validateDecodeType(options.decode_type);
    if (num_starts > 1 && !dynamic_embedding_->supportsMultistart())
        throw ConfigError("Environment " + env_->name() + " does not support multi-start decoding");
    if (embeddings.dim() != 3 || embeddings.size(0) != state.batchSize())
    {
        throw ShapeError("Decoder: embeddings " + shapeString(embeddings) + " do not match a state of "
                         + std::to_string(state.batchSize()) + " instances");
    }

    const PrecomputedCache cached = precompute(embeddings, num_starts);

    std::vector<torch::Tensor> outputs;
    std::vector<torch::Tensor> actions;

    // MULTISTART_SEED
    if (num_starts > 1)
    {
        auto action = start_node_selector_(state, num_starts, *env_);
        checkStartNodes(action, state.batchSize(), num_starts, state.get("action_mask").size(-1));

        state = batchify(state, num_starts);
        PendingAction(state).assign(action);
        torch::Tensor assigned = state.get("action");
        state = env_->step(state);

        // First log_p is 0, so p = exp(log_p) = 1
        outputs.push_back(torch::zeros(state.get("action_mask").sizes(), embeddings.options()));
        actions.push_back(assigned);
    }

    // STEPPING
    while (!allDone(state))
    {
        checkFeasible(state);

        auto [log_p, mask] = computeStepLogP(cached, state, options.softmax_temp, num_starts);
        auto action = action_selector_(log_p.exp(), mask, options.decode_type);

        PendingAction(state).assign(action);
        torch::Tensor assigned = state.get("action");
        if (mask.gather(1, assigned.unsqueeze(-1)).any().item<bool>())
            throw InfeasibleStepError("Decoder: selected action is forbidden by the action mask");
        state = env_->step(state);

        outputs.push_back(log_p);
        actions.push_back(assigned);
    }

    // DONE
    DecodeResult result;
    result.steps = static_cast<int64_t>(outputs.size());
    if (outputs.empty())
    {
        const int64_t num_nodes = state.get("action_mask").size(-1);
        result.log_p = torch::zeros({state.batchSize(), 0, num_nodes}, embeddings.options());
        result.actions = torch::zeros({state.batchSize(), 0},
                                      torch::TensorOptions().dtype(torch::kLong).device(embeddings.device()));
    }
    else
    {
        result.log_p = torch::stack(outputs, 1);
        result.actions = torch::stack(actions, 1);
    }

    // No trajectory to score when the state was done on entry
    if (options.calc_reward && result.steps > 0)
        state.set("reward", env_->getReward(state, result.actions));
    result.state = std::move(state);

    if (options.verbose)
    {
        auto t1 = std::chrono::high_resolution_clock::now();
        std::cout << "[Decoder] " << options.decode_type << ": " << result.state.batchSize()
                  << " trajectories, " << result.steps << " steps, "
                  << std::chrono::duration<double, std::milli>(t1 - t0).count() << " ms" << std::endl;
    }
    return result;
}

} // namespace amroute
