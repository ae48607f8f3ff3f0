#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include <torch/torch.h>

#include "decode_policy.hpp"
#include "decoder_config.hpp"
#include "env_embeddings.hpp"
#include "environment.hpp"
#include "logit_attention.hpp"
#include "tensor_state.hpp"

namespace amroute
{

/// Projections of the node embeddings shared by every decoding step of one
/// decode call. Never modified after precompute().
struct PrecomputedCache
{
    const torch::Tensor node_embeddings;  // [B, N, D]
    const torch::Tensor graph_context;    // [B, D], or [B, S, D] with num_starts > 1
    const torch::Tensor glimpse_key;      // [B, N, D]
    const torch::Tensor glimpse_val;      // [B, N, D]
    const torch::Tensor logit_key;        // [B, N, D]
};

struct DecodeResult
{
    torch::Tensor log_p;    // [B', steps, N], B' = B * max(num_starts, 1)
    torch::Tensor actions;  // [B', steps] int64
    TensorState state;      // final state, with "reward" when requested
    int64_t steps{0};
};

/// Auto-regressive decoder of the Attention Model, with greedy multi-start
/// (POMO-style) decoding.
///
/// State machine of forward():
///   INIT            validate the call, precompute the cache
///   MULTISTART_SEED (num_starts > 1) seed one start node per rollout,
///                   expand the state starts-major, step once
///   STEPPING        score, select, step until every trajectory is done
///   DONE            stack the trace, optionally attach the reward
///
/// Not thread-safe; one decode call at a time.
class DecoderImpl : public torch::nn::Module
{
public:
    DecoderImpl(std::shared_ptr<const Environment> env, const DecoderConfig& config,
                const EnvEmbeddingRegistry& registry = EnvEmbeddingRegistry::defaults());

    /// Decode full solutions for every instance in state. Runs in the
    /// caller's grad mode, so log_p stays differentiable unless a
    /// NoGradGuard is held. A state that is already done gives a zero-step
    /// result without a reward.
    DecodeResult forward(TensorState state, const torch::Tensor& embeddings,
                         const DecodeOptions& options = DecodeOptions());

    /// Project node embeddings [B, N, D] into the cache. With num_starts > 1
    /// the graph context is replicated to [B, num_starts, D].
    PrecomputedCache precompute(const torch::Tensor& embeddings, int64_t num_starts = 0);

    /// Masked log-probabilities [B', N] over the next node and the mask
    /// (true = forbidden) for the current, possibly expanded, state.
    std::pair<torch::Tensor, torch::Tensor> computeStepLogP(
        const PrecomputedCache& cached, const TensorState& state,
        std::optional<float> softmax_temp = std::nullopt, int64_t num_starts = 0);

    void setActionSelector(ActionSelector selector);
    void setStartNodeSelector(StartNodeSelector selector);

    const DecoderConfig& config() const { return config_; }
    const Environment& env() const { return *env_; }

private:
    /// Throws InfeasibleStepError if an active trajectory has no legal node.
    void checkFeasible(const TensorState& state) const;

    static bool allDone(const TensorState& state);

    std::shared_ptr<const Environment> env_;
    DecoderConfig config_;

    std::shared_ptr<StepContext> context_;
    std::shared_ptr<DynamicEmbedding> dynamic_embedding_;

    // For each node: glimpse key, glimpse value and logit key -> 3 * D
    torch::nn::Linear project_node_embeddings_{nullptr};
    torch::nn::Linear project_fixed_context_{nullptr};
    LogitAttention logit_attention_{nullptr};

    ActionSelector action_selector_;
    StartNodeSelector start_node_selector_;
};

TORCH_MODULE(Decoder);

} // namespace amroute
