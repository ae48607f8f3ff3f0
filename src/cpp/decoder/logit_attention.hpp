#pragma once

#include <cstdint>
#include <optional>

#include <torch/torch.h>

#include "decoder_config.hpp"

namespace amroute
{

/// Pointer-style scoring of the Attention Model.
///
/// A multi-head "glimpse" of the query over the glimpse keys/values is
/// projected back to embedding_dim, compared against the logit keys,
/// tanh-clipped, masked and normalised into log-probabilities.
///
/// Shapes (mask: true = forbidden):
///   query [B, 1, D], keys [B, N, D], mask [B, N]    -> [B, N]
///   query [B, S, D], keys [B, N, D], mask [B, S, N] -> [B, S, N]
class LogitAttentionImpl : public torch::nn::Module
{
public:
    LogitAttentionImpl(int64_t embedding_dim, int64_t num_heads,
                       float tanh_clipping = 10.0f, bool mask_inner = true,
                       bool mask_logits = true, bool normalize = true,
                       float softmax_temp = 1.0f);

    explicit LogitAttentionImpl(const DecoderConfig& config);

    torch::Tensor forward(const torch::Tensor& query, const torch::Tensor& key,
                          const torch::Tensor& value, const torch::Tensor& logit_key,
                          const torch::Tensor& mask,
                          std::optional<float> softmax_temp = std::nullopt);

    int64_t numHeads() const { return num_heads_; }

private:
    torch::Tensor innerMha(const torch::Tensor& query, const torch::Tensor& key,
                           const torch::Tensor& value, const torch::Tensor& mask) const;

    /// [B, L, H*dh] -> [B, H, L, dh]
    torch::Tensor makeHeads(const torch::Tensor& x) const;

    int64_t embedding_dim_;
    int64_t num_heads_;
    float tanh_clipping_;
    bool mask_inner_;
    bool mask_logits_;
    bool normalize_;
    float softmax_temp_;

    torch::nn::Linear project_out_{nullptr};
};

TORCH_MODULE(LogitAttention);

} // namespace amroute
