#include "logit_attention.hpp"

#include <cmath>
#include <limits>

#include "errors.hpp"
#include "tensor_state.hpp"

namespace amroute
{

LogitAttentionImpl::LogitAttentionImpl(int64_t embedding_dim, int64_t num_heads,
                                       float tanh_clipping, bool mask_inner,
                                       bool mask_logits, bool normalize,
                                       float softmax_temp)
    : embedding_dim_(embedding_dim), num_heads_(num_heads)
    , tanh_clipping_(tanh_clipping), mask_inner_(mask_inner)
    , mask_logits_(mask_logits), normalize_(normalize)
    , softmax_temp_(softmax_temp)
{
    if (num_heads <= 0 || embedding_dim % num_heads != 0)
    {
        throw ConfigError("embedding_dim (" + std::to_string(embedding_dim)
                          + ") must be divisible by num_heads (" + std::to_string(num_heads) + ")");
    }

    project_out_ = register_module(
        "project_out",
        torch::nn::Linear(torch::nn::LinearOptions(embedding_dim, embedding_dim).bias(false)));
}

LogitAttentionImpl::LogitAttentionImpl(const DecoderConfig& config)
    : LogitAttentionImpl(config.embedding_dim, config.num_heads, config.tanh_clipping,
                         config.mask_inner, config.mask_logits, config.normalize,
                         config.softmax_temp)
{
}

torch::Tensor LogitAttentionImpl::forward(const torch::Tensor& query, const torch::Tensor& key,
                                          const torch::Tensor& value, const torch::Tensor& logit_key,
                                          const torch::Tensor& mask,
                                          std::optional<float> softmax_temp)
{
    if (query.dim() != 3 || query.size(-1) != embedding_dim_)
        throw ShapeError("LogitAttention: query must be [B, Q, " + std::to_string(embedding_dim_)
                         + "], got " + shapeString(query));
    if (logit_key.dim() != 3 || logit_key.size(0) != query.size(0) || logit_key.size(-1) != embedding_dim_)
        throw ShapeError("LogitAttention: logit_key " + shapeString(logit_key)
                         + " does not match query " + shapeString(query));

    if (mask.scalar_type() != torch::kBool)
        throw ShapeError("LogitAttention: mask must be a bool tensor");

    const int64_t num_nodes = logit_key.size(1);
    const bool single_query = query.size(1) == 1;
    const bool mask_ok = single_query
        ? (mask.dim() == 2 && mask.size(0) == query.size(0) && mask.size(1) == num_nodes)
        : (mask.dim() == 3 && mask.size(0) == query.size(0) && mask.size(1) == query.size(1)
           && mask.size(2) == num_nodes);
    if (!mask_ok)
        throw ShapeError("LogitAttention: mask " + shapeString(mask) + " does not match query "
                         + shapeString(query) + " over " + std::to_string(num_nodes) + " nodes");

    auto heads = innerMha(query, key, value, mask);
    auto glimpse = project_out_(heads);

    // [B, Q, D] x [B, D, N] -> [B, Q, N]
    auto logits = torch::matmul(glimpse, logit_key.transpose(-2, -1))
                  / std::sqrt(static_cast<double>(glimpse.size(-1)));
    if (single_query)
        logits = logits.squeeze(1);

    if (tanh_clipping_ > 0.0f)
        logits = torch::tanh(logits) * tanh_clipping_;

    if (mask_logits_)
        logits = logits.masked_fill(mask, -std::numeric_limits<float>::infinity());

    if (normalize_)
    {
        float temp = softmax_temp.value_or(softmax_temp_);
        if (temp <= 0.0f)
            throw ConfigError("softmax temperature must be positive, got " + std::to_string(temp));
        logits = torch::log_softmax(logits / temp, -1);
    }

    if (torch::isnan(logits).any().item<bool>())
        throw InfeasibleStepError("LogitAttention: log-probabilities contain NaN (fully masked row?)");

    return logits;
}

torch::Tensor LogitAttentionImpl::innerMha(const torch::Tensor& query, const torch::Tensor& key,
                                           const torch::Tensor& value, const torch::Tensor& mask) const
{
    auto q = makeHeads(query);   // [B, H, Q, dh]
    auto k = makeHeads(key);     // [B, H, N, dh]
    auto v = makeHeads(value);   // [B, H, N, dh]

    if (k.size(0) != q.size(0) || v.sizes() != k.sizes())
        throw ShapeError("LogitAttention: glimpse key " + shapeString(key) + " / value "
                         + shapeString(value) + " do not match query " + shapeString(query));

    auto scores = torch::matmul(q, k.transpose(-2, -1)) / std::sqrt(static_cast<double>(q.size(-1)));

    if (mask_inner_)
    {
        // [B, N] -> [B, 1, 1, N];  [B, S, N] -> [B, 1, S, N]
        auto attn_mask = mask.dim() == 2 ? mask.unsqueeze(1).unsqueeze(2) : mask.unsqueeze(1);
        scores = scores.masked_fill(attn_mask, -std::numeric_limits<float>::infinity());
    }

    auto heads = torch::matmul(torch::softmax(scores, -1), v);  // [B, H, Q, dh]
    return heads.transpose(1, 2).reshape({query.size(0), query.size(1), embedding_dim_});
}

torch::Tensor LogitAttentionImpl::makeHeads(const torch::Tensor& x) const
{
    if (x.dim() != 3 || x.size(-1) != embedding_dim_)
        throw ShapeError("LogitAttention: expected [B, L, " + std::to_string(embedding_dim_)
                         + "], got " + shapeString(x));
    return x.reshape({x.size(0), x.size(1), num_heads_, embedding_dim_ / num_heads_}).transpose(1, 2);
}

} // namespace amroute
