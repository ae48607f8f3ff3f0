#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "tensor_state.hpp"

namespace amroute
{

/// Additive per-step corrections to the cached glimpse key/value and logit key.
struct DynamicKeys
{
    torch::Tensor glimpse_key;
    torch::Tensor glimpse_val;
    torch::Tensor logit_key;
};

/// Builds the step query ("where are we now") from the node embeddings and
/// the current state. Returns [B, D], or [B, S, D] for an expanded view.
class StepContext : public torch::nn::Module
{
public:
    virtual torch::Tensor forward(const torch::Tensor& embeddings, const StateView& state) = 0;
};

/// Produces step-varying corrections to the fixed attention keys.
class DynamicEmbedding : public torch::nn::Module
{
public:
    virtual DynamicKeys forward(const StateView& state) = 0;

    virtual bool supportsMultistart() const { return true; }
};

/// Projects raw instance features to node embeddings [B, N, D].
class InitEmbedding : public torch::nn::Module
{
public:
    virtual torch::Tensor forward(const TensorState& instances) = 0;
};

// ==================== Step contexts ====================

/// TSP/ATSP: [first node, current node] embeddings, or a learned
/// placeholder before the first move.
class TspContext : public StepContext
{
public:
    explicit TspContext(int64_t embedding_dim);

    torch::Tensor forward(const torch::Tensor& embeddings, const StateView& state) override;

private:
    int64_t embedding_dim_;
    torch::Tensor w_placeholder_;  // [2D]
    torch::nn::Linear project_context_{nullptr};
};

/// CVRP/SDVRP: current node embedding and remaining vehicle capacity.
class CvrpContext : public StepContext
{
public:
    explicit CvrpContext(int64_t embedding_dim);

    torch::Tensor forward(const torch::Tensor& embeddings, const StateView& state) override;

private:
    int64_t embedding_dim_;
    torch::nn::Linear project_context_{nullptr};
};

// ==================== Dynamic embeddings ====================

/// No dynamic features: zero corrections.
class StaticEmbedding : public DynamicEmbedding
{
public:
    DynamicKeys forward(const StateView& state) override;
};

/// Split-delivery VRP: projection of the remaining demand per node
/// (depot demand zeroed). Not defined for expanded views.
class SdvrpDynamicEmbedding : public DynamicEmbedding
{
public:
    explicit SdvrpDynamicEmbedding(int64_t embedding_dim);

    DynamicKeys forward(const StateView& state) override;

    bool supportsMultistart() const override { return false; }

private:
    torch::nn::Linear projection_{nullptr};
};

// ==================== Init embeddings ====================

class TspInitEmbedding : public InitEmbedding
{
public:
    explicit TspInitEmbedding(int64_t embedding_dim);

    torch::Tensor forward(const TensorState& instances) override;

private:
    torch::nn::Linear init_embed_{nullptr};
};

class CvrpInitEmbedding : public InitEmbedding
{
public:
    explicit CvrpInitEmbedding(int64_t embedding_dim);

    torch::Tensor forward(const TensorState& instances) override;

private:
    torch::nn::Linear init_embed_{nullptr};
    torch::nn::Linear init_embed_depot_{nullptr};
};

/// Throws ConfigError for an environment without an init embedding.
std::shared_ptr<InitEmbedding> createInitEmbedding(const std::string& env_name, int64_t embedding_dim);

// ==================== Registry ====================

struct EnvEmbeddings
{
    std::shared_ptr<StepContext> context;
    std::shared_ptr<DynamicEmbedding> dynamic;
};

/// Maps an environment name to its step-context and dynamic-embedding
/// factories. Resolved once when a decoder is constructed.
class EnvEmbeddingRegistry
{
public:
    using ContextFactory = std::function<std::shared_ptr<StepContext>(int64_t embedding_dim)>;
    using DynamicFactory = std::function<std::shared_ptr<DynamicEmbedding>(int64_t embedding_dim)>;

    /// Registry with tsp, atsp, cvrp and sdvrp.
    static const EnvEmbeddingRegistry& defaults();

    /// Registers or replaces an environment.
    void add(const std::string& env_name, ContextFactory context, DynamicFactory dynamic);

    bool contains(const std::string& env_name) const;

    std::vector<std::string> names() const;

    /// Throws ConfigError for an unknown environment.
    EnvEmbeddings create(const std::string& env_name, int64_t embedding_dim) const;

private:
    std::map<std::string, std::pair<ContextFactory, DynamicFactory>> factories_;
};

} // namespace amroute
