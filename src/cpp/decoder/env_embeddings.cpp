#include "env_embeddings.hpp"

#include "batch_ops.hpp"
#include "errors.hpp"

namespace amroute
{

namespace
{

void checkEmbeddings(const torch::Tensor& embeddings, const StateView& state, int64_t embedding_dim)
{
    if (embeddings.dim() != 3 || embeddings.size(2) != embedding_dim)
    {
        throw ShapeError("StepContext: expected embeddings [B, N, " + std::to_string(embedding_dim)
                         + "], got " + shapeString(embeddings));
    }
    if (embeddings.size(0) != state.batchSize())
    {
        throw ShapeError("StepContext: embeddings batch " + std::to_string(embeddings.size(0))
                         + " does not match state batch " + std::to_string(state.batchSize()));
    }
}

} // anonymous namespace

// ============================================================================
// TspContext
// ============================================================================

TspContext::TspContext(int64_t embedding_dim)
    : embedding_dim_(embedding_dim)
{
    w_placeholder_ = register_parameter("W_placeholder",
                                        torch::empty({2 * embedding_dim}).uniform_(-1, 1));
    project_context_ = register_module(
        "project_context",
        torch::nn::Linear(torch::nn::LinearOptions(2 * embedding_dim, embedding_dim).bias(false)));
}

torch::Tensor TspContext::forward(const torch::Tensor& embeddings, const StateView& state)
{
    checkEmbeddings(embeddings, state, embedding_dim_);
    const int64_t batch = embeddings.size(0);

    auto first = state.get("first_node");
    auto current = state.get("current_node");
    auto step = state.get("i");

    torch::Tensor context;
    if (step.flatten()[0].item<int64_t>() < 1)
    {
        auto w = w_placeholder_.to(embeddings.device());
        context = state.expanded()
            ? w.view({1, 1, -1}).expand({batch, state.numStarts(), 2 * embedding_dim_})
            : w.view({1, -1}).expand({batch, 2 * embedding_dim_});
    }
    else
    {
        // [B, 2] or [B, S, 2] -> gather -> [B, 2D] or [B, S, 2D]
        auto index = torch::stack({first, current}, -1).view({batch, -1});
        auto gathered = gatherByIndex(embeddings, index);
        context = state.expanded()
            ? gathered.reshape({batch, state.numStarts(), 2 * embedding_dim_})
            : gathered.reshape({batch, 2 * embedding_dim_});
    }
    return project_context_(context);
}

// ============================================================================
// CvrpContext
// ============================================================================

CvrpContext::CvrpContext(int64_t embedding_dim)
    : embedding_dim_(embedding_dim)
{
    project_context_ = register_module(
        "project_context",
        torch::nn::Linear(torch::nn::LinearOptions(embedding_dim + 1, embedding_dim).bias(false)));
}

torch::Tensor CvrpContext::forward(const torch::Tensor& embeddings, const StateView& state)
{
    checkEmbeddings(embeddings, state, embedding_dim_);

    auto current = state.get("current_node");
    auto cur_node_embedding = gatherByIndex(embeddings, current.reshape({embeddings.size(0), -1}));
    if (!state.expanded())
        cur_node_embedding = cur_node_embedding.squeeze(1);

    auto remaining = (state.get("vehicle_capacity") - state.get("used_capacity"))
                         .to(embeddings.dtype());
    remaining = remaining.reshape(current.sizes()).unsqueeze(-1);

    return project_context_(torch::cat({cur_node_embedding, remaining}, -1));
}

// ============================================================================
// Dynamic embeddings
// ============================================================================

DynamicKeys StaticEmbedding::forward(const StateView& /*state*/)
{
    auto zero = torch::zeros({});
    return {zero, zero, zero};
}

SdvrpDynamicEmbedding::SdvrpDynamicEmbedding(int64_t embedding_dim)
{
    projection_ = register_module(
        "projection",
        torch::nn::Linear(torch::nn::LinearOptions(1, 3 * embedding_dim).bias(false)));
}

DynamicKeys SdvrpDynamicEmbedding::forward(const StateView& state)
{
    if (state.expanded())
        throw ConfigError("SdvrpDynamicEmbedding does not support multi-start decoding");

    auto demands = state.get("demand_with_depot");
    if (demands.dim() != 2)
        throw ShapeError("SdvrpDynamicEmbedding: expected demand_with_depot [B, N], got " + shapeString(demands));

    demands = demands.to(torch::kFloat).clone();
    demands.select(1, 0).zero_();
    auto chunks = projection_(demands.unsqueeze(-1)).chunk(3, -1);
    return {chunks[0], chunks[1], chunks[2]};
}

// ============================================================================
// Init embeddings
// ============================================================================

TspInitEmbedding::TspInitEmbedding(int64_t embedding_dim)
{
    init_embed_ = register_module("init_embed", torch::nn::Linear(2, embedding_dim));
}

torch::Tensor TspInitEmbedding::forward(const TensorState& instances)
{
    return init_embed_(instances.get("locs"));
}

CvrpInitEmbedding::CvrpInitEmbedding(int64_t embedding_dim)
{
    init_embed_ = register_module("init_embed", torch::nn::Linear(3, embedding_dim));
    init_embed_depot_ = register_module("init_embed_depot", torch::nn::Linear(2, embedding_dim));
}

torch::Tensor CvrpInitEmbedding::forward(const TensorState& instances)
{
    using namespace torch::indexing;
    const auto& locs = instances.get("locs");      // [B, N+1, 2], depot first
    const auto& demand = instances.get("demand");  // [B, N]
    if (locs.dim() != 3 || demand.dim() != 2 || locs.size(1) != demand.size(1) + 1)
    {
        throw ShapeError("CvrpInitEmbedding: locs " + shapeString(locs)
                         + " and demand " + shapeString(demand) + " disagree");
    }

    auto depot = init_embed_depot_(locs.index({Slice(), Slice(0, 1)}));
    auto cities = init_embed_(torch::cat({locs.index({Slice(), Slice(1, None)}),
                                          demand.unsqueeze(-1).to(locs.dtype())}, -1));
    return torch::cat({depot, cities}, 1);
}

std::shared_ptr<InitEmbedding> createInitEmbedding(const std::string& env_name, int64_t embedding_dim)
{
    if (env_name == "tsp" || env_name == "atsp")
        return std::make_shared<TspInitEmbedding>(embedding_dim);
    if (env_name == "cvrp" || env_name == "sdvrp")
        return std::make_shared<CvrpInitEmbedding>(embedding_dim);
    throw ConfigError("No init embedding for environment: " + env_name);
}

// ============================================================================
// EnvEmbeddingRegistry
// ============================================================================

const EnvEmbeddingRegistry& EnvEmbeddingRegistry::defaults()
{
    static const EnvEmbeddingRegistry registry = [] {
        EnvEmbeddingRegistry r;
        auto tsp = [](int64_t d) -> std::shared_ptr<StepContext> { return std::make_shared<TspContext>(d); };
        auto cvrp = [](int64_t d) -> std::shared_ptr<StepContext> { return std::make_shared<CvrpContext>(d); };
        auto fixed = [](int64_t) -> std::shared_ptr<DynamicEmbedding> { return std::make_shared<StaticEmbedding>(); };
        auto sdvrp = [](int64_t d) -> std::shared_ptr<DynamicEmbedding> {
            return std::make_shared<SdvrpDynamicEmbedding>(d);
        };
        r.add("tsp", tsp, fixed);
        r.add("atsp", tsp, fixed);
        r.add("cvrp", cvrp, fixed);
        r.add("sdvrp", cvrp, sdvrp);
        return r;
    }();
    return registry;
}

void EnvEmbeddingRegistry::add(const std::string& env_name, ContextFactory context, DynamicFactory dynamic)
{
    if (!context || !dynamic)
        throw ConfigError("EnvEmbeddingRegistry: empty factory for environment " + env_name);
    factories_[env_name] = {std::move(context), std::move(dynamic)};
}

bool EnvEmbeddingRegistry::contains(const std::string& env_name) const
{
    return factories_.find(env_name) != factories_.end();
}

std::vector<std::string> EnvEmbeddingRegistry::names() const
{
    std::vector<std::string> result;
    for (const auto& [name, factories] : factories_)
        result.push_back(name);
    return result;
}

EnvEmbeddings EnvEmbeddingRegistry::create(const std::string& env_name, int64_t embedding_dim) const
{
    auto it = factories_.find(env_name);
    if (it == factories_.end())
        throw ConfigError("Unknown environment for context/dynamic embeddings: " + env_name);
    return {it->second.first(embedding_dim), it->second.second(embedding_dim)};
}

} // namespace amroute
