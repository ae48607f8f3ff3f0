#include "envs/tsp_env.hpp"

#include "decoder/errors.hpp"

namespace amroute::envs
{

TspEnv::TspEnv(int64_t num_loc)
    : num_loc_(num_loc)
{
    if (num_loc < 2)
        throw ConfigError("TspEnv: num_loc must be at least 2, got " + std::to_string(num_loc));
}

torch::Tensor TspEnv::generateLocs(int64_t batch_size) const
{
    return torch::rand({batch_size, num_loc_, 2});
}

TensorState TspEnv::reset(const torch::Tensor& locs) const
{
    if (locs.dim() != 3 || locs.size(2) != 2)
        throw ShapeError("TspEnv: expected locs [B, N, 2], got " + shapeString(locs));

    const int64_t batch = locs.size(0);
    const int64_t num_nodes = locs.size(1);
    auto long_opts = torch::TensorOptions().dtype(torch::kLong).device(locs.device());
    auto bool_opts = torch::TensorOptions().dtype(torch::kBool).device(locs.device());

    TensorState state(batch);
    state.set("locs", locs);
    state.set("first_node", torch::zeros({batch}, long_opts));
    state.set("current_node", torch::zeros({batch}, long_opts));
    state.set("i", torch::zeros({batch}, long_opts));
    state.set("action_mask", torch::ones({batch, num_nodes}, bool_opts));
    state.set("done", torch::zeros({batch}, bool_opts));
    return state;
}

TensorState TspEnv::step(const TensorState& state) const
{
    auto current = state.get("action");
    const auto& i = state.get("i");

    auto first = torch::where(i == 0, current, state.get("first_node"));
    auto available = state.get("action_mask").scatter(-1, current.unsqueeze(-1), false);
    auto done = available.sum(-1) == 0;

    TensorState next = state;
    next.set("first_node", first);
    next.set("current_node", current);
    next.set("i", i + 1);
    next.set("action_mask", available);
    next.set("done", done);
    return next;
}

torch::Tensor TspEnv::getReward(const TensorState& state, const torch::Tensor& actions) const
{
    const auto& locs = state.get("locs");
    const int64_t num_nodes = locs.size(1);
    if (actions.dim() != 2 || actions.size(0) != locs.size(0))
        throw ShapeError("TspEnv: actions " + shapeString(actions) + " do not match locs " + shapeString(locs));

    if (actions.size(1) != num_nodes)
        throw InfeasibleStepError("TspEnv: invalid tour, every node must be visited exactly once");
    auto expected = torch::arange(num_nodes, actions.options()).unsqueeze(0).expand_as(actions);
    if (!std::get<0>(actions.sort(1)).eq(expected).all().item<bool>())
        throw InfeasibleStepError("TspEnv: invalid tour, every node must be visited exactly once");

    auto ordered = locs.gather(1, actions.unsqueeze(-1).expand({actions.size(0), actions.size(1), 2}));
    return -tourLength(ordered);
}

torch::Tensor tourLength(const torch::Tensor& ordered_locs)
{
    auto next = ordered_locs.roll({-1}, {1});
    return (next - ordered_locs).pow(2).sum(-1).sqrt().sum(-1);
}

} // namespace amroute::envs
