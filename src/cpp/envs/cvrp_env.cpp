#include "envs/cvrp_env.hpp"

#include "decoder/errors.hpp"
#include "envs/tsp_env.hpp"

namespace amroute::envs
{

namespace
{

// Tolerance for accumulated float demand against the capacity
constexpr double kCapacityEps = 1e-5;

} // anonymous namespace

CvrpEnv::CvrpEnv(int64_t num_loc)
    : num_loc_(num_loc)
{
    if (num_loc < 1)
        throw ConfigError("CvrpEnv: num_loc must be positive, got " + std::to_string(num_loc));
}

float CvrpEnv::capacityFor(int64_t num_loc)
{
    if (num_loc <= 10) return 20.0f;
    if (num_loc <= 20) return 30.0f;
    if (num_loc <= 50) return 40.0f;
    return 50.0f;
}

TensorState CvrpEnv::generate(int64_t batch_size) const
{
    TensorState instances(batch_size);
    instances.set("locs", torch::rand({batch_size, num_loc_ + 1, 2}));
    instances.set("demand", torch::randint(1, 10, {batch_size, num_loc_}, torch::kFloat) / capacityFor(num_loc_));
    return instances;
}

TensorState CvrpEnv::reset(const torch::Tensor& locs, const torch::Tensor& demand) const
{
    if (locs.dim() != 3 || locs.size(2) != 2 || demand.dim() != 2
        || demand.size(0) != locs.size(0) || demand.size(1) + 1 != locs.size(1))
    {
        throw ShapeError("CvrpEnv: expected locs [B, N+1, 2] and demand [B, N], got "
                         + shapeString(locs) + " and " + shapeString(demand));
    }
    if ((demand > 1.0 + kCapacityEps).any().item<bool>())
        throw InfeasibleStepError("CvrpEnv: a customer demand exceeds the vehicle capacity");

    const int64_t batch = locs.size(0);
    auto long_opts = torch::TensorOptions().dtype(torch::kLong).device(locs.device());
    auto bool_opts = torch::TensorOptions().dtype(torch::kBool).device(locs.device());
    auto float_opts = torch::TensorOptions().dtype(demand.dtype()).device(locs.device());

    auto current = torch::zeros({batch}, long_opts);
    auto used = torch::zeros({batch}, float_opts);
    auto capacity = torch::ones({batch}, float_opts);
    auto visited = torch::zeros({batch, locs.size(1)}, bool_opts);

    TensorState state(batch);
    state.set("locs", locs);
    state.set("demand", demand);
    state.set("current_node", current);
    state.set("used_capacity", used);
    state.set("vehicle_capacity", capacity);
    state.set("visited", visited);
    state.set("i", torch::zeros({batch}, long_opts));
    state.set("action_mask", actionMask(demand, used, capacity, visited, current));
    state.set("done", torch::zeros({batch}, bool_opts));
    return state;
}

TensorState CvrpEnv::step(const TensorState& state) const
{
    auto current = state.get("action");
    const auto& demand = state.get("demand");
    const auto& capacity = state.get("vehicle_capacity");
    const int64_t n_loc = demand.size(1);

    // Customer k is node k + 1; the depot has no demand and resets the load
    auto selected_demand = demand.gather(1, (current - 1).clamp(0, n_loc - 1).unsqueeze(-1)).squeeze(-1);
    auto at_customer = (current != 0).to(demand.dtype());
    auto used = (state.get("used_capacity") + selected_demand) * at_customer;

    auto visited = state.get("visited").scatter(-1, current.unsqueeze(-1), true);
    auto done = visited.narrow(1, 1, n_loc).all(-1);

    TensorState next = state;
    next.set("current_node", current);
    next.set("used_capacity", used);
    next.set("visited", visited);
    next.set("i", state.get("i") + 1);
    next.set("action_mask", actionMask(demand, used, capacity, visited, current));
    next.set("done", done);
    return next;
}

torch::Tensor CvrpEnv::actionMask(const torch::Tensor& demand, const torch::Tensor& used_capacity,
                                  const torch::Tensor& vehicle_capacity, const torch::Tensor& visited,
                                  const torch::Tensor& current_node)
{
    // Forbidden customers: already served, or not fitting the remaining load
    auto exceeds = (demand + used_capacity.unsqueeze(-1)) > (vehicle_capacity.unsqueeze(-1) + kCapacityEps);
    auto forbid_loc = visited.narrow(1, 1, demand.size(1)).logical_or(exceeds);

    // No depot-to-depot moves while some customer can still be served
    auto forbid_depot = (current_node == 0).logical_and(forbid_loc.logical_not().any(-1));

    return torch::cat({forbid_depot.unsqueeze(-1), forbid_loc}, -1).logical_not();
}

torch::Tensor CvrpEnv::getReward(const TensorState& state, const torch::Tensor& actions) const
{
    const auto& locs = state.get("locs");
    const int64_t batch = locs.size(0);
    if (actions.dim() != 2 || actions.size(0) != batch)
        throw ShapeError("CvrpEnv: actions " + shapeString(actions) + " do not match locs " + shapeString(locs));

    auto counts = torch::zeros({batch, locs.size(1)}, actions.options())
                      .scatter_add(1, actions, torch::ones_like(actions));
    if (!counts.narrow(1, 1, locs.size(1) - 1).eq(1).all().item<bool>())
        throw InfeasibleStepError("CvrpEnv: invalid solution, every customer must be visited exactly once");

    auto route = locs.gather(1, actions.unsqueeze(-1).expand({batch, actions.size(1), 2}));
    auto ordered = torch::cat({locs.narrow(1, 0, 1), route}, 1);
    return -tourLength(ordered);
}

} // namespace amroute::envs
