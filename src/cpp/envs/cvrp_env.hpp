#pragma once

#include <cstdint>
#include <string>

#include <torch/torch.h>

#include "decoder/environment.hpp"

namespace amroute::envs
{

/// Capacitated vehicle routing with a single depot at node 0.
///
/// Demands are normalised by the vehicle capacity, so the vehicle capacity
/// is 1. The vehicle returns to the depot to reload.
///
/// State fields:
///   locs [B, N+1, 2], demand [B, N], current_node [B], used_capacity [B],
///   vehicle_capacity [B], visited [B, N+1], i [B], action_mask [B, N+1], done [B]
class CvrpEnv : public amroute::Environment
{
public:
    explicit CvrpEnv(int64_t num_loc = 20);

    const std::string& name() const override { return name_; }

    bool hasDepot() const override { return true; }

    /// Random instance: "locs" [B, N+1, 2] and "demand" [B, N], integer
    /// demands in 1..9 divided by the capacity for this instance size.
    TensorState generate(int64_t batch_size) const;

    TensorState reset(const torch::Tensor& locs, const torch::Tensor& demand) const;

    TensorState step(const TensorState& state) const override;

    /// Negative route length [B] including the legs from and back to the
    /// depot. Throws InfeasibleStepError if a customer is not visited exactly once.
    torch::Tensor getReward(const TensorState& state, const torch::Tensor& actions) const override;

    int64_t numLoc() const { return num_loc_; }

    /// Vehicle capacity used to normalise demands for a given instance size.
    static float capacityFor(int64_t num_loc);

private:
    static torch::Tensor actionMask(const torch::Tensor& demand, const torch::Tensor& used_capacity,
                                    const torch::Tensor& vehicle_capacity, const torch::Tensor& visited,
                                    const torch::Tensor& current_node);

    std::string name_{"cvrp"};
    int64_t num_loc_;
};

} // namespace amroute::envs
