#pragma once

#include <cstdint>
#include <string>

#include <torch/torch.h>

#include "decoder/environment.hpp"

namespace amroute::envs
{

/// Travelling salesman: visit every node once, return to the first node.
///
/// State fields:
///   locs [B, N, 2], first_node [B], current_node [B], i [B],
///   action_mask [B, N] (unvisited nodes), done [B]
class TspEnv : public amroute::Environment
{
public:
    explicit TspEnv(int64_t num_loc = 20);

    const std::string& name() const override { return name_; }

    /// Uniform random coordinates in [0, 1)^2: [batch_size, num_loc, 2].
    torch::Tensor generateLocs(int64_t batch_size) const;

    /// Initial state for the given coordinates [B, N, 2].
    TensorState reset(const torch::Tensor& locs) const;

    TensorState step(const TensorState& state) const override;

    /// Negative length of the closed tour [B]. Throws InfeasibleStepError if a
    /// row of actions is not a permutation of the nodes.
    torch::Tensor getReward(const TensorState& state, const torch::Tensor& actions) const override;

    int64_t numLoc() const { return num_loc_; }

private:
    std::string name_{"tsp"};
    int64_t num_loc_;
};

/// Sum of Euclidean distances along ordered locations [B, T, 2], closing the
/// loop back to the first location.
torch::Tensor tourLength(const torch::Tensor& ordered_locs);

} // namespace amroute::envs
