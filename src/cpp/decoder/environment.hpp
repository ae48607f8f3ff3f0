#pragma once

#include <string>

#include <torch/torch.h>

#include "tensor_state.hpp"

namespace amroute
{

/// Constraint-checking environment driven by the decoder.
///
/// A state produced by the environment carries at least:
///   action_mask [B, N] bool, true = node may be visited next
///   done        [B]    bool
/// The decoder sets "action" [B] int64 before every step().
class Environment
{
public:
    virtual ~Environment() = default;

    /// Selects the environment-specific context and dynamic embeddings.
    virtual const std::string& name() const = 0;

    /// Apply state["action"] and return the successor state. Must not modify
    /// the tensors of the input state.
    virtual TensorState step(const TensorState& state) const = 0;

    /// Terminal reward [B] from the final state and the actions [B, steps].
    virtual torch::Tensor getReward(const TensorState& state, const torch::Tensor& actions) const = 0;

    /// Node 0 is a depot and never a start node for multi-start decoding.
    virtual bool hasDepot() const { return false; }
};

} // namespace amroute
