#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <torch/torch.h>

#include "environment.hpp"
#include "tensor_state.hpp"

namespace amroute
{

/// (probs [B, N], mask [B, N] true = forbidden, decode_type) -> actions [B] int64
using ActionSelector = std::function<torch::Tensor(const torch::Tensor& probs,
                                                   const torch::Tensor& mask,
                                                   const std::string& decode_type)>;

/// (state [B], num_starts, env) -> start actions [num_starts * B], starts-major
using StartNodeSelector = std::function<torch::Tensor(const TensorState& state,
                                                      int64_t num_starts,
                                                      const Environment& env)>;

/// True if decode_type requests multi-start decoding.
bool isMultistart(const std::string& decode_type);

/// Throws ConfigError unless decode_type contains "greedy" or "sampling".
void validateDecodeType(const std::string& decode_type);

/// Default action selection: argmax for "greedy" modes, multinomial for
/// "sampling" modes (rows that hit a forbidden node are resampled).
/// Throws InfeasibleStepError if greedy picks a forbidden node or probs
/// contain NaN.
torch::Tensor decodeProbs(const torch::Tensor& probs, const torch::Tensor& mask,
                          const std::string& decode_type);

/// Default multi-start seeding: rollout s of every instance starts at node
/// s (or s + 1 when node 0 is a depot). Throws ConfigError when the instance
/// has fewer than num_starts candidate nodes.
torch::Tensor selectStartNodes(const TensorState& state, int64_t num_starts, const Environment& env);

} // namespace amroute
