#pragma once

#include <cstdint>

#include <torch/torch.h>

namespace amroute
{

// Multi-start batch layout
// ------------------------
// An expanded batch of B instances with S starts stores rollout s of
// instance b at row s * B + b ("starts-major"). The seeding step, the
// per-step state views and the folding of log-probabilities all go through
// the three functions below so the convention lives in one place.

/// (B, ...) -> (S*B, ...), starts-major copy. Identity when num_starts <= 1.
torch::Tensor batchify(const torch::Tensor& x, int64_t num_starts);

/// (S*B, ...) -> (B, S, ...) view. Identity when num_starts <= 1.
/// Throws ShapeError if the leading dimension is not a multiple of num_starts.
torch::Tensor unbatchify(const torch::Tensor& x, int64_t num_starts);

/// (B, S, ...) -> (S*B, ...), starts-major. Inverse of unbatchify.
torch::Tensor foldStarts(const torch::Tensor& x);

/// Gather rows of src (B, N, D) by index (B,) -> (B, D) or (B, K) -> (B, K, D).
torch::Tensor gatherByIndex(const torch::Tensor& src, const torch::Tensor& index);

} // namespace amroute
