#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace amroute
{

/// Format a tensor shape as "[2, 3, 4]" for error messages.
std::string shapeString(const torch::Tensor& tensor);

/// Live state of a batch of problem instances: named tensors that all share
/// the leading batch dimension.
///
/// Owned by the environment. Copies are shallow (tensor handles are shared),
/// so environments must replace fields rather than modify them in place.
class TensorState
{
public:
    TensorState() = default;
    explicit TensorState(int64_t batch_size);

    int64_t batchSize() const { return batch_size_; }

    bool contains(const std::string& key) const;

    /// Throws ShapeError if the field is missing.
    const torch::Tensor& get(const std::string& key) const;

    /// Throws ShapeError if value is a scalar or its leading dimension
    /// differs from batchSize().
    void set(const std::string& key, torch::Tensor value);

    void erase(const std::string& key);

    std::vector<std::string> keys() const;

    /// Device of the action mask, or of the first field if there is none.
    torch::Device device() const;

private:
    int64_t batch_size_{0};
    std::map<std::string, torch::Tensor> fields_;
};

/// Read-only view used for scoring.
///
/// When num_starts > 1 the underlying state is laid out starts-major
/// (index = start * batch + instance) and every field is returned as a
/// (batch, num_starts, ...) view. Otherwise fields are returned unchanged.
class StateView
{
public:
    StateView(const TensorState& state, int64_t num_starts);

    bool contains(const std::string& key) const { return state_.contains(key); }

    torch::Tensor get(const std::string& key) const;

    bool expanded() const { return num_starts_ > 1; }
    int64_t numStarts() const { return num_starts_; }

    /// Number of original instances (expanded batch / num_starts).
    int64_t batchSize() const { return batch_size_; }

private:
    const TensorState& state_;
    int64_t num_starts_;
    int64_t batch_size_;
};

/// Write-once handle for the pending "action" field of a state.
class PendingAction
{
public:
    explicit PendingAction(TensorState& state) : state_(state) {}

    /// Sets state["action"]. The action must be an integer tensor of shape
    /// (batch,). A second call throws std::logic_error.
    void assign(torch::Tensor action);

private:
    TensorState& state_;
    bool assigned_{false};
};

/// Replicate every field num_starts times along the batch dimension,
/// starts-major. No-op when num_starts <= 1.
TensorState batchify(const TensorState& state, int64_t num_starts);

} // namespace amroute
