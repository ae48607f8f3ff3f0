#include "tensor_state.hpp"

#include <sstream>
#include <stdexcept>

#include "batch_ops.hpp"
#include "errors.hpp"

namespace amroute
{

std::string shapeString(const torch::Tensor& tensor)
{
    if (!tensor.defined())
        return "<undefined>";
    std::ostringstream out;
    out << tensor.sizes();
    return out.str();
}

// ============================================================================
// TensorState
// ============================================================================

TensorState::TensorState(int64_t batch_size)
    : batch_size_(batch_size)
{
    if (batch_size < 0)
        throw ShapeError("TensorState: negative batch size " + std::to_string(batch_size));
}

bool TensorState::contains(const std::string& key) const
{
    return fields_.find(key) != fields_.end();
}

const torch::Tensor& TensorState::get(const std::string& key) const
{
    auto it = fields_.find(key);
    if (it == fields_.end())
        throw ShapeError("TensorState: missing field '" + key + "'");
    return it->second;
}

void TensorState::set(const std::string& key, torch::Tensor value)
{
    if (!value.defined() || value.dim() == 0)
        throw ShapeError("TensorState: field '" + key + "' must have a batch dimension");
    if (value.size(0) != batch_size_)
    {
        throw ShapeError("TensorState: field '" + key + "' has shape " + shapeString(value)
                         + ", expected leading dimension " + std::to_string(batch_size_));
    }
    fields_[key] = std::move(value);
}

void TensorState::erase(const std::string& key)
{
    fields_.erase(key);
}

std::vector<std::string> TensorState::keys() const
{
    std::vector<std::string> result;
    result.reserve(fields_.size());
    for (const auto& [key, value] : fields_)
        result.push_back(key);
    return result;
}

torch::Device TensorState::device() const
{
    auto it = fields_.find("action_mask");
    if (it != fields_.end())
        return it->second.device();
    if (!fields_.empty())
        return fields_.begin()->second.device();
    return torch::Device(torch::kCPU);
}

// ============================================================================
// StateView / PendingAction
// ============================================================================

StateView::StateView(const TensorState& state, int64_t num_starts)
    : state_(state)
    , num_starts_(num_starts > 1 ? num_starts : 0)
    , batch_size_(state.batchSize())
{
    if (num_starts_ > 1)
    {
        if (state.batchSize() % num_starts_ != 0)
        {
            throw ShapeError("StateView: batch size " + std::to_string(state.batchSize())
                             + " is not a multiple of num_starts=" + std::to_string(num_starts_));
        }
        batch_size_ = state.batchSize() / num_starts_;
    }
}

torch::Tensor StateView::get(const std::string& key) const
{
    return unbatchify(state_.get(key), num_starts_);
}

void PendingAction::assign(torch::Tensor action)
{
    if (assigned_)
        throw std::logic_error("PendingAction: action already assigned for this step");
    if (!action.defined() || action.dim() != 1 || action.size(0) != state_.batchSize())
    {
        throw ShapeError("PendingAction: expected action of shape [" + std::to_string(state_.batchSize())
                         + "], got " + shapeString(action));
    }
    if (action.is_floating_point() || action.scalar_type() == torch::kBool)
        throw ShapeError("PendingAction: action must be an integer tensor");

    state_.set("action", action.to(torch::kLong));
    assigned_ = true;
}

TensorState batchify(const TensorState& state, int64_t num_starts)
{
    if (num_starts <= 1)
        return state;

    TensorState expanded(state.batchSize() * num_starts);
    for (const auto& key : state.keys())
        expanded.set(key, batchify(state.get(key), num_starts));
    return expanded;
}

} // namespace amroute
