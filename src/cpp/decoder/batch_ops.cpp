#include "batch_ops.hpp"

#include <vector>

#include "errors.hpp"
#include "tensor_state.hpp"

namespace amroute
{

torch::Tensor batchify(const torch::Tensor& x, int64_t num_starts)
{
    if (num_starts <= 1)
        return x;
    if (x.dim() < 1)
        throw ShapeError("batchify: expected a batched tensor, got a scalar");

    std::vector<int64_t> expanded{num_starts};
    std::vector<int64_t> flat{num_starts * x.size(0)};
    for (int64_t d = 0; d < x.dim(); d++)
    {
        expanded.push_back(x.size(d));
        if (d > 0) flat.push_back(x.size(d));
    }
    return x.unsqueeze(0).expand(expanded).contiguous().view(flat);
}

torch::Tensor unbatchify(const torch::Tensor& x, int64_t num_starts)
{
    if (num_starts <= 1)
        return x;
    if (x.dim() < 1 || x.size(0) % num_starts != 0)
    {
        throw ShapeError("unbatchify: leading dimension of " + shapeString(x)
                         + " is not a multiple of num_starts=" + std::to_string(num_starts));
    }

    std::vector<int64_t> split{num_starts, x.size(0) / num_starts};
    for (int64_t d = 1; d < x.dim(); d++)
        split.push_back(x.size(d));
    // [S, B, ...] -> [B, S, ...]
    return x.view(split).transpose(0, 1);
}

torch::Tensor foldStarts(const torch::Tensor& x)
{
    if (x.dim() < 2)
        throw ShapeError("foldStarts: expected (batch, starts, ...), got " + shapeString(x));

    std::vector<int64_t> flat{x.size(0) * x.size(1)};
    for (int64_t d = 2; d < x.dim(); d++)
        flat.push_back(x.size(d));
    // Order matters: rows must come out starts-major, like batchify.
    return x.transpose(0, 1).reshape(flat);
}

torch::Tensor gatherByIndex(const torch::Tensor& src, const torch::Tensor& index)
{
    if (src.dim() != 3)
        throw ShapeError("gatherByIndex: expected src (batch, nodes, dim), got " + shapeString(src));
    if (index.dim() < 1 || index.dim() > 2 || index.size(0) != src.size(0))
    {
        throw ShapeError("gatherByIndex: index " + shapeString(index)
                         + " does not match src " + shapeString(src));
    }

    const int64_t dim = src.size(2);
    auto idx = index.to(torch::kLong);
    if (idx.dim() == 1)
    {
        auto gathered = src.gather(1, idx.view({-1, 1, 1}).expand({src.size(0), 1, dim}));
        return gathered.squeeze(1);
    }
    return src.gather(1, idx.unsqueeze(-1).expand({idx.size(0), idx.size(1), dim}));
}

} // namespace amroute
