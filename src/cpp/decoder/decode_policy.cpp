#include "decode_policy.hpp"

#include <iostream>

#include "errors.hpp"

namespace amroute
{

namespace
{

constexpr int kMaxResamples = 100;

bool selectsForbidden(const torch::Tensor& mask, const torch::Tensor& selected)
{
    return mask.gather(1, selected.unsqueeze(-1)).any().item<bool>();
}

} // anonymous namespace

bool isMultistart(const std::string& decode_type)
{
    return decode_type.find("multistart") != std::string::npos;
}

void validateDecodeType(const std::string& decode_type)
{
    if (decode_type.find("greedy") == std::string::npos
        && decode_type.find("sampling") == std::string::npos)
    {
        throw ConfigError("Unknown decode type: " + decode_type);
    }
}

torch::Tensor decodeProbs(const torch::Tensor& probs, const torch::Tensor& mask,
                          const std::string& decode_type)
{
    if (probs.dim() != 2 || mask.sizes() != probs.sizes())
        throw ShapeError("decodeProbs: probs " + shapeString(probs) + " and mask "
                         + shapeString(mask) + " must both be [B, N]");
    if (torch::isnan(probs).any().item<bool>())
        throw InfeasibleStepError("decodeProbs: probabilities contain NaN");

    if (decode_type.find("greedy") != std::string::npos)
    {
        auto selected = std::get<1>(probs.max(1));
        if (selectsForbidden(mask, selected))
            throw InfeasibleStepError("Decode greedy: infeasible action has maximum probability");
        return selected;
    }

    if (decode_type.find("sampling") != std::string::npos)
    {
        auto selected = torch::multinomial(probs, 1).squeeze(1);
        int attempts = 0;
        while (selectsForbidden(mask, selected))
        {
            if (++attempts > kMaxResamples)
                throw InfeasibleStepError("Decode sampling: could not sample a feasible action");
            std::cerr << "[decodeProbs] Sampled bad values, resampling!" << std::endl;
            selected = torch::multinomial(probs, 1).squeeze(1);
        }
        return selected;
    }

    throw ConfigError("Unknown decode type: " + decode_type);
}

torch::Tensor selectStartNodes(const TensorState& state, int64_t num_starts, const Environment& env)
{
    const int64_t num_nodes = state.get("action_mask").size(-1);
    const int64_t offset = env.hasDepot() ? 1 : 0;
    const int64_t candidates = num_nodes - offset;

    if (num_starts > candidates)
    {
        throw ConfigError("Multi-start decoding needs " + std::to_string(num_starts)
                          + " distinct start nodes but " + env.name() + " instances have only "
                          + std::to_string(candidates));
    }

    auto opts = torch::TensorOptions().dtype(torch::kLong).device(state.device());
    return torch::arange(num_starts, opts).repeat_interleave(state.batchSize()) % candidates + offset;
}

} // namespace amroute
