#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace amroute
{

/// Model hyper-parameters of the decoder. Defaults follow the Attention Model.
struct DecoderConfig
{
    std::string env_name{"tsp"};
    int64_t embedding_dim{128};
    int64_t num_heads{8};

    // LogitAttention
    float tanh_clipping{10.0f};
    bool mask_inner{true};
    bool mask_logits{true};
    bool normalize{true};
    float softmax_temp{1.0f};
};

/// Per-call decoding options.
struct DecodeOptions
{
    /// "sampling", "greedy", "multistart_greedy" or "multistart_sampling".
    std::string decode_type{"sampling"};
    /// Overrides DecoderConfig::softmax_temp for this call.
    std::optional<float> softmax_temp;
    /// 0 or 1: one rollout per instance. >1: parallel rollouts per instance.
    int64_t num_starts{0};
    bool calc_reward{true};
    bool verbose{false};
};

/// Load a DecoderConfig from a flat JSON object, e.g.
///   {"env_name": "cvrp", "embedding_dim": 64, "num_heads": 4, "tanh_clipping": 10.0}
/// Keys that are absent keep their defaults. Throws ConfigError on an
/// unreadable file or a malformed value.
DecoderConfig loadDecoderConfig(const std::string& path);

/// Same as loadDecoderConfig, from an in-memory JSON string.
DecoderConfig parseDecoderConfig(const std::string& json);

} // namespace amroute
