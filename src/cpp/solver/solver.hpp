#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "decoder/decoder_config.hpp"
#include "decoder/environment.hpp"
#include "decoder/tensor_state.hpp"

namespace amroute::solver
{

struct SolveOptions
{
    DecoderConfig config;
    DecodeOptions decode;
    int64_t num_loc{20};
    int64_t batch_size{1};
    uint64_t seed{1234};
};

struct InstanceSolution
{
    std::vector<int64_t> actions;
    float reward{0.0F};
    /// Rollout that produced the solution (0 without multi-start).
    int64_t best_start{0};
};

struct SolveSummary
{
    std::string env_name;
    std::vector<InstanceSolution> solutions;
    int64_t steps{0};
    double elapsed_ms{0.0};
};

/// An environment together with the initial state of a batch of instances.
struct PreparedBatch
{
    std::shared_ptr<Environment> env;
    TensorState state;
};

/// Build the "tsp" or "cvrp" environment and reset it on the instances
/// ("locs", plus "demand" for cvrp). Throws ConfigError for other names.
PreparedBatch prepare_instances(const std::string& env_name, int64_t num_loc, const TensorState& instances);

/// Decode the given instances ("locs", plus "demand" for cvrp) with an
/// untrained decoder seeded by options.seed. In multi-start mode the best
/// rollout per instance is reported.
SolveSummary solve_instances(const SolveOptions& options, const TensorState& instances);

/// Same, on options.batch_size random instances of options.num_loc nodes.
SolveSummary solve_random(const SolveOptions& options);

} // namespace amroute::solver
