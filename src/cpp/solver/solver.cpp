#include "solver/solver.hpp"

#include <algorithm>
#include <chrono>

#include "decoder/batch_ops.hpp"
#include "decoder/decoder_engine.hpp"
#include "decoder/env_embeddings.hpp"
#include "decoder/errors.hpp"
#include "envs/cvrp_env.hpp"
#include "envs/tsp_env.hpp"

namespace amroute::solver
{

PreparedBatch prepare_instances(const std::string& env_name, int64_t num_loc, const TensorState& instances)
{
    if (env_name == "tsp")
    {
        auto env = std::make_shared<envs::TspEnv>(num_loc);
        return {env, env->reset(instances.get("locs"))};
    }
    if (env_name == "cvrp")
    {
        auto env = std::make_shared<envs::CvrpEnv>(num_loc);
        return {env, env->reset(instances.get("locs"), instances.get("demand"))};
    }
    throw ConfigError("Unknown environment: " + env_name);
}

SolveSummary solve_instances(const SolveOptions& options, const TensorState& instances)
{
    auto t0 = std::chrono::high_resolution_clock::now();
    torch::NoGradGuard no_grad;
    torch::manual_seed(options.seed);

    auto [env, state] = prepare_instances(options.config.env_name, options.num_loc, instances);

    auto init_embedding = createInitEmbedding(env->name(), options.config.embedding_dim);
    Decoder decoder(env, options.config);
    decoder->eval();

    auto embeddings = init_embedding->forward(instances);
    DecodeOptions decode = options.decode;
    decode.calc_reward = true;
    auto result = decoder->forward(state, embeddings, decode);

    const int64_t batch = instances.batchSize();
    const int64_t starts = std::max<int64_t>(decode.num_starts, 1);

    // Rows are starts-major: rollout s of instance b sits at s * batch + b
    auto rewards = result.state.get("reward").to(torch::kCPU).to(torch::kFloat);
    auto per_start = starts > 1 ? unbatchify(rewards, starts) : rewards.unsqueeze(1);
    auto best = per_start.max(1);
    auto best_reward = std::get<0>(best);
    auto best_start = std::get<1>(best);
    auto actions = result.actions.to(torch::kCPU);

    SolveSummary summary;
    summary.env_name = env->name();
    summary.steps = result.steps;
    for (int64_t b = 0; b < batch; b++)
    {
        InstanceSolution solution;
        solution.best_start = best_start[b].item<int64_t>();
        solution.reward = best_reward[b].item<float>();

        auto row = actions[solution.best_start * batch + b].contiguous();
        const int64_t* data = row.data_ptr<int64_t>();
        solution.actions.assign(data, data + row.numel());
        summary.solutions.push_back(std::move(solution));
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    summary.elapsed_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    return summary;
}

SolveSummary solve_random(const SolveOptions& options)
{
    torch::manual_seed(options.seed);

    TensorState instances(options.batch_size);
    if (options.config.env_name == "tsp")
    {
        envs::TspEnv env(options.num_loc);
        instances.set("locs", env.generateLocs(options.batch_size));
    }
    else if (options.config.env_name == "cvrp")
    {
        envs::CvrpEnv env(options.num_loc);
        instances = env.generate(options.batch_size);
    }
    else
    {
        throw ConfigError("Unknown environment: " + options.config.env_name);
    }
    return solve_instances(options, instances);
}

} // namespace amroute::solver
