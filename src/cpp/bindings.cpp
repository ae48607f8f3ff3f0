#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <vector>

#include "decoder/decoder_config.hpp"
#include "decoder/errors.hpp"
#include "solver/solver.hpp"

namespace py = pybind11;

namespace
{

torch::Tensor to_tensor(const std::vector<std::vector<float>>& rows, int64_t width, const char* name)
{
    if (rows.empty())
    {
        throw amroute::ConfigError(std::string(name) + " must not be empty");
    }
    auto tensor = torch::empty({static_cast<int64_t>(rows.size()), width}, torch::kFloat);
    auto acc = tensor.accessor<float, 2>();
    for (size_t i = 0; i < rows.size(); ++i)
    {
        if (static_cast<int64_t>(rows[i].size()) != width)
        {
            throw amroute::ConfigError(std::string(name) + " rows must have " + std::to_string(width) + " values");
        }
        for (int64_t j = 0; j < width; ++j)
        {
            acc[i][j] = rows[i][j];
        }
    }
    return tensor;
}

amroute::solver::SolveOptions make_options(const amroute::DecoderConfig& config,
                                           const std::string& decode_type,
                                           int64_t num_starts,
                                           std::optional<float> temperature,
                                           uint64_t seed)
{
    amroute::solver::SolveOptions options;
    options.config = config;
    options.decode.decode_type = decode_type;
    options.decode.num_starts = num_starts;
    options.decode.softmax_temp = temperature;
    options.seed = seed;
    return options;
}

py::dict summary_to_python(const amroute::solver::SolveSummary& summary)
{
    py::dict result;
    result["env"] = summary.env_name;
    result["steps"] = summary.steps;
    result["elapsed_ms"] = summary.elapsed_ms;

    py::list tours;
    py::list rewards;
    py::list best_starts;
    for (const auto& solution : summary.solutions)
    {
        tours.append(py::cast(solution.actions));
        rewards.append(solution.reward);
        best_starts.append(solution.best_start);
    }
    result["tours"] = std::move(tours);
    result["rewards"] = std::move(rewards);
    result["best_starts"] = std::move(best_starts);
    return result;
}

} // namespace

PYBIND11_MODULE(_amroute_cpp, m)
{
    m.doc() = "C++/libtorch Attention Model decoder for routing problems";

    py::register_exception<amroute::ConfigError>(m, "ConfigError", PyExc_ValueError);
    py::register_exception<amroute::ShapeError>(m, "ShapeError", PyExc_RuntimeError);
    py::register_exception<amroute::InfeasibleStepError>(m, "InfeasibleStepError", PyExc_RuntimeError);

    py::class_<amroute::DecoderConfig>(m, "DecoderConfig")
        .def(py::init<>())
        .def_readwrite("env_name", &amroute::DecoderConfig::env_name)
        .def_readwrite("embedding_dim", &amroute::DecoderConfig::embedding_dim)
        .def_readwrite("num_heads", &amroute::DecoderConfig::num_heads)
        .def_readwrite("tanh_clipping", &amroute::DecoderConfig::tanh_clipping)
        .def_readwrite("mask_inner", &amroute::DecoderConfig::mask_inner)
        .def_readwrite("mask_logits", &amroute::DecoderConfig::mask_logits)
        .def_readwrite("normalize", &amroute::DecoderConfig::normalize)
        .def_readwrite("softmax_temp", &amroute::DecoderConfig::softmax_temp);

    m.def("load_config", &amroute::loadDecoderConfig, py::arg("path"),
          "Read a DecoderConfig from a JSON file.");

    m.def(
        "solve_tsp",
        [](const std::vector<std::vector<float>>& locs,
           amroute::DecoderConfig config,
           const std::string& decode_type,
           int64_t num_starts,
           std::optional<float> temperature,
           uint64_t seed) {
            auto locs_tensor = to_tensor(locs, 2, "locs");
            config.env_name = "tsp";
            auto options = make_options(config, decode_type, num_starts, temperature, seed);
            options.num_loc = locs_tensor.size(0);

            amroute::TensorState instances(1);
            instances.set("locs", locs_tensor.unsqueeze(0));
            amroute::solver::SolveSummary summary;
            {
                py::gil_scoped_release release;
                summary = amroute::solver::solve_instances(options, instances);
            }
            return summary_to_python(summary);
        },
        py::arg("locs"),
        py::arg("config") = amroute::DecoderConfig(),
        py::arg("decode_type") = std::string("greedy"),
        py::arg("num_starts") = 0,
        py::arg("temperature") = py::none(),
        py::arg("seed") = 1234,
        "Decode a tour through the given [x, y] points with an untrained decoder.");

    m.def(
        "solve_cvrp",
        [](const std::vector<std::vector<float>>& locs,
           const std::vector<float>& demand,
           amroute::DecoderConfig config,
           const std::string& decode_type,
           int64_t num_starts,
           std::optional<float> temperature,
           uint64_t seed) {
            auto locs_tensor = to_tensor(locs, 2, "locs");
            if (static_cast<int64_t>(demand.size()) + 1 != locs_tensor.size(0))
            {
                throw amroute::ConfigError("demand needs one value per customer (locs minus the depot)");
            }
            config.env_name = "cvrp";
            auto options = make_options(config, decode_type, num_starts, temperature, seed);
            options.num_loc = static_cast<int64_t>(demand.size());

            amroute::TensorState instances(1);
            instances.set("locs", locs_tensor.unsqueeze(0));
            instances.set("demand", torch::tensor(demand, torch::kFloat).unsqueeze(0));
            amroute::solver::SolveSummary summary;
            {
                py::gil_scoped_release release;
                summary = amroute::solver::solve_instances(options, instances);
            }
            return summary_to_python(summary);
        },
        py::arg("locs"),
        py::arg("demand"),
        py::arg("config") = amroute::DecoderConfig(),
        py::arg("decode_type") = std::string("greedy"),
        py::arg("num_starts") = 0,
        py::arg("temperature") = py::none(),
        py::arg("seed") = 1234,
        "Decode CVRP routes. locs[0] is the depot; demand is normalised by vehicle capacity.");
}
