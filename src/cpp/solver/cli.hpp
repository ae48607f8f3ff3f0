#pragma once

#include <string>

#include "solver/solver.hpp"

namespace amroute::solver
{

/// Parse `--flag value` style arguments:
///   --config PATH        decoder config JSON, applied before the other flags
///   --env tsp|cvrp       --num-loc N          --batch-size B
///   --decode-type TYPE   --num-starts S       --temperature T
///   --embedding-dim D    --num-heads H        --seed SEED
///   --verbose [BOOL]
/// A flag without a value is read as "true". Throws ConfigError on unknown
/// flags or malformed values.
SolveOptions parse_cli(int argc, char** argv);

/// Text for --help.
std::string usage();

} // namespace amroute::solver
