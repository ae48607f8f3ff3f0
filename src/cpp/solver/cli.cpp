#include "solver/cli.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "decoder/errors.hpp"

namespace amroute::solver
{

namespace
{

using FlagMap = std::unordered_map<std::string, std::string>;

bool is_flag(const char* arg)
{
    return arg[0] == '-' && arg[1] == '-';
}

bool parse_bool(std::string value, const std::string& name)
{
    static const std::unordered_map<std::string, bool> words = {
        {"1", true}, {"true", true}, {"yes", true}, {"on", true},
        {"0", false}, {"false", false}, {"no", false}, {"off", false},
    };
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = words.find(value);
    if (it == words.end())
    {
        throw ConfigError("Failed to parse boolean value for " + name + ": " + value);
    }
    return it->second;
}

// Whole-string numeric conversion; trailing characters are an error.
template <typename T, typename Convert>
T parse_number(const std::string& value, const std::string& name, const char* kind, Convert convert)
{
    size_t used = 0;
    T parsed{};
    try
    {
        parsed = convert(value, &used);
    }
    catch (const std::exception&)
    {
        used = 0;
    }
    if (used == 0 || used != value.size())
    {
        throw ConfigError(std::string("Failed to parse ") + kind + " value for " + name + ": " + value);
    }
    return parsed;
}

int64_t parse_int(const std::string& value, const std::string& name)
{
    return parse_number<int64_t>(value, name, "integer", [](const std::string& v, size_t* used) { return std::stoll(v, used); });
}

float parse_float(const std::string& value, const std::string& name)
{
    return parse_number<float>(value, name, "float", [](const std::string& v, size_t* used) { return std::stof(v, used); });
}

// Splits argv into flag -> value. A flag with no value that follows is a switch set to "true".
FlagMap parse_flags(int argc, char** argv)
{
    static const std::unordered_set<std::string> known = {
        "config", "env", "num-loc", "batch-size", "decode-type", "num-starts",
        "temperature", "embedding-dim", "num-heads", "seed", "verbose",
    };

    FlagMap flags;
    int i = 1;
    while (i < argc)
    {
        if (!is_flag(argv[i]))
        {
            throw ConfigError(std::string("Unexpected positional argument: ") + argv[i]);
        }
        const std::string key(argv[i] + 2);
        if (key.empty())
        {
            throw ConfigError("Empty flag encountered.");
        }
        if (known.count(key) == 0)
        {
            throw ConfigError("Unknown flag: --" + key);
        }
        const bool has_value = i + 1 < argc && !is_flag(argv[i + 1]);
        flags[key] = has_value ? argv[i + 1] : "true";
        i += has_value ? 2 : 1;
    }
    return flags;
}

const std::string* flag_value(const FlagMap& flags, const std::string& name)
{
    auto it = flags.find(name);
    return it == flags.end() ? nullptr : &it->second;
}

} // namespace

std::string usage()
{
    return "Usage: amroute_decode [--config PATH] [--env tsp|cvrp] [--num-loc N] [--batch-size B]\n"
           "                      [--decode-type greedy|sampling|multistart_greedy|multistart_sampling]\n"
           "                      [--num-starts S] [--temperature T] [--embedding-dim D] [--num-heads H]\n"
           "                      [--seed SEED] [--verbose]\n";
}

SolveOptions parse_cli(int argc, char** argv)
{
    const FlagMap flags = parse_flags(argc, argv);
    auto lookup = [&flags](const std::string& name) { return flag_value(flags, name); };

    SolveOptions options;

    if (auto path = lookup("config"))
    {
        options.config = loadDecoderConfig(*path);
    }
    if (auto env = lookup("env"))
    {
        options.config.env_name = *env;
    }
    if (auto dim = lookup("embedding-dim"))
    {
        options.config.embedding_dim = parse_int(*dim, "--embedding-dim");
    }
    if (auto heads = lookup("num-heads"))
    {
        options.config.num_heads = parse_int(*heads, "--num-heads");
    }
    if (auto num_loc = lookup("num-loc"))
    {
        options.num_loc = parse_int(*num_loc, "--num-loc");
    }
    if (auto batch = lookup("batch-size"))
    {
        options.batch_size = parse_int(*batch, "--batch-size");
    }
    if (auto decode_type = lookup("decode-type"))
    {
        options.decode.decode_type = *decode_type;
    }
    if (auto starts = lookup("num-starts"))
    {
        options.decode.num_starts = parse_int(*starts, "--num-starts");
    }
    if (auto temperature = lookup("temperature"))
    {
        options.decode.softmax_temp = parse_float(*temperature, "--temperature");
    }
    if (auto seed = lookup("seed"))
    {
        options.seed = static_cast<uint64_t>(parse_int(*seed, "--seed"));
    }
    if (auto verbose = lookup("verbose"))
    {
        options.decode.verbose = parse_bool(*verbose, "--verbose");
    }

    if (options.num_loc < 2)
    {
        throw ConfigError("--num-loc must be at least 2");
    }
    if (options.batch_size < 1)
    {
        throw ConfigError("--batch-size must be positive");
    }

    return options;
}

} // namespace amroute::solver
