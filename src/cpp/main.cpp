#include <cstring>
#include <iostream>
#include <string_view>

#include "solver/cli.hpp"
#include "solver/solver.hpp"

namespace
{

void print_summary(std::string_view label, const amroute::solver::SolveSummary& summary)
{
    std::cout << label << " " << summary.solutions.size() << " instances, " << summary.steps
              << " steps, " << summary.elapsed_ms << " ms" << '\n';

    for (size_t i = 0; i < summary.solutions.size(); ++i)
    {
        const auto& solution = summary.solutions[i];
        std::cout << "  #" << i << " reward " << solution.reward;
        if (solution.best_start > 0)
        {
            std::cout << " (start " << solution.best_start << ")";
        }
        std::cout << ":";
        for (const auto node : solution.actions)
        {
            std::cout << ' ' << node;
        }
        std::cout << '\n';
    }
}

} // namespace

int main(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--help") == 0)
        {
            std::cout << amroute::solver::usage();
            return 0;
        }
    }

    try
    {
        auto options = amroute::solver::parse_cli(argc, argv);
        auto summary = amroute::solver::solve_random(options);
        print_summary("[" + summary.env_name + "]", summary);
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
