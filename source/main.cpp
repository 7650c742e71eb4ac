#include <iostream>
#include <string>
#include <cstring>
#include <exception>
#include <memory>

#include "EngineSettings.h"
#include "Grid.h"
#include "GridBuilder.h"
#include "Path.h"
#include "StrategyRegistry.h"
#include "BenchmarkRunner.h"

// what main should do after the arguments are read
enum class RunMode
{
    Single = 1,     // one strategy, print the route
    Benchmark = 2,  // every strategy on the same grid
    Scaling = 3     // growing mazes, time ratios per strategy
};

static void printUsage(const char *program)
{
    std::cout << "usage: " << program << " [options]\n"
              << "  --config <file>        load key=value settings\n"
              << "  --save-config <file>   write the effective settings and exit\n"
              << "  --strategy <name>      one of: ";
    const auto &names = availableStrategies();
    for (size_t i = 0; i < names.size(); ++i)
    {
        std::cout << names[i] << (i + 1 < names.size() ? ", " : "\n");
    }
    std::cout << "  --maze                 search a generated maze (default)\n"
              << "  --open                 search an open grid with random costs and obstacles\n"
              << "  --image <file>         build the grid from an image\n"
              << "  --benchmark            run every strategy and print a comparison\n"
              << "  --scaling              run the maze scaling experiment\n"
              << "  --help                 show this message" << std::endl;
}

static int runSingle(const EngineSettings &settings, const Grid &grid, const GridCell &start, const GridCell &goal)
{
    std::unique_ptr<SearchStrategy> strategy = createAgent(settings.strategy);

    SearchLimits limits;
    limits.maxIterations = static_cast<size_t>(settings.maxIterations);
    strategy->setLimits(limits);

    SearchResult result = strategy->search(grid, start, goal);

    std::cout << strategy->name() << " from (" << start.row << "," << start.col << ") to ("
              << goal.row << "," << goal.col << ")" << std::endl;
    if (!result.found)
    {
        std::cout << "No route found (" << result.nodesExpanded << " iterations, "
                  << result.computeTimeMs << " ms)" << std::endl;
        return 2;
    }

    std::cout << "Route: " << result.path.toString() << std::endl;
    std::cout << "Moves: " << result.path.moveCount() << ", cost: " << result.pathCost
              << ", iterations: " << result.nodesExpanded << ", time: " << result.computeTimeMs
              << " ms" << std::endl;
    return 0;
}

int main(int argc, char *argv[])
{
    EngineSettings settings;
    RunMode mode = RunMode::Single;
    std::string saveConfigPath;
    std::string strategyOverride;
    bool mazeOverride = false;
    bool openOverride = false;
    std::string imageOverride;

    for (int i = 1; i < argc; ++i)
    {
        const char *arg = argv[i];
        bool hasValue = (i + 1 < argc);

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (std::strcmp(arg, "--config") == 0 && hasValue)
        {
            if (!settings.loadFromFile(argv[++i]))
                return 1;
        }
        else if (std::strcmp(arg, "--save-config") == 0 && hasValue)
            saveConfigPath = argv[++i];
        else if (std::strcmp(arg, "--strategy") == 0 && hasValue)
            strategyOverride = argv[++i];
        else if (std::strcmp(arg, "--image") == 0 && hasValue)
            imageOverride = argv[++i];
        else if (std::strcmp(arg, "--maze") == 0)
            mazeOverride = true;
        else if (std::strcmp(arg, "--open") == 0)
            openOverride = true;
        else if (std::strcmp(arg, "--benchmark") == 0)
            mode = RunMode::Benchmark;
        else if (std::strcmp(arg, "--scaling") == 0)
            mode = RunMode::Scaling;
        else
        {
            std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // command line wins over the config file
    if (!strategyOverride.empty())
        settings.strategy = strategyOverride;
    if (mazeOverride)
        settings.gridSource = EngineSettings::GridSource::Maze;
    if (openOverride)
        settings.gridSource = EngineSettings::GridSource::Open;
    if (!imageOverride.empty())
    {
        settings.gridSource = EngineSettings::GridSource::Image;
        settings.imagePath = imageOverride;
    }
    settings.validateAndClamp();

    if (!saveConfigPath.empty())
    {
        if (!settings.saveToFile(saveConfigPath))
            return 1;
        std::cout << "Settings written to " << saveConfigPath << std::endl;
        return 0;
    }

    try
    {
        if (mode == RunMode::Scaling)
        {
            BenchmarkRunner runner(static_cast<size_t>(settings.benchmarkThreads));
            runner.setTrials(settings.trials);
            runner.setMaxIterations(static_cast<size_t>(settings.maxIterations));
            runner.setGreedySeed(settings.seed);
            runner.runScalingExperiment(settings.scalingLevels, settings.seed);
            runner.printScalingReport(std::cout);
            return 0;
        }

        Grid grid(settings.rows, settings.cols, settings.defaultCost);
        GridCell start{0, 0};
        GridCell goal{0, 0};
        if (!buildGrid(settings, grid, start, goal))
            return 1;

        if (mode == RunMode::Benchmark)
        {
            BenchmarkRunner runner(static_cast<size_t>(settings.benchmarkThreads));
            runner.setTrials(settings.trials);
            runner.setMaxIterations(static_cast<size_t>(settings.maxIterations));
            runner.setGreedySeed(settings.seed);
            runner.run(grid, start, goal);
            runner.printReport(std::cout);
            return 0;
        }

        return runSingle(settings, grid, start, goal);
    }
    catch (const UnknownStrategyError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const SearchAborted &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 3;
    }
    catch (const std::exception &e)
    {
        // out of range endpoints, bad cost ranges
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
