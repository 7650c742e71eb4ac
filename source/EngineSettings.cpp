#include "EngineSettings.h"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>
#include <limits>

// stoul wraps "-1" around instead of failing, and unsigned long is wider than the seed
static uint32_t parseSeed(const std::string &value)
{
    size_t first = value.find_first_not_of(" \t");
    if (first != std::string::npos && value[first] == '-')
        throw std::invalid_argument("negative seed");

    unsigned long parsed = std::stoul(value);
    if (parsed > std::numeric_limits<uint32_t>::max())
        throw std::out_of_range("seed does not fit 32 bits");
    return static_cast<uint32_t>(parsed);
}

bool EngineSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# gridroute settings\n";
    file << "gridSource=" << static_cast<int>(gridSource) << "\n";
    file << "rows=" << rows << "\n";
    file << "cols=" << cols << "\n";
    file << "defaultCost=" << defaultCost << "\n";
    file << "minCost=" << minCost << "\n";
    file << "maxCost=" << maxCost << "\n";
    file << "obstacleCount=" << obstacleCount << "\n";
    file << "obstacleMinSize=" << obstacleMinSize << "\n";
    file << "obstacleMaxSize=" << obstacleMaxSize << "\n";
    file << "mazeCellsX=" << mazeCellsX << "\n";
    file << "mazeCellsY=" << mazeCellsY << "\n";
    file << "imagePath=" << imagePath << "\n";
    file << "seed=" << seed << "\n";
    file << "strategy=" << strategy << "\n";
    file << "startRow=" << startRow << "\n";
    file << "startCol=" << startCol << "\n";
    file << "goalRow=" << goalRow << "\n";
    file << "goalCol=" << goalCol << "\n";
    file << "maxIterations=" << maxIterations << "\n";
    file << "trials=" << trials << "\n";
    file << "benchmarkThreads=" << benchmarkThreads << "\n";
    file << "scalingLevels=" << scalingLevels << "\n";

    return true;
}

bool EngineSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        ++lineNumber;
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        try
        {
            if (key == "gridSource")
                gridSource = static_cast<GridSource>(std::clamp(std::stoi(value), 0, 2));
            else if (key == "rows")
                rows = std::stoi(value);
            else if (key == "cols")
                cols = std::stoi(value);
            else if (key == "defaultCost")
                defaultCost = std::stoi(value);
            else if (key == "minCost")
                minCost = std::stoi(value);
            else if (key == "maxCost")
                maxCost = std::stoi(value);
            else if (key == "obstacleCount")
                obstacleCount = std::stoi(value);
            else if (key == "obstacleMinSize")
                obstacleMinSize = std::stoi(value);
            else if (key == "obstacleMaxSize")
                obstacleMaxSize = std::stoi(value);
            else if (key == "mazeCellsX")
                mazeCellsX = std::stoi(value);
            else if (key == "mazeCellsY")
                mazeCellsY = std::stoi(value);
            else if (key == "imagePath")
                imagePath = value;
            else if (key == "seed")
                seed = parseSeed(value);
            else if (key == "strategy")
                strategy = value;
            else if (key == "startRow")
                startRow = std::stoi(value);
            else if (key == "startCol")
                startCol = std::stoi(value);
            else if (key == "goalRow")
                goalRow = std::stoi(value);
            else if (key == "goalCol")
                goalCol = std::stoi(value);
            else if (key == "maxIterations")
                maxIterations = std::stoi(value);
            else if (key == "trials")
                trials = std::stoi(value);
            else if (key == "benchmarkThreads")
                benchmarkThreads = std::stoi(value);
            else if (key == "scalingLevels")
                scalingLevels = std::stoi(value);
            else
                std::cerr << "Warning: Unknown setting '" << key << "' on line " << lineNumber << std::endl;
        }
        catch (const std::logic_error &)
        {
            // std::invalid_argument and std::out_of_range from the number parsers
            std::cerr << "Error: Bad value for '" << key << "' on line " << lineNumber
                      << " of " << filename << ": " << value << std::endl;
            return false;
        }
    }

    validateAndClamp();
    return true;
}

void EngineSettings::validateAndClamp()
{
    rows = std::clamp(rows, 1, 4096);
    cols = std::clamp(cols, 1, 4096);
    defaultCost = std::max(0, defaultCost);
    minCost = std::max(0, minCost);
    maxCost = std::max(minCost, maxCost);
    obstacleCount = std::max(0, obstacleCount);
    obstacleMinSize = std::max(1, obstacleMinSize);
    obstacleMaxSize = std::max(obstacleMinSize, obstacleMaxSize);
    mazeCellsX = std::clamp(mazeCellsX, 1, 2047);
    mazeCellsY = std::clamp(mazeCellsY, 1, 2047);
    maxIterations = std::max(0, maxIterations);
    trials = std::clamp(trials, 1, 1000);
    benchmarkThreads = std::max(0, benchmarkThreads);
    scalingLevels = std::clamp(scalingLevels, 1, 8);

    // endpoints stay on the open grid, image grids are checked once loaded
    if (gridSource == GridSource::Open)
    {
        startRow = std::clamp(startRow, 0, rows - 1);
        startCol = std::clamp(startCol, 0, cols - 1);
        goalRow = std::clamp(goalRow, 0, rows - 1);
        goalCol = std::clamp(goalCol, 0, cols - 1);
    }

    if (strategy.empty())
    {
        strategy = "AStar";
    }
}
