#pragma once
#include <string>
#include <cstdint>

class EngineSettings
{
public:
    // where the grid for a run comes from
    enum class GridSource
    {
        Open,   // open grid with random costs and scattered obstacles
        Maze,   // recursive backtracker maze, start/goal at entrance/exit
        Image   // one pixel per cell, loaded through GridImage
    };

    static const char *gridSourceName(GridSource source)
    {
        switch (source)
        {
        case GridSource::Open:
            return "Open";
        case GridSource::Maze:
            return "Maze";
        case GridSource::Image:
            return "Image";
        default:
            return "Unknown";
        }
    }

    // grid settings. open grids stay small, branch and bound and A* keep every
    // self avoiding candidate and weighted open grids grow that pool quickly
    GridSource gridSource = GridSource::Maze;
    int rows = 12;
    int cols = 12;
    int defaultCost = 1;
    int minCost = 1;                 // random cost range for open grids
    int maxCost = 9;
    int obstacleCount = 6;           // random rectangles on open grids
    int obstacleMinSize = 1;
    int obstacleMaxSize = 3;
    int mazeCellsX = 8;              // logical maze cells (grid is 2n+1 wide)
    int mazeCellsY = 6;
    std::string imagePath;
    uint32_t seed = 1234;

    // search settings
    std::string strategy = "AStar";
    int startRow = 0;
    int startCol = 0;
    int goalRow = 11;
    int goalCol = 11;
    int maxIterations = 200000;      // 0 = strategy default (unbounded except greedy)

    // benchmark settings
    int trials = 3;                  // runs per strategy, times are averaged
    int benchmarkThreads = 0;        // 0 = one task per strategy
    int scalingLevels = 4;           // maze sizes in the scaling experiment

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();
};
