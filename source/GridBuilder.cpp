#include "GridBuilder.h"
#include "GridImage.h"
#include <iostream>

bool buildGrid(const EngineSettings &settings, Grid &grid, GridCell &start, GridCell &goal)
{
    start = {settings.startRow, settings.startCol};
    goal = {settings.goalRow, settings.goalCol};

    switch (settings.gridSource)
    {
    case EngineSettings::GridSource::Maze:
    {
        MazeEnds ends = grid.generateMaze(settings.mazeCellsX, settings.mazeCellsY, settings.seed);
        start = ends.entrance;
        goal = ends.exit;
        std::cout << "Generated " << grid.rows() << "x" << grid.cols() << " maze ("
                  << settings.mazeCellsX * settings.mazeCellsY << " maze cells)" << std::endl;
        return true;
    }
    case EngineSettings::GridSource::Image:
        if (!GridImage::load(settings.imagePath, grid, settings.maxCost))
            return false;
        if (!grid.inBounds(start) || !grid.inBounds(goal))
        {
            std::cerr << "Error: start/goal outside the " << grid.rows() << "x" << grid.cols()
                      << " image grid" << std::endl;
            return false;
        }
        return true;
    case EngineSettings::GridSource::Open:
    default:
        grid.resize(settings.rows, settings.cols);
        grid.randomizeCosts(settings.minCost, settings.maxCost, settings.seed);
        grid.generateRandomObstacles(settings.obstacleCount, settings.obstacleMinSize, settings.obstacleMaxSize,
                                     settings.seed, {start, goal});
        std::cout << "Generated " << grid.rows() << "x" << grid.cols() << " open grid, costs "
                  << settings.minCost << ".." << settings.maxCost << ", "
                  << settings.obstacleCount << " obstacles" << std::endl;
        return true;
    }
}
