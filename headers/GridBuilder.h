#pragma once
#include "EngineSettings.h"
#include "Grid.h"

// builds the grid described by settings and fills in start/goal.
// maze grids use the maze entrance and exit, the other sources use the
// configured endpoints. returns false when the grid could not be built
bool buildGrid(const EngineSettings &settings, Grid &grid, GridCell &start, GridCell &goal);
