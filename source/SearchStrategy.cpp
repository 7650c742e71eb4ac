#include "SearchStrategy.h"
#include <chrono>
#include <stdexcept>

Path SearchStrategy::findPath(const Grid& grid, const GridCell& start, const GridCell& goal) const {
    return search(grid, start, goal).path;
}

SearchResult SearchStrategy::search(const Grid& grid, const GridCell& start, const GridCell& goal) const {
    auto startTime = std::chrono::high_resolution_clock::now();

    // fail fast on coordinates the grid cannot answer for
    if (!grid.inBounds(start)) {
        throw std::out_of_range(name_ + ": start (" + std::to_string(start.row) + "," +
                                std::to_string(start.col) + ") is outside the grid");
    }
    if (!grid.inBounds(goal)) {
        throw std::out_of_range(name_ + ": goal (" + std::to_string(goal.row) + "," +
                                std::to_string(goal.col) + ") is outside the grid");
    }

    SearchResult result;

    if (start == goal) {
        result.found = true;
        result.path = Path(std::vector<GridCell>{start});
        return result;
    }

    SearchBudget budget(name_, limits_, defaultIterationBudget(grid));
    result.path = run(grid, start, goal, budget);
    result.nodesExpanded = static_cast<int>(budget.iterations());
    result.found = !result.path.empty();
    if (result.found) {
        result.pathCost = result.path.moveCost(grid);
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    result.computeTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    return result;
}
