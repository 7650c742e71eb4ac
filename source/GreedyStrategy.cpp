#include "SearchStrategy.h"
#include <algorithm>
#include <limits>
#include <random>
#include <vector>
#include <utility>

size_t GreedyStrategy::defaultIterationBudget(const Grid& grid) const {
    // the walk has no failure condition of its own, so it never runs unbounded
    return static_cast<size_t>(grid.cellCount()) * 4;
}

// greedy local descent: always step to the neighbour closest to the goal.
// no visited set, the walk may revisit cells and only the budget stops it
Path GreedyStrategy::run(const Grid& grid, const GridCell& start, const GridCell& goal,
                         SearchBudget& budget) const {
    std::mt19937 gen;
    if (seed_) {
        gen.seed(*seed_);
    } else {
        std::random_device rd;
        gen.seed(rd());
    }

    std::vector<GridCell> nodes;
    nodes.push_back(start);

    while (nodes.back() != goal) {
        budget.tick();

        std::vector<Tile> neighbors = grid.neighbors4(nodes.back());
        if (neighbors.empty()) {
            // boxed in, there is no move to make
            return Path();
        }

        int minDist = std::numeric_limits<int>::max();
        for (const Tile& tile : neighbors) {
            minDist = std::min(minDist, grid.manhattan(tile.pos, goal));
        }

        std::vector<GridCell> bestTiles;
        for (const Tile& tile : neighbors) {
            if (grid.manhattan(tile.pos, goal) == minDist) {
                bestTiles.push_back(tile.pos);
            }
        }

        // uniform pick among the tied neighbours
        std::uniform_int_distribution<size_t> pick(0, bestTiles.size() - 1);
        nodes.push_back(bestTiles[pick(gen)]);
    }

    return Path(std::move(nodes));
}
