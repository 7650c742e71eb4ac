#include "SearchStrategy.h"
#include <algorithm>
#include <unordered_set>
#include <vector>
#include <utility>

namespace {

// fixed direction priority for ties on cost: east, south, west, north
int directionPriority(const GridCell& from, const GridCell& to) {
    int dr = to.row - from.row;
    int dc = to.col - from.col;
    if (dr == 0 && dc == 1) return 0;   // east
    if (dr == 1 && dc == 0) return 1;   // south
    if (dr == 0 && dc == -1) return 2;  // west
    return 3;                           // north
}

}  // namespace

// dfs keeps the in progress path as its stack. visited marks are permanent,
// a cell is never entered twice even after backtracking past it, so the
// search always terminates on a finite grid
Path DepthFirstStrategy::run(const Grid& grid, const GridCell& start, const GridCell& goal,
                             SearchBudget& budget) const {
    std::vector<GridCell> nodes;
    nodes.push_back(start);

    std::unordered_set<GridCell, GridCellHash> visited;
    visited.insert(start);

    while (!nodes.empty() && nodes.back() != goal) {
        budget.tick();

        const GridCell current = nodes.back();

        std::vector<Tile> candidates;
        for (const Tile& tile : grid.neighbors4(current)) {
            if (visited.find(tile.pos) == visited.end()) {
                candidates.push_back(tile);
            }
        }

        if (candidates.empty()) {
            nodes.pop_back();  // dead end, backtrack
            continue;
        }

        // cheapest tile first, direction priority breaks ties
        auto best = std::min_element(candidates.begin(), candidates.end(),
                                     [&current](const Tile& a, const Tile& b) {
                                         if (a.cost != b.cost) return a.cost < b.cost;
                                         return directionPriority(current, a.pos) <
                                                directionPriority(current, b.pos);
                                     });

        nodes.push_back(best->pos);
        visited.insert(best->pos);
    }

    // an emptied stack is the "not found" result
    return Path(std::move(nodes));
}
