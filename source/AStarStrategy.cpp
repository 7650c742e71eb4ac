#include "SearchStrategy.h"
#include "PathArena.h"
#include <queue>
#include <vector>
#include <cstdint>

namespace {

struct OpenEntry {
    int gCost;       // accumulated cost including the start tile
    int hCost;       // manhattan distance to the goal, fixed when the entry is made
    int length;      // cells on the partial path
    uint64_t order;  // insertion order
    int node;        // arena node the chain ends at

    int fCost() const { return gCost + hCost; }
};

// min heap on (g + h, length, order)
struct OpenEntryCompare {
    bool operator()(const OpenEntry& a, const OpenEntry& b) const {
        if (a.fCost() != b.fCost()) return a.fCost() > b.fCost();
        if (a.length != b.length) return a.length > b.length;
        return a.order > b.order;
    }
};

}  // namespace

// A*: same pool structure as branch and bound, ordered by g + h.
// no closed set, duplicate cells with different costs can sit in the pool
// together and the admissible heuristic makes the cheapest one surface first
Path AStarStrategy::run(const Grid& grid, const GridCell& start, const GridCell& goal,
                        SearchBudget& budget) const {
    PathArena arena;
    std::priority_queue<OpenEntry, std::vector<OpenEntry>, OpenEntryCompare> open;
    uint64_t nextOrder = 0;

    open.push({grid.get(start).cost, grid.manhattan(start, goal), 1, nextOrder++, arena.addRoot(start)});

    // main A* loop: pop lowest f entry, expand neighbours
    while (!open.empty()) {
        budget.tick();

        OpenEntry best = open.top();
        open.pop();

        const GridCell current = arena[best.node].cell;
        if (current == goal) {
            return Path(arena.reconstruct(best.node));
        }

        for (const Tile& neighbor : grid.neighbors4(current)) {
            if (arena.contains(best.node, neighbor.pos)) continue;

            int node = arena.extend(best.node, neighbor.pos);
            open.push({best.gCost + neighbor.cost,
                       grid.manhattan(neighbor.pos, goal),  // fresh h for the successor
                       best.length + 1,
                       nextOrder++,
                       node});
        }
    }

    return Path();
}
