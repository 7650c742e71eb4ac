#include "SearchStrategy.h"
#include "PathArena.h"
#include <queue>
#include <vector>
#include <cstdint>

namespace {

// one candidate partial path in the pool
struct Candidate {
    int cost;        // accumulated cost including the start tile
    int length;      // cells on the partial path
    uint64_t order;  // insertion order, first inserted wins among equal keys
    int node;        // arena node the chain ends at
};

// min heap on (cost, length, order)
struct CandidateCompare {
    bool operator()(const Candidate& a, const Candidate& b) const {
        if (a.cost != b.cost) return a.cost > b.cost;
        if (a.length != b.length) return a.length > b.length;
        return a.order > b.order;
    }
};

}  // namespace

// branch and bound: always expand the globally cheapest partial path.
// paths are self avoiding but nothing is deduplicated across candidates,
// optimality comes only from the expansion order
Path BranchAndBoundStrategy::run(const Grid& grid, const GridCell& start, const GridCell& goal,
                                 SearchBudget& budget) const {
    PathArena arena;
    std::priority_queue<Candidate, std::vector<Candidate>, CandidateCompare> pool;
    uint64_t nextOrder = 0;

    pool.push({grid.get(start).cost, 1, nextOrder++, arena.addRoot(start)});

    while (!pool.empty()) {
        budget.tick();

        Candidate best = pool.top();
        pool.pop();

        const GridCell current = arena[best.node].cell;
        if (current == goal) {
            // costs only grow along a chain, so the first goal popped is optimal
            return Path(arena.reconstruct(best.node));
        }

        for (const Tile& neighbor : grid.neighbors4(current)) {
            if (arena.contains(best.node, neighbor.pos)) continue;

            int node = arena.extend(best.node, neighbor.pos);
            pool.push({best.cost + neighbor.cost, best.length + 1, nextOrder++, node});
        }
    }

    // pool exhausted without reaching the goal
    return Path();
}
