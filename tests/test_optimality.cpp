#include <doctest/doctest.h>

#include "SearchStrategy.h"
#include "TestGrids.h"

TEST_CASE("Optimality/cost matches brute force on 4x4 corner to corner") {
    const GridCell start{0, 0};
    const GridCell goal{3, 3};

    for (uint32_t seed = 1; seed <= 40; ++seed) {
        CAPTURE(seed);
        Grid grid = testgrids::randomWeighted(4, 4, seed, 9, 0.2, {start, goal});
        const int best = testgrids::bruteForceMinCost(grid, start, goal);

        Path bnb = BranchAndBoundStrategy().findPath(grid, start, goal);
        Path astar = AStarStrategy().findPath(grid, start, goal);

        if (best < 0) {
            CHECK(bnb.empty());
            CHECK(astar.empty());
            continue;
        }
        REQUIRE_FALSE(bnb.empty());
        REQUIRE_FALSE(astar.empty());
        CHECK(bnb.moveCost(grid) == best);
        CHECK(astar.moveCost(grid) == best);
    }
}

TEST_CASE("Optimality/cost matches brute force for scattered endpoints") {
    for (uint32_t seed = 100; seed < 130; ++seed) {
        CAPTURE(seed);
        const GridCell start{static_cast<int>(seed % 4), static_cast<int>((seed / 4) % 4)};
        const GridCell goal{static_cast<int>((seed / 3) % 4), static_cast<int>((seed / 7) % 4)};
        Grid grid = testgrids::randomWeighted(4, 4, seed, 6, 0.15, {start, goal});

        const int best = testgrids::bruteForceMinCost(grid, start, goal);
        SearchResult bnb = BranchAndBoundStrategy().search(grid, start, goal);
        SearchResult astar = AStarStrategy().search(grid, start, goal);

        CHECK(bnb.found == (best >= 0));
        CHECK(astar.found == (best >= 0));
        if (best >= 0) {
            CHECK(bnb.pathCost == best);
            CHECK(astar.pathCost == best);
        }
    }
}

TEST_CASE("Optimality/AStar and BranchAndBound agree on cost") {
    const GridCell start{0, 0};
    const GridCell goal{3, 4};

    for (uint32_t seed = 1; seed <= 15; ++seed) {
        CAPTURE(seed);
        Grid grid = testgrids::randomWeighted(4, 5, seed, 4, 0.2, {start, goal});

        SearchResult bnb = BranchAndBoundStrategy().search(grid, start, goal);
        SearchResult astar = AStarStrategy().search(grid, start, goal);

        CHECK(bnb.found == astar.found);
        CHECK(bnb.pathCost == astar.pathCost);
    }
}

TEST_CASE("Optimality/AStar expands no more than BranchAndBound on open grids") {
    Grid grid = testgrids::uniform(5, 5);
    SearchResult bnb = BranchAndBoundStrategy().search(grid, GridCell{0, 0}, GridCell{4, 4});
    SearchResult astar = AStarStrategy().search(grid, GridCell{0, 0}, GridCell{4, 4});

    CHECK(astar.pathCost == bnb.pathCost);
    CHECK(astar.nodesExpanded <= bnb.nodesExpanded);
}
