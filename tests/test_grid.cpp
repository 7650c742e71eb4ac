#include <doctest/doctest.h>

#include <stdexcept>

#include "Grid.h"
#include "SearchStrategy.h"

TEST_CASE("Grid/get returns position and entry cost") {
    Grid grid(3, 4, 2);
    grid.setCost(1, 2, 7);

    Tile tile = grid.get(1, 2);
    CHECK(tile.pos == GridCell{1, 2});
    CHECK(tile.cost == 7);
    CHECK(grid.get(GridCell{0, 0}).cost == 2);
    CHECK(grid.rows() == 3);
    CHECK(grid.cols() == 4);
    CHECK(grid.cellCount() == 12);
}

TEST_CASE("Grid/out of range lookups throw") {
    Grid grid(3, 3);
    CHECK_THROWS_AS(grid.get(-1, 0), std::out_of_range);
    CHECK_THROWS_AS(grid.get(0, 3), std::out_of_range);
    CHECK_THROWS_AS(grid.get(GridCell{3, 0}), std::out_of_range);
    CHECK_THROWS_AS(grid.setCost(5, 5, 1), std::out_of_range);
    CHECK_THROWS_AS(grid.setBlocked(0, -1, true), std::out_of_range);
}

TEST_CASE("Grid/rejects negative costs and empty dimensions") {
    Grid grid(2, 2);
    CHECK_THROWS_AS(grid.setCost(0, 0, -1), std::invalid_argument);
    CHECK_THROWS_AS(grid.fillCost(-3), std::invalid_argument);
    CHECK_THROWS_AS(grid.randomizeCosts(5, 2, 1), std::invalid_argument);
    CHECK_THROWS_AS(Grid(0, 4), std::invalid_argument);
    CHECK_THROWS_AS(Grid(2, 2, -1), std::invalid_argument);

    // zero is a valid cost
    grid.setCost(0, 0, 0);
    CHECK(grid.get(0, 0).cost == 0);
}

TEST_CASE("Grid/neighbors4 order and filtering") {
    Grid grid(3, 3);

    SUBCASE("centre has all four in N E S W order") {
        auto n = grid.neighbors4(1, 1);
        REQUIRE(n.size() == 4);
        CHECK(n[0].pos == GridCell{0, 1});
        CHECK(n[1].pos == GridCell{1, 2});
        CHECK(n[2].pos == GridCell{2, 1});
        CHECK(n[3].pos == GridCell{1, 0});
    }

    SUBCASE("corner only sees in bounds cells") {
        auto n = grid.neighbors4(0, 0);
        REQUIRE(n.size() == 2);
        CHECK(n[0].pos == GridCell{0, 1});
        CHECK(n[1].pos == GridCell{1, 0});
    }

    SUBCASE("blocked cells are skipped and carry their cost otherwise") {
        grid.setBlocked(0, 1, true);
        grid.setCost(1, 0, 5);
        auto n = grid.neighbors4(0, 0);
        REQUIRE(n.size() == 1);
        CHECK(n[0].pos == GridCell{1, 0});
        CHECK(n[0].cost == 5);
    }
}

TEST_CASE("Grid/blocked queries outside the grid count as blocked") {
    Grid grid(2, 2);
    CHECK_FALSE(grid.isBlocked(0, 0));
    CHECK(grid.isBlocked(-1, 0));
    CHECK(grid.isBlocked(GridCell{2, 2}));
    CHECK_FALSE(grid.inBounds(2, 0));
    CHECK(grid.inBounds(GridCell{1, 1}));
}

TEST_CASE("Grid/manhattan distance") {
    Grid grid(10, 10);
    CHECK(grid.manhattan({0, 0}, {0, 0}) == 0);
    CHECK(grid.manhattan({0, 0}, {2, 3}) == 5);
    CHECK(grid.manhattan({7, 1}, {2, 4}) == 8);
}

TEST_CASE("Grid/obstacles are clipped to the grid") {
    Grid grid(4, 4);
    grid.addObstacle(2, 2, 5, 5);
    CHECK(grid.isBlocked(2, 2));
    CHECK(grid.isBlocked(3, 3));
    CHECK_FALSE(grid.isBlocked(1, 1));

    grid.clearObstacles();
    CHECK_FALSE(grid.isBlocked(3, 3));
}

TEST_CASE("Grid/random obstacles keep requested cells open") {
    Grid grid(8, 8);
    grid.generateRandomObstacles(40, 2, 3, 99, {GridCell{0, 0}, GridCell{7, 7}});
    CHECK_FALSE(grid.isBlocked(0, 0));
    CHECK_FALSE(grid.isBlocked(7, 7));
}

TEST_CASE("Grid/randomized costs stay in range and repeat per seed") {
    Grid a(6, 6);
    Grid b(6, 6);
    a.randomizeCosts(2, 5, 42);
    b.randomizeCosts(2, 5, 42);
    for (int r = 0; r < 6; ++r) {
        for (int c = 0; c < 6; ++c) {
            int cost = a.get(r, c).cost;
            CHECK(cost >= 2);
            CHECK(cost <= 5);
            CHECK(cost == b.get(r, c).cost);
        }
    }
}

TEST_CASE("Grid/generated maze has open ends joined by a corridor") {
    Grid grid(1, 1);
    MazeEnds ends = grid.generateMaze(5, 4, 7);

    CHECK(grid.rows() == 9);
    CHECK(grid.cols() == 11);
    CHECK(ends.entrance == GridCell{5, 0});
    CHECK(ends.exit == GridCell{7, 10});
    CHECK_FALSE(grid.isBlocked(ends.entrance));
    CHECK_FALSE(grid.isBlocked(ends.exit));

    // the wall tiles on even rows and columns meet at corners that are never carved
    CHECK(grid.isBlocked(0, 0));
    CHECK(grid.isBlocked(2, 2));

    DepthFirstStrategy dfs;
    Path route = dfs.findPath(grid, ends.entrance, ends.exit);
    REQUIRE_FALSE(route.empty());
    CHECK(route.front() == ends.entrance);
    CHECK(route.back() == ends.exit);
}

TEST_CASE("Grid/same maze seed gives the same maze") {
    Grid a(1, 1);
    Grid b(1, 1);
    a.generateMaze(6, 6, 3);
    b.generateMaze(6, 6, 3);
    for (int r = 0; r < a.rows(); ++r) {
        for (int c = 0; c < a.cols(); ++c) {
            CHECK(a.isBlocked(r, c) == b.isBlocked(r, c));
        }
    }
}
