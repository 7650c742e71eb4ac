#include <doctest/doctest.h>

#include "Grid.h"
#include "Path.h"

TEST_CASE("Path/empty path") {
    Path path;
    CHECK(path.empty());
    CHECK(path.size() == 0);
    CHECK(path.moveCount() == 0);
    CHECK(path.toString() == "<empty>");

    Grid grid(2, 2);
    CHECK(path.moveCost(grid) == 0);
}

TEST_CASE("Path/move cost skips the start tile") {
    Grid grid(2, 3);
    grid.setCost(0, 0, 9);
    grid.setCost(0, 1, 2);
    grid.setCost(0, 2, 3);

    Path path(std::vector<GridCell>{{0, 0}, {0, 1}, {0, 2}});
    CHECK(path.moveCount() == 2);
    CHECK(path.moveCost(grid) == 5);
}

TEST_CASE("Path/contiguity and simplicity") {
    Path good(std::vector<GridCell>{{0, 0}, {0, 1}, {1, 1}});
    CHECK(good.isContiguous());
    CHECK(good.isSimple());

    Path diagonal(std::vector<GridCell>{{0, 0}, {1, 1}});
    CHECK_FALSE(diagonal.isContiguous());

    Path revisit(std::vector<GridCell>{{0, 0}, {0, 1}, {0, 0}});
    CHECK(revisit.isContiguous());
    CHECK_FALSE(revisit.isSimple());
}

TEST_CASE("Path/text form and comparison") {
    Path a(std::vector<GridCell>{{0, 0}, {1, 0}});
    Path b(std::vector<GridCell>{{0, 0}, {1, 0}});
    Path c(std::vector<GridCell>{{0, 0}, {0, 1}});

    CHECK(a.toString() == "(0,0) -> (1,0)");
    CHECK(a == b);
    CHECK(a != c);
    CHECK(a.front() == GridCell{0, 0});
    CHECK(a.back() == GridCell{1, 0});
    CHECK(a[1] == GridCell{1, 0});
}
