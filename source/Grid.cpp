#include "Grid.h"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <string>
#include <cstdlib>

Grid::Grid(int rows, int cols, int defaultCost)
    : rows_(0), cols_(0), defaultCost_(defaultCost) {
    if (defaultCost < 0) {
        throw std::invalid_argument("Grid: default cost must be non-negative, got " + std::to_string(defaultCost));
    }
    resize(rows, cols);
}

void Grid::resize(int rows, int cols) {
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("Grid: dimensions must be positive, got " +
                                    std::to_string(rows) + "x" + std::to_string(cols));
    }
    // resizing wipes costs and obstacles, same as a fresh grid
    rows_ = rows;
    cols_ = cols;
    costs_.assign(rows_ * cols_, defaultCost_);
    blocked_.assign(rows_ * cols_, false);
}

void Grid::checkBounds(int row, int col) const {
    if (!inBounds(row, col)) {
        throw std::out_of_range("Grid: cell (" + std::to_string(row) + "," + std::to_string(col) +
                                ") is outside the " + std::to_string(rows_) + "x" +
                                std::to_string(cols_) + " grid");
    }
}

void Grid::setCost(int row, int col, int cost) {
    checkBounds(row, col);
    if (cost < 0) {
        throw std::invalid_argument("Grid: tile cost must be non-negative, got " + std::to_string(cost));
    }
    costs_[getIndex(row, col)] = cost;
}

void Grid::fillCost(int cost) {
    if (cost < 0) {
        throw std::invalid_argument("Grid: tile cost must be non-negative, got " + std::to_string(cost));
    }
    std::fill(costs_.begin(), costs_.end(), cost);
}

void Grid::randomizeCosts(int minCost, int maxCost, uint32_t seed) {
    if (minCost < 0 || maxCost < minCost) {
        throw std::invalid_argument("Grid: invalid cost range [" + std::to_string(minCost) + ", " +
                                    std::to_string(maxCost) + "]");
    }
    std::mt19937 gen(seed);
    std::uniform_int_distribution<> costDist(minCost, maxCost);
    for (auto& cost : costs_) {
        cost = costDist(gen);
    }
}

void Grid::setBlocked(int row, int col, bool blocked) {
    checkBounds(row, col);
    blocked_[getIndex(row, col)] = blocked;
}

void Grid::clearObstacles() {
    std::fill(blocked_.begin(), blocked_.end(), false);
}

void Grid::addObstacle(int row, int col, int height, int width) {
    // marking every cell inside the rectangle as blocked, clipped to the grid
    for (int dr = 0; dr < height; dr++) {
        for (int dc = 0; dc < width; dc++) {
            int r = row + dr;
            int c = col + dc;
            if (inBounds(r, c)) {
                blocked_[getIndex(r, c)] = true;
            }
        }
    }
}

void Grid::generateRandomObstacles(int count, int minSize, int maxSize, uint32_t seed,
                                   const std::vector<GridCell>& keepClear) {
    if (minSize < 1 || maxSize < minSize) {
        return;
    }

    std::mt19937 gen(seed);
    std::uniform_int_distribution<> rowDist(0, rows_ - 1);
    std::uniform_int_distribution<> colDist(0, cols_ - 1);
    std::uniform_int_distribution<> sizeDist(minSize, maxSize);

    for (int i = 0; i < count; i++) {
        addObstacle(rowDist(gen), colDist(gen), sizeDist(gen), sizeDist(gen));
    }

    // endpoints the caller cares about stay open
    for (const GridCell& cell : keepClear) {
        if (inBounds(cell)) {
            blocked_[getIndex(cell.row, cell.col)] = false;
        }
    }
}

MazeEnds Grid::generateMaze(int cellsX, int cellsY, uint32_t seed) {
    cellsX = std::max(1, cellsX);
    cellsY = std::max(1, cellsY);

    // one open tile per logical cell plus a wall tile between every pair
    resize(2 * cellsY + 1, 2 * cellsX + 1);

    // blanket block the whole area so carving only has to clear corridors
    std::fill(blocked_.begin(), blocked_.end(), true);

    auto tileOf = [](int cx, int cy) {
        return GridCell{2 * cy + 1, 2 * cx + 1};
    };

    std::mt19937 gen(seed);
    std::vector<std::vector<bool>> visited(cellsX, std::vector<bool>(cellsY, false));

    // recursive backtracking with an explicit stack
    std::vector<std::pair<int, int>> stack;
    int startX = 0;
    int startY = cellsY / 2;

    visited[startX][startY] = true;
    stack.push_back({startX, startY});
    GridCell startTile = tileOf(startX, startY);
    blocked_[getIndex(startTile.row, startTile.col)] = false;

    const int dx[] = {1, 0, -1, 0};
    const int dy[] = {0, 1, 0, -1};

    while (!stack.empty()) {
        auto [cx, cy] = stack.back();

        // collecting unvisited neighbouring maze cells
        std::vector<int> options;
        for (int d = 0; d < 4; d++) {
            int nx = cx + dx[d];
            int ny = cy + dy[d];
            if (nx >= 0 && nx < cellsX && ny >= 0 && ny < cellsY && !visited[nx][ny]) {
                options.push_back(d);
            }
        }

        if (options.empty()) {
            stack.pop_back();  // dead end, backtrack
            continue;
        }

        std::uniform_int_distribution<> pick(0, static_cast<int>(options.size()) - 1);
        int d = options[pick(gen)];
        int nx = cx + dx[d];
        int ny = cy + dy[d];

        // open the wall tile between the two cells and the new cell itself
        GridCell from = tileOf(cx, cy);
        GridCell to = tileOf(nx, ny);
        blocked_[getIndex((from.row + to.row) / 2, (from.col + to.col) / 2)] = false;
        blocked_[getIndex(to.row, to.col)] = false;

        visited[nx][ny] = true;
        stack.push_back({nx, ny});
    }

    // entrance on the left wall next to the start cell, exit on the right wall
    // next to the bottom right cell
    MazeEnds ends;
    ends.entrance = GridCell{startTile.row, 0};
    GridCell lastTile = tileOf(cellsX - 1, cellsY - 1);
    ends.exit = GridCell{lastTile.row, cols_ - 1};
    blocked_[getIndex(ends.entrance.row, ends.entrance.col)] = false;
    blocked_[getIndex(ends.exit.row, ends.exit.col)] = false;

    return ends;
}

bool Grid::inBounds(int row, int col) const {
    return row >= 0 && row < rows_ && col >= 0 && col < cols_;
}

bool Grid::isBlocked(int row, int col) const {
    if (!inBounds(row, col)) {
        return true;
    }
    return blocked_[getIndex(row, col)];
}

Tile Grid::get(int row, int col) const {
    checkBounds(row, col);
    return Tile{GridCell{row, col}, costs_[getIndex(row, col)]};
}

std::vector<Tile> Grid::neighbors4(int row, int col) const {
    std::vector<Tile> neighbors;
    neighbors.reserve(4);

    // cardinal offsets: N, E, S, W
    const int dr[] = {-1, 0, 1, 0};
    const int dc[] = {0, 1, 0, -1};

    for (int i = 0; i < 4; i++) {
        int nr = row + dr[i];
        int nc = col + dc[i];
        if (inBounds(nr, nc) && !blocked_[getIndex(nr, nc)]) {
            neighbors.push_back(Tile{GridCell{nr, nc}, costs_[getIndex(nr, nc)]});
        }
    }

    return neighbors;
}

int Grid::manhattan(const GridCell& a, const GridCell& b) const {
    return std::abs(a.row - b.row) + std::abs(a.col - b.col);
}
