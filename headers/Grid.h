#pragma once
#include <vector>
#include <functional>
#include <cstdint>
#include <utility>

// grid cell coordinates (row major, row 0 is the top)
struct GridCell {
    int row, col;

    bool operator==(const GridCell& other) const {
        return row == other.row && col == other.col;
    }

    bool operator!=(const GridCell& other) const {
        return !(*this == other);
    }

    // row major, for ordered containers
    bool operator<(const GridCell& other) const {
        if (row != other.row) return row < other.row;
        return col < other.col;
    }
};

// hash function for GridCell (for use in unordered_map/set)
struct GridCellHash {
    size_t operator()(const GridCell& cell) const {
        return std::hash<int>()(cell.row) ^ (std::hash<int>()(cell.col) << 16);
    }
};

// a cell plus the cost to enter it
struct Tile {
    GridCell pos;
    int cost = 1;
};

// entrance/exit pair produced by the maze generator
struct MazeEnds {
    GridCell entrance;
    GridCell exit;
};

class Grid {
public:
    Grid(int rows, int cols, int defaultCost = 1);

    // grid management
    void resize(int rows, int cols);
    int rows() const { return rows_; }
    int cols() const { return cols_; }
    int cellCount() const { return rows_ * cols_; }

    // cost management, throws std::invalid_argument on negative cost
    void setCost(int row, int col, int cost);
    void fillCost(int cost);
    void randomizeCosts(int minCost, int maxCost, uint32_t seed);

    // obstacle management
    void setBlocked(int row, int col, bool blocked);
    void clearObstacles();
    void addObstacle(int row, int col, int height, int width);
    void generateRandomObstacles(int count, int minSize, int maxSize, uint32_t seed,
                                 const std::vector<GridCell>& keepClear = {});

    // perfect maze via recursive backtracking, cellsX by cellsY logical cells
    // each logical cell is one open tile with a wall tile between cells
    MazeEnds generateMaze(int cellsX, int cellsY, uint32_t seed);

    bool inBounds(int row, int col) const;
    bool inBounds(const GridCell& cell) const { return inBounds(cell.row, cell.col); }
    bool isBlocked(int row, int col) const;
    bool isBlocked(const GridCell& cell) const { return isBlocked(cell.row, cell.col); }

    // tile lookup, throws std::out_of_range when (row, col) is outside the grid
    Tile get(int row, int col) const;
    Tile get(const GridCell& cell) const { return get(cell.row, cell.col); }

    // in bounds, non blocked orthogonal neighbours (N, E, S, W order)
    std::vector<Tile> neighbors4(int row, int col) const;
    std::vector<Tile> neighbors4(const GridCell& cell) const { return neighbors4(cell.row, cell.col); }

    int manhattan(const GridCell& a, const GridCell& b) const;

private:
    int rows_, cols_;
    int defaultCost_;

    std::vector<int> costs_;            // entry cost per cell
    std::vector<bool> blocked_;         // blocked cells (true = obstacle)

    // helper to get the flat index from grid coordinates
    int getIndex(int row, int col) const { return row * cols_ + col; }

    void checkBounds(int row, int col) const;
};
