#pragma once
#include <vector>
#include <string>
#include <utility>
#include "Grid.h"

// an ordered route, start first and goal last. empty means no route was found
class Path {
public:
    Path() = default;
    explicit Path(std::vector<GridCell> cells) : cells_(std::move(cells)) {}

    const std::vector<GridCell>& cells() const { return cells_; }
    bool empty() const { return cells_.empty(); }
    size_t size() const { return cells_.size(); }
    const GridCell& front() const { return cells_.front(); }
    const GridCell& back() const { return cells_.back(); }
    const GridCell& operator[](size_t i) const { return cells_[i]; }

    std::vector<GridCell>::const_iterator begin() const { return cells_.begin(); }
    std::vector<GridCell>::const_iterator end() const { return cells_.end(); }

    // number of moves (cells minus one, zero for an empty path)
    size_t moveCount() const { return cells_.empty() ? 0 : cells_.size() - 1; }

    // sum of entry costs of every cell after the start
    int moveCost(const Grid& grid) const;

    // every consecutive pair is 4-adjacent
    bool isContiguous() const;

    // no cell appears twice
    bool isSimple() const;

    // "(r,c) -> (r,c) -> ..." or "<empty>"
    std::string toString() const;

    bool operator==(const Path& other) const { return cells_ == other.cells_; }
    bool operator!=(const Path& other) const { return !(*this == other); }

private:
    std::vector<GridCell> cells_;
};
