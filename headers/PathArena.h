#pragma once
#include <vector>
#include <algorithm>
#include "Grid.h"

// append only pool of partial path nodes for one search call.
// each node points back at its parent so a candidate path is a chain, not a copy
class PathArena {
public:
    static constexpr int kNoParent = -1;

    struct Node {
        GridCell cell;
        int parent;   // index of the previous node, kNoParent for the start
        int length;   // number of cells on the chain ending here
    };

    int addRoot(const GridCell& cell) {
        nodes_.push_back({cell, kNoParent, 1});
        return static_cast<int>(nodes_.size()) - 1;
    }

    int extend(int parent, const GridCell& cell) {
        int length = nodes_[parent].length + 1;
        nodes_.push_back({cell, parent, length});
        return static_cast<int>(nodes_.size()) - 1;
    }

    const Node& operator[](int index) const { return nodes_[index]; }
    size_t size() const { return nodes_.size(); }

    // linear walk of the chain, so self avoidance stays per candidate
    bool contains(int index, const GridCell& cell) const {
        for (int i = index; i != kNoParent; i = nodes_[i].parent) {
            if (nodes_[i].cell == cell) return true;
        }
        return false;
    }

    // start first coordinate sequence of the chain ending at index
    std::vector<GridCell> reconstruct(int index) const {
        std::vector<GridCell> cells;
        cells.reserve(nodes_[index].length);
        for (int i = index; i != kNoParent; i = nodes_[i].parent) {
            cells.push_back(nodes_[i].cell);
        }
        // built goal->start so flip it to start->goal
        std::reverse(cells.begin(), cells.end());
        return cells;
    }

private:
    std::vector<Node> nodes_;
};
