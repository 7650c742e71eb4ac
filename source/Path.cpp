#include "Path.h"
#include <unordered_set>
#include <sstream>
#include <cstdlib>

int Path::moveCost(const Grid& grid) const {
    int cost = 0;
    for (size_t i = 1; i < cells_.size(); i++) {
        cost += grid.get(cells_[i]).cost;
    }
    return cost;
}

bool Path::isContiguous() const {
    for (size_t i = 1; i < cells_.size(); i++) {
        int dr = std::abs(cells_[i].row - cells_[i - 1].row);
        int dc = std::abs(cells_[i].col - cells_[i - 1].col);
        if (dr + dc != 1) return false;
    }
    return true;
}

bool Path::isSimple() const {
    std::unordered_set<GridCell, GridCellHash> seen;
    for (const GridCell& cell : cells_) {
        if (!seen.insert(cell).second) return false;
    }
    return true;
}

std::string Path::toString() const {
    if (cells_.empty()) return "<empty>";

    std::ostringstream out;
    for (size_t i = 0; i < cells_.size(); i++) {
        if (i > 0) out << " -> ";
        out << "(" << cells_[i].row << "," << cells_[i].col << ")";
    }
    return out.str();
}
