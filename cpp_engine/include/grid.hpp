/**
 * Pokemon Battle Arena Engine - Grid Model
 *
 * Bounded 2D cell grid for the catching phase. Shared read-only by the
 * pathfinder and both agents once generated.
 */

#pragma once

#include <cstdlib>
#include <functional>
#include <string>
#include <vector>

namespace arena {

/**
 * Cell - (row, col) coordinate on the grid.
 */
struct Cell {
    int row = 0;
    int col = 0;

    Cell() = default;
    Cell(int r, int c) : row(r), col(c) {}

    bool operator==(const Cell& other) const {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Cell& other) const {
        return !(*this == other);
    }

    bool operator<(const Cell& other) const {
        return row != other.row ? row < other.row : col < other.col;
    }

    std::string to_string() const {
        return "(" + std::to_string(row) + ", " + std::to_string(col) + ")";
    }
};

inline int manhattan(const Cell& a, const Cell& b) {
    return std::abs(a.row - b.row) + std::abs(a.col - b.col);
}

/**
 * Grid - Dimensions plus a passable flag per cell.
 */
class Grid {
public:
    Grid() = default;

    Grid(int rows, int cols)
        : rows_(rows > 0 ? rows : 0)
        , cols_(cols > 0 ? cols : 0)
        , passable_(static_cast<size_t>(rows_) * static_cast<size_t>(cols_), true)
    {}

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    int cell_count() const { return rows_ * cols_; }

    bool in_bounds(const Cell& cell) const {
        return cell.row >= 0 && cell.row < rows_ && cell.col >= 0 && cell.col < cols_;
    }

    /**
     * Out-of-bounds cells are never passable.
     */
    bool is_passable(const Cell& cell) const {
        return in_bounds(cell) && passable_[index_of(cell)];
    }

    void set_obstacle(const Cell& cell, bool obstacle = true) {
        if (in_bounds(cell)) {
            passable_[index_of(cell)] = !obstacle;
        }
    }

    int obstacle_count() const {
        int count = 0;
        for (bool p : passable_) {
            if (!p) count++;
        }
        return count;
    }

    // Row-major index; caller guarantees the cell is in bounds
    int index_of(const Cell& cell) const {
        return cell.row * cols_ + cell.col;
    }

    Cell cell_at(int index) const {
        return Cell(index / cols_, index % cols_);
    }

    /**
     * Build a grid from rows of text: '#' marks an obstacle, anything else is open.
     */
    static Grid from_rows(const std::vector<std::string>& rows);

private:
    int rows_ = 0;
    int cols_ = 0;
    std::vector<bool> passable_;
};

} // namespace arena

namespace std {
    template<>
    struct hash<arena::Cell> {
        size_t operator()(const arena::Cell& c) const {
            return hash<int>()(c.row) ^ (hash<int>()(c.col) << 1);
        }
    };
}
