/**
 * Pokemon Battle Arena Engine - A* Pathfinder
 *
 * Minimal-cost routes on a 4-connected grid with unit step cost.
 */

#pragma once

#include "grid.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace arena {

using Path = std::vector<Cell>;

/**
 * Either an ordered start..goal path (inclusive) or std::nullopt when the
 * goal cannot be reached.
 */
using PathResult = std::optional<Path>;

/**
 * PathNode - Open/closed bookkeeping for one search invocation.
 */
struct PathNode {
    Cell cell;
    int g = 0;          // cost from start
    int h = 0;          // Manhattan distance to goal
    int parent = -1;    // index into the node arena, -1 for the start node
    uint64_t seq = 0;   // insertion order, last tie-break

    int f() const { return g + h; }
};

/**
 * Find a shortest path from start to goal.
 *
 * Open set ordered by f = g + h, ties broken by lower h then insertion order,
 * so results are reproducible for identical inputs. Returns nullopt when
 * either endpoint is out of bounds or blocked, or the open set empties.
 */
PathResult find_path(const Grid& grid, const Cell& start, const Cell& goal);

/**
 * Number of steps in a path (cells - 1), 0 for an empty path.
 */
inline int path_length(const Path& path) {
    return path.empty() ? 0 : static_cast<int>(path.size()) - 1;
}

} // namespace arena
