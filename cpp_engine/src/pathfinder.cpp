/**
 * Pokemon Battle Arena Engine - A* Pathfinder Implementation
 */

#include "pathfinder.hpp"
#include <algorithm>
#include <array>
#include <limits>
#include <queue>

namespace arena {

namespace {

// Down, up, right, left
constexpr std::array<std::pair<int, int>, 4> DIRECTIONS = {{
    {1, 0}, {-1, 0}, {0, 1}, {0, -1}
}};

struct OpenEntry {
    int f;
    int h;
    uint64_t seq;
    int node;
};

// Min-heap on (f, h, seq)
struct OpenEntryGreater {
    bool operator()(const OpenEntry& a, const OpenEntry& b) const {
        if (a.f != b.f) return a.f > b.f;
        if (a.h != b.h) return a.h > b.h;
        return a.seq > b.seq;
    }
};

Path reconstruct(const std::vector<PathNode>& nodes, int index) {
    Path path;
    while (index >= 0) {
        path.push_back(nodes[index].cell);
        index = nodes[index].parent;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace

PathResult find_path(const Grid& grid, const Cell& start, const Cell& goal) {
    if (!grid.is_passable(start) || !grid.is_passable(goal)) {
        return std::nullopt;
    }

    if (start == goal) {
        return Path{start};
    }

    const int cell_count = grid.cell_count();
    std::vector<int> best_g(cell_count, std::numeric_limits<int>::max());
    std::vector<bool> closed(cell_count, false);

    std::vector<PathNode> nodes;
    std::priority_queue<OpenEntry, std::vector<OpenEntry>, OpenEntryGreater> open;
    uint64_t next_seq = 0;

    auto push = [&](const Cell& cell, int g, int parent) {
        PathNode node;
        node.cell = cell;
        node.g = g;
        node.h = manhattan(cell, goal);
        node.parent = parent;
        node.seq = next_seq++;
        nodes.push_back(node);
        best_g[grid.index_of(cell)] = g;
        open.push({node.f(), node.h, node.seq, static_cast<int>(nodes.size()) - 1});
    };

    push(start, 0, -1);

    while (!open.empty()) {
        OpenEntry entry = open.top();
        open.pop();

        // Copy: push() below may reallocate the arena
        const PathNode current = nodes[entry.node];
        const int current_index = grid.index_of(current.cell);

        // Stale entry superseded by a cheaper route
        if (closed[current_index] || current.g > best_g[current_index]) {
            continue;
        }

        if (current.cell == goal) {
            return reconstruct(nodes, entry.node);
        }

        closed[current_index] = true;

        for (const auto& [dr, dc] : DIRECTIONS) {
            Cell next(current.cell.row + dr, current.cell.col + dc);
            if (!grid.is_passable(next)) {
                continue;
            }

            const int next_index = grid.index_of(next);
            if (closed[next_index]) {
                continue;
            }

            int tentative = current.g + 1;
            if (tentative < best_g[next_index]) {
                push(next, tentative, entry.node);
            }
        }
    }

    return std::nullopt;
}

} // namespace arena
