/**
 * Pokemon Battle Arena Engine - Grid Implementation
 */

#include "grid.hpp"
#include <algorithm>

namespace arena {

Grid Grid::from_rows(const std::vector<std::string>& rows) {
    size_t width = 0;
    for (const auto& row : rows) {
        width = std::max(width, row.size());
    }

    Grid grid(static_cast<int>(rows.size()), static_cast<int>(width));
    for (size_t r = 0; r < rows.size(); r++) {
        for (size_t c = 0; c < rows[r].size(); c++) {
            if (rows[r][c] == '#') {
                grid.set_obstacle(Cell(static_cast<int>(r), static_cast<int>(c)));
            }
        }
    }
    return grid;
}

} // namespace arena
