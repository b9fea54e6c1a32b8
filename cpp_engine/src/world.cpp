/**
 * Pokemon Battle Arena Engine - World Generation Implementation
 */

#include "world.hpp"

namespace arena {

namespace {

constexpr int SPAWN_MARGIN = 2;
constexpr int SPAWN_ATTEMPTS = 100;

} // namespace

Grid generate_grid(const GridConfig& config, RandomSource& rng) {
    Grid grid(config.rows, config.cols);

    for (int r = 0; r < grid.rows(); r++) {
        for (int c = 0; c < grid.cols(); c++) {
            // Draw for every cell so the layout only depends on the seed and size
            bool blocked = rng.uniform(0.0, 1.0) < config.obstacle_density;
            bool interior = r > 0 && r < grid.rows() - 1 && c > 0 && c < grid.cols() - 1;
            if (blocked && interior) {
                grid.set_obstacle(Cell(r, c));
            }
        }
    }

    return grid;
}

std::vector<CatchTarget> spawn_targets(const Grid& grid,
                                       const std::vector<std::pair<std::string, ElementType>>& species,
                                       RandomSource& rng) {
    std::vector<CatchTarget> targets;
    targets.reserve(species.size());

    const Cell center(grid.rows() / 2, grid.cols() / 2);

    for (const auto& [name, type] : species) {
        CatchTarget target;
        target.species = name;
        target.type = type;
        target.cell = center;

        for (int attempt = 0; attempt < SPAWN_ATTEMPTS; attempt++) {
            Cell candidate(rng.range(SPAWN_MARGIN, grid.rows() - SPAWN_MARGIN),
                           rng.range(SPAWN_MARGIN, grid.cols() - SPAWN_MARGIN));
            if (grid.is_passable(candidate)) {
                target.cell = candidate;
                break;
            }
        }

        targets.push_back(target);
    }

    return targets;
}

} // namespace arena
