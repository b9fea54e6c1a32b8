/**
 * Pokemon Battle Arena Engine - World Generation
 *
 * Builds the catching-phase grid and places the wild Pokemon each side
 * has to collect. Runs once at the start of the catching phase.
 */

#pragma once

#include "arena_config.hpp"
#include "grid.hpp"
#include "random_source.hpp"

namespace arena {

/**
 * CatchTarget - A wild Pokemon waiting on the grid.
 */
struct CatchTarget {
    std::string species;
    ElementType type = ElementType::FIRE;
    Cell cell;
};

/**
 * Generate a grid of the configured size. Each interior cell becomes an
 * obstacle with probability grid.obstacle_density; border cells stay open.
 */
Grid generate_grid(const GridConfig& config, RandomSource& rng);

/**
 * Place one target per species on a random open cell at least two cells
 * away from the border. Gives up after 100 attempts per species and uses
 * the grid center instead.
 */
std::vector<CatchTarget> spawn_targets(const Grid& grid,
                                       const std::vector<std::pair<std::string, ElementType>>& species,
                                       RandomSource& rng);

} // namespace arena
