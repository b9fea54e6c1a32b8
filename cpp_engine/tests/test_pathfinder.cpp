/**
 * Tests for Grid, A* Pathfinder and World Generation
 */

#include <sstream>

// ============================================================================
// GRID TESTS
// ============================================================================

TEST(Grid, FromRowsMarksObstacles) {
    Grid grid = Grid::from_rows({
        ".#.",
        "...",
        "##.",
    });

    TEST_ASSERT_EQ(3, grid.rows());
    TEST_ASSERT_EQ(3, grid.cols());
    TEST_ASSERT_EQ(3, grid.obstacle_count());
    TEST_ASSERT_FALSE(grid.is_passable(Cell(0, 1)));
    TEST_ASSERT_TRUE(grid.is_passable(Cell(1, 1)));
}

TEST(Grid, OutOfBoundsIsNotPassable) {
    Grid grid(4, 4);
    TEST_ASSERT_FALSE(grid.is_passable(Cell(-1, 0)));
    TEST_ASSERT_FALSE(grid.is_passable(Cell(0, 4)));
    TEST_ASSERT_TRUE(grid.is_passable(Cell(3, 3)));
}

// ============================================================================
// PATHFINDER TESTS
// ============================================================================

TEST(Pathfinder, OpenGridCornerToCorner) {
    Grid grid(5, 5);
    PathResult path = find_path(grid, Cell(0, 0), Cell(4, 4));

    TEST_ASSERT_TRUE(path.has_value());
    TEST_ASSERT_EQ(8, path_length(*path));
    TEST_ASSERT(path->front() == Cell(0, 0));
    TEST_ASSERT(path->back() == Cell(4, 4));
    for (const Cell& cell : *path) {
        TEST_ASSERT_TRUE(grid.is_passable(cell));
    }
}

TEST(Pathfinder, BlockedGoalIsNotFound) {
    Grid grid(5, 5);
    grid.set_obstacle(Cell(4, 4));

    TEST_ASSERT_FALSE(find_path(grid, Cell(0, 0), Cell(4, 4)).has_value());
}

TEST(Pathfinder, BlockedStartIsNotFound) {
    Grid grid(5, 5);
    grid.set_obstacle(Cell(0, 0));

    TEST_ASSERT_FALSE(find_path(grid, Cell(0, 0), Cell(4, 4)).has_value());
}

TEST(Pathfinder, OutOfBoundsGoalIsNotFound) {
    Grid grid(5, 5);
    TEST_ASSERT_FALSE(find_path(grid, Cell(0, 0), Cell(5, 5)).has_value());
}

TEST(Pathfinder, StartEqualsGoal) {
    Grid grid(3, 3);
    PathResult path = find_path(grid, Cell(1, 1), Cell(1, 1));

    TEST_ASSERT_TRUE(path.has_value());
    TEST_ASSERT_EQ(size_t(1), path->size());
    TEST_ASSERT_EQ(0, path_length(*path));
}

TEST(Pathfinder, WalledOffGoalIsNotFound) {
    Grid grid = Grid::from_rows({
        ".....",
        ".###.",
        ".#.#.",
        ".###.",
        ".....",
    });

    TEST_ASSERT_FALSE(find_path(grid, Cell(0, 0), Cell(2, 2)).has_value());
}

TEST(Pathfinder, StepsAreAdjacentAndAvoidObstacles) {
    Grid grid = Grid::from_rows({
        "..........",
        ".########.",
        "........#.",
        "#######.#.",
        "..........",
    });

    PathResult path = find_path(grid, Cell(0, 0), Cell(4, 0));
    TEST_ASSERT_TRUE(path.has_value());

    for (size_t i = 0; i < path->size(); i++) {
        TEST_ASSERT_TRUE(grid.is_passable((*path)[i]));
        if (i > 0) {
            TEST_ASSERT_EQ(1, manhattan((*path)[i - 1], (*path)[i]));
        }
    }
    TEST_ASSERT_EQ(bfs_distance(grid, Cell(0, 0), Cell(4, 0)), path_length(*path));
}

TEST(Pathfinder, MatchesBreadthFirstOnRandomGrids) {
    SeededRandom rng(7);
    GridConfig config;
    config.rows = 11;
    config.cols = 24;
    config.obstacle_density = 0.25;

    for (int trial = 0; trial < 40; trial++) {
        Grid grid = generate_grid(config, rng);
        Cell start(rng.range(0, grid.rows()), rng.range(0, grid.cols()));
        Cell goal(rng.range(0, grid.rows()), rng.range(0, grid.cols()));

        int expected = bfs_distance(grid, start, goal);
        PathResult path = find_path(grid, start, goal);

        if (expected < 0) {
            TEST_ASSERT_FALSE(path.has_value());
        } else {
            TEST_ASSERT_TRUE(path.has_value());
            TEST_ASSERT_EQ(expected, path_length(*path));
        }
    }
}

TEST(Pathfinder, SameInputsSamePath) {
    Grid grid = Grid::from_rows({
        "......",
        "..#...",
        "......",
        "...#..",
        "......",
    });

    PathResult first = find_path(grid, Cell(0, 0), Cell(4, 5));
    PathResult second = find_path(grid, Cell(0, 0), Cell(4, 5));

    TEST_ASSERT_TRUE(first.has_value() && second.has_value());
    TEST_ASSERT(*first == *second);
}

// ============================================================================
// WORLD GENERATION TESTS
// ============================================================================

TEST(World, BorderStaysClear) {
    SeededRandom rng(3);
    GridConfig config;
    config.obstacle_density = 1.0;

    Grid grid = generate_grid(config, rng);
    TEST_ASSERT_EQ(config.rows, grid.rows());
    TEST_ASSERT_EQ(config.cols, grid.cols());

    for (int c = 0; c < grid.cols(); c++) {
        TEST_ASSERT_TRUE(grid.is_passable(Cell(0, c)));
        TEST_ASSERT_TRUE(grid.is_passable(Cell(grid.rows() - 1, c)));
    }
    for (int r = 0; r < grid.rows(); r++) {
        TEST_ASSERT_TRUE(grid.is_passable(Cell(r, 0)));
        TEST_ASSERT_TRUE(grid.is_passable(Cell(r, grid.cols() - 1)));
    }
    TEST_ASSERT_EQ((config.rows - 2) * (config.cols - 2), grid.obstacle_count());
}

TEST(World, SameSeedSameGrid) {
    GridConfig config;
    SeededRandom a(99);
    SeededRandom b(99);

    Grid first = generate_grid(config, a);
    Grid second = generate_grid(config, b);

    for (int i = 0; i < first.cell_count(); i++) {
        TEST_ASSERT_EQ(first.is_passable(first.cell_at(i)), second.is_passable(second.cell_at(i)));
    }
}

TEST(World, TargetsSpawnInsideMargin) {
    SeededRandom rng(11);
    Grid grid = generate_grid(GridConfig(), rng);
    ArenaConfig config;

    auto targets = spawn_targets(grid, config.match.teams[0].species, rng);
    TEST_ASSERT_EQ(size_t(3), targets.size());

    for (const auto& target : targets) {
        TEST_ASSERT_TRUE(grid.is_passable(target.cell));
        TEST_ASSERT_TRUE(target.cell.row >= 2 && target.cell.row < grid.rows() - 2);
        TEST_ASSERT_TRUE(target.cell.col >= 2 && target.cell.col < grid.cols() - 2);
    }
    TEST_ASSERT_EQ(std::string("Pikachu"), targets[0].species);
}

TEST(World, SpawnFallsBackToCenter) {
    Grid grid(11, 24);
    for (int r = 1; r < 10; r++) {
        for (int c = 1; c < 23; c++) {
            grid.set_obstacle(Cell(r, c));
        }
    }
    SeededRandom rng(5);

    auto targets = spawn_targets(grid, {{"Pikachu", ElementType::ELECTRIC}}, rng);
    TEST_ASSERT(targets[0].cell == Cell(5, 12));
}
