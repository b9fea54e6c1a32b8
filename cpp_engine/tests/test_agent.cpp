/**
 * Tests for the Agent Facade
 */

#include <sstream>

namespace {

AgentFacade make_agent(const ArenaConfig& config = ArenaConfig()) {
    return AgentFacade(0, "Ash", config, std::make_shared<SeededRandom>(42));
}

// Tick until catching finishes or the tick budget runs out
int run_catching(AgentFacade& agent, int max_ticks) {
    int ticks = 0;
    while (!agent.catching_finished() && ticks < max_ticks) {
        agent.catch_tick();
        ticks++;
    }
    return ticks;
}

} // namespace

// ============================================================================
// PHASES
// ============================================================================

TEST(Agent, StartsIdleWithConfiguredResources) {
    AgentFacade agent = make_agent();
    TEST_ASSERT(agent.phase() == AgentPhase::IDLE);
    TEST_ASSERT_EQ(100, agent.resources().coins);
    TEST_ASSERT_EQ(45, agent.resources().fuel);
}

TEST(Agent, PhasesOnlyMoveForward) {
    AgentFacade agent = make_agent();

    TEST_ASSERT_TRUE(agent.enter_phase(AgentPhase::CATCHING));
    TEST_ASSERT_TRUE(agent.enter_phase(AgentPhase::BATTLING));
    TEST_ASSERT_FALSE(agent.enter_phase(AgentPhase::SHOPPING));
    TEST_ASSERT_FALSE(agent.enter_phase(AgentPhase::BATTLING));
    TEST_ASSERT(agent.phase() == AgentPhase::BATTLING);

    agent.finish();
    TEST_ASSERT(agent.phase() == AgentPhase::DONE);
}

TEST(Agent, ResetReturnsToIdle) {
    AgentFacade agent = make_agent();
    agent.shop();
    agent.finish();

    agent.reset();
    TEST_ASSERT(agent.phase() == AgentPhase::IDLE);
    TEST_ASSERT_EQ(100, agent.resources().coins);
    TEST_ASSERT_EQ(0, agent.resources().total_elixirs());
}

// ============================================================================
// CATCHING
// ============================================================================

TEST(Agent, CatchesAllReachableTargets) {
    AgentFacade agent = make_agent();
    Grid grid(6, 6);
    std::vector<CatchTarget> targets = {
        {"Pikachu", ElementType::ELECTRIC, Cell(0, 3)},
        {"Charmander", ElementType::FIRE, Cell(5, 5)},
        {"Squirtle", ElementType::WATER, Cell(2, 0)},
    };

    agent.begin_catching(grid, Cell(0, 0), targets);
    TEST_ASSERT(agent.phase() == AgentPhase::CATCHING);

    run_catching(agent, 100);
    TEST_ASSERT_TRUE(agent.catching_finished());
    TEST_ASSERT_EQ(size_t(3), agent.caught().size());
    TEST_ASSERT_EQ(0, agent.resources().fuel);
}

TEST(Agent, GoesToNearestTargetFirst) {
    AgentFacade agent = make_agent();
    Grid grid(6, 6);
    std::vector<CatchTarget> targets = {
        {"Far", ElementType::WATER, Cell(5, 5)},
        {"Near", ElementType::FIRE, Cell(0, 2)},
    };

    agent.begin_catching(grid, Cell(0, 0), targets);
    run_catching(agent, 100);

    TEST_ASSERT_EQ(std::string("Near"), agent.caught().front());
}

TEST(Agent, OneStepPerTick) {
    AgentFacade agent = make_agent();
    Grid grid(1, 6);
    agent.begin_catching(grid, Cell(0, 0), {{"Pikachu", ElementType::ELECTRIC, Cell(0, 5)}});

    for (int i = 1; i <= 4; i++) {
        CatchTick step = agent.catch_tick();
        TEST_ASSERT_TRUE(step.moved);
        TEST_ASSERT(step.position == Cell(0, i));
        TEST_ASSERT_FALSE(step.caught_species.has_value());
    }

    CatchTick last = agent.catch_tick();
    TEST_ASSERT_TRUE(last.caught_species.has_value());
    TEST_ASSERT_TRUE(last.finished);
    TEST_ASSERT_EQ(30, agent.resources().fuel);
}

TEST(Agent, UnreachableTargetHoldsPosition) {
    AgentFacade agent = make_agent();
    Grid grid = Grid::from_rows({
        "..#..",
        "..#..",
        "..#..",
    });
    agent.begin_catching(grid, Cell(1, 0), {{"Pikachu", ElementType::ELECTRIC, Cell(1, 4)}});

    for (int i = 0; i < 3; i++) {
        CatchTick step = agent.catch_tick();
        TEST_ASSERT_TRUE(step.path_not_found);
        TEST_ASSERT_FALSE(step.moved);
        TEST_ASSERT(agent.position() == Cell(1, 0));
    }

    // Clearing the wall lets the next tick plan a route
    grid.set_obstacle(Cell(1, 2), false);
    CatchTick step = agent.catch_tick();
    TEST_ASSERT_TRUE(step.moved);
    TEST_ASSERT_FALSE(agent.catching_finished());
}

TEST(Agent, UnreachableNearestTargetIsSkipped) {
    AgentFacade agent = make_agent();
    Grid grid = Grid::from_rows({
        "...#.",
        "...##",
        ".....",
        ".....",
    });
    std::vector<CatchTarget> targets = {
        {"Walled", ElementType::FIRE, Cell(0, 4)},
        {"Open", ElementType::WATER, Cell(3, 4)},
    };

    // Walled is nearer from (0, 0) but sealed off
    agent.begin_catching(grid, Cell(0, 0), targets);
    CatchTick first = agent.catch_tick();
    TEST_ASSERT_TRUE(first.moved);
    TEST_ASSERT_FALSE(first.path_not_found);

    run_catching(agent, 20);
    TEST_ASSERT_EQ(size_t(1), agent.caught().size());
    TEST_ASSERT_EQ(std::string("Open"), agent.caught().front());
    TEST_ASSERT(agent.position() == Cell(3, 4));

    // Only the sealed target is left, so the agent holds position
    CatchTick stuck = agent.catch_tick();
    TEST_ASSERT_TRUE(stuck.path_not_found);
    TEST_ASSERT_FALSE(stuck.moved);
    TEST_ASSERT(agent.position() == Cell(3, 4));
}

TEST(Agent, OutOfFuelEndsCatching) {
    ArenaConfig config;
    config.economy.start_fuel = 20;
    AgentFacade agent = make_agent(config);
    Grid grid(3, 3);

    agent.begin_catching(grid, Cell(0, 0), {
        {"Pikachu", ElementType::ELECTRIC, Cell(0, 1)},
        {"Charmander", ElementType::FIRE, Cell(0, 2)},
    });

    CatchTick first = agent.catch_tick();
    TEST_ASSERT_TRUE(first.caught_species.has_value());
    TEST_ASSERT_EQ(5, agent.resources().fuel);

    CatchTick second = agent.catch_tick();
    TEST_ASSERT_TRUE(second.out_of_fuel);
    TEST_ASSERT_TRUE(agent.catching_finished());
    TEST_ASSERT_EQ(size_t(1), agent.caught().size());
}

// ============================================================================
// SHOPPING
// ============================================================================

TEST(Agent, ShoppingSpendsCoinsOnElixirs) {
    AgentFacade agent = make_agent();
    PurchasePlan plan = agent.shop();

    TEST_ASSERT(agent.phase() == AgentPhase::SHOPPING);
    TEST_ASSERT_EQ(2, agent.resources().elixir_count(ElixirTier::LARGE));
    TEST_ASSERT_EQ(0, agent.resources().coins);
    TEST_ASSERT_EQ(100, plan.coins_spent);
}

TEST(Agent, ShoppingBudgetIsCappedByCoins) {
    AgentFacade agent = make_agent();
    PurchasePlan plan = agent.shop(30);

    TEST_ASSERT_EQ(30, plan.coins_spent);
    TEST_ASSERT_EQ(70, agent.resources().coins);

    Resources poor;
    poor.coins = 20;
    agent.set_resources(poor);
    PurchasePlan capped = agent.shop(500);
    TEST_ASSERT_TRUE(capped.coins_spent <= 20);
}

// ============================================================================
// BATTLING
// ============================================================================

TEST(Agent, ChooseActionEntersBattle) {
    AgentFacade agent = make_agent();
    BattleSnapshot snapshot = default_snapshot();

    Action action = agent.choose_action(snapshot);
    TEST_ASSERT(agent.phase() == AgentPhase::BATTLING);
    TEST_ASSERT_TRUE(agent.engine().rules().is_legal(snapshot, 0, action));
    TEST_ASSERT_TRUE(agent.last_search().searched);
}

TEST(Agent, DefeatedSideGetsDefend) {
    AgentFacade agent = make_agent();
    BattleSnapshot snapshot = make_snapshot(
        {make_combatant("Pikachu", ElementType::ELECTRIC, 0)},
        {make_combatant("Meowth", ElementType::ELECTRIC)});

    TEST_ASSERT(agent.choose_action(snapshot) == Action::defend());
    TEST_ASSERT_FALSE(agent.last_search().searched);
}

TEST(Agent, EmptyRosterRejected) {
    AgentFacade agent = make_agent();
    BattleSnapshot snapshot = make_snapshot({}, {make_combatant("Meowth", ElementType::ELECTRIC)});

    TEST_ASSERT_THROWS(agent.choose_action(snapshot), EmptyRosterError);
}

TEST(Agent, SideMustBeZeroOrOne) {
    TEST_ASSERT_THROWS(AgentFacade agent(2, "Nobody", ArenaConfig(), std::make_shared<SeededRandom>(1)),
                       std::invalid_argument);
}
