/**
 * Tests for Adversarial Search and the Decision Engine
 */

#include <sstream>

namespace {

// Random mid-battle position; both sides keep at least one living member
BattleSnapshot random_position(SeededRandom& rng) {
    BattleSnapshot snapshot = default_snapshot();
    snapshot.field_type = ALL_ELEMENT_TYPES[rng.pick(ALL_ELEMENT_TYPES.size())];

    for (SideId side = 0; side < NUM_SIDES; side++) {
        SideState& state = snapshot.side(side);
        for (auto& member : state.roster.members) {
            member.hp = rng.range(0, 101);
        }
        if (state.roster.is_defeated()) {
            state.roster.members[rng.range(0, 3)].hp = rng.range(1, 101);
        }
        state.roster.active_index = state.roster.first_alive();
        for (ElixirTier tier : ALL_ELIXIR_TIERS) {
            state.resources.add_elixirs(tier, rng.range(0, 2));
        }
    }
    return snapshot;
}

bool same_actions(const std::vector<Action>& a, const std::vector<Action>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (a[i] != b[i]) return false;
    }
    return true;
}

} // namespace

// ============================================================================
// EVALUATION
// ============================================================================

TEST(Search, EvaluateHpAndAliveDifference) {
    AdversarialSearch search{ArenaConfig()};
    BattleSnapshot snapshot = default_snapshot();
    snapshot.side(1).roster.members[0].hp = 0;
    snapshot.side(1).roster.members[1].hp = 50;

    // (300 - 150) + (3 - 2) * 30
    TEST_ASSERT_NEAR(180.0, search.evaluate(snapshot, 0), 1e-9);
    TEST_ASSERT_NEAR(-180.0, search.evaluate(snapshot, 1), 1e-9);
}

// ============================================================================
// ALPHA-BETA
// ============================================================================

TEST(Search, PruningMatchesPlainMinimax) {
    AdversarialSearch search{ArenaConfig()};
    FuzzyAdvisor advisor{ArenaConfig()};
    SeededRandom positions(2024);

    for (int trial = 0; trial < 30; trial++) {
        BattleSnapshot snapshot = random_position(positions);
        SideId side = static_cast<SideId>(trial % 2);
        Advice advice = advisor.advise(snapshot, side);

        SeededRandom rng_a(trial);
        SeededRandom rng_b(trial);
        SearchResult pruned = search.decide(snapshot, side, advice, rng_a);
        SearchResult plain = search.minimax_reference(snapshot, side, advice, rng_b);

        TEST_ASSERT_NEAR(plain.score, pruned.score, 1e-9);
        TEST_ASSERT_TRUE(same_actions(plain.best_actions, pruned.best_actions));
        TEST_ASSERT(plain.action == pruned.action);
        TEST_ASSERT_TRUE(pruned.nodes_visited <= plain.nodes_visited);
    }
}

TEST(Search, PruningVisitsFewerNodes) {
    AdversarialSearch search{ArenaConfig()};
    BattleSnapshot snapshot = default_snapshot();
    snapshot.side(0).resources.add_elixirs(ElixirTier::SMALL, 1);
    snapshot.side(1).resources.add_elixirs(ElixirTier::LARGE, 1);

    SeededRandom rng(1);
    SearchResult pruned = search.decide(snapshot, 0, Advice(), rng);
    SearchResult plain = search.minimax_reference(snapshot, 0, Advice(), rng);

    TEST_ASSERT_TRUE(pruned.nodes_visited < plain.nodes_visited);
}

TEST(Search, ChosenActionIsAlwaysLegal) {
    ArenaConfig config;
    AdversarialSearch search(config);
    FuzzyAdvisor advisor(config);
    SeededRandom positions(77);
    SeededRandom rng(5);

    for (int trial = 0; trial < 40; trial++) {
        BattleSnapshot snapshot = random_position(positions);
        SideId side = static_cast<SideId>(trial % 2);

        SearchResult result = search.decide(snapshot, side, advisor.advise(snapshot, side), rng,
                                            1 + trial % 3);
        TEST_ASSERT_TRUE(search.rules().is_legal(snapshot, side, result.action));
    }
}

TEST(Search, AdviceShiftsBranchScore) {
    AdversarialSearch search{ArenaConfig()};
    BattleSnapshot snapshot = default_snapshot();
    snapshot.side(0).roster.active().hp = 20;
    snapshot.side(0).resources.add_elixirs(ElixirTier::LARGE, 1);

    Advice advice;
    advice.heal = 0.9;

    FixedRandom rng;
    SearchResult plain = search.decide(snapshot, 0, Advice(), rng);
    SearchResult biased = search.minimax_reference(snapshot, 0, advice, rng);
    SearchResult unbiased = search.minimax_reference(snapshot, 0, Advice(), rng);

    const Action heal = Action::heal(ElixirTier::LARGE);
    double with_bias = 0.0;
    double without_bias = 0.0;
    for (const auto& scored : biased.root_scores) {
        if (scored.action == heal) with_bias = scored.score;
    }
    for (const auto& scored : unbiased.root_scores) {
        if (scored.action == heal) without_bias = scored.score;
    }

    // Heal weight 0.9 times bias scale 10
    TEST_ASSERT_NEAR(9.0, with_bias - without_bias, 1e-9);
    TEST_ASSERT_TRUE(plain.searched);
}

TEST(Search, DepthIsAtLeastOne) {
    AdversarialSearch search{ArenaConfig()};
    FixedRandom rng;

    SearchResult result = search.decide(default_snapshot(), 0, Advice(), rng, 0);
    TEST_ASSERT_TRUE(result.searched);
    // Root plus one leaf each for Attack, Defend, Swap(1), Swap(2)
    TEST_ASSERT_EQ(5, result.nodes_visited);
}

// ============================================================================
// TIE-BREAK
// ============================================================================

TEST(Search, TieBreakUsesRandomSource) {
    AdversarialSearch search{ArenaConfig()};
    // Enemy already down: every action leads to the same position
    BattleSnapshot snapshot = make_snapshot(
        {make_combatant("Pikachu", ElementType::ELECTRIC, 30),
         make_combatant("Squirtle", ElementType::WATER),
         make_combatant("Psyduck", ElementType::WATER)},
        {make_combatant("Wobbuffet", ElementType::WATER, 0)});

    FixedRandom first(1.0, 0);
    FixedRandom last(1.0, 3);
    SearchResult a = search.decide(snapshot, 0, Advice(), first);
    SearchResult b = search.decide(snapshot, 0, Advice(), last);

    TEST_ASSERT_EQ(size_t(4), a.best_actions.size());
    TEST_ASSERT(a.action == Action::attack());
    TEST_ASSERT(b.action == Action::swap(2));
    TEST_ASSERT_EQ(1, first.picks);
}

TEST(Search, SameSeedSameChoice) {
    ArenaConfig config;
    SeededRandom positions(31);

    for (int trial = 0; trial < 10; trial++) {
        BattleSnapshot snapshot = random_position(positions);
        DecisionEngine a(config, 1234);
        DecisionEngine b(config, 1234);

        for (int step = 0; step < 3; step++) {
            TEST_ASSERT(a.choose_action(snapshot, 0) == b.choose_action(snapshot, 0));
        }
    }
}

// ============================================================================
// DECISION ENGINE
// ============================================================================

TEST(DecisionEngine, DefeatedSideDefendsWithoutSearch) {
    auto rng = std::make_shared<FixedRandom>();
    DecisionEngine engine(ArenaConfig(), rng);

    BattleSnapshot snapshot = make_snapshot(
        {make_combatant("Pikachu", ElementType::ELECTRIC, 0),
         make_combatant("Charmander", ElementType::FIRE, 0)},
        {make_combatant("Meowth", ElementType::ELECTRIC)});

    SearchResult result = engine.analyze(snapshot, 0);
    TEST_ASSERT(result.action == Action::defend());
    TEST_ASSERT_FALSE(result.searched);
    TEST_ASSERT_EQ(0, result.nodes_visited);
    TEST_ASSERT_EQ(0, rng->picks);

    TEST_ASSERT(engine.choose_action(snapshot, 0) == Action::defend());
}

TEST(DecisionEngine, EmptyRosterRejected) {
    DecisionEngine engine(ArenaConfig(), 1);
    BattleSnapshot snapshot = make_snapshot({}, {make_combatant("Meowth", ElementType::ELECTRIC)});

    TEST_ASSERT_THROWS(engine.choose_action(snapshot, 1), EmptyRosterError);
}

TEST(DecisionEngine, NullRandomSourceRejected) {
    std::shared_ptr<RandomSource> none;
    TEST_ASSERT_THROWS(DecisionEngine engine(ArenaConfig(), none), std::invalid_argument);
}

TEST(DecisionEngine, FinishesWeakenedEnemy) {
    DecisionEngine engine(ArenaConfig(), 9);
    BattleSnapshot snapshot = make_snapshot(
        {make_combatant("Pikachu", ElementType::ELECTRIC)},
        {make_combatant("Meowth", ElementType::ELECTRIC, 10)});

    // One hit ends the battle
    TEST_ASSERT(engine.choose_action(snapshot, 0) == Action::attack());
}

TEST(DecisionEngine, UnknownSideRejected) {
    DecisionEngine engine(ArenaConfig(), 1);
    TEST_ASSERT_THROWS(engine.choose_action(default_snapshot(), 2), std::out_of_range);
}

TEST(DecisionEngine, FaintedActiveChoiceMatchesLiveTurn) {
    DecisionEngine engine(ArenaConfig(), 5);
    BattleSnapshot snapshot = make_snapshot(
        {make_combatant("Pikachu", ElementType::ELECTRIC, 0),
         make_combatant("Squirtle", ElementType::WATER)},
        {make_combatant("Meowth", ElementType::ELECTRIC, 10)});

    SearchResult result = engine.analyze(snapshot, 0);
    TEST_ASSERT(result.action == Action::attack());
    for (const auto& scored : result.root_scores) {
        TEST_ASSERT_FALSE(scored.action.is_swap());
    }

    // The chosen attack lands when the turn is actually resolved
    FixedRandom rng(1.0);
    BattleSnapshot next = engine.rules().resolve_turn(snapshot, result.action, Action::defend(), rng);
    TEST_ASSERT_TRUE(next.side(1).is_defeated());
}
