/**
 * Tests for snapshot JSON conversion
 */

#include <sstream>

TEST(SnapshotJson, WriteThenRead) {
    BattleSnapshot snapshot = default_snapshot();
    snapshot.side(0).roster.members[0].hp = 42;
    snapshot.side(0).roster.active_index = 1;
    snapshot.side(1).resources.add_elixirs(ElixirTier::MEDIUM, 2);
    snapshot.side(1).defending = true;
    snapshot.field_type = ElementType::ELECTRIC;
    snapshot.ply = 6;

    BattleSnapshot copy = snapshot_from_string(snapshot_to_string(snapshot));
    TEST_ASSERT_EQ(42, copy.side(0).roster.members[0].hp);
    TEST_ASSERT_EQ(1, copy.side(0).roster.active_index);
    TEST_ASSERT_EQ(2, copy.side(1).resources.elixir_count(ElixirTier::MEDIUM));
    TEST_ASSERT_TRUE(copy.side(1).defending);
    TEST_ASSERT(copy.field_type == ElementType::ELECTRIC);
    TEST_ASSERT_EQ(6, copy.ply);
    TEST_ASSERT_EQ(std::string("Team Rocket"), copy.side(1).trainer_name);
}

TEST(SnapshotJson, ExtraFieldsIgnored) {
    const char* text = R"({
        "sides": [
            {"trainer": "Ash", "mood": "determined",
             "roster": [{"species": "Pikachu", "type": "Electric", "hp": 60, "sprite": "pika.png"}]},
            {"trainer": "Team Rocket",
             "roster": [{"species": "Meowth", "type": "electric"}],
             "resources": {"coins": 5, "elixirs": {"Large": 1, "Mega": 9}}}
        ],
        "field": "Water",
        "weather": "rain"
    })";

    BattleSnapshot snapshot = snapshot_from_string(text);
    const Combatant& pikachu = snapshot.side(0).roster.active();
    TEST_ASSERT_EQ(60, pikachu.hp);
    TEST_ASSERT_EQ(100, pikachu.max_hp);
    TEST_ASSERT_EQ(22, pikachu.attack);

    // Missing hp means full health
    TEST_ASSERT_EQ(100, snapshot.side(1).roster.active().hp);
    TEST_ASSERT_EQ(1, snapshot.side(1).resources.elixir_count(ElixirTier::LARGE));
    TEST_ASSERT_EQ(5, snapshot.side(1).resources.coins);
}

TEST(SnapshotJson, ParsedSnapshotIsDecidable) {
    const char* text = R"({"sides": [
        {"roster": [{"species": "Charmander", "type": "Fire"}]},
        {"roster": [{"species": "Meowth", "type": "Electric", "hp": 10}]}
    ], "field": "Fire"})";

    DecisionEngine engine(ArenaConfig(), 3);
    TEST_ASSERT(engine.choose_action(snapshot_from_string(text), 0) == Action::attack());
}

TEST(SnapshotJson, MissingRosterFailsValidation) {
    BattleSnapshot snapshot = snapshot_from_string(R"({"sides": [{"trainer": "Ash"}, {}]})");
    TEST_ASSERT_THROWS(validate_snapshot(snapshot), EmptyRosterError);
}

TEST(SnapshotJson, ActionJson) {
    nlohmann::json heal = Action::heal(ElixirTier::LARGE);
    TEST_ASSERT_EQ(std::string("HEAL"), heal["type"].get<std::string>());
    TEST_ASSERT_EQ(std::string("Large"), heal["tier"].get<std::string>());

    Action swap = nlohmann::json({{"type", "swap"}, {"index", 2}}).get<Action>();
    TEST_ASSERT(swap == Action::swap(2));

    TEST_ASSERT_THROWS(nlohmann::json({{"type", "flee"}}).get<Action>(), std::invalid_argument);
}
