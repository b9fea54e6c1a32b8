/**
 * Pokemon Battle Arena Engine - Configuration
 *
 * Immutable rule set injected into the agents, the search and the match
 * driver. Defaults reproduce the original game; a JSON file may override
 * any subset of the values.
 */

#pragma once

#include "types.hpp"
#include <map>
#include <utility>
#include <nlohmann/json_fwd.hpp>

namespace arena {

/**
 * Price and heal amount of one elixir tier.
 */
struct ElixirSpec {
    int heal = 0;
    int price = 0;
};

/**
 * One row of the fuzzy rule table.
 *
 * The rule fires when the own active combatant falls into `own`, the enemy
 * active falls into `enemy` (if set) and, when `requires_disadvantage` is
 * true, the enemy's type beats the own type.
 */
struct FuzzyRule {
    HpBand own = HpBand::LOW;
    std::optional<HpBand> enemy;
    bool requires_disadvantage = false;
    AdviceKind action = AdviceKind::HEAL;
    double weight = 0.0;
};

/**
 * One side's team as listed in the configuration.
 */
struct TeamSpec {
    std::string trainer_name;
    std::vector<std::pair<std::string, ElementType>> species;
};

struct GridConfig {
    int rows = 11;
    int cols = 24;
    double obstacle_density = 0.08;
};

struct EconomyConfig {
    int start_fuel = 45;
    int fuel_per_catch = 15;
    int coins_per_agent = 100;
    std::map<ElixirTier, ElixirSpec> elixirs = {
        {ElixirTier::SMALL, {25, 15}},
        {ElixirTier::MEDIUM, {50, 30}},
        {ElixirTier::LARGE, {80, 50}},
    };
    PurchaseStrategy purchase_strategy = PurchaseStrategy::MAX_HEAL;

    std::map<ElixirTier, int> price_table() const;
    std::map<ElixirTier, int> heal_table() const;
};

struct BattleConfig {
    // (attacker type, defender type) -> damage multiplier
    std::map<std::pair<ElementType, ElementType>, double> type_advantage = {
        {{ElementType::FIRE, ElementType::ELECTRIC}, 1.3},
        {{ElementType::ELECTRIC, ElementType::WATER}, 1.3},
        {{ElementType::WATER, ElementType::FIRE}, 1.3},
    };
    double field_boost = 1.2;
    double defend_factor = 0.5;
    int damage_floor = 5;
    double jitter_min = 0.8;
    double jitter_max = 1.2;

    int default_max_hp = 100;
    int default_attack = 22;
    int default_defense = 10;

    double advantage(ElementType attacker, ElementType defender) const;
    bool is_disadvantaged(ElementType own, ElementType enemy) const;
};

struct SearchConfig {
    int depth = 3;
    double alive_weight = 30.0;
    double fuzzy_bias_scale = 10.0;
};

struct FuzzyConfig {
    double low_threshold = 0.30;
    double high_threshold = 0.70;
    std::vector<FuzzyRule> rules = {
        {HpBand::LOW, HpBand::HIGH, false, AdviceKind::HEAL, 0.90},
        {HpBand::MEDIUM, HpBand::HIGH, false, AdviceKind::HEAL, 0.60},
        {HpBand::LOW, std::nullopt, true, AdviceKind::SWAP, 0.95},
    };
};

struct MatchConfig {
    // 30 s catching at one movement tick per 0.25 s
    int catch_phase_ticks = 120;
    // 130 s battle at one decision tick per 0.7 s
    int battle_phase_ticks = 185;
    std::array<TeamSpec, NUM_SIDES> teams = {{
        {"Ash", {{"Pikachu", ElementType::ELECTRIC},
                 {"Charmander", ElementType::FIRE},
                 {"Squirtle", ElementType::WATER}}},
        {"Team Rocket", {{"Meowth", ElementType::ELECTRIC},
                         {"Weezing", ElementType::FIRE},
                         {"Wobbuffet", ElementType::WATER}}},
    }};
};

/**
 * ArenaConfig - The complete rule set.
 */
struct ArenaConfig {
    GridConfig grid;
    EconomyConfig economy;
    BattleConfig battle;
    SearchConfig search;
    FuzzyConfig fuzzy;
    MatchConfig match;

    /**
     * Overlay values from a JSON file onto this configuration.
     *
     * Returns false (and leaves the configuration unchanged) if the file
     * cannot be opened or parsed.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Overlay values from a parsed JSON document. Unknown keys are ignored.
     *
     * Throws nlohmann::json exceptions on type mismatches.
     */
    void apply_json(const nlohmann::json& data);

    /**
     * Build a configuration from defaults plus a JSON document.
     */
    static ArenaConfig from_json(const nlohmann::json& data);
};

} // namespace arena
