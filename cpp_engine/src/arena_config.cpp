/**
 * Pokemon Battle Arena Engine - Configuration Implementation
 *
 * Parses configuration overrides using nlohmann/json.
 */

#include "arena_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <iostream>

using json = nlohmann::json;

namespace arena {

// ============================================================================
// TABLE HELPERS
// ============================================================================

std::map<ElixirTier, int> EconomyConfig::price_table() const {
    std::map<ElixirTier, int> table;
    for (const auto& [tier, spec] : elixirs) {
        table[tier] = spec.price;
    }
    return table;
}

std::map<ElixirTier, int> EconomyConfig::heal_table() const {
    std::map<ElixirTier, int> table;
    for (const auto& [tier, spec] : elixirs) {
        table[tier] = spec.heal;
    }
    return table;
}

double BattleConfig::advantage(ElementType attacker, ElementType defender) const {
    auto it = type_advantage.find({attacker, defender});
    if (it != type_advantage.end()) {
        return it->second;
    }
    return 1.0;
}

bool BattleConfig::is_disadvantaged(ElementType own, ElementType enemy) const {
    return type_advantage.find({enemy, own}) != type_advantage.end();
}

// ============================================================================
// JSON PARSING
// ============================================================================

namespace {

ElementType require_element(const json& j) {
    std::string name = j.get<std::string>();
    auto parsed = parse_element_type(name);
    if (!parsed) {
        throw std::invalid_argument("unknown element type '" + name + "'");
    }
    return *parsed;
}

void parse_grid(const json& j, GridConfig& grid) {
    grid.rows = j.value("rows", grid.rows);
    grid.cols = j.value("cols", grid.cols);
    grid.obstacle_density = j.value("obstacle_density", grid.obstacle_density);
}

void parse_economy(const json& j, EconomyConfig& economy) {
    economy.start_fuel = j.value("start_fuel", economy.start_fuel);
    economy.fuel_per_catch = j.value("fuel_per_catch", economy.fuel_per_catch);
    economy.coins_per_agent = j.value("coins_per_agent", economy.coins_per_agent);

    if (j.contains("elixirs") && j["elixirs"].is_object()) {
        for (const auto& [name, spec_json] : j["elixirs"].items()) {
            auto tier = parse_elixir_tier(name);
            if (!tier) {
                std::cerr << "[ArenaConfig] Ignoring unknown elixir tier: " << name << std::endl;
                continue;
            }
            ElixirSpec& spec = economy.elixirs[*tier];
            spec.heal = spec_json.value("heal", spec.heal);
            spec.price = spec_json.value("price", spec.price);
        }
    }

    if (j.contains("purchase_strategy")) {
        std::string name = j["purchase_strategy"].get<std::string>();
        auto strategy = parse_purchase_strategy(name);
        if (!strategy) {
            throw std::invalid_argument("unknown purchase strategy '" + name + "'");
        }
        economy.purchase_strategy = *strategy;
    }
}

void parse_battle(const json& j, BattleConfig& battle) {
    battle.field_boost = j.value("field_boost", battle.field_boost);
    battle.defend_factor = j.value("defend_factor", battle.defend_factor);
    battle.damage_floor = j.value("damage_floor", battle.damage_floor);
    battle.jitter_min = j.value("jitter_min", battle.jitter_min);
    battle.jitter_max = j.value("jitter_max", battle.jitter_max);
    battle.default_max_hp = j.value("default_max_hp", battle.default_max_hp);
    battle.default_attack = j.value("default_attack", battle.default_attack);
    battle.default_defense = j.value("default_defense", battle.default_defense);

    // A type_advantage array replaces the whole table
    if (j.contains("type_advantage") && j["type_advantage"].is_array()) {
        battle.type_advantage.clear();
        for (const auto& entry : j["type_advantage"]) {
            ElementType attacker = require_element(entry.at("attacker"));
            ElementType defender = require_element(entry.at("defender"));
            battle.type_advantage[{attacker, defender}] = entry.value("multiplier", 1.3);
        }
    }
}

void parse_search(const json& j, SearchConfig& search) {
    search.depth = j.value("depth", search.depth);
    search.alive_weight = j.value("alive_weight", search.alive_weight);
    search.fuzzy_bias_scale = j.value("fuzzy_bias_scale", search.fuzzy_bias_scale);
}

FuzzyRule parse_rule(const json& j) {
    FuzzyRule rule;

    std::string own = j.at("own").get<std::string>();
    auto own_band = parse_hp_band(own);
    if (!own_band) {
        throw std::invalid_argument("unknown hp band '" + own + "'");
    }
    rule.own = *own_band;

    if (j.contains("enemy") && !j["enemy"].is_null()) {
        std::string enemy = j["enemy"].get<std::string>();
        auto enemy_band = parse_hp_band(enemy);
        if (!enemy_band) {
            throw std::invalid_argument("unknown hp band '" + enemy + "'");
        }
        rule.enemy = *enemy_band;
    }

    rule.requires_disadvantage = j.value("disadvantaged", false);

    std::string action = j.at("action").get<std::string>();
    auto kind = parse_advice_kind(action);
    if (!kind) {
        throw std::invalid_argument("unknown advice action '" + action + "'");
    }
    rule.action = *kind;
    rule.weight = j.at("weight").get<double>();
    return rule;
}

void parse_fuzzy(const json& j, FuzzyConfig& fuzzy) {
    fuzzy.low_threshold = j.value("low_threshold", fuzzy.low_threshold);
    fuzzy.high_threshold = j.value("high_threshold", fuzzy.high_threshold);

    if (j.contains("rules") && j["rules"].is_array()) {
        std::vector<FuzzyRule> rules;
        for (const auto& rule_json : j["rules"]) {
            rules.push_back(parse_rule(rule_json));
        }
        fuzzy.rules = std::move(rules);
    }
}

TeamSpec parse_team(const json& j, const TeamSpec& fallback) {
    TeamSpec team = fallback;
    team.trainer_name = j.value("name", team.trainer_name);

    if (j.contains("species") && j["species"].is_array()) {
        team.species.clear();
        for (const auto& entry : j["species"]) {
            team.species.emplace_back(entry.at("name").get<std::string>(),
                                      require_element(entry.at("type")));
        }
        if (team.species.empty()) {
            throw std::invalid_argument("team '" + team.trainer_name + "' has no species");
        }
    }
    return team;
}

void parse_match(const json& j, MatchConfig& match) {
    match.catch_phase_ticks = j.value("catch_phase_ticks", match.catch_phase_ticks);
    match.battle_phase_ticks = j.value("battle_phase_ticks", match.battle_phase_ticks);

    if (j.contains("teams") && j["teams"].is_array()) {
        const auto& teams = j["teams"];
        for (size_t i = 0; i < teams.size() && i < match.teams.size(); i++) {
            match.teams[i] = parse_team(teams[i], match.teams[i]);
        }
    }
}

} // namespace

void ArenaConfig::apply_json(const json& data) {
    if (data.contains("grid")) parse_grid(data["grid"], grid);
    if (data.contains("economy")) parse_economy(data["economy"], economy);
    if (data.contains("battle")) parse_battle(data["battle"], battle);
    if (data.contains("search")) parse_search(data["search"], search);
    if (data.contains("fuzzy")) parse_fuzzy(data["fuzzy"], fuzzy);
    if (data.contains("match")) parse_match(data["match"], match);
}

ArenaConfig ArenaConfig::from_json(const json& data) {
    ArenaConfig config;
    config.apply_json(data);
    return config;
}

bool ArenaConfig::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[ArenaConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);

        // Parse into a copy so a bad file leaves this config untouched
        ArenaConfig updated = *this;
        updated.apply_json(data);
        *this = std::move(updated);

        std::cout << "[ArenaConfig] Loaded " << filepath << std::endl;
        return true;

    } catch (const json::exception& e) {
        std::cerr << "[ArenaConfig] JSON error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[ArenaConfig] Error: " << e.what() << std::endl;
        return false;
    }
}

} // namespace arena
