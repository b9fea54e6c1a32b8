/**
 * Pokemon Battle Arena Engine - Snapshot JSON Implementation
 */

#include "snapshot_io.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace arena {

namespace {

ElementType element_from(const json& j, const char* key, ElementType fallback) {
    if (!j.contains(key) || !j[key].is_string()) {
        return fallback;
    }
    std::string name = j[key].get<std::string>();
    auto parsed = parse_element_type(name);
    if (!parsed) {
        throw std::invalid_argument("unknown element type '" + name + "'");
    }
    return *parsed;
}

} // namespace

// ============================================================================
// COMBATANT
// ============================================================================

void to_json(json& j, const Combatant& combatant) {
    j = json{
        {"species", combatant.species},
        {"type", to_string(combatant.type)},
        {"hp", combatant.hp},
        {"max_hp", combatant.max_hp},
        {"attack", combatant.attack},
        {"defense", combatant.defense},
    };
}

void from_json(const json& j, Combatant& combatant) {
    combatant.species = j.value("species", combatant.species);
    combatant.type = element_from(j, "type", combatant.type);
    combatant.max_hp = j.value("max_hp", combatant.max_hp);
    // A missing hp means full health
    combatant.hp = j.value("hp", combatant.max_hp);
    combatant.attack = j.value("attack", combatant.attack);
    combatant.defense = j.value("defense", combatant.defense);
}

// ============================================================================
// RESOURCES
// ============================================================================

void to_json(json& j, const Resources& resources) {
    json elixirs = json::object();
    for (ElixirTier tier : ALL_ELIXIR_TIERS) {
        elixirs[to_string(tier)] = resources.elixir_count(tier);
    }
    j = json{
        {"elixirs", elixirs},
        {"coins", resources.coins},
        {"fuel", resources.fuel},
    };
}

void from_json(const json& j, Resources& resources) {
    resources.coins = j.value("coins", resources.coins);
    resources.fuel = j.value("fuel", resources.fuel);

    if (j.contains("elixirs") && j["elixirs"].is_object()) {
        for (const auto& [name, count] : j["elixirs"].items()) {
            auto tier = parse_elixir_tier(name);
            if (!tier) continue;
            resources.elixirs[tier_index(*tier)] = std::max(0, count.get<int>());
        }
    }
}

// ============================================================================
// SIDE / SNAPSHOT
// ============================================================================

void to_json(json& j, const SideState& side) {
    j = json{
        {"trainer", side.trainer_name},
        {"roster", side.roster.members},
        {"active", side.roster.active_index},
        {"resources", side.resources},
        {"defending", side.defending},
    };
}

void from_json(const json& j, SideState& side) {
    side.trainer_name = j.value("trainer", side.trainer_name);
    if (j.contains("roster") && j["roster"].is_array()) {
        side.roster.members = j["roster"].get<std::vector<Combatant>>();
    }
    side.roster.active_index = j.value("active", side.roster.active_index);
    if (j.contains("resources")) {
        side.resources = j["resources"].get<Resources>();
    }
    side.defending = j.value("defending", side.defending);
}

void to_json(json& j, const BattleSnapshot& snapshot) {
    j = json{
        {"sides", json::array({snapshot.sides[0], snapshot.sides[1]})},
        {"field", to_string(snapshot.field_type)},
        {"to_move", static_cast<int>(snapshot.to_move)},
        {"ply", snapshot.ply},
    };
}

void from_json(const json& j, BattleSnapshot& snapshot) {
    if (j.contains("sides") && j["sides"].is_array()) {
        const auto& sides = j["sides"];
        for (size_t i = 0; i < sides.size() && i < snapshot.sides.size(); i++) {
            snapshot.sides[i] = sides[i].get<SideState>();
        }
    }
    snapshot.field_type = element_from(j, "field", snapshot.field_type);
    snapshot.to_move = static_cast<SideId>(j.value("to_move", 0) == 1 ? 1 : 0);
    snapshot.ply = j.value("ply", snapshot.ply);
}

// ============================================================================
// ACTION
// ============================================================================

void to_json(json& j, const Action& action) {
    j = json{{"type", to_string(action.action_type)}};
    if (action.tier) {
        j["tier"] = to_string(*action.tier);
    }
    if (action.swap_index) {
        j["index"] = *action.swap_index;
    }
}

void from_json(const json& j, Action& action) {
    std::string name = j.at("type").get<std::string>();
    auto type = parse_action_type(name);
    if (!type) {
        throw std::invalid_argument("unknown action type '" + name + "'");
    }

    switch (*type) {
        case ActionType::ATTACK:
            action = Action::attack();
            break;
        case ActionType::DEFEND:
            action = Action::defend();
            break;
        case ActionType::HEAL: {
            std::string tier_name = j.at("tier").get<std::string>();
            auto tier = parse_elixir_tier(tier_name);
            if (!tier) {
                throw std::invalid_argument("unknown elixir tier '" + tier_name + "'");
            }
            action = Action::heal(*tier);
            break;
        }
        case ActionType::SWAP:
            action = Action::swap(j.at("index").get<int>());
            break;
    }
}

std::string snapshot_to_string(const BattleSnapshot& snapshot, int indent) {
    return json(snapshot).dump(indent);
}

BattleSnapshot snapshot_from_string(const std::string& text) {
    return json::parse(text).get<BattleSnapshot>();
}

} // namespace arena
