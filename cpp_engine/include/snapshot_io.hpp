/**
 * Pokemon Battle Arena Engine - Snapshot JSON
 *
 * nlohmann/json conversions for battle snapshots and actions, used by the
 * console and the Python bindings. Readers take only the keys they know,
 * so extra fields are ignored and missing fields keep their defaults.
 */

#pragma once

#include "action.hpp"
#include "battle_snapshot.hpp"
#include <nlohmann/json.hpp>

namespace arena {

void to_json(nlohmann::json& j, const Combatant& combatant);
void from_json(const nlohmann::json& j, Combatant& combatant);

void to_json(nlohmann::json& j, const Resources& resources);
void from_json(const nlohmann::json& j, Resources& resources);

void to_json(nlohmann::json& j, const SideState& side);
void from_json(const nlohmann::json& j, SideState& side);

void to_json(nlohmann::json& j, const BattleSnapshot& snapshot);
void from_json(const nlohmann::json& j, BattleSnapshot& snapshot);

void to_json(nlohmann::json& j, const Action& action);
void from_json(const nlohmann::json& j, Action& action);

// String helpers for callers that do not want the json type
std::string snapshot_to_string(const BattleSnapshot& snapshot, int indent = -1);
BattleSnapshot snapshot_from_string(const std::string& text);

} // namespace arena
