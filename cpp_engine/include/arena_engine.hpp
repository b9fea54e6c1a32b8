/**
 * Pokemon Battle Arena Engine - C++ Implementation
 *
 * Decision engine for the arena agents: A* movement, fuzzy advice,
 * alpha-beta battle search and elixir purchase planning.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "errors.hpp"
#include "arena_config.hpp"
#include "random_source.hpp"

// World
#include "grid.hpp"
#include "pathfinder.hpp"
#include "world.hpp"

// Battle state
#include "combatant.hpp"
#include "battle_snapshot.hpp"
#include "action.hpp"
#include "battle_rules.hpp"
#include "snapshot_io.hpp"

// Decisions
#include "fuzzy_advisor.hpp"
#include "adversarial_search.hpp"
#include "purchase_planner.hpp"
#include "decision_engine.hpp"

// Agents and match
#include "battle_logger.hpp"
#include "agent.hpp"
#include "match.hpp"

namespace arena {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace arena
