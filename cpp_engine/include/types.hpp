/**
 * Pokemon Battle Arena Engine - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the engine.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arena {

// ============================================================================
// ENUMS
// ============================================================================

enum class ElementType : uint8_t {
    FIRE,
    WATER,
    ELECTRIC
};

enum class ElixirTier : uint8_t {
    SMALL,
    MEDIUM,
    LARGE
};

enum class ActionType : uint8_t {
    ATTACK,
    DEFEND,
    HEAL,
    SWAP
};

enum class AgentPhase : uint8_t {
    IDLE,
    CATCHING,
    SHOPPING,
    BATTLING,
    DONE
};

enum class MatchPhase : uint8_t {
    CATCHING,
    SHOPPING,
    BATTLING,
    GAME_OVER
};

enum class MatchResult : uint8_t {
    ONGOING,
    SIDE_0_WIN,
    SIDE_1_WIN,
    DRAW
};

enum class PurchaseStrategy : uint8_t {
    MAX_HEAL,
    GREEDY_RATIO
};

// Fuzzy categories over an HP ratio
enum class HpBand : uint8_t {
    LOW,
    MEDIUM,
    HIGH
};

// Actions the fuzzy advisor can recommend
enum class AdviceKind : uint8_t {
    HEAL,
    SWAP
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using SideId = uint8_t;  // 0 or 1

constexpr int NUM_SIDES = 2;
constexpr int NUM_ELIXIR_TIERS = 3;

constexpr std::array<ElixirTier, NUM_ELIXIR_TIERS> ALL_ELIXIR_TIERS = {
    ElixirTier::SMALL, ElixirTier::MEDIUM, ElixirTier::LARGE
};

constexpr std::array<ElementType, 3> ALL_ELEMENT_TYPES = {
    ElementType::FIRE, ElementType::WATER, ElementType::ELECTRIC
};

inline SideId opponent_of(SideId side) {
    return static_cast<SideId>(1 - side);
}

inline int tier_index(ElixirTier tier) {
    return static_cast<int>(tier);
}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(ElementType type) {
    switch (type) {
        case ElementType::FIRE: return "Fire";
        case ElementType::WATER: return "Water";
        case ElementType::ELECTRIC: return "Electric";
        default: return "Unknown";
    }
}

inline const char* to_string(ElixirTier tier) {
    switch (tier) {
        case ElixirTier::SMALL: return "Small";
        case ElixirTier::MEDIUM: return "Medium";
        case ElixirTier::LARGE: return "Large";
        default: return "Unknown";
    }
}

inline const char* to_string(ActionType type) {
    switch (type) {
        case ActionType::ATTACK: return "ATTACK";
        case ActionType::DEFEND: return "DEFEND";
        case ActionType::HEAL: return "HEAL";
        case ActionType::SWAP: return "SWAP";
        default: return "UNKNOWN";
    }
}

inline const char* to_string(AgentPhase phase) {
    switch (phase) {
        case AgentPhase::IDLE: return "idle";
        case AgentPhase::CATCHING: return "catching";
        case AgentPhase::SHOPPING: return "shopping";
        case AgentPhase::BATTLING: return "battling";
        case AgentPhase::DONE: return "done";
        default: return "unknown";
    }
}

inline const char* to_string(MatchPhase phase) {
    switch (phase) {
        case MatchPhase::CATCHING: return "catching";
        case MatchPhase::SHOPPING: return "shopping";
        case MatchPhase::BATTLING: return "battling";
        case MatchPhase::GAME_OVER: return "game_over";
        default: return "unknown";
    }
}

inline const char* to_string(MatchResult result) {
    switch (result) {
        case MatchResult::ONGOING: return "ongoing";
        case MatchResult::SIDE_0_WIN: return "side_0_win";
        case MatchResult::SIDE_1_WIN: return "side_1_win";
        case MatchResult::DRAW: return "draw";
        default: return "unknown";
    }
}

inline const char* to_string(PurchaseStrategy strategy) {
    switch (strategy) {
        case PurchaseStrategy::MAX_HEAL: return "max_heal";
        case PurchaseStrategy::GREEDY_RATIO: return "greedy_ratio";
        default: return "unknown";
    }
}

inline const char* to_string(HpBand band) {
    switch (band) {
        case HpBand::LOW: return "low";
        case HpBand::MEDIUM: return "medium";
        case HpBand::HIGH: return "high";
        default: return "unknown";
    }
}

inline const char* to_string(AdviceKind kind) {
    switch (kind) {
        case AdviceKind::HEAL: return "heal";
        case AdviceKind::SWAP: return "swap";
        default: return "unknown";
    }
}

// Parsers return nullopt for names they do not recognize.
std::optional<ElementType> parse_element_type(const std::string& s);
std::optional<ElixirTier> parse_elixir_tier(const std::string& s);
std::optional<ActionType> parse_action_type(const std::string& s);
std::optional<PurchaseStrategy> parse_purchase_strategy(const std::string& s);
std::optional<HpBand> parse_hp_band(const std::string& s);
std::optional<AdviceKind> parse_advice_kind(const std::string& s);

} // namespace arena
