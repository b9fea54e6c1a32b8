/**
 * Pokemon Battle Arena Engine - Action Representation
 *
 * Defines the Action struct returned by legal_actions() and decide().
 */

#pragma once

#include "types.hpp"
#include <functional>

namespace arena {

/**
 * Action - A single battle action for one side.
 *
 * Tagged by ActionType; HEAL carries the elixir tier and SWAP the roster
 * index to bring in. Designed for fast comparison and hashing.
 */
struct Action {
    ActionType action_type = ActionType::DEFEND;

    // Only set for HEAL
    std::optional<ElixirTier> tier;

    // Only set for SWAP
    std::optional<int> swap_index;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Action() = default;

    explicit Action(ActionType type)
        : action_type(type)
    {}

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static Action attack() {
        return Action(ActionType::ATTACK);
    }

    static Action defend() {
        return Action(ActionType::DEFEND);
    }

    static Action heal(ElixirTier elixir) {
        Action a(ActionType::HEAL);
        a.tier = elixir;
        return a;
    }

    static Action swap(int index) {
        Action a(ActionType::SWAP);
        a.swap_index = index;
        return a;
    }

    bool is_heal() const { return action_type == ActionType::HEAL; }
    bool is_swap() const { return action_type == ActionType::SWAP; }

    // ========================================================================
    // STRING REPRESENTATION
    // ========================================================================

    std::string to_string() const {
        std::string result = arena::to_string(action_type);

        if (tier.has_value()) {
            result += "(" + std::string(arena::to_string(*tier)) + ")";
        }
        if (swap_index.has_value()) {
            result += "(" + std::to_string(*swap_index) + ")";
        }
        return result;
    }

    // ========================================================================
    // COMPARISON
    // ========================================================================

    bool operator==(const Action& other) const {
        return action_type == other.action_type
            && tier == other.tier
            && swap_index == other.swap_index;
    }

    bool operator!=(const Action& other) const {
        return !(*this == other);
    }
};

} // namespace arena

// Hash function for Action (for use in unordered_set/map)
namespace std {
    template<>
    struct hash<arena::Action> {
        size_t operator()(const arena::Action& a) const {
            size_t h = hash<int>()(static_cast<int>(a.action_type));
            if (a.tier) h ^= hash<int>()(static_cast<int>(*a.tier)) << 1;
            if (a.swap_index) h ^= hash<int>()(*a.swap_index) << 2;
            return h;
        }
    };
}
