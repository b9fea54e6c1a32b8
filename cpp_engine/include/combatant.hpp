/**
 * Pokemon Battle Arena Engine - Combatants and Rosters
 *
 * A Combatant is one battling Pokemon; a Roster is one side's ordered team
 * with a pointer to the active member.
 */

#pragma once

#include "types.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace arena {

/**
 * Combatant - One Pokemon's battle stats.
 */
struct Combatant {
    std::string species;
    ElementType type = ElementType::FIRE;
    int hp = 100;
    int max_hp = 100;
    int attack = 22;
    int defense = 10;

    Combatant() = default;

    Combatant(std::string name, ElementType t, int max, int atk, int def)
        : species(std::move(name))
        , type(t)
        , hp(max)
        , max_hp(max)
        , attack(atk)
        , defense(def)
    {}

    bool is_fainted() const {
        return hp <= 0;
    }

    bool is_alive() const {
        return !is_fainted();
    }

    double hp_ratio() const {
        if (max_hp <= 0) {
            return 0.0;
        }
        return static_cast<double>(std::max(0, hp)) / static_cast<double>(max_hp);
    }

    // HP floors at 0
    void take_damage(int amount) {
        if (is_fainted() || amount <= 0) {
            return;
        }
        hp = std::max(0, hp - amount);
    }

    // Fainted combatants cannot be healed; HP caps at max_hp
    void heal(int amount) {
        if (is_fainted() || amount <= 0) {
            return;
        }
        hp = std::min(max_hp, hp + amount);
    }
};

/**
 * Roster - Ordered team plus the index of the active combatant.
 *
 * Exactly one member is active unless all have fainted, in which case the
 * side is defeated.
 */
struct Roster {
    std::vector<Combatant> members;
    int active_index = 0;

    Roster() = default;

    explicit Roster(std::vector<Combatant> team, int active = 0)
        : members(std::move(team))
        , active_index(active)
    {}

    bool empty() const { return members.empty(); }
    int size() const { return static_cast<int>(members.size()); }

    bool has_member(int index) const {
        return index >= 0 && index < size();
    }

    Combatant& active() { return members[active_index]; }
    const Combatant& active() const { return members[active_index]; }

    int alive_count() const {
        int count = 0;
        for (const auto& c : members) {
            if (c.is_alive()) count++;
        }
        return count;
    }

    int total_hp() const {
        int total = 0;
        for (const auto& c : members) {
            total += std::max(0, c.hp);
        }
        return total;
    }

    bool is_defeated() const {
        return alive_count() == 0;
    }

    // Index of the first non-fainted member, -1 if none
    int first_alive() const {
        for (int i = 0; i < size(); i++) {
            if (members[i].is_alive()) return i;
        }
        return -1;
    }

    // The member that actually fights: the active one, or the first alive
    // member if the active one has fainted. -1 if the roster is defeated.
    int live_active_index() const {
        if (has_member(active_index) && members[active_index].is_alive()) {
            return active_index;
        }
        return first_alive();
    }

    /**
     * If the active member has fainted, make the first alive member active.
     */
    void promote_if_fainted() {
        if (has_member(active_index) && members[active_index].is_alive()) {
            return;
        }
        int next = first_alive();
        if (next >= 0) {
            active_index = next;
        }
    }
};

} // namespace arena
