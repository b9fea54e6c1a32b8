/**
 * Pokemon Battle Arena Engine - Battle Snapshot
 *
 * Point-in-time battle state for both sides. Snapshots are values: the search
 * and the resolver copy them on every transition and never mutate the one
 * they were given.
 */

#pragma once

#include "combatant.hpp"
#include <array>

namespace arena {

/**
 * Resources - Elixirs, coins and fuel held by one side. Never negative.
 */
struct Resources {
    std::array<int, NUM_ELIXIR_TIERS> elixirs = {0, 0, 0};
    int coins = 0;
    int fuel = 0;

    int elixir_count(ElixirTier tier) const {
        return elixirs[tier_index(tier)];
    }

    int total_elixirs() const {
        return elixirs[0] + elixirs[1] + elixirs[2];
    }

    bool has_elixir(ElixirTier tier) const {
        return elixir_count(tier) > 0;
    }

    void add_elixirs(ElixirTier tier, int count) {
        elixirs[tier_index(tier)] = std::max(0, elixirs[tier_index(tier)] + count);
    }

    bool consume_elixir(ElixirTier tier) {
        if (!has_elixir(tier)) {
            return false;
        }
        elixirs[tier_index(tier)]--;
        return true;
    }

    bool spend_coins(int amount) {
        if (amount < 0 || amount > coins) {
            return false;
        }
        coins -= amount;
        return true;
    }

    bool spend_fuel(int amount) {
        if (amount < 0 || amount > fuel) {
            return false;
        }
        fuel -= amount;
        return true;
    }
};

/**
 * SideState - One side's roster, resources and guard flag.
 */
struct SideState {
    std::string trainer_name;
    Roster roster;
    Resources resources;

    // Set by Defend; halves incoming damage until this side acts again
    bool defending = false;

    bool is_defeated() const {
        return roster.is_defeated();
    }
};

/**
 * BattleSnapshot - Both sides plus the field.
 */
struct BattleSnapshot {
    std::array<SideState, NUM_SIDES> sides;
    ElementType field_type = ElementType::FIRE;
    SideId to_move = 0;
    int ply = 0;

    SideState& side(SideId id) { return sides[id]; }
    const SideState& side(SideId id) const { return sides[id]; }

    SideState& opponent(SideId id) { return sides[opponent_of(id)]; }
    const SideState& opponent(SideId id) const { return sides[opponent_of(id)]; }

    bool is_over() const {
        return sides[0].is_defeated() || sides[1].is_defeated();
    }

    /**
     * Promote the first alive member on any side whose active has fainted.
     */
    void normalize_actives() {
        for (auto& s : sides) {
            s.roster.promote_if_fainted();
        }
    }
};

/**
 * Reject snapshots the engine cannot search.
 *
 * Throws EmptyRosterError if either side has no combatants and
 * std::out_of_range if an active index points outside its roster.
 */
void validate_snapshot(const BattleSnapshot& snapshot);

/**
 * As above, and also throws std::out_of_range if `side` is not 0 or 1.
 */
void validate_snapshot(const BattleSnapshot& snapshot, SideId side);

} // namespace arena
