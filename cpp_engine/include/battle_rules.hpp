/**
 * Pokemon Battle Arena Engine - Battle Rules
 *
 * Legality, damage and state transitions for the battle phase. Everything
 * here is a pure function of its inputs: transitions return a new snapshot
 * and leave the argument untouched.
 */

#pragma once

#include "action.hpp"
#include "arena_config.hpp"
#include "battle_snapshot.hpp"
#include "random_source.hpp"

namespace arena {

/**
 * BattleRules - The rule book shared by the search and the resolver.
 *
 * Holds its own copy of the battle and elixir tables, so it can outlive the
 * configuration it was built from.
 */
class BattleRules {
public:
    explicit BattleRules(const ArenaConfig& config);

    // ========================================================================
    // LEGALITY
    // ========================================================================

    /**
     * All legal actions for a side, in a fixed order:
     * ATTACK, DEFEND, HEAL per tier held (Small, Medium, Large), SWAP per
     * alive bench member (ascending index).
     *
     * A defeated side can only pass, so its legal set is {DEFEND}.
     */
    std::vector<Action> legal_actions(const BattleSnapshot& snapshot, SideId side) const;

    bool is_legal(const BattleSnapshot& snapshot, SideId side, const Action& action) const;

    // ========================================================================
    // DAMAGE
    // ========================================================================

    /**
     * Deterministic damage used by the search:
     * round(max(floor, atk - def / 2) * type advantage * field boost).
     */
    int expected_damage(const Combatant& attacker,
                        const Combatant& defender,
                        ElementType field) const;

    /**
     * Live damage used by the resolver: expected damage with a uniform
     * jitter multiplier in [jitter_min, jitter_max].
     */
    int rolled_damage(const Combatant& attacker,
                      const Combatant& defender,
                      ElementType field,
                      RandomSource& rng) const;

    /**
     * Damage after a Defend (truncated).
     */
    int guarded(int damage) const;

    int heal_amount(ElixirTier tier) const;

    // ========================================================================
    // TRANSITIONS
    // ========================================================================

    /**
     * One ply: `side` performs `action`, the other side does nothing.
     *
     * Clears the mover's defending flag, applies the action with expected
     * damage, promotes the first alive member over a fainted active, passes
     * the move to the opponent and advances the ply counter.
     *
     * Throws IllegalActionError if the action is not legal.
     */
    BattleSnapshot apply_action(const BattleSnapshot& snapshot,
                                SideId side,
                                const Action& action) const;

    /**
     * One real turn with both actions resolved simultaneously.
     *
     * Swaps and heals go first (side 0, then side 1). Then side 0 attacks and
     * side 1 attacks, each only while both actives are standing, with jittered
     * damage halved by a Defend. Fainted actives are replaced afterwards.
     *
     * Throws IllegalActionError if either action is not legal.
     */
    BattleSnapshot resolve_turn(const BattleSnapshot& snapshot,
                                const Action& side0_action,
                                const Action& side1_action,
                                RandomSource& rng) const;

    const BattleConfig& battle_config() const { return battle_; }

private:
    BattleConfig battle_;
    std::map<ElixirTier, ElixirSpec> elixirs_;

    double damage_multiplier(const Combatant& attacker,
                             const Combatant& defender,
                             ElementType field) const;

    int base_damage(const Combatant& attacker, const Combatant& defender) const;

    void require_legal(const BattleSnapshot& snapshot, SideId side, const Action& action) const;

    void apply_support(SideState& state, const Action& action) const;
};

/**
 * Sum of both sides' HP used to settle a battle that ran out of time.
 */
MatchResult decide_by_hp(const BattleSnapshot& snapshot);

} // namespace arena
