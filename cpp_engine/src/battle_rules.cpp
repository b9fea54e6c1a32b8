/**
 * Pokemon Battle Arena Engine - Battle Rules Implementation
 */

#include "battle_rules.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace arena {

BattleRules::BattleRules(const ArenaConfig& config)
    : battle_(config.battle)
    , elixirs_(config.economy.elixirs)
{}

// ============================================================================
// LEGALITY
// ============================================================================

std::vector<Action> BattleRules::legal_actions(const BattleSnapshot& snapshot, SideId side) const {
    const SideState& me = snapshot.side(side);

    if (me.is_defeated()) {
        return {Action::defend()};
    }

    std::vector<Action> actions;
    actions.push_back(Action::attack());
    actions.push_back(Action::defend());

    for (ElixirTier tier : ALL_ELIXIR_TIERS) {
        if (me.resources.has_elixir(tier)) {
            actions.push_back(Action::heal(tier));
        }
    }

    const int live = me.roster.live_active_index();
    for (int i = 0; i < me.roster.size(); i++) {
        if (i != live && me.roster.members[i].is_alive()) {
            actions.push_back(Action::swap(i));
        }
    }

    return actions;
}

bool BattleRules::is_legal(const BattleSnapshot& snapshot, SideId side, const Action& action) const {
    const SideState& me = snapshot.side(side);

    if (me.is_defeated()) {
        return action.action_type == ActionType::DEFEND;
    }

    switch (action.action_type) {
        case ActionType::ATTACK:
        case ActionType::DEFEND:
            return true;

        case ActionType::HEAL:
            return action.tier.has_value() && me.resources.has_elixir(*action.tier);

        case ActionType::SWAP:
            return action.swap_index.has_value()
                && me.roster.has_member(*action.swap_index)
                && *action.swap_index != me.roster.live_active_index()
                && me.roster.members[*action.swap_index].is_alive();

        default:
            return false;
    }
}

void BattleRules::require_legal(const BattleSnapshot& snapshot, SideId side, const Action& action) const {
    if (!is_legal(snapshot, side, action)) {
        throw IllegalActionError("IllegalAction: " + action.to_string() +
                                 " for side " + std::to_string(static_cast<int>(side)));
    }
}

// ============================================================================
// DAMAGE
// ============================================================================

int BattleRules::base_damage(const Combatant& attacker, const Combatant& defender) const {
    return std::max(battle_.damage_floor, attacker.attack - defender.defense / 2);
}

double BattleRules::damage_multiplier(const Combatant& attacker,
                                      const Combatant& defender,
                                      ElementType field) const {
    double mult = battle_.advantage(attacker.type, defender.type);
    if (attacker.type == field) {
        mult *= battle_.field_boost;
    }
    return mult;
}

int BattleRules::expected_damage(const Combatant& attacker,
                                 const Combatant& defender,
                                 ElementType field) const {
    double dmg = base_damage(attacker, defender) * damage_multiplier(attacker, defender, field);
    return static_cast<int>(std::lround(dmg));
}

int BattleRules::rolled_damage(const Combatant& attacker,
                               const Combatant& defender,
                               ElementType field,
                               RandomSource& rng) const {
    double jitter = rng.uniform(battle_.jitter_min, battle_.jitter_max);
    double dmg = base_damage(attacker, defender) * damage_multiplier(attacker, defender, field) * jitter;
    return static_cast<int>(std::lround(dmg));
}

int BattleRules::guarded(int damage) const {
    return static_cast<int>(damage * battle_.defend_factor);
}

int BattleRules::heal_amount(ElixirTier tier) const {
    auto it = elixirs_.find(tier);
    return it != elixirs_.end() ? it->second.heal : 0;
}

// ============================================================================
// TRANSITIONS
// ============================================================================

void BattleRules::apply_support(SideState& state, const Action& action) const {
    if (action.is_swap()) {
        state.roster.active_index = *action.swap_index;
    } else if (action.is_heal()) {
        if (state.resources.consume_elixir(*action.tier)) {
            state.roster.active().heal(heal_amount(*action.tier));
        }
    }
}

BattleSnapshot BattleRules::apply_action(const BattleSnapshot& snapshot,
                                         SideId side,
                                         const Action& action) const {
    require_legal(snapshot, side, action);

    BattleSnapshot next = snapshot;
    next.normalize_actives();
    SideState& me = next.side(side);
    SideState& enemy = next.opponent(side);

    me.defending = false;

    if (!me.is_defeated()) {
        switch (action.action_type) {
            case ActionType::ATTACK:
                if (!enemy.is_defeated()) {
                    int dmg = expected_damage(me.roster.active(), enemy.roster.active(), next.field_type);
                    if (enemy.defending) {
                        dmg = guarded(dmg);
                    }
                    enemy.roster.active().take_damage(dmg);
                    enemy.roster.promote_if_fainted();
                }
                break;

            case ActionType::DEFEND:
                me.defending = true;
                break;

            case ActionType::HEAL:
            case ActionType::SWAP:
                apply_support(me, action);
                break;
        }
    }

    next.to_move = opponent_of(side);
    next.ply++;
    return next;
}

BattleSnapshot BattleRules::resolve_turn(const BattleSnapshot& snapshot,
                                         const Action& side0_action,
                                         const Action& side1_action,
                                         RandomSource& rng) const {
    require_legal(snapshot, 0, side0_action);
    require_legal(snapshot, 1, side1_action);

    BattleSnapshot next = snapshot;
    next.normalize_actives();
    const std::array<Action, NUM_SIDES> actions = {side0_action, side1_action};

    for (SideId id = 0; id < NUM_SIDES; id++) {
        SideState& state = next.side(id);
        state.defending = actions[id].action_type == ActionType::DEFEND;
        if (!state.is_defeated()) {
            apply_support(state, actions[id]);
        }
    }

    for (SideId id = 0; id < NUM_SIDES; id++) {
        if (actions[id].action_type != ActionType::ATTACK) {
            continue;
        }

        SideState& attacker = next.side(id);
        SideState& defender = next.opponent(id);
        if (attacker.is_defeated() || defender.is_defeated()) {
            continue;
        }

        Combatant& att = attacker.roster.active();
        Combatant& def = defender.roster.active();
        if (att.is_fainted() || def.is_fainted()) {
            continue;
        }

        int dmg = rolled_damage(att, def, next.field_type, rng);
        if (defender.defending) {
            dmg = guarded(dmg);
        }
        def.take_damage(dmg);
    }

    for (SideId id = 0; id < NUM_SIDES; id++) {
        next.side(id).roster.promote_if_fainted();
        next.side(id).defending = false;
    }

    next.ply += NUM_SIDES;
    return next;
}

MatchResult decide_by_hp(const BattleSnapshot& snapshot) {
    int hp0 = snapshot.side(0).roster.total_hp();
    int hp1 = snapshot.side(1).roster.total_hp();
    if (hp0 > hp1) return MatchResult::SIDE_0_WIN;
    if (hp1 > hp0) return MatchResult::SIDE_1_WIN;
    return MatchResult::DRAW;
}

} // namespace arena
