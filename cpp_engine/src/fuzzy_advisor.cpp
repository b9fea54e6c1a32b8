/**
 * Pokemon Battle Arena Engine - Fuzzy Advisor Implementation
 */

#include "fuzzy_advisor.hpp"
#include <algorithm>

namespace arena {

FuzzyAdvisor::FuzzyAdvisor(const FuzzyConfig& fuzzy, const BattleConfig& battle)
    : fuzzy_(fuzzy)
    , battle_(battle)
{}

FuzzyAdvisor::FuzzyAdvisor(const ArenaConfig& config)
    : FuzzyAdvisor(config.fuzzy, config.battle)
{}

HpBand FuzzyAdvisor::classify(double hp_ratio) const {
    if (hp_ratio < fuzzy_.low_threshold) {
        return HpBand::LOW;
    }
    if (hp_ratio > fuzzy_.high_threshold) {
        return HpBand::HIGH;
    }
    return HpBand::MEDIUM;
}

Advice FuzzyAdvisor::evaluate(double own_ratio, double enemy_ratio, bool disadvantaged) const {
    const HpBand own = classify(own_ratio);
    const HpBand enemy = classify(enemy_ratio);

    Advice advice;
    for (const auto& rule : fuzzy_.rules) {
        if (rule.own != own) continue;
        if (rule.enemy.has_value() && *rule.enemy != enemy) continue;
        if (rule.requires_disadvantage && !disadvantaged) continue;

        double w = std::clamp(rule.weight, 0.0, 1.0);
        if (rule.action == AdviceKind::HEAL) {
            advice.heal = std::max(advice.heal, w);
        } else {
            advice.swap = std::max(advice.swap, w);
        }
    }
    return advice;
}

Advice FuzzyAdvisor::advise(const BattleSnapshot& snapshot, SideId side) const {
    validate_snapshot(snapshot, side);

    const SideState& me = snapshot.side(side);
    const SideState& enemy = snapshot.opponent(side);
    if (me.is_defeated() || enemy.is_defeated()) {
        return Advice{};
    }

    const Combatant& own_active = me.roster.members[me.roster.live_active_index()];
    const Combatant& enemy_active = enemy.roster.members[enemy.roster.live_active_index()];

    return evaluate(own_active.hp_ratio(),
                    enemy_active.hp_ratio(),
                    battle_.is_disadvantaged(own_active.type, enemy_active.type));
}

} // namespace arena
