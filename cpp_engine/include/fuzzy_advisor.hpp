/**
 * Pokemon Battle Arena Engine - Fuzzy Advisor
 *
 * Maps a battle snapshot to weighted Heal / Swap recommendations. The rule
 * base is a fixed table of (predicate, action, weight) rows from the
 * configuration; firing rules combine by maximum per action.
 */

#pragma once

#include "arena_config.hpp"
#include "battle_snapshot.hpp"

namespace arena {

/**
 * Advice - Recommendation weights in [0, 1].
 */
struct Advice {
    double heal = 0.0;
    double swap = 0.0;

    double weight(AdviceKind kind) const {
        return kind == AdviceKind::HEAL ? heal : swap;
    }

    // Weight for the advice kind an action falls under; 0 for ATTACK/DEFEND
    double weight_for(ActionType type) const {
        switch (type) {
            case ActionType::HEAL: return heal;
            case ActionType::SWAP: return swap;
            default: return 0.0;
        }
    }
};

/**
 * FuzzyAdvisor - Crisp-threshold fuzzy controller.
 */
class FuzzyAdvisor {
public:
    FuzzyAdvisor(const FuzzyConfig& fuzzy, const BattleConfig& battle);
    explicit FuzzyAdvisor(const ArenaConfig& config);

    /**
     * Low below the low threshold, High above the high threshold,
     * Medium otherwise.
     */
    HpBand classify(double hp_ratio) const;

    /**
     * Advice for `side` given its active combatant and the enemy's.
     *
     * Throws EmptyRosterError for a side with no combatants. A defeated side,
     * or a defeated enemy, gets zero advice.
     */
    Advice advise(const BattleSnapshot& snapshot, SideId side) const;

    /**
     * Evaluate the rule table on raw inputs.
     */
    Advice evaluate(double own_ratio, double enemy_ratio, bool disadvantaged) const;

    const std::vector<FuzzyRule>& rules() const { return fuzzy_.rules; }

private:
    FuzzyConfig fuzzy_;
    BattleConfig battle_;
};

} // namespace arena
