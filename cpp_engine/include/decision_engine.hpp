/**
 * Pokemon Battle Arena Engine - Decision Engine
 *
 * The three entry points the surrounding game calls once per decision tick:
 * find_path() for catching, choose_action() for battling and
 * plan_purchases() for shopping.
 */

#pragma once

#include "adversarial_search.hpp"
#include "fuzzy_advisor.hpp"
#include "pathfinder.hpp"
#include "purchase_planner.hpp"
#include <memory>

namespace arena {

/**
 * DecisionEngine - Pure computation over the state it is handed.
 *
 * Not thread-safe: choose_action() draws tie-breaks from the engine's random
 * source. Give each agent its own engine.
 */
class DecisionEngine {
public:
    /**
     * Engine with its own seeded random source.
     */
    DecisionEngine(const ArenaConfig& config, uint64_t seed);

    /**
     * Engine drawing from an injected random source.
     */
    DecisionEngine(const ArenaConfig& config, std::shared_ptr<RandomSource> rng);

    ~DecisionEngine() = default;

    // ========================================================================
    // CORE API
    // ========================================================================

    PathResult find_path(const Grid& grid, const Cell& start, const Cell& goal) const;

    /**
     * Advise then search. A side with no alive combatants gets DEFEND
     * without search. Throws EmptyRosterError for an empty roster.
     */
    Action choose_action(const BattleSnapshot& snapshot, SideId side);

    /**
     * Same as choose_action() but returns the full search diagnostics.
     */
    SearchResult analyze(const BattleSnapshot& snapshot, SideId side);

    Advice advise(const BattleSnapshot& snapshot, SideId side) const;

    /**
     * Elixir counts per tier, using the configured purchase strategy.
     */
    PurchasePlan plan_purchases(int budget, const PriceTable& prices, const HealTable& heals) const;

    // ========================================================================
    // ACCESS
    // ========================================================================

    const ArenaConfig& config() const { return config_; }
    const BattleRules& rules() const { return search_.rules(); }
    const AdversarialSearch& search() const { return search_; }
    const FuzzyAdvisor& advisor() const { return advisor_; }
    RandomSource& random_source() { return *rng_; }

private:
    ArenaConfig config_;
    FuzzyAdvisor advisor_;
    AdversarialSearch search_;
    std::shared_ptr<RandomSource> rng_;
};

} // namespace arena
