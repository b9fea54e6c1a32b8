/**
 * Pokemon Battle Arena Engine - Decision Engine Implementation
 */

#include "decision_engine.hpp"
#include <stdexcept>

namespace arena {

DecisionEngine::DecisionEngine(const ArenaConfig& config, uint64_t seed)
    : DecisionEngine(config, std::make_shared<SeededRandom>(seed))
{}

DecisionEngine::DecisionEngine(const ArenaConfig& config, std::shared_ptr<RandomSource> rng)
    : config_(config)
    , advisor_(config)
    , search_(config)
    , rng_(std::move(rng))
{
    if (!rng_) {
        throw std::invalid_argument("DecisionEngine requires a random source");
    }
}

// ============================================================================
// CORE API
// ============================================================================

PathResult DecisionEngine::find_path(const Grid& grid, const Cell& start, const Cell& goal) const {
    return arena::find_path(grid, start, goal);
}

Action DecisionEngine::choose_action(const BattleSnapshot& snapshot, SideId side) {
    return analyze(snapshot, side).action;
}

SearchResult DecisionEngine::analyze(const BattleSnapshot& snapshot, SideId side) {
    validate_snapshot(snapshot, side);

    // Defeated side: no-op, no search
    if (snapshot.side(side).is_defeated()) {
        SearchResult result;
        result.action = Action::defend();
        result.best_actions = {result.action};
        return result;
    }

    Advice advice = advisor_.advise(snapshot, side);
    return search_.decide(snapshot, side, advice, *rng_);
}

Advice DecisionEngine::advise(const BattleSnapshot& snapshot, SideId side) const {
    return advisor_.advise(snapshot, side);
}

PurchasePlan DecisionEngine::plan_purchases(int budget,
                                            const PriceTable& prices,
                                            const HealTable& heals) const {
    return arena::plan_purchases(budget, prices, heals, config_.economy.purchase_strategy);
}

} // namespace arena
