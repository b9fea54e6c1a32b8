/**
 * Pokemon Battle Arena Engine - Agent Facade Implementation
 */

#include "agent.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>

namespace arena {

AgentFacade::AgentFacade(SideId side,
                         std::string name,
                         const ArenaConfig& config,
                         std::shared_ptr<RandomSource> rng)
    : side_(side)
    , name_(std::move(name))
    , engine_(config, std::move(rng)) {
    if (side_ >= NUM_SIDES) {
        throw std::invalid_argument("agent side must be 0 or 1");
    }
    reset_resources();
}

std::string AgentFacade::log_prefix() const {
    return "[Agent " + name_ + "] ";
}

void AgentFacade::reset_resources() {
    resources_ = Resources();
    resources_.coins = engine_.config().economy.coins_per_agent;
    resources_.fuel = engine_.config().economy.start_fuel;
}

// ============================================================================
// PHASES
// ============================================================================

bool AgentFacade::enter_phase(AgentPhase next) {
    if (static_cast<int>(next) <= static_cast<int>(phase_)) {
        std::cerr << log_prefix() << "Rejected phase change "
                  << to_string(phase_) << " -> " << to_string(next) << std::endl;
        return false;
    }

    std::cout << log_prefix() << to_string(phase_) << " -> " << to_string(next) << std::endl;
    phase_ = next;
    return true;
}

void AgentFacade::reset() {
    phase_ = AgentPhase::IDLE;
    reset_resources();

    grid_ = nullptr;
    position_ = Cell();
    targets_.clear();
    target_caught_.clear();
    target_blocked_.clear();
    caught_.clear();
    path_.clear();
    path_step_ = 0;
    goal_target_ = -1;
    catching_done_ = false;

    last_search_ = SearchResult();
    last_advice_ = Advice();
}

// ============================================================================
// CATCHING
// ============================================================================

void AgentFacade::begin_catching(const Grid& grid, const Cell& start, std::vector<CatchTarget> targets) {
    if (phase_ != AgentPhase::CATCHING) {
        enter_phase(AgentPhase::CATCHING);
    }

    grid_ = &grid;
    position_ = start;
    targets_ = std::move(targets);
    target_caught_.assign(targets_.size(), false);
    target_blocked_.assign(targets_.size(), false);
    caught_.clear();
    path_.clear();
    path_step_ = 0;
    goal_target_ = -1;
    catching_done_ = targets_.empty();
}

bool AgentFacade::all_targets_caught() const {
    for (bool done : target_caught_) {
        if (!done) return false;
    }
    return true;
}

int AgentFacade::nearest_target() const {
    int best = -1;
    int best_distance = std::numeric_limits<int>::max();

    // Strict comparison keeps the earliest target on equal distance
    for (size_t i = 0; i < targets_.size(); i++) {
        if (target_caught_[i] || target_blocked_[i]) continue;
        int distance = manhattan(position_, targets_[i].cell);
        if (distance < best_distance) {
            best_distance = distance;
            best = static_cast<int>(i);
        }
    }
    return best;
}

CatchTick AgentFacade::catch_tick() {
    CatchTick step;
    step.position = position_;

    if (phase_ != AgentPhase::CATCHING || grid_ == nullptr || catching_done_) {
        step.finished = true;
        return step;
    }

    // Nearest target with a route; unreachable ones are skipped for now
    int target = nearest_target();
    while (target >= 0) {
        // Keep following the current path unless the goal changed or it ran out
        if (target == goal_target_ && path_step_ + 1 < path_.size()) {
            break;
        }

        goal_target_ = target;
        path_.clear();
        path_step_ = 0;
        if (position_ == targets_[target].cell) {
            break;
        }

        step.replanned = true;
        PathResult planned = engine_.find_path(*grid_, position_, targets_[target].cell);
        if (planned) {
            path_ = std::move(*planned);
            break;
        }
        target_blocked_[target] = true;
        target = nearest_target();
    }

    if (target < 0) {
        if (all_targets_caught()) {
            catching_done_ = true;
            step.finished = true;
            return step;
        }

        // Nothing reachable: hold position and retry every target next tick
        target_blocked_.assign(targets_.size(), false);
        goal_target_ = -1;
        step.path_not_found = true;
        return step;
    }

    if (path_step_ + 1 < path_.size()) {
        path_step_++;
        position_ = path_[path_step_];
        step.moved = true;
        step.position = position_;
    }

    if (position_ == targets_[target].cell) {
        int cost = engine_.config().economy.fuel_per_catch;
        if (!resources_.spend_fuel(cost)) {
            std::cout << log_prefix() << "Out of fuel at " << position_.to_string() << std::endl;
            catching_done_ = true;
            step.out_of_fuel = true;
            step.finished = true;
            return step;
        }

        target_caught_[target] = true;
        target_blocked_.assign(targets_.size(), false);
        caught_.push_back(targets_[target].species);
        step.caught_species = targets_[target].species;
        path_.clear();
        path_step_ = 0;
        goal_target_ = -1;

        std::cout << log_prefix() << "Caught " << targets_[target].species
                  << " (fuel " << resources_.fuel << ")" << std::endl;

        if (all_targets_caught()) {
            catching_done_ = true;
            step.finished = true;
        }
    }

    return step;
}

// ============================================================================
// SHOPPING
// ============================================================================

PurchasePlan AgentFacade::shop(std::optional<int> budget) {
    if (phase_ != AgentPhase::SHOPPING) {
        enter_phase(AgentPhase::SHOPPING);
    }

    int spendable = budget ? std::min(*budget, resources_.coins) : resources_.coins;
    const EconomyConfig& economy = engine_.config().economy;

    PurchasePlan plan = engine_.plan_purchases(spendable, economy.price_table(), economy.heal_table());

    if (!resources_.spend_coins(plan.coins_spent)) {
        // Planner stays within budget, so this only happens with bad tables
        std::cerr << log_prefix() << "Purchase of " << plan.coins_spent
                  << " exceeds coins " << resources_.coins << std::endl;
        return PurchasePlan();
    }

    for (const auto& [tier, count] : plan.counts) {
        resources_.add_elixirs(tier, count);
    }

    std::cout << log_prefix() << "Bought " << plan.to_string() << std::endl;
    if (logger_) {
        logger_->log_purchase(name_, plan);
    }
    return plan;
}

// ============================================================================
// BATTLING
// ============================================================================

Action AgentFacade::choose_action(const BattleSnapshot& snapshot) {
    validate_snapshot(snapshot, side_);

    if (phase_ != AgentPhase::BATTLING && phase_ != AgentPhase::DONE) {
        enter_phase(AgentPhase::BATTLING);
    }

    last_advice_ = Advice();
    if (phase_ == AgentPhase::DONE || snapshot.side(side_).is_defeated()) {
        last_search_ = SearchResult();
        return Action::defend();
    }

    last_advice_ = engine_.advise(snapshot, side_);
    last_search_ = engine_.search().decide(snapshot, side_, last_advice_, engine_.random_source());
    return last_search_.action;
}

} // namespace arena
