/**
 * Pokemon Battle Arena Engine - Agent Facade
 *
 * One trainer's controller. Owns a DecisionEngine and drives it through the
 * match phases: walking the grid to catch targets, buying elixirs, then
 * choosing battle actions.
 */

#pragma once

#include "battle_logger.hpp"
#include "decision_engine.hpp"
#include "world.hpp"

namespace arena {

/**
 * Outcome of a single catching tick.
 */
struct CatchTick {
    Cell position;
    bool moved = false;
    bool replanned = false;
    bool path_not_found = false;
    bool out_of_fuel = false;
    bool finished = false;
    std::optional<std::string> caught_species;
};

/**
 * AgentFacade - Phase state machine for one side.
 *
 * Phases only move forward (Idle -> Catching -> Shopping -> Battling ->
 * Done). reset() is the only way back to Idle.
 */
class AgentFacade {
public:
    AgentFacade(SideId side,
                std::string name,
                const ArenaConfig& config,
                std::shared_ptr<RandomSource> rng);

    // ========================================================================
    // PHASES
    // ========================================================================

    AgentPhase phase() const { return phase_; }

    /**
     * Request a phase change. Returns false (and logs) if the request
     * would move backwards or stay in place.
     */
    bool enter_phase(AgentPhase next);

    void finish() { enter_phase(AgentPhase::DONE); }

    /**
     * Back to Idle with fresh starting resources.
     */
    void reset();

    // ========================================================================
    // CATCHING
    // ========================================================================

    /**
     * Start catching on `grid` from `start`. The grid must outlive the
     * catching phase.
     */
    void begin_catching(const Grid& grid, const Cell& start, std::vector<CatchTarget> targets);

    /**
     * Advance one cell toward the nearest uncaught target that has a route.
     * If no remaining target is reachable the agent holds position and
     * reports path_not_found.
     */
    CatchTick catch_tick();

    bool catching_finished() const { return catching_done_; }

    const Cell& position() const { return position_; }
    const std::vector<std::string>& caught() const { return caught_; }
    const std::vector<CatchTarget>& targets() const { return targets_; }

    // ========================================================================
    // SHOPPING
    // ========================================================================

    /**
     * Buy elixirs with the current coins (or `budget` if given, capped at
     * the coins held).
     */
    PurchasePlan shop(std::optional<int> budget = std::nullopt);

    // ========================================================================
    // BATTLING
    // ========================================================================

    /**
     * Choose this side's action on `snapshot`. Enters Battling on first use.
     * A defeated side (or a finished agent) gets Defend without search.
     *
     * Throws EmptyRosterError if either side has no combatants.
     */
    Action choose_action(const BattleSnapshot& snapshot);

    const SearchResult& last_search() const { return last_search_; }
    const Advice& last_advice() const { return last_advice_; }

    // ========================================================================
    // ACCESS
    // ========================================================================

    SideId side() const { return side_; }
    const std::string& name() const { return name_; }

    const Resources& resources() const { return resources_; }
    void set_resources(const Resources& resources) { resources_ = resources; }

    DecisionEngine& engine() { return engine_; }
    const DecisionEngine& engine() const { return engine_; }

    void set_logger(BattleLogger* logger) { logger_ = logger; }

private:
    SideId side_;
    std::string name_;
    DecisionEngine engine_;
    AgentPhase phase_ = AgentPhase::IDLE;
    Resources resources_;

    // Catching state
    const Grid* grid_ = nullptr;
    Cell position_;
    std::vector<CatchTarget> targets_;
    std::vector<bool> target_caught_;
    // Targets with no route from the current position, skipped until a catch
    // or until every remaining target is blocked
    std::vector<bool> target_blocked_;
    std::vector<std::string> caught_;
    Path path_;
    size_t path_step_ = 0;
    int goal_target_ = -1;
    bool catching_done_ = false;

    SearchResult last_search_;
    Advice last_advice_;

    BattleLogger* logger_ = nullptr;

    int nearest_target() const;
    bool all_targets_caught() const;
    void reset_resources();
    std::string log_prefix() const;
};

} // namespace arena
