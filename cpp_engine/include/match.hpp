/**
 * Pokemon Battle Arena Engine - Match Driver
 *
 * Runs a complete match between two agents on a seeded world: catching on
 * the grid, one shopping round, then simultaneous-turn battle until a side
 * is defeated or the battle clock runs out.
 */

#pragma once

#include "agent.hpp"
#include <memory>

namespace arena {

/**
 * Final result of a match.
 */
struct MatchOutcome {
    MatchResult result = MatchResult::ONGOING;
    std::string reason;
    int ticks = 0;
    int battle_turns = 0;
    BattleSnapshot final_snapshot;
};

/**
 * Match - Tick-driven game loop.
 *
 * All randomness (grid, spawns, field type, damage jitter) comes from the
 * match seed. Each agent gets its own random source derived from it.
 */
class Match {
public:
    // Throws EmptyRosterError if either configured team has no species
    Match(const ArenaConfig& config, uint64_t seed, BattleLogger* logger = nullptr);

    // Agents hold a pointer to grid_
    Match(const Match&) = delete;
    Match& operator=(const Match&) = delete;

    // ========================================================================
    // GAME LOOP
    // ========================================================================

    /**
     * Advance the current phase by one tick. Does nothing while paused or
     * once the match is over. Returns the phase after the tick.
     */
    MatchPhase tick();

    /**
     * Tick until the match is over. A paused match is resumed first.
     */
    MatchOutcome run_to_completion();

    void pause() { paused_ = true; }
    void resume() { paused_ = false; }
    bool is_paused() const { return paused_; }

    /**
     * Start over with a new seed.
     */
    void restart(uint64_t seed);

    // ========================================================================
    // QUERIES
    // ========================================================================

    MatchPhase phase() const { return phase_; }
    bool is_over() const { return phase_ == MatchPhase::GAME_OVER; }
    MatchResult result() const { return outcome_.result; }
    const MatchOutcome& outcome() const { return outcome_; }

    uint64_t seed() const { return seed_; }
    int tick_count() const { return tick_count_; }
    int phase_tick() const { return phase_tick_; }

    const Grid& grid() const { return grid_; }
    const BattleSnapshot& snapshot() const { return snapshot_; }
    ElementType field_type() const { return snapshot_.field_type; }

    AgentFacade& agent(SideId side) { return *agents_[side]; }
    const AgentFacade& agent(SideId side) const { return *agents_[side]; }

    const ArenaConfig& config() const { return config_; }

    // Starting cell of each side on the grid
    Cell start_cell(SideId side) const;

private:
    ArenaConfig config_;
    uint64_t seed_;
    BattleLogger* logger_;

    std::shared_ptr<SeededRandom> rng_;
    std::array<std::unique_ptr<AgentFacade>, NUM_SIDES> agents_;
    Grid grid_;
    BattleSnapshot snapshot_;

    MatchPhase phase_ = MatchPhase::CATCHING;
    MatchOutcome outcome_;
    bool paused_ = false;
    int tick_count_ = 0;
    int phase_tick_ = 0;

    void setup();
    void tick_catching();
    void tick_shopping();
    void tick_battling();
    void enter_phase(MatchPhase next);
    void build_snapshot();
    void finish(MatchResult result, const std::string& reason);
};

} // namespace arena
