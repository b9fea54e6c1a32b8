/**
 * Pokemon Battle Arena Engine - Match Driver Implementation
 */

#include "match.hpp"
#include "errors.hpp"
#include <iostream>

namespace arena {

Match::Match(const ArenaConfig& config, uint64_t seed, BattleLogger* logger)
    : config_(config)
    , seed_(seed)
    , logger_(logger) {
    for (const TeamSpec& team : config_.match.teams) {
        if (team.species.empty()) {
            throw EmptyRosterError("EmptyRoster: " + team.trainer_name + " has no species");
        }
    }
    setup();
}

Cell Match::start_cell(SideId side) const {
    // Opposite corners, one cell in from the border
    if (side == 0) {
        return Cell(config_.grid.rows - 2, 1);
    }
    return Cell(1, config_.grid.cols - 2);
}

void Match::setup() {
    rng_ = std::make_shared<SeededRandom>(seed_);

    for (SideId side = 0; side < NUM_SIDES; side++) {
        auto agent_rng = std::make_shared<SeededRandom>(seed_ + 1 + side);
        agents_[side] = std::make_unique<AgentFacade>(
            side, config_.match.teams[side].trainer_name, config_, agent_rng);
        agents_[side]->set_logger(logger_);
    }

    snapshot_ = BattleSnapshot();
    snapshot_.field_type = ALL_ELEMENT_TYPES[rng_->pick(ALL_ELEMENT_TYPES.size())];

    grid_ = generate_grid(config_.grid, *rng_);

    std::array<std::vector<CatchTarget>, NUM_SIDES> targets;
    for (SideId side = 0; side < NUM_SIDES; side++) {
        Cell start = start_cell(side);
        if (grid_.in_bounds(start)) {
            grid_.set_obstacle(start, false);
        }
        targets[side] = spawn_targets(grid_, config_.match.teams[side].species, *rng_);
    }

    phase_ = MatchPhase::CATCHING;
    outcome_ = MatchOutcome();
    paused_ = false;
    tick_count_ = 0;
    phase_tick_ = 0;

    for (SideId side = 0; side < NUM_SIDES; side++) {
        agents_[side]->begin_catching(grid_, start_cell(side), targets[side]);
    }

    std::cout << "[Match] Seed " << seed_ << " | field " << to_string(snapshot_.field_type)
              << " | grid " << grid_.rows() << "x" << grid_.cols()
              << " with " << grid_.obstacle_count() << " obstacles" << std::endl;

    if (logger_) {
        logger_->log_note("Seed " + std::to_string(seed_) + ", field " + to_string(snapshot_.field_type));
        logger_->log_phase(phase_, tick_count_);
    }
}

void Match::restart(uint64_t seed) {
    seed_ = seed;
    setup();
}

// ============================================================================
// GAME LOOP
// ============================================================================

MatchPhase Match::tick() {
    if (paused_ || is_over()) {
        return phase_;
    }

    tick_count_++;
    phase_tick_++;

    switch (phase_) {
        case MatchPhase::CATCHING:
            tick_catching();
            break;
        case MatchPhase::SHOPPING:
            tick_shopping();
            break;
        case MatchPhase::BATTLING:
            tick_battling();
            break;
        case MatchPhase::GAME_OVER:
            break;
    }
    return phase_;
}

MatchOutcome Match::run_to_completion() {
    resume();
    while (!is_over()) {
        tick();
    }
    return outcome_;
}

void Match::enter_phase(MatchPhase next) {
    phase_ = next;
    phase_tick_ = 0;

    std::cout << "[Match] Phase: " << to_string(next) << std::endl;
    if (logger_) {
        logger_->log_phase(next, tick_count_);
    }
}

void Match::tick_catching() {
    bool all_done = true;
    for (SideId side = 0; side < NUM_SIDES; side++) {
        AgentFacade& agent = *agents_[side];
        if (!agent.catching_finished()) {
            CatchTick step = agent.catch_tick();
            if (logger_) {
                logger_->log_catch_tick(agent.name(), tick_count_, step);
            }
        }
        all_done = all_done && agent.catching_finished();
    }

    if (all_done || phase_tick_ >= config_.match.catch_phase_ticks) {
        enter_phase(MatchPhase::SHOPPING);
    }
}

void Match::tick_shopping() {
    for (SideId side = 0; side < NUM_SIDES; side++) {
        agents_[side]->shop();
    }

    build_snapshot();
    enter_phase(MatchPhase::BATTLING);
    if (logger_) {
        logger_->log_snapshot(snapshot_);
    }
}

void Match::build_snapshot() {
    for (SideId side = 0; side < NUM_SIDES; side++) {
        const TeamSpec& team = config_.match.teams[side];
        SideState& state = snapshot_.side(side);

        std::vector<Combatant> members;
        for (const auto& [species, type] : team.species) {
            members.emplace_back(species, type,
                                 config_.battle.default_max_hp,
                                 config_.battle.default_attack,
                                 config_.battle.default_defense);
        }

        state.trainer_name = team.trainer_name;
        state.roster = Roster(std::move(members));
        state.resources = agents_[side]->resources();
        state.defending = false;
    }
    snapshot_.to_move = 0;
    snapshot_.ply = 0;
}

void Match::tick_battling() {
    if (snapshot_.is_over()) {
        finish(snapshot_.side(0).is_defeated() ? MatchResult::SIDE_1_WIN : MatchResult::SIDE_0_WIN,
               "knockout");
        return;
    }

    std::array<Action, NUM_SIDES> actions;
    for (SideId side = 0; side < NUM_SIDES; side++) {
        AgentFacade& agent = *agents_[side];
        actions[side] = agent.choose_action(snapshot_);
        if (logger_) {
            logger_->log_decision(tick_count_, agent.name(), agent.last_advice(), agent.last_search());
        }
    }

    snapshot_ = agents_[0]->engine().rules().resolve_turn(snapshot_, actions[0], actions[1], *rng_);
    outcome_.battle_turns++;

    for (SideId side = 0; side < NUM_SIDES; side++) {
        agents_[side]->set_resources(snapshot_.side(side).resources);
    }

    if (logger_) {
        logger_->log_snapshot(snapshot_);
    }

    if (snapshot_.is_over()) {
        finish(snapshot_.side(0).is_defeated() ? MatchResult::SIDE_1_WIN : MatchResult::SIDE_0_WIN,
               "knockout");
        return;
    }

    if (phase_tick_ >= config_.match.battle_phase_ticks) {
        finish(decide_by_hp(snapshot_), "time up");
    }
}

void Match::finish(MatchResult result, const std::string& reason) {
    phase_ = MatchPhase::GAME_OVER;
    outcome_.result = result;
    outcome_.reason = reason;
    outcome_.ticks = tick_count_;
    outcome_.final_snapshot = snapshot_;

    for (SideId side = 0; side < NUM_SIDES; side++) {
        agents_[side]->finish();
    }

    std::cout << "[Match] Game over: " << to_string(result) << " (" << reason << ")" << std::endl;
    if (logger_) {
        logger_->log_match_end(result, reason);
    }
}

} // namespace arena
