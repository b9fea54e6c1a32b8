/**
 * Pokemon Battle Arena Engine - Battle Logger Implementation
 */

#include "battle_logger.hpp"
#include "agent.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace arena {

BattleLogger::BattleLogger(const std::string& output_dir, bool enabled)
    : enabled_(enabled) {

    if (!enabled_) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[Battle Logger] Failed to create " << output_dir << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    log_path_ = output_dir + "/arena_match_" + timestamp("%Y%m%d_%H%M%S") + ".log";

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[Battle Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "ARENA MATCH LOG - LINEAR DECISION TRACE\n";
    log_file_ << "Started: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[Battle Logger] Logging to: " << log_path_ << std::endl;
}

BattleLogger::~BattleLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string BattleLogger::timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

std::string BattleLogger::format_combatant_line(const Combatant& combatant, bool active) const {
    std::ostringstream line;
    line << (active ? "  > " : "    ") << combatant.species
         << " [" << to_string(combatant.type) << "]"
         << " | HP: " << std::max(0, combatant.hp) << "/" << combatant.max_hp
         << " | ATK " << combatant.attack << " DEF " << combatant.defense;
    if (combatant.is_fainted()) {
        line << " | FAINTED";
    }
    return line.str();
}

void BattleLogger::log_phase(MatchPhase phase, int tick) {
    if (!enabled_) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TICK " << tick << "] PHASE: " << to_string(phase) << "\n";
    log_file_ << std::string(80, '#') << "\n\n";
    log_file_.flush();
}

void BattleLogger::log_catch_tick(const std::string& agent, int tick, const CatchTick& step) {
    if (!enabled_) return;

    log_file_ << "[TICK " << tick << " | " << agent << "] at " << step.position.to_string();
    if (step.replanned) log_file_ << " | replanned";
    if (step.moved) log_file_ << " | moved";
    if (step.path_not_found) log_file_ << " | no path, holding";
    if (step.caught_species) log_file_ << " | CAUGHT " << *step.caught_species;
    if (step.out_of_fuel) log_file_ << " | out of fuel";
    if (step.finished) log_file_ << " | done";
    log_file_ << "\n";
    log_file_.flush();
}

void BattleLogger::log_purchase(const std::string& agent, const PurchasePlan& plan) {
    if (!enabled_) return;

    log_file_ << "[SHOP | " << agent << "] " << plan.to_string() << "\n";
    log_file_.flush();
}

void BattleLogger::log_decision(int tick,
                                const std::string& agent,
                                const Advice& advice,
                                const SearchResult& result) {
    if (!enabled_) return;

    log_file_ << "[TICK " << tick << " | " << agent << "] ACTION: " << result.action.to_string();
    if (!result.searched) {
        log_file_ << " (no search)\n";
        log_file_.flush();
        return;
    }

    log_file_ << " | score " << result.score
              << " | nodes " << result.nodes_visited
              << " | advice heal=" << advice.heal << " swap=" << advice.swap << "\n";

    log_file_ << "    root: [";
    for (size_t i = 0; i < result.root_scores.size(); i++) {
        if (i > 0) log_file_ << ", ";
        log_file_ << result.root_scores[i].action.to_string() << "=" << result.root_scores[i].score;
    }
    log_file_ << "]\n";
    if (result.best_actions.size() > 1) {
        log_file_ << "    tie-break among " << result.best_actions.size() << " actions\n";
    }
    log_file_.flush();
}

void BattleLogger::log_snapshot(const BattleSnapshot& snapshot) {
    if (!enabled_) return;

    log_file_ << std::string(80, '=') << "\n";

    for (SideId id = 0; id < NUM_SIDES; id++) {
        const SideState& side = snapshot.side(id);
        log_file_ << "[SIDE " << static_cast<int>(id) << ": " << side.trainer_name << "]\n";

        for (int i = 0; i < side.roster.size(); i++) {
            bool active = i == side.roster.active_index && !side.is_defeated();
            log_file_ << format_combatant_line(side.roster.members[i], active) << "\n";
        }

        log_file_ << "ELIXIRS: ";
        for (ElixirTier tier : ALL_ELIXIR_TIERS) {
            log_file_ << to_string(tier) << "=" << side.resources.elixir_count(tier) << " ";
        }
        log_file_ << "| Coins: " << side.resources.coins << "\n\n";
    }

    log_file_ << "Field: " << to_string(snapshot.field_type) << " | Ply: " << snapshot.ply << "\n";
    log_file_ << std::string(80, '=') << "\n\n";
    log_file_.flush();
}

void BattleLogger::log_note(const std::string& message) {
    if (!enabled_) return;

    log_file_ << "[NOTE] " << message << "\n";
    log_file_.flush();
}

void BattleLogger::log_match_end(MatchResult result, const std::string& reason) {
    if (!enabled_) return;

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "MATCH END\n";
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "Result: " << to_string(result) << "\n";
    log_file_ << "Reason: " << reason << "\n";
    log_file_ << "Ended: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n";
    log_file_.flush();
}

} // namespace arena
