/**
 * Pokemon Battle Arena Engine - Battle Logger
 *
 * Linear trace of a match for debugging: phase changes, every catching
 * step, purchases, each battle decision with its search diagnostics, and
 * full snapshots after each resolved turn.
 */

#pragma once

#include "adversarial_search.hpp"
#include "purchase_planner.hpp"
#include <fstream>

namespace arena {

struct CatchTick;

/**
 * BattleLogger - Timestamped trace file for one match.
 */
class BattleLogger {
public:
    /**
     * Constructor - creates arena_match_YYYYmmdd_HHMMSS.log in output_dir.
     *
     * @param output_dir Directory for log files
     * @param enabled When false no file is created and every call is a no-op
     */
    explicit BattleLogger(const std::string& output_dir = "arena_logs", bool enabled = true);

    ~BattleLogger();

    BattleLogger(const BattleLogger&) = delete;
    BattleLogger& operator=(const BattleLogger&) = delete;

    /**
     * Log a phase header.
     */
    void log_phase(MatchPhase phase, int tick);

    /**
     * Log one movement tick of one agent.
     */
    void log_catch_tick(const std::string& agent, int tick, const CatchTick& step);

    void log_purchase(const std::string& agent, const PurchasePlan& plan);

    /**
     * Log a battle decision with the advice and root scores behind it.
     */
    void log_decision(int tick,
                      const std::string& agent,
                      const Advice& advice,
                      const SearchResult& result);

    /**
     * Log complete battle state for both sides.
     */
    void log_snapshot(const BattleSnapshot& snapshot);

    void log_note(const std::string& message);

    /**
     * Log match end result.
     */
    void log_match_end(MatchResult result, const std::string& reason);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled && log_file_.is_open(); }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    std::string format_combatant_line(const Combatant& combatant, bool active) const;

    static std::string timestamp(const char* format);
};

} // namespace arena
