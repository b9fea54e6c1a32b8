/**
 * Pokemon Battle Arena Engine - Interactive Test Console
 *
 * Simple REPL for manual testing: step a seeded match tick by tick, inspect
 * the grid and battle state, and query the decision engine directly.
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <chrono>
#include <memory>

#include "arena_engine.hpp"

using namespace arena;

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::optional<int> parse_int(const std::string& s) {
    try {
        size_t used = 0;
        int value = std::stoi(s, &used);
        if (used != s.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void print_help() {
    std::cout << R"(
=== Pokemon Battle Arena Test Console ===

Commands:
  help                    - Show this help
  quit / exit             - Exit console

Match Control:
  load <config.json>      - Load configuration and start a new match
  new [seed]              - Start a new match (random seed if omitted)
  tick [n]                - Advance n ticks (default 1)
  run                     - Run the match to the end
  pause / resume          - Pause or resume the match clock

Inspection:
  show / s                - Show current match state
  grid                    - Draw the catching grid
  json                    - Dump the battle snapshot as JSON
  decide                  - Show each side's search on the current snapshot
  path <r> <c> <r> <c>    - A* path between two cells on the grid
  shop <budget>           - Plan a purchase for the given budget

Logging:
  log on|off              - Toggle the battle trace file

Examples:
  new 42                  # Seeded match
  tick 30                 # Walk the trainers for 30 ticks
  decide                  # Root scores for both sides
)" << std::endl;
}

// ============================================================================
// STATE DISPLAY
// ============================================================================

void show_side(const SideState& side, bool to_move) {
    std::cout << "  " << side.trainer_name << (to_move ? " *" : "")
              << (side.defending ? " [DEFENDING]" : "") << std::endl;

    for (int i = 0; i < side.roster.size(); i++) {
        const Combatant& c = side.roster.members[i];
        bool active = i == side.roster.active_index;
        std::cout << "    " << (active ? ">" : " ") << "[" << i << "] " << c.species
                  << " (" << to_string(c.type) << ") HP " << c.hp << "/" << c.max_hp
                  << (c.is_fainted() ? " FAINTED" : "") << std::endl;
    }

    std::cout << "    Elixirs:";
    for (ElixirTier tier : ALL_ELIXIR_TIERS) {
        std::cout << " " << to_string(tier) << "=" << side.resources.elixir_count(tier);
    }
    std::cout << " | Coins " << side.resources.coins << std::endl;
}

void show_match(const Match& match) {
    std::cout << "\n=== Match (seed " << match.seed() << ") ===" << std::endl;
    std::cout << "Phase: " << to_string(match.phase())
              << " | Tick " << match.tick_count() << " (phase tick " << match.phase_tick() << ")"
              << " | Field " << to_string(match.field_type())
              << (match.is_paused() ? " | PAUSED" : "") << std::endl;

    if (match.phase() == MatchPhase::CATCHING || match.phase() == MatchPhase::SHOPPING) {
        for (SideId side = 0; side < NUM_SIDES; side++) {
            const AgentFacade& agent = match.agent(side);
            std::cout << "  " << agent.name() << " at " << agent.position().to_string()
                      << " | fuel " << agent.resources().fuel
                      << " | caught " << agent.caught().size() << "/" << agent.targets().size()
                      << (agent.catching_finished() ? " (done)" : "") << std::endl;
        }
        return;
    }

    for (SideId side = 0; side < NUM_SIDES; side++) {
        show_side(match.snapshot().side(side), match.snapshot().to_move == side);
    }

    if (match.is_over()) {
        const MatchOutcome& outcome = match.outcome();
        std::cout << "Result: " << to_string(outcome.result) << " (" << outcome.reason << ") after "
                  << outcome.battle_turns << " battle turns" << std::endl;
    }
}

void show_grid(const Match& match) {
    const Grid& grid = match.grid();
    for (int r = 0; r < grid.rows(); r++) {
        std::string line;
        for (int c = 0; c < grid.cols(); c++) {
            Cell cell(r, c);
            char ch = grid.is_passable(cell) ? '.' : '#';
            for (SideId side = 0; side < NUM_SIDES; side++) {
                const AgentFacade& agent = match.agent(side);
                for (const auto& target : agent.targets()) {
                    if (target.cell == cell) ch = side == 0 ? 'a' : 'r';
                }
                if (agent.position() == cell) ch = side == 0 ? 'A' : 'R';
            }
            line += ch;
        }
        std::cout << "  " << line << std::endl;
    }
    std::cout << "  A/R = trainers, a/r = targets, # = obstacle" << std::endl;
}

void show_search(const AgentFacade& agent, const Advice& advice, const SearchResult& result) {
    std::cout << "  " << agent.name() << ": " << result.action.to_string()
              << " | advice heal=" << advice.heal << " swap=" << advice.swap << std::endl;
    if (!result.searched) {
        std::cout << "    (no search)" << std::endl;
        return;
    }
    for (const auto& scored : result.root_scores) {
        std::cout << "    " << scored.action.to_string() << " = " << scored.score << std::endl;
    }
    std::cout << "    nodes: " << result.nodes_visited << std::endl;
}

// ============================================================================
// CONSOLE
// ============================================================================

class Console {
public:
    ArenaConfig config;
    std::unique_ptr<BattleLogger> battle_logger;
    std::unique_ptr<Match> match;

    Console() {
        battle_logger = std::make_unique<BattleLogger>("arena_logs", false);
    }

    uint64_t clock_seed() const {
        return static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    }

    void cmd_load(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: load <config.json>" << std::endl;
            return;
        }
        if (!config.load_from_json(args[1])) {
            std::cout << "Config unchanged." << std::endl;
            return;
        }
        cmd_new({"new"});
    }

    void cmd_new(const std::vector<std::string>& args) {
        uint64_t seed = clock_seed();
        if (args.size() > 1) {
            auto parsed = parse_int(args[1]);
            if (!parsed || *parsed < 0) {
                std::cout << "Seed must be a non-negative integer." << std::endl;
                return;
            }
            seed = static_cast<uint64_t>(*parsed);
        }

        if (match) {
            match->restart(seed);
        } else {
            match = std::make_unique<Match>(config, seed, battle_logger.get());
        }
        show_match(*match);
    }

    void cmd_tick(const std::vector<std::string>& args) {
        int count = 1;
        if (args.size() > 1) {
            auto parsed = parse_int(args[1]);
            if (!parsed || *parsed < 1) {
                std::cout << "Usage: tick [n] (n >= 1)" << std::endl;
                return;
            }
            count = *parsed;
        }
        if (match->is_paused()) {
            std::cout << "Match is paused. Type 'resume' first." << std::endl;
            return;
        }
        for (int i = 0; i < count && !match->is_over(); i++) {
            match->tick();
        }
        show_match(*match);
    }

    void cmd_decide() {
        if (match->phase() != MatchPhase::BATTLING) {
            std::cout << "No battle in progress." << std::endl;
            return;
        }
        // Query fresh engines so the match's own random streams are untouched
        for (SideId side = 0; side < NUM_SIDES; side++) {
            DecisionEngine engine(config, clock_seed());
            const AgentFacade& agent = match->agent(side);
            Advice advice = engine.advise(match->snapshot(), side);
            SearchResult result = engine.analyze(match->snapshot(), side);
            show_search(agent, advice, result);
        }
    }

    void cmd_path(const std::vector<std::string>& args) {
        if (args.size() < 5) {
            std::cout << "Usage: path <row> <col> <row> <col>" << std::endl;
            return;
        }
        std::vector<int> coords;
        for (size_t i = 1; i < 5; i++) {
            auto parsed = parse_int(args[i]);
            if (!parsed) {
                std::cout << "Coordinates must be integers." << std::endl;
                return;
            }
            coords.push_back(*parsed);
        }

        PathResult path = find_path(match->grid(), Cell(coords[0], coords[1]), Cell(coords[2], coords[3]));
        if (!path) {
            std::cout << "No path." << std::endl;
            return;
        }
        std::cout << "Length " << path_length(*path) << ":";
        for (const Cell& cell : *path) {
            std::cout << " " << cell.to_string();
        }
        std::cout << std::endl;
    }

    void cmd_shop(const std::vector<std::string>& args) {
        int budget = config.economy.coins_per_agent;
        if (args.size() > 1) {
            auto parsed = parse_int(args[1]);
            if (!parsed) {
                std::cout << "Usage: shop <budget>" << std::endl;
                return;
            }
            budget = *parsed;
        }
        PurchasePlan plan = plan_purchases(budget, config.economy.price_table(),
                                           config.economy.heal_table(),
                                           config.economy.purchase_strategy);
        std::cout << plan.to_string() << std::endl;
    }

    void cmd_log(const std::vector<std::string>& args) {
        if (args.size() < 2 || (args[1] != "on" && args[1] != "off")) {
            std::cout << "Usage: log on|off" << std::endl;
            return;
        }
        if (args[1] == "on" && battle_logger->get_log_path().empty()) {
            battle_logger = std::make_unique<BattleLogger>("arena_logs", true);
            // The match keeps the old logger pointer; start over with the new one
            match = std::make_unique<Match>(config, match->seed(), battle_logger.get());
        }
        battle_logger->set_enabled(args[1] == "on");
        std::cout << "Battle log " << (battle_logger->is_enabled() ? "on" : "off") << std::endl;
    }

    void run() {
        std::cout << "Pokemon Battle Arena C++ Test Console" << std::endl;
        std::cout << "=====================================\n" << std::endl;

        cmd_new({"new"});

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            try {
                if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                    break;
                } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                    print_help();
                } else if (cmd == "load") {
                    cmd_load(args);
                } else if (cmd == "new" || cmd == "restart" || cmd == "reset") {
                    cmd_new(args);
                } else if (cmd == "tick" || cmd == "t") {
                    cmd_tick(args);
                } else if (cmd == "run") {
                    match->run_to_completion();
                    show_match(*match);
                } else if (cmd == "pause") {
                    match->pause();
                    std::cout << "Paused." << std::endl;
                } else if (cmd == "resume") {
                    match->resume();
                    std::cout << "Resumed." << std::endl;
                } else if (cmd == "show" || cmd == "s") {
                    show_match(*match);
                } else if (cmd == "grid" || cmd == "g") {
                    show_grid(*match);
                } else if (cmd == "json") {
                    std::cout << snapshot_to_string(match->snapshot(), 2) << std::endl;
                } else if (cmd == "decide") {
                    cmd_decide();
                } else if (cmd == "path") {
                    cmd_path(args);
                } else if (cmd == "shop") {
                    cmd_shop(args);
                } else if (cmd == "log") {
                    cmd_log(args);
                } else {
                    std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
    Console console;
    if (argc > 1 && !console.config.load_from_json(argv[1])) {
        std::cerr << "Continuing with default configuration." << std::endl;
    }
    console.run();
    return 0;
}
