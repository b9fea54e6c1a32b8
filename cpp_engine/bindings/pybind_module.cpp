/**
 * Pokemon Battle Arena Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine.
 * Exposes the decision engine, the agent facade and the match driver to the
 * Python game loop.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "arena_engine.hpp"

namespace py = pybind11;

PYBIND11_MODULE(arena_engine_cpp, m) {
    m.doc() = "Pokemon Battle Arena decision engine";

    // ========================================================================
    // EXCEPTIONS
    // ========================================================================

    py::register_exception<arena::EmptyRosterError>(m, "EmptyRosterError", PyExc_ValueError);
    py::register_exception<arena::IllegalActionError>(m, "IllegalActionError", PyExc_RuntimeError);

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<arena::ElementType>(m, "ElementType")
        .value("FIRE", arena::ElementType::FIRE)
        .value("WATER", arena::ElementType::WATER)
        .value("ELECTRIC", arena::ElementType::ELECTRIC)
        .export_values();

    py::enum_<arena::ElixirTier>(m, "ElixirTier")
        .value("SMALL", arena::ElixirTier::SMALL)
        .value("MEDIUM", arena::ElixirTier::MEDIUM)
        .value("LARGE", arena::ElixirTier::LARGE)
        .export_values();

    py::enum_<arena::ActionType>(m, "ActionType")
        .value("ATTACK", arena::ActionType::ATTACK)
        .value("DEFEND", arena::ActionType::DEFEND)
        .value("HEAL", arena::ActionType::HEAL)
        .value("SWAP", arena::ActionType::SWAP)
        .export_values();

    py::enum_<arena::AgentPhase>(m, "AgentPhase")
        .value("IDLE", arena::AgentPhase::IDLE)
        .value("CATCHING", arena::AgentPhase::CATCHING)
        .value("SHOPPING", arena::AgentPhase::SHOPPING)
        .value("BATTLING", arena::AgentPhase::BATTLING)
        .value("DONE", arena::AgentPhase::DONE)
        .export_values();

    py::enum_<arena::MatchPhase>(m, "MatchPhase")
        .value("CATCHING", arena::MatchPhase::CATCHING)
        .value("SHOPPING", arena::MatchPhase::SHOPPING)
        .value("BATTLING", arena::MatchPhase::BATTLING)
        .value("GAME_OVER", arena::MatchPhase::GAME_OVER)
        .export_values();

    py::enum_<arena::MatchResult>(m, "MatchResult")
        .value("ONGOING", arena::MatchResult::ONGOING)
        .value("SIDE_0_WIN", arena::MatchResult::SIDE_0_WIN)
        .value("SIDE_1_WIN", arena::MatchResult::SIDE_1_WIN)
        .value("DRAW", arena::MatchResult::DRAW)
        .export_values();

    py::enum_<arena::PurchaseStrategy>(m, "PurchaseStrategy")
        .value("MAX_HEAL", arena::PurchaseStrategy::MAX_HEAL)
        .value("GREEDY_RATIO", arena::PurchaseStrategy::GREEDY_RATIO)
        .export_values();

    // ========================================================================
    // CONFIGURATION
    // ========================================================================

    py::class_<arena::ArenaConfig>(m, "ArenaConfig")
        .def(py::init<>())
        .def("load_from_json", &arena::ArenaConfig::load_from_json)
        .def_static("from_json_string", [](const std::string& text) {
            return arena::ArenaConfig::from_json(nlohmann::json::parse(text));
        })
        .def_property("search_depth",
                      [](const arena::ArenaConfig& c) { return c.search.depth; },
                      [](arena::ArenaConfig& c, int depth) { c.search.depth = depth; })
        .def_property("purchase_strategy",
                      [](const arena::ArenaConfig& c) { return c.economy.purchase_strategy; },
                      [](arena::ArenaConfig& c, arena::PurchaseStrategy s) { c.economy.purchase_strategy = s; })
        .def("price_table", [](const arena::ArenaConfig& c) { return c.economy.price_table(); })
        .def("heal_table", [](const arena::ArenaConfig& c) { return c.economy.heal_table(); });

    py::class_<arena::RandomSource, std::shared_ptr<arena::RandomSource>>(m, "RandomSource");

    py::class_<arena::SeededRandom, arena::RandomSource, std::shared_ptr<arena::SeededRandom>>(m, "SeededRandom")
        .def(py::init<uint64_t>(), py::arg("seed") = 0)
        .def("uniform", &arena::SeededRandom::uniform)
        .def("range", &arena::SeededRandom::range)
        .def("reseed", &arena::SeededRandom::reseed)
        .def_property_readonly("seed", &arena::SeededRandom::seed);

    // ========================================================================
    // GRID / PATHFINDING
    // ========================================================================

    py::class_<arena::Cell>(m, "Cell")
        .def(py::init<>())
        .def(py::init<int, int>(), py::arg("row"), py::arg("col"))
        .def_readwrite("row", &arena::Cell::row)
        .def_readwrite("col", &arena::Cell::col)
        .def("__repr__", &arena::Cell::to_string)
        .def("__hash__", [](const arena::Cell& c) { return std::hash<arena::Cell>()(c); })
        .def(py::self == py::self)
        .def(py::self != py::self);

    py::class_<arena::Grid>(m, "Grid")
        .def(py::init<int, int>(), py::arg("rows"), py::arg("cols"))
        .def_static("from_rows", &arena::Grid::from_rows)
        .def_property_readonly("rows", &arena::Grid::rows)
        .def_property_readonly("cols", &arena::Grid::cols)
        .def("in_bounds", &arena::Grid::in_bounds)
        .def("is_passable", &arena::Grid::is_passable)
        .def("set_obstacle", &arena::Grid::set_obstacle, py::arg("cell"), py::arg("obstacle") = true)
        .def("obstacle_count", &arena::Grid::obstacle_count);

    m.def("find_path", &arena::find_path, py::arg("grid"), py::arg("start"), py::arg("goal"));
    m.def("path_length", &arena::path_length);
    m.def("manhattan", &arena::manhattan);

    py::class_<arena::CatchTarget>(m, "CatchTarget")
        .def(py::init<>())
        .def_readwrite("species", &arena::CatchTarget::species)
        .def_readwrite("type", &arena::CatchTarget::type)
        .def_readwrite("cell", &arena::CatchTarget::cell);

    // ========================================================================
    // BATTLE STATE
    // ========================================================================

    py::class_<arena::Combatant>(m, "Combatant")
        .def(py::init<>())
        .def(py::init<std::string, arena::ElementType, int, int, int>(),
             py::arg("species"), py::arg("type"),
             py::arg("max_hp") = 100, py::arg("attack") = 22, py::arg("defense") = 10)
        .def_readwrite("species", &arena::Combatant::species)
        .def_readwrite("type", &arena::Combatant::type)
        .def_readwrite("hp", &arena::Combatant::hp)
        .def_readwrite("max_hp", &arena::Combatant::max_hp)
        .def_readwrite("attack", &arena::Combatant::attack)
        .def_readwrite("defense", &arena::Combatant::defense)
        .def("is_fainted", &arena::Combatant::is_fainted)
        .def("hp_ratio", &arena::Combatant::hp_ratio);

    py::class_<arena::Roster>(m, "Roster")
        .def(py::init<>())
        .def(py::init<std::vector<arena::Combatant>, int>(), py::arg("members"), py::arg("active") = 0)
        .def_readwrite("members", &arena::Roster::members)
        .def_readwrite("active_index", &arena::Roster::active_index)
        .def("alive_count", &arena::Roster::alive_count)
        .def("total_hp", &arena::Roster::total_hp)
        .def("is_defeated", &arena::Roster::is_defeated);

    py::class_<arena::Resources>(m, "Resources")
        .def(py::init<>())
        .def_readwrite("elixirs", &arena::Resources::elixirs)
        .def_readwrite("coins", &arena::Resources::coins)
        .def_readwrite("fuel", &arena::Resources::fuel)
        .def("elixir_count", &arena::Resources::elixir_count);

    py::class_<arena::SideState>(m, "SideState")
        .def(py::init<>())
        .def_readwrite("trainer_name", &arena::SideState::trainer_name)
        .def_readwrite("roster", &arena::SideState::roster)
        .def_readwrite("resources", &arena::SideState::resources)
        .def_readwrite("defending", &arena::SideState::defending)
        .def("is_defeated", &arena::SideState::is_defeated);

    py::class_<arena::BattleSnapshot>(m, "BattleSnapshot")
        .def(py::init<>())
        .def_readwrite("sides", &arena::BattleSnapshot::sides)
        .def_readwrite("field_type", &arena::BattleSnapshot::field_type)
        .def_readwrite("to_move", &arena::BattleSnapshot::to_move)
        .def_readwrite("ply", &arena::BattleSnapshot::ply)
        .def("is_over", &arena::BattleSnapshot::is_over)
        .def("to_json", [](const arena::BattleSnapshot& s) { return arena::snapshot_to_string(s); })
        .def_static("from_json", &arena::snapshot_from_string);

    py::class_<arena::Action>(m, "Action")
        .def(py::init<>())
        .def_readwrite("action_type", &arena::Action::action_type)
        .def_readwrite("tier", &arena::Action::tier)
        .def_readwrite("swap_index", &arena::Action::swap_index)
        .def("__str__", &arena::Action::to_string)
        .def("__repr__", &arena::Action::to_string)
        .def(py::self == py::self)
        .def(py::self != py::self)
        // Factory methods
        .def_static("attack", &arena::Action::attack)
        .def_static("defend", &arena::Action::defend)
        .def_static("heal", &arena::Action::heal)
        .def_static("swap", &arena::Action::swap);

    py::class_<arena::BattleRules>(m, "BattleRules")
        .def(py::init<const arena::ArenaConfig&>())
        .def("legal_actions", &arena::BattleRules::legal_actions)
        .def("is_legal", &arena::BattleRules::is_legal)
        .def("expected_damage", &arena::BattleRules::expected_damage)
        .def("apply_action", &arena::BattleRules::apply_action)
        .def("resolve_turn", &arena::BattleRules::resolve_turn);

    // ========================================================================
    // DECISIONS
    // ========================================================================

    py::class_<arena::Advice>(m, "Advice")
        .def(py::init<>())
        .def_readwrite("heal", &arena::Advice::heal)
        .def_readwrite("swap", &arena::Advice::swap);

    py::class_<arena::ScoredAction>(m, "ScoredAction")
        .def_readonly("action", &arena::ScoredAction::action)
        .def_readonly("score", &arena::ScoredAction::score);

    py::class_<arena::SearchResult>(m, "SearchResult")
        .def_readonly("action", &arena::SearchResult::action)
        .def_readonly("score", &arena::SearchResult::score)
        .def_readonly("root_scores", &arena::SearchResult::root_scores)
        .def_readonly("best_actions", &arena::SearchResult::best_actions)
        .def_readonly("nodes_visited", &arena::SearchResult::nodes_visited)
        .def_readonly("searched", &arena::SearchResult::searched);

    py::class_<arena::PurchasePlan>(m, "PurchasePlan")
        .def_readonly("counts", &arena::PurchasePlan::counts)
        .def_readonly("coins_spent", &arena::PurchasePlan::coins_spent)
        .def_readonly("total_heal", &arena::PurchasePlan::total_heal)
        .def("count", &arena::PurchasePlan::count)
        .def("__repr__", &arena::PurchasePlan::to_string);

    m.def("plan_purchases", &arena::plan_purchases,
          py::arg("budget"), py::arg("prices"), py::arg("heals"),
          py::arg("strategy") = arena::PurchaseStrategy::MAX_HEAL);

    py::class_<arena::DecisionEngine>(m, "DecisionEngine")
        .def(py::init<const arena::ArenaConfig&, uint64_t>(), py::arg("config"), py::arg("seed") = 0)
        .def("find_path", &arena::DecisionEngine::find_path)
        .def("choose_action", &arena::DecisionEngine::choose_action)
        .def("analyze", &arena::DecisionEngine::analyze)
        .def("advise", &arena::DecisionEngine::advise)
        .def("plan_purchases", &arena::DecisionEngine::plan_purchases);

    // ========================================================================
    // AGENTS / MATCH
    // ========================================================================

    py::class_<arena::CatchTick>(m, "CatchTick")
        .def_readonly("position", &arena::CatchTick::position)
        .def_readonly("moved", &arena::CatchTick::moved)
        .def_readonly("replanned", &arena::CatchTick::replanned)
        .def_readonly("path_not_found", &arena::CatchTick::path_not_found)
        .def_readonly("out_of_fuel", &arena::CatchTick::out_of_fuel)
        .def_readonly("finished", &arena::CatchTick::finished)
        .def_readonly("caught_species", &arena::CatchTick::caught_species);

    py::class_<arena::AgentFacade>(m, "AgentFacade")
        .def(py::init([](arena::SideId side, std::string name, const arena::ArenaConfig& config, uint64_t seed) {
                 return std::make_unique<arena::AgentFacade>(
                     side, std::move(name), config, std::make_shared<arena::SeededRandom>(seed));
             }),
             py::arg("side"), py::arg("name"), py::arg("config"), py::arg("seed") = 0)
        .def_property_readonly("phase", &arena::AgentFacade::phase)
        .def_property_readonly("name", &arena::AgentFacade::name)
        .def_property_readonly("position", &arena::AgentFacade::position)
        .def_property_readonly("caught", &arena::AgentFacade::caught)
        .def_property("resources", &arena::AgentFacade::resources, &arena::AgentFacade::set_resources)
        .def("enter_phase", &arena::AgentFacade::enter_phase)
        .def("reset", &arena::AgentFacade::reset)
        .def("begin_catching", &arena::AgentFacade::begin_catching, py::keep_alive<1, 2>())
        .def("catch_tick", &arena::AgentFacade::catch_tick)
        .def("catching_finished", &arena::AgentFacade::catching_finished)
        .def("shop", &arena::AgentFacade::shop, py::arg("budget") = py::none())
        .def("choose_action", &arena::AgentFacade::choose_action)
        .def("last_search", &arena::AgentFacade::last_search);

    py::class_<arena::MatchOutcome>(m, "MatchOutcome")
        .def_readonly("result", &arena::MatchOutcome::result)
        .def_readonly("reason", &arena::MatchOutcome::reason)
        .def_readonly("ticks", &arena::MatchOutcome::ticks)
        .def_readonly("battle_turns", &arena::MatchOutcome::battle_turns)
        .def_readonly("final_snapshot", &arena::MatchOutcome::final_snapshot);

    py::class_<arena::Match>(m, "Match")
        .def(py::init([](const arena::ArenaConfig& config, uint64_t seed) {
                 return std::make_unique<arena::Match>(config, seed);
             }),
             py::arg("config"), py::arg("seed") = 0)
        .def("tick", &arena::Match::tick)
        .def("run_to_completion", &arena::Match::run_to_completion)
        .def("pause", &arena::Match::pause)
        .def("resume", &arena::Match::resume)
        .def("restart", &arena::Match::restart)
        .def_property_readonly("phase", &arena::Match::phase)
        .def_property_readonly("result", &arena::Match::result)
        .def_property_readonly("is_over", &arena::Match::is_over)
        .def_property_readonly("snapshot", &arena::Match::snapshot)
        .def_property_readonly("grid", &arena::Match::grid, py::return_value_policy::reference_internal)
        .def("agent", py::overload_cast<arena::SideId>(&arena::Match::agent),
             py::return_value_policy::reference_internal);

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = arena::get_version();
    m.attr("__version__") = arena::get_version();
}
