#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <optional>
#include "../include/common.hpp"
#include "../include/errors.hpp"
#include "../include/rules/movelet.hpp"
#include "../include/rules/rule_engine.hpp"
#include "../include/solver/config.hpp"
#include "../include/solver/policy.hpp"
#include "../include/solver/value_iteration.hpp"
#include "../include/storage/policy_store.hpp"
#include "../include/strategy/strategy.hpp"
#include "../include/strategy/python_callback_strategy.hpp"
#include "../include/game/farkle_game.hpp"
#include "../include/sim/match.hpp"
#include "../include/sim/batch_simulator.hpp"

namespace py = pybind11;

PYBIND11_MODULE(farkle_cpp, m) {
    m.doc() = "C++ Farkle rule engine, optimal-strategy solver and simulator";

    // Errors
    py::register_exception<farkle::InvalidRollError>(m, "InvalidRollError", PyExc_ValueError);
    py::register_exception<farkle::ConfigError>(m, "ConfigError", PyExc_ValueError);
    py::register_exception<farkle::BoundsError>(m, "BoundsError", PyExc_IndexError);
    py::register_exception<farkle::NonConvergenceError>(m, "NonConvergenceError", PyExc_RuntimeError);
    py::register_exception<farkle::StorageError>(m, "StorageError", PyExc_IOError);

    py::enum_<farkle::Action>(m, "Action")
        .value("ROLL", farkle::Action::kRoll)
        .value("BANK", farkle::Action::kBank)
        .export_values();

    py::class_<farkle::GameState>(m, "GameState")
        .def(py::init<int, int, int>(),
             py::arg("dice_remaining"), py::arg("round_score"), py::arg("total_score"))
        .def_readwrite("dice_remaining", &farkle::GameState::dice_remaining, "Dice left to roll, 0 = hot dice")
        .def_readwrite("round_score", &farkle::GameState::round_score, "Unbanked points this turn")
        .def_readwrite("total_score", &farkle::GameState::total_score, "Banked points");

    // Rules
    py::class_<farkle::rules::Movelet>(m, "Movelet")
        .def_readonly("face", &farkle::rules::Movelet::face)
        .def_readonly("points", &farkle::rules::Movelet::points)
        .def_readonly("dice", &farkle::rules::Movelet::dice)
        .def("name", &farkle::rules::Movelet::name);

    m.def("movelets", &farkle::rules::movelets, py::return_value_policy::reference,
          "Static scoring rule table");

    py::class_<farkle::rules::Move>(m, "Move")
        .def(py::init<>())
        .def_readonly("points", &farkle::rules::Move::points, "Best partition score")
        .def_readonly("dice_used", &farkle::rules::Move::dice_used, "Dice set aside")
        .def_readonly("movelets", &farkle::rules::Move::movelets, "Indices into movelets()")
        .def("kept_dice", &farkle::rules::Move::kept_dice, "Kept faces, ascending")
        .def("describe", &farkle::rules::Move::describe)
        .def("__repr__", [](const farkle::rules::Move& move) {
            return "<Move " + move.describe() + ">";
        });

    py::class_<farkle::rules::RuleEngine>(m, "RuleEngine")
        .def(py::init<>())
        .def("score_roll", &farkle::rules::RuleEngine::score_roll, py::arg("dice"),
             "Maximal scoring combinations, empty on bust")
        .def("legal_moves", &farkle::rules::RuleEngine::legal_moves, py::arg("dice"),
             "Every legal keep, best first")
        .def("best_move", &farkle::rules::RuleEngine::best_move, py::arg("dice"),
             "Highest scoring keep or None on bust")
        .def("score_selection", &farkle::rules::RuleEngine::score_selection, py::arg("kept"))
        .def("has_scoring_potential", &farkle::rules::RuleEngine::has_scoring_potential, py::arg("dice"));

    // Solver
    py::class_<farkle::solver::SolverConfig>(m, "SolverConfig")
        .def(py::init([](int victory_threshold, int num_dice, double continue_probability,
                         double tolerance, int max_iterations, int num_threads) {
                 farkle::solver::SolverConfig config;
                 config.victory_threshold = victory_threshold;
                 config.num_dice = num_dice;
                 config.continue_probability = continue_probability;
                 config.tolerance = tolerance;
                 config.max_iterations = max_iterations;
                 config.num_threads = num_threads;
                 return config;
             }),
             py::arg("victory_threshold") = 10000,
             py::arg("num_dice") = farkle::kMaxDice,
             py::arg("continue_probability") = 0.95,
             py::arg("tolerance") = 1e-9,
             py::arg("max_iterations") = 10000,
             py::arg("num_threads") = 0)
        .def_readwrite("victory_threshold", &farkle::solver::SolverConfig::victory_threshold)
        .def_readwrite("num_dice", &farkle::solver::SolverConfig::num_dice)
        .def_readwrite("continue_probability", &farkle::solver::SolverConfig::continue_probability)
        .def_readwrite("tolerance", &farkle::solver::SolverConfig::tolerance)
        .def_readwrite("max_iterations", &farkle::solver::SolverConfig::max_iterations)
        .def_readwrite("num_threads", &farkle::solver::SolverConfig::num_threads)
        .def("validate", &farkle::solver::SolverConfig::validate);

    py::class_<farkle::solver::Policy, std::shared_ptr<farkle::solver::Policy>>(m, "Policy")
        .def("decision", &farkle::solver::Policy::decision, py::arg("state"))
        .def("value", &farkle::solver::Policy::value, py::arg("state"))
        .def("is_bank", &farkle::solver::Policy::is_bank, py::arg("state"))
        .def("bank_count", &farkle::solver::Policy::bank_count)
        .def_property_readonly("config", &farkle::solver::Policy::config)
        .def("__eq__", [](const farkle::solver::Policy& a, const farkle::solver::Policy& b) {
            return a == b;
        });

    py::class_<farkle::solver::OptimalStrategySolver>(m, "OptimalStrategySolver")
        .def(py::init<const farkle::solver::SolverConfig&>(), py::arg("config"))
        .def("solve", [](const farkle::solver::OptimalStrategySolver& solver,
                         const farkle::solver::OptimalStrategySolver::ProgressCallback& progress) {
                 farkle::solver::SolveResult result = [&]() {
                     py::gil_scoped_release release;
                     farkle::solver::OptimalStrategySolver::ProgressCallback locked;
                     if (progress) {
                         locked = [&progress](int iteration, double max_delta) {
                             py::gil_scoped_acquire gil;
                             progress(iteration, max_delta);
                         };
                     }
                     return solver.solve(locked);
                 }();
                 return py::make_tuple(
                     std::make_shared<farkle::solver::Policy>(std::move(result.policy)),
                     result.iterations, result.max_delta);
             },
             py::arg("progress") = nullptr,
             "Run value iteration; returns (policy, iterations, max_delta)")
        .def_property_readonly("config", &farkle::solver::OptimalStrategySolver::config);

    py::class_<farkle::storage::PolicyStore>(m, "PolicyStore")
        .def_static("save", &farkle::storage::PolicyStore::save, py::arg("policy"), py::arg("path"))
        .def_static("load", [](const std::string& path) {
            return std::make_shared<farkle::solver::Policy>(farkle::storage::PolicyStore::load(path));
        }, py::arg("path"));

    // Strategies
    py::class_<farkle::strategy::TurnView>(m, "TurnView")
        .def(py::init([](farkle::GameState state, std::vector<int> scores, int seat,
                         int victory_threshold, farkle::Dice roll) {
                 return farkle::strategy::TurnView{state, std::move(scores), seat,
                                                   victory_threshold, std::move(roll)};
             }),
             py::arg("state"),
             py::arg("scores"),
             py::arg("seat") = 0,
             py::arg("victory_threshold") = 10000,
             py::arg("roll") = farkle::Dice{})
        .def_readwrite("state", &farkle::strategy::TurnView::state)
        .def_readwrite("scores", &farkle::strategy::TurnView::scores)
        .def_readwrite("seat", &farkle::strategy::TurnView::seat)
        .def_readwrite("victory_threshold", &farkle::strategy::TurnView::victory_threshold)
        .def_readwrite("roll", &farkle::strategy::TurnView::roll);

    py::class_<farkle::strategy::Strategy, std::shared_ptr<farkle::strategy::Strategy>>(m, "Strategy")
        .def("decide_keep", &farkle::strategy::Strategy::decide_keep, py::arg("view"))
        .def("decide_continue", &farkle::strategy::Strategy::decide_continue, py::arg("view"))
        .def("name", &farkle::strategy::Strategy::name);

    py::class_<farkle::strategy::SimpleStrategy, farkle::strategy::Strategy,
               std::shared_ptr<farkle::strategy::SimpleStrategy>>(m, "SimpleStrategy")
        .def(py::init<int, int>(), py::arg("bank_at") = 300, py::arg("min_dice") = 3);

    py::class_<farkle::strategy::OptimalStrategy, farkle::strategy::Strategy,
               std::shared_ptr<farkle::strategy::OptimalStrategy>>(m, "OptimalStrategy")
        .def(py::init([](std::shared_ptr<farkle::solver::Policy> policy) {
                 return std::make_shared<farkle::strategy::OptimalStrategy>(std::move(policy));
             }),
             py::arg("policy"));

    // PythonCallbackStrategy - lets Python code play inside C++ matches
    py::class_<farkle::strategy::PythonCallbackStrategy, farkle::strategy::Strategy,
               std::shared_ptr<farkle::strategy::PythonCallbackStrategy>>(m, "PythonCallbackStrategy")
        .def(py::init<py::object, std::string>(),
             py::arg("py_strategy"),
             py::arg("name") = "python",
             "Create strategy that calls decide(dice, round, total, scores) -> bool (True = bank) "
             "and, if present, keep(roll, dice, round, total, scores) -> list of kept dice");

    // Game
    py::enum_<farkle::game::TurnPhase>(m, "TurnPhase")
        .value("AWAIT_ROLL", farkle::game::TurnPhase::kAwaitRoll)
        .value("AWAIT_KEEP", farkle::game::TurnPhase::kAwaitKeep)
        .value("GAME_OVER", farkle::game::TurnPhase::kGameOver)
        .export_values();

    // Without a seed the game draws one from std::random_device, as in C++
    py::class_<farkle::game::FarkleGame>(m, "FarkleGame")
        .def(py::init([](int num_players, int victory_threshold, int num_dice,
                         std::optional<uint32_t> seed) {
                 if (seed) {
                     return farkle::game::FarkleGame(num_players, victory_threshold, num_dice, *seed);
                 }
                 return farkle::game::FarkleGame(num_players, victory_threshold, num_dice);
             }),
             py::arg("num_players") = 2,
             py::arg("victory_threshold") = 10000,
             py::arg("num_dice") = farkle::kMaxDice,
             py::arg("seed") = py::none())
        .def("reset", &farkle::game::FarkleGame::reset, "Reset the game")
        .def("roll", &farkle::game::FarkleGame::roll, "Roll the remaining dice")
        .def("apply_roll", &farkle::game::FarkleGame::apply_roll, py::arg("dice"))
        .def("keep", &farkle::game::FarkleGame::keep, py::arg("move"))
        .def("bank", &farkle::game::FarkleGame::bank, "Bank the round score")
        .def("winner", &farkle::game::FarkleGame::winner)
        .def("is_terminal", &farkle::game::FarkleGame::is_terminal)
        .def("last_roll_bust", &farkle::game::FarkleGame::last_roll_bust)
        .def("can_bank", &farkle::game::FarkleGame::can_bank)
        .def("get_state", &farkle::game::FarkleGame::get_state)
        .def("current_player", &farkle::game::FarkleGame::current_player)
        .def("round_score", &farkle::game::FarkleGame::round_score)
        .def("dice_remaining", &farkle::game::FarkleGame::dice_remaining)
        .def("phase", &farkle::game::FarkleGame::phase)
        .def("scores", &farkle::game::FarkleGame::scores);

    // Simulation
    py::class_<farkle::sim::TurnRecord>(m, "TurnRecord")
        .def_readonly("player", &farkle::sim::TurnRecord::player)
        .def_readonly("rolls", &farkle::sim::TurnRecord::rolls)
        .def_readonly("kept_points", &farkle::sim::TurnRecord::kept_points)
        .def_readonly("round_score", &farkle::sim::TurnRecord::round_score)
        .def_readonly("busted", &farkle::sim::TurnRecord::busted)
        .def_readonly("total_after", &farkle::sim::TurnRecord::total_after);

    py::class_<farkle::sim::MatchResult>(m, "MatchResult")
        .def_readonly("winner", &farkle::sim::MatchResult::winner)
        .def_readonly("turns", &farkle::sim::MatchResult::turns)
        .def_readonly("final_scores", &farkle::sim::MatchResult::final_scores)
        .def_readonly("log", &farkle::sim::MatchResult::log);

    py::class_<farkle::sim::Match>(m, "Match")
        .def(py::init<std::vector<std::shared_ptr<farkle::strategy::Strategy>>, int, int, int>(),
             py::arg("players"),
             py::arg("victory_threshold") = 10000,
             py::arg("num_dice") = farkle::kMaxDice,
             py::arg("max_turns") = 10000)
        .def("play", &farkle::sim::Match::play, py::arg("seed"),
             py::call_guard<py::gil_scoped_release>(), "Play a full game");

    py::class_<farkle::sim::BatchStats>(m, "BatchStats")
        .def_readonly("total_games", &farkle::sim::BatchStats::total_games)
        .def_readonly("wins", &farkle::sim::BatchStats::wins)
        .def_readonly("unfinished", &farkle::sim::BatchStats::unfinished)
        .def_readonly("average_turns", &farkle::sim::BatchStats::average_turns)
        .def_readonly("total_busts", &farkle::sim::BatchStats::total_busts);

    py::class_<farkle::sim::BatchSimulator>(m, "BatchSimulator")
        .def(py::init<std::vector<std::shared_ptr<farkle::strategy::Strategy>>, int, int, int>(),
             py::arg("players"),
             py::arg("num_threads") = 8,
             py::arg("victory_threshold") = 10000,
             py::arg("num_dice") = farkle::kMaxDice)
        .def("run", &farkle::sim::BatchSimulator::run,
             py::arg("num_games"),
             py::arg("seed") = 0,
             py::call_guard<py::gil_scoped_release>(),
             "Play a batch of games in parallel")
        .def("update_player", &farkle::sim::BatchSimulator::update_player,
             py::arg("seat"), py::arg("player"))
        .def("num_threads", &farkle::sim::BatchSimulator::num_threads,
             "Get number of threads");

    m.attr("__version__") = "0.1.0";
}
