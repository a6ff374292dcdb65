#include "../include/game/farkle_game.hpp"
#include "../include/rules/rule_engine.hpp"
#include "../include/sim/batch_simulator.hpp"
#include "../include/sim/match.hpp"
#include "../include/solver/value_iteration.hpp"
#include "../include/strategy/strategy.hpp"
#include "check.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using farkle::Action;
using farkle::Dice;
using farkle::GameState;
using farkle::game::FarkleGame;
using farkle::game::TurnPhase;
using farkle::rules::RuleEngine;

static farkle::rules::Move best(const Dice& dice) {
    return RuleEngine().best_move(dice).value();
}

static void test_bust_loses_round_and_passes_turn() {
    FarkleGame game(2, 10000, 6, 1);
    game.apply_roll({1, 2, 3, 4, 6, 6});
    game.keep(best({1, 2, 3, 4, 6, 6}));
    CHECK(game.round_score() == 100);
    CHECK(game.dice_remaining() == 5);

    game.apply_roll({2, 3, 4, 6, 6});
    CHECK(game.last_roll_bust());
    CHECK(game.current_player() == 1);
    CHECK(game.round_score() == 0);
    CHECK(game.dice_remaining() == 6);
    CHECK(game.scores()[0] == 0);
}

static void test_bank_adds_round_and_passes_turn() {
    FarkleGame game(2, 10000, 6, 1);
    game.apply_roll({5, 5, 5, 2, 3, 4});
    game.keep(best({5, 5, 5, 2, 3, 4}));
    CHECK(game.can_bank());
    GameState state = game.get_state();
    CHECK(state.dice_remaining == 3);
    CHECK(state.round_score == 500);
    CHECK(state.total_score == 0);

    game.bank();
    CHECK(game.scores()[0] == 500);
    CHECK(game.current_player() == 1);
    CHECK(!game.can_bank());
}

static void test_hot_dice_return_the_full_hand() {
    FarkleGame game(1, 10000, 6, 1);
    game.apply_roll({1, 1, 1, 5, 5, 5});
    game.keep(best({1, 1, 1, 5, 5, 5}));
    CHECK(game.round_score() == 1500);
    CHECK(game.dice_remaining() == 6);
    CHECK(game.phase() == TurnPhase::kAwaitRoll);
}

static void test_illegal_actions_throw() {
    FarkleGame game(2, 10000, 6, 1);
    CHECK_THROWS(game.bank(), std::invalid_argument);
    CHECK_THROWS(game.apply_roll({1, 2}), std::invalid_argument);

    game.apply_roll({1, 2, 3, 4, 6, 6});
    CHECK_THROWS(game.apply_roll({1, 2, 3, 4, 6, 6}), std::invalid_argument);

    // Fives that were not rolled
    CHECK_THROWS(game.keep(best({5, 5, 5})), std::invalid_argument);

    // A kept 2 does not score
    farkle::rules::Move junk;
    junk.kept[2] = 1;
    junk.dice_used = 1;
    CHECK_THROWS(game.keep(junk), std::invalid_argument);
}

static void test_reaching_the_threshold_wins() {
    FarkleGame game(2, 1000, 6, 1);
    game.apply_roll({1, 1, 1, 2, 3, 4});
    game.keep(best({1, 1, 1, 2, 3, 4}));
    game.bank();
    CHECK(game.is_terminal());
    CHECK(game.winner().has_value());
    CHECK(game.winner().value() == 0);
    CHECK_THROWS(game.roll(), std::invalid_argument);
}

static void test_seeded_games_roll_the_same_dice() {
    FarkleGame a(2, 10000, 6, 7);
    FarkleGame b(2, 10000, 6, 7);
    CHECK(a.roll() == b.roll());
}

static void test_simple_strategy_thresholds() {
    farkle::strategy::SimpleStrategy simple(300, 3);
    farkle::strategy::TurnView view{GameState{4, 0, 0}, {0, 0}, 0, 10000};
    CHECK(simple.decide_continue(view) == Action::kRoll);

    view.state = GameState{4, 250, 0};
    CHECK(simple.decide_continue(view) == Action::kRoll);
    view.state = GameState{4, 300, 0};
    CHECK(simple.decide_continue(view) == Action::kBank);
    view.state = GameState{2, 100, 0};
    CHECK(simple.decide_continue(view) == Action::kBank);
    view.state = GameState{0, 100, 0};
    CHECK(simple.decide_continue(view) == Action::kRoll);
}

static void test_optimal_strategy_follows_policy_and_clips() {
    farkle::solver::SolverConfig config;
    config.victory_threshold = 1000;
    auto policy = std::make_shared<farkle::solver::Policy>(
        farkle::solver::OptimalStrategySolver(config).solve().policy);
    farkle::strategy::OptimalStrategy optimal(policy);

    farkle::strategy::TurnView view{GameState{3, 350, 100}, {100, 0}, 0, 1000};
    CHECK(optimal.decide_continue(view) == policy->decision(view.state));

    // Already past the policy's threshold: bank instead of querying
    view.state = GameState{6, 1500, 0};
    CHECK(optimal.decide_continue(view) == Action::kBank);

    view.state = GameState{6, 0, 0};
    CHECK(optimal.decide_continue(view) == Action::kRoll);
}

static void test_strategies_keep_the_best_move_by_default() {
    farkle::strategy::SimpleStrategy simple;
    farkle::strategy::TurnView view{GameState{6, 0, 0}, {0, 0}, 0, 10000,
                                    Dice{2, 2, 2, 2, 3, 3}};
    auto move = simple.decide_keep(view);
    CHECK(move.points == 1500);
    CHECK(move.dice_used == 6);

    view.roll = Dice{2, 3, 4, 6, 6, 3};
    CHECK_THROWS(simple.decide_keep(view), std::invalid_argument);
}

// Sets aside as few dice as it can and remembers every roll it was shown
class CautiousKeeper : public farkle::strategy::Strategy {
public:
    farkle::rules::Move decide_keep(const farkle::strategy::TurnView& view) override {
        seen.push_back(view.roll);
        auto moves = engine_.legal_moves(view.roll);
        farkle::rules::Move smallest = moves.front();
        for (const auto& move : moves) {
            if (move.dice_used < smallest.dice_used) {
                smallest = move;
            }
        }
        return smallest;
    }

    Action decide_continue(const farkle::strategy::TurnView& view) override {
        return view.state.round_score >= 300 ? Action::kBank : Action::kRoll;
    }

    std::string name() const override { return "cautious"; }

    std::vector<Dice> seen;
};

static void test_match_keeps_what_the_strategy_chooses() {
    auto keeper = std::make_shared<CautiousKeeper>();
    farkle::sim::Match match({keeper}, 1000);
    auto result = match.play(5);
    CHECK(result.winner == 0);

    RuleEngine engine;
    size_t kept = 0;
    for (const auto& turn : result.log) {
        for (size_t i = 0; i < turn.kept_points.size(); i++) {
            CHECK(kept < keeper->seen.size());
            CHECK(keeper->seen[kept] == turn.rolls[i]);

            auto moves = engine.legal_moves(turn.rolls[i]);
            int fewest = 6;
            for (const auto& move : moves) {
                fewest = std::min(fewest, move.dice_used);
            }
            bool matches_small_keep = false;
            for (const auto& move : moves) {
                if (move.dice_used == fewest && move.points == turn.kept_points[i]) {
                    matches_small_keep = true;
                }
            }
            CHECK(matches_small_keep);
            kept++;
        }
    }
    CHECK(kept == keeper->seen.size());
}

static void test_match_log_is_consistent() {
    auto a = std::make_shared<farkle::strategy::SimpleStrategy>(300, 3);
    auto b = std::make_shared<farkle::strategy::SimpleStrategy>(500, 2);
    farkle::sim::Match match({a, b}, 2000);
    auto result = match.play(42);

    CHECK(result.winner == 0 || result.winner == 1);
    CHECK(result.final_scores[result.winner] >= 2000);
    CHECK(result.turns == static_cast<int>(result.log.size()));

    int banked[2] = {0, 0};
    for (const auto& turn : result.log) {
        CHECK(!turn.rolls.empty());
        if (turn.busted) {
            CHECK(turn.round_score == 0);
            CHECK(turn.kept_points.size() + 1 == turn.rolls.size());
        } else {
            CHECK(turn.kept_points.size() == turn.rolls.size());
        }
        banked[turn.player] += turn.round_score;
        CHECK(turn.total_after == banked[turn.player]);
    }
    CHECK(banked[0] == result.final_scores[0]);
    CHECK(banked[1] == result.final_scores[1]);
    CHECK(result.log.back().player == result.winner);

    // Same seed, same game
    auto replay = match.play(42);
    CHECK(replay.turns == result.turns);
    CHECK(replay.final_scores == result.final_scores);
}

static void test_batch_results_do_not_depend_on_threads() {
    auto a = std::make_shared<farkle::strategy::SimpleStrategy>(300, 3);
    auto b = std::make_shared<farkle::strategy::SimpleStrategy>(1000, 1);

    farkle::sim::BatchSimulator serial({a, b}, 1, 2000);
    farkle::sim::BatchSimulator parallel({a, b}, 4, 2000);
    auto s = serial.run(200, 11);
    auto p = parallel.run(200, 11);

    CHECK(s.total_games == 200);
    CHECK(s.wins[0] + s.wins[1] + s.unfinished == 200);
    CHECK(s.wins == p.wins);
    CHECK(s.unfinished == p.unfinished);
    CHECK(s.total_busts == p.total_busts);
    CHECK(s.average_turns == p.average_turns);
    CHECK(s.average_turns > 0.0);

    CHECK_THROWS(serial.update_player(2, a), std::out_of_range);
    serial.update_player(1, a);
    CHECK(serial.run(0).total_games == 0);
}

int main() {
    test_bust_loses_round_and_passes_turn();
    test_bank_adds_round_and_passes_turn();
    test_hot_dice_return_the_full_hand();
    test_illegal_actions_throw();
    test_reaching_the_threshold_wins();
    test_seeded_games_roll_the_same_dice();
    test_simple_strategy_thresholds();
    test_optimal_strategy_follows_policy_and_clips();
    test_strategies_keep_the_best_move_by_default();
    test_match_keeps_what_the_strategy_chooses();
    test_match_log_is_consistent();
    test_batch_results_do_not_depend_on_threads();

    std::cout << "All game tests passed\n";
    return 0;
}
