#include "../include/errors.hpp"
#include "../include/rules/movelet.hpp"
#include "../include/rules/rule_engine.hpp"
#include "check.hpp"

#include <functional>
#include <iostream>
#include <string>

using farkle::Dice;
using farkle::rules::Move;
using farkle::rules::RuleEngine;

static void test_six_of_a_kind_is_a_single_full_move() {
    RuleEngine engine;
    for (int v = 2; v <= 6; v++) {
        auto moves = engine.score_roll(Dice(6, v));
        CHECK(moves.size() == 1);
        CHECK(moves[0].points == 100 * v * 8);
        CHECK(moves[0].dice_used == 6);
    }

    auto ones = engine.score_roll(Dice(6, 1));
    CHECK(ones.size() == 1);
    CHECK(ones[0].points == 8000);
}

static void test_more_of_a_kind_dominates_fewer() {
    RuleEngine engine;
    for (int v = 1; v <= 6; v++) {
        int previous = 0;
        for (int n = 3; n <= 6; n++) {
            auto best = engine.best_move(Dice(n, v));
            CHECK(best.has_value());
            CHECK(best->dice_used == n);
            CHECK(best->points > previous);
            previous = best->points;
        }
    }
}

static void test_triple_ones_leaves_non_scoring_remainder() {
    RuleEngine engine;
    auto moves = engine.score_roll({1, 1, 1, 2, 3, 4});
    CHECK(moves.size() == 1);
    CHECK(moves[0].points == 1000);
    CHECK(moves[0].dice_used == 3);
    CHECK((moves[0].kept_dice() == Dice{1, 1, 1}));

    CHECK(engine.score_roll({2, 3, 4}).empty());
    CHECK(!engine.has_scoring_potential({2, 3, 4}));
}

static void test_straight_uses_every_die() {
    RuleEngine engine;
    auto moves = engine.score_roll({1, 2, 3, 4, 5, 6});
    CHECK(moves.size() == 1);
    CHECK(moves[0].points == 1500);
    CHECK(moves[0].dice_used == 6);

    // Order of the roll does not matter
    auto shuffled = engine.best_move({6, 4, 2, 5, 3, 1});
    CHECK(shuffled.has_value());
    CHECK(shuffled->points == 1500);
}

static void test_rolls_without_scoring_dice_bust() {
    RuleEngine engine;
    const int faces[] = {2, 3, 4, 6};
    int checked = 0;

    // At most two of each non-scoring face, so no triples
    std::function<void(int, Dice&)> enumerate = [&](int index, Dice& roll) {
        if (index == 4) {
            if (roll.empty() || roll.size() > 6) {
                return;
            }
            // Six dice only score when three faces show twice each (2+2+1+1 busts)
            auto counts = farkle::count_faces(roll);
            int pairs = 0;
            for (int face = 1; face <= 6; face++) {
                if (counts[face] == 2) pairs++;
            }
            if (pairs == 3) {
                CHECK(!engine.score_roll(roll).empty());
                return;
            }
            CHECK(engine.score_roll(roll).empty());
            CHECK(!engine.best_move(roll).has_value());
            CHECK(!engine.has_scoring_potential(roll));
            checked++;
            return;
        }
        for (int n = 0; n <= 2; n++) {
            for (int i = 0; i < n; i++) roll.push_back(faces[index]);
            enumerate(index + 1, roll);
            for (int i = 0; i < n; i++) roll.pop_back();
        }
    };
    Dice roll;
    enumerate(0, roll);
    CHECK(checked > 0);
}

static void test_best_partition_beats_greedy_grouping() {
    RuleEngine engine;

    // Four 2s alone are worth 400; as three pairs with the 3s, 1500
    auto pairs = engine.best_move({2, 2, 2, 2, 3, 3});
    CHECK(pairs.has_value());
    CHECK(pairs->points == 1500);
    CHECK(pairs->dice_used == 6);

    // Four 1s plus two 5s outscore three pairs
    auto ones = engine.best_move({1, 1, 1, 1, 5, 5});
    CHECK(ones.has_value());
    CHECK(ones->points == 2100);

    auto mixed = engine.best_move({5, 5, 5, 1, 2, 3});
    CHECK(mixed.has_value());
    CHECK(mixed->points == 600);
    CHECK(mixed->dice_used == 4);

    CHECK(engine.best_move({2, 2, 3, 3, 4, 4})->points == 1500);
}

static void test_legal_moves_are_ordered_best_first() {
    RuleEngine engine;
    auto moves = engine.legal_moves({1, 5, 2, 3, 4, 4});
    CHECK(moves.size() == 3);
    CHECK(moves[0].points == 150);
    CHECK(moves[0].dice_used == 2);
    CHECK(moves[1].points == 100);
    CHECK(moves[2].points == 50);

    // Only the keep of both scoring dice is maximal
    auto maximal = engine.score_roll({1, 5, 2, 3, 4, 4});
    CHECK(maximal.size() == 1);
    CHECK(maximal[0] == moves[0]);
}

static void test_move_records_its_partition() {
    RuleEngine engine;
    auto move = engine.best_move({1, 1, 1, 1, 5, 5});
    CHECK(move.has_value());

    int points = 0;
    int dice = 0;
    for (int index : move->movelets) {
        points += farkle::rules::movelets()[index].points;
        dice += farkle::rules::movelets()[index].dice;
    }
    CHECK(points == move->points);
    CHECK(dice == move->dice_used);
    CHECK(!move->describe().empty());
    CHECK(move->describe().find("= 2100") != std::string::npos);
}

static void test_partition_score_rejects_negative_counts() {
    farkle::FaceCounts counts{};
    counts[1] = -1;
    counts[2] = 1;
    CHECK(farkle::rules::partition_score(counts) == -1);

    counts = farkle::FaceCounts{};
    counts[5] = -2;
    counts[1] = 3;
    CHECK(farkle::rules::partition_score(counts) == -1);

    counts = farkle::FaceCounts{};
    counts[1] = 6;
    CHECK(farkle::rules::partition_score(counts) == 8000);
}

static void test_score_selection() {
    RuleEngine engine;
    CHECK(engine.score_selection({1, 1, 1}) == 1000);
    CHECK(engine.score_selection({5}) == 50);
    CHECK(engine.score_selection({1, 2}) == 0);
    CHECK(farkle::rules::of_a_kind_points(4, 5) == 1600);
}

static void test_invalid_rolls_are_rejected() {
    RuleEngine engine;
    CHECK_THROWS(engine.score_roll({}), farkle::InvalidRollError);
    CHECK_THROWS(engine.score_roll({1, 2, 3, 4, 5, 6, 1}), farkle::InvalidRollError);
    CHECK_THROWS(engine.score_roll({0, 1}), farkle::InvalidRollError);
    CHECK_THROWS(engine.score_roll({7}), farkle::InvalidRollError);
    CHECK_THROWS(engine.best_move(Dice{}), farkle::InvalidRollError);
    CHECK_THROWS(engine.has_scoring_potential({}), farkle::InvalidRollError);
}

int main() {
    test_six_of_a_kind_is_a_single_full_move();
    test_more_of_a_kind_dominates_fewer();
    test_triple_ones_leaves_non_scoring_remainder();
    test_straight_uses_every_die();
    test_rolls_without_scoring_dice_bust();
    test_best_partition_beats_greedy_grouping();
    test_legal_moves_are_ordered_best_first();
    test_move_records_its_partition();
    test_partition_score_rejects_negative_counts();
    test_score_selection();
    test_invalid_rolls_are_rejected();

    std::cout << "All rule engine tests passed\n";
    return 0;
}
