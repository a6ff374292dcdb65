#include "../../include/game/farkle_game.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace farkle::game {

FarkleGame::FarkleGame(int num_players, int victory_threshold, int num_dice, uint32_t seed)
    : gen_(seed), victory_threshold_(victory_threshold), num_dice_(num_dice) {
    if (num_players < 1) {
        throw std::invalid_argument("Farkle needs at least one player");
    }
    if (victory_threshold_ <= 0) {
        throw std::invalid_argument("Victory threshold must be positive");
    }
    if (num_dice_ < 1 || num_dice_ > kMaxDice) {
        throw std::invalid_argument("Dice count must be in [1, 6]");
    }
    scores_.assign(num_players, 0);
    reset();
}

void FarkleGame::reset() {
    std::fill(scores_.begin(), scores_.end(), 0);
    current_player_ = 0;
    dice_remaining_ = num_dice_;
    round_score_ = 0;
    last_roll_.clear();
    last_roll_bust_ = false;
    phase_ = TurnPhase::kAwaitRoll;
    winner_.reset();
}

const Dice& FarkleGame::roll() {
    std::uniform_int_distribution<int> face(1, 6);
    Dice dice(dice_remaining_);
    for (int& d : dice) {
        d = face(gen_);
    }
    apply_roll(dice);
    return last_roll_;
}

void FarkleGame::apply_roll(const Dice& dice) {
    if (phase_ != TurnPhase::kAwaitRoll) {
        throw std::invalid_argument("Cannot roll now");
    }
    if (static_cast<int>(dice.size()) != dice_remaining_) {
        throw std::invalid_argument("Expected " + std::to_string(dice_remaining_) + " dice");
    }

    last_roll_ = dice;
    last_roll_bust_ = !engine_.has_scoring_potential(dice);
    if (last_roll_bust_) {
        // Farkle: the round is lost
        round_score_ = 0;
        pass_turn();
    } else {
        phase_ = TurnPhase::kAwaitKeep;
    }
}

void FarkleGame::keep(const rules::Move& move) {
    if (phase_ != TurnPhase::kAwaitKeep) {
        throw std::invalid_argument("Nothing to keep");
    }
    FaceCounts rolled = count_faces(last_roll_);
    for (int face = 1; face <= 6; face++) {
        if (move.kept[face] < 0 || move.kept[face] > rolled[face]) {
            throw std::invalid_argument("Kept dice are not part of the roll");
        }
    }
    int used = total_dice(move.kept);
    int points = used > 0 ? rules::partition_score(move.kept) : -1;
    if (points <= 0) {
        throw std::invalid_argument("Kept dice do not score");
    }

    round_score_ += points;
    dice_remaining_ -= used;
    if (dice_remaining_ == 0) {
        dice_remaining_ = num_dice_;  // Hot dice
    }
    phase_ = TurnPhase::kAwaitRoll;
}

void FarkleGame::bank() {
    if (!can_bank()) {
        throw std::invalid_argument("Nothing to bank");
    }
    scores_[current_player_] += round_score_;
    if (scores_[current_player_] >= victory_threshold_) {
        winner_ = current_player_;
        phase_ = TurnPhase::kGameOver;
        return;
    }
    pass_turn();
}

GameState FarkleGame::get_state() const {
    return GameState{dice_remaining_, round_score_, scores_[current_player_]};
}

void FarkleGame::pass_turn() {
    round_score_ = 0;
    dice_remaining_ = num_dice_;
    current_player_ = (current_player_ + 1) % num_players();
    phase_ = TurnPhase::kAwaitRoll;
}

} // namespace farkle::game
