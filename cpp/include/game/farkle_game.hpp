#pragma once
#include "../common.hpp"
#include "../rules/rule_engine.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace farkle::game {

enum class TurnPhase : int8_t {
    kAwaitRoll,   // roll (or bank once something was kept)
    kAwaitKeep,   // a scoring roll is on the table
    kGameOver
};

class FarkleGame {
public:
    FarkleGame(int num_players = 2,
               int victory_threshold = 10000,
               int num_dice = kMaxDice,
               uint32_t seed = std::random_device{}());

    // Core game methods
    void reset();
    const Dice& roll();
    void apply_roll(const Dice& dice);  // roll with given faces
    void keep(const rules::Move& move);
    void bank();

    // Queries
    std::optional<int> winner() const { return winner_; }
    bool is_terminal() const { return phase_ == TurnPhase::kGameOver; }
    bool last_roll_bust() const { return last_roll_bust_; }
    bool can_bank() const { return phase_ == TurnPhase::kAwaitRoll && round_score_ > 0; }

    // Decision point of the current player
    GameState get_state() const;

    // Getters
    int current_player() const { return current_player_; }
    int num_players() const { return static_cast<int>(scores_.size()); }
    int victory_threshold() const { return victory_threshold_; }
    int num_dice() const { return num_dice_; }
    int dice_remaining() const { return dice_remaining_; }
    int round_score() const { return round_score_; }
    TurnPhase phase() const { return phase_; }
    const Dice& last_roll() const { return last_roll_; }
    const std::vector<int>& scores() const { return scores_; }

private:
    void pass_turn();

    rules::RuleEngine engine_;
    std::mt19937 gen_;
    int victory_threshold_;
    int num_dice_;

    std::vector<int> scores_;
    int current_player_;
    int dice_remaining_;
    int round_score_;
    Dice last_roll_;
    bool last_roll_bust_;
    TurnPhase phase_;
    std::optional<int> winner_;
};

} // namespace farkle::game
