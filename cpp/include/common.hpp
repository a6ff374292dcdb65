#pragma once
#include <vector>
#include <array>
#include <cstdint>

namespace farkle {

// Dice per full roll and the granularity of every score in the game
constexpr int kMaxDice = 6;
constexpr int kScoreUnit = 50;

// Face values in roll order
using Dice = std::vector<int>;

// Number of dice showing each face, indexed 1..6 (slot 0 unused)
using FaceCounts = std::array<int, 7>;

enum class Action : int8_t { kRoll = 0, kBank = 1 };

// Decision point of the active player, before the next roll
struct GameState {
    int dice_remaining;   // dice left to roll, 0 means hot dice
    int round_score;      // points accumulated this turn, not yet banked
    int total_score;      // points already banked by the active player
};

FaceCounts count_faces(const Dice& dice);
int total_dice(const FaceCounts& counts);

} // namespace farkle
