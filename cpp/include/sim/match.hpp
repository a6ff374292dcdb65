#pragma once
#include "../common.hpp"
#include "../strategy/strategy.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace farkle::sim {

// One player's turn, from first roll to bank or bust
struct TurnRecord {
    int player;
    std::vector<Dice> rolls;
    std::vector<int> kept_points;  // points of the move kept after each scoring roll
    int round_score;               // banked amount, 0 on a bust
    bool busted;
    int total_after;
};

struct MatchResult {
    int winner;                    // -1 when the turn limit was hit
    int turns;
    std::vector<int> final_scores;
    std::vector<TurnRecord> log;
};

class Match {
public:
    Match(std::vector<std::shared_ptr<strategy::Strategy>> players,
          int victory_threshold = 10000,
          int num_dice = kMaxDice,
          int max_turns = 10000);

    // Play one full game and return the outcome with the per-turn log
    MatchResult play(uint32_t seed);

private:
    std::vector<std::shared_ptr<strategy::Strategy>> players_;
    int victory_threshold_;
    int num_dice_;
    int max_turns_;
};

} // namespace farkle::sim
