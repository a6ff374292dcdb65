#pragma once
#include "../common.hpp"
#include "movelet.hpp"
#include <optional>
#include <string>
#include <vector>

namespace farkle::rules {

// A concrete keep decision for one roll: the dice set aside and the best
// partition of them into movelets.
struct Move {
    int points = 0;
    int dice_used = 0;
    FaceCounts kept{};
    std::vector<int> movelets;  // indices into movelets()

    Dice kept_dice() const;
    std::string describe() const;
};

bool operator==(const Move& a, const Move& b);

class RuleEngine {
public:
    RuleEngine() = default;

    // Maximal scoring combinations of a roll (keeps that no other scoring die
    // of the roll can extend). Empty means bust.
    std::vector<Move> score_roll(const Dice& dice) const;

    // Every keep a player may legally make, best first
    std::vector<Move> legal_moves(const Dice& dice) const;
    std::vector<Move> legal_moves_from_counts(const FaceCounts& counts) const;

    // Highest scoring keep, ties broken towards more dice used
    std::optional<Move> best_move(const Dice& dice) const;
    std::optional<Move> best_move_from_counts(const FaceCounts& counts) const;

    // Best partition score of an explicit selection, 0 if some die in it
    // does not score
    int score_selection(const Dice& kept) const;

    bool has_scoring_potential(const Dice& dice) const;

private:
    static FaceCounts validate_roll(const Dice& dice);
};

// Best partition score of a face multiset (at most six dice), -1 if it
// cannot be split entirely into movelets
int partition_score(const FaceCounts& counts);

} // namespace farkle::rules
