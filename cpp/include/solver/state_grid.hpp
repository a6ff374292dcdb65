#pragma once
#include <cstddef>

namespace farkle::solver {

/**
 * Dense layout of the non-terminal decision states.
 *
 * Coordinates are in score units (50 points). A state (d, r, t) is stored
 * when 0 <= t < U, 0 <= r < U - t and 1 <= d <= N. Everything with
 * t + r >= U is an absorbing won state and has no slot.
 *
 * Rows are grouped by total score so that a band of totals is one
 * contiguous range of the table.
 */
class StateGrid {
public:
    StateGrid(int score_units, int num_dice);

    bool contains(int dice, int round_units, int total_units) const;

    // Caller guarantees contains(dice, round_units, total_units)
    size_t index(int dice, int round_units, int total_units) const {
        return (row_offset(total_units) + static_cast<size_t>(round_units)) * num_dice_ +
               static_cast<size_t>(dice - 1);
    }

    // First slot of the row for the given total score
    size_t row_begin(int total_units) const {
        return row_offset(total_units) * num_dice_;
    }

    size_t size() const { return row_begin(score_units_); }
    int score_units() const { return score_units_; }
    int num_dice() const { return num_dice_; }

private:
    size_t row_offset(int total_units) const {
        size_t t = static_cast<size_t>(total_units);
        size_t u = static_cast<size_t>(score_units_);
        return t * u - (t * (t - 1)) / 2;
    }

    int score_units_;
    int num_dice_;
};

} // namespace farkle::solver
