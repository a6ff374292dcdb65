#include "../../include/solver/state_grid.hpp"
#include "../../include/common.hpp"
#include <stdexcept>

namespace farkle::solver {

StateGrid::StateGrid(int score_units, int num_dice)
    : score_units_(score_units), num_dice_(num_dice) {
    if (score_units_ <= 0) {
        throw std::invalid_argument("State grid needs at least one score unit");
    }
    if (num_dice_ < 1 || num_dice_ > kMaxDice) {
        throw std::invalid_argument("State grid dice count must be in [1, 6]");
    }
}

bool StateGrid::contains(int dice, int round_units, int total_units) const {
    return dice >= 1 && dice <= num_dice_ &&
           total_units >= 0 && total_units < score_units_ &&
           round_units >= 0 && round_units < score_units_ - total_units;
}

} // namespace farkle::solver
