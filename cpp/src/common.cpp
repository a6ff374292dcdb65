#include "../include/common.hpp"
#include "../include/errors.hpp"
#include <string>

namespace farkle {

FaceCounts count_faces(const Dice& dice) {
    FaceCounts counts{};
    for (int face : dice) {
        if (face < 1 || face > 6) {
            throw InvalidRollError("Die face out of range: " + std::to_string(face));
        }
        counts[face]++;
    }
    return counts;
}

int total_dice(const FaceCounts& counts) {
    int total = 0;
    for (int face = 1; face <= 6; face++) {
        total += counts[face];
    }
    return total;
}

NonConvergenceError::NonConvergenceError(int iterations, double max_delta)
    : std::runtime_error("Value iteration did not converge after " +
                         std::to_string(iterations) + " iterations (max delta " +
                         std::to_string(max_delta) + ")"),
      iterations_(iterations),
      max_delta_(max_delta) {}

} // namespace farkle
