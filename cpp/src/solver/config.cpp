#include "../../include/solver/config.hpp"
#include "../../include/errors.hpp"
#include <string>

namespace farkle::solver {

void SolverConfig::validate() const {
    if (victory_threshold <= 0 || victory_threshold % kScoreUnit != 0) {
        throw ConfigError("victory_threshold must be a positive multiple of " +
                          std::to_string(kScoreUnit) + ", got " +
                          std::to_string(victory_threshold));
    }
    if (num_dice < 1 || num_dice > kMaxDice) {
        throw ConfigError("num_dice must be in [1, 6], got " + std::to_string(num_dice));
    }
    if (!(continue_probability > 0.0 && continue_probability <= 1.0)) {
        throw ConfigError("continue_probability must be in (0, 1]");
    }
    if (!(tolerance > 0.0)) {
        throw ConfigError("tolerance must be positive");
    }
    if (max_iterations <= 0) {
        throw ConfigError("max_iterations must be positive");
    }
    if (num_threads < 0) {
        throw ConfigError("num_threads must not be negative");
    }
}

bool same_problem(const SolverConfig& a, const SolverConfig& b) {
    return a.victory_threshold == b.victory_threshold &&
           a.num_dice == b.num_dice &&
           a.continue_probability == b.continue_probability &&
           a.tolerance == b.tolerance &&
           a.max_iterations == b.max_iterations;
}

} // namespace farkle::solver
