#pragma once
#include "../common.hpp"

namespace farkle::solver {

struct SolverConfig {
    int victory_threshold = 10000;      // points needed to win, multiple of 50
    int num_dice = kMaxDice;            // dice per full roll, 1..6
    double continue_probability = 0.95; // chance the game is still open next turn
    double tolerance = 1e-9;            // max value change that counts as converged
    int max_iterations = 10000;         // sweeps before giving up
    int num_threads = 0;                // 0 = hardware concurrency

    // Throws ConfigError describing the first invalid field
    void validate() const;

    // Threshold in score units
    int score_units() const { return victory_threshold / kScoreUnit; }
};

// Fields that shape the solved policy; thread count is excluded
bool same_problem(const SolverConfig& a, const SolverConfig& b);

} // namespace farkle::solver
