#pragma once
#include "../common.hpp"
#include "../rules/rule_engine.hpp"
#include "config.hpp"
#include "policy.hpp"
#include "state_grid.hpp"
#include <functional>
#include <utility>
#include <vector>

namespace farkle::solver {

// One non-bust result of rolling, after keeping the best move
struct Transition {
    int points_units;   // score gained, in units of 50
    int next_dice;      // dice to roll next, hot dice already folded in
    double probability;
};

// Distribution of rolling a fixed number of dice
struct RollTable {
    double bust_probability = 0.0;
    std::vector<Transition> transitions;  // ordered by (points, next dice)
};

// Roll tables for 1..num_dice dice; entry 0 is empty
std::vector<RollTable> build_roll_tables(const rules::RuleEngine& engine, int num_dice);

struct SolveResult {
    Policy policy;
    int iterations;
    double max_delta;  // change in the final sweep
};

/**
 * Value iteration for the single-player race to the victory threshold.
 *
 * V(d, r, t) is the probability of banking the threshold before the game
 * ends, where each new turn is reached with probability c (the continue
 * probability). For a state with d dice, round score r and total t:
 *
 *   bank = c * V(N, 0, t + r)                     (not allowed with r = 0)
 *   roll = P(bust) * c * V(N, 0, t)
 *        + sum P(p, d') * V(d', r + p, t)         (1 once t + r + p >= U)
 *
 * Sweeps are synchronous: every state of sweep k reads only the values of
 * sweep k - 1 and writes into a separate table. A sweep is split across
 * worker threads by bands of total score.
 */
class OptimalStrategySolver {
public:
    using ProgressCallback = std::function<void(int iteration, double max_delta)>;

    explicit OptimalStrategySolver(const SolverConfig& config);

    // Runs to convergence. Throws NonConvergenceError at the iteration cap.
    SolveResult solve(const ProgressCallback& progress = nullptr) const;

    const SolverConfig& config() const { return config_; }
    const StateGrid& grid() const { return grid_; }
    const std::vector<RollTable>& roll_tables() const { return roll_tables_; }

private:
    // Bands of total score [begin, end) with roughly equal state counts
    std::vector<std::pair<int, int>> make_bands(int num_bands) const;

    // Updates every state with total in [t_begin, t_end), returns max change
    double sweep_band(const std::vector<double>& current,
                      std::vector<double>& next,
                      std::vector<Action>& decisions,
                      int t_begin, int t_end) const;

    SolverConfig config_;
    StateGrid grid_;
    std::vector<RollTable> roll_tables_;
    int num_threads_;
};

} // namespace farkle::solver
