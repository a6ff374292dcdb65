#pragma once
#include "../common.hpp"
#include "config.hpp"
#include "state_grid.hpp"
#include <vector>

namespace farkle::solver {

/**
 * Solved bank/roll decision for every state of the grid.
 *
 * Read-only once built. Queries take scores in points; they must be
 * multiples of 50 with the total below the victory threshold and the round
 * score at most the threshold. A round that already reaches the threshold
 * answers bank with value 1. Anything else raises BoundsError: callers clip
 * before asking.
 */
class Policy {
public:
    Policy(const SolverConfig& config,
           std::vector<Action> decisions,
           std::vector<double> values);

    Action decision(const GameState& state) const;
    double value(const GameState& state) const;
    bool is_bank(const GameState& state) const { return decision(state) == Action::kBank; }

    const SolverConfig& config() const { return config_; }
    const StateGrid& grid() const { return grid_; }
    const std::vector<Action>& decisions() const { return decisions_; }
    const std::vector<double>& values() const { return values_; }

    // Number of grid states where the policy banks
    size_t bank_count() const;

private:
    // Slot of a query, or grid().size() for a won state
    size_t locate(const GameState& state) const;

    SolverConfig config_;
    StateGrid grid_;
    std::vector<Action> decisions_;
    std::vector<double> values_;
};

// Same problem, same decisions and bit-identical values
bool operator==(const Policy& a, const Policy& b);
bool operator!=(const Policy& a, const Policy& b);

} // namespace farkle::solver
