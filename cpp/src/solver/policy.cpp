#include "../../include/solver/policy.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

namespace farkle::solver {

namespace {

std::string describe(const GameState& state) {
    return "(dice " + std::to_string(state.dice_remaining) +
           ", round " + std::to_string(state.round_score) +
           ", total " + std::to_string(state.total_score) + ")";
}

const SolverConfig& validated(const SolverConfig& config) {
    config.validate();
    return config;
}

} // namespace

Policy::Policy(const SolverConfig& config,
               std::vector<Action> decisions,
               std::vector<double> values)
    : config_(validated(config)),
      grid_(config.score_units(), config.num_dice),
      decisions_(std::move(decisions)),
      values_(std::move(values)) {
    if (decisions_.size() != grid_.size() || values_.size() != grid_.size()) {
        throw std::invalid_argument("Policy tables do not match the state grid: expected " +
                                    std::to_string(grid_.size()) + " states");
    }
}

size_t Policy::locate(const GameState& state) const {
    const int threshold = config_.victory_threshold;
    if (state.dice_remaining < 0 || state.dice_remaining > config_.num_dice) {
        throw BoundsError("Dice out of range for policy " + describe(state));
    }
    if (state.total_score < 0 || state.total_score >= threshold ||
        state.round_score < 0 || state.round_score > threshold) {
        throw BoundsError("Score out of range for policy " + describe(state));
    }
    if (state.total_score % kScoreUnit != 0 || state.round_score % kScoreUnit != 0) {
        throw BoundsError("Scores must be multiples of " + std::to_string(kScoreUnit) +
                          " " + describe(state));
    }
    if (state.total_score + state.round_score >= threshold) {
        return grid_.size();
    }

    // No dice left means every die scored: the whole hand is rolled again
    int dice = state.dice_remaining == 0 ? config_.num_dice : state.dice_remaining;
    return grid_.index(dice, state.round_score / kScoreUnit, state.total_score / kScoreUnit);
}

Action Policy::decision(const GameState& state) const {
    size_t slot = locate(state);
    if (slot == grid_.size()) {
        return Action::kBank;
    }
    return decisions_[slot];
}

double Policy::value(const GameState& state) const {
    size_t slot = locate(state);
    if (slot == grid_.size()) {
        return 1.0;
    }
    return values_[slot];
}

size_t Policy::bank_count() const {
    return static_cast<size_t>(std::count(decisions_.begin(), decisions_.end(), Action::kBank));
}

bool operator==(const Policy& a, const Policy& b) {
    if (!same_problem(a.config(), b.config())) {
        return false;
    }
    if (a.decisions() != b.decisions() || a.values().size() != b.values().size()) {
        return false;
    }
    return std::memcmp(a.values().data(), b.values().data(),
                       a.values().size() * sizeof(double)) == 0;
}

bool operator!=(const Policy& a, const Policy& b) {
    return !(a == b);
}

} // namespace farkle::solver
