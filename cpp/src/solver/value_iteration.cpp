#include "../../include/solver/value_iteration.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <future>
#include <map>
#include <thread>

namespace farkle::solver {

namespace {

const SolverConfig& validated(const SolverConfig& config) {
    config.validate();
    return config;
}

double factorial(int n) {
    double result = 1.0;
    for (int i = 2; i <= n; i++) {
        result *= i;
    }
    return result;
}

} // namespace

std::vector<RollTable> build_roll_tables(const rules::RuleEngine& engine, int num_dice) {
    std::vector<RollTable> tables(num_dice + 1);

    for (int dice = 1; dice <= num_dice; dice++) {
        const double outcomes = std::pow(6.0, dice);
        std::map<std::pair<int, int>, double> merged;
        RollTable& table = tables[dice];

        // Each multiset of faces, weighted by its number of orderings
        FaceCounts counts{};
        std::function<void(int, int)> enumerate = [&](int face, int left) {
            if (face == 6) {
                counts[6] = left;
                double orderings = factorial(dice);
                for (int f = 1; f <= 6; f++) {
                    orderings /= factorial(counts[f]);
                }
                double p = orderings / outcomes;

                auto move = engine.best_move_from_counts(counts);
                if (!move) {
                    table.bust_probability += p;
                } else {
                    int next = dice - move->dice_used;
                    if (next == 0) {
                        next = num_dice;  // hot dice
                    }
                    merged[{move->points / kScoreUnit, next}] += p;
                }
                return;
            }
            for (int n = 0; n <= left; n++) {
                counts[face] = n;
                enumerate(face + 1, left - n);
            }
            counts[face] = 0;
        };
        enumerate(1, dice);

        for (const auto& [key, p] : merged) {
            table.transitions.push_back(Transition{key.first, key.second, p});
        }
    }

    return tables;
}

OptimalStrategySolver::OptimalStrategySolver(const SolverConfig& config)
    : config_(validated(config)),
      grid_(config.score_units(), config.num_dice),
      roll_tables_(build_roll_tables(rules::RuleEngine(), config.num_dice)),
      num_threads_(config.num_threads) {

    if (num_threads_ <= 0) {
        num_threads_ = static_cast<int>(std::thread::hardware_concurrency());
        if (num_threads_ <= 0) {
            num_threads_ = 4;  // Fallback
        }
    }
}

std::vector<std::pair<int, int>> OptimalStrategySolver::make_bands(int num_bands) const {
    const int units = grid_.score_units();
    num_bands = std::max(1, std::min(num_bands, units));

    std::vector<std::pair<int, int>> bands;
    const size_t target = (grid_.size() + num_bands - 1) / num_bands;
    int begin = 0;
    for (int t = 0; t < units; t++) {
        bool last_row = (t + 1 == units);
        if (last_row || grid_.row_begin(t + 1) - grid_.row_begin(begin) >= target) {
            bands.emplace_back(begin, t + 1);
            begin = t + 1;
        }
    }
    return bands;
}

double OptimalStrategySolver::sweep_band(const std::vector<double>& current,
                                         std::vector<double>& next,
                                         std::vector<Action>& decisions,
                                         int t_begin, int t_end) const {
    const int units = grid_.score_units();
    const int full_hand = grid_.num_dice();
    const double carry = config_.continue_probability;

    double max_delta = 0.0;
    for (int t = t_begin; t < t_end; t++) {
        const double restart = carry * current[grid_.index(full_hand, 0, t)];

        for (int r = 0; r < units - t; r++) {
            const double bank = (r > 0) ? carry * current[grid_.index(full_hand, 0, t + r)] : -1.0;

            for (int d = 1; d <= full_hand; d++) {
                const RollTable& table = roll_tables_[d];
                double roll = table.bust_probability * restart;
                for (const Transition& tr : table.transitions) {
                    int reached = r + tr.points_units;
                    if (t + reached >= units) {
                        roll += tr.probability;
                    } else {
                        roll += tr.probability * current[grid_.index(tr.next_dice, reached, t)];
                    }
                }

                const size_t slot = grid_.index(d, r, t);
                if (bank >= roll) {
                    next[slot] = bank;
                    decisions[slot] = Action::kBank;
                } else {
                    next[slot] = roll;
                    decisions[slot] = Action::kRoll;
                }
                max_delta = std::max(max_delta, std::fabs(next[slot] - current[slot]));
            }
        }
    }
    return max_delta;
}

SolveResult OptimalStrategySolver::solve(const ProgressCallback& progress) const {
    const size_t states = grid_.size();
    std::vector<double> current(states, 0.0);
    std::vector<double> next(states, 0.0);
    std::vector<Action> decisions(states, Action::kRoll);

    const auto bands = make_bands(num_threads_);

    double max_delta = 0.0;
    for (int iteration = 1; iteration <= config_.max_iterations; iteration++) {
        if (bands.size() == 1) {
            max_delta = sweep_band(current, next, decisions, bands[0].first, bands[0].second);
        } else {
            // Bands write disjoint ranges of next/decisions and only read current
            std::vector<std::future<double>> futures;
            for (const auto& band : bands) {
                futures.push_back(std::async(std::launch::async, [&, band]() {
                    return sweep_band(current, next, decisions, band.first, band.second);
                }));
            }
            max_delta = 0.0;
            for (auto& future : futures) {
                max_delta = std::max(max_delta, future.get());
            }
        }

        current.swap(next);

        if (progress) {
            progress(iteration, max_delta);
        }
        if (max_delta < config_.tolerance) {
            return SolveResult{Policy(config_, std::move(decisions), std::move(current)),
                               iteration, max_delta};
        }
    }

    throw NonConvergenceError(config_.max_iterations, max_delta);
}

} // namespace farkle::solver
