#pragma once
#include "../common.hpp"
#include "match.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace farkle::sim {

// Aggregate outcome of many matches between the same strategies
struct BatchStats {
    int total_games = 0;
    std::vector<int> wins;     // per strategy, seat rotation undone
    int unfinished = 0;        // games stopped by the turn limit
    double average_turns = 0.0;
    long long total_busts = 0;
};

/**
 * Parallel match runner.
 *
 * Games are split across worker threads; game i uses seed + i and rotates
 * the seating by i so every strategy opens equally often. Results do not
 * depend on the thread count.
 *
 * Strategies are shared between threads and must be safe to call
 * concurrently (the built-in ones are stateless).
 */
class BatchSimulator {
public:
    /**
     * @param players Strategies, one per seat
     * @param num_threads Worker threads, 0 = hardware concurrency
     */
    BatchSimulator(std::vector<std::shared_ptr<strategy::Strategy>> players,
                   int num_threads = 8,
                   int victory_threshold = 10000,
                   int num_dice = kMaxDice);

    BatchStats run(int num_games, uint32_t seed = 0);

    // Swap a seat's strategy between batches
    void update_player(int seat, std::shared_ptr<strategy::Strategy> player);

    int num_threads() const { return num_threads_; }

private:
    std::vector<std::shared_ptr<strategy::Strategy>> players_;
    int num_threads_;
    int victory_threshold_;
    int num_dice_;
    std::mutex players_mutex_;  // Protect strategy updates
};

} // namespace farkle::sim
