#include "../../include/sim/batch_simulator.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>

namespace farkle::sim {

namespace {

struct PartialStats {
    std::vector<int> wins;
    int unfinished = 0;
    long long turns = 0;
    long long busts = 0;
};

} // namespace

BatchSimulator::BatchSimulator(std::vector<std::shared_ptr<strategy::Strategy>> players,
                               int num_threads,
                               int victory_threshold,
                               int num_dice)
    : players_(std::move(players)),
      num_threads_(num_threads),
      victory_threshold_(victory_threshold),
      num_dice_(num_dice) {

    if (players_.empty()) {
        throw std::invalid_argument("A batch needs at least one player");
    }
    if (num_threads_ <= 0) {
        num_threads_ = static_cast<int>(std::thread::hardware_concurrency());
        if (num_threads_ <= 0) {
            num_threads_ = 4;  // Fallback
        }
    }
}

void BatchSimulator::update_player(int seat, std::shared_ptr<strategy::Strategy> player) {
    if (!player) {
        throw std::invalid_argument("Null strategy");
    }
    std::lock_guard<std::mutex> lock(players_mutex_);
    if (seat < 0 || seat >= static_cast<int>(players_.size())) {
        throw std::out_of_range("No such seat: " + std::to_string(seat));
    }
    players_[seat] = std::move(player);
}

BatchStats BatchSimulator::run(int num_games, uint32_t seed) {
    if (num_games < 0) {
        throw std::invalid_argument("num_games must not be negative");
    }

    std::vector<std::shared_ptr<strategy::Strategy>> players;
    {
        std::lock_guard<std::mutex> lock(players_mutex_);
        players = players_;
    }
    const int seats = static_cast<int>(players.size());

    auto play_range = [=](int begin, int end) {
        PartialStats partial;
        partial.wins.assign(seats, 0);

        for (int i = begin; i < end; i++) {
            // Seat s is taken by strategy (s + i) % seats
            std::vector<std::shared_ptr<strategy::Strategy>> seating(seats);
            for (int s = 0; s < seats; s++) {
                seating[s] = players[(s + i) % seats];
            }

            Match match(seating, victory_threshold_, num_dice_);
            MatchResult result = match.play(seed + static_cast<uint32_t>(i));

            if (result.winner < 0) {
                partial.unfinished++;
            } else {
                partial.wins[(result.winner + i) % seats]++;
            }
            partial.turns += result.turns;
            for (const TurnRecord& turn : result.log) {
                partial.busts += turn.busted ? 1 : 0;
            }
        }
        return partial;
    };

    const int workers = std::max(1, std::min(num_threads_, num_games));
    std::vector<std::future<PartialStats>> futures;
    for (int w = 0; w < workers; w++) {
        int begin = static_cast<int>(static_cast<long long>(num_games) * w / workers);
        int end = static_cast<int>(static_cast<long long>(num_games) * (w + 1) / workers);
        futures.push_back(std::async(std::launch::async, play_range, begin, end));
    }

    // Collect results from all workers
    BatchStats stats;
    stats.total_games = num_games;
    stats.wins.assign(seats, 0);
    long long turns = 0;

    for (auto& future : futures) {
        PartialStats partial = future.get();
        for (int s = 0; s < seats; s++) {
            stats.wins[s] += partial.wins[s];
        }
        stats.unfinished += partial.unfinished;
        stats.total_busts += partial.busts;
        turns += partial.turns;
    }

    stats.average_turns = num_games > 0 ? static_cast<double>(turns) / num_games : 0.0;
    return stats;
}

} // namespace farkle::sim
