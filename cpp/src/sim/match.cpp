#include "../../include/sim/match.hpp"
#include "../../include/game/farkle_game.hpp"
#include <stdexcept>

namespace farkle::sim {

Match::Match(std::vector<std::shared_ptr<strategy::Strategy>> players,
             int victory_threshold,
             int num_dice,
             int max_turns)
    : players_(std::move(players)),
      victory_threshold_(victory_threshold),
      num_dice_(num_dice),
      max_turns_(max_turns) {

    if (players_.empty()) {
        throw std::invalid_argument("A match needs at least one player");
    }
    for (const auto& player : players_) {
        if (!player) {
            throw std::invalid_argument("Null strategy in match");
        }
    }
}

MatchResult Match::play(uint32_t seed) {
    game::FarkleGame game(static_cast<int>(players_.size()), victory_threshold_, num_dice_, seed);

    MatchResult result;
    result.winner = -1;
    result.turns = 0;

    while (!game.is_terminal() && result.turns < max_turns_) {
        TurnRecord record;
        record.player = game.current_player();
        record.busted = false;
        record.round_score = 0;

        strategy::Strategy& player = *players_[record.player];

        while (true) {
            record.rolls.push_back(game.roll());
            if (game.last_roll_bust()) {
                record.busted = true;
                break;
            }

            strategy::TurnView keep_view{game.get_state(), game.scores(), record.player,
                                         victory_threshold_, game.last_roll()};
            rules::Move move = player.decide_keep(keep_view);
            game.keep(move);
            record.kept_points.push_back(move.points);

            strategy::TurnView view{game.get_state(), game.scores(), record.player,
                                    victory_threshold_};
            if (player.decide_continue(view) == Action::kBank) {
                record.round_score = game.round_score();
                game.bank();
                break;
            }
        }

        record.total_after = game.scores()[record.player];
        result.log.push_back(std::move(record));
        result.turns++;
    }

    if (game.winner().has_value()) {
        result.winner = game.winner().value();
    }
    result.final_scores = game.scores();
    return result;
}

} // namespace farkle::sim
