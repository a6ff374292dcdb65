#include "../../include/strategy/strategy.hpp"
#include <algorithm>
#include <stdexcept>

namespace farkle::strategy {

rules::Move Strategy::decide_keep(const TurnView& view) {
    auto move = engine_.best_move(view.roll);
    if (!move) {
        throw std::invalid_argument("Nothing to keep from a bust roll");
    }
    return *move;
}

SimpleStrategy::SimpleStrategy(int bank_at, int min_dice)
    : bank_at_(bank_at), min_dice_(min_dice) {
    if (bank_at_ <= 0) {
        throw std::invalid_argument("bank_at must be positive");
    }
}

Action SimpleStrategy::decide_continue(const TurnView& view) {
    const GameState& s = view.state;
    if (s.round_score <= 0) {
        return Action::kRoll;
    }
    if (s.total_score + s.round_score >= view.victory_threshold) {
        return Action::kBank;
    }
    if (s.round_score >= bank_at_) {
        return Action::kBank;
    }
    // Hot dice (0) means a full hand
    if (s.dice_remaining != 0 && s.dice_remaining < min_dice_) {
        return Action::kBank;
    }
    return Action::kRoll;
}

std::string SimpleStrategy::name() const {
    return "simple(" + std::to_string(bank_at_) + "," + std::to_string(min_dice_) + ")";
}

OptimalStrategy::OptimalStrategy(std::shared_ptr<const solver::Policy> policy)
    : policy_(std::move(policy)) {
    if (!policy_) {
        throw std::invalid_argument("OptimalStrategy needs a policy");
    }
}

Action OptimalStrategy::decide_continue(const TurnView& view) {
    const GameState& s = view.state;
    if (s.round_score <= 0) {
        return Action::kRoll;
    }

    // The policy only knows its own grid: clip to its threshold
    const int threshold = policy_->config().victory_threshold;
    if (s.total_score + s.round_score >= threshold) {
        return Action::kBank;
    }
    GameState clipped{std::min(s.dice_remaining, policy_->config().num_dice),
                      s.round_score, s.total_score};
    return policy_->decision(clipped);
}

} // namespace farkle::strategy
