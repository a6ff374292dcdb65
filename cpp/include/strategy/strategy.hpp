#pragma once
#include "../common.hpp"
#include "../rules/rule_engine.hpp"
#include "../solver/policy.hpp"
#include <memory>
#include <string>
#include <vector>

namespace farkle::strategy {

// What a player sees when deciding. When keeping, roll holds the dice on the
// table and state the round before the keep; when choosing to roll on or
// bank, roll is empty and state includes the kept points.
struct TurnView {
    GameState state;               // own dice, round and total
    std::vector<int> scores;       // banked totals of every seat
    int seat;                      // index of the deciding player in scores
    int victory_threshold;
    Dice roll = {};
};

// Interface for a player's two decisions in a turn
class Strategy {
public:
    virtual ~Strategy() = default;

    // Which scoring dice to set aside from view.roll. Defaults to the best move.
    virtual rules::Move decide_keep(const TurnView& view);

    virtual Action decide_continue(const TurnView& view) = 0;
    virtual std::string name() const = 0;

protected:
    rules::RuleEngine engine_;
};

// Fixed rule of thumb: bank at a round target or when few dice remain
class SimpleStrategy : public Strategy {
public:
    explicit SimpleStrategy(int bank_at = 300, int min_dice = 3);

    Action decide_continue(const TurnView& view) override;
    std::string name() const override;

private:
    int bank_at_;
    int min_dice_;
};

// Follows a solved policy
class OptimalStrategy : public Strategy {
public:
    explicit OptimalStrategy(std::shared_ptr<const solver::Policy> policy);

    Action decide_continue(const TurnView& view) override;
    std::string name() const override { return "optimal"; }

    const solver::Policy& policy() const { return *policy_; }

private:
    std::shared_ptr<const solver::Policy> policy_;
};

} // namespace farkle::strategy
