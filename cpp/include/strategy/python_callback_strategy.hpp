#pragma once

#include "strategy.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace farkle::strategy {

/**
 * Strategy that calls back to a Python object for its turn decisions.
 *
 * Lets scripted or experimental players in Python take part in C++ matches
 * and batch simulations. The GIL is acquired for each call, so batches may
 * run with it released.
 */
class PythonCallbackStrategy : public Strategy {
public:
    /**
     * Create strategy with Python callable.
     *
     * @param py_strategy Python object with
     *        decide(dice_remaining, round_score, total_score, scores) -> bool
     *        returning True to bank, and optionally
     *        keep(roll, dice_remaining, round_score, total_score, scores) -> list
     *        returning the dice to set aside (best move when absent)
     * @param name Label used in match logs
     */
    explicit PythonCallbackStrategy(py::object py_strategy, std::string name = "python");

    ~PythonCallbackStrategy() override;

    rules::Move decide_keep(const TurnView& view) override;
    Action decide_continue(const TurnView& view) override;
    std::string name() const override { return name_; }

private:
    py::object py_strategy_;  // Python strategy object
    std::string name_;
};

} // namespace farkle::strategy
