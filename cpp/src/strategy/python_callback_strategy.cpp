#include "strategy/python_callback_strategy.hpp"
#include <pybind11/stl.h>
#include <stdexcept>

namespace farkle::strategy {

PythonCallbackStrategy::PythonCallbackStrategy(py::object py_strategy, std::string name)
    : py_strategy_(std::move(py_strategy)), name_(std::move(name)) {

    // Verify the Python object has a decide method
    if (!py::hasattr(py_strategy_, "decide")) {
        throw std::runtime_error("Python strategy must have a 'decide(...)' method");
    }
}

PythonCallbackStrategy::~PythonCallbackStrategy() {
    // Worker threads may hold the last reference with the GIL released
    py::gil_scoped_acquire gil;
    py_strategy_ = py::object();
}

rules::Move PythonCallbackStrategy::decide_keep(const TurnView& view) {
    Dice kept;
    {
        py::gil_scoped_acquire gil;
        if (!py::hasattr(py_strategy_, "keep")) {
            return Strategy::decide_keep(view);
        }
        py::object result = py_strategy_.attr("keep")(view.roll,
                                                      view.state.dice_remaining,
                                                      view.state.round_score,
                                                      view.state.total_score,
                                                      view.scores);
        kept = result.cast<Dice>();
    }

    const FaceCounts counts = count_faces(kept);
    for (const rules::Move& move : engine_.legal_moves(view.roll)) {
        if (move.kept == counts) {
            return move;
        }
    }
    throw std::invalid_argument("Python strategy kept dice that do not form a legal move");
}

Action PythonCallbackStrategy::decide_continue(const TurnView& view) {
    py::gil_scoped_acquire gil;

    py::object result = py_strategy_.attr("decide")(view.state.dice_remaining,
                                                    view.state.round_score,
                                                    view.state.total_score,
                                                    view.scores);
    return result.cast<bool>() ? Action::kBank : Action::kRoll;
}

} // namespace farkle::strategy
