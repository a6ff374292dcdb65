#pragma once
#include <stdexcept>
#include <string>

namespace farkle {

// Roll with no dice, too many dice, or a face outside [1,6]
class InvalidRollError : public std::invalid_argument {
public:
    explicit InvalidRollError(const std::string& what) : std::invalid_argument(what) {}
};

class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Policy lookup outside the solved grid. Callers clip before querying.
class BoundsError : public std::out_of_range {
public:
    explicit BoundsError(const std::string& what) : std::out_of_range(what) {}
};

// Value iteration hit its iteration cap before the tolerance was met
class NonConvergenceError : public std::runtime_error {
public:
    NonConvergenceError(int iterations, double max_delta);

    int iterations() const { return iterations_; }
    double max_delta() const { return max_delta_; }

private:
    int iterations_;
    double max_delta_;
};

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace farkle
