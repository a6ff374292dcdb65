// Usage: farkle_solve <policy.db> [threshold] [continue_probability] [tolerance]
//                     [max_iterations] [threads]
//
// Solves the bank/roll policy by value iteration and stores it with
// PolicyStore. Exit codes: 1 bad arguments, 2 no convergence, 3 storage.

#include "../include/errors.hpp"
#include "../include/solver/config.hpp"
#include "../include/solver/value_iteration.hpp"
#include "../include/storage/policy_store.hpp"
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace {

void usage() {
    fprintf(stderr,
            "usage: farkle_solve <policy.db> [threshold=10000] [continue_probability=0.95]\n"
            "                    [tolerance=1e-9] [max_iterations=10000] [threads=0]\n");
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || argc > 7) {
        usage();
        return 1;
    }

    std::string path = argv[1];
    farkle::solver::SolverConfig config;
    try {
        if (argc > 2) config.victory_threshold = std::stoi(argv[2]);
        if (argc > 3) config.continue_probability = std::stod(argv[3]);
        if (argc > 4) config.tolerance = std::stod(argv[4]);
        if (argc > 5) config.max_iterations = std::stoi(argv[5]);
        if (argc > 6) config.num_threads = std::stoi(argv[6]);
        config.validate();
    } catch (const farkle::ConfigError& e) {
        fprintf(stderr, "invalid configuration: %s\n", e.what());
        return 1;
    } catch (const std::logic_error& e) {
        fprintf(stderr, "cannot parse arguments: %s\n", e.what());
        usage();
        return 1;
    }

    fprintf(stderr, "Solving threshold=%d dice=%d continue=%.4f tolerance=%g cap=%d\n",
            config.victory_threshold, config.num_dice, config.continue_probability,
            config.tolerance, config.max_iterations);

    auto start = std::chrono::steady_clock::now();
    farkle::solver::OptimalStrategySolver solver(config);
    fprintf(stderr, "%zu states\n", solver.grid().size());

    try {
        auto result = solver.solve([](int iteration, double max_delta) {
            if (iteration % 25 == 0) {
                fprintf(stderr, "  sweep %d  max delta %.3e\n", iteration, max_delta);
            }
        });
        double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        farkle::GameState opening{config.num_dice, 0, 0};
        fprintf(stderr, "Converged after %d sweeps (max delta %.3e) in %.1fs\n",
                result.iterations, result.max_delta, seconds);
        fprintf(stderr, "Opening value %.6f, %zu bank states\n",
                result.policy.value(opening), result.policy.bank_count());

        farkle::storage::PolicyStore::save(result.policy, path);
        fprintf(stderr, "Wrote policy to %s\n", path.c_str());
    } catch (const farkle::NonConvergenceError& e) {
        fprintf(stderr, "%s\n", e.what());
        return 2;
    } catch (const farkle::StorageError& e) {
        fprintf(stderr, "%s\n", e.what());
        return 3;
    }
    return 0;
}
