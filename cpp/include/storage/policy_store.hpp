#pragma once
#include "../solver/policy.hpp"
#include <string>

namespace farkle::storage {

/**
 * SQLite persistence for solved policies.
 *
 * Tables:
 *   farkle_policy(dice, round_score, total_score, bank, value)
 *   farkle_meta(key, value)
 *
 * Values are stored as REAL, so a loaded policy compares equal to the one
 * that was saved. Any SQLite failure raises StorageError.
 */
class PolicyStore {
public:
    // Replaces any policy already stored at path
    static void save(const solver::Policy& policy, const std::string& path);

    static solver::Policy load(const std::string& path);
};

} // namespace farkle::storage
