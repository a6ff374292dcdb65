#include "../include/errors.hpp"
#include "../include/solver/value_iteration.hpp"
#include "../include/storage/policy_store.hpp"
#include "check.hpp"

#include <sqlite3.h>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>

using farkle::GameState;
using farkle::solver::OptimalStrategySolver;
using farkle::solver::SolverConfig;
using farkle::storage::PolicyStore;

static std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

static void test_saved_policy_loads_identically() {
    SolverConfig config;
    config.victory_threshold = 1000;
    config.continue_probability = 0.9;
    auto result = OptimalStrategySolver(config).solve();

    std::string path = temp_path("farkle_policy_roundtrip.db");
    std::remove(path.c_str());
    PolicyStore::save(result.policy, path);

    auto loaded = PolicyStore::load(path);
    CHECK(loaded == result.policy);
    CHECK(loaded.config().victory_threshold == 1000);
    CHECK(loaded.config().continue_probability == 0.9);
    CHECK(loaded.value(GameState{6, 0, 0}) == result.policy.value(GameState{6, 0, 0}));
    CHECK(loaded.bank_count() == result.policy.bank_count());

    std::remove(path.c_str());
}

static void test_saving_twice_replaces_the_policy() {
    std::string path = temp_path("farkle_policy_replace.db");
    std::remove(path.c_str());

    SolverConfig small;
    small.victory_threshold = 500;
    PolicyStore::save(OptimalStrategySolver(small).solve().policy, path);

    SolverConfig larger;
    larger.victory_threshold = 1000;
    auto result = OptimalStrategySolver(larger).solve();
    PolicyStore::save(result.policy, path);

    auto loaded = PolicyStore::load(path);
    CHECK(loaded == result.policy);
    CHECK(loaded.grid().size() == result.policy.grid().size());

    std::remove(path.c_str());
}

static void test_missing_database_raises_storage_error() {
    std::string path = temp_path("farkle_policy_does_not_exist.db");
    std::remove(path.c_str());
    CHECK_THROWS(PolicyStore::load(path), farkle::StorageError);
}

static void test_database_without_policy_raises_storage_error() {
    std::string path = temp_path("farkle_policy_not_a_db.db");
    {
        std::FILE* f = std::fopen(path.c_str(), "w");
        CHECK(f != nullptr);
        std::fputs("definitely not sqlite\n", f);
        std::fclose(f);
    }
    CHECK_THROWS(PolicyStore::load(path), farkle::StorageError);
    std::remove(path.c_str());
}

static void run_sql(const std::string& path, const char* sql) {
    sqlite3* db = nullptr;
    CHECK(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    CHECK(sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);
}

static void test_unwritable_path_raises_storage_error() {
    SolverConfig config;
    config.victory_threshold = 500;
    auto result = OptimalStrategySolver(config).solve();

    std::string path = temp_path("farkle_no_such_directory/policy.db");
    CHECK_THROWS(PolicyStore::save(result.policy, path), farkle::StorageError);
}

static void test_failed_save_keeps_previous_policy() {
    std::string path = temp_path("farkle_policy_locked.db");
    std::remove(path.c_str());

    SolverConfig kept_config;
    kept_config.victory_threshold = 500;
    auto kept = OptimalStrategySolver(kept_config).solve();
    PolicyStore::save(kept.policy, path);

    SolverConfig other_config;
    other_config.victory_threshold = 1000;
    auto other = OptimalStrategySolver(other_config).solve();

    // Another writer holds the database while we try to replace the policy
    sqlite3* writer = nullptr;
    CHECK(sqlite3_open(path.c_str(), &writer) == SQLITE_OK);
    CHECK(sqlite3_exec(writer, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) == SQLITE_OK);
    CHECK_THROWS(PolicyStore::save(other.policy, path), farkle::StorageError);
    CHECK(sqlite3_exec(writer, "ROLLBACK;", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(writer);

    auto loaded = PolicyStore::load(path);
    CHECK(loaded == kept.policy);
    CHECK(loaded.config().victory_threshold == 500);

    std::remove(path.c_str());
}

static void test_out_of_range_metadata_raises_storage_error() {
    std::string path = temp_path("farkle_policy_bad_meta.db");
    std::remove(path.c_str());

    SolverConfig config;
    config.victory_threshold = 500;
    PolicyStore::save(OptimalStrategySolver(config).solve().policy, path);

    run_sql(path, "UPDATE farkle_meta SET value=1e300 WHERE key='victory_threshold';");
    CHECK_THROWS(PolicyStore::load(path), farkle::StorageError);

    run_sql(path, "UPDATE farkle_meta SET value=500.5 WHERE key='victory_threshold';");
    CHECK_THROWS(PolicyStore::load(path), farkle::StorageError);

    run_sql(path, "UPDATE farkle_meta SET value=500 WHERE key='victory_threshold';"
                  "UPDATE farkle_meta SET value=-1e300 WHERE key='num_dice';");
    CHECK_THROWS(PolicyStore::load(path), farkle::StorageError);

    std::remove(path.c_str());
}

int main() {
    test_saved_policy_loads_identically();
    test_saving_twice_replaces_the_policy();
    test_missing_database_raises_storage_error();
    test_database_without_policy_raises_storage_error();
    test_unwritable_path_raises_storage_error();
    test_failed_save_keeps_previous_policy();
    test_out_of_range_metadata_raises_storage_error();

    std::cout << "All policy store tests passed\n";
    return 0;
}
