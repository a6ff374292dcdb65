#include "../../include/storage/policy_store.hpp"
#include "../../include/errors.hpp"
#include <sqlite3.h>
#include <climits>
#include <cmath>
#include <map>
#include <memory>
#include <vector>

namespace farkle::storage {

namespace {

struct DbCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};

struct StmtFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using DbHandle = std::unique_ptr<sqlite3, DbCloser>;
using StmtHandle = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

DbHandle open_db(const std::string& path, int flags) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    DbHandle db(raw);
    if (rc != SQLITE_OK) {
        std::string message = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        throw StorageError("Cannot open policy database " + path + ": " + message);
    }
    return db;
}

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "(unknown)";
        sqlite3_free(err);
        throw StorageError("SQLite error: " + message);
    }
}

StmtHandle prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        throw StorageError(std::string("Cannot prepare statement: ") + sqlite3_errmsg(db));
    }
    return StmtHandle(raw);
}

void check_bind(sqlite3* db, int rc) {
    if (rc != SQLITE_OK) {
        throw StorageError(std::string("Cannot bind value: ") + sqlite3_errmsg(db));
    }
}

void reset(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_reset(stmt) != SQLITE_OK) {
        throw StorageError(std::string("Cannot reset statement: ") + sqlite3_errmsg(db));
    }
}

void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw StorageError(std::string("Insert failed: ") + sqlite3_errmsg(db));
    }
}

double require(const std::map<std::string, double>& meta, const std::string& key) {
    auto it = meta.find(key);
    if (it == meta.end()) {
        throw StorageError("Policy metadata is missing '" + key + "'");
    }
    return it->second;
}

int require_int(const std::map<std::string, double>& meta, const std::string& key) {
    double value = require(meta, key);
    if (!std::isfinite(value) || value != std::floor(value) ||
        value < static_cast<double>(INT_MIN) || value > static_cast<double>(INT_MAX)) {
        throw StorageError("Policy metadata '" + key + "' is not an integer: " +
                           std::to_string(value));
    }
    return static_cast<int>(value);
}

// Rolls back unless committed, so a failed save keeps the previous policy
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE;"); }

    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit() {
        exec(db_, "COMMIT;");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

} // namespace

void PolicyStore::save(const solver::Policy& policy, const std::string& path) {
    DbHandle db = open_db(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    sqlite3* raw = db.get();

    // Keep the rollback journal: the old tables are only replaced on commit
    exec(raw, "PRAGMA synchronous=NORMAL;");

    Transaction transaction(raw);
    exec(raw, "DROP TABLE IF EXISTS farkle_policy;");
    exec(raw, "DROP TABLE IF EXISTS farkle_meta;");
    exec(raw, "CREATE TABLE farkle_policy(dice INTEGER,round_score INTEGER,total_score INTEGER,"
              "bank INTEGER,value REAL,"
              "PRIMARY KEY(dice,round_score,total_score));");
    exec(raw, "CREATE TABLE farkle_meta(key TEXT PRIMARY KEY,value REAL);");

    const solver::StateGrid& grid = policy.grid();
    const auto& decisions = policy.decisions();
    const auto& values = policy.values();

    StmtHandle insert = prepare(raw, "INSERT INTO farkle_policy VALUES(?,?,?,?,?);");
    sqlite3_stmt* row = insert.get();
    for (int t = 0; t < grid.score_units(); t++) {
        for (int r = 0; r < grid.score_units() - t; r++) {
            for (int d = 1; d <= grid.num_dice(); d++) {
                size_t slot = grid.index(d, r, t);
                reset(raw, row);
                check_bind(raw, sqlite3_bind_int(row, 1, d));
                check_bind(raw, sqlite3_bind_int(row, 2, r * kScoreUnit));
                check_bind(raw, sqlite3_bind_int(row, 3, t * kScoreUnit));
                check_bind(raw, sqlite3_bind_int(row, 4, decisions[slot] == Action::kBank ? 1 : 0));
                check_bind(raw, sqlite3_bind_double(row, 5, values[slot]));
                step_done(raw, row);
            }
        }
    }

    const solver::SolverConfig& config = policy.config();
    StmtHandle meta = prepare(raw, "INSERT INTO farkle_meta(key,value) VALUES(?,?);");
    auto put = [&](const char* key, double value) {
        reset(raw, meta.get());
        check_bind(raw, sqlite3_bind_text(meta.get(), 1, key, -1, SQLITE_TRANSIENT));
        check_bind(raw, sqlite3_bind_double(meta.get(), 2, value));
        step_done(raw, meta.get());
    };
    put("victory_threshold", config.victory_threshold);
    put("num_dice", config.num_dice);
    put("continue_probability", config.continue_probability);
    put("tolerance", config.tolerance);
    put("max_iterations", config.max_iterations);
    put("state_count", static_cast<double>(grid.size()));

    // Statements must be finalized before the transaction ends
    insert.reset();
    meta.reset();
    transaction.commit();
}

solver::Policy PolicyStore::load(const std::string& path) {
    DbHandle db = open_db(path, SQLITE_OPEN_READONLY);
    sqlite3* raw = db.get();

    std::map<std::string, double> meta;
    {
        StmtHandle query = prepare(raw, "SELECT key,value FROM farkle_meta;");
        int rc;
        while ((rc = sqlite3_step(query.get())) == SQLITE_ROW) {
            const unsigned char* key = sqlite3_column_text(query.get(), 0);
            meta[key ? reinterpret_cast<const char*>(key) : ""] = sqlite3_column_double(query.get(), 1);
        }
        if (rc != SQLITE_DONE) {
            throw StorageError(std::string("Reading policy metadata failed: ") + sqlite3_errmsg(raw));
        }
    }

    solver::SolverConfig config;
    config.victory_threshold = require_int(meta, "victory_threshold");
    config.num_dice = require_int(meta, "num_dice");
    config.continue_probability = require(meta, "continue_probability");
    config.tolerance = require(meta, "tolerance");
    config.max_iterations = require_int(meta, "max_iterations");
    try {
        config.validate();
    } catch (const ConfigError& e) {
        throw StorageError(std::string("Stored policy has an invalid configuration: ") + e.what());
    }

    solver::StateGrid grid(config.score_units(), config.num_dice);
    std::vector<Action> decisions(grid.size(), Action::kRoll);
    std::vector<double> values(grid.size(), 0.0);
    std::vector<bool> seen(grid.size(), false);
    size_t filled = 0;

    StmtHandle query = prepare(raw, "SELECT dice,round_score,total_score,bank,value FROM farkle_policy;");
    int rc;
    while ((rc = sqlite3_step(query.get())) == SQLITE_ROW) {
        int dice = sqlite3_column_int(query.get(), 0);
        int round_score = sqlite3_column_int(query.get(), 1);
        int total_score = sqlite3_column_int(query.get(), 2);
        if (round_score % kScoreUnit != 0 || total_score % kScoreUnit != 0 ||
            !grid.contains(dice, round_score / kScoreUnit, total_score / kScoreUnit)) {
            throw StorageError("Stored policy has a state outside its grid");
        }
        size_t slot = grid.index(dice, round_score / kScoreUnit, total_score / kScoreUnit);
        if (!seen[slot]) {
            seen[slot] = true;
            filled++;
        }
        decisions[slot] = sqlite3_column_int(query.get(), 3) != 0 ? Action::kBank : Action::kRoll;
        values[slot] = sqlite3_column_double(query.get(), 4);
    }
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("Reading policy failed: ") + sqlite3_errmsg(raw));
    }
    if (filled != grid.size()) {
        throw StorageError("Stored policy is incomplete: " + std::to_string(filled) + " of " +
                           std::to_string(grid.size()) + " states");
    }

    return solver::Policy(config, std::move(decisions), std::move(values));
}

} // namespace farkle::storage
