// File: src/storage/result_store.cpp
#include "storage/result_store.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace floodvi {

// ============================================================================
// Constructor and Destructor
// ============================================================================

ResultStore::ResultStore(const Config& config)
    : config_(config) {

    if (config_.db_path.empty()) {
        throw std::invalid_argument("Result store path must not be empty");
    }

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open result store " + config_.db_path + ": " + error);
    }

    try {
        InitializeDatabase();
    } catch (const std::exception&) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

ResultStore::~ResultStore() {
    if (db_) {
        // sqlite3_close_v2 defers the close until outstanding statements finish
        if (sqlite3_close_v2(db_) != SQLITE_OK) {
            std::cerr << "Warning: result store did not close cleanly: "
                      << sqlite3_errmsg(db_) << std::endl;
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void ResultStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal && config_.db_path != ":memory:") {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    ExecuteSQL("PRAGMA foreign_keys=ON;");

    CreateTables();
}

void ResultStore::CreateTables() {
    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            label TEXT NOT NULL,
            started_at INTEGER NOT NULL
        );
    )");

    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS factor_columns (
            run_id INTEGER NOT NULL REFERENCES runs(id) ON DELETE CASCADE,
            category INTEGER NOT NULL,
            stage INTEGER NOT NULL,
            position INTEGER NOT NULL,
            factor TEXT NOT NULL,
            PRIMARY KEY (run_id, category, stage, position)
        );
    )");

    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS factor_values (
            run_id INTEGER NOT NULL REFERENCES runs(id) ON DELETE CASCADE,
            category INTEGER NOT NULL,
            stage INTEGER NOT NULL,
            zone_position INTEGER NOT NULL,
            zone_id TEXT NOT NULL,
            factor TEXT NOT NULL,
            value REAL,
            PRIMARY KEY (run_id, category, stage, zone_id, factor)
        );
    )");

    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS category_index (
            run_id INTEGER NOT NULL REFERENCES runs(id) ON DELETE CASCADE,
            category INTEGER NOT NULL,
            position INTEGER NOT NULL,
            zone_id TEXT NOT NULL,
            value REAL NOT NULL,
            weight_used REAL NOT NULL,
            factors_used INTEGER NOT NULL,
            degraded_reason TEXT,
            PRIMARY KEY (run_id, category, zone_id)
        );
    )");

    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS overall_index (
            run_id INTEGER NOT NULL REFERENCES runs(id) ON DELETE CASCADE,
            position INTEGER NOT NULL,
            zone_id TEXT NOT NULL,
            physical REAL NOT NULL,
            socioeconomic REAL NOT NULL,
            overall REAL NOT NULL,
            physical_fallback INTEGER NOT NULL,
            socioeconomic_fallback INTEGER NOT NULL,
            PRIMARY KEY (run_id, zone_id)
        );
    )");

    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_factor_values_order "
               "ON factor_values(run_id, category, stage, zone_position);");
}

void ResultStore::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errmsg(db_);
        sqlite3_free(error_msg);
        throw std::runtime_error("SQL error: " + error);
    }
}

sqlite3_stmt* ResultStore::Prepare(const char* sql) const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }
    return stmt;
}

void ResultStore::StepDone(sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        throw std::runtime_error("Failed to write result row: " + error);
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

// ============================================================================
// Runs
// ============================================================================

int64_t ResultStore::BeginRun(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    int64_t started_at = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();

    sqlite3_stmt* stmt = Prepare("INSERT INTO runs (label, started_at) VALUES (?, ?);");
    sqlite3_bind_text(stmt, 1, label.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, started_at);
    StepDone(stmt);
    sqlite3_finalize(stmt);

    current_run_ = sqlite3_last_insert_rowid(db_);
    return *current_run_;
}

std::optional<int64_t> ResultStore::LatestRunId() const {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = Prepare("SELECT id FROM runs ORDER BY id DESC LIMIT 1;");
    std::optional<int64_t> id;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        id = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return id;
}

std::vector<RunInfo> ResultStore::ListRuns() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<RunInfo> runs;
    sqlite3_stmt* stmt = Prepare("SELECT id, label, started_at FROM runs ORDER BY id;");
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        RunInfo info;
        info.id = sqlite3_column_int64(stmt, 0);
        const unsigned char* label = sqlite3_column_text(stmt, 1);
        info.label = label ? reinterpret_cast<const char*>(label) : "";
        info.started_at = sqlite3_column_int64(stmt, 2);
        runs.push_back(info);
    }
    sqlite3_finalize(stmt);
    return runs;
}

int64_t ResultStore::RequireRun() const {
    if (!current_run_.has_value()) {
        throw std::runtime_error("Result store has no active run; call BeginRun first");
    }
    return *current_run_;
}

// ============================================================================
// ResultSink
// ============================================================================

void ResultStore::StoreFactorTable(int64_t run_id, Category category, FactorStage stage,
                                   const FactorTable& table) {
    sqlite3_stmt* column = Prepare(
        "INSERT OR REPLACE INTO factor_columns (run_id, category, stage, position, factor) "
        "VALUES (?, ?, ?, ?, ?);");
    const auto& names = table.FactorNames();
    for (size_t i = 0; i < names.size(); ++i) {
        sqlite3_bind_int64(column, 1, run_id);
        sqlite3_bind_int(column, 2, static_cast<int>(category));
        sqlite3_bind_int(column, 3, static_cast<int>(stage));
        sqlite3_bind_int64(column, 4, static_cast<int64_t>(i));
        sqlite3_bind_text(column, 5, names[i].c_str(), -1, SQLITE_TRANSIENT);
        StepDone(column);
    }
    sqlite3_finalize(column);

    sqlite3_stmt* value = Prepare(
        "INSERT OR REPLACE INTO factor_values "
        "(run_id, category, stage, zone_position, zone_id, factor, value) "
        "VALUES (?, ?, ?, ?, ?, ?, ?);");
    const auto& zones = table.ZoneIds();
    for (size_t z = 0; z < zones.size(); ++z) {
        for (const auto& factor : names) {
            sqlite3_bind_int64(value, 1, run_id);
            sqlite3_bind_int(value, 2, static_cast<int>(category));
            sqlite3_bind_int(value, 3, static_cast<int>(stage));
            sqlite3_bind_int64(value, 4, static_cast<int64_t>(z));
            sqlite3_bind_text(value, 5, zones[z].c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(value, 6, factor.c_str(), -1, SQLITE_TRANSIENT);
            auto cell = table.Get(zones[z], factor);
            if (cell.has_value()) {
                sqlite3_bind_double(value, 7, *cell);
            } else {
                sqlite3_bind_null(value, 7);
            }
            StepDone(value);
        }
    }
    sqlite3_finalize(value);
}

void ResultStore::WriteCategory(const CategoryResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t run_id = RequireRun();

    BeginTransaction();
    try {
        StoreFactorTable(run_id, result.category, FactorStage::RAW, result.raw);
        StoreFactorTable(run_id, result.category, FactorStage::NORMALIZED, result.normalized);

        sqlite3_stmt* stmt = Prepare(
            "INSERT OR REPLACE INTO category_index "
            "(run_id, category, position, zone_id, value, weight_used, factors_used, degraded_reason) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        for (size_t i = 0; i < result.indices.size(); ++i) {
            const CategoryIndex& index = result.indices[i];
            sqlite3_bind_int64(stmt, 1, run_id);
            sqlite3_bind_int(stmt, 2, static_cast<int>(result.category));
            sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(i));
            sqlite3_bind_text(stmt, 4, index.zone_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 5, index.value);
            sqlite3_bind_double(stmt, 6, index.weight_used);
            sqlite3_bind_int64(stmt, 7, static_cast<int64_t>(index.factors_used));
            sqlite3_bind_null(stmt, 8);
            for (const auto& warning : result.degraded) {
                if (warning.zone_id == index.zone_id) {
                    sqlite3_bind_text(stmt, 8, warning.reason.c_str(), -1, SQLITE_TRANSIENT);
                    break;
                }
            }
            StepDone(stmt);
        }
        sqlite3_finalize(stmt);
        CommitTransaction();
    } catch (const std::exception&) {
        RollbackTransaction();
        throw;
    }
}

void ResultStore::WriteOverall(const std::vector<OverallIndex>& overall) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t run_id = RequireRun();

    BeginTransaction();
    try {
        sqlite3_stmt* stmt = Prepare(
            "INSERT OR REPLACE INTO overall_index "
            "(run_id, position, zone_id, physical, socioeconomic, overall, "
            " physical_fallback, socioeconomic_fallback) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        for (size_t i = 0; i < overall.size(); ++i) {
            const OverallIndex& row = overall[i];
            sqlite3_bind_int64(stmt, 1, run_id);
            sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(i));
            sqlite3_bind_text(stmt, 3, row.zone_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, row.physical);
            sqlite3_bind_double(stmt, 5, row.socioeconomic);
            sqlite3_bind_double(stmt, 6, row.overall);
            sqlite3_bind_int(stmt, 7, row.physical_fallback ? 1 : 0);
            sqlite3_bind_int(stmt, 8, row.socioeconomic_fallback ? 1 : 0);
            StepDone(stmt);
        }
        sqlite3_finalize(stmt);
        CommitTransaction();
    } catch (const std::exception&) {
        RollbackTransaction();
        throw;
    }
}

void ResultStore::WriteJoined(const std::vector<JoinedZone>&, const std::string&) {}

void ResultStore::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_wal && config_.db_path != ":memory:") {
        ExecuteSQL("PRAGMA wal_checkpoint(FULL);");
    }
}

// ============================================================================
// Reload
// ============================================================================

FactorTable ResultStore::LoadFactorTable(int64_t run_id, Category category,
                                         FactorStage stage) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    sqlite3_stmt* columns = Prepare(
        "SELECT factor FROM factor_columns WHERE run_id = ? AND category = ? AND stage = ? "
        "ORDER BY position;");
    sqlite3_bind_int64(columns, 1, run_id);
    sqlite3_bind_int(columns, 2, static_cast<int>(category));
    sqlite3_bind_int(columns, 3, static_cast<int>(stage));
    while (sqlite3_step(columns) == SQLITE_ROW) {
        names.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(columns, 0)));
    }
    sqlite3_finalize(columns);

    sqlite3_stmt* values = Prepare(
        "SELECT zone_id, factor, value FROM factor_values "
        "WHERE run_id = ? AND category = ? AND stage = ? "
        "ORDER BY zone_position;");
    sqlite3_bind_int64(values, 1, run_id);
    sqlite3_bind_int(values, 2, static_cast<int>(category));
    sqlite3_bind_int(values, 3, static_cast<int>(stage));

    FactorTable table(names);
    bool any_row = false;
    while (sqlite3_step(values) == SQLITE_ROW) {
        any_row = true;
        std::string zone_id = reinterpret_cast<const char*>(sqlite3_column_text(values, 0));
        std::string factor = reinterpret_cast<const char*>(sqlite3_column_text(values, 1));
        if (!table.HasZone(zone_id)) {
            table.AddZone(zone_id);
        }
        if (sqlite3_column_type(values, 2) != SQLITE_NULL) {
            table.Set(zone_id, factor, sqlite3_column_double(values, 2));
        }
    }
    sqlite3_finalize(values);

    if (names.empty() && !any_row) {
        throw std::runtime_error("Run " + std::to_string(run_id) + " has no " +
                                 ToString(category) + " factor table");
    }
    return table;
}

std::vector<CategoryIndex> ResultStore::LoadCategoryIndex(int64_t run_id, Category category) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CategoryIndex> indices;
    sqlite3_stmt* stmt = Prepare(
        "SELECT zone_id, value, weight_used, factors_used FROM category_index "
        "WHERE run_id = ? AND category = ? ORDER BY position;");
    sqlite3_bind_int64(stmt, 1, run_id);
    sqlite3_bind_int(stmt, 2, static_cast<int>(category));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        CategoryIndex index;
        index.zone_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        index.value = sqlite3_column_double(stmt, 1);
        index.weight_used = sqlite3_column_double(stmt, 2);
        index.factors_used = static_cast<size_t>(sqlite3_column_int64(stmt, 3));
        indices.push_back(index);
    }
    sqlite3_finalize(stmt);
    return indices;
}

std::vector<OverallIndex> ResultStore::LoadOverall(int64_t run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<OverallIndex> overall;
    sqlite3_stmt* stmt = Prepare(
        "SELECT zone_id, physical, socioeconomic, overall, physical_fallback, socioeconomic_fallback "
        "FROM overall_index WHERE run_id = ? ORDER BY position;");
    sqlite3_bind_int64(stmt, 1, run_id);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        OverallIndex row;
        row.zone_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        row.physical = sqlite3_column_double(stmt, 1);
        row.socioeconomic = sqlite3_column_double(stmt, 2);
        row.overall = sqlite3_column_double(stmt, 3);
        row.physical_fallback = sqlite3_column_int(stmt, 4) != 0;
        row.socioeconomic_fallback = sqlite3_column_int(stmt, 5) != 0;
        overall.push_back(row);
    }
    sqlite3_finalize(stmt);
    return overall;
}

// ============================================================================
// Transactions
// ============================================================================

void ResultStore::BeginTransaction() {
    ExecuteSQL("BEGIN TRANSACTION;");
}

void ResultStore::CommitTransaction() {
    ExecuteSQL("COMMIT;");
}

void ResultStore::RollbackTransaction() {
    char* error_msg = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &error_msg) != SQLITE_OK) {
        std::cerr << "Warning: rollback failed: "
                  << (error_msg ? error_msg : sqlite3_errmsg(db_)) << std::endl;
    }
    sqlite3_free(error_msg);
}

} // namespace floodvi
