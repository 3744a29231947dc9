// File: src/storage/result_store.hpp
#pragma once

#include "storage/result_sink.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace floodvi {

/// Which copy of a factor table to archive or reload
enum class FactorStage : uint8_t {
    RAW = 0,
    NORMALIZED = 1,
};

/// Archived run metadata
struct RunInfo {
    int64_t id{0};
    std::string label;
    int64_t started_at{0};  // Unix seconds
};

/// Run archive backed by SQLite
///
/// Every pipeline run becomes one row in `runs`; the category tables and
/// the overall index written through the ResultSink interface are stored
/// against the active run:
/// - factor_columns / factor_values: raw and normalized factor tables,
///   column and row order preserved, missing cells as NULL
/// - category_index: per-zone index, weight used and degraded reason
/// - overall_index: per-zone blend with fallback flags
///
/// Each write is one transaction. Geometry is not archived.
class ResultStore : public ResultSink {
public:
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private in-memory store)
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// Lock wait before SQLITE_BUSY is reported
        int busy_timeout_ms{5000};
    };

    /// @throws std::runtime_error if the database cannot be opened or initialized
    explicit ResultStore(const Config& config);

    ~ResultStore() override;

    ResultStore(const ResultStore&) = delete;
    ResultStore& operator=(const ResultStore&) = delete;

    // ========================================================================
    // Runs
    // ========================================================================

    /// Start a new run; subsequent writes are stored against it
    /// @return Id of the new run
    int64_t BeginRun(const std::string& label);

    /// Run receiving writes, if any
    std::optional<int64_t> current_run() const { return current_run_; }

    /// Most recently started run in the archive
    std::optional<int64_t> LatestRunId() const;

    /// All runs, oldest first
    std::vector<RunInfo> ListRuns() const;

    // ========================================================================
    // ResultSink
    // ========================================================================

    /// @throws std::runtime_error without an active run or on a database error
    void WriteCategory(const CategoryResult& result) override;

    /// @throws std::runtime_error without an active run or on a database error
    void WriteOverall(const std::vector<OverallIndex>& overall) override;

    /// Geometry is not archived
    void WriteJoined(const std::vector<JoinedZone>& joined, const std::string& crs) override;

    /// Checkpoint the write-ahead log
    void Flush() override;

    // ========================================================================
    // Reload
    // ========================================================================

    /// Factor table of a run as it was written
    /// @throws std::runtime_error if the run has no such table
    FactorTable LoadFactorTable(int64_t run_id, Category category, FactorStage stage) const;

    /// Category indices of a run, in written order
    std::vector<CategoryIndex> LoadCategoryIndex(int64_t run_id, Category category) const;

    /// Overall indices of a run, in written order
    std::vector<OverallIndex> LoadOverall(int64_t run_id) const;

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
    std::optional<int64_t> current_run_;

    void InitializeDatabase();
    void CreateTables();

    /// Execute a statement without results
    /// @throws std::runtime_error with the SQLite message on failure
    void ExecuteSQL(const std::string& sql);

    /// Prepare a statement
    /// @throws std::runtime_error with the SQLite message on failure
    sqlite3_stmt* Prepare(const char* sql) const;

    /// Step a write statement to completion
    /// @throws std::runtime_error unless the step reports SQLITE_DONE
    void StepDone(sqlite3_stmt* stmt);

    int64_t RequireRun() const;

    void StoreFactorTable(int64_t run_id, Category category, FactorStage stage,
                          const FactorTable& table);

    void BeginTransaction();
    void CommitTransaction();
    void RollbackTransaction();
};

} // namespace floodvi
