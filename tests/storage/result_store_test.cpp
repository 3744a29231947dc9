// File: tests/storage/result_store_test.cpp
#include "storage/result_store.hpp"
#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>
#include <stdexcept>

namespace floodvi {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

std::string GetTempDbPath() {
    static int counter = 0;
    return "/tmp/test_result_store_" + std::to_string(std::time(nullptr)) +
           "_" + std::to_string(counter++) + ".db";
}

void RemoveDb(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

CategoryResult SocioeconomicResult() {
    FactorTable raw({"population_density", "poverty_index", "concrete_building_pct"});
    raw.AddZone("W02");
    raw.AddZone("W01");
    raw.Set("W02", "population_density", 2500);
    raw.Set("W01", "population_density", 800);
    raw.Set("W02", "poverty_index", 0.35);
    VulnerabilityAggregator aggregator;
    return aggregator.ComputeCategory(Category::SOCIOECONOMIC, raw);
}

std::vector<OverallIndex> OverallRows() {
    std::vector<OverallIndex> rows(2);
    rows[0].zone_id = "W02";
    rows[0].physical = 50.0;
    rows[0].socioeconomic = 100.0;
    rows[0].overall = 70.0;
    rows[0].physical_fallback = true;
    rows[1].zone_id = "W01";
    rows[1].physical = 50.0;
    rows[1].socioeconomic = 0.0;
    rows[1].overall = 30.0;
    rows[1].physical_fallback = true;
    return rows;
}

// ============================================================================
// Constructor and Configuration Tests
// ============================================================================

TEST(ResultStoreTest, ConstructorCreatesDatabase) {
    std::string db_path = GetTempDbPath();

    {
        ResultStore::Config config;
        config.db_path = db_path;
        ResultStore store(config);

        EXPECT_TRUE(std::filesystem::exists(db_path));
        EXPECT_FALSE(store.LatestRunId().has_value());
        EXPECT_TRUE(store.ListRuns().empty());
    }

    RemoveDb(db_path);
}

TEST(ResultStoreTest, EmptyPathIsRejected) {
    ResultStore::Config config;
    EXPECT_THROW(ResultStore store(config), std::invalid_argument);
}

TEST(ResultStoreTest, UnopenablePathThrows) {
    ResultStore::Config config;
    config.db_path = "/nonexistent_dir_floodvi/archive.db";
    EXPECT_THROW(ResultStore store(config), std::runtime_error);
}

TEST(ResultStoreTest, InMemoryStore) {
    ResultStore::Config config;
    config.db_path = ":memory:";
    ResultStore store(config);
    int64_t run = store.BeginRun("memory");
    store.WriteOverall(OverallRows());
    EXPECT_EQ(2u, store.LoadOverall(run).size());
    EXPECT_NO_THROW(store.Flush());
}

// ============================================================================
// Run Tests
// ============================================================================

TEST(ResultStoreTest, WritesRequireActiveRun) {
    ResultStore::Config config;
    config.db_path = ":memory:";
    ResultStore store(config);

    EXPECT_FALSE(store.current_run().has_value());
    EXPECT_THROW(store.WriteOverall(OverallRows()), std::runtime_error);
    EXPECT_THROW(store.WriteCategory(SocioeconomicResult()), std::runtime_error);
}

TEST(ResultStoreTest, RunsAreListedOldestFirst) {
    std::string db_path = GetTempDbPath();

    {
        ResultStore::Config config;
        config.db_path = db_path;
        ResultStore store(config);

        int64_t first = store.BeginRun("2024-01-01T00:00:00Z");
        int64_t second = store.BeginRun("2024-01-02T00:00:00Z");
        EXPECT_LT(first, second);
        EXPECT_EQ(second, *store.current_run());
        EXPECT_EQ(second, *store.LatestRunId());

        auto runs = store.ListRuns();
        ASSERT_EQ(2u, runs.size());
        EXPECT_EQ("2024-01-01T00:00:00Z", runs[0].label);
        EXPECT_GT(runs[1].started_at, 0);
    }

    RemoveDb(db_path);
}

// ============================================================================
// Persistence Tests
// ============================================================================

TEST(ResultStoreTest, CategoryTablesReloadUnchanged) {
    std::string db_path = GetTempDbPath();
    CategoryResult result = SocioeconomicResult();
    int64_t run = 0;

    {
        ResultStore::Config config;
        config.db_path = db_path;
        ResultStore store(config);
        run = store.BeginRun("category");
        store.WriteCategory(result);
        store.Flush();
    }

    {
        ResultStore::Config config;
        config.db_path = db_path;
        ResultStore store(config);

        FactorTable raw = store.LoadFactorTable(run, Category::SOCIOECONOMIC, FactorStage::RAW);
        EXPECT_TRUE(result.raw.ContentEquals(raw));
        EXPECT_EQ(result.raw.ZoneIds(), raw.ZoneIds());
        EXPECT_EQ(result.raw.FactorNames(), raw.FactorNames());
        EXPECT_FALSE(raw.Get("W01", "poverty_index").has_value());

        FactorTable normalized = store.LoadFactorTable(run, Category::SOCIOECONOMIC,
                                                       FactorStage::NORMALIZED);
        EXPECT_TRUE(result.normalized.ContentEquals(normalized));

        auto indices = store.LoadCategoryIndex(run, Category::SOCIOECONOMIC);
        ASSERT_EQ(result.indices.size(), indices.size());
        for (size_t i = 0; i < indices.size(); ++i) {
            EXPECT_EQ(result.indices[i].zone_id, indices[i].zone_id);
            EXPECT_DOUBLE_EQ(result.indices[i].value, indices[i].value);
            EXPECT_DOUBLE_EQ(result.indices[i].weight_used, indices[i].weight_used);
            EXPECT_EQ(result.indices[i].factors_used, indices[i].factors_used);
        }
    }

    RemoveDb(db_path);
}

TEST(ResultStoreTest, MissingTableThrows) {
    ResultStore::Config config;
    config.db_path = ":memory:";
    ResultStore store(config);
    int64_t run = store.BeginRun("empty");
    EXPECT_THROW(store.LoadFactorTable(run, Category::PHYSICAL, FactorStage::RAW),
                 std::runtime_error);
    EXPECT_TRUE(store.LoadCategoryIndex(run, Category::PHYSICAL).empty());
}

TEST(ResultStoreTest, OverallPreservesOrderAndFlags) {
    ResultStore::Config config;
    config.db_path = ":memory:";
    ResultStore store(config);
    int64_t run = store.BeginRun("overall");
    store.WriteOverall(OverallRows());

    auto rows = store.LoadOverall(run);
    ASSERT_EQ(2u, rows.size());
    EXPECT_EQ("W02", rows[0].zone_id);
    EXPECT_EQ("W01", rows[1].zone_id);
    EXPECT_DOUBLE_EQ(70.0, rows[0].overall);
    EXPECT_TRUE(rows[0].physical_fallback);
    EXPECT_FALSE(rows[0].socioeconomic_fallback);
}

TEST(ResultStoreTest, RunsAreIsolated) {
    ResultStore::Config config;
    config.db_path = ":memory:";
    ResultStore store(config);

    int64_t first = store.BeginRun("first");
    store.WriteOverall(OverallRows());
    int64_t second = store.BeginRun("second");
    std::vector<OverallIndex> one = {OverallRows()[0]};
    store.WriteOverall(one);

    EXPECT_EQ(2u, store.LoadOverall(first).size());
    EXPECT_EQ(1u, store.LoadOverall(second).size());
}

TEST(ResultStoreTest, RewriteWithinRunReplacesRows) {
    ResultStore::Config config;
    config.db_path = ":memory:";
    ResultStore store(config);
    int64_t run = store.BeginRun("rewrite");

    auto rows = OverallRows();
    store.WriteOverall(rows);
    rows[0].overall = 12.5;
    store.WriteOverall(rows);

    auto reloaded = store.LoadOverall(run);
    ASSERT_EQ(2u, reloaded.size());
    EXPECT_DOUBLE_EQ(12.5, reloaded[0].overall);
}

TEST(ResultStoreTest, WriteJoinedIsIgnored) {
    ResultStore::Config config;
    config.db_path = ":memory:";
    ResultStore store(config);
    EXPECT_NO_THROW(store.WriteJoined({}, "EPSG:4326"));
}

} // namespace
} // namespace floodvi
