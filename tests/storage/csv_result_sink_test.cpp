// File: tests/storage/csv_result_sink_test.cpp
#include "storage/csv_result_sink.hpp"
#include "storage/csv_table.hpp"
#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>
#include <memory>

namespace floodvi {
namespace {

class CsvResultSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        static int counter = 0;
        dir_ = "/tmp/floodvi_csv_sink_" + std::to_string(std::time(nullptr)) +
               "_" + std::to_string(counter++);
        CsvResultSink::Config config;
        config.output_dir = dir_;
        sink_ = std::make_unique<CsvResultSink>(config);
    }

    void TearDown() override {
        sink_.reset();
        std::filesystem::remove_all(dir_);
    }

    CategoryResult Socioeconomic() {
        FactorTable raw({"population_density", "poverty_index", "concrete_building_pct"});
        raw.AddZone("W01");
        raw.AddZone("W02");
        raw.Set("W01", "population_density", 1000);
        raw.Set("W02", "population_density", 3000);
        raw.Set("W01", "poverty_index", 0.2);
        raw.Set("W02", "poverty_index", 0.4);
        VulnerabilityAggregator aggregator;
        CategoryResult result = aggregator.ComputeCategory(Category::SOCIOECONOMIC, raw);
        result.zone_names["W01"] = "Harbour, Old Town";
        return result;
    }

    CategoryResult Physical() {
        FactorTable raw({"elevation_mean", "elevation_min", "elevation_max",
                         "pct_below_5m", "pct_below_10m"});
        raw.AddZone("W01");
        raw.AddZone("W02");
        for (const auto& factor : raw.FactorNames()) {
            raw.Set("W01", factor, 0.0);
            raw.Set("W02", factor, 5.0);
        }
        VulnerabilityAggregator aggregator;
        CategoryResult result = aggregator.ComputeCategory(Category::PHYSICAL, raw);
        result.degraded.push_back({"W01", "zone lies outside the surface extent"});
        return result;
    }

    std::string dir_;
    std::unique_ptr<CsvResultSink> sink_;
};

TEST_F(CsvResultSinkTest, IndexColumnNames) {
    EXPECT_EQ("physical_vulnerability", CsvResultSink::IndexColumn(Category::PHYSICAL));
    EXPECT_EQ("socioeconomic_vulnerability", CsvResultSink::IndexColumn(Category::SOCIOECONOMIC));
}

TEST_F(CsvResultSinkTest, SocioeconomicTableLayout) {
    sink_->WriteCategory(Socioeconomic());

    ASSERT_EQ(1u, sink_->written_files().size());
    DataTable table = ReadCsvFile(dir_ + "/socioeconomic_vulnerability.csv");

    std::vector<std::string> header = {
        "zone_id", "zone_name", "population_density", "poverty_index", "concrete_building_pct",
        "population_density_norm", "poverty_index_norm",
        "socioeconomic_vulnerability", "weight_used"};
    EXPECT_EQ(header, table.header());
    ASSERT_EQ(2u, table.RowCount());

    EXPECT_EQ("Harbour, Old Town", table.Cell(0, 1));
    EXPECT_EQ("", table.Cell(1, 1));
    // Absent optional column stays empty
    EXPECT_EQ("", table.Cell(0, 4));
    EXPECT_DOUBLE_EQ(1.0, *table.NumericCell(1, 5));
    EXPECT_DOUBLE_EQ(100.0, *table.NumericCell(1, 7));
    EXPECT_DOUBLE_EQ(0.5, *table.NumericCell(1, 8));
}

TEST_F(CsvResultSinkTest, PhysicalTableFlagsDegradedZones) {
    sink_->WriteCategory(Physical());
    DataTable table = ReadCsvFile(dir_ + "/physical_vulnerability.csv");

    auto degraded = table.ColumnIndex("degraded");
    auto reason = table.ColumnIndex("degraded_reason");
    ASSERT_TRUE(degraded.has_value());
    ASSERT_TRUE(reason.has_value());
    EXPECT_FALSE(table.ColumnIndex("zone_name").has_value());
    EXPECT_TRUE(table.ColumnIndex("elevation_max").has_value());
    EXPECT_FALSE(table.ColumnIndex("elevation_max_norm").has_value());

    EXPECT_EQ("1", table.Cell(0, *degraded));
    EXPECT_EQ("zone lies outside the surface extent", table.Cell(0, *reason));
    EXPECT_EQ("0", table.Cell(1, *degraded));
    EXPECT_EQ("", table.Cell(1, *reason));
}

TEST_F(CsvResultSinkTest, OverallTable) {
    OverallIndex row;
    row.zone_id = "W01";
    row.physical = 50.0;
    row.socioeconomic = 25.0;
    row.overall = 40.0;
    row.physical_fallback = true;
    sink_->WriteOverall({row});

    DataTable table = ReadCsvFile(dir_ + "/overall_vulnerability.csv");
    std::vector<std::string> header = {
        "zone_id", "physical_vulnerability", "socioeconomic_vulnerability",
        "overall_vulnerability", "physical_fallback", "socioeconomic_fallback"};
    EXPECT_EQ(header, table.header());
    ASSERT_EQ(1u, table.RowCount());
    EXPECT_DOUBLE_EQ(40.0, *table.NumericCell(0, 3));
    EXPECT_EQ("1", table.Cell(0, 4));
    EXPECT_EQ("0", table.Cell(0, 5));
}

TEST_F(CsvResultSinkTest, RawFactorsSurviveRoundTrip) {
    CategoryResult result = Socioeconomic();
    sink_->WriteCategory(result);
    DataTable table = ReadCsvFile(dir_ + "/socioeconomic_vulnerability.csv");

    for (size_t row = 0; row < table.RowCount(); ++row) {
        const std::string& id = table.Cell(row, 0);
        auto original = result.raw.Get(id, "poverty_index");
        auto written = table.NumericCell(row, *table.ColumnIndex("poverty_index"));
        ASSERT_EQ(original.has_value(), written.has_value());
        EXPECT_EQ(*original, *written);
    }
}

TEST(CsvResultSinkConstructionTest, UncreatableDirectoryThrows) {
    CsvResultSink::Config config;
    config.output_dir = "/proc/floodvi_cannot_create";
    EXPECT_THROW(CsvResultSink sink(config), std::runtime_error);
}

} // namespace
} // namespace floodvi
