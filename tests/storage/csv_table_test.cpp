// File: tests/storage/csv_table_test.cpp
#include "storage/csv_table.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>

namespace floodvi {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

std::string GetTempCsvPath() {
    static int counter = 0;
    return "/tmp/floodvi_csv_" + std::to_string(std::time(nullptr)) +
           "_" + std::to_string(counter++) + ".csv";
}

void WriteFile(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

std::vector<std::string> SocioeconomicIdColumns() {
    return {"zone_id", "ward_id"};
}

// ============================================================================
// Writer
// ============================================================================

TEST(CsvWriterTest, EscapeCell) {
    EXPECT_EQ("plain", CsvWriter::EscapeCell("plain"));
    EXPECT_EQ("\"a,b\"", CsvWriter::EscapeCell("a,b"));
    EXPECT_EQ("\"say \"\"hi\"\"\"", CsvWriter::EscapeCell("say \"hi\""));
    EXPECT_EQ("\"two\nlines\"", CsvWriter::EscapeCell("two\nlines"));
    EXPECT_EQ("\" padded\"", CsvWriter::EscapeCell(" padded"));
    EXPECT_EQ("", CsvWriter::EscapeCell(""));
}

TEST(CsvWriterTest, FormatNumberIsShortAndExact) {
    EXPECT_EQ("0.5", CsvWriter::FormatNumber(0.5));
    EXPECT_EQ("42", CsvWriter::FormatNumber(42.0));
    EXPECT_EQ("", CsvWriter::FormatNumber(std::numeric_limits<double>::quiet_NaN()));

    double awkward = 0.1 + 0.2;
    EXPECT_EQ(awkward, std::strtod(CsvWriter::FormatNumber(awkward).c_str(), nullptr));
}

TEST(CsvWriterTest, UnwritablePathThrows) {
    EXPECT_THROW(CsvWriter("/nonexistent_dir_floodvi/out.csv"), std::runtime_error);
}

// ============================================================================
// Parser
// ============================================================================

TEST(CsvParseTest, HeaderAndRows) {
    DataTable table = ParseCsv("zone_id,poverty_index\nW01,0.2\nW02,0.4\n");
    ASSERT_EQ(2u, table.header().size());
    EXPECT_EQ(2u, table.RowCount());
    EXPECT_EQ("W02", table.Cell(1, 0));
    EXPECT_DOUBLE_EQ(0.4, *table.NumericCell(1, 1));
}

TEST(CsvParseTest, QuotedFieldsAndCrlf) {
    DataTable table = ParseCsv("id,name\r\n1,\"Ward, North\"\r\n2,\"He said \"\"dry\"\"\"\r\n");
    ASSERT_EQ(2u, table.RowCount());
    EXPECT_EQ("Ward, North", table.Cell(0, 1));
    EXPECT_EQ("He said \"dry\"", table.Cell(1, 1));
}

TEST(CsvParseTest, QuotedLineBreak) {
    DataTable table = ParseCsv("id,note\n1,\"first\nsecond\"\n");
    ASSERT_EQ(1u, table.RowCount());
    EXPECT_EQ("first\nsecond", table.Cell(0, 1));
}

TEST(CsvParseTest, BlankLinesSkippedAndBomStripped) {
    DataTable table = ParseCsv("\xEF\xBB\xBFzone_id,x\n\nW01,1\n\n");
    EXPECT_EQ("zone_id", table.header()[0]);
    EXPECT_EQ(1u, table.RowCount());
}

TEST(CsvParseTest, LastLineWithoutNewline) {
    DataTable table = ParseCsv("a,b\n1,2");
    ASSERT_EQ(1u, table.RowCount());
    EXPECT_EQ("2", table.Cell(0, 1));
}

TEST(CsvParseTest, UnterminatedQuoteThrows) {
    EXPECT_THROW(ParseCsv("a,b\n1,\"open\n"), std::runtime_error);
}

TEST(CsvParseTest, EmptyInput) {
    DataTable table = ParseCsv("");
    EXPECT_TRUE(table.header().empty());
    EXPECT_EQ(0u, table.RowCount());
}

TEST(CsvParseTest, NumericCellRules) {
    DataTable table = ParseCsv("v\n 3.5 \nabc\n12x\n\ninf\n1e400\n-2\n");
    // The blank record is skipped, so rows are: " 3.5 ", abc, 12x, inf, 1e400, -2
    ASSERT_EQ(6u, table.RowCount());
    EXPECT_DOUBLE_EQ(3.5, *table.NumericCell(0, 0));
    EXPECT_FALSE(table.NumericCell(1, 0).has_value());
    EXPECT_FALSE(table.NumericCell(2, 0).has_value());
    EXPECT_FALSE(table.NumericCell(3, 0).has_value());
    EXPECT_FALSE(table.NumericCell(4, 0).has_value());
    EXPECT_DOUBLE_EQ(-2.0, *table.NumericCell(5, 0));
}

TEST(CsvParseTest, ShortRowsReadAsEmpty) {
    DataTable table = ParseCsv("a,b,c\n1\n");
    EXPECT_EQ("", table.Cell(0, 2));
    EXPECT_FALSE(table.NumericCell(0, 2).has_value());
}

TEST(CsvParseTest, FindColumnUsesFirstCandidate) {
    DataTable table = ParseCsv("ward_id,zone_id\n1,2\n");
    EXPECT_EQ(1u, *table.FindColumn({"zone_id", "ward_id"}));
    EXPECT_EQ(0u, *table.FindColumn({"ward_id", "zone_id"}));
    EXPECT_FALSE(table.FindColumn({"id"}).has_value());
}

TEST(CsvParseTest, MissingFileThrows) {
    EXPECT_THROW(ReadCsvFile("/tmp/floodvi_no_such_file.csv"), std::runtime_error);
}

// ============================================================================
// Factor contract
// ============================================================================

TEST(BuildFactorTableTest, AbsentOptionalColumnIsAllMissing) {
    DataTable source = ParseCsv(
        "ward_id,ward_name,population_density,poverty_index\n"
        "1.0,Harbour,1200,0.3\n"
        "2,Hill,,0.1\n");
    std::vector<FactorSpec> specs = {
        {"population_density", FactorDirection::ASCENDING, 0.25, true},
        {"poverty_index", FactorDirection::ASCENDING, 0.25, true},
        {"concrete_building_pct", FactorDirection::DESCENDING, 0.1, true},
    };

    SourceFactorTable result = BuildFactorTable(source, specs, SocioeconomicIdColumns(),
                                                {"zone_name", "ward_name"}, "socio.csv");

    EXPECT_EQ(3u, result.table.FactorCount());
    std::vector<std::string> ids = {"1", "2"};
    EXPECT_EQ(ids, result.table.ZoneIds());
    EXPECT_DOUBLE_EQ(1200.0, *result.table.Get("1", "population_density"));
    EXPECT_FALSE(result.table.Get("2", "population_density").has_value());
    EXPECT_TRUE(result.table.HasFactor("concrete_building_pct"));
    EXPECT_FALSE(result.table.IsPresent("concrete_building_pct"));

    std::vector<std::string> absent = {"concrete_building_pct"};
    EXPECT_EQ(absent, result.absent_columns);
    EXPECT_EQ("Harbour", result.zone_names.at("1"));
}

TEST(BuildFactorTableTest, MissingRequiredColumnThrows) {
    DataTable source = ParseCsv("zone_id,a\nW01,1\n");
    std::vector<FactorSpec> specs = {{"b", FactorDirection::ASCENDING, 1.0, false}};
    try {
        BuildFactorTable(source, specs, SocioeconomicIdColumns(), {}, "table.csv");
        FAIL() << "expected MissingInputError";
    } catch (const MissingInputError& e) {
        EXPECT_EQ("table.csv", e.source());
        EXPECT_NE(std::string::npos, std::string(e.what()).find("Required column missing: b"));
    }
}

TEST(BuildFactorTableTest, MissingIdColumnThrows) {
    DataTable source = ParseCsv("name,a\nx,1\n");
    EXPECT_THROW(BuildFactorTable(source, {}, SocioeconomicIdColumns(), {}, "table.csv"),
                 MissingInputError);
}

TEST(BuildFactorTableTest, SkipsRowsWithoutIdAndRejectsDuplicates) {
    std::vector<FactorSpec> specs = {{"a", FactorDirection::ASCENDING, 1.0, true}};

    DataTable blanks = ParseCsv("zone_id,a\n,5\nW01,1\n");
    EXPECT_EQ(1u, BuildFactorTable(blanks, specs, SocioeconomicIdColumns(), {}, "t").table.ZoneCount());

    DataTable duplicates = ParseCsv("zone_id,a\n7,1\n7.0,2\n");
    EXPECT_THROW(BuildFactorTable(duplicates, specs, SocioeconomicIdColumns(), {}, "t"),
                 std::invalid_argument);
}

// ============================================================================
// Persistence
// ============================================================================

TEST(FactorTableCsvTest, WriteThenReadPreservesCells) {
    std::string path = GetTempCsvPath();

    FactorTable table({"elevation_mean", "pct_below_5m"});
    table.AddZone("W01");
    table.AddZone("W02");
    table.Set("W01", "elevation_mean", 3.141592653589793);
    table.Set("W01", "pct_below_5m", 62.5);
    table.Set("W02", "elevation_mean", 1e-7);

    WriteFactorTableCsv(path, table);
    FactorTable reloaded = ReadFactorTableCsv(path);

    EXPECT_TRUE(table.ContentEquals(reloaded));
    EXPECT_FALSE(reloaded.Get("W02", "pct_below_5m").has_value());
    EXPECT_EQ(table.FactorNames(), reloaded.FactorNames());

    std::filesystem::remove(path);
}

TEST(FactorTableCsvTest, RewriteIsIdempotent) {
    std::string first = GetTempCsvPath();
    std::string second = GetTempCsvPath();

    FactorTable table({"x"});
    table.AddZone("12");
    table.Set("12", "x", 2.0 / 3.0);
    WriteFactorTableCsv(first, table);
    WriteFactorTableCsv(second, ReadFactorTableCsv(first));

    std::ifstream a(first), b(second);
    std::string text_a((std::istreambuf_iterator<char>(a)), std::istreambuf_iterator<char>());
    std::string text_b((std::istreambuf_iterator<char>(b)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text_a, text_b);

    std::filesystem::remove(first);
    std::filesystem::remove(second);
}

TEST(FactorTableCsvTest, ReadRejectsForeignTable) {
    std::string path = GetTempCsvPath();
    WriteFile(path, "name,value\nx,1\n");
    EXPECT_THROW(ReadFactorTableCsv(path), std::runtime_error);
    std::filesystem::remove(path);
}

} // namespace
} // namespace floodvi
