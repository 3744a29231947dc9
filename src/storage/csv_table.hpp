// File: src/storage/csv_table.hpp
#pragma once

#include "scoring/factor_table.hpp"
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace floodvi {

/// Row-oriented delimited-text writer (RFC 4180 quoting)
class CsvWriter {
public:
    /// Opens (and truncates) the file
    /// @throws std::runtime_error if the file cannot be opened
    explicit CsvWriter(const std::string& path);
    ~CsvWriter();

    CsvWriter(const CsvWriter&) = delete;
    CsvWriter& operator=(const CsvWriter&) = delete;

    void Header(const std::vector<std::string>& columns);
    void Row(const std::vector<std::string>& cells);

    /// Flush and close
    /// @throws std::runtime_error if the stream is in a failed state
    void Close();

    /// Quote a cell when it contains a delimiter, quote or line break
    static std::string EscapeCell(std::string_view cell);

    /// Shortest text that reads back to exactly the same double
    static std::string FormatNumber(double value);

private:
    void WriteLine(const std::vector<std::string>& cells);

    std::string path_;
    std::ofstream out_;
};

/// Parsed delimited-text table: a header and string cells
class DataTable {
public:
    DataTable() = default;
    DataTable(std::vector<std::string> header, std::vector<std::vector<std::string>> rows);

    const std::vector<std::string>& header() const { return header_; }
    const std::vector<std::vector<std::string>>& rows() const { return rows_; }
    size_t RowCount() const { return rows_.size(); }

    /// Column position by exact name
    std::optional<size_t> ColumnIndex(const std::string& name) const;

    /// First column found among candidate names
    std::optional<size_t> FindColumn(const std::vector<std::string>& candidates) const;

    /// Cell text; empty string for short rows
    const std::string& Cell(size_t row, size_t column) const;

    /// Cell as a number; nullopt when empty or not fully numeric
    std::optional<double> NumericCell(size_t row, size_t column) const;

private:
    std::vector<std::string> header_;
    std::vector<std::vector<std::string>> rows_;
    std::map<std::string, size_t> column_index_;
};

/// Parse CSV text (first record is the header)
/// @throws std::runtime_error on an unterminated quoted field
DataTable ParseCsv(const std::string& content);

/// Read and parse a CSV file
/// @throws std::runtime_error if the file cannot be read
DataTable ReadCsvFile(const std::string& path);

/// Socioeconomic source table converted to declared factors
struct SourceFactorTable {
    FactorTable table;
    std::map<std::string, std::string> zone_names;

    /// Declared factors whose column the source lacks
    std::vector<std::string> absent_columns;
};

/// Convert a source table into a factor table under an explicit factor
/// contract. Every declared factor becomes a column; a declared optional
/// factor without a source column is all-missing. Presence is checked here
/// once.
/// @param id_columns Candidate names of the zone id column, first match wins
/// @param name_columns Candidate names of the display name column
/// @throws MissingInputError if no id column exists or a required factor column is absent
/// @throws std::invalid_argument on duplicate zone ids
SourceFactorTable BuildFactorTable(
    const DataTable& source,
    const std::vector<FactorSpec>& specs,
    const std::vector<std::string>& id_columns,
    const std::vector<std::string>& name_columns,
    const std::string& source_name);

/// Persist a factor table: zone_id then one column per factor, missing cells empty
/// @throws std::runtime_error on I/O failure
void WriteFactorTableCsv(const std::string& path, const FactorTable& table);

/// Reload a table written by WriteFactorTableCsv
/// @throws std::runtime_error on I/O or format failure
FactorTable ReadFactorTableCsv(const std::string& path);

} // namespace floodvi
