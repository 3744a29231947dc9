// File: src/storage/csv_table.cpp
#include "storage/csv_table.hpp"
#include "core/errors.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace floodvi {

// ============================================================================
// CsvWriter
// ============================================================================

CsvWriter::CsvWriter(const std::string& path)
    : path_(path) {
    out_.open(path, std::ios::out | std::ios::trunc);
    if (!out_.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
}

CsvWriter::~CsvWriter() {
    if (out_.is_open()) {
        out_.flush();
    }
}

void CsvWriter::Header(const std::vector<std::string>& columns) {
    WriteLine(columns);
}

void CsvWriter::Row(const std::vector<std::string>& cells) {
    WriteLine(cells);
}

void CsvWriter::Close() {
    if (!out_.is_open()) {
        return;
    }
    out_.flush();
    bool failed = out_.fail();
    out_.close();
    if (failed) {
        throw std::runtime_error("Failed writing CSV file: " + path_);
    }
}

void CsvWriter::WriteLine(const std::vector<std::string>& cells) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i) out_ << ',';
        out_ << EscapeCell(cells[i]);
    }
    out_ << '\n';
}

std::string CsvWriter::EscapeCell(std::string_view cell) {
    bool needs_quoting = false;
    for (char c : cell) {
        if (c == ',' || c == '"' || c == '\n' || c == '\r') {
            needs_quoting = true;
            break;
        }
    }
    if (!cell.empty() && (cell.front() == ' ' || cell.back() == ' ')) {
        needs_quoting = true;
    }
    if (!needs_quoting) {
        return std::string(cell);
    }

    std::string out;
    out.reserve(cell.size() + 2);
    out.push_back('"');
    for (char c : cell) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string CsvWriter::FormatNumber(double value) {
    if (!std::isfinite(value)) {
        return std::string();
    }
    // Try short forms first so typical values stay readable
    for (int precision = 6; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
        std::ostringstream ss;
        ss << std::setprecision(precision) << value;
        if (std::strtod(ss.str().c_str(), nullptr) == value) {
            return ss.str();
        }
    }
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return ss.str();
}

// ============================================================================
// DataTable
// ============================================================================

DataTable::DataTable(std::vector<std::string> header, std::vector<std::vector<std::string>> rows)
    : header_(std::move(header)), rows_(std::move(rows)) {
    for (size_t i = 0; i < header_.size(); ++i) {
        column_index_.emplace(header_[i], i);  // first occurrence wins
    }
}

std::optional<size_t> DataTable::ColumnIndex(const std::string& name) const {
    auto it = column_index_.find(name);
    if (it == column_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<size_t> DataTable::FindColumn(const std::vector<std::string>& candidates) const {
    for (const auto& name : candidates) {
        if (auto index = ColumnIndex(name)) {
            return index;
        }
    }
    return std::nullopt;
}

const std::string& DataTable::Cell(size_t row, size_t column) const {
    static const std::string kEmpty;
    const auto& cells = rows_.at(row);
    if (column >= cells.size()) {
        return kEmpty;
    }
    return cells[column];
}

std::optional<double> DataTable::NumericCell(size_t row, size_t column) const {
    const std::string& text = Cell(row, column);
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    size_t end = text.find_last_not_of(" \t");
    std::string trimmed = text.substr(begin, end - begin + 1);

    errno = 0;
    char* parse_end = nullptr;
    double value = std::strtod(trimmed.c_str(), &parse_end);
    if (errno == ERANGE || parse_end != trimmed.c_str() + trimmed.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// ============================================================================
// Parsing
// ============================================================================

DataTable ParseCsv(const std::string& content) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    auto end_field = [&]() {
        record.push_back(std::move(field));
        field.clear();
        field_started = false;
    };
    auto end_record = [&]() {
        end_field();
        // Skip blank lines
        if (!(record.size() == 1 && record[0].empty())) {
            records.push_back(std::move(record));
        }
        record.clear();
    };

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == '"' && !field_started) {
            in_quotes = true;
            field_started = true;
        } else if (c == ',') {
            end_field();
        } else if (c == '\n') {
            end_record();
        } else if (c == '\r') {
            // CRLF: the '\n' closes the record
        } else {
            field.push_back(c);
            field_started = true;
        }
    }

    if (in_quotes) {
        throw std::runtime_error("Unterminated quoted field in CSV input");
    }
    if (field_started || !field.empty() || !record.empty()) {
        end_record();
    }

    if (records.empty()) {
        return DataTable();
    }

    std::vector<std::string> header = std::move(records.front());
    // Strip a UTF-8 byte order mark from the first column name
    if (!header.empty() && header[0].size() >= 3 &&
        header[0].compare(0, 3, "\xEF\xBB\xBF") == 0) {
        header[0].erase(0, 3);
    }
    records.erase(records.begin());
    return DataTable(std::move(header), std::move(records));
}

DataTable ReadCsvFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open CSV file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return ParseCsv(buffer.str());
}

// ============================================================================
// Factor tables
// ============================================================================

SourceFactorTable BuildFactorTable(
    const DataTable& source,
    const std::vector<FactorSpec>& specs,
    const std::vector<std::string>& id_columns,
    const std::vector<std::string>& name_columns,
    const std::string& source_name) {

    auto id_column = source.FindColumn(id_columns);
    if (!id_column.has_value()) {
        throw MissingInputError(source_name, "No zone id column in table");
    }
    auto name_column = source.FindColumn(name_columns);

    SourceFactorTable result;
    std::vector<std::string> names;
    std::vector<std::optional<size_t>> columns;
    for (const auto& spec : specs) {
        auto column = source.ColumnIndex(spec.name);
        if (!column.has_value()) {
            if (!spec.optional) {
                throw MissingInputError(source_name, "Required column missing: " + spec.name);
            }
            result.absent_columns.push_back(spec.name);
        }
        names.push_back(spec.name);
        columns.push_back(column);
    }

    result.table = FactorTable(names);
    for (size_t row = 0; row < source.RowCount(); ++row) {
        std::string zone_id = CanonicalZoneId(source.Cell(row, *id_column));
        if (zone_id.empty()) {
            continue;
        }
        result.table.AddZone(zone_id);
        if (name_column.has_value() && !source.Cell(row, *name_column).empty()) {
            result.zone_names[zone_id] = source.Cell(row, *name_column);
        }
        for (size_t f = 0; f < names.size(); ++f) {
            if (!columns[f].has_value()) {
                continue;
            }
            if (auto value = source.NumericCell(row, *columns[f])) {
                result.table.Set(zone_id, names[f], *value);
            }
        }
    }
    return result;
}

void WriteFactorTableCsv(const std::string& path, const FactorTable& table) {
    CsvWriter writer(path);
    std::vector<std::string> header = {"zone_id"};
    header.insert(header.end(), table.FactorNames().begin(), table.FactorNames().end());
    writer.Header(header);

    for (const auto& zone_id : table.ZoneIds()) {
        std::vector<std::string> cells = {zone_id};
        for (const auto& factor : table.FactorNames()) {
            auto value = table.Get(zone_id, factor);
            cells.push_back(value.has_value() ? CsvWriter::FormatNumber(*value) : std::string());
        }
        writer.Row(cells);
    }
    writer.Close();
}

FactorTable ReadFactorTableCsv(const std::string& path) {
    DataTable source = ReadCsvFile(path);
    if (source.header().empty() || source.header()[0] != "zone_id") {
        throw std::runtime_error("Not a factor table (first column must be zone_id): " + path);
    }

    std::vector<std::string> factors(source.header().begin() + 1, source.header().end());
    FactorTable table(factors);
    for (size_t row = 0; row < source.RowCount(); ++row) {
        const std::string& zone_id = source.Cell(row, 0);
        table.AddZone(zone_id);
        for (size_t f = 0; f < factors.size(); ++f) {
            if (auto value = source.NumericCell(row, f + 1)) {
                table.Set(zone_id, factors[f], *value);
            }
        }
    }
    return table;
}

} // namespace floodvi
