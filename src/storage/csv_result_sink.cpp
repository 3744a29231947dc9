// File: src/storage/csv_result_sink.cpp
#include "storage/csv_result_sink.hpp"
#include "storage/csv_table.hpp"
#include <filesystem>
#include <map>
#include <stdexcept>
#include <system_error>

namespace floodvi {

namespace {

std::string Cell(const std::optional<double>& value) {
    return value.has_value() ? CsvWriter::FormatNumber(*value) : std::string();
}

std::string Flag(bool value) {
    return value ? "1" : "0";
}

} // namespace

CsvResultSink::CsvResultSink()
    : CsvResultSink(Config()) {}

CsvResultSink::CsvResultSink(const Config& config)
    : config_(config) {
    std::error_code ec;
    std::filesystem::create_directories(config_.output_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory " + config_.output_dir +
                                 ": " + ec.message());
    }
}

std::string CsvResultSink::IndexColumn(Category category) {
    return std::string(ToString(category)) + "_vulnerability";
}

std::string CsvResultSink::PathFor(const std::string& file) const {
    return (std::filesystem::path(config_.output_dir) / file).string();
}

// ============================================================================
// Category tables
// ============================================================================

void CsvResultSink::WriteCategory(const CategoryResult& result) {
    const bool physical = result.category == Category::PHYSICAL;
    const std::string path = PathFor(physical ? config_.physical_file
                                              : config_.socioeconomic_file);
    const bool with_names = !result.zone_names.empty();

    std::map<std::string, std::string> degraded;
    for (const auto& warning : result.degraded) {
        degraded[warning.zone_id] = warning.reason;
    }

    CsvWriter writer(path);

    std::vector<std::string> header = {"zone_id"};
    if (with_names) header.push_back("zone_name");
    for (const auto& factor : result.raw.FactorNames()) {
        header.push_back(factor);
    }
    for (const auto& spec : result.factors_used) {
        header.push_back(spec.name + "_norm");
    }
    header.push_back(IndexColumn(result.category));
    header.push_back("weight_used");
    if (physical) {
        header.push_back("degraded");
        header.push_back("degraded_reason");
    }
    writer.Header(header);

    for (const auto& index : result.indices) {
        const std::string& id = index.zone_id;
        std::vector<std::string> cells = {id};
        if (with_names) {
            auto name = result.zone_names.find(id);
            cells.push_back(name != result.zone_names.end() ? name->second : std::string());
        }
        for (const auto& factor : result.raw.FactorNames()) {
            cells.push_back(result.raw.HasZone(id) ? Cell(result.raw.Get(id, factor)) : std::string());
        }
        for (const auto& spec : result.factors_used) {
            bool known = result.normalized.HasZone(id) && result.normalized.HasFactor(spec.name);
            cells.push_back(known ? Cell(result.normalized.Get(id, spec.name)) : std::string());
        }
        cells.push_back(CsvWriter::FormatNumber(index.value));
        cells.push_back(CsvWriter::FormatNumber(index.weight_used));
        if (physical) {
            auto it = degraded.find(id);
            cells.push_back(Flag(it != degraded.end()));
            cells.push_back(it != degraded.end() ? it->second : std::string());
        }
        writer.Row(cells);
    }

    writer.Close();
    written_files_.push_back(path);
}

// ============================================================================
// Overall table
// ============================================================================

void CsvResultSink::WriteOverall(const std::vector<OverallIndex>& overall) {
    const std::string path = PathFor(config_.overall_file);
    CsvWriter writer(path);
    writer.Header({"zone_id",
                   IndexColumn(Category::PHYSICAL),
                   IndexColumn(Category::SOCIOECONOMIC),
                   "overall_vulnerability",
                   "physical_fallback",
                   "socioeconomic_fallback"});

    for (const auto& row : overall) {
        writer.Row({row.zone_id,
                    CsvWriter::FormatNumber(row.physical),
                    CsvWriter::FormatNumber(row.socioeconomic),
                    CsvWriter::FormatNumber(row.overall),
                    Flag(row.physical_fallback),
                    Flag(row.socioeconomic_fallback)});
    }

    writer.Close();
    written_files_.push_back(path);
}

void CsvResultSink::WriteJoined(const std::vector<JoinedZone>&, const std::string&) {}

} // namespace floodvi
