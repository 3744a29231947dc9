// File: src/storage/csv_result_sink.hpp
#pragma once

#include "storage/result_sink.hpp"
#include <string>
#include <vector>

namespace floodvi {

/// Writes the tabular artifacts of a run as CSV files in one directory.
///
/// Category files hold zone_id, zone_name (when known), every raw factor,
/// a <factor>_norm column per contributing factor, the category index and
/// weight_used; the physical file also carries degraded and
/// degraded_reason. Missing values are empty cells.
///
/// Geometry output is left to a spatial sink; WriteJoined is a no-op here.
class CsvResultSink : public ResultSink {
public:
    struct Config {
        std::string output_dir{"output"};
        std::string physical_file{"physical_vulnerability.csv"};
        std::string socioeconomic_file{"socioeconomic_vulnerability.csv"};
        std::string overall_file{"overall_vulnerability.csv"};
    };

    CsvResultSink();

    /// @throws std::runtime_error if the output directory cannot be created
    explicit CsvResultSink(const Config& config);

    void WriteCategory(const CategoryResult& result) override;
    void WriteOverall(const std::vector<OverallIndex>& overall) override;
    void WriteJoined(const std::vector<JoinedZone>& joined, const std::string& crs) override;
    void Flush() override {}

    /// Paths written so far, in write order
    const std::vector<std::string>& written_files() const { return written_files_; }

    /// Name of the index column for a category, e.g. "physical_vulnerability"
    static std::string IndexColumn(Category category);

private:
    std::string PathFor(const std::string& file) const;

    Config config_;
    std::vector<std::string> written_files_;
};

} // namespace floodvi
