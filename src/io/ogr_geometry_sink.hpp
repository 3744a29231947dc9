// File: src/io/ogr_geometry_sink.hpp
#pragma once

#include "storage/result_sink.hpp"
#include <string>

namespace floodvi {

/// Writes the geometry-joined overall index as a vector file through OGR.
///
/// One multipolygon feature per zone carrying zone_id, zone_name, the
/// three indices, both fallback flags and the zone's source attributes.
/// An existing file at the target path is replaced. Tabular writes are
/// ignored.
class OgrGeometrySink : public ResultSink {
public:
    struct Config {
        std::string path{"output/overall_vulnerability.geojson"};
        std::string driver{"GeoJSON"};
        std::string layer_name{"overall_vulnerability"};
    };

    explicit OgrGeometrySink(const Config& config);

    void WriteCategory(const CategoryResult&) override {}
    void WriteOverall(const std::vector<OverallIndex>&) override {}

    /// @throws std::runtime_error if the driver, file, layer or a feature cannot be created
    void WriteJoined(const std::vector<JoinedZone>& joined, const std::string& crs) override;

    void Flush() override {}

private:
    Config config_;
};

} // namespace floodvi
