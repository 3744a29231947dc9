// File: src/io/gdal_surface_provider.hpp
#pragma once

#include "pipeline/providers.hpp"
#include <string>

namespace floodvi {

/// Elevation surface from any GDAL-readable raster (GeoTIFF and others).
///
/// One band is read in full as 32-bit floats together with its geotransform,
/// nodata value and coordinate reference (WKT).
class GdalSurfaceProvider : public SurfaceProvider {
public:
    struct Config {
        std::string path;
        int band{1};
    };

    explicit GdalSurfaceProvider(const Config& config);

    /// @throws MissingInputError if the raster cannot be opened or read
    ElevationSurface Load() override;

    std::string Describe() const override { return config_.path; }

private:
    Config config_;
};

} // namespace floodvi
