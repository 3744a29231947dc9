// File: src/io/gdal_surface_provider.cpp
#include "io/gdal_surface_provider.hpp"
#include "core/errors.hpp"
#include "io/ogr_geometry.hpp"
#include <gdal.h>
#include <cpl_error.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace floodvi {

GdalSurfaceProvider::GdalSurfaceProvider(const Config& config)
    : config_(config) {
    GDALAllRegister();
}

ElevationSurface GdalSurfaceProvider::Load() {
    if (config_.path.empty()) {
        throw MissingInputError("<none>", "No elevation raster configured", Category::PHYSICAL);
    }

    GdalDatasetPtr dataset(GDALOpenEx(config_.path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY,
                                      nullptr, nullptr, nullptr));
    if (!dataset) {
        throw MissingInputError(config_.path,
                                std::string("Cannot open elevation raster: ") + CPLGetLastErrorMsg(),
                                Category::PHYSICAL);
    }
    GDALDatasetH ds = static_cast<GDALDatasetH>(dataset.get());

    if (config_.band < 1 || config_.band > GDALGetRasterCount(ds)) {
        throw MissingInputError(config_.path,
                                "Raster has no band " + std::to_string(config_.band),
                                Category::PHYSICAL);
    }

    GeoTransform transform;
    if (GDALGetGeoTransform(ds, transform.coefficients.data()) != CE_None) {
        throw MissingInputError(config_.path, "Raster is not georeferenced", Category::PHYSICAL);
    }

    const char* projection = GDALGetProjectionRef(ds);
    std::string crs = projection ? projection : "";

    const int width = GDALGetRasterXSize(ds);
    const int height = GDALGetRasterYSize(ds);
    GDALRasterBandH band = GDALGetRasterBand(ds, config_.band);

    int has_nodata = 0;
    double nodata_value = GDALGetRasterNoDataValue(band, &has_nodata);
    std::optional<double> nodata;
    if (has_nodata) {
        nodata = nodata_value;
    }

    std::vector<float> samples(static_cast<size_t>(width) * static_cast<size_t>(height));
    CPLErr err = GDALRasterIO(band, GF_Read, 0, 0, width, height,
                              samples.data(), width, height, GDT_Float32, 0, 0);
    if (err != CE_None) {
        throw MissingInputError(config_.path,
                                std::string("Failed to read elevation band: ") + CPLGetLastErrorMsg(),
                                Category::PHYSICAL);
    }

    return ElevationSurface(static_cast<size_t>(width), static_cast<size_t>(height),
                            std::move(samples), transform, nodata, crs);
}

} // namespace floodvi
