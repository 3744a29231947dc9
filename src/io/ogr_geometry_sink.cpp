// File: src/io/ogr_geometry_sink.cpp
#include "io/ogr_geometry_sink.hpp"
#include "io/ogr_geometry.hpp"
#include <cpl_error.h>
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace floodvi {

namespace {

void CreateField(OGRLayerH layer, const std::string& name, OGRFieldType type) {
    OGRFieldDefnH field = OGR_Fld_Create(name.c_str(), type);
    OGRErr err = OGR_L_CreateField(layer, field, TRUE);
    OGR_Fld_Destroy(field);
    if (err != OGRERR_NONE) {
        throw std::runtime_error("Failed to create output field " + name);
    }
}

} // namespace

OgrGeometrySink::OgrGeometrySink(const Config& config)
    : config_(config) {
    GDALAllRegister();
}

void OgrGeometrySink::WriteJoined(const std::vector<JoinedZone>& joined, const std::string& crs) {
    GDALDriverH driver = GDALGetDriverByName(config_.driver.c_str());
    if (driver == nullptr) {
        throw std::runtime_error("Unknown OGR driver: " + config_.driver);
    }

    std::error_code ec;
    std::filesystem::path target(config_.path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
    }
    if (std::filesystem::exists(target, ec)) {
        // Drivers refuse to create over an existing dataset
        if (GDALDeleteDataset(driver, config_.path.c_str()) != CE_None) {
            std::filesystem::remove(target, ec);
        }
    }

    GdalDatasetPtr dataset(GDALCreate(driver, config_.path.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!dataset) {
        throw std::runtime_error("Failed to create " + config_.path + ": " + CPLGetLastErrorMsg());
    }
    GDALDatasetH ds = static_cast<GDALDatasetH>(dataset.get());

    OGRSpatialReferenceH srs = nullptr;
    if (!crs.empty()) {
        srs = OSRNewSpatialReference(nullptr);
        if (OSRSetFromUserInput(srs, crs.c_str()) != OGRERR_NONE) {
            std::cerr << "Warning: output written without a coordinate reference" << std::endl;
            OSRDestroySpatialReference(srs);
            srs = nullptr;
        }
    }
    OGRLayerH layer = GDALDatasetCreateLayer(ds, config_.layer_name.c_str(), srs, wkbMultiPolygon, nullptr);
    if (srs) {
        OSRDestroySpatialReference(srs);
    }
    if (layer == nullptr) {
        throw std::runtime_error("Failed to create layer " + config_.layer_name + " in " + config_.path);
    }

    // Field positions follow creation order; some drivers truncate names
    const std::set<std::string> reserved = {
        "zone_id", "zone_name", "physical_vulnerability", "socioeconomic_vulnerability",
        "overall_vulnerability", "physical_fallback", "socioeconomic_fallback"};
    std::set<std::string> attribute_names;
    for (const auto& entry : joined) {
        for (const auto& attribute : entry.zone.attributes) {
            if (reserved.count(attribute.first) == 0) {
                attribute_names.insert(attribute.first);
            }
        }
    }
    CreateField(layer, "zone_id", OFTString);
    CreateField(layer, "zone_name", OFTString);
    CreateField(layer, "physical_vulnerability", OFTReal);
    CreateField(layer, "socioeconomic_vulnerability", OFTReal);
    CreateField(layer, "overall_vulnerability", OFTReal);
    CreateField(layer, "physical_fallback", OFTInteger);
    CreateField(layer, "socioeconomic_fallback", OFTInteger);
    const int first_attribute = 7;
    std::vector<std::string> attributes(attribute_names.begin(), attribute_names.end());
    for (const auto& name : attributes) {
        CreateField(layer, name, OFTString);
    }

    for (const auto& entry : joined) {
        OgrFeaturePtr feature(OGR_F_Create(OGR_L_GetLayerDefn(layer)));
        OGRFeatureH f = static_cast<OGRFeatureH>(feature.get());

        OGR_F_SetFieldString(f, 0, entry.index.zone_id.c_str());
        if (entry.zone.name.has_value()) {
            OGR_F_SetFieldString(f, 1, entry.zone.name->c_str());
        }
        OGR_F_SetFieldDouble(f, 2, entry.index.physical);
        OGR_F_SetFieldDouble(f, 3, entry.index.socioeconomic);
        OGR_F_SetFieldDouble(f, 4, entry.index.overall);
        OGR_F_SetFieldInteger(f, 5, entry.index.physical_fallback ? 1 : 0);
        OGR_F_SetFieldInteger(f, 6, entry.index.socioeconomic_fallback ? 1 : 0);
        for (size_t i = 0; i < attributes.size(); ++i) {
            auto it = entry.zone.attributes.find(attributes[i]);
            if (it != entry.zone.attributes.end()) {
                OGR_F_SetFieldString(f, first_attribute + static_cast<int>(i), it->second.c_str());
            }
        }

        if (!entry.zone.geometry.IsEmpty()) {
            OGR_F_SetGeometryDirectly(f, ToOgrGeometry(entry.zone.geometry));
        }

        if (OGR_L_CreateFeature(layer, f) != OGRERR_NONE) {
            throw std::runtime_error("Failed to write zone " + entry.index.zone_id + " to " + config_.path);
        }
    }
}

} // namespace floodvi
