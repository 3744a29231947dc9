// File: src/io/ogr_boundary_provider.cpp
#include "io/ogr_boundary_provider.hpp"
#include "core/errors.hpp"
#include "io/ogr_geometry.hpp"
#include <cpl_conv.h>
#include <cpl_error.h>
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>
#include <iostream>
#include <utility>

namespace floodvi {

namespace {

int FindField(OGRFeatureDefnH definition, const std::vector<std::string>& candidates) {
    for (const auto& name : candidates) {
        int index = OGR_FD_GetFieldIndex(definition, name.c_str());
        if (index >= 0) {
            return index;
        }
    }
    return -1;
}

std::string LayerCrs(OGRLayerH layer) {
    OGRSpatialReferenceH srs = OGR_L_GetSpatialRef(layer);
    if (srs == nullptr) {
        return std::string();
    }
    char* wkt = nullptr;
    std::string result;
    if (OSRExportToWkt(srs, &wkt) == OGRERR_NONE && wkt != nullptr) {
        result = wkt;
    }
    CPLFree(wkt);
    return result;
}

} // namespace

OgrBoundaryProvider::OgrBoundaryProvider(const Config& config)
    : config_(config) {
    GDALAllRegister();
}

ZoneCollection OgrBoundaryProvider::Load() {
    if (config_.path.empty()) {
        throw MissingInputError("<none>", "No boundary source configured", Category::PHYSICAL);
    }

    GdalDatasetPtr dataset(GDALOpenEx(config_.path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY,
                                      nullptr, nullptr, nullptr));
    if (!dataset) {
        throw MissingInputError(config_.path,
                                std::string("Cannot open boundaries: ") + CPLGetLastErrorMsg(),
                                Category::PHYSICAL);
    }
    GDALDatasetH ds = static_cast<GDALDatasetH>(dataset.get());

    OGRLayerH layer = config_.layer.empty()
        ? (GDALDatasetGetLayerCount(ds) > 0 ? GDALDatasetGetLayer(ds, 0) : nullptr)
        : GDALDatasetGetLayerByName(ds, config_.layer.c_str());
    if (layer == nullptr) {
        throw MissingInputError(config_.path,
                                "Boundary layer not found: " +
                                    (config_.layer.empty() ? std::string("<first>") : config_.layer),
                                Category::PHYSICAL);
    }

    OGRFeatureDefnH definition = OGR_L_GetLayerDefn(layer);
    const int id_field = FindField(definition, config_.id_fields);
    const int name_field = FindField(definition, config_.name_fields);
    if (id_field < 0) {
        std::cerr << "Warning: " << config_.path
                  << " has no zone id field; numbering zones W01, W02, ..." << std::endl;
    }

    ZoneCollection zones(LayerCrs(layer));
    const int field_count = OGR_FD_GetFieldCount(definition);

    OGR_L_ResetReading(layer);
    size_t position = 0;
    for (OgrFeaturePtr feature(OGR_L_GetNextFeature(layer)); feature;
         feature.reset(OGR_L_GetNextFeature(layer)), ++position) {
        OGRFeatureH f = static_cast<OGRFeatureH>(feature.get());

        Zone zone;
        if (id_field >= 0 && OGR_F_IsFieldSetAndNotNull(f, id_field)) {
            zone.id = CanonicalZoneId(OGR_F_GetFieldAsString(f, id_field));
        }
        if (zone.id.empty()) {
            zone.id = SynthesizeZoneId(position);
        }
        if (name_field >= 0 && OGR_F_IsFieldSetAndNotNull(f, name_field)) {
            zone.name = OGR_F_GetFieldAsString(f, name_field);
        }

        for (int i = 0; i < field_count; ++i) {
            if (i == id_field || i == name_field || !OGR_F_IsFieldSetAndNotNull(f, i)) {
                continue;
            }
            OGRFieldDefnH field = OGR_FD_GetFieldDefn(definition, i);
            zone.attributes[OGR_Fld_GetNameRef(field)] = OGR_F_GetFieldAsString(f, i);
        }

        // Non-polygonal geometry leaves the zone empty; extraction degrades it
        try {
            zone.geometry = FromOgrGeometry(OGR_F_GetGeometryRef(f));
        } catch (const std::runtime_error& e) {
            std::cerr << "Warning: zone " << zone.id << ": " << e.what() << std::endl;
        }

        zones.Add(std::move(zone));
    }

    return zones;
}

} // namespace floodvi
