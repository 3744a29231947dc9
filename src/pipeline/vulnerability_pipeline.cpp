// File: src/pipeline/vulnerability_pipeline.cpp
#include "pipeline/vulnerability_pipeline.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <memory>
#include <utility>

namespace floodvi {

VulnerabilityPipeline::VulnerabilityPipeline(const Config& config,
                                             SurfaceProvider& surface_provider,
                                             BoundaryProvider& boundary_provider,
                                             SocioeconomicProvider& socioeconomic_provider,
                                             ResultSink& sink,
                                             CoordinateTransformerFactory transformer_factory)
    : config_(config),
      extractor_(config.extraction),
      aggregator_(config.aggregation),
      surface_provider_(surface_provider),
      boundary_provider_(boundary_provider),
      socioeconomic_provider_(socioeconomic_provider),
      sink_(sink),
      transformer_factory_(std::move(transformer_factory)) {}

void VulnerabilityPipeline::Log(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[floodvi] " << message << std::endl;
    }
}

void VulnerabilityPipeline::Write(RunReport& report, const std::string& artifact,
                                  const std::function<void()>& fn) {
    try {
        fn();
        Log("Wrote " + artifact);
    } catch (const std::exception& e) {
        std::cerr << "Warning: failed to write " << artifact << ": " << e.what() << std::endl;
        report.sink_errors.push_back(artifact + ": " + e.what());
    }
}

// ============================================================================
// Categories
// ============================================================================

CategoryResult VulnerabilityPipeline::ComputePhysical(const ZoneCollection& zones) {
    Log("Reading elevation surface " + surface_provider_.Describe());
    ElevationSurface surface = surface_provider_.Load();

    if (surface.crs().empty()) {
        throw MissingInputError(surface_provider_.Describe(),
                                "Elevation surface has no coordinate reference",
                                Category::PHYSICAL);
    }

    std::unique_ptr<CoordinateTransformer> transformer;
    if (!zones.crs().empty() && zones.crs() != surface.crs() && transformer_factory_) {
        transformer = transformer_factory_(zones.crs(), surface.crs());
        if (transformer) {
            Log("Reprojecting zones: " + transformer->Describe());
        }
    }

    Log("Extracting zonal statistics for " + std::to_string(zones.size()) + " zones");
    auto stats = extractor_.Extract(surface, zones, transformer.get());

    const std::vector<std::string> order = zones.Ids();
    FactorTable raw = extractor_.ToFactorTable(stats, order);

    CategoryResult result = aggregator_.ComputeCategory(Category::PHYSICAL, raw);
    result.degraded = ZonalStatsExtractor::CollectWarnings(stats, order);
    for (const auto& zone : zones) {
        if (zone.name.has_value()) {
            result.zone_names[zone.id] = *zone.name;
        }
    }
    return result;
}

CategoryResult VulnerabilityPipeline::ComputeSocioeconomic() {
    Log("Reading socioeconomic table " + socioeconomic_provider_.Describe());
    const auto& specs = aggregator_.FactorsFor(Category::SOCIOECONOMIC);
    SourceFactorTable source = socioeconomic_provider_.Load(specs);

    for (const auto& column : source.absent_columns) {
        std::cerr << "Warning: socioeconomic column '" << column
                  << "' not found; factor dropped" << std::endl;
    }

    CategoryResult result = aggregator_.ComputeCategory(Category::SOCIOECONOMIC, source.table);
    result.zone_names = std::move(source.zone_names);
    return result;
}

// ============================================================================
// Run
// ============================================================================

RunReport VulnerabilityPipeline::Run() {
    RunReport report;

    // Zones feed both the physical category and the final join
    std::optional<ZoneCollection> zones;
    try {
        Log("Reading boundaries " + boundary_provider_.Describe());
        zones = boundary_provider_.Load();
        Log("Loaded " + std::to_string(zones->size()) + " zones");
    } catch (const std::exception& e) {
        // Unreadable or inconsistent boundaries stop only the physical category
        std::cerr << "Warning: boundaries unavailable: " << e.what() << std::endl;
        report.category_errors.push_back(std::string("physical: ") + e.what());
    }

    if (zones.has_value()) {
        try {
            report.physical = ComputePhysical(*zones);
        } catch (const std::exception& e) {
            std::cerr << "Warning: physical vulnerability not computed: " << e.what() << std::endl;
            report.category_errors.push_back(std::string("physical: ") + e.what());
        }
    }

    try {
        report.socioeconomic = ComputeSocioeconomic();
    } catch (const std::exception& e) {
        std::cerr << "Warning: socioeconomic vulnerability not computed: " << e.what() << std::endl;
        report.category_errors.push_back(std::string("socioeconomic: ") + e.what());
    }

    if (report.physical.has_value()) {
        report.degraded = report.physical->degraded;
        for (const auto& warning : report.degraded) {
            std::cerr << "Warning: zone " << warning.zone_id << " degraded: "
                      << warning.reason << std::endl;
        }
        Write(report, "physical table", [&]() { sink_.WriteCategory(*report.physical); });
    }
    if (report.socioeconomic.has_value()) {
        Write(report, "socioeconomic table", [&]() { sink_.WriteCategory(*report.socioeconomic); });
    }

    std::optional<std::vector<CategoryIndex>> physical_indices;
    std::optional<std::vector<CategoryIndex>> socio_indices;
    if (report.physical.has_value()) physical_indices = report.physical->indices;
    if (report.socioeconomic.has_value()) socio_indices = report.socioeconomic->indices;

    // Throws when both categories are gone
    auto aggregate = aggregator_.Aggregate(physical_indices, socio_indices,
                                           zones.has_value() ? &*zones : nullptr);
    report.overall = std::move(aggregate.overall);
    report.fallbacks = std::move(aggregate.fallbacks);
    for (const auto& fallback : report.fallbacks) {
        std::cerr << "Warning: " << ToString(fallback.category) << " value "
                  << fallback.substituted_value << " substituted for "
                  << fallback.affected_zones.size() << " zone(s): " << fallback.reason << std::endl;
    }
    Write(report, "overall table", [&]() { sink_.WriteOverall(report.overall); });

    if (zones.has_value()) {
        try {
            report.joined = VulnerabilityAggregator::JoinWithGeometry(report.overall, *zones);
            Write(report, "zone geometry", [&]() { sink_.WriteJoined(report.joined, zones->crs()); });
        } catch (const JoinMismatchError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            report.join_error = e.what();
        }
    } else {
        report.join_error = "zone geometry unavailable";
    }

    Write(report, "pending output", [&]() { sink_.Flush(); });
    return report;
}

} // namespace floodvi
