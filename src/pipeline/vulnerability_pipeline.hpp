// File: src/pipeline/vulnerability_pipeline.hpp
#pragma once

#include "pipeline/providers.hpp"
#include "raster/coordinate_transformer.hpp"
#include "raster/zonal_stats_extractor.hpp"
#include "scoring/vulnerability_aggregator.hpp"
#include "storage/result_sink.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace floodvi {

/// Everything one run produced, including what went wrong
struct RunReport {
    std::optional<CategoryResult> physical;
    std::optional<CategoryResult> socioeconomic;

    /// Why a category could not be computed, one message per failed category
    std::vector<std::string> category_errors;

    std::vector<OverallIndex> overall;
    std::vector<JoinedZone> joined;

    std::vector<DegradedZoneWarning> degraded;
    std::vector<PartialCategoryFallback> fallbacks;

    /// Set when the geometry join failed; tabular outputs are still written
    std::optional<std::string> join_error;

    /// Artifacts the sink failed to persist
    std::vector<std::string> sink_errors;

    /// Overall indices exist, the join succeeded and every write succeeded
    bool Complete() const {
        return !join_error.has_value() && sink_errors.empty();
    }
};

/// VulnerabilityPipeline: end-to-end flood vulnerability run
///
/// Stages:
/// 1. Boundaries and surface -> zonal statistics -> physical category
/// 2. Socioeconomic table -> socioeconomic category
/// 3. Overall blend, then the join back onto zone geometry
///
/// The two categories are isolated: a missing or unreadable input stops
/// only the category that needed it, and the overall index falls back to
/// the neutral value for the lost category. Every artifact is handed to the
/// sink as soon as it exists.
class VulnerabilityPipeline {
public:
    struct Config {
        ZonalStatsExtractor::Config extraction;
        VulnerabilityAggregator::Config aggregation;

        /// Progress messages on std::cout
        bool verbose{false};
    };

    /// Collaborators are borrowed and must outlive the pipeline.
    /// @param transformer_factory Used when the zones' CRS differs from the
    ///        surface's; may be empty
    VulnerabilityPipeline(const Config& config,
                          SurfaceProvider& surface_provider,
                          BoundaryProvider& boundary_provider,
                          SocioeconomicProvider& socioeconomic_provider,
                          ResultSink& sink,
                          CoordinateTransformerFactory transformer_factory = nullptr);

    /// Execute one run.
    /// @throws MissingInputError if neither category could be computed
    RunReport Run();

    const Config& config() const { return config_; }

private:
    /// Physical category over loaded zones
    CategoryResult ComputePhysical(const ZoneCollection& zones);

    CategoryResult ComputeSocioeconomic();

    void Write(RunReport& report, const std::string& artifact, const std::function<void()>& fn);

    void Log(const std::string& message) const;

    Config config_;
    ZonalStatsExtractor extractor_;
    VulnerabilityAggregator aggregator_;

    SurfaceProvider& surface_provider_;
    BoundaryProvider& boundary_provider_;
    SocioeconomicProvider& socioeconomic_provider_;
    ResultSink& sink_;
    CoordinateTransformerFactory transformer_factory_;
};

} // namespace floodvi
