// File: src/scoring/vulnerability_aggregator.hpp
#pragma once

#include "core/errors.hpp"
#include "core/types.hpp"
#include "core/zone.hpp"
#include "scoring/composite_scorer.hpp"
#include "scoring/factor_table.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace floodvi {

/// elevation_mean, elevation_min (descending, 0.3 each);
/// pct_below_5m (ascending, 0.25); pct_below_10m (ascending, 0.15)
std::vector<FactorSpec> DefaultPhysicalFactors();

/// population_density, poverty_index (ascending, 0.25 each);
/// vulnerable_population_pct, slum_household_pct (ascending, 0.2 each);
/// concrete_building_pct (descending, 0.1). All optional.
std::vector<FactorSpec> DefaultSocioeconomicFactors();

/// Everything computed for one category: raw and normalized factors, the
/// factors actually used and the per-zone index.
struct CategoryResult {
    Category category{Category::PHYSICAL};

    /// Declared factors that the source supplied, in declaration order
    std::vector<FactorSpec> factors_used;

    /// Declared optional factors the source did not supply
    std::vector<std::string> factors_absent;

    FactorTable raw;
    FactorTable normalized;
    std::vector<CategoryIndex> indices;

    /// Zone display names, where the source had them
    std::map<std::string, std::string> zone_names;

    /// Zones whose raw inputs were sentinel-filled
    std::vector<DegradedZoneWarning> degraded;

    const CategoryIndex* Find(const std::string& zone_id) const;
};

/// Per-zone blend of the category indices
struct OverallIndex {
    std::string zone_id;
    double physical{0.0};
    double socioeconomic{0.0};
    double overall{0.0};

    /// Category value was substituted by the neutral fallback
    bool physical_fallback{false};
    bool socioeconomic_fallback{false};
};

/// Zone geometry with its overall index attached
struct JoinedZone {
    Zone zone;
    OverallIndex index;
};

/// VulnerabilityAggregator: category scoring, overall blending and the
/// join back onto zone geometry.
///
/// Overall = physical_weight * physical + socioeconomic_weight * socioeconomic.
/// A zone known to only one category gets the neutral value for the other;
/// a category that failed as a whole is neutral for every zone. Both
/// categories missing is an error.
class VulnerabilityAggregator {
public:
    struct Config {
        std::vector<FactorSpec> physical_factors = DefaultPhysicalFactors();
        std::vector<FactorSpec> socioeconomic_factors = DefaultSocioeconomicFactors();

        double physical_weight{0.6};
        double socioeconomic_weight{0.4};

        /// Substituted for a missing category
        double neutral_value{50.0};
    };

    /// Result of blending the two categories
    struct AggregateResult {
        std::vector<OverallIndex> overall;
        std::vector<PartialCategoryFallback> fallbacks;
    };

    VulnerabilityAggregator();

    /// @throws std::invalid_argument on negative category weights or a
    ///         neutral value outside [0, 100]
    explicit VulnerabilityAggregator(const Config& config);

    /// Normalize and score one category from its raw factor table.
    /// @throws MissingInputError if a non-optional factor has no value at all
    CategoryResult ComputeCategory(Category category, const FactorTable& raw) const;

    /// Blend category indices into the overall index.
    /// @param physical Physical indices, nullopt when the category failed
    /// @param socioeconomic Socioeconomic indices, nullopt when the category failed
    /// @param zones Optional zone collection fixing the output order
    /// @throws MissingInputError when both categories are absent
    AggregateResult Aggregate(
        const std::optional<std::vector<CategoryIndex>>& physical,
        const std::optional<std::vector<CategoryIndex>>& socioeconomic,
        const ZoneCollection* zones = nullptr) const;

    /// Attach every overall index to its zone geometry.
    /// Identifiers are compared in canonical text form.
    /// @throws JoinMismatchError unless the match is one-to-one
    static std::vector<JoinedZone> JoinWithGeometry(
        const std::vector<OverallIndex>& overall,
        const ZoneCollection& zones);

    const Config& config() const { return config_; }

    const std::vector<FactorSpec>& FactorsFor(Category category) const;

private:
    Config config_;
};

} // namespace floodvi
