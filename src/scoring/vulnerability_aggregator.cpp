// File: src/scoring/vulnerability_aggregator.cpp
#include "scoring/vulnerability_aggregator.hpp"
#include "scoring/factor_normalizer.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace floodvi {

// ============================================================================
// Factor catalogs
// ============================================================================

std::vector<FactorSpec> DefaultPhysicalFactors() {
    return {
        {factors::ELEVATION_MEAN, FactorDirection::DESCENDING, 0.30, false},
        {factors::ELEVATION_MIN, FactorDirection::DESCENDING, 0.30, false},
        {factors::PCT_BELOW_5M, FactorDirection::ASCENDING, 0.25, false},
        {factors::PCT_BELOW_10M, FactorDirection::ASCENDING, 0.15, false},
    };
}

std::vector<FactorSpec> DefaultSocioeconomicFactors() {
    return {
        {factors::POPULATION_DENSITY, FactorDirection::ASCENDING, 0.25, true},
        {factors::POVERTY_INDEX, FactorDirection::ASCENDING, 0.25, true},
        {factors::VULNERABLE_POPULATION_PCT, FactorDirection::ASCENDING, 0.20, true},
        {factors::SLUM_HOUSEHOLD_PCT, FactorDirection::ASCENDING, 0.20, true},
        {factors::CONCRETE_BUILDING_PCT, FactorDirection::DESCENDING, 0.10, true},
    };
}

const CategoryIndex* CategoryResult::Find(const std::string& zone_id) const {
    const std::string id = CanonicalZoneId(zone_id);
    for (const auto& index : indices) {
        if (index.zone_id == id) {
            return &index;
        }
    }
    return nullptr;
}

// ============================================================================
// Construction
// ============================================================================

VulnerabilityAggregator::VulnerabilityAggregator()
    : VulnerabilityAggregator(Config()) {}

VulnerabilityAggregator::VulnerabilityAggregator(const Config& config)
    : config_(config) {
    if (!std::isfinite(config_.physical_weight) || config_.physical_weight < 0.0 ||
        !std::isfinite(config_.socioeconomic_weight) || config_.socioeconomic_weight < 0.0) {
        throw std::invalid_argument("Category weights must be non-negative");
    }
    if (!(config_.neutral_value >= 0.0 && config_.neutral_value <= 100.0)) {
        throw std::invalid_argument("Neutral fallback value must lie in [0, 100]");
    }
}

const std::vector<FactorSpec>& VulnerabilityAggregator::FactorsFor(Category category) const {
    return category == Category::PHYSICAL ? config_.physical_factors
                                          : config_.socioeconomic_factors;
}

// ============================================================================
// Category scoring
// ============================================================================

CategoryResult VulnerabilityAggregator::ComputeCategory(Category category,
                                                        const FactorTable& raw) const {
    CategoryResult result;
    result.category = category;
    result.raw = raw;

    for (const auto& spec : FactorsFor(category)) {
        if (raw.IsPresent(spec.name)) {
            result.factors_used.push_back(spec);
        } else if (spec.optional) {
            result.factors_absent.push_back(spec.name);
        } else {
            throw MissingInputError(std::string(ToString(category)) + " factor table",
                                    "Required factor has no values: " + spec.name,
                                    category);
        }
    }

    result.normalized = FactorNormalizer::NormalizeTable(raw, result.factors_used);

    CompositeScorer scorer(WeightsFromSpecs(result.factors_used));
    result.indices = scorer.Score(result.normalized);
    return result;
}

// ============================================================================
// Overall blend
// ============================================================================

VulnerabilityAggregator::AggregateResult VulnerabilityAggregator::Aggregate(
    const std::optional<std::vector<CategoryIndex>>& physical,
    const std::optional<std::vector<CategoryIndex>>& socioeconomic,
    const ZoneCollection* zones) const {

    if (!physical.has_value() && !socioeconomic.has_value()) {
        throw MissingInputError("physical and socioeconomic inputs",
                                "Neither vulnerability category could be computed");
    }

    std::unordered_map<std::string, double> physical_by_zone;
    std::unordered_map<std::string, double> socio_by_zone;
    std::vector<std::string> order;
    std::set<std::string> seen;

    auto collect = [&](const std::optional<std::vector<CategoryIndex>>& indices,
                       std::unordered_map<std::string, double>& by_zone) {
        if (!indices.has_value()) {
            return;
        }
        for (const auto& index : *indices) {
            std::string id = CanonicalZoneId(index.zone_id);
            by_zone[id] = index.value;
            if (seen.insert(id).second) {
                order.push_back(id);
            }
        }
    };
    collect(physical, physical_by_zone);
    collect(socioeconomic, socio_by_zone);

    // Zone-collection order first, then anything the collection lacks
    if (zones != nullptr) {
        std::vector<std::string> ordered;
        std::set<std::string> placed;
        for (const auto& zone : *zones) {
            if (seen.count(zone.id) > 0) {
                ordered.push_back(zone.id);
                placed.insert(zone.id);
            }
        }
        for (const auto& id : order) {
            if (placed.count(id) == 0) {
                ordered.push_back(id);
            }
        }
        order = std::move(ordered);
    }

    AggregateResult result;
    PartialCategoryFallback physical_fallback{Category::PHYSICAL, "", {}, config_.neutral_value};
    PartialCategoryFallback socio_fallback{Category::SOCIOECONOMIC, "", {}, config_.neutral_value};
    physical_fallback.reason = physical.has_value() ? "zone absent from physical output"
                                                    : "physical category unavailable";
    socio_fallback.reason = socioeconomic.has_value() ? "zone absent from socioeconomic output"
                                                      : "socioeconomic category unavailable";

    result.overall.reserve(order.size());
    for (const auto& id : order) {
        OverallIndex index;
        index.zone_id = id;

        auto p = physical_by_zone.find(id);
        if (p != physical_by_zone.end()) {
            index.physical = p->second;
        } else {
            index.physical = config_.neutral_value;
            index.physical_fallback = true;
            physical_fallback.affected_zones.push_back(id);
        }

        auto s = socio_by_zone.find(id);
        if (s != socio_by_zone.end()) {
            index.socioeconomic = s->second;
        } else {
            index.socioeconomic = config_.neutral_value;
            index.socioeconomic_fallback = true;
            socio_fallback.affected_zones.push_back(id);
        }

        index.overall = config_.physical_weight * index.physical +
                        config_.socioeconomic_weight * index.socioeconomic;
        result.overall.push_back(index);
    }

    if (!physical_fallback.affected_zones.empty()) {
        result.fallbacks.push_back(std::move(physical_fallback));
    }
    if (!socio_fallback.affected_zones.empty()) {
        result.fallbacks.push_back(std::move(socio_fallback));
    }
    return result;
}

// ============================================================================
// Geometry join
// ============================================================================

std::vector<JoinedZone> VulnerabilityAggregator::JoinWithGeometry(
    const std::vector<OverallIndex>& overall,
    const ZoneCollection& zones) {

    std::unordered_map<std::string, size_t> index_count;
    for (const auto& row : overall) {
        ++index_count[CanonicalZoneId(row.zone_id)];
    }

    std::vector<std::string> unmatched_index;
    std::vector<std::string> unmatched_geometry;
    std::vector<std::string> duplicates;
    std::set<std::string> reported;

    for (const auto& row : overall) {
        std::string id = CanonicalZoneId(row.zone_id);
        if (index_count[id] > 1 && reported.insert(id).second) {
            duplicates.push_back(id);
        }
        if (!zones.Contains(id) && std::find(unmatched_index.begin(), unmatched_index.end(), id) == unmatched_index.end()) {
            unmatched_index.push_back(id);
        }
    }
    for (const auto& zone : zones) {
        if (index_count.count(zone.id) == 0) {
            unmatched_geometry.push_back(zone.id);
        }
    }

    if (!unmatched_index.empty() || !unmatched_geometry.empty() || !duplicates.empty()) {
        throw JoinMismatchError(unmatched_index, unmatched_geometry, duplicates);
    }

    std::vector<JoinedZone> joined;
    joined.reserve(overall.size());
    for (const auto& row : overall) {
        JoinedZone entry;
        entry.zone = *zones.Find(row.zone_id);
        entry.index = row;
        entry.index.zone_id = entry.zone.id;
        joined.push_back(std::move(entry));
    }
    return joined;
}

} // namespace floodvi
