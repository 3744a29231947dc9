// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace floodvi {

// FactorDirection: how a raw factor value maps onto vulnerability
enum class FactorDirection : uint8_t {
    ASCENDING = 0,   // Higher raw value -> higher vulnerability
    DESCENDING = 1,  // Higher raw value -> lower vulnerability
};

// Convert FactorDirection to string
const char* ToString(FactorDirection direction);

// Parse FactorDirection from string ("ascending" / "descending")
FactorDirection ParseFactorDirection(const std::string& str);

// Category: the two families of vulnerability factors
enum class Category : uint8_t {
    PHYSICAL = 0,
    SOCIOECONOMIC = 1,
};

// Convert Category to string
const char* ToString(Category category);

// Parse Category from string
Category ParseCategory(const std::string& str);

/// Canonical textual form of a zone identifier.
///
/// Identifiers arrive from shapefile attributes, CSV cells and synthesized
/// sequences, and may differ only in representation ("7", " 7", "7.0").
/// The canonical form trims surrounding whitespace and drops an all-zero
/// fractional part and a leading '+' from an integer ("+7.0" -> "7").
/// Leading zeros are kept, so
/// "W01" and "01" are distinct from "W1" and "1".
std::string CanonicalZoneId(const std::string& raw);

/// Synthesized identifier for the zone at position index (0-based): W01, W02, ...
std::string SynthesizeZoneId(size_t index);

/// Statistic name for an elevation threshold: 5 -> "pct_below_5m", 2.5 -> "pct_below_2.5m"
std::string ThresholdFactorName(double threshold);

// Well-known factor names
namespace factors {
    inline constexpr const char* ELEVATION_MEAN = "elevation_mean";
    inline constexpr const char* ELEVATION_MIN = "elevation_min";
    inline constexpr const char* ELEVATION_MAX = "elevation_max";
    inline constexpr const char* PCT_BELOW_5M = "pct_below_5m";
    inline constexpr const char* PCT_BELOW_10M = "pct_below_10m";

    inline constexpr const char* POPULATION_DENSITY = "population_density";
    inline constexpr const char* POVERTY_INDEX = "poverty_index";
    inline constexpr const char* VULNERABLE_POPULATION_PCT = "vulnerable_population_pct";
    inline constexpr const char* SLUM_HOUSEHOLD_PCT = "slum_household_pct";
    inline constexpr const char* CONCRETE_BUILDING_PCT = "concrete_building_pct";
}

} // namespace floodvi
