// File: src/scoring/factor_normalizer.hpp
#pragma once

#include "scoring/factor_table.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace floodvi {

/// FactorNormalizer: min-max rescaling of factor columns to [0, 1]
///
/// Normalization runs across every zone that has a value for the factor.
/// Missing cells stay missing. A flat column (max == min) carries no
/// vulnerability signal and normalizes to 0 for every zone, as does a column
/// with an infinite bound.
namespace FactorNormalizer {

    /// One factor column rescaled to [0, 1]
    struct NormalizedFactor {
        std::string name;
        FactorDirection direction{FactorDirection::ASCENDING};

        /// Aligned with the source table's ZoneIds()
        std::vector<std::optional<double>> values;

        /// Range of the raw values; both 0 when no value was present
        double raw_min{0.0};
        double raw_max{0.0};

        /// True when max == min, a bound is infinite, or no value at all
        bool degenerate{false};
    };

    // ========================================================================
    // Column Normalization
    // ========================================================================

    /// Normalize a raw column
    /// ascending:  (x - min) / (max - min)
    /// descending: 1 - (x - min) / (max - min)
    /// @param values Raw values, missing entries allowed
    /// @param direction Mapping from raw value to vulnerability
    /// @return Normalized values aligned with input
    std::vector<std::optional<double>> NormalizeValues(
        const std::vector<std::optional<double>>& values,
        FactorDirection direction
    );

    /// Normalize one factor of a table
    /// @throws std::invalid_argument if the table has no such factor
    NormalizedFactor Normalize(
        const FactorTable& table,
        const std::string& factor_name,
        FactorDirection direction
    );

    // ========================================================================
    // Table Normalization
    // ========================================================================

    /// Normalize every factor named in specs that the table declares.
    /// The result has one column per such spec, in spec order; factors the
    /// table lacks are skipped.
    FactorTable NormalizeTable(
        const FactorTable& table,
        const std::vector<FactorSpec>& specs
    );

} // namespace FactorNormalizer

} // namespace floodvi
