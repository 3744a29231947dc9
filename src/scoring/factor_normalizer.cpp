// File: src/scoring/factor_normalizer.cpp
#include "scoring/factor_normalizer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace floodvi {
namespace FactorNormalizer {

std::vector<std::optional<double>> NormalizeValues(
    const std::vector<std::optional<double>>& values,
    FactorDirection direction
) {
    double min_value = std::numeric_limits<double>::infinity();
    double max_value = -std::numeric_limits<double>::infinity();
    for (const auto& v : values) {
        if (v.has_value()) {
            min_value = std::min(min_value, *v);
            max_value = std::max(max_value, *v);
        }
    }

    std::vector<std::optional<double>> normalized(values.size());
    // Extreme columns whose span overflows are scaled by half to stay finite
    const bool halved = !std::isfinite(max_value - min_value);
    const double scale = halved ? 0.5 : 1.0;
    const double range = max_value * scale - min_value * scale;
    const bool flat = !(range > 0.0) || !std::isfinite(range);

    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i].has_value()) {
            continue;
        }
        if (flat) {
            normalized[i] = 0.0;
            continue;
        }
        double scaled = (*values[i] * scale - min_value * scale) / range;
        if (direction == FactorDirection::DESCENDING) {
            scaled = 1.0 - scaled;
        }
        normalized[i] = std::clamp(scaled, 0.0, 1.0);
    }

    return normalized;
}

NormalizedFactor Normalize(
    const FactorTable& table,
    const std::string& factor_name,
    FactorDirection direction
) {
    if (!table.HasFactor(factor_name)) {
        throw std::invalid_argument("Factor not in table: " + factor_name);
    }

    auto column = table.Column(factor_name);

    NormalizedFactor result;
    result.name = factor_name;
    result.direction = direction;
    result.values = NormalizeValues(column, direction);

    bool any = false;
    double min_value = std::numeric_limits<double>::infinity();
    double max_value = -std::numeric_limits<double>::infinity();
    for (const auto& v : column) {
        if (v.has_value()) {
            any = true;
            min_value = std::min(min_value, *v);
            max_value = std::max(max_value, *v);
        }
    }
    if (any) {
        result.raw_min = min_value;
        result.raw_max = max_value;
    }
    result.degenerate = !(max_value > min_value) ||
                        !std::isfinite(max_value) || !std::isfinite(min_value);

    return result;
}

FactorTable NormalizeTable(
    const FactorTable& table,
    const std::vector<FactorSpec>& specs
) {
    std::vector<const FactorSpec*> present;
    std::vector<std::string> names;
    for (const auto& spec : specs) {
        if (table.HasFactor(spec.name)) {
            present.push_back(&spec);
            names.push_back(spec.name);
        }
    }

    FactorTable normalized(names);
    const auto& zone_ids = table.ZoneIds();
    for (const auto& id : zone_ids) {
        normalized.AddZone(id);
    }

    for (const auto* spec : present) {
        auto column = Normalize(table, spec->name, spec->direction);
        for (size_t i = 0; i < zone_ids.size(); ++i) {
            if (column.values[i].has_value()) {
                normalized.Set(zone_ids[i], spec->name, *column.values[i]);
            }
        }
    }

    return normalized;
}

} // namespace FactorNormalizer
} // namespace floodvi
