// File: src/scoring/composite_scorer.cpp
#include "scoring/composite_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace floodvi {

WeightTable WeightsFromSpecs(const std::vector<FactorSpec>& specs) {
    WeightTable weights;
    for (const auto& spec : specs) {
        weights[spec.name] = spec.weight;
    }
    return weights;
}

CompositeScorer::CompositeScorer(WeightTable weights)
    : weights_(std::move(weights)) {
    for (const auto& [name, weight] : weights_) {
        if (!std::isfinite(weight) || weight < 0.0) {
            throw std::invalid_argument("Weight for factor " + name + " must be non-negative");
        }
    }
}

std::vector<CategoryIndex> CompositeScorer::Score(const FactorTable& normalized) const {
    std::vector<CategoryIndex> indices;
    indices.reserve(normalized.ZoneCount());
    for (const auto& zone_id : normalized.ZoneIds()) {
        indices.push_back(ScoreZone(normalized, zone_id));
    }
    return indices;
}

CategoryIndex CompositeScorer::ScoreZone(const FactorTable& normalized,
                                         const std::string& zone_id) const {
    CategoryIndex index;
    index.zone_id = CanonicalZoneId(zone_id);

    double weighted_sum = 0.0;
    for (const auto& [name, weight] : weights_) {
        if (!normalized.HasFactor(name)) {
            continue;
        }
        auto value = normalized.Get(zone_id, name);
        if (!value.has_value()) {
            continue;
        }
        weighted_sum += weight * *value;
        index.weight_used += weight;
        ++index.factors_used;
    }

    if (index.weight_used > 0.0) {
        index.value = std::clamp(weighted_sum / index.weight_used * 100.0, 0.0, 100.0);
    }
    return index;
}

} // namespace floodvi
