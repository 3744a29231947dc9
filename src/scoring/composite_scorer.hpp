// File: src/scoring/composite_scorer.hpp
#pragma once

#include "scoring/factor_table.hpp"
#include <map>
#include <string>
#include <vector>

namespace floodvi {

/// Factor name -> non-negative weight. Weights need not sum to 1.
using WeightTable = std::map<std::string, double>;

/// Build a weight table from factor declarations
WeightTable WeightsFromSpecs(const std::vector<FactorSpec>& specs);

/// Per-zone score of one category on a 0-100 scale
struct CategoryIndex {
    std::string zone_id;

    /// Weighted mean of contributing normalized factors, times 100
    double value{0.0};

    /// Sum of the weights of factors that had a value for this zone
    double weight_used{0.0};

    /// Number of factors that contributed
    size_t factors_used{0};
};

/// CompositeScorer: weighted aggregation of normalized factors
///
/// For each zone only factors with a value contribute, and the weighted sum
/// is divided by the weight mass actually used:
///
///   index = 100 * sum(w_i * n_i) / sum(w_i)   over contributing factors i
///
/// so a missing factor narrows the basis of the score instead of pulling it
/// towards zero. A zone with no contributing factor scores 0.
class CompositeScorer {
public:
    /// @throws std::invalid_argument on a negative or non-finite weight
    explicit CompositeScorer(WeightTable weights);

    /// Score every zone of a normalized table, in table row order.
    /// Factors in the weight table but not in the table are ignored;
    /// table columns without a weight are ignored too.
    std::vector<CategoryIndex> Score(const FactorTable& normalized) const;

    /// Score a single zone row
    CategoryIndex ScoreZone(const FactorTable& normalized, const std::string& zone_id) const;

    const WeightTable& weights() const { return weights_; }

private:
    WeightTable weights_;
};

} // namespace floodvi
