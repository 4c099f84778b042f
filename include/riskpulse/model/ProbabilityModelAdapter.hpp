#pragma once
#include <memory>
#include <string>
#include <vector>

#include "riskpulse/model/ProbabilityModel.hpp"

namespace riskpulse {

// ---------------------------------------------------------------------------
// Wraps an optional shared estimator. Absent model is a valid state:
// ready() is false and score()/top_features() throw ModelNotReady.
// Holds only a const model pointer, so concurrent calls share no mutable
// state.
// ---------------------------------------------------------------------------
class ProbabilityModelAdapter {
public:
    ProbabilityModelAdapter() = default;
    explicit ProbabilityModelAdapter(std::shared_ptr<const ProbabilityModel> model);

    bool ready() const { return model_ != nullptr; }

    // Probability in [0,1]. Does not check feature ranges or order.
    double score(const FeatureVector& x) const;

    // First n entries of the training-time importance ranking.
    std::vector<FeatureImportance> top_features(std::size_t n) const;

    std::string model_name() const;

private:
    std::shared_ptr<const ProbabilityModel> model_;
};

}
