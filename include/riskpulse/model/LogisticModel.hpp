#pragma once
#include <array>
#include <memory>

#include "riskpulse/config/RiskConfig.hpp"
#include "riskpulse/data/EnrichedDataset.hpp"
#include "riskpulse/model/ProbabilityModel.hpp"

namespace riskpulse {

// ---------------------------------------------------------------------------
// Logistic regression on standardized features.
//
//   p = sigmoid(bias + sum_i w_i * (x_i - mean_i) / scale_i)
//
// A constant training column gets scale 1 so it contributes nothing.
// Importance of feature i is |w_i| normalized to sum 1.
// ---------------------------------------------------------------------------
class LogisticModel final : public ProbabilityModel {
public:
    LogisticModel(const std::array<double, kFeatureCount>& mean,
                  const std::array<double, kFeatureCount>& scale,
                  const std::array<double, kFeatureCount>& weights,
                  double bias);

    double probability(const FeatureVector& x) const override;
    std::vector<FeatureImportance> feature_importances() const override;
    std::string name() const override { return "logistic_regression"; }

    const std::array<double, kFeatureCount>& weights() const { return weights_; }
    double bias() const { return bias_; }

private:
    std::array<double, kFeatureCount> mean_;
    std::array<double, kFeatureCount> scale_;
    std::array<double, kFeatureCount> weights_;
    double bias_;
};

// ---------------------------------------------------------------------------
// Startup training fallback: full-batch gradient descent on log-loss over the
// enriched dataset (6 fields + 5 signals against is_delinquent).
// Deterministic: zero-initialized weights, fixed iteration count.
// Throws ModelNotReady on an empty dataset.
// ---------------------------------------------------------------------------
std::shared_ptr<const LogisticModel> train_logistic_model(const EnrichedDataset& ds,
                                                          const ModelSettings& settings);

}
