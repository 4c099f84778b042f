// =============================================================================
// ProbabilityModel.hpp - Delinquency probability estimator interface
// =============================================================================
// FEATURE ORDER (fixed, must match training):
//   0 Utilisation %            6  signal_spend_decline
//   1 Avg Payment Ratio        7  signal_high_utilization
//   2 Min Due Paid Frequency   8  signal_payment_decline
//   3 Merchant Mix Index       9  signal_cash_surge
//   4 Cash Withdrawal %        10 signal_low_merchant_mix
//   5 Recent Spend Change %
// Signals are encoded 0.0 / 1.0. Order is a convention, not checked at
// runtime: a vector built in another order silently scores garbage.
//
// THREADING: implementations are immutable after construction; probability()
// is const and may be called concurrently from any request handler.
// =============================================================================
#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "riskpulse/core/Types.hpp"

namespace riskpulse {

constexpr std::size_t kFeatureCount = 6 + kSignalCount;

using FeatureVector = std::array<double, kFeatureCount>;

const std::array<const char*, kFeatureCount>& feature_names();

FeatureVector build_feature_vector(const BehaviorFields& fields, const SignalSet& signals);

struct FeatureImportance {
    std::string feature;
    double importance{0.0};
};

class ProbabilityModel {
public:
    virtual ~ProbabilityModel() = default;

    // Probability of the delinquent class, in [0,1].
    virtual double probability(const FeatureVector& x) const = 0;

    // Training-time importance ranking, sorted descending.
    virtual std::vector<FeatureImportance> feature_importances() const = 0;

    virtual std::string name() const = 0;
};

// Sort descending by importance; ties keep feature order.
std::vector<FeatureImportance> rank_importances(const std::array<double, kFeatureCount>& raw);

double sigmoid(double z);

}
