#include "riskpulse/model/ProbabilityModel.hpp"
#include <algorithm>
#include <cmath>

namespace riskpulse {

const std::array<const char*, kFeatureCount>& feature_names() {
    static const std::array<const char*, kFeatureCount> kNames = {
        "Utilisation %",
        "Avg Payment Ratio",
        "Min Due Paid Frequency",
        "Merchant Mix Index",
        "Cash Withdrawal %",
        "Recent Spend Change %",
        "signal_spend_decline",
        "signal_high_utilization",
        "signal_payment_decline",
        "signal_cash_surge",
        "signal_low_merchant_mix",
    };
    return kNames;
}

FeatureVector build_feature_vector(const BehaviorFields& fields, const SignalSet& signals) {
    FeatureVector x{};
    x[0] = fields.utilisation_pct;
    x[1] = fields.avg_payment_ratio;
    x[2] = fields.min_due_paid_freq;
    x[3] = fields.merchant_mix_index;
    x[4] = fields.cash_withdrawal_pct;
    x[5] = fields.spend_change_pct;
    for (SignalId id : kAllSignals) {
        x[6 + static_cast<std::size_t>(id)] = signals.get(id) ? 1.0 : 0.0;
    }
    return x;
}

std::vector<FeatureImportance> rank_importances(const std::array<double, kFeatureCount>& raw) {
    std::vector<FeatureImportance> out;
    out.reserve(kFeatureCount);
    const auto& names = feature_names();
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        out.push_back({names[i], raw[i]});
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const FeatureImportance& a, const FeatureImportance& b) {
                         return a.importance > b.importance;
                     });
    return out;
}

double sigmoid(double z) {
    // Split by sign so exp() never overflows.
    if (z >= 0.0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    const double e = std::exp(z);
    return e / (1.0 + e);
}

}
