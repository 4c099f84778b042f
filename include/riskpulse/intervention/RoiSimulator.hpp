#pragma once
#include <array>
#include <cstddef>

#include "riskpulse/config/RiskConfig.hpp"
#include "riskpulse/core/Types.hpp"
#include "riskpulse/data/EnrichedDataset.hpp"

namespace riskpulse {

struct TierRoi {
    RiskTier tier{RiskTier::LOW};
    std::size_t count{0};
    double delinquency_rate{0.0};   // empirical, within tier, fraction 0..1
    double prevention_rate{0.0};
    double unit_cost{0.0};
    double prevented{0.0};          // count * prevention_rate * delinquency_rate
    double cost{0.0};               // count * unit_cost
};

struct RoiAnalysis {
    std::array<TierRoi, kTierCount> tiers{};   // kTierOrder
    double total_prevented{0.0};
    double total_cost{0.0};
    double revenue_protected{0.0};
    double net_benefit{0.0};
    double roi_percentage{0.0};    // 0 when total_cost == 0
    double per_dollar_yield{0.0};  // 0 when total_cost == 0

    const TierRoi& tier(RiskTier t) const;
};

// ---------------------------------------------------------------------------
// Tier-based intervention program model.
//
//   revenue_protected = total_prevented * avg_loss_per_default
//   net_benefit       = revenue_protected - total_cost
//   roi_percentage    = net_benefit / total_cost * 100
//   per_dollar_yield  = revenue_protected / total_cost
//
// A tier with no customers contributes zero prevented and zero cost. When
// total_cost is 0 both ratios are reported as exactly 0; nothing throws.
// ---------------------------------------------------------------------------
class RoiSimulator {
public:
    explicit RoiSimulator(const InterventionEconomics& economics);

    RoiAnalysis simulate(const EnrichedDataset& ds) const;

    // Same model from per-tier (count, delinquent) pairs.
    struct TierPopulation {
        std::size_t count{0};
        std::size_t delinquent{0};
    };
    RoiAnalysis simulate(const std::array<TierPopulation, kTierCount>& populations) const;

private:
    InterventionEconomics econ_;
};

}
