#include "riskpulse/intervention/RoiSimulator.hpp"

using namespace riskpulse;

const TierRoi& RoiAnalysis::tier(RiskTier t) const {
    for (const auto& tr : tiers) {
        if (tr.tier == t) return tr;
    }
    return tiers.back();
}

RoiSimulator::RoiSimulator(const InterventionEconomics& economics)
    : econ_(economics) {
    econ_.validate_or_throw();
}

RoiAnalysis RoiSimulator::simulate(const EnrichedDataset& ds) const {
    std::array<TierPopulation, kTierCount> pops{};
    for (const auto& row : ds) {
        for (std::size_t i = 0; i < kTierOrder.size(); ++i) {
            if (kTierOrder[i] != row.tier) continue;
            ++pops[i].count;
            if (row.is_delinquent) ++pops[i].delinquent;
            break;
        }
    }
    return simulate(pops);
}

RoiAnalysis RoiSimulator::simulate(const std::array<TierPopulation, kTierCount>& populations) const {
    RoiAnalysis out;

    for (std::size_t i = 0; i < kTierOrder.size(); ++i) {
        const RiskTier t = kTierOrder[i];
        const auto& econ = econ_.for_tier(t);
        const auto& pop = populations[i];

        TierRoi& tr = out.tiers[i];
        tr.tier            = t;
        tr.count           = pop.count;
        tr.prevention_rate = econ.prevention_rate;
        tr.unit_cost       = econ.unit_cost;
        tr.delinquency_rate = pop.count > 0
            ? static_cast<double>(pop.delinquent) / static_cast<double>(pop.count)
            : 0.0;

        const double n = static_cast<double>(pop.count);
        tr.prevented = n * econ.prevention_rate * tr.delinquency_rate;
        tr.cost      = n * econ.unit_cost;

        out.total_prevented += tr.prevented;
        out.total_cost      += tr.cost;
    }

    out.revenue_protected = out.total_prevented * econ_.avg_loss_per_default;
    out.net_benefit       = out.revenue_protected - out.total_cost;

    if (out.total_cost > 0.0) {
        out.roi_percentage   = out.net_benefit / out.total_cost * 100.0;
        out.per_dollar_yield = out.revenue_protected / out.total_cost;
    }
    return out;
}
