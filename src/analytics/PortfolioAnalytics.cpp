#include "riskpulse/analytics/PortfolioAnalytics.hpp"

using namespace riskpulse;

namespace {

std::size_t tier_slot(RiskTier t) {
    for (std::size_t i = 0; i < kTierOrder.size(); ++i) {
        if (kTierOrder[i] == t) return i;
    }
    return kTierOrder.size() - 1;
}

double pct(std::size_t num, std::size_t den) {
    return den > 0 ? static_cast<double>(num) / static_cast<double>(den) * 100.0 : 0.0;
}

}

namespace riskpulse {

const TierStats& tier_stats(const TierBreakdown& tiers, RiskTier t) {
    return tiers[tier_slot(t)];
}

TierBreakdown compute_tier_breakdown(const EnrichedDataset& ds) {
    TierBreakdown out{};
    std::array<FieldMeans, kTierCount> sums{};

    for (std::size_t i = 0; i < kTierOrder.size(); ++i) {
        out[i].tier = kTierOrder[i];
    }

    for (const auto& row : ds) {
        const std::size_t slot = tier_slot(row.tier);
        auto& ts = out[slot];
        ++ts.count;
        if (row.is_delinquent) ++ts.delinquent;

        const auto& b = row.raw.behavior;
        auto& s = sums[slot];
        s.utilisation_pct     += b.utilisation_pct;
        s.avg_payment_ratio   += b.avg_payment_ratio;
        s.min_due_paid_freq   += b.min_due_paid_freq;
        s.merchant_mix_index  += b.merchant_mix_index;
        s.cash_withdrawal_pct += b.cash_withdrawal_pct;
        s.spend_change_pct    += b.spend_change_pct;
    }

    for (std::size_t i = 0; i < kTierCount; ++i) {
        auto& ts = out[i];
        ts.percentage       = pct(ts.count, ds.size());
        ts.delinquency_rate = pct(ts.delinquent, ts.count);
        if (ts.count == 0) continue;

        const double n = static_cast<double>(ts.count);
        const auto& s = sums[i];
        ts.means.utilisation_pct     = s.utilisation_pct / n;
        ts.means.avg_payment_ratio   = s.avg_payment_ratio / n;
        ts.means.min_due_paid_freq   = s.min_due_paid_freq / n;
        ts.means.merchant_mix_index  = s.merchant_mix_index / n;
        ts.means.cash_withdrawal_pct = s.cash_withdrawal_pct / n;
        ts.means.spend_change_pct    = s.spend_change_pct / n;
    }
    return out;
}

PortfolioSummary summarize_portfolio(const EnrichedDataset& ds) {
    PortfolioSummary out;
    out.total_customers = ds.size();
    for (const auto& row : ds) {
        if (row.is_delinquent) ++out.total_delinquent;
    }
    out.delinquency_rate = pct(out.total_delinquent, out.total_customers);
    out.tiers = compute_tier_breakdown(ds);
    return out;
}

RiskDistribution compute_risk_distribution(const EnrichedDataset& ds) {
    RiskDistribution out;
    for (const auto& row : ds) {
        // Score is a signal count, so always within 0..kSignalCount.
        out.score_histogram[static_cast<std::size_t>(row.risk_score)] += 1;
    }
    out.tiers = compute_tier_breakdown(ds);
    return out;
}

}
