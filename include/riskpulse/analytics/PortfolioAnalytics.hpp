#pragma once
#include <array>
#include <cstddef>

#include "riskpulse/core/Types.hpp"
#include "riskpulse/data/EnrichedDataset.hpp"

namespace riskpulse {

// Means of the six behavioral fields over a tier. All 0 for an empty tier.
struct FieldMeans {
    double utilisation_pct{0.0};
    double avg_payment_ratio{0.0};
    double min_due_paid_freq{0.0};
    double merchant_mix_index{0.0};
    double cash_withdrawal_pct{0.0};
    double spend_change_pct{0.0};
};

struct TierStats {
    RiskTier tier{RiskTier::LOW};
    std::size_t count{0};
    std::size_t delinquent{0};
    double percentage{0.0};          // share of all customers, 0..100
    double delinquency_rate{0.0};    // within tier, 0..100; 0 for empty tier
    FieldMeans means;
};

// Per-tier entries follow kTierOrder (HIGH, MEDIUM, LOW).
using TierBreakdown = std::array<TierStats, kTierCount>;

const TierStats& tier_stats(const TierBreakdown& tiers, RiskTier t);

struct PortfolioSummary {
    std::size_t total_customers{0};
    std::size_t total_delinquent{0};
    double delinquency_rate{0.0};    // 0..100
    TierBreakdown tiers{};
};

// ---------------------------------------------------------------------------
// Dense histogram: index i holds the number of customers with risk score i,
// for every i in 0..5 (zero where no customer has that score).
// ---------------------------------------------------------------------------
using ScoreHistogram = std::array<std::size_t, kSignalCount + 1>;

struct RiskDistribution {
    ScoreHistogram score_histogram{};
    TierBreakdown tiers{};
};

TierBreakdown compute_tier_breakdown(const EnrichedDataset& ds);
PortfolioSummary summarize_portfolio(const EnrichedDataset& ds);
RiskDistribution compute_risk_distribution(const EnrichedDataset& ds);

}
