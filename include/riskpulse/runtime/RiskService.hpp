#pragma once
#include <optional>
#include <string>
#include <vector>

#include "riskpulse/analytics/PortfolioAnalytics.hpp"
#include "riskpulse/analytics/SignalEffectiveness.hpp"
#include "riskpulse/intervention/RoiSimulator.hpp"
#include "riskpulse/runtime/ServiceState.hpp"
#include "riskpulse/scoring/CustomerScorer.hpp"

namespace riskpulse {

struct CustomerSummary {
    std::string customer_id;
    RiskTier tier{RiskTier::LOW};
    int risk_score{0};
    double utilization{0.0};
    double payment_ratio{0.0};
    double spend_change{0.0};
    bool is_delinquent{false};
    double credit_limit{0.0};
};

struct DashboardStats {
    PortfolioSummary portfolio;
    RoiAnalysis roi;
    std::vector<SignalEffectiveness> top_signals;   // at most 3
};

struct HealthReport {
    bool data_loaded{false};
    bool model_trained{false};
    std::string model_source{"none"};
    std::string reason;   // set when data is not loaded
};

// ---------------------------------------------------------------------------
// Operations exposed to the transport layer.
//
// Readiness is checked here, once per call, against the ServiceState
// variant. Dataset-backed calls on a NotReady service throw DataUnavailable;
// bad caller input throws InvalidCustomerData. Nothing here mutates the
// context, so one RiskService is shared by every request handler.
// Aggregates are recomputed per call from the immutable dataset.
// ---------------------------------------------------------------------------
class RiskService {
public:
    static constexpr int kDefaultCustomerLimit = 20;
    static constexpr int kMaxCustomerLimit = 100;
    static constexpr int kDefaultTopFeatures = 10;
    static constexpr std::size_t kDashboardTopSignals = 3;

    explicit RiskService(ServiceState state);

    bool ready() const;
    HealthReport health() const;

    PortfolioSummary get_portfolio_summary() const;
    std::vector<SignalEffectiveness> get_signal_effectiveness() const;
    RiskDistribution get_risk_distribution() const;
    CustomerScoreResult score_customer(const ScoreRequest& req) const;

    // limit is capped at kMaxCustomerLimit; limit < 1 is rejected.
    std::vector<CustomerSummary> get_customers(std::optional<RiskTier> tier, int limit) const;

    RoiAnalysis calculate_roi() const;

    // n < 1 rejected; throws ModelNotReady without a model.
    std::vector<FeatureImportance> get_top_features(int n) const;

    DashboardStats get_dashboard_stats() const;

private:
    const RiskContext& require_ready() const;

    ServiceState state_;
};

}
