#include "riskpulse/runtime/RiskService.hpp"
#include "riskpulse/core/Errors.hpp"
#include <algorithm>

using namespace riskpulse;

RiskService::RiskService(ServiceState state)
    : state_(std::move(state)) {}

bool RiskService::ready() const {
    return std::holds_alternative<Ready>(state_);
}

const RiskContext& RiskService::require_ready() const {
    if (const auto* nr = std::get_if<NotReady>(&state_)) {
        throw DataUnavailable("risk service not available: " + nr->reason);
    }
    const auto& r = std::get<Ready>(state_);
    if (!r.ctx) {
        throw DataUnavailable("risk service not available: empty context");
    }
    return *r.ctx;
}

HealthReport RiskService::health() const {
    HealthReport h;
    if (const auto* nr = std::get_if<NotReady>(&state_)) {
        h.reason = nr->reason;
        return h;
    }
    const auto& ctx = std::get<Ready>(state_).ctx;
    h.data_loaded   = ctx != nullptr;
    h.model_trained = ctx && ctx->model().ready();
    h.model_source  = ctx ? ctx->model_source() : "none";
    return h;
}

PortfolioSummary RiskService::get_portfolio_summary() const {
    return summarize_portfolio(require_ready().dataset());
}

std::vector<SignalEffectiveness> RiskService::get_signal_effectiveness() const {
    return compute_signal_effectiveness(require_ready().dataset());
}

RiskDistribution RiskService::get_risk_distribution() const {
    return compute_risk_distribution(require_ready().dataset());
}

CustomerScoreResult RiskService::score_customer(const ScoreRequest& req) const {
    return require_ready().scorer().score(req);
}

std::vector<CustomerSummary> RiskService::get_customers(std::optional<RiskTier> tier, int limit) const {
    if (limit < 1) {
        throw InvalidCustomerData("limit must be >= 1");
    }
    const auto& ds = require_ready().dataset();
    const size_t cap = static_cast<size_t>(std::min(limit, kMaxCustomerLimit));

    std::vector<CustomerSummary> out;
    for (const auto& row : ds) {
        if (out.size() >= cap) break;
        if (tier && row.tier != *tier) continue;

        CustomerSummary c;
        c.customer_id   = row.raw.customer_id;
        c.tier          = row.tier;
        c.risk_score    = row.risk_score;
        c.utilization   = row.raw.behavior.utilisation_pct;
        c.payment_ratio = row.raw.behavior.avg_payment_ratio;
        c.spend_change  = row.raw.behavior.spend_change_pct;
        c.is_delinquent = row.is_delinquent;
        c.credit_limit  = row.raw.credit_limit;
        out.push_back(std::move(c));
    }
    return out;
}

RoiAnalysis RiskService::calculate_roi() const {
    const auto& ctx = require_ready();
    return RoiSimulator(ctx.config().economics).simulate(ctx.dataset());
}

std::vector<FeatureImportance> RiskService::get_top_features(int n) const {
    if (n < 1) {
        throw InvalidCustomerData("top must be >= 1");
    }
    return require_ready().model().top_features(static_cast<size_t>(n));
}

DashboardStats RiskService::get_dashboard_stats() const {
    DashboardStats out;
    out.portfolio   = get_portfolio_summary();
    out.roi         = calculate_roi();
    out.top_signals = get_signal_effectiveness();
    if (out.top_signals.size() > kDashboardTopSignals) {
        out.top_signals.resize(kDashboardTopSignals);
    }
    return out;
}
