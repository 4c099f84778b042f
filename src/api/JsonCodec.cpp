#include "riskpulse/api/JsonCodec.hpp"
#include "riskpulse/core/Errors.hpp"
#include <cmath>

using json = nlohmann::json;

namespace {

const char* tier_key(riskpulse::RiskTier t) {
    switch (t) {
        case riskpulse::RiskTier::HIGH:   return "high_tier";
        case riskpulse::RiskTier::MEDIUM: return "medium_tier";
        case riskpulse::RiskTier::LOW:    return "low_tier";
    }
    return "low_tier";
}

const char* tier_risk_key(riskpulse::RiskTier t) {
    switch (t) {
        case riskpulse::RiskTier::HIGH:   return "high_risk";
        case riskpulse::RiskTier::MEDIUM: return "medium_risk";
        case riskpulse::RiskTier::LOW:    return "low_risk";
    }
    return "low_risk";
}

struct FieldAlias {
    const char* column;
    const char* alias;
    double riskpulse::BehaviorFields::*member;
};

const FieldAlias kFieldAliases[] = {
    {"Utilisation %",          "utilisation_pct",         &riskpulse::BehaviorFields::utilisation_pct},
    {"Avg Payment Ratio",      "avg_payment_ratio",       &riskpulse::BehaviorFields::avg_payment_ratio},
    {"Min Due Paid Frequency", "min_due_paid_frequency",  &riskpulse::BehaviorFields::min_due_paid_freq},
    {"Merchant Mix Index",     "merchant_mix_index",      &riskpulse::BehaviorFields::merchant_mix_index},
    {"Cash Withdrawal %",      "cash_withdrawal_pct",     &riskpulse::BehaviorFields::cash_withdrawal_pct},
    {"Recent Spend Change %",  "recent_spend_change_pct", &riskpulse::BehaviorFields::spend_change_pct},
};

}

namespace riskpulse {

double round_to(double v, int places) {
    const double scale = std::pow(10.0, places);
    return std::round(v * scale) / scale;
}

void to_json(json& j, const PortfolioSummary& s) {
    j = json{
        {"total_customers", s.total_customers},
        {"total_delinquent", s.total_delinquent},
        {"delinquency_rate", round_to(s.delinquency_rate, 2)},
    };
    json breakdown = json::object();
    for (const auto& t : s.tiers) {
        breakdown[tierToStr(t.tier)] = t.count;
        j[tier_risk_key(t.tier)] = json{
            {"count", t.count},
            {"delinquency_rate", round_to(t.delinquency_rate, 1)},
        };
    }
    j["tier_breakdown"] = breakdown;
}

void to_json(json& j, const SignalEffectiveness& e) {
    j = json{
        {"name", signalTitle(e.signal)},
        {"code", signalCode(e.signal)},
        {"prevalence", e.prevalence},
        {"prevalence_pct", round_to(e.prevalence_pct, 1)},
        {"delinquency_rate_when_present", round_to(e.delinquency_rate_when_present, 1)},
        {"delinquency_rate_when_absent", round_to(e.delinquency_rate_when_absent, 1)},
        {"risk_lift", round_to(e.risk_lift, 2)},
    };
}

void to_json(json& j, const TierStats& t) {
    j = json{
        {"tier", tierToStr(t.tier)},
        {"count", t.count},
        {"percentage", round_to(t.percentage, 1)},
        {"delinquency_rate", round_to(t.delinquency_rate, 1)},
        {"avg_utilization", round_to(t.means.utilisation_pct, 1)},
        {"avg_payment_ratio", round_to(t.means.avg_payment_ratio, 1)},
        {"avg_min_due_freq", round_to(t.means.min_due_paid_freq, 1)},
        {"avg_merchant_mix", round_to(t.means.merchant_mix_index, 2)},
        {"avg_cash_withdrawal", round_to(t.means.cash_withdrawal_pct, 1)},
        {"avg_spend_change", round_to(t.means.spend_change_pct, 1)},
    };
}

void to_json(json& j, const RiskDistribution& d) {
    json hist = json::object();
    for (size_t score = 0; score < d.score_histogram.size(); ++score) {
        hist[std::to_string(score)] = d.score_histogram[score];
    }
    json tiers = json::array();
    for (const auto& t : d.tiers) tiers.push_back(t);

    j = json{
        {"risk_score_distribution", hist},
        {"tier_distribution", tiers},
    };
}

void to_json(json& j, const RoiAnalysis& r) {
    json cost = json::object();
    json prevented = json::object();
    json tiers = json::array();
    for (const auto& t : r.tiers) {
        cost[tier_key(t.tier)] = t.cost;
        prevented[tier_key(t.tier)] = round_to(t.prevented, 1);
        tiers.push_back(json{
            {"tier", tierToStr(t.tier)},
            {"count", t.count},
            {"delinquency_rate", round_to(t.delinquency_rate * 100.0, 1)},
            {"prevention_rate", t.prevention_rate},
            {"unit_cost", t.unit_cost},
            {"prevented", round_to(t.prevented, 1)},
            {"cost", t.cost},
        });
    }
    cost["total"] = r.total_cost;

    j = json{
        {"program_cost", cost},
        {"prevented_defaults", round_to(r.total_prevented, 1)},
        {"prevented_by_tier", prevented},
        {"revenue_protected", r.revenue_protected},
        {"net_benefit", r.net_benefit},
        {"roi_percentage", round_to(r.roi_percentage, 1)},
        {"per_dollar_yield", round_to(r.per_dollar_yield, 2)},
        {"tiers", tiers},
    };
}

void to_json(json& j, const CustomerScoreResult& r) {
    json overridden = json::array();
    for (SignalId id : r.overridden_signals) overridden.push_back(signalCode(id));

    j = json{
        {"customer_id", r.customer_id},
        {"risk_score", r.risk_score},
        {"risk_tier", tierToStr(r.tier)},
        {"triggered_signals", r.triggered_signals},
        {"recommendations", r.recommendations},
        {"overridden_signals", overridden},
    };

    if (r.delinquency_probability && r.confidence) {
        j["delinquency_probability"] = round_to(*r.delinquency_probability, 3);
        j["confidence"] = round_to(*r.confidence, 3);
        j["probability_status"] = "available";
    } else {
        j["delinquency_probability"] = nullptr;
        j["confidence"] = nullptr;
        j["probability_status"] = "unavailable";
        j["probability_unavailable_reason"] = r.probability_unavailable_reason;
    }
}

void to_json(json& j, const CustomerSummary& c) {
    j = json{
        {"customer_id", c.customer_id},
        {"risk_tier", tierToStr(c.tier)},
        {"risk_score", c.risk_score},
        {"utilization", round_to(c.utilization, 1)},
        {"payment_ratio", round_to(c.payment_ratio, 1)},
        {"spend_change", round_to(c.spend_change, 1)},
        {"is_delinquent", c.is_delinquent},
        {"credit_limit", static_cast<long long>(c.credit_limit)},
    };
}

void to_json(json& j, const FeatureImportance& f) {
    j = json{
        {"feature", f.feature},
        {"importance", f.importance},
    };
}

void to_json(json& j, const DashboardStats& d) {
    j = json{
        {"portfolio", d.portfolio},
        {"roi", d.roi},
        {"top_signals", d.top_signals},
    };
}

void to_json(json& j, const HealthReport& h) {
    j = json{
        {"status", h.data_loaded ? "healthy" : "degraded"},
        {"data_loaded", h.data_loaded},
        {"model_trained", h.model_trained},
        {"model_source", h.model_source},
    };
    if (!h.data_loaded) j["reason"] = h.reason;
}

ScoreRequest parse_score_request(const json& body) {
    if (!body.is_object()) {
        throw InvalidCustomerData("request body must be a JSON object");
    }

    ScoreRequest req;

    auto id = body.find("customer_id");
    if (id != body.end() && !id->is_null()) {
        if (id->is_string()) {
            req.customer_id = id->get<std::string>();
        } else if (id->is_number()) {
            req.customer_id = id->dump();
        } else {
            throw InvalidCustomerData("customer_id must be a string");
        }
    }

    for (const auto& f : kFieldAliases) {
        auto it = body.find(f.column);
        if (it == body.end() || it->is_null()) it = body.find(f.alias);
        if (it == body.end() || it->is_null()) {
            throw InvalidCustomerData(std::string("missing required field '") + f.column + "'");
        }
        if (!it->is_number()) {
            throw InvalidCustomerData(std::string("field '") + f.column + "' must be numeric");
        }
        const double v = it->get<double>();
        if (!std::isfinite(v)) {
            throw InvalidCustomerData(std::string("field '") + f.column + "' must be finite");
        }
        req.fields.*(f.member) = v;
    }

    for (SignalId sid : kAllSignals) {
        auto it = body.find(signalCode(sid));
        if (it == body.end() || it->is_null()) continue;

        auto& slot = req.supplied_signals[static_cast<size_t>(sid)];
        if (it->is_boolean()) {
            slot = it->get<bool>();
        } else if (it->is_number()) {
            const double v = it->get<double>();
            if (v != 0.0 && v != 1.0) {
                throw InvalidCustomerData(std::string(signalCode(sid)) + " must be 0 or 1");
            }
            slot = (v == 1.0);
        } else {
            throw InvalidCustomerData(std::string(signalCode(sid)) + " must be a boolean or 0/1");
        }
    }
    return req;
}

json error_body(const std::string& kind, const std::string& detail) {
    return json{
        {"error", kind},
        {"detail", detail},
    };
}

}
