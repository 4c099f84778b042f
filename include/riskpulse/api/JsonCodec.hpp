#pragma once
// =============================================================================
// JsonCodec.hpp - nlohmann::json mapping for API payloads
// =============================================================================
// Core results carry full-precision values; rounding happens only here.
//   percentages (tier/signal rates, prevalence)  1 place
//   portfolio delinquency rate, lift, yield      2 places
//   probability, confidence                      3 places
// =============================================================================

#include <nlohmann/json.hpp>
#include <string>

#include "riskpulse/analytics/PortfolioAnalytics.hpp"
#include "riskpulse/analytics/SignalEffectiveness.hpp"
#include "riskpulse/intervention/RoiSimulator.hpp"
#include "riskpulse/model/ProbabilityModel.hpp"
#include "riskpulse/runtime/RiskService.hpp"
#include "riskpulse/scoring/CustomerScorer.hpp"

namespace riskpulse {

double round_to(double v, int places);

void to_json(nlohmann::json& j, const PortfolioSummary& s);
void to_json(nlohmann::json& j, const SignalEffectiveness& e);
void to_json(nlohmann::json& j, const RiskDistribution& d);
void to_json(nlohmann::json& j, const TierStats& t);
void to_json(nlohmann::json& j, const RoiAnalysis& r);
void to_json(nlohmann::json& j, const CustomerScoreResult& r);
void to_json(nlohmann::json& j, const CustomerSummary& c);
void to_json(nlohmann::json& j, const FeatureImportance& f);
void to_json(nlohmann::json& j, const DashboardStats& d);
void to_json(nlohmann::json& j, const HealthReport& h);

// ---------------------------------------------------------------------------
// Decode a scoring request body into a validated ScoreRequest.
//
// Each continuous field is accepted under its dataset column name
// ("Utilisation %") or snake_case alias ("utilisation_pct") and must be a
// JSON number. signal_* flags are optional: bool, or number 0/1; null counts
// as not supplied. Anything else throws InvalidCustomerData.
// ---------------------------------------------------------------------------
ScoreRequest parse_score_request(const nlohmann::json& body);

nlohmann::json error_body(const std::string& kind, const std::string& detail);

}
