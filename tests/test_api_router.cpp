// =============================================================================
// test_api_router.cpp - request dispatch, JSON payloads, status mapping
// =============================================================================

#include <nlohmann/json.hpp>

#include "AnalyticsFixture.hpp"
#include "riskpulse/api/ApiRouter.hpp"
#include "riskpulse/api/JsonCodec.hpp"
#include "riskpulse/runtime/Bootstrap.hpp"

using namespace riskpulse;
using namespace riskpulse::test;
using json = nlohmann::json;

namespace {

class FixedModel : public ProbabilityModel {
public:
    explicit FixedModel(double p) : p_(p) {}
    double probability(const FeatureVector&) const override { return p_; }
    std::vector<FeatureImportance> feature_importances() const override {
        std::array<double, kFeatureCount> raw{};
        raw[4] = 0.7;
        raw[0] = 0.3;
        return rank_importances(raw);
    }
    std::string name() const override { return "fixed"; }
private:
    double p_;
};

std::vector<CustomerRecord> many_low_records(std::size_t n) {
    std::vector<CustomerRecord> out;
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(make_record("Q" + std::to_string(i), quiet_fields(), 0));
    }
    return out;
}

const char* kScoreBody = R"({
    "customer_id": "NEW-1",
    "Utilisation %": 85, "Avg Payment Ratio": 35, "Min Due Paid Frequency": 10,
    "Merchant Mix Index": 0.2, "Cash Withdrawal %": 20, "Recent Spend Change %": -15
})";

}

class ApiRouterTest : public TestSuite {
public:
    ApiRouterTest()
        : TestSuite("API ROUTER - UNIT TESTS"),
          ready_(bootstrap_from_records(RiskConfig{}, portfolio_records(),
                                        std::make_shared<FixedModel>(0.8), "test")),
          no_model_(bootstrap_from_records(RiskConfig{}, portfolio_records(), nullptr, "none")),
          not_ready_(NotReady{"data_unavailable: data file not found at /x.csv"}),
          router_(ready_, telemetry_, "/api/v1"),
          no_model_router_(no_model_, telemetry_, "/api/v1"),
          not_ready_router_(not_ready_, telemetry_, "/api/v1") {}

    void run_all_tests() {
        print_banner();
        test_query_parsing();
        test_health();
        test_portfolio_endpoints();
        test_customers();
        test_score_customer();
        test_score_errors();
        test_feature_importance();
        test_not_ready();
        test_routing_errors();
        test_metrics();
        print_summary();
    }

private:
    TelemetryState telemetry_;
    RiskService ready_;
    RiskService no_model_;
    RiskService not_ready_;
    ApiRouter router_;
    ApiRouter no_model_router_;
    ApiRouter not_ready_router_;

    static ApiResponse get(const ApiRouter& r, const std::string& target) {
        return r.handle({"GET", target, ""});
    }

    static ApiResponse post(const ApiRouter& r, const std::string& target, const std::string& body) {
        return r.handle({"POST", target, body});
    }

    void test_query_parsing() {
        section("Query Parsing");
        QueryParams q = ApiRouter::parse_query("tier=HIGH&limit=5&name=a%20b+c&flag");
        check(q["tier"] == "HIGH", "Plain value");
        check(q["limit"] == "5", "Second pair");
        check(q["name"] == "a b c", "Percent and plus decoding");
        check(q.count("flag") == 1 && q["flag"].empty(), "Key without value");
        check(ApiRouter::url_decode("100%") == "100%", "Dangling percent kept");
    }

    void test_health() {
        section("Health");
        ApiResponse res = get(router_, "/health");
        json body = json::parse(res.body);
        check(res.status == 200, "200 OK");
        check(body["data_loaded"] == true && body["model_trained"] == true, "Data and model reported");
        check(body["model_source"] == "test", "Model source reported");

        ApiResponse down = get(not_ready_router_, "/health");
        json d = json::parse(down.body);
        check(down.status == 200, "Health answers even when not ready");
        check(d["data_loaded"] == false && d["status"] == "degraded", "Degraded status");
        check(d["reason"].get<std::string>().find("not found") != std::string::npos, "Reason surfaced");
    }

    void test_portfolio_endpoints() {
        section("Portfolio Endpoints");
        json summary = json::parse(get(router_, "/api/v1/portfolio-summary").body);
        check(summary["total_customers"] == 5, "Total customers");
        check(summary["delinquency_rate"] == 40.0, "Delinquency rate");
        check(summary["tier_breakdown"]["HIGH"] == 2, "Tier breakdown");
        check(summary["high_risk"]["delinquency_rate"] == 50.0, "High tier rate");

        json signals = json::parse(get(router_, "/api/v1/signals").body);
        check(signals["signals"].size() == kSignalCount, "Five signal entries");
        check(signals["signals"][0]["risk_lift"] == 1.5, "Lift rounded to 2 places");
        check(signals["signals"][0]["delinquency_rate_when_absent"] == 33.3, "Rate rounded to 1 place");

        json dist = json::parse(get(router_, "/api/v1/risk-distribution").body);
        check(dist["risk_score_distribution"].size() == 6, "Histogram has six buckets");
        check(dist["risk_score_distribution"]["1"] == 0, "Empty bucket reported as 0");
        check(dist["tier_distribution"][0]["tier"] == "HIGH", "Tiers listed HIGH first");

        json roi = json::parse(get(router_, "/api/v1/intervention-roi").body);
        check(roi["program_cost"]["total"] == 48.5, "Program cost total");
        check(roi["prevented_defaults"] == 0.7, "Prevented rounded to 1 place");
        check(roi["tiers"].size() == kTierCount, "Per-tier detail");

        json dash = json::parse(get(router_, "/api/v1/dashboard-stats").body);
        check(dash["top_signals"].size() == 3, "Dashboard keeps top three signals");
        check(dash["portfolio"]["total_customers"] == 5, "Dashboard embeds portfolio");
    }

    void test_customers() {
        section("Customer Listing");
        json all = json::parse(get(router_, "/api/v1/customers").body);
        check(all["count"] == 5, "All customers under default limit");
        check(all["customers"][0]["customer_id"] == "H1", "Dataset order kept");

        json high = json::parse(get(router_, "/api/v1/customers?tier=high&limit=1").body);
        check(high["count"] == 1 && high["customers"][0]["risk_tier"] == "HIGH", "Tier filter and limit");

        RiskService big(bootstrap_from_records(RiskConfig{}, many_low_records(150), nullptr, "none"));
        ApiRouter big_router(big, telemetry_, "/api/v1");
        json capped = json::parse(get(big_router, "/api/v1/customers?limit=150").body);
        check(capped["count"] == RiskService::kMaxCustomerLimit, "Limit 150 capped to 100");
        json dflt = json::parse(get(big_router, "/api/v1/customers").body);
        check(dflt["count"] == RiskService::kDefaultCustomerLimit, "Default limit 20");

        check(get(router_, "/api/v1/customers?limit=0").status == 400, "Limit 0 rejected");
        check(get(router_, "/api/v1/customers?limit=abc").status == 400, "Non-numeric limit rejected");
        check(get(router_, "/api/v1/customers?tier=EXTREME").status == 400, "Unknown tier rejected");
    }

    void test_score_customer() {
        section("Score Customer");
        ApiResponse res = post(router_, "/api/v1/score-customer", kScoreBody);
        json body = json::parse(res.body);
        check(res.status == 200, "200 OK");
        check(body["customer_id"] == "NEW-1", "Customer id echoed");
        check(body["risk_score"] == 5 && body["risk_tier"] == "HIGH", "Score 5, tier HIGH");
        check(body["delinquency_probability"] == 0.8, "Model probability");
        check(body["confidence"] == 0.6, "Confidence rounded");
        check(body["probability_status"] == "available", "Probability available");

        json aliased = {
            {"utilisation_pct", 30}, {"avg_payment_ratio", 90}, {"min_due_paid_frequency", 80},
            {"merchant_mix_index", 0.8}, {"cash_withdrawal_pct", 2}, {"recent_spend_change_pct", 5},
            {"signal_cash_surge", 1}, {"signal_payment_decline", true},
        };
        json ab = json::parse(post(router_, "/api/v1/score-customer", aliased.dump()).body);
        check(ab["customer_id"] == "UNKNOWN", "Missing id defaults to UNKNOWN");
        check(ab["risk_tier"] == "MEDIUM", "Snake-case fields with supplied flags");
        check(ab["overridden_signals"].size() == 2, "Overrides listed");

        json nm = json::parse(post(no_model_router_, "/api/v1/score-customer", kScoreBody).body);
        check(nm["risk_tier"] == "HIGH", "Tier without model");
        check(nm["delinquency_probability"].is_null(), "Probability null without model");
        check(nm["probability_status"] == "unavailable", "Status unavailable");
    }

    void test_score_errors() {
        section("Score Errors");
        check(post(router_, "/api/v1/score-customer", "{not json").status == 400, "Malformed JSON is 400");
        check(post(router_, "/api/v1/score-customer", "[1,2]").status == 400, "Non-object body is 400");

        json missing = json::parse(kScoreBody);
        missing.erase("Merchant Mix Index");
        ApiResponse r = post(router_, "/api/v1/score-customer", missing.dump());
        json body = json::parse(r.body);
        check(r.status == 400, "Missing field is 400");
        check(body["error"] == "invalid_customer_data", "Error kind");
        check(body["detail"].get<std::string>().find("Merchant Mix Index") != std::string::npos,
              "Detail names the field");

        json wrong = json::parse(kScoreBody);
        wrong["Utilisation %"] = "85";
        check(post(router_, "/api/v1/score-customer", wrong.dump()).status == 400, "String number is 400");

        json bad_flag = json::parse(kScoreBody);
        bad_flag["signal_cash_surge"] = 2;
        check(post(router_, "/api/v1/score-customer", bad_flag.dump()).status == 400, "Flag outside 0/1 is 400");

        check(get(router_, "/api/v1/score-customer").status == 405, "GET on scoring is 405");
    }

    void test_feature_importance() {
        section("Feature Importance");
        json fi = json::parse(get(router_, "/api/v1/feature-importance?top=2").body);
        check(fi["top_features"].size() == 2, "top=2 honored");
        check(fi["top_features"][0]["feature"] == "Cash Withdrawal %", "Ranked by importance");

        check(get(no_model_router_, "/api/v1/feature-importance").status == 503, "No model is 503");
        check(get(router_, "/api/v1/feature-importance?top=0").status == 400, "top=0 is 400");
    }

    void test_not_ready() {
        section("Service Not Ready");
        const char* endpoints[] = {
            "/api/v1/portfolio-summary", "/api/v1/signals", "/api/v1/risk-distribution",
            "/api/v1/customers", "/api/v1/intervention-roi", "/api/v1/dashboard-stats",
        };
        bool all_503 = true;
        for (const char* ep : endpoints) {
            if (get(not_ready_router_, ep).status != 503) all_503 = false;
        }
        check(all_503, "Dataset endpoints answer 503");

        ApiResponse score = post(not_ready_router_, "/api/v1/score-customer", kScoreBody);
        check(score.status == 503, "Scoring answers 503");
        check(json::parse(score.body)["error"] == "data_unavailable", "Error kind data_unavailable");
    }

    void test_routing_errors() {
        section("Routing Errors");
        check(get(router_, "/api/v1/unknown").status == 404, "Unknown endpoint 404");
        check(get(router_, "/elsewhere").status == 404, "Outside prefix 404");
        check(post(router_, "/api/v1/signals", "").status == 405, "POST on GET route 405");
        check(get(router_, "/api/v1/signals/").status == 200, "Trailing slash tolerated");

        ApiRouter root(ready_, telemetry_, "/");
        check(get(root, "/signals").status == 200, "Root prefix serves bare paths");
    }

    void test_metrics() {
        section("Metrics");
        const uint64_t before = telemetry_.requests_total();
        get(router_, "/api/v1/signals");
        check(telemetry_.requests_total() == before + 1, "Request counted");
        check(telemetry_.route_hits("/signals") > 0, "Route hits tracked");
        check(telemetry_.score_requests() > 0, "Scoring requests counted");
        check(telemetry_.probability_unavailable() > 0, "Unavailable probabilities counted");
        check(telemetry_.responses_2xx() > 0, "2xx responses counted");
        check(telemetry_.responses_4xx() > 0 && telemetry_.responses_5xx() > 0, "Status classes counted");

        ApiResponse m = get(router_, "/metrics");
        check(m.status == 200, "Metrics 200");
        check(m.content_type.rfind("text/plain", 0) == 0, "Prometheus content type");
        check(m.body.find("riskpulse_requests_total") != std::string::npos, "Request counter exported");

        ApiResponse t = get(router_, "/telemetry");
        check(t.status == 200 && t.content_type == "application/json", "Telemetry snapshot 200 JSON");
        // The snapshot is taken before its own response is counted
        json snap = json::parse(t.body);
        check(snap["requests_total"].get<uint64_t>() + 1 == telemetry_.requests_total(), "Snapshot request total");
        check(snap["responses_2xx"].get<uint64_t>() + 1 == telemetry_.responses_2xx(), "Snapshot 2xx count");
        check(snap["routes"]["/signals"].get<uint64_t>() == telemetry_.route_hits("/signals"), "Snapshot route hits");
        check(post(router_, "/telemetry", "").status == 405, "Telemetry rejects POST");
    }
};

int main() {
    ApiRouterTest tester;
    tester.run_all_tests();
    return tester.exit_code();
}
