#pragma once
// =============================================================================
// ApiRouter.hpp - transport-neutral request dispatch
// =============================================================================
// Maps (method, target, body) onto RiskService calls and encodes the result.
// HttpServer owns the socket; tests drive handle() directly.
//
//   GET  /health                         liveness + readiness report
//   GET  /metrics                        Prometheus text
//   GET  {prefix}/portfolio-summary
//   GET  {prefix}/signals
//   GET  {prefix}/risk-distribution
//   POST {prefix}/score-customer
//   GET  {prefix}/customers?tier=&limit=
//   GET  {prefix}/intervention-roi
//   GET  {prefix}/feature-importance?top=
//   GET  {prefix}/dashboard-stats
//
// Errors: 400 bad input, 404 unknown path, 405 wrong method,
// 503 data/model unavailable, 500 anything else.
// Error body: {"error": <kind>, "detail": <message>}
// =============================================================================

#include <string>
#include <string_view>
#include <unordered_map>

#include "riskpulse/runtime/RiskService.hpp"
#include "riskpulse/telemetry/TelemetryState.hpp"

namespace riskpulse {

struct ApiRequest {
    std::string method;   // "GET", "POST", ...
    std::string target;   // path plus optional query string
    std::string body;
};

struct ApiResponse {
    unsigned status{200};
    std::string content_type{"application/json"};
    std::string body;
};

using QueryParams = std::unordered_map<std::string, std::string>;

class ApiRouter {
public:
    ApiRouter(const RiskService& service, TelemetryState& telemetry, std::string api_prefix);

    ApiResponse handle(const ApiRequest& req) const;

    static QueryParams parse_query(std::string_view query);
    static std::string url_decode(std::string_view in);

private:
    ApiResponse dispatch(const std::string& method, const std::string& path,
                         const QueryParams& query, const std::string& body,
                         std::string& route) const;

    const RiskService& service_;
    TelemetryState& telemetry_;
    std::string prefix_;
};

}
