#include "riskpulse/api/ApiRouter.hpp"
#include "riskpulse/api/JsonCodec.hpp"
#include "riskpulse/core/Errors.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

using namespace riskpulse;
using json = nlohmann::json;

namespace {

ApiResponse json_response(unsigned status, const json& body) {
    ApiResponse res;
    res.status = status;
    res.body = body.dump();
    return res;
}

ApiResponse error_response(unsigned status, const std::string& kind, const std::string& detail) {
    return json_response(status, error_body(kind, detail));
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int int_param(const QueryParams& q, const char* name, int defaultVal) {
    auto it = q.find(name);
    if (it == q.end() || it->second.empty()) return defaultVal;
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(it->second, &used);
    } catch (const std::exception&) {
        throw InvalidCustomerData(std::string("query parameter '") + name + "' must be an integer");
    }
    if (used != it->second.size()) {
        throw InvalidCustomerData(std::string("query parameter '") + name + "' must be an integer");
    }
    return v;
}

}

ApiRouter::ApiRouter(const RiskService& service, TelemetryState& telemetry, std::string api_prefix)
    : service_(service), telemetry_(telemetry), prefix_(std::move(api_prefix)) {
    if (prefix_ == "/") prefix_.clear();
}

std::string ApiRouter::url_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
            } else {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
            }
        } else {
            out.push_back(c);
        }
    }
    return out;
}

QueryParams ApiRouter::parse_query(std::string_view query) {
    QueryParams out;
    while (!query.empty()) {
        size_t amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string_view::npos) {
                out[url_decode(pair)] = "";
            } else {
                out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return out;
}

ApiResponse ApiRouter::handle(const ApiRequest& req) const {
    std::string path = req.target;
    QueryParams query;
    size_t qpos = path.find('?');
    if (qpos != std::string::npos) {
        query = parse_query(std::string_view(path).substr(qpos + 1));
        path.erase(qpos);
    }
    if (path.size() > 1 && path.back() == '/') path.pop_back();

    std::string route = "unmatched";
    ApiResponse res;
    try {
        res = dispatch(req.method, path, query, req.body, route);
    } catch (const json::parse_error& e) {
        res = error_response(400, "invalid_json", e.what());
    } catch (const InvalidCustomerData& e) {
        res = error_response(400, e.kind(), e.what());
    } catch (const MalformedRecord& e) {
        res = error_response(400, e.kind(), e.what());
    } catch (const DataUnavailable& e) {
        res = error_response(503, e.kind(), e.what());
    } catch (const ModelNotReady& e) {
        res = error_response(503, e.kind(), e.what());
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] " << req.method << " " << path << " failed: " << e.what() << "\n";
        res = error_response(500, "internal_error", e.what());
    }

    telemetry_.record_response(route, res.status);
    return res;
}

ApiResponse ApiRouter::dispatch(const std::string& method, const std::string& path,
                                const QueryParams& query, const std::string& body,
                                std::string& route) const {
    if (path == "/health") {
        route = path;
        if (method != "GET") return error_response(405, "method_not_allowed", "use GET");
        return json_response(200, service_.health());
    }
    if (path == "/metrics") {
        route = path;
        if (method != "GET") return error_response(405, "method_not_allowed", "use GET");
        ApiResponse res;
        res.content_type = "text/plain; version=0.0.4";
        res.body = telemetry_.to_prometheus();
        return res;
    }
    if (path == "/telemetry") {
        route = path;
        if (method != "GET") return error_response(405, "method_not_allowed", "use GET");
        ApiResponse res;
        res.body = telemetry_.to_json();
        return res;
    }

    if (path.compare(0, prefix_.size(), prefix_) != 0) {
        return error_response(404, "not_found", "no route for " + path);
    }
    const std::string endpoint = path.substr(prefix_.size());
    const bool is_get = method == "GET";

    if (endpoint == "/score-customer") {
        route = endpoint;
        if (method != "POST") return error_response(405, "method_not_allowed", "use POST");
        telemetry_.increment_score_requests();
        ScoreRequest sreq = parse_score_request(json::parse(body));
        CustomerScoreResult result = service_.score_customer(sreq);
        if (!result.delinquency_probability) telemetry_.increment_probability_unavailable();
        return json_response(200, result);
    }

    if (endpoint == "/portfolio-summary") {
        route = endpoint;
        if (!is_get) return error_response(405, "method_not_allowed", "use GET");
        return json_response(200, service_.get_portfolio_summary());
    }
    if (endpoint == "/signals") {
        route = endpoint;
        if (!is_get) return error_response(405, "method_not_allowed", "use GET");
        return json_response(200, json{{"signals", service_.get_signal_effectiveness()}});
    }
    if (endpoint == "/risk-distribution") {
        route = endpoint;
        if (!is_get) return error_response(405, "method_not_allowed", "use GET");
        return json_response(200, service_.get_risk_distribution());
    }
    if (endpoint == "/customers") {
        route = endpoint;
        if (!is_get) return error_response(405, "method_not_allowed", "use GET");
        std::optional<RiskTier> tier;
        auto t = query.find("tier");
        if (t != query.end() && !t->second.empty()) {
            tier = tierFromStr(t->second);
            if (!tier) throw InvalidCustomerData("unknown tier '" + t->second + "'");
        }
        const int limit = int_param(query, "limit", RiskService::kDefaultCustomerLimit);
        auto customers = service_.get_customers(tier, limit);
        return json_response(200, json{{"customers", customers}, {"count", customers.size()}});
    }
    if (endpoint == "/intervention-roi") {
        route = endpoint;
        if (!is_get) return error_response(405, "method_not_allowed", "use GET");
        return json_response(200, service_.calculate_roi());
    }
    if (endpoint == "/feature-importance") {
        route = endpoint;
        if (!is_get) return error_response(405, "method_not_allowed", "use GET");
        const int top = int_param(query, "top", RiskService::kDefaultTopFeatures);
        return json_response(200, json{{"top_features", service_.get_top_features(top)}});
    }
    if (endpoint == "/dashboard-stats") {
        route = endpoint;
        if (!is_get) return error_response(405, "method_not_allowed", "use GET");
        return json_response(200, service_.get_dashboard_stats());
    }

    return error_response(404, "not_found", "no route for " + path);
}
