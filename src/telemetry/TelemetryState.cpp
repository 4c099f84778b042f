#include "riskpulse/telemetry/TelemetryState.hpp"
#include <sstream>

using namespace riskpulse;

TelemetryState::TelemetryState()
    : started_(std::chrono::steady_clock::now()) {}

void TelemetryState::record_response(const std::string& route, unsigned status) {
    requests_total_.fetch_add(1);
    if (status >= 500)      responses_5xx_.fetch_add(1);
    else if (status >= 400) responses_4xx_.fetch_add(1);
    else if (status >= 200 && status < 300) responses_2xx_.fetch_add(1);

    std::lock_guard<std::mutex> lock(mtx_);
    route_hits_[route]++;
}

void TelemetryState::increment_score_requests() {
    score_requests_.fetch_add(1);
}

void TelemetryState::increment_probability_unavailable() {
    probability_unavailable_.fetch_add(1);
}

uint64_t TelemetryState::requests_total() const { return requests_total_.load(); }
uint64_t TelemetryState::responses_2xx() const { return responses_2xx_.load(); }
uint64_t TelemetryState::responses_4xx() const { return responses_4xx_.load(); }
uint64_t TelemetryState::responses_5xx() const { return responses_5xx_.load(); }
uint64_t TelemetryState::score_requests() const { return score_requests_.load(); }
uint64_t TelemetryState::probability_unavailable() const { return probability_unavailable_.load(); }

uint64_t TelemetryState::route_hits(const std::string& route) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = route_hits_.find(route);
    return it == route_hits_.end() ? 0 : it->second;
}

uint64_t TelemetryState::uptime_sec() const {
    auto elapsed = std::chrono::steady_clock::now() - started_;
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
}

std::string TelemetryState::to_json() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::ostringstream out;
    out << "{\"uptime\":" << uptime_sec()
        << ",\"requests_total\":" << requests_total_.load()
        << ",\"responses_2xx\":" << responses_2xx_.load()
        << ",\"responses_4xx\":" << responses_4xx_.load()
        << ",\"responses_5xx\":" << responses_5xx_.load()
        << ",\"score_requests\":" << score_requests_.load()
        << ",\"probability_unavailable\":" << probability_unavailable_.load()
        << ",\"routes\":{";

    bool first = true;
    for (const auto& kv : route_hits_) {
        if (!first) out << ",";
        first = false;
        out << "\"" << kv.first << "\":" << kv.second;
    }
    out << "}}";
    return out.str();
}

std::string TelemetryState::to_prometheus() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::ostringstream out;
    out << "riskpulse_uptime_seconds " << uptime_sec() << "\n"
        << "riskpulse_requests_total " << requests_total_.load() << "\n"
        << "riskpulse_responses_total{class=\"2xx\"} " << responses_2xx_.load() << "\n"
        << "riskpulse_responses_total{class=\"4xx\"} " << responses_4xx_.load() << "\n"
        << "riskpulse_responses_total{class=\"5xx\"} " << responses_5xx_.load() << "\n"
        << "riskpulse_score_requests_total " << score_requests_.load() << "\n"
        << "riskpulse_probability_unavailable_total " << probability_unavailable_.load() << "\n";

    for (const auto& kv : route_hits_) {
        out << "riskpulse_route_hits_total{route=\"" << kv.first << "\"} " << kv.second << "\n";
    }
    return out.str();
}
