#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace riskpulse {

// ---------------------------------------------------------------------------
// Process counters served on /metrics. Scalar counters are atomic; the
// per-route map is guarded by mtx_.
// ---------------------------------------------------------------------------
class TelemetryState {
public:
    TelemetryState();

    void record_response(const std::string& route, unsigned status);
    void increment_score_requests();
    void increment_probability_unavailable();

    uint64_t requests_total() const;
    uint64_t responses_2xx() const;
    uint64_t responses_4xx() const;
    uint64_t responses_5xx() const;
    uint64_t score_requests() const;
    uint64_t probability_unavailable() const;
    uint64_t route_hits(const std::string& route) const;
    uint64_t uptime_sec() const;

    std::string to_json() const;
    std::string to_prometheus() const;

private:
    std::chrono::steady_clock::time_point started_;

    std::atomic<uint64_t> requests_total_{0};
    std::atomic<uint64_t> responses_2xx_{0};
    std::atomic<uint64_t> responses_4xx_{0};
    std::atomic<uint64_t> responses_5xx_{0};
    std::atomic<uint64_t> score_requests_{0};
    std::atomic<uint64_t> probability_unavailable_{0};

    mutable std::mutex mtx_;
    std::map<std::string, uint64_t> route_hits_;
};

}
