#pragma once
#include <atomic>
#include <cstdint>

#include "riskpulse/api/ApiRouter.hpp"
#include "riskpulse/config/RiskConfig.hpp"

namespace riskpulse {

// ---------------------------------------------------------------------------
// Async Beast server. Each connection gets its own session with a deadline
// on every read and write, so a silent client only holds its own socket.
// run() drives the io_context from settings.threads workers and returns
// once `running` goes false.
// ---------------------------------------------------------------------------
class HttpServer {
public:
    HttpServer(const ServerSettings& settings, const ApiRouter& router, std::atomic<bool>& running);
    void run();

    // Bound port once listening (useful when settings.port is 0), else 0.
    uint16_t local_port() const { return local_port_.load(); }

private:
    ServerSettings settings_;
    const ApiRouter& router_;
    std::atomic<bool>& running_;
    std::atomic<uint16_t> local_port_{0};
};

}
