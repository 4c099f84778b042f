#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "riskpulse/api/ApiRouter.hpp"
#include "riskpulse/config/ConfigLoader.hpp"
#include "riskpulse/core/Errors.hpp"
#include "riskpulse/runtime/Bootstrap.hpp"
#include "riskpulse/runtime/RiskService.hpp"
#include "riskpulse/telemetry/HttpServer.hpp"
#include "riskpulse/telemetry/TelemetryState.hpp"

using namespace riskpulse;

// ---------------------------------------------------------------------------
// Signal handler only sets the flag. The main loop observes it and stops
// the server thread.
// ---------------------------------------------------------------------------
static std::atomic<bool> g_sigint_flag{false};

void handle_sigint(int) {
    g_sigint_flag.store(true, std::memory_order_relaxed);
}

int main() {
    std::cout << "[RISKPULSE] Starting delinquency early-warning service\n";

    RiskConfig config;
    try {
        config = load_risk_config();
    } catch (const ConfigError& e) {
        std::cerr << "[CONFIG] FATAL: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT,  handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    // A failed data load leaves the service up in NotReady: /health reports
    // the reason and dataset endpoints answer 503.
    RiskService service(bootstrap(config));
    if (service.ready()) {
        const HealthReport h = service.health();
        std::cout << "[RISKPULSE] Ready (model: " << h.model_source << ")\n";
    } else {
        std::cerr << "[RISKPULSE] NOT READY: " << service.health().reason << "\n";
    }

    TelemetryState telemetry;
    ApiRouter router(service, telemetry, config.server.api_prefix);

    std::atomic<bool> running{true};
    HttpServer server(config.server, router, running);
    std::thread http_thread([&]() { server.run(); });

    while (running.load()) {
        if (g_sigint_flag.load()) {
            std::cout << "\n[RISKPULSE] Shutdown requested\n";
            running.store(false);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    http_thread.join();
    std::cout << "[RISKPULSE] Served " << telemetry.requests_total() << " requests in "
              << telemetry.uptime_sec() << "s (2xx " << telemetry.responses_2xx()
              << ", 4xx " << telemetry.responses_4xx() << ", 5xx " << telemetry.responses_5xx() << ")\n";
    return 0;
}
