#pragma once
#include "riskpulse/config/RiskConfig.hpp"
#include "riskpulse/runtime/ServiceState.hpp"

namespace riskpulse {

// ---------------------------------------------------------------------------
// Load + enrich the dataset, resolve the model, build the context.
// A dataset failure yields NotReady (recorded, not retried). A missing model
// still yields Ready; probability outputs degrade per request.
// ---------------------------------------------------------------------------
ServiceState bootstrap(const RiskConfig& config);

// Same, from records already in memory. Used by tests and tools.
ServiceState bootstrap_from_records(const RiskConfig& config,
                                    const std::vector<CustomerRecord>& records,
                                    std::shared_ptr<const ProbabilityModel> model,
                                    std::string model_source);

}
