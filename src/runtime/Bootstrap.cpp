#include "riskpulse/runtime/Bootstrap.hpp"
#include "riskpulse/core/Errors.hpp"
#include "riskpulse/data/DatasetLoader.hpp"
#include "riskpulse/model/ModelProvider.hpp"
#include <iostream>

namespace riskpulse {

ServiceState bootstrap_from_records(const RiskConfig& config,
                                    const std::vector<CustomerRecord>& records,
                                    std::shared_ptr<const ProbabilityModel> model,
                                    std::string model_source) {
    SignalEngine signals(config.signals);
    TierEngine tiers(config.tiers);
    EnrichedDataset ds = EnrichedDataset::build(records, signals, tiers);
    return Ready{std::make_shared<const RiskContext>(config, std::move(ds), std::move(model),
                                                     std::move(model_source))};
}

ServiceState bootstrap(const RiskConfig& config) {
    EnrichedDataset ds;
    try {
        auto records = DatasetLoader(config.data.file).load();
        SignalEngine signals(config.signals);
        TierEngine tiers(config.tiers);
        ds = EnrichedDataset::build(records, signals, tiers);
    } catch (const RiskPulseError& e) {
        std::cerr << "[DATA] Failed to prepare data: " << e.what() << "\n";
        return NotReady{std::string(e.kind()) + ": " + e.what()};
    }

    ProvidedModel pm = provide_model(config.model, &ds);
    std::cout << "[RISKPULSE] Context ready: " << ds.size() << " customers, model="
              << pm.source << "\n";
    return Ready{std::make_shared<const RiskContext>(config, std::move(ds), std::move(pm.model),
                                                     std::move(pm.source))};
}

}
