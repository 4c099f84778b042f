#pragma once
#include <memory>
#include <string>

#include "riskpulse/config/RiskConfig.hpp"
#include "riskpulse/data/EnrichedDataset.hpp"
#include "riskpulse/model/ProbabilityModelAdapter.hpp"
#include "riskpulse/risk/TierEngine.hpp"
#include "riskpulse/scoring/CustomerScorer.hpp"
#include "riskpulse/signal/SignalEngine.hpp"

namespace riskpulse {

// Single authoritative owner of all request-visible state.
// Constructed once at startup, then only ever handed out as
// shared_ptr<const RiskContext>. No writer exists after construction, so
// request handlers read it without locks.
class RiskContext {
public:
    RiskContext(RiskConfig config,
                EnrichedDataset dataset,
                std::shared_ptr<const ProbabilityModel> model,
                std::string model_source);

    RiskContext(const RiskContext&) = delete;
    RiskContext& operator=(const RiskContext&) = delete;

    const RiskConfig& config() const { return config_; }
    const EnrichedDataset& dataset() const { return dataset_; }
    const SignalEngine& signals() const { return signals_; }
    const TierEngine& tiers() const { return tiers_; }
    const ProbabilityModelAdapter& model() const { return model_; }
    const CustomerScorer& scorer() const { return scorer_; }
    const std::string& model_source() const { return model_source_; }

private:
    RiskConfig config_;
    SignalEngine signals_;
    TierEngine tiers_;
    EnrichedDataset dataset_;
    ProbabilityModelAdapter model_;
    std::string model_source_;
    CustomerScorer scorer_;
};

}
