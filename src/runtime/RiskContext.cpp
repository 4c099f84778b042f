#include "riskpulse/runtime/RiskContext.hpp"

using namespace riskpulse;

RiskContext::RiskContext(RiskConfig config,
                         EnrichedDataset dataset,
                         std::shared_ptr<const ProbabilityModel> model,
                         std::string model_source)
    : config_(std::move(config)),
      signals_(config_.signals),
      tiers_(config_.tiers),
      dataset_(std::move(dataset)),
      model_(std::move(model)),
      model_source_(std::move(model_source)),
      scorer_(signals_, tiers_, model_) {}
