#pragma once
#include <memory>
#include <string>

#include "riskpulse/config/RiskConfig.hpp"
#include "riskpulse/data/EnrichedDataset.hpp"
#include "riskpulse/model/ProbabilityModel.hpp"

namespace riskpulse {

struct ProvidedModel {
    std::shared_ptr<const ProbabilityModel> model;   // null when none available
    std::string source;                              // "file:<path>", "trained", "none"
    std::string reason;                              // why no model, when null
};

// ---------------------------------------------------------------------------
// Resolve the estimator at startup:
//   1. load the tree ensemble from settings.file
//   2. else, if allow_startup_training and a dataset is available, train
//      the logistic fallback
//   3. else none
// Never throws: a failed load or training run is recorded in the result.
// ---------------------------------------------------------------------------
ProvidedModel provide_model(const ModelSettings& settings, const EnrichedDataset* dataset);

}
