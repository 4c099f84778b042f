#include "riskpulse/model/ProbabilityModelAdapter.hpp"
#include "riskpulse/core/Errors.hpp"
#include <algorithm>
#include <cmath>

using namespace riskpulse;

ProbabilityModelAdapter::ProbabilityModelAdapter(std::shared_ptr<const ProbabilityModel> model)
    : model_(std::move(model)) {}

double ProbabilityModelAdapter::score(const FeatureVector& x) const {
    if (!model_) {
        throw ModelNotReady("no trained delinquency model is loaded");
    }
    const double p = model_->probability(x);
    if (std::isnan(p)) {
        throw ModelNotReady(model_->name() + " produced a NaN probability");
    }
    return std::clamp(p, 0.0, 1.0);
}

std::vector<FeatureImportance> ProbabilityModelAdapter::top_features(std::size_t n) const {
    if (!model_) {
        throw ModelNotReady("feature importance unavailable: no trained model");
    }
    auto all = model_->feature_importances();
    if (all.size() > n) all.resize(n);
    return all;
}

std::string ProbabilityModelAdapter::model_name() const {
    return model_ ? model_->name() : "none";
}
