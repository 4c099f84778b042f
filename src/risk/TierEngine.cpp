#include "riskpulse/risk/TierEngine.hpp"

using namespace riskpulse;

TierEngine::TierEngine(const TierThresholds& thresholds)
    : t_(thresholds) {
    t_.validate_or_throw();
}

int TierEngine::score(const SignalSet& signals) const {
    return signals.count();
}

RiskTier TierEngine::classify(int score) const {
    if (score >= t_.high) return RiskTier::HIGH;
    if (score >= t_.medium) return RiskTier::MEDIUM;
    return RiskTier::LOW;
}
