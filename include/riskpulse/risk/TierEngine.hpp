#pragma once
#include "riskpulse/config/RiskConfig.hpp"
#include "riskpulse/core/Types.hpp"

namespace riskpulse {

// ---------------------------------------------------------------------------
// Risk score = number of active signals (0..5).
// Tier: score >= high -> HIGH, else score >= medium -> MEDIUM, else LOW.
// Both comparisons are inclusive. With medium <= high (enforced by
// TierThresholds::validate_or_throw) the tier never drops as score rises.
// ---------------------------------------------------------------------------
class TierEngine {
public:
    explicit TierEngine(const TierThresholds& thresholds);

    int score(const SignalSet& signals) const;
    RiskTier classify(int score) const;

    const TierThresholds& thresholds() const { return t_; }

private:
    TierThresholds t_;
};

}
