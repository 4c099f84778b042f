#pragma once
#include <array>
#include <optional>
#include <string>
#include <vector>

#include "riskpulse/core/Types.hpp"
#include "riskpulse/model/ProbabilityModelAdapter.hpp"
#include "riskpulse/risk/TierEngine.hpp"
#include "riskpulse/signal/SignalEngine.hpp"

namespace riskpulse {

// Validated single-customer input. Built by the API codec; every required
// field is present by construction.
struct ScoreRequest {
    std::string customer_id{"UNKNOWN"};
    BehaviorFields fields;
    // Per-signal override. A supplied flag is used verbatim; an empty slot
    // is computed from fields by the SignalEngine.
    std::array<std::optional<bool>, kSignalCount> supplied_signals{};
};

struct CustomerScoreResult {
    std::string customer_id;
    SignalSet signals;
    int risk_score{0};
    RiskTier tier{RiskTier::LOW};

    // Empty when the model is unavailable; never defaulted to 0.
    std::optional<double> delinquency_probability;
    std::optional<double> confidence;
    std::string probability_unavailable_reason;

    std::vector<std::string> triggered_signals;
    std::vector<std::string> recommendations;
    std::vector<SignalId> overridden_signals;
};

// ---------------------------------------------------------------------------
// Single-customer scoring: signals (supplied or derived) -> score/tier,
// model probability on the full feature vector, tier playbook.
//
// confidence = |p - 0.5| * 2.
//
// A missing model degrades only the probability fields. Non-finite input
// fields throw InvalidCustomerData.
// ---------------------------------------------------------------------------
class CustomerScorer {
public:
    CustomerScorer(const SignalEngine& signals,
                   const TierEngine& tiers,
                   const ProbabilityModelAdapter& model);

    CustomerScoreResult score(const ScoreRequest& req) const;

    static double confidence(double probability);

private:
    SignalSet resolve_signals(const ScoreRequest& req, std::vector<SignalId>& overridden) const;

    const SignalEngine& signals_;
    const TierEngine& tiers_;
    const ProbabilityModelAdapter& model_;
};

}
