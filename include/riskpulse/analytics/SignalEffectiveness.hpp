#pragma once
#include <cstddef>
#include <vector>

#include "riskpulse/core/Types.hpp"
#include "riskpulse/data/EnrichedDataset.hpp"

namespace riskpulse {

// Rates are percentages (0..100). risk_lift is a plain ratio.
struct SignalEffectiveness {
    SignalId signal{SignalId::SPEND_DECLINE};
    std::size_t prevalence{0};
    double prevalence_pct{0.0};
    double delinquency_rate_when_present{0.0};
    double delinquency_rate_when_absent{0.0};
    double risk_lift{1.0};
};

// ---------------------------------------------------------------------------
// Prevalence and lift of every signal over the enriched dataset, sorted by
// risk_lift descending (ties keep signal order).
//
// Zero-denominator policy:
//   - no record has the signal      -> rate_when_present = 0
//   - every record has the signal   -> rate_when_absent  = 0
//   - rate_when_absent == 0         -> risk_lift = 1
//   - empty dataset                 -> prevalence_pct = 0
// so lift is always finite and >= 0.
// ---------------------------------------------------------------------------
std::vector<SignalEffectiveness> compute_signal_effectiveness(const EnrichedDataset& ds);

// Lift from two rates under the policy above.
double risk_lift(double rate_when_present, double rate_when_absent);

}
