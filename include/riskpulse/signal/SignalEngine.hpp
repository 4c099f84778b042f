#pragma once
#include <vector>

#include "riskpulse/config/RiskConfig.hpp"
#include "riskpulse/core/Types.hpp"

namespace riskpulse {

// ---------------------------------------------------------------------------
// Derives the five behavioral signals from one record's fields.
//
//   spend_decline    = spend_change < SPEND_DECLINE
//   high_utilization = util > UTIL_HIGH || (util > UTIL_MEDIUM && cash > CASH)
//   payment_decline  = pay_ratio < PAY_HIGH || (pay_ratio < PAY_MEDIUM && min_due < MIN_DUE)
//   cash_surge       = cash > CASH
//   low_merchant_mix = merchant_mix < MERCHANT_MIX
//
// Pure and stateless after construction; safe to share across threads.
// Throws MalformedRecord for NaN/inf fields rather than guessing.
// ---------------------------------------------------------------------------
class SignalEngine {
public:
    explicit SignalEngine(const SignalThresholds& thresholds);

    SignalSet evaluate(const BehaviorFields& f) const;
    bool evaluate(SignalId id, const BehaviorFields& f) const;

    std::vector<SignalSet> evaluate_batch(const std::vector<CustomerRecord>& records) const;

    const SignalThresholds& thresholds() const { return t_; }

private:
    void check_numeric(const BehaviorFields& f) const;
    bool test(SignalId id, const BehaviorFields& f) const;

    SignalThresholds t_;
};

}
