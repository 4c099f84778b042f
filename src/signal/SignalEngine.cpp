#include "riskpulse/signal/SignalEngine.hpp"
#include "riskpulse/core/Errors.hpp"
#include <cmath>

using namespace riskpulse;

SignalEngine::SignalEngine(const SignalThresholds& thresholds)
    : t_(thresholds) {}

void SignalEngine::check_numeric(const BehaviorFields& f) const {
    struct Field { const char* name; double value; };
    const Field fields[] = {
        {"Utilisation %",          f.utilisation_pct},
        {"Avg Payment Ratio",      f.avg_payment_ratio},
        {"Min Due Paid Frequency", f.min_due_paid_freq},
        {"Merchant Mix Index",     f.merchant_mix_index},
        {"Cash Withdrawal %",      f.cash_withdrawal_pct},
        {"Recent Spend Change %",  f.spend_change_pct},
    };
    for (const auto& fld : fields) {
        if (!std::isfinite(fld.value)) {
            throw MalformedRecord(std::string("field '") + fld.name + "' is not a finite number");
        }
    }
}

bool SignalEngine::test(SignalId id, const BehaviorFields& f) const {
    switch (id) {
        case SignalId::SPEND_DECLINE:
            return f.spend_change_pct < t_.spend_decline;
        case SignalId::HIGH_UTILIZATION:
            return f.utilisation_pct > t_.utilization_high ||
                   (f.utilisation_pct > t_.utilization_medium &&
                    f.cash_withdrawal_pct > t_.cash_withdrawal);
        case SignalId::PAYMENT_DECLINE:
            return f.avg_payment_ratio < t_.payment_ratio_high ||
                   (f.avg_payment_ratio < t_.payment_ratio_medium &&
                    f.min_due_paid_freq < t_.min_due_freq);
        case SignalId::CASH_SURGE:
            return f.cash_withdrawal_pct > t_.cash_withdrawal;
        case SignalId::LOW_MERCHANT_MIX:
            return f.merchant_mix_index < t_.merchant_mix;
    }
    return false;
}

bool SignalEngine::evaluate(SignalId id, const BehaviorFields& f) const {
    check_numeric(f);
    return test(id, f);
}

SignalSet SignalEngine::evaluate(const BehaviorFields& f) const {
    check_numeric(f);
    SignalSet out;
    for (SignalId id : kAllSignals) {
        out.set(id, test(id, f));
    }
    return out;
}

std::vector<SignalSet> SignalEngine::evaluate_batch(const std::vector<CustomerRecord>& records) const {
    std::vector<SignalSet> out;
    out.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        try {
            out.push_back(evaluate(records[i].behavior));
        } catch (const MalformedRecord& e) {
            throw MalformedRecord("record " + std::to_string(i) + " (" +
                                  records[i].customer_id + "): " + e.what());
        }
    }
    return out;
}
