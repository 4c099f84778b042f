#include "riskpulse/core/Types.hpp"
#include <cctype>

using namespace riskpulse;

namespace {

struct SignalNames {
    const char* code;
    const char* title;
    const char* trigger_label;
};

constexpr std::array<SignalNames, kSignalCount> kSignalNames = {{
    {"signal_spend_decline",    "Spend Decline",    "Spending Decline"},
    {"signal_high_utilization", "High Utilization", "High Utilization"},
    {"signal_payment_decline",  "Payment Decline",  "Payment Decline"},
    {"signal_cash_surge",       "Cash Surge",       "Cash Surge"},
    {"signal_low_merchant_mix", "Low Merchant Mix", "Low Merchant Mix"},
}};

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}

namespace riskpulse {

std::optional<RiskTier> tierFromStr(std::string_view s) {
    for (RiskTier t : kTierOrder) {
        if (iequals(s, tierToStr(t))) return t;
    }
    return std::nullopt;
}

const char* signalCode(SignalId id) {
    return kSignalNames[static_cast<std::size_t>(id)].code;
}

const char* signalTitle(SignalId id) {
    return kSignalNames[static_cast<std::size_t>(id)].title;
}

const char* signalTriggerLabel(SignalId id) {
    return kSignalNames[static_cast<std::size_t>(id)].trigger_label;
}

}
