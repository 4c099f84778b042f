// =============================================================================
// Types.hpp - RiskPulse shared value types
// =============================================================================
// Customer records, signal sets and risk tiers. Everything here is a plain
// value type; no component mutates a record after it has been loaded.
// =============================================================================
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace riskpulse {

// =============================================================================
// Risk Tier
// =============================================================================
// Underlying values follow severity so tiers compare in risk order.
enum class RiskTier : uint8_t {
    LOW    = 0,
    MEDIUM = 1,
    HIGH   = 2
};

constexpr std::size_t kTierCount = 3;

// Display/report order used by every per-tier output.
constexpr std::array<RiskTier, kTierCount> kTierOrder = {
    RiskTier::HIGH, RiskTier::MEDIUM, RiskTier::LOW
};

inline const char* tierToStr(RiskTier t) {
    switch (t) {
        case RiskTier::HIGH:   return "HIGH";
        case RiskTier::MEDIUM: return "MEDIUM";
        case RiskTier::LOW:    return "LOW";
        default: return "UNKNOWN";
    }
}

// Case-insensitive. Returns nullopt for anything but high/medium/low.
std::optional<RiskTier> tierFromStr(std::string_view s);

// =============================================================================
// Signals
// =============================================================================
enum class SignalId : uint8_t {
    SPEND_DECLINE    = 0,
    HIGH_UTILIZATION = 1,
    PAYMENT_DECLINE  = 2,
    CASH_SURGE       = 3,
    LOW_MERCHANT_MIX = 4
};

constexpr std::size_t kSignalCount = 5;
constexpr int kMaxRiskScore = static_cast<int>(kSignalCount);

constexpr std::array<SignalId, kSignalCount> kAllSignals = {
    SignalId::SPEND_DECLINE,
    SignalId::HIGH_UTILIZATION,
    SignalId::PAYMENT_DECLINE,
    SignalId::CASH_SURGE,
    SignalId::LOW_MERCHANT_MIX
};

// Column/feature code, e.g. "signal_cash_surge".
const char* signalCode(SignalId id);

// Title built from the code, e.g. "Cash Surge". Used by effectiveness reports.
const char* signalTitle(SignalId id);

// Human-readable name reported in a customer's triggered-signal list.
const char* signalTriggerLabel(SignalId id);

struct SignalSet {
    std::array<bool, kSignalCount> flags{};

    bool get(SignalId id) const { return flags[static_cast<std::size_t>(id)]; }
    void set(SignalId id, bool v) { flags[static_cast<std::size_t>(id)] = v; }

    int count() const {
        int n = 0;
        for (bool f : flags) n += f ? 1 : 0;
        return n;
    }

    bool operator==(const SignalSet& o) const { return flags == o.flags; }
    bool operator!=(const SignalSet& o) const { return !(*this == o); }
};

// =============================================================================
// Customer Record
// =============================================================================
// The six behavioral fields every signal and the probability model read.
struct BehaviorFields {
    double utilisation_pct{0.0};
    double avg_payment_ratio{0.0};
    double min_due_paid_freq{0.0};
    double merchant_mix_index{0.0};
    double cash_withdrawal_pct{0.0};
    double spend_change_pct{0.0};

    bool operator==(const BehaviorFields& o) const {
        return utilisation_pct == o.utilisation_pct &&
               avg_payment_ratio == o.avg_payment_ratio &&
               min_due_paid_freq == o.min_due_paid_freq &&
               merchant_mix_index == o.merchant_mix_index &&
               cash_withdrawal_pct == o.cash_withdrawal_pct &&
               spend_change_pct == o.spend_change_pct;
    }
};

struct CustomerRecord {
    std::string customer_id;
    BehaviorFields behavior;
    double credit_limit{0.0};
    double dpd_bucket_next_month{0.0};   // forward-looking; only feeds the label

    bool operator==(const CustomerRecord& o) const {
        return customer_id == o.customer_id && behavior == o.behavior &&
               credit_limit == o.credit_limit &&
               dpd_bucket_next_month == o.dpd_bucket_next_month;
    }
};

// One row of the enriched dataset: raw record plus derived columns.
struct EnrichedRecord {
    CustomerRecord raw;
    SignalSet signals;
    int risk_score{0};
    RiskTier tier{RiskTier::LOW};
    bool is_delinquent{false};

    bool operator==(const EnrichedRecord& o) const {
        return raw == o.raw && signals == o.signals && risk_score == o.risk_score &&
               tier == o.tier && is_delinquent == o.is_delinquent;
    }
};

}
