#pragma once
#include <cstdint>
#include <string>

#include "riskpulse/core/Types.hpp"

namespace riskpulse {

// ---------------------------------------------------------------------------
// Signal thresholds. Units follow the dataset columns: percentages are
// 0..100, merchant mix is an index in 0..1.
// ---------------------------------------------------------------------------
struct SignalThresholds {
    double spend_decline{-10.0};        // spend change % strictly below
    double utilization_high{80.0};
    double utilization_medium{70.0};
    double cash_withdrawal{15.0};
    double payment_ratio_high{40.0};
    double payment_ratio_medium{60.0};
    double min_due_freq{30.0};
    double merchant_mix{0.4};

    void validate_or_throw() const;
};

// Cut points on the 0..5 risk score. Both comparisons are score >= cut.
struct TierThresholds {
    int high{3};
    int medium{2};

    void validate_or_throw() const;
};

struct TierEconomics {
    double unit_cost{0.0};          // cost per customer contacted
    double prevention_rate{0.0};    // fraction of tier defaults averted
};

struct InterventionEconomics {
    TierEconomics high{20.0, 0.40};
    TierEconomics medium{7.50, 0.25};
    TierEconomics low{0.50, 0.07};
    double avg_loss_per_default{5000.0};

    const TierEconomics& for_tier(RiskTier t) const;
    void validate_or_throw() const;
};

struct DataSettings {
    std::string file{"data/cc_delinquency.csv"};
};

struct ModelSettings {
    std::string file{"models/delinquency_gbt.model"};
    bool allow_startup_training{false};
    int training_iterations{400};
    double training_learning_rate{0.1};

    void validate_or_throw() const;
};

struct ServerSettings {
    std::string host{"0.0.0.0"};
    uint16_t port{8000};
    std::string api_prefix{"/api/v1"};
    int threads{4};
    int request_timeout_ms{10000};  // per read or write on a connection

    void validate_or_throw() const;
};

// ---------------------------------------------------------------------------
// Process-wide configuration. Built once at startup, validated, then frozen
// inside RiskContext. Nothing mutates it per request.
// ---------------------------------------------------------------------------
struct RiskConfig {
    SignalThresholds signals;
    TierThresholds tiers;
    InterventionEconomics economics;
    DataSettings data;
    ModelSettings model;
    ServerSettings server;

    void validate_or_throw() const;
};

}
