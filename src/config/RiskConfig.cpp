#include "riskpulse/config/RiskConfig.hpp"
#include "riskpulse/core/Errors.hpp"
#include <cmath>

using namespace riskpulse;

namespace {

void require_finite(double v, const char* name) {
    if (!std::isfinite(v)) {
        throw ConfigError(std::string(name) + " must be a finite number");
    }
}

void require_rate(double v, const char* name) {
    if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
        throw ConfigError(std::string(name) + " must be within [0,1]");
    }
}

void require_non_negative(double v, const char* name) {
    if (!std::isfinite(v) || v < 0.0) {
        throw ConfigError(std::string(name) + " must be >= 0");
    }
}

}

void SignalThresholds::validate_or_throw() const {
    require_finite(spend_decline, "signals.spend_decline_threshold");
    require_finite(utilization_high, "signals.utilization_high");
    require_finite(utilization_medium, "signals.utilization_medium");
    require_finite(cash_withdrawal, "signals.cash_withdrawal_threshold");
    require_finite(payment_ratio_high, "signals.payment_ratio_high");
    require_finite(payment_ratio_medium, "signals.payment_ratio_medium");
    require_finite(min_due_freq, "signals.min_due_freq_threshold");
    require_finite(merchant_mix, "signals.merchant_mix_threshold");

    // The medium arm of each compound signal must be the looser test.
    if (utilization_medium > utilization_high) {
        throw ConfigError("signals.utilization_medium must not exceed signals.utilization_high");
    }
    if (payment_ratio_high > payment_ratio_medium) {
        throw ConfigError("signals.payment_ratio_high must not exceed signals.payment_ratio_medium");
    }
}

void TierThresholds::validate_or_throw() const {
    if (medium < 0 || medium > kMaxRiskScore + 1) {
        throw ConfigError("tiers.medium_threshold must be within [0,6]");
    }
    if (high < 0 || high > kMaxRiskScore + 1) {
        throw ConfigError("tiers.high_threshold must be within [0,6]");
    }
    if (medium > high) {
        throw ConfigError("tiers.medium_threshold must not exceed tiers.high_threshold");
    }
}

const TierEconomics& InterventionEconomics::for_tier(RiskTier t) const {
    switch (t) {
        case RiskTier::HIGH:   return high;
        case RiskTier::MEDIUM: return medium;
        case RiskTier::LOW:    return low;
    }
    return low;
}

void InterventionEconomics::validate_or_throw() const {
    require_non_negative(high.unit_cost, "economics.high_cost");
    require_non_negative(medium.unit_cost, "economics.medium_cost");
    require_non_negative(low.unit_cost, "economics.low_cost");
    require_rate(high.prevention_rate, "economics.high_prevention_rate");
    require_rate(medium.prevention_rate, "economics.medium_prevention_rate");
    require_rate(low.prevention_rate, "economics.low_prevention_rate");
    require_non_negative(avg_loss_per_default, "economics.avg_loss_per_default");
}

void ModelSettings::validate_or_throw() const {
    if (training_iterations < 1) {
        throw ConfigError("model.training_iterations must be >= 1");
    }
    if (!std::isfinite(training_learning_rate) || training_learning_rate <= 0.0) {
        throw ConfigError("model.training_learning_rate must be > 0");
    }
}

void ServerSettings::validate_or_throw() const {
    if (port == 0) {
        throw ConfigError("server.port must be non-zero");
    }
    if (api_prefix.empty() || api_prefix.front() != '/') {
        throw ConfigError("server.api_prefix must start with '/'");
    }
    if (api_prefix.size() > 1 && api_prefix.back() == '/') {
        throw ConfigError("server.api_prefix must not end with '/'");
    }
    if (threads < 1) {
        throw ConfigError("server.threads must be >= 1");
    }
    if (request_timeout_ms < 1) {
        throw ConfigError("server.request_timeout_ms must be >= 1");
    }
}

void RiskConfig::validate_or_throw() const {
    signals.validate_or_throw();
    tiers.validate_or_throw();
    economics.validate_or_throw();
    model.validate_or_throw();
    server.validate_or_throw();
    if (data.file.empty()) {
        throw ConfigError("data.file must not be empty");
    }
}
