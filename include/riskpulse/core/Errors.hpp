#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace riskpulse {

// ---------------------------------------------------------------------------
// Error taxonomy.
//
// Startup failures (DataUnavailable, ModelNotReady) are caught once by the
// bootstrap and recorded in ServiceState. Per-request failures
// (MalformedRecord, InvalidCustomerData) are caught at the API boundary and
// never touch the shared context.
//
// kind() is the stable identifier written into error response bodies.
// ---------------------------------------------------------------------------
class RiskPulseError : public std::runtime_error {
public:
    explicit RiskPulseError(std::string msg) : std::runtime_error(std::move(msg)) {}
    virtual const char* kind() const noexcept = 0;
};

// Dataset failed to load. Fatal for every dataset-backed operation.
class DataUnavailable : public RiskPulseError {
public:
    explicit DataUnavailable(std::string msg) : RiskPulseError(std::move(msg)) {}
    const char* kind() const noexcept override { return "data_unavailable"; }
};

// No trained estimator, or the model file could not be loaded.
class ModelNotReady : public RiskPulseError {
public:
    explicit ModelNotReady(std::string msg) : RiskPulseError(std::move(msg)) {}
    const char* kind() const noexcept override { return "model_not_ready"; }
};

// A dataset row or record with a missing or non-numeric field.
class MalformedRecord : public RiskPulseError {
public:
    explicit MalformedRecord(std::string msg) : RiskPulseError(std::move(msg)) {}
    const char* kind() const noexcept override { return "malformed_record"; }
};

// Caller-supplied request data is missing, mistyped or out of range.
class InvalidCustomerData : public RiskPulseError {
public:
    explicit InvalidCustomerData(std::string msg) : RiskPulseError(std::move(msg)) {}
    const char* kind() const noexcept override { return "invalid_customer_data"; }
};

class ConfigError : public RiskPulseError {
public:
    explicit ConfigError(std::string msg) : RiskPulseError(std::move(msg)) {}
    const char* kind() const noexcept override { return "config_error"; }
};

}
