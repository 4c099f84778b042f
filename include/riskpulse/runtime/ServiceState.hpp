#pragma once
#include <memory>
#include <string>
#include <variant>

#include "riskpulse/runtime/RiskContext.hpp"

namespace riskpulse {

struct Ready {
    std::shared_ptr<const RiskContext> ctx;
};

struct NotReady {
    std::string reason;
};

// Startup outcome, checked once at the service boundary.
using ServiceState = std::variant<Ready, NotReady>;

}
