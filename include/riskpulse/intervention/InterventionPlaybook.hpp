#pragma once
#include <string>
#include <vector>

#include "riskpulse/core/Types.hpp"

namespace riskpulse {

// Fixed outreach actions per tier. Lookup only, no computation.
const std::vector<std::string>& recommendations_for(RiskTier tier);

}
