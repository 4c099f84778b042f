#include "riskpulse/intervention/InterventionPlaybook.hpp"

namespace riskpulse {

const std::vector<std::string>& recommendations_for(RiskTier tier) {
    static const std::vector<std::string> kHigh = {
        "Direct phone outreach within 24-48 hours",
        "Offer payment plan or credit limit review",
        "Connect with financial counselor",
        "Monitor weekly for 3 months",
    };
    static const std::vector<std::string> kMedium = {
        "Automated email with account health summary",
        "Offer payment flexibility or rate reduction",
        "Push financial wellness resources",
        "Monitor monthly for 2 months",
    };
    static const std::vector<std::string> kLow = {
        "Educational email campaign",
        "Highlight available resources",
        "Quarterly monitoring",
        "Standard customer service",
    };

    switch (tier) {
        case RiskTier::HIGH:   return kHigh;
        case RiskTier::MEDIUM: return kMedium;
        case RiskTier::LOW:    return kLow;
    }
    return kLow;
}

}
