#include "riskpulse/analytics/SignalEffectiveness.hpp"
#include <algorithm>
#include <array>

using namespace riskpulse;

namespace {

double pct(std::size_t num, std::size_t den) {
    return den > 0 ? static_cast<double>(num) / static_cast<double>(den) * 100.0 : 0.0;
}

}

namespace riskpulse {

double risk_lift(double rate_when_present, double rate_when_absent) {
    return rate_when_absent > 0.0 ? rate_when_present / rate_when_absent : 1.0;
}

std::vector<SignalEffectiveness> compute_signal_effectiveness(const EnrichedDataset& ds) {
    struct Counts {
        std::size_t present{0};
        std::size_t present_delinquent{0};
        std::size_t absent_delinquent{0};
    };
    std::array<Counts, kSignalCount> counts{};

    // Single scan; the absent population is total - present.
    for (const auto& row : ds) {
        for (SignalId id : kAllSignals) {
            auto& c = counts[static_cast<std::size_t>(id)];
            if (row.signals.get(id)) {
                ++c.present;
                if (row.is_delinquent) ++c.present_delinquent;
            } else if (row.is_delinquent) {
                ++c.absent_delinquent;
            }
        }
    }

    const std::size_t total = ds.size();
    std::vector<SignalEffectiveness> out;
    out.reserve(kSignalCount);

    for (SignalId id : kAllSignals) {
        const auto& c = counts[static_cast<std::size_t>(id)];
        const std::size_t absent = total - c.present;

        SignalEffectiveness e;
        e.signal                        = id;
        e.prevalence                    = c.present;
        e.prevalence_pct                = pct(c.present, total);
        e.delinquency_rate_when_present = pct(c.present_delinquent, c.present);
        e.delinquency_rate_when_absent  = pct(c.absent_delinquent, absent);
        e.risk_lift                     = risk_lift(e.delinquency_rate_when_present,
                                                    e.delinquency_rate_when_absent);
        out.push_back(e);
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const SignalEffectiveness& a, const SignalEffectiveness& b) {
                         return a.risk_lift > b.risk_lift;
                     });
    return out;
}

}
