#include "riskpulse/data/EnrichedDataset.hpp"
#include "riskpulse/core/Errors.hpp"

using namespace riskpulse;

EnrichedDataset EnrichedDataset::build(const std::vector<CustomerRecord>& records,
                                       const SignalEngine& signals,
                                       const TierEngine& tiers) {
    std::vector<SignalSet> sets = signals.evaluate_batch(records);

    std::vector<EnrichedRecord> rows;
    rows.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        EnrichedRecord row;
        row.raw           = records[i];
        row.signals       = sets[i];
        row.risk_score    = tiers.score(row.signals);
        row.tier          = tiers.classify(row.risk_score);
        row.is_delinquent = label(records[i]);
        rows.push_back(std::move(row));
    }
    return EnrichedDataset(std::move(rows));
}
