#pragma once
#include <cstddef>
#include <utility>
#include <vector>

#include "riskpulse/core/Types.hpp"
#include "riskpulse/risk/TierEngine.hpp"
#include "riskpulse/signal/SignalEngine.hpp"

namespace riskpulse {

// ---------------------------------------------------------------------------
// Raw customer records plus signals, score, tier and label.
//
// Built once by build(); read-only afterwards. When source data changes a
// new dataset is built wholesale, never patched. build() is a pure function
// of (records, engines), so building twice from the same input yields equal
// datasets.
// ---------------------------------------------------------------------------
class EnrichedDataset {
public:
    EnrichedDataset() = default;

    static EnrichedDataset build(const std::vector<CustomerRecord>& records,
                                 const SignalEngine& signals,
                                 const TierEngine& tiers);

    // Label rule: delinquent when the next-month DPD bucket is above zero.
    static bool label(const CustomerRecord& r) { return r.dpd_bucket_next_month > 0.0; }

    std::size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    const EnrichedRecord& operator[](std::size_t i) const { return rows_[i]; }
    std::vector<EnrichedRecord>::const_iterator begin() const { return rows_.begin(); }
    std::vector<EnrichedRecord>::const_iterator end() const { return rows_.end(); }

    bool operator==(const EnrichedDataset& o) const { return rows_ == o.rows_; }

private:
    explicit EnrichedDataset(std::vector<EnrichedRecord> rows) : rows_(std::move(rows)) {}

    std::vector<EnrichedRecord> rows_;
};

}
