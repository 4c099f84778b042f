#pragma once
#include <array>
#include <istream>
#include <string>
#include <vector>

#include "riskpulse/core/Types.hpp"

namespace riskpulse {

// ---------------------------------------------------------------------------
// Customer dataset CSV reader.
//
// The header row must name every required column; column order is free and
// extra columns are ignored. Quoted fields and CRLF line endings are
// accepted. Any row with a missing or non-numeric value fails the whole
// load with MalformedRecord (row number + column in the message): values are
// never coerced.
//
// Missing file, missing column or zero data rows -> DataUnavailable.
// ---------------------------------------------------------------------------
class DatasetLoader {
public:
    static constexpr const char* COL_CUSTOMER_ID      = "Customer ID";
    static constexpr const char* COL_UTILISATION      = "Utilisation %";
    static constexpr const char* COL_PAYMENT_RATIO    = "Avg Payment Ratio";
    static constexpr const char* COL_MIN_DUE_FREQ     = "Min Due Paid Frequency";
    static constexpr const char* COL_MERCHANT_MIX     = "Merchant Mix Index";
    static constexpr const char* COL_CASH_WITHDRAWAL  = "Cash Withdrawal %";
    static constexpr const char* COL_SPEND_CHANGE     = "Recent Spend Change %";
    static constexpr const char* COL_CREDIT_LIMIT     = "Credit Limit";
    static constexpr const char* COL_DPD_NEXT_MONTH   = "DPD Bucket Next Month";

    explicit DatasetLoader(std::string path);

    std::vector<CustomerRecord> load() const;

    static std::vector<CustomerRecord> parse(std::istream& in, const std::string& source);

    // Split one CSV line. Double quotes group commas; "" inside quotes is a
    // literal quote.
    static std::vector<std::string> split_line(const std::string& line);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}
