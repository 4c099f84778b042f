#include "riskpulse/data/DatasetLoader.hpp"
#include "riskpulse/core/Errors.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <unordered_map>

using namespace riskpulse;

namespace {

constexpr size_t kColumnCount = 9;

enum Column : size_t {
    CUSTOMER_ID = 0,
    UTILISATION,
    PAYMENT_RATIO,
    MIN_DUE_FREQ,
    MERCHANT_MIX,
    CASH_WITHDRAWAL,
    SPEND_CHANGE,
    CREDIT_LIMIT,
    DPD_NEXT_MONTH
};

const std::array<const char*, kColumnCount> kColumnNames = {
    DatasetLoader::COL_CUSTOMER_ID,
    DatasetLoader::COL_UTILISATION,
    DatasetLoader::COL_PAYMENT_RATIO,
    DatasetLoader::COL_MIN_DUE_FREQ,
    DatasetLoader::COL_MERCHANT_MIX,
    DatasetLoader::COL_CASH_WITHDRAWAL,
    DatasetLoader::COL_SPEND_CHANGE,
    DatasetLoader::COL_CREDIT_LIMIT,
    DatasetLoader::COL_DPD_NEXT_MONTH,
};

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

double parse_number(const std::string& raw, size_t row, Column col) {
    std::string v = trim(raw);
    if (v.empty()) {
        throw MalformedRecord("row " + std::to_string(row) + ": missing value for '" +
                              kColumnNames[col] + "'");
    }
    size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(v, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != v.size() || !std::isfinite(out)) {
        throw MalformedRecord("row " + std::to_string(row) + ": non-numeric value '" + v +
                              "' for '" + kColumnNames[col] + "'");
    }
    return out;
}

}

DatasetLoader::DatasetLoader(std::string path)
    : path_(std::move(path)) {}

std::vector<CustomerRecord> DatasetLoader::load() const {
    std::ifstream in(path_);
    if (!in) {
        throw DataUnavailable("data file not found at " + path_);
    }
    auto records = parse(in, path_);
    std::cout << "[DATA] Loaded " << records.size() << " customers from " << path_ << "\n";
    return records;
}

std::vector<std::string> DatasetLoader::split_line(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cur.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            out.push_back(cur);
            cur.clear();
        } else if (c != '\r') {
            cur.push_back(c);
        }
    }
    out.push_back(cur);
    return out;
}

std::vector<CustomerRecord> DatasetLoader::parse(std::istream& in, const std::string& source) {
    std::string line;
    if (!std::getline(in, line)) {
        throw DataUnavailable(source + ": empty file, no header row");
    }
    // Strip UTF-8 BOM written by spreadsheet exports
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }

    std::unordered_map<std::string, size_t> header;
    auto names = split_line(line);
    for (size_t i = 0; i < names.size(); ++i) {
        header.emplace(trim(names[i]), i);
    }

    std::array<size_t, kColumnCount> index{};
    for (size_t c = 0; c < kColumnCount; ++c) {
        auto it = header.find(kColumnNames[c]);
        if (it == header.end()) {
            throw DataUnavailable(source + ": required column '" + kColumnNames[c] + "' missing from header");
        }
        index[c] = it->second;
    }

    std::vector<CustomerRecord> records;
    size_t row = 1;   // header is row 1
    while (std::getline(in, line)) {
        ++row;
        if (trim(line).empty()) continue;

        auto fields = split_line(line);
        auto field = [&](Column col) -> const std::string& {
            size_t idx = index[col];
            if (idx >= fields.size()) {
                throw MalformedRecord("row " + std::to_string(row) + ": missing value for '" +
                                      kColumnNames[col] + "'");
            }
            return fields[idx];
        };

        CustomerRecord r;
        r.customer_id = trim(field(CUSTOMER_ID));
        if (r.customer_id.empty()) {
            throw MalformedRecord("row " + std::to_string(row) + ": missing value for '" +
                                  kColumnNames[CUSTOMER_ID] + "'");
        }
        r.behavior.utilisation_pct     = parse_number(field(UTILISATION), row, UTILISATION);
        r.behavior.avg_payment_ratio   = parse_number(field(PAYMENT_RATIO), row, PAYMENT_RATIO);
        r.behavior.min_due_paid_freq   = parse_number(field(MIN_DUE_FREQ), row, MIN_DUE_FREQ);
        r.behavior.merchant_mix_index  = parse_number(field(MERCHANT_MIX), row, MERCHANT_MIX);
        r.behavior.cash_withdrawal_pct = parse_number(field(CASH_WITHDRAWAL), row, CASH_WITHDRAWAL);
        r.behavior.spend_change_pct    = parse_number(field(SPEND_CHANGE), row, SPEND_CHANGE);
        r.credit_limit                 = parse_number(field(CREDIT_LIMIT), row, CREDIT_LIMIT);
        r.dpd_bucket_next_month        = parse_number(field(DPD_NEXT_MONTH), row, DPD_NEXT_MONTH);
        records.push_back(std::move(r));
    }

    if (records.empty()) {
        throw DataUnavailable(source + ": no customer rows");
    }
    return records;
}
