#include "riskpulse/config/ConfigLoader.hpp"
#include "riskpulse/core/Errors.hpp"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdlib.h>

using namespace riskpulse;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

}

namespace riskpulse {

bool parse_bool_flag(const std::string& val, bool& out) {
    std::string v = lower(trim(val));
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    return false;
}

std::vector<std::string> ConfigLoader::default_search_paths() {
    std::vector<std::string> paths;
    if (const char* forced = env_or_null("RISKPULSE_CONFIG")) {
        paths.emplace_back(forced);
        return paths;
    }
    paths.emplace_back("riskpulse.ini");
    paths.emplace_back("../riskpulse.ini");
    if (const char* home = env_or_null("HOME")) {
        paths.emplace_back(std::string(home) + "/.riskpulse/riskpulse.ini");
    }
    return paths;
}

bool ConfigLoader::load(const std::string& path) {
    return load(std::vector<std::string>{path});
}

bool ConfigLoader::load(const std::vector<std::string>& candidates) {
    for (const auto& p : candidates) {
        std::ifstream file(p);
        if (file.is_open()) {
            configPath_ = p;
            parse(file);
            std::cout << "[CONFIG] Loaded " << values_.size() << " values from " << p << "\n";
            return true;
        }
    }

    std::cout << "[CONFIG] No config file found, using defaults. Searched:\n";
    for (const auto& p : candidates) {
        std::cout << "  - " << p << "\n";
    }
    return false;
}

void ConfigLoader::parse(std::istream& in) {
    std::string line;
    std::string currentSection;
    int lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        // Section header
        if (line[0] == '[') {
            size_t closePos = line.find(']');
            if (closePos == std::string::npos) {
                throw ConfigError("config line " + std::to_string(lineNo) + ": unterminated section header");
            }
            currentSection = trim(line.substr(1, closePos - 1));
            continue;
        }

        // Key = Value
        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            throw ConfigError("config line " + std::to_string(lineNo) + ": expected key = value");
        }
        std::string key = trim(line.substr(0, eqPos));
        std::string value = trim(line.substr(eqPos + 1));
        if (key.empty()) {
            throw ConfigError("config line " + std::to_string(lineNo) + ": empty key");
        }

        // Store with section prefix
        values_[currentSection + "." + key] = value;
    }
}

bool ConfigLoader::has(const std::string& section, const std::string& key) const {
    return values_.find(section + "." + key) != values_.end();
}

std::string ConfigLoader::get(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    auto it = values_.find(section + "." + key);
    if (it != values_.end()) {
        return it->second;
    }
    return defaultVal;
}

int ConfigLoader::getInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(val, &used);
    } catch (const std::exception&) {
        throw ConfigError(section + "." + key + ": '" + val + "' is not an integer");
    }
    if (used != val.size()) {
        throw ConfigError(section + "." + key + ": '" + val + "' is not an integer");
    }
    return out;
}

double ConfigLoader::getDouble(const std::string& section, const std::string& key, double defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(val, &used);
    } catch (const std::exception&) {
        throw ConfigError(section + "." + key + ": '" + val + "' is not a number");
    }
    if (used != val.size()) {
        throw ConfigError(section + "." + key + ": '" + val + "' is not a number");
    }
    return out;
}

bool ConfigLoader::getBool(const std::string& section, const std::string& key, bool defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    bool out = defaultVal;
    if (!parse_bool_flag(val, out)) {
        throw ConfigError(section + "." + key + ": '" + val + "' is not a boolean");
    }
    return out;
}

RiskConfig ConfigLoader::build() const {
    RiskConfig cfg;

    auto& s = cfg.signals;
    s.spend_decline        = getDouble("signals", "spend_decline_threshold", s.spend_decline);
    s.utilization_high     = getDouble("signals", "utilization_high", s.utilization_high);
    s.utilization_medium   = getDouble("signals", "utilization_medium", s.utilization_medium);
    s.cash_withdrawal      = getDouble("signals", "cash_withdrawal_threshold", s.cash_withdrawal);
    s.payment_ratio_high   = getDouble("signals", "payment_ratio_high", s.payment_ratio_high);
    s.payment_ratio_medium = getDouble("signals", "payment_ratio_medium", s.payment_ratio_medium);
    s.min_due_freq         = getDouble("signals", "min_due_freq_threshold", s.min_due_freq);
    s.merchant_mix         = getDouble("signals", "merchant_mix_threshold", s.merchant_mix);

    cfg.tiers.high   = getInt("tiers", "high_threshold", cfg.tiers.high);
    cfg.tiers.medium = getInt("tiers", "medium_threshold", cfg.tiers.medium);

    auto& e = cfg.economics;
    e.high.unit_cost         = getDouble("economics", "high_cost", e.high.unit_cost);
    e.medium.unit_cost       = getDouble("economics", "medium_cost", e.medium.unit_cost);
    e.low.unit_cost          = getDouble("economics", "low_cost", e.low.unit_cost);
    e.high.prevention_rate   = getDouble("economics", "high_prevention_rate", e.high.prevention_rate);
    e.medium.prevention_rate = getDouble("economics", "medium_prevention_rate", e.medium.prevention_rate);
    e.low.prevention_rate    = getDouble("economics", "low_prevention_rate", e.low.prevention_rate);
    e.avg_loss_per_default   = getDouble("economics", "avg_loss_per_default", e.avg_loss_per_default);

    cfg.data.file = get("data", "file", cfg.data.file);

    cfg.model.file                   = get("model", "file", cfg.model.file);
    cfg.model.allow_startup_training = getBool("model", "allow_startup_training", cfg.model.allow_startup_training);
    cfg.model.training_iterations    = getInt("model", "training_iterations", cfg.model.training_iterations);
    cfg.model.training_learning_rate = getDouble("model", "training_learning_rate", cfg.model.training_learning_rate);

    cfg.server.host       = get("server", "host", cfg.server.host);
    cfg.server.api_prefix = get("server", "api_prefix", cfg.server.api_prefix);
    int port = getInt("server", "port", cfg.server.port);
    if (port < 1 || port > std::numeric_limits<uint16_t>::max()) {
        throw ConfigError("server.port out of range: " + std::to_string(port));
    }
    cfg.server.port = static_cast<uint16_t>(port);
    cfg.server.threads            = getInt("server", "threads", cfg.server.threads);
    cfg.server.request_timeout_ms = getInt("server", "request_timeout_ms", cfg.server.request_timeout_ms);

    return cfg;
}

void ConfigLoader::dump() const {
    std::cout << "[CONFIG] Loaded from: " << (configPath_.empty() ? "<defaults>" : configPath_) << "\n";
    for (const auto& kv : values_) {
        std::cout << "  " << kv.first << " = " << kv.second << "\n";
    }
}

void apply_env_overrides(RiskConfig& cfg) {
    if (const char* v = env_or_null("RISKPULSE_DATA_FILE")) {
        cfg.data.file = v;
        std::cout << "[CONFIG] data.file overridden by RISKPULSE_DATA_FILE\n";
    }
    if (const char* v = env_or_null("RISKPULSE_MODEL_FILE")) {
        cfg.model.file = v;
        std::cout << "[CONFIG] model.file overridden by RISKPULSE_MODEL_FILE\n";
    }
    if (const char* v = env_or_null("RISKPULSE_PORT")) {
        int port = 0;
        size_t used = 0;
        try {
            port = std::stoi(v, &used);
        } catch (const std::exception&) {
            throw ConfigError(std::string("RISKPULSE_PORT is not an integer: ") + v);
        }
        if (used != std::strlen(v)) {
            throw ConfigError(std::string("RISKPULSE_PORT is not an integer: ") + v);
        }
        if (port < 1 || port > std::numeric_limits<uint16_t>::max()) {
            throw ConfigError(std::string("RISKPULSE_PORT out of range: ") + v);
        }
        cfg.server.port = static_cast<uint16_t>(port);
    }
    if (const char* v = env_or_null("RISKPULSE_ALLOW_STARTUP_TRAINING")) {
        bool flag = false;
        if (!parse_bool_flag(v, flag)) {
            throw ConfigError(std::string("RISKPULSE_ALLOW_STARTUP_TRAINING is not a boolean: ") + v);
        }
        cfg.model.allow_startup_training = flag;
    }
}

bool load_dotenv(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return false;  // no .env = silent skip

    std::string line;
    while (std::getline(f, line)) {
        // Strip trailing \r (Windows line endings)
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key   = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // Shell-style .env files use "export KEY=val"
        if (key.rfind("export ", 0) == 0) {
            key = trim(key.substr(7));
        }
        if (key.empty()) continue;

        // Strip surrounding quotes (single or double)
        if (value.size() >= 2) {
            char q = value.front();
            if ((q == '"' || q == '\'') && value.back() == q) {
                value = value.substr(1, value.size() - 2);
            }
        }

        // Environment wins over .env
        if (!std::getenv(key.c_str())) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }

    std::cout << "[CONFIG] .env loaded from " << path << "\n";
    return true;
}

RiskConfig load_risk_config() {
    load_dotenv(".env");

    ConfigLoader loader;
    loader.load(ConfigLoader::default_search_paths());
    loader.dump();

    RiskConfig cfg = loader.build();
    apply_env_overrides(cfg);
    cfg.validate_or_throw();
    return cfg;
}

}
