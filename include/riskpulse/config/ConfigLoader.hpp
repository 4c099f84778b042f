#pragma once
// =============================================================================
// ConfigLoader.hpp - INI file parser for RiskPulse configuration
// =============================================================================
// Reads riskpulse.ini ([signals], [tiers], [economics], [data], [model],
// [server]) and layers environment overrides on top. A missing file is not
// an error: compiled-in defaults apply. A value that does not parse is.
// =============================================================================

#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

#include "riskpulse/config/RiskConfig.hpp"

namespace riskpulse {

class ConfigLoader {
public:
    // ---------------------------------------------------------------------------
    // Try each candidate path in order; the first that opens is parsed.
    // Returns false if none exists (defaults stay in effect).
    // ---------------------------------------------------------------------------
    bool load(const std::vector<std::string>& candidates);
    bool load(const std::string& path);

    // Default search order: $RISKPULSE_CONFIG, ./riskpulse.ini,
    // ../riskpulse.ini, $HOME/.riskpulse/riskpulse.ini
    static std::vector<std::string> default_search_paths();

    void parse(std::istream& in);

    bool has(const std::string& section, const std::string& key) const;
    std::string get(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Typed getters throw ConfigError when the value is present but malformed.
    int getInt(const std::string& section, const std::string& key, int defaultVal) const;
    double getDouble(const std::string& section, const std::string& key, double defaultVal) const;
    bool getBool(const std::string& section, const std::string& key, bool defaultVal) const;

    // Overlay parsed values onto the compiled-in defaults. Does not validate.
    RiskConfig build() const;

    const std::string& getConfigPath() const { return configPath_; }

    void dump() const;

private:
    std::unordered_map<std::string, std::string> values_;
    std::string configPath_;
};

// ---------------------------------------------------------------------------
// RISKPULSE_DATA_FILE, RISKPULSE_MODEL_FILE, RISKPULSE_PORT,
// RISKPULSE_ALLOW_STARTUP_TRAINING. Applied after the INI file.
// ---------------------------------------------------------------------------
void apply_env_overrides(RiskConfig& cfg);

// ---------------------------------------------------------------------------
// .env loader: KEY=VALUE lines exported into the process environment.
// Variables already set win. Returns false if the file does not exist.
// ---------------------------------------------------------------------------
bool load_dotenv(const std::string& path);

// Full startup path: .env, INI search, env overrides, validate_or_throw().
RiskConfig load_risk_config();

bool parse_bool_flag(const std::string& val, bool& out);

}
