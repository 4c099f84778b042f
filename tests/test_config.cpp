// =============================================================================
// test_config.cpp - INI parsing, typed getters, env overrides, validation
// =============================================================================

#include <cstdlib>
#include <sstream>
#include <stdlib.h>

#include "TestHarness.hpp"
#include "riskpulse/config/ConfigLoader.hpp"

using namespace riskpulse;
using namespace riskpulse::test;

class ConfigTest : public TestSuite {
public:
    ConfigTest() : TestSuite("CONFIG LOADER - UNIT TESTS") {}

    void run_all_tests() {
        print_banner();
        test_defaults();
        test_parse_sections();
        test_malformed_values();
        test_bad_lines();
        test_validation();
        test_env_overrides();
        test_missing_file();
        print_summary();
    }

private:
    static ConfigLoader parsed(const std::string& text) {
        ConfigLoader loader;
        std::istringstream in(text);
        loader.parse(in);
        return loader;
    }

    void test_defaults() {
        section("Defaults");
        RiskConfig cfg = ConfigLoader().build();
        check_no_throw([&]() { cfg.validate_or_throw(); }, "Defaults validate");
        check(cfg.tiers.high == 3 && cfg.tiers.medium == 2, "Tier cuts 3/2");
        check_near(cfg.economics.avg_loss_per_default, 5000.0, 1e-9, "Loss per default 5000");
        check_near(cfg.economics.high.prevention_rate, 0.40, 1e-9, "High prevention 40%");
        check(cfg.server.port == 8000, "Port 8000");
        check(cfg.server.api_prefix == "/api/v1", "Prefix /api/v1");
        check(!cfg.model.allow_startup_training, "Startup training off by default");
    }

    void test_parse_sections() {
        section("Sections");
        ConfigLoader loader = parsed(
            "# comment\n"
            "[signals]\n"
            "utilization_high = 85\n"
            "; another comment\n"
            "[tiers]\n"
            "high_threshold = 4\n"
            "[economics]\n"
            "medium_cost = 9.25\n"
            "[model]\n"
            "allow_startup_training = yes\n"
            "[server]\n"
            "port = 9100\n"
            "api_prefix = /risk\n"
            "threads = 2\n"
            "request_timeout_ms = 1500\n");

        check(loader.has("signals", "utilization_high"), "Key registered under its section");
        check(!loader.has("tiers", "utilization_high"), "Key not visible in another section");

        RiskConfig cfg = loader.build();
        check_near(cfg.signals.utilization_high, 85.0, 1e-9, "utilization_high overridden");
        check_near(cfg.signals.utilization_medium, 70.0, 1e-9, "utilization_medium kept default");
        check(cfg.tiers.high == 4, "high_threshold overridden");
        check_near(cfg.economics.medium.unit_cost, 9.25, 1e-9, "medium_cost overridden");
        check(cfg.model.allow_startup_training, "Boolean 'yes' parsed");
        check(cfg.server.port == 9100, "Port overridden");
        check(cfg.server.api_prefix == "/risk", "Prefix overridden");
        check(cfg.server.threads == 2, "Server threads overridden");
        check(cfg.server.request_timeout_ms == 1500, "Request timeout overridden");
    }

    void test_malformed_values() {
        section("Malformed Values");
        check_throws<ConfigError>([]() { parsed("[tiers]\nhigh_threshold = three\n").build(); },
                                  "Non-integer tier threshold");
        check_throws<ConfigError>([]() { parsed("[economics]\nhigh_cost = 20x\n").build(); },
                                  "Trailing junk on a number");
        check_throws<ConfigError>([]() { parsed("[model]\nallow_startup_training = maybe\n").build(); },
                                  "Non-boolean flag");
        check_throws<ConfigError>([]() { parsed("[server]\nport = 70000\n").build(); },
                                  "Port out of range");
    }

    void test_bad_lines() {
        section("Bad Lines");
        check_throws<ConfigError>([]() { parsed("[signals\n"); }, "Unterminated section header");
        check_throws<ConfigError>([]() { parsed("[signals]\njust text\n"); }, "Line without '='");
        check_throws<ConfigError>([]() { parsed("[signals]\n = 4\n"); }, "Empty key");
    }

    void test_validation() {
        section("Validation");
        RiskConfig cfg;
        cfg.tiers.medium = 4;
        check_throws<ConfigError>([&]() { cfg.validate_or_throw(); }, "medium > high rejected");

        cfg = RiskConfig{};
        cfg.economics.low.prevention_rate = 1.5;
        check_throws<ConfigError>([&]() { cfg.validate_or_throw(); }, "Prevention rate above 1 rejected");

        cfg = RiskConfig{};
        cfg.economics.high.unit_cost = -1.0;
        check_throws<ConfigError>([&]() { cfg.validate_or_throw(); }, "Negative cost rejected");

        cfg = RiskConfig{};
        cfg.signals.utilization_medium = 90.0;
        check_throws<ConfigError>([&]() { cfg.validate_or_throw(); }, "Medium utilization above high rejected");

        cfg = RiskConfig{};
        cfg.server.api_prefix = "/api/";
        check_throws<ConfigError>([&]() { cfg.validate_or_throw(); }, "Trailing slash on prefix rejected");

        cfg = RiskConfig{};
        cfg.server.api_prefix = "api";
        check_throws<ConfigError>([&]() { cfg.validate_or_throw(); }, "Prefix without leading slash rejected");

        cfg = RiskConfig{};
        cfg.server.threads = 0;
        check_throws<ConfigError>([&]() { cfg.validate_or_throw(); }, "Zero server threads rejected");

        cfg = RiskConfig{};
        cfg.server.request_timeout_ms = 0;
        check_throws<ConfigError>([&]() { cfg.validate_or_throw(); }, "Zero request timeout rejected");
    }

    void test_env_overrides() {
        section("Environment Overrides");
        setenv("RISKPULSE_DATA_FILE", "/tmp/other.csv", 1);
        setenv("RISKPULSE_PORT", "8123", 1);
        setenv("RISKPULSE_ALLOW_STARTUP_TRAINING", "true", 1);

        RiskConfig cfg;
        apply_env_overrides(cfg);
        check(cfg.data.file == "/tmp/other.csv", "Data file from environment");
        check(cfg.server.port == 8123, "Port from environment");
        check(cfg.model.allow_startup_training, "Training flag from environment");

        setenv("RISKPULSE_PORT", "eighty", 1);
        check_throws<ConfigError>([&]() { apply_env_overrides(cfg); }, "Bad RISKPULSE_PORT rejected");

        setenv("RISKPULSE_PORT", "8000abc", 1);
        check_throws<ConfigError>([&]() { apply_env_overrides(cfg); }, "RISKPULSE_PORT with trailing junk rejected");

        unsetenv("RISKPULSE_DATA_FILE");
        unsetenv("RISKPULSE_PORT");
        unsetenv("RISKPULSE_ALLOW_STARTUP_TRAINING");
    }

    void test_missing_file() {
        section("Missing File");
        ConfigLoader loader;
        check(!loader.load("/nonexistent/riskpulse.ini"), "Missing file reports false");
        check(loader.getConfigPath().empty(), "No path recorded");
        check(!load_dotenv("/nonexistent/.env"), "Missing .env reports false");
    }
};

int main() {
    ConfigTest tester;
    tester.run_all_tests();
    return tester.exit_code();
}
