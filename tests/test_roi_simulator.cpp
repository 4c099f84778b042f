// =============================================================================
// test_roi_simulator.cpp - intervention economics
// =============================================================================

#include "AnalyticsFixture.hpp"
#include "riskpulse/intervention/InterventionPlaybook.hpp"
#include "riskpulse/intervention/RoiSimulator.hpp"

using namespace riskpulse;
using namespace riskpulse::test;

class RoiSimulatorTest : public TestSuite {
public:
    RoiSimulatorTest() : TestSuite("ROI SIMULATOR - UNIT TESTS") {}

    void run_all_tests() {
        print_banner();
        test_portfolio_roi();
        test_empty_tier();
        test_zero_cost();
        test_invalid_economics();
        test_playbook();
        print_summary();
    }

private:
    void test_portfolio_roi() {
        section("Portfolio ROI");
        RoiSimulator sim(InterventionEconomics{});
        RoiAnalysis r = sim.simulate(portfolio_dataset());

        const TierRoi& high = r.tier(RiskTier::HIGH);
        check(high.count == 2, "HIGH count");
        check_near(high.delinquency_rate, 0.5, 1e-12, "HIGH rate as fraction");
        check_near(high.prevented, 0.4, 1e-12, "HIGH prevented = 2 * 0.40 * 0.5");
        check_near(high.cost, 40.0, 1e-12, "HIGH cost = 2 * $20");

        check_near(r.tier(RiskTier::MEDIUM).prevented, 0.25, 1e-12, "MEDIUM prevented");
        check_near(r.tier(RiskTier::LOW).cost, 1.0, 1e-12, "LOW cost = 2 * $0.50");

        check_near(r.total_prevented, 0.65, 1e-12, "Total prevented");
        check_near(r.total_cost, 48.5, 1e-12, "Total cost");
        check_near(r.revenue_protected, 3250.0, 1e-9, "Revenue protected");
        check_near(r.net_benefit, 3201.5, 1e-9, "Net benefit");
        check_near(r.roi_percentage, 3201.5 / 48.5 * 100.0, 1e-9, "ROI percentage");
        check_near(r.per_dollar_yield, 3250.0 / 48.5, 1e-9, "Per-dollar yield");
    }

    void test_empty_tier() {
        section("Empty Tier");
        RoiSimulator sim(InterventionEconomics{});
        std::array<RoiSimulator::TierPopulation, kTierCount> pops{};
        pops[2] = {10, 1};   // LOW only
        RoiAnalysis r = sim.simulate(pops);
        check(r.tier(RiskTier::HIGH).prevented == 0.0, "Empty HIGH prevents nothing");
        check(r.tier(RiskTier::HIGH).cost == 0.0, "Empty HIGH costs nothing");
        check_near(r.tier(RiskTier::LOW).prevented, 10 * 0.07 * 0.1, 1e-12, "LOW still computed");
    }

    void test_zero_cost() {
        section("Zero Program Cost");
        InterventionEconomics econ;
        econ.high.unit_cost = 0.0;
        econ.medium.unit_cost = 0.0;
        econ.low.unit_cost = 0.0;
        RoiAnalysis r = RoiSimulator(econ).simulate(portfolio_dataset());
        check(r.total_cost == 0.0, "Cost is zero");
        check(r.revenue_protected > 0.0, "Revenue still reported");
        check(r.roi_percentage == 0.0, "ROI 0 when cost is 0");
        check(r.per_dollar_yield == 0.0, "Yield 0 when cost is 0");

        RoiAnalysis empty = RoiSimulator(InterventionEconomics{}).simulate(EnrichedDataset{});
        check(empty.total_cost == 0.0 && empty.roi_percentage == 0.0, "Empty portfolio yields zeros");
    }

    void test_invalid_economics() {
        section("Invalid Economics");
        InterventionEconomics econ;
        econ.medium.prevention_rate = -0.1;
        check_throws<ConfigError>([&]() { RoiSimulator s(econ); }, "Negative prevention rate rejected");
    }

    void test_playbook() {
        section("Playbook");
        check(!recommendations_for(RiskTier::HIGH).empty(), "HIGH has actions");
        check(!recommendations_for(RiskTier::LOW).empty(), "LOW has actions");
        check(recommendations_for(RiskTier::HIGH) != recommendations_for(RiskTier::LOW),
              "Tiers carry different playbooks");
    }
};

int main() {
    RoiSimulatorTest tester;
    tester.run_all_tests();
    return tester.exit_code();
}
