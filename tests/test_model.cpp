// =============================================================================
// test_model.cpp - tree ensemble format, logistic training, adapter, provider
// =============================================================================

#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "AnalyticsFixture.hpp"
#include "riskpulse/model/LogisticModel.hpp"
#include "riskpulse/model/ModelProvider.hpp"
#include "riskpulse/model/ProbabilityModelAdapter.hpp"
#include "riskpulse/model/TreeEnsembleModel.hpp"

using namespace riskpulse;
using namespace riskpulse::test;

namespace {

// Two trees: a split on utilisation at 80, and a constant 0.5.
const char* kSmallModel =
    "riskpulse-gbt 1\n"
    "features 11\n"
    "learning_rate 0.5\n"
    "init_score -1.0\n"
    "importances 0.4 0.1 0 0 0.2 0 0 0 0 0.3 0\n"
    "trees 2\n"
    "tree 3\n"
    "0 0 80 1 2 0\n"
    "1 -1 0 -1 -1 -1.0\n"
    "2 -1 0 -1 -1 2.0\n"
    "tree 1\n"
    "0 -1 0 -1 -1 0.5\n";

std::shared_ptr<const TreeEnsembleModel> parse_model(const std::string& text) {
    std::istringstream in(text);
    return TreeEnsembleModel::parse(in, "inline.gbt");
}

class FixedModel : public ProbabilityModel {
public:
    explicit FixedModel(double p) : p_(p) {}
    double probability(const FeatureVector&) const override { return p_; }
    std::vector<FeatureImportance> feature_importances() const override { return {}; }
    std::string name() const override { return "fixed"; }
private:
    double p_;
};

FeatureVector features_of(const BehaviorFields& f) {
    SignalEngine signals(SignalThresholds{});
    return build_feature_vector(f, signals.evaluate(f));
}

}

class ModelTest : public TestSuite {
public:
    ModelTest() : TestSuite("PROBABILITY MODEL - UNIT TESTS") {}

    void run_all_tests() {
        print_banner();
        test_feature_vector();
        test_sigmoid();
        test_tree_ensemble();
        test_tree_format_errors();
        test_logistic_training();
        test_adapter();
        test_provider();
        print_summary();
    }

private:
    void test_feature_vector() {
        section("Feature Vector");
        FeatureVector x = features_of(all_signals_fields());
        check_near(x[0], 85.0, 1e-12, "Utilisation first");
        check_near(x[5], -15.0, 1e-12, "Spend change sixth");
        bool flags = true;
        for (std::size_t i = 6; i < kFeatureCount; ++i) flags = flags && x[i] == 1.0;
        check(flags, "Signal flags encoded as 1.0");
        check(std::string(feature_names()[9]) == "signal_cash_surge", "Flag names follow signal order");
    }

    void test_sigmoid() {
        section("Sigmoid");
        check_near(sigmoid(0.0), 0.5, 1e-12, "sigmoid(0) = 0.5");
        check(sigmoid(1000.0) == 1.0, "Large positive saturates");
        check(sigmoid(-1000.0) >= 0.0 && sigmoid(-1000.0) < 1e-300, "Large negative does not overflow");
    }

    void test_tree_ensemble() {
        section("Tree Ensemble");
        auto model = parse_model(kSmallModel);
        check(model->tree_count() == 2, "Two trees loaded");

        FeatureVector high = features_of(all_signals_fields());
        FeatureVector low = features_of(quiet_fields());
        check_near(model->decision_value(high), 0.25, 1e-12, "Right branch: -1 + 0.5 * (2.0 + 0.5)");
        check_near(model->decision_value(low), -1.25, 1e-12, "Left branch: -1 + 0.5 * (-1.0 + 0.5)");
        check_near(model->probability(high), sigmoid(0.25), 1e-12, "Probability is sigmoid of margin");

        auto imp = model->feature_importances();
        check(imp.size() == kFeatureCount, "Importance for every feature");
        check(imp[0].feature == "Utilisation %", "Top feature by stored gain");
        check(imp[1].feature == "signal_cash_surge", "Second feature by stored gain");
        check(model->name() == "gradient_boosted_trees", "Model name");
    }

    void test_tree_format_errors() {
        section("Model Format Errors");
        check_throws<ModelNotReady>([]() { parse_model("xgboost 1\n"); }, "Wrong magic");
        check_throws<ModelNotReady>([]() { parse_model("riskpulse-gbt 2\n"); }, "Unsupported version");

        std::string wrong_features = kSmallModel;
        wrong_features.replace(wrong_features.find("features 11"), 11, "features 9");
        check_throws<ModelNotReady>([&]() { parse_model(wrong_features); }, "Feature count mismatch");

        std::string bad_child = kSmallModel;
        bad_child.replace(bad_child.find("0 0 80 1 2 0"), 12, "0 0 80 0 2 0");
        check_throws<ModelNotReady>([&]() { parse_model(bad_child); }, "Child pointing backwards");

        std::string truncated(kSmallModel);
        truncated.resize(truncated.find("tree 1"));
        check_throws<ModelNotReady>([&]() { parse_model(truncated); }, "Truncated tree list");

        std::string huge_trees = kSmallModel;
        huge_trees.replace(huge_trees.find("trees 2"), 7, "trees 18446744073709551615");
        check_throws<ModelNotReady>([&]() { parse_model(huge_trees); }, "Absurd tree count rejected");

        std::string many_trees = kSmallModel;
        many_trees.replace(many_trees.find("trees 2"), 7, "trees 5000");
        check_throws<ModelNotReady>([&]() { parse_model(many_trees); }, "Tree count beyond file size rejected");

        std::string huge_nodes = kSmallModel;
        huge_nodes.replace(huge_nodes.find("tree 3"), 6, "tree 4294967296");
        check_throws<ModelNotReady>([&]() { parse_model(huge_nodes); }, "Absurd node count rejected");

        check_throws<ModelNotReady>([]() { TreeEnsembleModel::load_file("/nonexistent/model.gbt"); },
                                    "Missing model file");
        check_throws<ModelNotReady>([]() {
            TreeEnsembleModel m(0.1, 0.0, {}, {});
        }, "Empty ensemble rejected");
    }

    void test_logistic_training() {
        section("Logistic Training");
        ModelSettings settings;
        settings.training_iterations = 300;
        auto model = train_logistic_model(portfolio_dataset(), settings);

        const double p_high = model->probability(features_of(all_signals_fields()));
        const double p_low = model->probability(features_of(quiet_fields()));
        check(p_high > p_low, "Risky profile scores above a quiet one");
        check(p_high > 0.0 && p_high < 1.0, "Probability strictly inside (0,1)");

        double total = 0.0;
        for (const auto& f : model->feature_importances()) total += f.importance;
        check_near(total, 1.0, 1e-9, "Importances normalized to 1");
        check(model->name() == "logistic_regression", "Model name");

        check_throws<ModelNotReady>([&]() { train_logistic_model(EnrichedDataset{}, settings); },
                                    "Training on empty data rejected");
    }

    void test_adapter() {
        section("Model Adapter");
        ProbabilityModelAdapter none;
        check(!none.ready(), "Default adapter not ready");
        check_throws<ModelNotReady>([&]() { none.score(FeatureVector{}); }, "Score without model");
        check_throws<ModelNotReady>([&]() { none.top_features(3); }, "Importance without model");
        check(none.model_name() == "none", "Name without model");

        ProbabilityModelAdapter nan_model(std::make_shared<FixedModel>(std::numeric_limits<double>::quiet_NaN()));
        check_throws<ModelNotReady>([&]() { nan_model.score(FeatureVector{}); }, "NaN output rejected");

        ProbabilityModelAdapter over(std::make_shared<FixedModel>(1.5));
        check(over.score(FeatureVector{}) == 1.0, "Output clamped to 1");

        ProbabilityModelAdapter gbt(parse_model(kSmallModel));
        check(gbt.top_features(3).size() == 3, "top_features truncates");
        check(gbt.top_features(50).size() == kFeatureCount, "top_features caps at feature count");
    }

    void test_provider() {
        section("Model Provider");
        ModelSettings settings;
        settings.file = "/nonexistent/model.gbt";
        settings.allow_startup_training = false;

        ProvidedModel none = provide_model(settings, nullptr);
        check(!none.model && none.source == "none", "No file, no training: no model");
        check(!none.reason.empty(), "Reason recorded");

        EnrichedDataset ds = portfolio_dataset();
        settings.allow_startup_training = true;
        ProvidedModel trained = provide_model(settings, &ds);
        check(trained.model && trained.source == "trained", "Training fallback used");

        ProvidedModel no_data = provide_model(settings, nullptr);
        check(!no_data.model, "Training skipped without a dataset");

        const std::string path = "/tmp/riskpulse_test_model.gbt";
        {
            std::ofstream out(path);
            out << kSmallModel;
        }
        settings.file = path;
        ProvidedModel from_file = provide_model(settings, &ds);
        check(from_file.model && from_file.source == "file:" + path, "Model file preferred over training");

        {
            std::ofstream out(path);
            out << "riskpulse-gbt 1\nfeatures 11\nlearning_rate 0.1\ninit_score 0\n"
                << "importances 0 0 0 0 0 0 0 0 0 0 0\ntrees 18446744073709551615\n";
        }
        settings.allow_startup_training = false;
        check_no_throw([&]() {
            ProvidedModel corrupt = provide_model(settings, nullptr);
            if (corrupt.model || corrupt.source != "none" || corrupt.reason.empty()) {
                throw std::runtime_error("corrupt model file not recorded as a reason");
            }
        }, "Corrupt model file degrades to no model");
        std::remove(path.c_str());
    }
};

int main() {
    ModelTest tester;
    tester.run_all_tests();
    return tester.exit_code();
}
