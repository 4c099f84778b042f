#pragma once
#include <array>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "riskpulse/model/ProbabilityModel.hpp"

namespace riskpulse {

// ---------------------------------------------------------------------------
// Gradient-boosted binary tree ensemble.
//
//   p = sigmoid(init_score + learning_rate * sum(leaf value of each tree))
//
// Split rule: x[feature] <= threshold goes left. A node whose children are
// both negative is a leaf. Children must come after their parent in the node
// list so every walk terminates.
//
// Text model file:
//   riskpulse-gbt 1
//   features 11
//   learning_rate <double>
//   init_score <double>
//   importances <11 doubles>
//   trees <T>
//   tree <N>                                  (T times)
//   <idx> <feature> <threshold> <left> <right> <value>   (N lines)
//
// Any structural problem raises ModelNotReady naming the source and reason.
// ---------------------------------------------------------------------------
class TreeEnsembleModel final : public ProbabilityModel {
public:
    struct Node {
        int feature{-1};
        double threshold{0.0};
        int left{-1};
        int right{-1};
        double value{0.0};

        bool leaf() const { return left < 0 && right < 0; }
    };

    struct Tree {
        std::vector<Node> nodes;
    };

    TreeEnsembleModel(double learning_rate,
                      double init_score,
                      const std::array<double, kFeatureCount>& importances,
                      std::vector<Tree> trees);

    static std::shared_ptr<const TreeEnsembleModel> load_file(const std::string& path);
    static std::shared_ptr<const TreeEnsembleModel> parse(std::istream& in, const std::string& source);

    double probability(const FeatureVector& x) const override;
    std::vector<FeatureImportance> feature_importances() const override;
    std::string name() const override { return "gradient_boosted_trees"; }

    // Raw additive score before the sigmoid.
    double decision_value(const FeatureVector& x) const;

    std::size_t tree_count() const { return trees_.size(); }

private:
    void validate(const std::string& source) const;

    double learning_rate_;
    double init_score_;
    std::array<double, kFeatureCount> importances_;
    std::vector<Tree> trees_;
};

}
