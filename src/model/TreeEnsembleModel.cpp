#include "riskpulse/model/TreeEnsembleModel.hpp"
#include "riskpulse/core/Errors.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>

using namespace riskpulse;

namespace {

constexpr const char* kMagic = "riskpulse-gbt";
constexpr int kVersion = 1;

// Upper bounds on declared counts. A node line is at least 12 bytes, a tree
// header at least 7, so counts are also checked against the bytes left.
constexpr size_t kMaxTrees = 100000;
constexpr size_t kMaxNodesPerTree = 1u << 20;
constexpr size_t kMinNodeBytes = 12;
constexpr size_t kMinTreeBytes = 7;

// Bytes left in a seekable stream; SIZE_MAX when the stream cannot seek.
size_t remaining_bytes(std::istream& in) {
    const auto here = in.tellg();
    if (here < 0) return SIZE_MAX;
    in.seekg(0, std::ios::end);
    const auto end = in.tellg();
    in.seekg(here);
    if (end < here) return SIZE_MAX;
    return static_cast<size_t>(end - here);
}

void check_count(size_t count, size_t limit, size_t min_bytes, std::istream& in,
                 const std::string& what, const std::string& source) {
    if (count > limit) {
        throw ModelNotReady(source + ": " + what + " count " + std::to_string(count) +
                            " exceeds limit " + std::to_string(limit));
    }
    const size_t left = remaining_bytes(in);
    if (left != SIZE_MAX && count > left / min_bytes) {
        throw ModelNotReady(source + ": " + what + " count " + std::to_string(count) +
                            " larger than the file can hold");
    }
}

template <typename T>
void expect_field(std::istream& in, const char* key, T& out, const std::string& source) {
    std::string tag;
    if (!(in >> tag) || tag != key) {
        throw ModelNotReady(source + ": expected '" + key + "'");
    }
    if (!(in >> out)) {
        throw ModelNotReady(source + ": bad value for '" + key + "'");
    }
}

}

TreeEnsembleModel::TreeEnsembleModel(double learning_rate,
                                     double init_score,
                                     const std::array<double, kFeatureCount>& importances,
                                     std::vector<Tree> trees)
    : learning_rate_(learning_rate),
      init_score_(init_score),
      importances_(importances),
      trees_(std::move(trees)) {
    validate("tree ensemble");
}

void TreeEnsembleModel::validate(const std::string& source) const {
    if (!std::isfinite(learning_rate_) || !std::isfinite(init_score_)) {
        throw ModelNotReady(source + ": non-finite learning_rate or init_score");
    }
    if (trees_.empty()) {
        throw ModelNotReady(source + ": ensemble has no trees");
    }
    for (size_t t = 0; t < trees_.size(); ++t) {
        const auto& nodes = trees_[t].nodes;
        const std::string where = source + ": tree " + std::to_string(t);
        if (nodes.empty()) {
            throw ModelNotReady(where + " is empty");
        }
        const int n = static_cast<int>(nodes.size());
        for (int i = 0; i < n; ++i) {
            const Node& nd = nodes[static_cast<size_t>(i)];
            if (nd.leaf()) {
                if (!std::isfinite(nd.value)) {
                    throw ModelNotReady(where + " node " + std::to_string(i) + ": non-finite leaf value");
                }
                continue;
            }
            if (nd.feature < 0 || nd.feature >= static_cast<int>(kFeatureCount)) {
                throw ModelNotReady(where + " node " + std::to_string(i) + ": feature index out of range");
            }
            if (nd.left <= i || nd.left >= n || nd.right <= i || nd.right >= n) {
                throw ModelNotReady(where + " node " + std::to_string(i) + ": child index out of range");
            }
        }
    }
}

std::shared_ptr<const TreeEnsembleModel> TreeEnsembleModel::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ModelNotReady("model file not found at " + path);
    }
    auto model = parse(in, path);
    std::cout << "[MODEL] Loaded " << model->tree_count() << " trees from " << path << "\n";
    return model;
}

std::shared_ptr<const TreeEnsembleModel> TreeEnsembleModel::parse(std::istream& in, const std::string& source) {
    std::string magic;
    int version = 0;
    if (!(in >> magic >> version) || magic != kMagic) {
        throw ModelNotReady(source + ": not a " + std::string(kMagic) + " model file");
    }
    if (version != kVersion) {
        throw ModelNotReady(source + ": unsupported model version " + std::to_string(version));
    }

    size_t features = 0;
    expect_field(in, "features", features, source);
    if (features != kFeatureCount) {
        throw ModelNotReady(source + ": model expects " + std::to_string(features) +
                            " features, engine supplies " + std::to_string(kFeatureCount));
    }

    double learning_rate = 0.0;
    double init_score = 0.0;
    expect_field(in, "learning_rate", learning_rate, source);
    expect_field(in, "init_score", init_score, source);

    std::string tag;
    std::array<double, kFeatureCount> importances{};
    if (!(in >> tag) || tag != "importances") {
        throw ModelNotReady(source + ": expected 'importances'");
    }
    for (auto& v : importances) {
        if (!(in >> v)) throw ModelNotReady(source + ": truncated importances");
    }

    size_t tree_count = 0;
    expect_field(in, "trees", tree_count, source);
    check_count(tree_count, kMaxTrees, kMinTreeBytes, in, "tree", source);

    std::vector<Tree> trees;
    trees.reserve(tree_count);
    for (size_t t = 0; t < tree_count; ++t) {
        size_t node_count = 0;
        expect_field(in, "tree", node_count, source);
        check_count(node_count, kMaxNodesPerTree, kMinNodeBytes, in, "node", source);

        Tree tree;
        tree.nodes.resize(node_count);
        for (size_t i = 0; i < node_count; ++i) {
            size_t idx = 0;
            Node nd;
            if (!(in >> idx >> nd.feature >> nd.threshold >> nd.left >> nd.right >> nd.value)) {
                throw ModelNotReady(source + ": truncated tree " + std::to_string(t));
            }
            if (idx != i) {
                throw ModelNotReady(source + ": tree " + std::to_string(t) + " node " +
                                    std::to_string(i) + " listed out of order");
            }
            tree.nodes[i] = nd;
        }
        trees.push_back(std::move(tree));
    }

    try {
        return std::make_shared<const TreeEnsembleModel>(learning_rate, init_score, importances, std::move(trees));
    } catch (const ModelNotReady& e) {
        throw ModelNotReady(source + ": " + e.what());
    }
}

double TreeEnsembleModel::decision_value(const FeatureVector& x) const {
    double sum = 0.0;
    for (const auto& t : trees_) {
        size_t i = 0;
        while (!t.nodes[i].leaf()) {
            const auto& nd = t.nodes[i];
            i = static_cast<size_t>(x[static_cast<size_t>(nd.feature)] <= nd.threshold ? nd.left : nd.right);
        }
        sum += t.nodes[i].value;
    }
    return init_score_ + learning_rate_ * sum;
}

double TreeEnsembleModel::probability(const FeatureVector& x) const {
    return sigmoid(decision_value(x));
}

std::vector<FeatureImportance> TreeEnsembleModel::feature_importances() const {
    return rank_importances(importances_);
}
