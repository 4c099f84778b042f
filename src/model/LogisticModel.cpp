#include "riskpulse/model/LogisticModel.hpp"
#include "riskpulse/core/Errors.hpp"
#include <cmath>
#include <iostream>
#include <vector>

using namespace riskpulse;

LogisticModel::LogisticModel(const std::array<double, kFeatureCount>& mean,
                             const std::array<double, kFeatureCount>& scale,
                             const std::array<double, kFeatureCount>& weights,
                             double bias)
    : mean_(mean), scale_(scale), weights_(weights), bias_(bias) {
    for (size_t i = 0; i < kFeatureCount; ++i) {
        if (!std::isfinite(mean_[i]) || !std::isfinite(weights_[i]) ||
            !std::isfinite(scale_[i]) || scale_[i] <= 0.0) {
            throw ModelNotReady("logistic model: invalid parameters for feature " +
                                std::string(feature_names()[i]));
        }
    }
    if (!std::isfinite(bias_)) {
        throw ModelNotReady("logistic model: non-finite bias");
    }
}

double LogisticModel::probability(const FeatureVector& x) const {
    double z = bias_;
    for (size_t i = 0; i < kFeatureCount; ++i) {
        z += weights_[i] * (x[i] - mean_[i]) / scale_[i];
    }
    return sigmoid(z);
}

std::vector<FeatureImportance> LogisticModel::feature_importances() const {
    std::array<double, kFeatureCount> raw{};
    double total = 0.0;
    for (size_t i = 0; i < kFeatureCount; ++i) {
        raw[i] = std::fabs(weights_[i]);
        total += raw[i];
    }
    if (total > 0.0) {
        for (auto& v : raw) v /= total;
    }
    return rank_importances(raw);
}

namespace riskpulse {

std::shared_ptr<const LogisticModel> train_logistic_model(const EnrichedDataset& ds,
                                                          const ModelSettings& settings) {
    if (ds.empty()) {
        throw ModelNotReady("cannot train: dataset is empty");
    }

    const size_t n = ds.size();
    std::vector<FeatureVector> xs;
    std::vector<double> ys;
    xs.reserve(n);
    ys.reserve(n);
    for (const auto& row : ds) {
        xs.push_back(build_feature_vector(row.raw.behavior, row.signals));
        ys.push_back(row.is_delinquent ? 1.0 : 0.0);
    }

    // Standardize
    std::array<double, kFeatureCount> mean{};
    std::array<double, kFeatureCount> scale{};
    for (const auto& x : xs) {
        for (size_t i = 0; i < kFeatureCount; ++i) mean[i] += x[i];
    }
    for (auto& m : mean) m /= static_cast<double>(n);
    for (const auto& x : xs) {
        for (size_t i = 0; i < kFeatureCount; ++i) {
            const double d = x[i] - mean[i];
            scale[i] += d * d;
        }
    }
    for (auto& s : scale) {
        s = std::sqrt(s / static_cast<double>(n));
        if (s < 1e-12) s = 1.0;
    }
    for (auto& x : xs) {
        for (size_t i = 0; i < kFeatureCount; ++i) x[i] = (x[i] - mean[i]) / scale[i];
    }

    std::array<double, kFeatureCount> w{};
    double b = 0.0;
    const double lr = settings.training_learning_rate;

    for (int it = 0; it < settings.training_iterations; ++it) {
        std::array<double, kFeatureCount> grad{};
        double grad_b = 0.0;
        for (size_t r = 0; r < n; ++r) {
            double z = b;
            for (size_t i = 0; i < kFeatureCount; ++i) z += w[i] * xs[r][i];
            const double err = sigmoid(z) - ys[r];
            for (size_t i = 0; i < kFeatureCount; ++i) grad[i] += err * xs[r][i];
            grad_b += err;
        }
        const double inv_n = 1.0 / static_cast<double>(n);
        for (size_t i = 0; i < kFeatureCount; ++i) w[i] -= lr * grad[i] * inv_n;
        b -= lr * grad_b * inv_n;
    }

    std::cout << "[MODEL] Trained logistic model on " << n << " rows ("
              << settings.training_iterations << " iterations)\n";
    return std::make_shared<const LogisticModel>(mean, scale, w, b);
}

}
