#include "riskpulse/model/ModelProvider.hpp"
#include "riskpulse/core/Errors.hpp"
#include "riskpulse/model/LogisticModel.hpp"
#include "riskpulse/model/TreeEnsembleModel.hpp"
#include <iostream>

namespace riskpulse {

ProvidedModel provide_model(const ModelSettings& settings, const EnrichedDataset* dataset) {
    ProvidedModel out;
    out.source = "none";

    try {
        out.model = TreeEnsembleModel::load_file(settings.file);
        out.source = "file:" + settings.file;
        return out;
    } catch (const ModelNotReady& e) {
        out.reason = e.what();
        std::cout << "[MODEL] " << e.what() << "\n";
    } catch (const std::exception& e) {
        out.reason = "model file " + settings.file + " could not be loaded: " + e.what();
        std::cerr << "[MODEL] " << out.reason << "\n";
    }

    if (!settings.allow_startup_training) {
        std::cout << "[MODEL] Startup training disabled; probability scoring unavailable\n";
        return out;
    }
    if (dataset == nullptr) {
        out.reason += "; startup training skipped: no dataset";
        std::cerr << "[MODEL] Startup training skipped: dataset unavailable\n";
        return out;
    }

    try {
        out.model = train_logistic_model(*dataset, settings);
        out.source = "trained";
        out.reason.clear();
    } catch (const std::exception& e) {
        out.reason += std::string("; startup training failed: ") + e.what();
        std::cerr << "[MODEL] Startup training failed: " << e.what() << "\n";
    }
    return out;
}

}
