#include "riskpulse/scoring/CustomerScorer.hpp"
#include "riskpulse/core/Errors.hpp"
#include "riskpulse/intervention/InterventionPlaybook.hpp"
#include <cmath>

using namespace riskpulse;

CustomerScorer::CustomerScorer(const SignalEngine& signals,
                               const TierEngine& tiers,
                               const ProbabilityModelAdapter& model)
    : signals_(signals), tiers_(tiers), model_(model) {}

double CustomerScorer::confidence(double probability) {
    return std::fabs(probability - 0.5) * 2.0;
}

SignalSet CustomerScorer::resolve_signals(const ScoreRequest& req, std::vector<SignalId>& overridden) const {
    SignalSet derived;
    try {
        derived = signals_.evaluate(req.fields);
    } catch (const MalformedRecord& e) {
        throw InvalidCustomerData(e.what());
    }

    SignalSet out = derived;
    for (SignalId id : kAllSignals) {
        const auto& supplied = req.supplied_signals[static_cast<size_t>(id)];
        if (supplied.has_value()) {
            out.set(id, *supplied);
            overridden.push_back(id);
        }
    }
    return out;
}

CustomerScoreResult CustomerScorer::score(const ScoreRequest& req) const {
    CustomerScoreResult out;
    out.customer_id = req.customer_id.empty() ? "UNKNOWN" : req.customer_id;
    out.signals     = resolve_signals(req, out.overridden_signals);
    out.risk_score  = tiers_.score(out.signals);
    out.tier        = tiers_.classify(out.risk_score);

    for (SignalId id : kAllSignals) {
        if (out.signals.get(id)) out.triggered_signals.emplace_back(signalTriggerLabel(id));
    }
    out.recommendations = recommendations_for(out.tier);

    // Rule-based fields are complete; the model only adds probability.
    try {
        const double p = model_.score(build_feature_vector(req.fields, out.signals));
        out.delinquency_probability = p;
        out.confidence = confidence(p);
    } catch (const ModelNotReady& e) {
        out.probability_unavailable_reason = e.what();
    }
    return out;
}
