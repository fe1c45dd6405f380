#include <vmplace/algo/model_service.hpp>

#include <vmplace/core/error.hpp>

#include <algorithm>
#include <utility>

namespace vmplace::algo {

struct ModelService::State {
    explicit State(ModelAssets&& assets)
        : vocabulary(std::move(assets.vocabulary))
        , scaler(std::move(assets.scaler))
        , candidates(std::move(assets.candidates))
        , builder(vocabulary) {}

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    LabelVocabulary vocabulary;
    std::shared_ptr<const FeatureScaler> scaler;
    std::vector<ModelCandidate> candidates;
    FeatureBuilder builder;
    std::size_t best{0};
};

ModelService::ModelService() = default;

ModelService::ModelService(ModelAssets assets) {
    initialize(std::move(assets));
}

ModelService::~ModelService() = default;
ModelService::ModelService(ModelService&&) noexcept = default;
ModelService& ModelService::operator=(ModelService&&) noexcept = default;

void ModelService::initialize(ModelAssets assets) {
    if (assets.vocabulary.empty()) {
        throw core::InvalidInputError("model assets: vocabulary is empty");
    }
    if (assets.candidates.empty()) {
        throw core::InvalidInputError("model assets: no candidate model");
    }
    for (const auto& candidate : assets.candidates) {
        if (!candidate.predictor) {
            throw core::InvalidInputError("model assets: candidate '" + candidate.name +
                                          "' has no predictor");
        }
        if (candidate.scaled_input && !assets.scaler) {
            throw core::InvalidInputError("model assets: candidate '" + candidate.name +
                                          "' needs a scaler but none is loaded");
        }
    }

    auto state = std::make_unique<State>(std::move(assets));
    for (std::size_t i = 1; i < state->candidates.size(); ++i) {
        if (state->candidates[i].quality.r2 > state->candidates[state->best].quality.r2) {
            state->best = i;
        }
    }
    state_ = std::move(state);
}

void ModelService::reset() noexcept {
    state_.reset();
}

const ModelService::State& ModelService::state() const {
    if (!state_) {
        throw core::PredictorUnavailableError("no model loaded");
    }
    return *state_;
}

std::span<const std::string> ModelService::vm_labels() const {
    return state().vocabulary.classes();
}

const std::string& ModelService::best_model() const {
    const auto& s = state();
    return s.candidates[s.best].name;
}

std::vector<CandidateSummary> ModelService::candidates() const {
    const auto& s = state();
    std::vector<CandidateSummary> out;
    out.reserve(s.candidates.size());
    for (std::size_t i = 0; i < s.candidates.size(); ++i) {
        out.push_back(CandidateSummary{s.candidates[i].name, s.candidates[i].quality, i == s.best});
    }
    std::stable_sort(out.begin(), out.end(), [](const CandidateSummary& lhs, const CandidateSummary& rhs) {
        return lhs.quality.r2 > rhs.quality.r2;
    });
    return out;
}

std::vector<FeatureImportance> ModelService::feature_importance() const {
    const auto& s = state();
    const ModelCandidate* source = nullptr;
    for (const auto& candidate : s.candidates) {
        if (candidate.feature_importance && (!source || candidate.quality.r2 > source->quality.r2)) {
            source = &candidate;
        }
    }

    std::vector<FeatureImportance> out;
    if (!source) {
        return out;
    }
    out.reserve(FEATURE_COUNT);
    for (std::size_t i = 0; i < FEATURE_COUNT; ++i) {
        out.push_back(FeatureImportance{FEATURE_NAMES[i], (*source->feature_importance)[i]});
    }
    std::stable_sort(out.begin(), out.end(), [](const FeatureImportance& lhs, const FeatureImportance& rhs) {
        return lhs.importance > rhs.importance;
    });
    return out;
}

std::string ModelService::run_candidate(const State& state, const ModelCandidate& candidate,
                                        const FeatureVector& features) {
    if (candidate.scaled_input) {
        return candidate.predictor->predict(state.scaler->transform(features));
    }
    return candidate.predictor->predict(features);
}

Recommendation ModelService::recommend(const core::TelemetrySample& sample,
                                       const core::ObjectiveWeights& weights) const {
    const auto& s = state();
    const auto& best = s.candidates[s.best];

    Recommendation rec;
    rec.features = s.builder.build(sample);
    rec.host = run_candidate(s, best, rec.features);
    rec.model = best.name;
    rec.confidence = best.quality.r2;
    rec.objectives = ObjectiveEvaluator::evaluate(sample, weights);
    rec.feature_importance = feature_importance();
    return rec;
}

std::vector<CandidatePrediction> ModelService::predict_all(const core::TelemetrySample& sample) const {
    const auto& s = state();
    FeatureVector features = s.builder.build(sample);

    std::vector<CandidatePrediction> out;
    out.reserve(s.candidates.size());
    for (const auto& candidate : s.candidates) {
        out.push_back(CandidatePrediction{candidate.name, run_candidate(s, candidate, features)});
    }
    return out;
}

} // namespace vmplace::algo
