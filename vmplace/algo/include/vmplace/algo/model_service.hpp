#pragma once

#include <vmplace/algo/feature_builder.hpp>
#include <vmplace/algo/feature_scaler.hpp>
#include <vmplace/algo/label_vocabulary.hpp>
#include <vmplace/algo/objective_evaluator.hpp>
#include <vmplace/algo/predictor.hpp>

#include <vmplace/core/types.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vmplace::algo {

/// @brief Everything a ModelService needs, as produced by offline training.
/// @ingroup algo_model
struct ModelAssets {
    LabelVocabulary vocabulary;                  ///< VM label encoding.
    std::shared_ptr<const FeatureScaler> scaler; ///< May be null if no candidate needs it.
    std::vector<ModelCandidate> candidates;      ///< At least one.
};

/// @brief Importance of one input feature.
/// @ingroup algo_model
struct FeatureImportance {
    std::string_view feature; ///< One of FEATURE_NAMES.
    double importance{0.0};
};

/// @brief Result of the model-assisted path for one sample.
/// @ingroup algo_model
struct Recommendation {
    std::string host;        ///< Host label predicted by the best model.
    std::string model;       ///< Name of the model that produced it.
    double confidence{0.0};  ///< R^2 of that model.
    FeatureVector features{}; ///< Unscaled feature vector.
    ObjectiveBreakdown objectives;
    std::vector<FeatureImportance> feature_importance; ///< As ModelService::feature_importance().
};

/// @brief Prediction of a single candidate model.
/// @ingroup algo_model
struct CandidatePrediction {
    std::string model;
    std::string host;
};

/// @brief Quality summary of a loaded candidate.
/// @ingroup algo_model
struct CandidateSummary {
    std::string model;
    ModelQuality quality;
    bool best{false};
};

/// @brief Owns the trained model assets and serves predictions.
/// @ingroup algo_model
///
/// Explicitly constructed and passed to whoever needs it. The assets are
/// loaded once (constructor or initialize()) and are immutable afterwards;
/// initialize() replaces them atomically, keeping the previous assets if
/// the new bundle is rejected.
///
/// The best candidate is the one with the highest R^2; the first loaded
/// wins on equal R^2.
///
/// @see FeatureBuilder, ObjectiveEvaluator, Predictor
class ModelService {
public:
    /// @brief Construct an empty (not ready) service.
    ModelService();

    /// @brief Construct and initialize from @p assets.
    /// @throws core::InvalidInputError if the assets are incomplete.
    explicit ModelService(ModelAssets assets);

    ~ModelService();

    ModelService(const ModelService&) = delete;
    ModelService& operator=(const ModelService&) = delete;
    ModelService(ModelService&&) noexcept;
    ModelService& operator=(ModelService&&) noexcept;

    /// @brief Replace the loaded assets.
    ///
    /// Requires a non-empty vocabulary, at least one candidate with a
    /// predictor, and a scaler if any candidate uses scaled input.
    ///
    /// @throws core::InvalidInputError otherwise (service state unchanged).
    void initialize(ModelAssets assets);

    /// @brief Unload the assets; the service is no longer ready.
    void reset() noexcept;

    [[nodiscard]] bool is_ready() const noexcept { return state_ != nullptr; }

    /// @brief Known VM labels.
    /// @throws core::PredictorUnavailableError if not ready.
    [[nodiscard]] std::span<const std::string> vm_labels() const;

    /// @brief Name of the best candidate.
    /// @throws core::PredictorUnavailableError if not ready.
    [[nodiscard]] const std::string& best_model() const;

    /// @brief Candidates ordered by R^2, best first.
    /// @throws core::PredictorUnavailableError if not ready.
    [[nodiscard]] std::vector<CandidateSummary> candidates() const;

    /// @brief Feature importances, most important first.
    ///
    /// Taken from the highest-R^2 candidate that carries importances, so a
    /// best model without them (a linear model, say) does not hide the
    /// ensemble's. Equal importances keep FEATURE_NAMES order. Empty if no
    /// candidate carries any.
    ///
    /// @throws core::PredictorUnavailableError if not ready.
    [[nodiscard]] std::vector<FeatureImportance> feature_importance() const;

    /// @brief Predict a host with the best model and evaluate the objectives.
    ///
    /// @throws core::PredictorUnavailableError if not ready.
    /// @throws core::UnknownCategoryError if the VM label is unknown.
    [[nodiscard]] Recommendation recommend(const core::TelemetrySample& sample,
                                           const core::ObjectiveWeights& weights = {}) const;

    /// @brief Prediction of every candidate, in load order.
    ///
    /// @throws core::PredictorUnavailableError if not ready.
    /// @throws core::UnknownCategoryError if the VM label is unknown.
    [[nodiscard]] std::vector<CandidatePrediction> predict_all(const core::TelemetrySample& sample) const;

private:
    struct State;

    [[nodiscard]] const State& state() const;
    [[nodiscard]] static std::string run_candidate(const State& state, const ModelCandidate& candidate,
                                                   const FeatureVector& features);

    std::unique_ptr<const State> state_;
};

} // namespace vmplace::algo
