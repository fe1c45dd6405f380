#pragma once

#include <vmplace/algo/feature_builder.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace vmplace::algo {

/// @brief Abstract host-label predictor.
/// @ingroup algo_model
///
/// The placement contract only sees `features -> host label`; how the
/// model was trained or what algorithm it uses stays behind this
/// interface.
///
/// @see TreeEnsemblePredictor, ModelService
class Predictor {
public:
    virtual ~Predictor() = default;

    /// @brief Predict the host label for one feature vector.
    [[nodiscard]] virtual std::string predict(const FeatureVector& features) const = 0;

    /// @brief Display name of the model.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

protected:
    Predictor() = default;
    Predictor(const Predictor&) = default;
    Predictor& operator=(const Predictor&) = default;
    Predictor(Predictor&&) = default;
    Predictor& operator=(Predictor&&) = default;
};

/// @brief Held-out quality metrics reported by the training harness.
/// @ingroup algo_model
struct ModelQuality {
    double r2{0.0};  ///< Coefficient of determination (higher is better).
    double mse{0.0}; ///< Mean squared error.
    double mae{0.0}; ///< Mean absolute error.
};

/// @brief A trained model offered to the ModelService.
/// @ingroup algo_model
struct ModelCandidate {
    std::string name;
    ModelQuality quality;
    std::shared_ptr<const Predictor> predictor;
    bool scaled_input{false}; ///< True if the model was trained on scaled features.
    /// Per-feature importances in FEATURE_NAMES order, if the training
    /// harness exported them (tree ensembles do).
    std::optional<FeatureVector> feature_importance;
};

} // namespace vmplace::algo
