#pragma once

#include <vmplace/algo/feature_builder.hpp>

namespace vmplace::algo {

/// @brief Abstract per-feature transform fitted at training time.
/// @ingroup algo_model
///
/// Predictors trained on normalized inputs receive
/// `transform(features)`; inverse_transform() maps back to raw units.
///
/// @see StandardScaler, MinMaxScaler
class FeatureScaler {
public:
    virtual ~FeatureScaler() = default;

    [[nodiscard]] virtual FeatureVector transform(const FeatureVector& raw) const = 0;
    [[nodiscard]] virtual FeatureVector inverse_transform(const FeatureVector& scaled) const = 0;

protected:
    FeatureScaler() = default;
    FeatureScaler(const FeatureScaler&) = default;
    FeatureScaler& operator=(const FeatureScaler&) = default;
    FeatureScaler(FeatureScaler&&) = default;
    FeatureScaler& operator=(FeatureScaler&&) = default;
};

/// @brief Standardization: `(x - mean) / scale`.
/// @ingroup algo_model
///
/// A zero scale is treated as 1 (constant feature), matching the fitting
/// tool's behaviour.
class StandardScaler : public FeatureScaler {
public:
    StandardScaler(const FeatureVector& mean, const FeatureVector& scale);

    [[nodiscard]] FeatureVector transform(const FeatureVector& raw) const override;
    [[nodiscard]] FeatureVector inverse_transform(const FeatureVector& scaled) const override;

    [[nodiscard]] const FeatureVector& mean() const noexcept { return mean_; }
    [[nodiscard]] const FeatureVector& scale() const noexcept { return scale_; }

private:
    FeatureVector mean_;
    FeatureVector scale_;
};

/// @brief Min-max scaling: `(x - min) * scale`, mapping the fitted range to [0, 1].
/// @ingroup algo_model
///
/// @c scale is `1 / (data_max - data_min)` per feature, with constant
/// features stored as scale 1.
class MinMaxScaler : public FeatureScaler {
public:
    MinMaxScaler(const FeatureVector& data_min, const FeatureVector& scale);

    [[nodiscard]] FeatureVector transform(const FeatureVector& raw) const override;
    [[nodiscard]] FeatureVector inverse_transform(const FeatureVector& scaled) const override;

private:
    FeatureVector min_;
    FeatureVector scale_;
};

} // namespace vmplace::algo
