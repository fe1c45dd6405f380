#include <vmplace/algo/feature_scaler.hpp>

#include <vmplace/core/error.hpp>

#include <cmath>
#include <string>

namespace vmplace::algo {

namespace {

void check_finite(const FeatureVector& values, const char* what) {
    for (double v : values) {
        if (!std::isfinite(v)) {
            throw core::InvalidInputError(std::string("scaler ") + what + " must be finite");
        }
    }
}

} // anonymous namespace

// =============================================================================
// StandardScaler
// =============================================================================

StandardScaler::StandardScaler(const FeatureVector& mean, const FeatureVector& scale)
    : mean_(mean)
    , scale_(scale) {
    check_finite(mean_, "mean");
    check_finite(scale_, "scale");
    for (double& s : scale_) {
        if (s == 0.0) {
            s = 1.0;
        }
    }
}

FeatureVector StandardScaler::transform(const FeatureVector& raw) const {
    FeatureVector out{};
    for (std::size_t i = 0; i < FEATURE_COUNT; ++i) {
        out[i] = (raw[i] - mean_[i]) / scale_[i];
    }
    return out;
}

FeatureVector StandardScaler::inverse_transform(const FeatureVector& scaled) const {
    FeatureVector out{};
    for (std::size_t i = 0; i < FEATURE_COUNT; ++i) {
        out[i] = scaled[i] * scale_[i] + mean_[i];
    }
    return out;
}

// =============================================================================
// MinMaxScaler
// =============================================================================

MinMaxScaler::MinMaxScaler(const FeatureVector& data_min, const FeatureVector& scale)
    : min_(data_min)
    , scale_(scale) {
    check_finite(min_, "min");
    check_finite(scale_, "scale");
    for (double s : scale_) {
        if (s <= 0.0) {
            throw core::InvalidInputError("min-max scale must be > 0");
        }
    }
}

FeatureVector MinMaxScaler::transform(const FeatureVector& raw) const {
    FeatureVector out{};
    for (std::size_t i = 0; i < FEATURE_COUNT; ++i) {
        out[i] = (raw[i] - min_[i]) * scale_[i];
    }
    return out;
}

FeatureVector MinMaxScaler::inverse_transform(const FeatureVector& scaled) const {
    FeatureVector out{};
    for (std::size_t i = 0; i < FEATURE_COUNT; ++i) {
        out[i] = scaled[i] / scale_[i] + min_[i];
    }
    return out;
}

} // namespace vmplace::algo
