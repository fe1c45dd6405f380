#pragma once

#include <vmplace/algo/label_vocabulary.hpp>

#include <vmplace/core/types.hpp>

#include <array>
#include <cstddef>
#include <string_view>

namespace vmplace::algo {

/// @brief Number of features fed to a predictor.
/// @ingroup algo_features
inline constexpr std::size_t FEATURE_COUNT = 7;

/// @brief Fixed-order numeric encoding of a telemetry sample.
///
/// Order: vm_encoded, cpu, memory, network_io, power, cpu_mem_ratio,
/// power_per_cpu.
///
/// @ingroup algo_features
using FeatureVector = std::array<double, FEATURE_COUNT>;

/// @brief Positions of each feature inside a FeatureVector.
/// @ingroup algo_features
enum FeatureIndex : std::size_t {
    VmEncoded = 0,
    Cpu = 1,
    Memory = 2,
    NetworkIo = 3,
    Power = 4,
    CpuMemRatio = 5,
    PowerPerCpu = 6,
};

/// @brief Names of the features, in FeatureVector order.
/// @ingroup algo_features
inline constexpr std::array<std::string_view, FEATURE_COUNT> FEATURE_NAMES{
    "vm", "cpu", "memory", "network_io", "power", "cpu_mem_ratio", "power_per_cpu"};

/// @brief Ratios derived from raw telemetry.
/// @ingroup algo_features
struct DerivedFeatures {
    double cpu_mem_ratio{0.0}; ///< cpu / memory, 0 when memory is 0.
    double power_per_cpu{0.0}; ///< power / cpu, 0 when cpu is 0.
};

/// @brief Compute the derived ratios of a sample.
///
/// Shared by FeatureBuilder and ObjectiveEvaluator so that both paths see
/// identical values. A zero denominator yields 0.0.
///
/// @ingroup algo_features
[[nodiscard]] DerivedFeatures derive_features(const core::TelemetrySample& sample) noexcept;

/// @brief Turns telemetry samples into predictor input.
/// @ingroup algo_features
///
/// Holds a reference to the vocabulary used to encode the VM label; the
/// vocabulary must outlive the builder.
class FeatureBuilder {
public:
    explicit FeatureBuilder(const LabelVocabulary& vocabulary) noexcept
        : vocabulary_(vocabulary) {}

    /// @brief Build the feature vector of @p sample.
    /// @throws core::UnknownCategoryError if the VM label is not in the vocabulary.
    [[nodiscard]] FeatureVector build(const core::TelemetrySample& sample) const;

    [[nodiscard]] static constexpr const std::array<std::string_view, FEATURE_COUNT>& feature_names() noexcept {
        return FEATURE_NAMES;
    }

private:
    const LabelVocabulary& vocabulary_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // namespace vmplace::algo
