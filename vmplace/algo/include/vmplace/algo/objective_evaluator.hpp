#pragma once

#include <vmplace/algo/feature_builder.hpp>

#include <vmplace/core/types.hpp>

namespace vmplace::algo {

/// @brief Proxy objectives of a telemetry sample, raw and normalized.
/// @ingroup algo_objectives
struct ObjectiveBreakdown {
    double proxy_cost{0.0};         ///< Rounded to 2 decimals.
    double proxy_energy{0.0};       ///< Rounded to 2 decimals.
    double proxy_load_balance{0.0}; ///< Rounded to 2 decimals, in [0, 100].

    double norm_cost{0.0};   ///< In [0, 1], higher is worse.
    double norm_energy{0.0}; ///< In [0, 1], higher is worse.
    double norm_load{0.0};   ///< In [0, 1], inverted load balance (higher is worse).

    double weighted_score{0.0}; ///< Rounded to 3 decimals.

    DerivedFeatures derived;       ///< Ratios shared with the feature path.
    core::ObjectiveWeights weights; ///< Weights used for weighted_score.
};

/// @brief Calibration constants of the proxy objective model.
/// @ingroup algo_objectives
namespace objective_calibration {
inline constexpr double COST_PER_WATT = 0.12;
inline constexpr double COST_PER_CPU = 0.05;
inline constexpr double NETWORK_BASELINE_GBPS = 1.0;
inline constexpr double COST_PER_NETWORK_EXCESS = 0.5;
inline constexpr double ENERGY_PER_WATT = 0.9;
inline constexpr double ENERGY_PER_CPU = 0.2;
inline constexpr double COST_NORMALIZER = 200.0;
inline constexpr double ENERGY_NORMALIZER = 300.0;
inline constexpr double LOAD_BALANCE_MAX = 100.0;
} // namespace objective_calibration

/// @brief Computes bounded, comparable objective scores from raw telemetry.
/// @ingroup algo_objectives
///
/// - proxy_cost = power*0.12 + cpu*0.05 + max(0, network_io - 1)*0.5
/// - proxy_energy = power*0.9 + cpu*0.2
/// - proxy_load_balance = 100 - min(100, |cpu - min(memory, 100)|)
///
/// Proxies are rounded to 2 decimals, then normalized: cost over 200,
/// energy over 300 (both capped at 1), load as `1 - balance/100`. The
/// weighted score is rounded to 3 decimals.
///
/// @note The load-balance term caps memory (GB) at 100 and subtracts it
///       from a CPU percentage. The units do not match; the formula is kept
///       as-is for compatibility with existing reports.
///
/// Stateless: evaluating the same input twice gives the same output.
class ObjectiveEvaluator {
public:
    [[nodiscard]] static ObjectiveBreakdown evaluate(const core::TelemetrySample& sample,
                                                     const core::ObjectiveWeights& weights = {}) noexcept;
};

/// @brief Round @p value to @p decimals digits after the point.
///
/// The decision is taken on the exact binary value: 12.625 is stored as
/// 12.62499... and becomes 12.62, while an exact tie such as 2.5 rounds to
/// the even neighbour. Non-finite values and negative @p decimals are
/// returned unchanged.
/// @ingroup algo_objectives
[[nodiscard]] double round_to(double value, int decimals) noexcept;

} // namespace vmplace::algo
