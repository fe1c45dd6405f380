#pragma once

/// @file report_writer.hpp
/// @brief JSON reports of placement runs and model recommendations.
/// @ingroup io_writers

#include <vmplace/algo/model_service.hpp>
#include <vmplace/algo/objective_evaluator.hpp>
#include <vmplace/algo/placement_engine.hpp>

#include <vmplace/core/host_pool.hpp>
#include <vmplace/core/types.hpp>

#include <ostream>
#include <span>

namespace vmplace::io {

/// @brief Write the outcome of a batch placement run.
///
/// Layout:
/// @code{.json}
/// {"weights": {"cpu": 0.4, "energy": 0.3, "cost": 0.3},
///  "placements": [{"vm_id": "VM1", "host_id": "H1", "feasible_hosts": 5,
///                  "score": {"cpu": 0.087, "energy": 0.5986, "cost": 0.3664, "total": 0.3235}},
///                 {"vm_id": "VM9", "host_id": null, "feasible_hosts": 0}],
///  "placed": 1, "rejected": 1,
///  "hosts": [{"host_id": "H1", "cpu_remaining": 84, "ram_remaining": 90}]}
/// @endcode
///
/// @param placements  Decisions in placement order.
/// @param pool        Pool after the run (remaining capacities).
/// @param weights     Weights used for the run.
/// @param out         Destination stream.
void write_placement_report(std::span<const algo::Placement> placements, const core::HostPool& pool,
                            const core::PlacementWeights& weights, std::ostream& out);

/// @brief Write the proxy objectives of a sample.
void write_objectives(const core::TelemetrySample& sample, const algo::ObjectiveBreakdown& objectives,
                      std::ostream& out);

/// @brief Write a model recommendation.
///
/// Contains the recommended host, the model and its R^2, the feature
/// vector by name and the objectives. "feature_importance" (most important
/// first) is written when the recommendation carries importances, and
/// "predictions" when @p predictions is not empty.
void write_recommendation(const core::TelemetrySample& sample, const algo::Recommendation& recommendation,
                          std::span<const algo::CandidatePrediction> predictions, std::ostream& out);

} // namespace vmplace::io
