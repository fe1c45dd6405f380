#pragma once

/// @file model_loader.hpp
/// @brief Loading trained model bundles and telemetry requests (JSON).
/// @ingroup io_loaders

#include <vmplace/algo/model_service.hpp>

#include <vmplace/core/types.hpp>

#include <filesystem>
#include <string_view>

namespace vmplace::io {

/// @brief Load a model bundle manifest into ModelAssets.
///
/// The manifest holds the VM vocabulary, an optional feature scaler and
/// one or more exported tree-ensemble models with their quality metrics:
///
/// @code{.json}
/// {
///   "vocabulary": ["VM1", "VM2"],
///   "scaler": {"kind": "standard", "mean": [7 numbers], "scale": [7 numbers]},
///   "models": [{
///     "name": "random_forest",
///     "quality": {"r2": 0.91, "mse": 0.07, "mae": 0.11},
///     "scaled": false,
///     "feature_importance": [7 numbers],
///     "classes": ["Host1", "Host2", "Host3"],
///     "trees": [{"nodes": [{"feature": 1, "threshold": 33.0, "left": 1, "right": 2},
///                          {"leaf": "Host1"}, {"leaf": "Host2"}]}]
///   }]
/// }
/// @endcode
///
/// A "minmax" scaler uses "min" instead of "mean". "scaled", "classes"
/// and "feature_importance" are optional. Importances are given in
/// algo::FEATURE_NAMES order and must not be negative.
///
/// @throws LoaderError  If the file cannot be read or the manifest is
///                      malformed (including invalid trees).
///
/// @see algo::ModelService::initialize
algo::ModelAssets load_model_bundle(const std::filesystem::path& path);

/// @brief Load a model bundle manifest from a JSON string.
/// @throws LoaderError  If the manifest is malformed.
algo::ModelAssets load_model_bundle_from_string(std::string_view json);

/// @brief One request of the model-assisted path.
/// @ingroup io_loaders
struct TelemetryRequest {
    core::TelemetrySample sample;
    core::ObjectiveWeights weights;
};

/// @brief Load a telemetry request file.
///
/// @code{.json}
/// {"vm": "VM1", "cpu": 50, "memory": 16, "network_io": 1.0, "power": 150,
///  "weights": {"cost": 0.34, "energy": 0.33, "load": 0.33}}
/// @endcode
///
/// "weights" and each of its members are optional and default to the
/// values of core::ObjectiveWeights.
///
/// @throws LoaderError  If the file cannot be read or a field is missing,
///                      has the wrong type, or is negative.
TelemetryRequest load_telemetry_request(const std::filesystem::path& path);

/// @brief Load a telemetry request from a JSON string.
/// @throws LoaderError  On malformed input.
TelemetryRequest load_telemetry_request_from_string(std::string_view json);

} // namespace vmplace::io
