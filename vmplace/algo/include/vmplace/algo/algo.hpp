#pragma once

/// @defgroup algo Algorithms Library
/// @brief Greedy placement, feature encoding, objective scoring, model serving.
///
/// Depends on core only.

/// @defgroup algo_placement Placement
/// @ingroup algo
/// @brief Weighted greedy host selection.

/// @defgroup algo_features Features
/// @ingroup algo
/// @brief Feature vectors derived from VM telemetry.

/// @defgroup algo_objectives Objectives
/// @ingroup algo
/// @brief Proxy cost/energy/load-balance scores.

/// @defgroup algo_model Model
/// @ingroup algo
/// @brief Vocabulary, scalers, predictors, and the model service.

// Convenience header for the algorithms library
#include <vmplace/algo/placement_engine.hpp>
#include <vmplace/algo/label_vocabulary.hpp>
#include <vmplace/algo/feature_builder.hpp>
#include <vmplace/algo/feature_scaler.hpp>
#include <vmplace/algo/predictor.hpp>
#include <vmplace/algo/tree_ensemble_predictor.hpp>
#include <vmplace/algo/objective_evaluator.hpp>
#include <vmplace/algo/model_service.hpp>
