#pragma once

/// @defgroup io I/O Library
/// @brief JSON loading and reports, trace output, scenario generation.
///
/// The I/O library handles all external data formats: scenario files,
/// model bundle manifests and telemetry requests (RapidJSON), placement
/// and recommendation reports, decision traces (JSON, textual, in-memory),
/// and generation of demo and random data. Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Scenario, model bundle and request loaders.

/// @defgroup io_writers Writers
/// @ingroup io
/// @brief Trace writers and JSON reports.

/// @defgroup io_generation Generation
/// @ingroup io
/// @brief Fixed demo data and seeded random generation.

// Convenience header for the I/O library

#include <vmplace/io/error.hpp>
#include <vmplace/io/trace_writers.hpp>
#include <vmplace/io/scenario_loader.hpp>
#include <vmplace/io/model_loader.hpp>
#include <vmplace/io/report_writer.hpp>
#include <vmplace/io/scenario_generation.hpp>
