#pragma once

/// @defgroup core Core Library
/// @brief Host/VM data model, host pool, error types, and trace interface.
///
/// The core library provides the value types shared by both placement
/// paths: hosts and their capacity-tracked pool, VM demands, weights,
/// telemetry samples, and the exception hierarchy. It has no dependencies
/// on placement algorithms or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Host, VM demand, weights, and telemetry records.

/// @defgroup core_hosts Host Pool
/// @ingroup core
/// @brief Ordered host storage and capacity debits.

// Convenience header for the core library
#include <vmplace/core/types.hpp>
#include <vmplace/core/error.hpp>
#include <vmplace/core/trace_writer.hpp>
#include <vmplace/core/host_pool.hpp>
