#pragma once

#include <string>

namespace vmplace::core {

/// @brief A physical host and its remaining capacity.
///
/// Value type stored by HostPool. Capacities are remaining units and only
/// ever decrease during a placement run; `energy` and `cost` are static
/// coefficients normalized when the host data was produced.
///
/// @see HostPool
/// @ingroup core_types
struct Host {
    std::string host_id;      ///< Unique identifier within a pool.
    double cpu_capacity{0.0}; ///< Remaining CPU units (>= 0).
    double ram_capacity{0.0}; ///< Remaining RAM units (>= 0).
    double energy{0.0};       ///< Static energy-cost coefficient (> 0).
    double cost{0.0};         ///< Static monetary coefficient (> 0).
};

/// @brief Resource demand of a single VM.
///
/// Build with make_vm_demand() to get validation.
///
/// @ingroup core_types
struct VmDemand {
    std::string vm_id;      ///< VM identifier.
    double cpu_demand{0.0}; ///< Requested CPU units (> 0).
    double ram_demand{0.0}; ///< Requested RAM units (> 0).
};

/// @brief Caller-supplied weights for the greedy placement score.
///
/// Not validated: negative or zero weights are accepted and scored as-is.
///
/// @ingroup core_types
struct PlacementWeights {
    double cpu{0.4};
    double energy{0.3};
    double cost{0.3};
};

/// @brief Weights of the normalized objectives in the weighted score.
/// @ingroup core_types
struct ObjectiveWeights {
    double cost{0.34};
    double energy{0.33};
    double load{0.33};
};

/// @brief Raw telemetry of one VM, input of the model-assisted path.
///
/// Build with make_telemetry_sample() to get validation.
///
/// @ingroup core_types
struct TelemetrySample {
    std::string vm;          ///< VM label (categorical).
    double cpu{0.0};         ///< CPU usage in percent.
    double memory{0.0};      ///< Memory usage in GB.
    double network_io{0.0};  ///< Network throughput in GB/s.
    double power{0.0};       ///< Power draw in W.
};

/// @brief Build a validated VM demand.
/// @throws InvalidInputError if a demand is not strictly positive and finite.
VmDemand make_vm_demand(std::string vm_id, double cpu_demand, double ram_demand);

/// @brief Build a validated telemetry sample.
/// @throws InvalidInputError if a value is negative or not finite.
TelemetrySample make_telemetry_sample(std::string vm, double cpu, double memory,
                                      double network_io, double power);

/// @brief Check the static invariants of a host record.
/// @throws InvalidInputError on negative capacity or non-positive coefficients.
void validate_host(const Host& host);

} // namespace vmplace::core
