#pragma once

/// @file scenario_generation.hpp
/// @brief Fixed demo data and random generation of hosts, VMs and telemetry.
///
/// The random generators draw from a caller-owned std::mt19937 so that a
/// seed fully determines the output.
///
/// @ingroup io_generation

#include <vmplace/io/scenario_loader.hpp>

#include <vmplace/core/types.hpp>

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace vmplace::io {

/// @brief Number of hosts in the fixed demo scenario.
/// @ingroup io_generation
inline constexpr std::size_t FIXED_HOST_COUNT = 5;

/// @brief Number of VMs in the fixed demo scenario.
/// @ingroup io_generation
inline constexpr std::size_t FIXED_VM_COUNT = 3;

/// @brief Number of distinct VM labels in generated telemetry (VM1..VM10).
/// @ingroup io_generation
inline constexpr std::size_t TELEMETRY_VM_COUNT = 10;

/// @brief The first @p n hosts of the fixed demo scenario (H1..H5).
/// @throws std::invalid_argument if @p n > FIXED_HOST_COUNT.
std::vector<core::Host> fixed_hosts(std::size_t n = FIXED_HOST_COUNT);

/// @brief The first @p n VMs of the fixed demo scenario (VM1..VM3).
/// @throws std::invalid_argument if @p n > FIXED_VM_COUNT.
std::vector<core::VmDemand> fixed_vms(std::size_t n = FIXED_VM_COUNT);

/// @brief Complete fixed demo scenario.
ScenarioData fixed_scenario();

/// @brief Random hosts H1..Hn.
///
/// CPU capacity is a uniform integer in [50, 120], RAM in [64, 128];
/// energy is uniform in [0.3, 1.5] and cost in [0.2, 0.8], both rounded
/// to 4 decimals.
std::vector<core::Host> generate_hosts(std::size_t n, std::mt19937& rng);

/// @brief Random VMs VM1..VMn with CPU in [4, 20] and RAM in [8, 32] (integers).
std::vector<core::VmDemand> generate_vms(std::size_t n, std::mt19937& rng);

/// @brief Random hosts and VMs in one call.
ScenarioData generate_scenario(std::size_t num_hosts, std::size_t num_vms, std::mt19937& rng);

/// @brief A labelled telemetry record, as used to train the host predictor.
/// @ingroup io_generation
struct TelemetryRecord {
    core::TelemetrySample sample;
    std::string host; ///< Reference host label.
};

/// @brief Reference host label of a (cpu, memory) pair.
///
/// `Host1` if cpu <= 33 and memory <= 11, `Host2` if cpu <= 66 and
/// memory <= 22, `Host3` otherwise.
///
/// @ingroup io_generation
[[nodiscard]] std::string_view reference_host_label(double cpu, double memory) noexcept;

/// @brief Random labelled telemetry.
///
/// Records cycle over VM1..VM10. CPU is a uniform integer in [10, 90],
/// memory in [1, 32], power in [100, 300]; network_io is uniform in
/// [0.1, 5.0]. Each record is labelled with reference_host_label().
std::vector<TelemetryRecord> generate_telemetry(std::size_t n, std::mt19937& rng);

/// @brief Write telemetry records as JSON (`{"records": [...]}`) to @p out.
void write_telemetry_to_stream(const std::vector<TelemetryRecord>& records, std::ostream& out);

/// @brief Write telemetry records as JSON to a file.
/// @throws LoaderError  If the file cannot be opened for writing.
void write_telemetry(const std::vector<TelemetryRecord>& records, const std::filesystem::path& path);

} // namespace vmplace::io
