#pragma once

/// @file scenario_loader.hpp
/// @brief Loading and writing placement scenario files (JSON).
/// @ingroup io_loaders

#include <vmplace/core/host_pool.hpp>
#include <vmplace/core/types.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>
#include <vector>

namespace vmplace::io {

/// @brief A placement problem: candidate hosts and the VMs to place, in order.
///
/// Loaded from JSON via @ref load_scenario or built with the generation
/// utilities in scenario_generation.hpp. Format:
///
/// @code{.json}
/// {
///   "hosts": [{"host_id": "H1", "cpu_capacity": 92, "ram_capacity": 114,
///              "energy": 0.5986, "cost": 0.3664}],
///   "vms":   [{"vm_id": "VM1", "cpu_demand": 8, "ram_demand": 24}]
/// }
/// @endcode
///
/// @ingroup io_loaders
/// @see load_scenario, fixed_scenario, generate_scenario
struct ScenarioData {
    std::vector<core::Host> hosts;   ///< Candidate hosts, in scan order.
    std::vector<core::VmDemand> vms; ///< VMs, in placement order.

    /// @brief Build a HostPool holding a copy of the hosts.
    [[nodiscard]] core::HostPool make_pool() const { return core::HostPool{hosts}; }
};

/// @brief Load a scenario from a JSON file.
///
/// Every host and VM is validated the same way the core types validate
/// them; host ids must be unique. A missing "vms" array means no VMs.
///
/// @throws LoaderError  If the file cannot be read, is not valid JSON, or
///                      fails validation.
ScenarioData load_scenario(const std::filesystem::path& path);

/// @brief Load a scenario from a JSON string.
/// @throws LoaderError  If the JSON is malformed or fails validation.
ScenarioData load_scenario_from_string(std::string_view json);

/// @brief Write a scenario to a JSON file.
/// @throws LoaderError  If the file cannot be opened for writing.
void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path);

/// @brief Write a scenario as JSON to @p out.
void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out);

} // namespace vmplace::io
